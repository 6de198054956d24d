#include "image_processing.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>

#include "utilities.hpp"

namespace {

constexpr size_t kTrajectoryTail = 20;

cv::Mat toBgr(const cv::Mat& frame) {
    cv::Mat bgr;
    if (frame.channels() == 4) {
        cv::cvtColor(frame, bgr, cv::COLOR_BGRA2BGR);
    } else if (frame.channels() == 1) {
        cv::cvtColor(frame, bgr, cv::COLOR_GRAY2BGR);
    } else {
        bgr = frame.clone();
    }
    return bgr;
}

void drawCalibration(cv::Mat& canvas, const CalibrationData& calibration) {
    const auto& quad = calibration.tableCorners;
    if (quad.size() == 4) {
        // Edges in table order: 0-1 and 2-3 are the long cushions.
        cv::line(canvas, quad[0], quad[1], cv::Scalar(0, 0, 255), 2);
        cv::line(canvas, quad[1], quad[2], cv::Scalar(0, 255, 0), 2);
        cv::line(canvas, quad[2], quad[3], cv::Scalar(255, 0, 0), 2);
        cv::line(canvas, quad[3], quad[0], cv::Scalar(0, 255, 255), 2);
        for (int i = 0; i < 4; i++) {
            cv::circle(canvas, quad[i], 6, cv::Scalar(255, 255, 255), -1);
            cv::putText(canvas, std::to_string(i), quad[i] + cv::Point2f(-4, 4),
                        cv::FONT_HERSHEY_SIMPLEX, 0.4, cv::Scalar(0, 0, 0), 1);
        }
    }

    cv::Scalar pocketColor = calibration.isValid ? cv::Scalar(255, 0, 255) : cv::Scalar(90, 90, 90);
    for (const auto& pocket : calibration.pocketRegions) {
        cv::rectangle(canvas, pocket.toRect(), pocketColor, 1);
    }
}

}  // namespace

cv::Mat drawFrameAnalysis(const cv::Mat& frame, const FrameAnalysis& analysis) {
    cv::Mat canvas = toBgr(frame);
    if (canvas.empty()) return canvas;

    if (analysis.calibrationData) drawCalibration(canvas, *analysis.calibrationData);

    for (const auto& d : analysis.detections) {
        cv::Scalar color = ballColor(d.ballType());
        cv::rectangle(canvas, d.bbox.toRect(), color, 2);
        char label[64];
        snprintf(label, sizeof(label), "%s %.2f", ballTypeName(d.ballType()), d.confidence);
        cv::putText(canvas, label, cv::Point2f(d.bbox.x1, d.bbox.y1 - 4),
                    cv::FONT_HERSHEY_SIMPLEX, 0.4, color, 1);
    }

    for (const auto& ball : analysis.trackedBalls) {
        cv::Scalar color = ballColor(ball.ballType);
        size_t first = ball.trajectory.size() > kTrajectoryTail
                           ? ball.trajectory.size() - kTrajectoryTail
                           : 0;
        for (size_t i = first + 1; i < ball.trajectory.size(); ++i) {
            cv::line(canvas, ball.trajectory[i - 1], ball.trajectory[i], color, 1, cv::LINE_AA);
        }
        std::string label = "#" + std::to_string(ball.trackId) + " " + trackStateName(ball.state);
        cv::putText(canvas, label, ball.currentPosition + cv::Point2f(8, 12),
                    cv::FONT_HERSHEY_SIMPLEX, 0.4, cv::Scalar(255, 255, 255), 1);
    }

    for (const auto& event : analysis.events) {
        cv::Scalar color = event.type == BallEventType::Potted ? cv::Scalar(0, 255, 255)
                                                                 : cv::Scalar(0, 0, 255);
        cv::drawMarker(canvas, event.position, color, cv::MARKER_TILTED_CROSS, 18, 2);
        cv::putText(canvas, ballEventTypeName(event.type), event.position + cv::Point2f(10, -10),
                    cv::FONT_HERSHEY_SIMPLEX, 0.45, color, 1);
    }

    char info[128];
    snprintf(info, sizeof(info), "frame %d  t=%.2fs  %zu det  %zu tracks  %.1f ms",
             analysis.frameNumber, analysis.timestamp, analysis.detections.size(),
             analysis.trackedBalls.size(), analysis.processingTime);
    cv::putText(canvas, info, cv::Point(10, 20), cv::FONT_HERSHEY_SIMPLEX, 0.5,
                cv::Scalar(255, 255, 255), 1);
    if (!analysis.tableCoordinatesValid) {
        cv::putText(canvas, analysis.usedPriorCalibration ? "calibration: prior" : "uncalibrated",
                    cv::Point(10, 40), cv::FONT_HERSHEY_SIMPLEX, 0.5, cv::Scalar(0, 165, 255), 1);
    }
    return canvas;
}

cv::Mat drawTopDownView(const cv::Mat& frame, const FrameAnalysis& analysis, int outW) {
    const auto& calibration = analysis.calibrationData;
    if (!calibration || calibration->tableCorners.size() != 4) return cv::Mat();

    WarpResult warp = warpTable(toBgr(frame), calibration->homography,
                                calibration->tableDimensions, outW);
    cv::Mat& canvas = warp.warped;

    // 52.5 mm balls on a 3.569 m table.
    double metresToCanvas = (outW - 1) / static_cast<double>(calibration->tableDimensions.width);
    int radius = std::max(static_cast<int>(round(0.02625 * metresToCanvas)), 4);
    float textSize = 0.7f * (radius / 8.0f);

    for (const auto& ball : analysis.trackedBalls) {
        if (!ball.hasTablePosition || ball.isRetired()) continue;
        cv::Point2f p = ball.tablePosition * static_cast<float>(metresToCanvas);
        LOGD("  %s #%d @ (%.3f, %.3f) m", ballTypeName(ball.ballType), ball.trackId,
             ball.tablePosition.x, ball.tablePosition.y);
        cv::circle(canvas, p, radius, ballColor(ball.ballType), cv::FILLED, cv::LINE_AA);
        cv::putText(canvas, std::to_string(ball.trackId), p + cv::Point2f(radius + 2, 0),
                    cv::FONT_HERSHEY_SIMPLEX, textSize, cv::Scalar(255, 255, 255), 2);
    }
    return canvas;
}
