#include "analysis_json.hpp"

#include <cmath>

namespace {

// JSON has no nan or infinity.
std::string numberJson(double value) {
    return std::isfinite(value) ? std::to_string(value) : "null";
}

std::string escape(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\n':
                out += "\\n";
                break;
            default:
                out += c;
        }
    }
    return out;
}

std::string pointJson(const cv::Point2f& p) {
    return "[" + numberJson(p.x) + ", " + numberJson(p.y) + "]";
}

std::string pointsJson(const std::vector<cv::Point2f>& points) {
    std::string json = "[";
    for (size_t i = 0; i < points.size(); ++i) {
        json += pointJson(points[i]);
        if (i < points.size() - 1) json += ", ";
    }
    return json + "]";
}

std::string boxJson(const BoundingBox& box) {
    return "{\"x1\": " + numberJson(box.x1) + ", \"y1\": " + numberJson(box.y1) +
           ", \"x2\": " + numberJson(box.x2) + ", \"y2\": " + numberJson(box.y2) + "}";
}

std::string eventJson(const BallEvent& event) {
    std::string json = "{\"type\": \"" + std::string(ballEventTypeName(event.type)) + "\"";
    json += ", \"frame_number\": " + std::to_string(event.frameNumber);
    json += ", \"track_id\": " + std::to_string(event.trackId);
    json += ", \"ball_type\": \"" + std::string(ballTypeName(event.ballType)) + "\"";
    if (event.type == BallEventType::Collision) {
        json += ", \"other_track_id\": " + std::to_string(event.otherTrackId);
        json += ", \"other_ball_type\": \"" + std::string(ballTypeName(event.otherBallType)) + "\"";
    } else {
        json += ", \"pocket\": " + std::to_string(event.pocket);
    }
    json += ", \"position\": " + pointJson(event.position);
    json += ", \"confidence\": " + numberJson(event.confidence) + "}";
    return json;
}

}  // namespace

std::string formatDetectionsJson(const std::vector<Detection>& detections,
                                 const std::vector<cv::Point2f>& tablePositions) {
    std::string json = "[";
    for (size_t i = 0; i < detections.size(); ++i) {
        const auto& detection = detections[i];
        json += "{";
        json += "\"class_id\": " + std::to_string(detection.classId) + ", ";
        json += "\"ball_type\": \"" + std::string(ballTypeName(detection.ballType())) + "\", ";
        json += "\"confidence\": " + numberJson(detection.confidence) + ", ";
        json += "\"center\": " + pointJson(detection.centroid()) + ", ";
        if (i < tablePositions.size()) {
            json += "\"table_position\": " + pointJson(tablePositions[i]) + ", ";
        }
        json += "\"box\": " + boxJson(detection.bbox);
        json += "}";
        if (i < detections.size() - 1) {
            json += ", ";
        }
    }
    json += "]";
    return json;
}

std::string formatTrackedBallsJson(const std::vector<TrackedBall>& balls) {
    std::string json = "[";
    for (size_t i = 0; i < balls.size(); ++i) {
        const auto& ball = balls[i];
        json += "{";
        json += "\"track_id\": " + std::to_string(ball.trackId) + ", ";
        json += "\"ball_type\": \"" + std::string(ballTypeName(ball.ballType)) + "\", ";
        json += "\"state\": \"" + std::string(trackStateName(ball.state)) + "\", ";
        json += "\"position\": " + pointJson(ball.currentPosition) + ", ";
        json += "\"velocity\": " + pointJson(ball.velocity) + ", ";
        if (ball.hasTablePosition) {
            json += "\"table_position\": " + pointJson(ball.tablePosition) + ", ";
        }
        json += "\"last_seen_frame\": " + std::to_string(ball.lastSeenFrame) + ", ";
        json += "\"frames_since_seen\": " + std::to_string(ball.framesSinceSeen) + ", ";
        json += "\"trajectory\": " + pointsJson(ball.trajectory);
        json += "}";
        if (i < balls.size() - 1) json += ", ";
    }
    json += "]";
    return json;
}

std::string formatTrajectoriesJson(const std::vector<TrajectorySummary>& summaries) {
    std::string json = "[";
    for (size_t i = 0; i < summaries.size(); ++i) {
        const auto& s = summaries[i];
        json += "{\"track_id\": " + std::to_string(s.trackId);
        json += ", \"ball_type\": \"" + std::string(ballTypeName(s.ballType)) + "\"";
        json += ", \"motion\": \"" + std::string(motionStateName(s.motion)) + "\"";
        json += ", \"trajectory_length\": " + std::to_string(s.trajectoryLength);
        json += ", \"total_distance\": " + numberJson(s.totalDistance);
        json += ", \"average_speed\": " + numberJson(s.averageSpeed);
        json += ", \"direction_changes\": " + std::to_string(s.directionChanges);
        json += ", \"near_pocket\": " + std::to_string(s.nearPocket) + "}";
        if (i < summaries.size() - 1) json += ", ";
    }
    return json + "]";
}

std::string formatEventsJson(const std::vector<BallEvent>& events) {
    std::string json = "[";
    for (size_t i = 0; i < events.size(); ++i) {
        json += eventJson(events[i]);
        if (i < events.size() - 1) json += ", ";
    }
    return json + "]";
}

std::string formatOverviewJson(const TrajectoryOverview& overview) {
    std::string json = "{\"total_balls\": " + std::to_string(overview.totalBalls);
    json += ", \"active_balls\": " + std::to_string(overview.activeBalls);
    json += ", \"motion_states\": {";
    for (int i = 0; i < kMotionStateCount; ++i) {
        json += "\"" + std::string(motionStateName(static_cast<MotionState>(i))) +
                "\": " + std::to_string(overview.motionCounts[i]);
        if (i < kMotionStateCount - 1) json += ", ";
    }
    json += "}, \"total_events\": " + std::to_string(overview.totalEvents);
    json += ", \"average_trajectory_length\": " + numberJson(overview.averageTrajectoryLength);
    json += ", \"total_distance\": " + numberJson(overview.totalDistance) + "}";
    return json;
}

std::string formatCalibrationJson(const CalibrationData* calibration, CalibrationState state) {
    std::string json = "{\"state\": \"" + std::string(calibrationStateName(state)) + "\"";
    if (calibration == nullptr) {
        return json + ", \"is_valid\": false}";
    }
    json += ", \"is_valid\": " + std::string(calibration->isValid ? "true" : "false");
    json += ", \"frame_number\": " + std::to_string(calibration->frameNumber);
    json += ", \"timestamp\": " + numberJson(calibration->timestamp);
    json += ", \"reprojection_error\": " + numberJson(calibration->reprojectionError);
    json += ", \"table_dimensions\": " + pointJson(cv::Point2f(
                                             calibration->tableDimensions.width,
                                             calibration->tableDimensions.height));
    json += ", \"table_corners\": " + pointsJson(calibration->tableCorners);

    json += ", \"homography\": [";
    for (int i = 0; i < 9; ++i) {
        json += numberJson(calibration->homography.val[i]);
        if (i < 8) json += ", ";
    }
    json += "], \"pocket_regions\": [";
    for (size_t i = 0; i < calibration->pocketRegions.size(); ++i) {
        json += boxJson(calibration->pocketRegions[i]);
        if (i < calibration->pocketRegions.size() - 1) json += ", ";
    }
    json += "]}";
    return json;
}

std::string formatFrameAnalysisJson(const FrameAnalysis& analysis) {
    std::string json = "{";
    json += "\"frame_number\": " + std::to_string(analysis.frameNumber);
    json += ", \"timestamp\": " + numberJson(analysis.timestamp);
    json += ", \"processing_time_ms\": " + numberJson(analysis.processingTime);
    json += ", \"table_coordinates_valid\": " +
            std::string(analysis.tableCoordinatesValid ? "true" : "false");
    json += ", \"used_prior_calibration\": " +
            std::string(analysis.usedPriorCalibration ? "true" : "false");
    json += ", \"detections\": " +
            formatDetectionsJson(analysis.detections, analysis.detectionTablePositions);
    json += ", \"tracked_balls\": " + formatTrackedBallsJson(analysis.trackedBalls);
    json += ", \"trajectories\": " + formatTrajectoriesJson(analysis.trajectories);
    json += ", \"events\": " + formatEventsJson(analysis.events);
    json += ", \"summary\": " + formatOverviewJson(analysis.overview);
    json += ", \"diagnostics\": [";
    for (size_t i = 0; i < analysis.diagnostics.size(); ++i) {
        const auto& d = analysis.diagnostics[i];
        json += "{\"subsystem\": \"" + std::string(subsystemName(d.subsystem)) +
                "\", \"reason\": \"" + escape(d.reason) + "\"}";
        if (i < analysis.diagnostics.size() - 1) json += ", ";
    }
    json += "]}";
    return json;
}

std::string formatErrorJson(const std::string& message) {
    return "{\"error\": \"" + escape(message) + "\"}";
}
