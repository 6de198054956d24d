#include "calibration_engine.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <opencv2/imgproc.hpp>

#include "errors.hpp"
#include "quad_analysis.hpp"
#include "utilities.hpp"

using namespace std;
using namespace cv;

namespace {

vector<Point2f> tableRectangle(const Size2f& dims) {
    return {Point2f(0.f, 0.f), Point2f(dims.width, 0.f), Point2f(dims.width, dims.height),
            Point2f(0.f, dims.height)};
}

bool isFinite(const Matx33d& m) {
    for (int i = 0; i < 9; ++i) {
        if (!std::isfinite(m.val[i])) return false;
    }
    return true;
}

}  // namespace

const char* calibrationStateName(CalibrationState state) {
    switch (state) {
        case CalibrationState::Uncalibrated:
            return "uncalibrated";
        case CalibrationState::Calibrating:
            return "calibrating";
        case CalibrationState::Calibrated:
            return "calibrated";
        case CalibrationState::Recalibrating:
            return "recalibrating";
    }
    return "unknown";
}

CalibrationEngine::CalibrationEngine(const CalibrationConfig& config)
    : config(config), tableDetector(config) {}

double CalibrationEngine::reprojectionError(const CalibrationData& data) {
    if (data.tableCorners.size() != 4) return std::numeric_limits<double>::infinity();

    Matx33d inverse = data.homography.inv();
    vector<Point2f> reprojected;
    perspectiveTransform(tableRectangle(data.tableDimensions), reprojected, inverse);
    double error = meanPointDistance(reprojected, data.tableCorners);
    return error < 0 ? std::numeric_limits<double>::infinity() : error;
}

shared_ptr<CalibrationData> CalibrationEngine::buildCalibration(const vector<Point2f>& corners,
                                                                Size imageSize, int frameNumber,
                                                                double timestamp) const {
    QuadValidation check =
        QuadAnalysis::validateTableQuad(corners, imageSize, config.minTableAreaFraction);
    if (!check.isValid) {
        throw CalibrationError(check.errorMessage);
    }

    Size2f dims(config.tableLength, config.tableWidth);
    vector<Point2f> dst = tableRectangle(dims);
    // Long cushions running vertically in the image: rotate so table x follows them.
    int offset = QuadAnalysis::longSideHorizontal(corners) ? 0 : 1;
    vector<Point2f> src(4);
    for (int k = 0; k < 4; ++k) src[k] = corners[(k + offset) % 4];

    Mat h = getPerspectiveTransform(src, dst);
    Matx33d homography = h;
    if (!isFinite(homography) || std::abs(determinant(homography)) < 1e-12) {
        throw CalibrationError("homography is singular");
    }

    auto data = make_shared<CalibrationData>();
    data->homography = homography;
    data->tableCorners = src;
    data->tableDimensions = dims;
    data->imageSize = imageSize;
    data->frameNumber = frameNumber;
    data->timestamp = timestamp;

    data->reprojectionError = reprojectionError(*data);
    if (!(data->reprojectionError <= config.reprojectionTolerance)) {
        throw CalibrationError("reprojection error " + to_string(data->reprojectionError) +
                               " px exceeds tolerance");
    }

    // Forward check in table units, tolerance scaled by the first cushion's metres per pixel.
    vector<Point2f> mapped;
    perspectiveTransform(src, mapped, homography);
    double metresPerPixel = dims.width / std::max(norm(src[1] - src[0]), 1e-6);
    double forwardError = meanPointDistance(mapped, dst);
    if (!(forwardError >= 0 && forwardError <= config.reprojectionTolerance * metresPerPixel)) {
        throw CalibrationError("corners map " + to_string(forwardError) +
                               " m away from the table outline");
    }

    Matx33d inverse = homography.inv();
    const float half = config.pocketRegionSize / 2.f;
    const float xs[] = {0.f, dims.width / 2.f, dims.width};
    const float ys[] = {0.f, dims.height};
    Rect2f frameRect(0.f, 0.f, static_cast<float>(imageSize.width),
                     static_cast<float>(imageSize.height));
    for (float y : ys) {
        for (float x : xs) {
            vector<Point2f> square = {Point2f(x - half, y - half), Point2f(x + half, y - half),
                                      Point2f(x + half, y + half), Point2f(x - half, y + half)};
            vector<Point2f> pixels;
            perspectiveTransform(square, pixels, inverse);
            float minX = pixels[0].x, maxX = pixels[0].x, minY = pixels[0].y, maxY = pixels[0].y;
            for (const auto& p : pixels) {
                minX = std::min(minX, p.x);
                maxX = std::max(maxX, p.x);
                minY = std::min(minY, p.y);
                maxY = std::max(maxY, p.y);
            }
            Rect2f region(minX, minY, maxX - minX, maxY - minY);
            if (!imageSize.empty()) region &= frameRect;
            data->pocketRegions.push_back(BoundingBox::fromRect(region));
        }
    }

    data->isValid = true;
    return data;
}

bool CalibrationEngine::hypothesisConsistent(const CalibrationData& candidate,
                                             Size imageSize) const {
    if (!candidate.isValid || !isFinite(candidate.homography)) return false;
    if (!candidate.imageSize.empty() && candidate.imageSize != imageSize) return false;
    if (std::abs(candidate.tableDimensions.width - config.tableLength) > 1e-3f ||
        std::abs(candidate.tableDimensions.height - config.tableWidth) > 1e-3f) {
        return false;
    }
    return reprojectionError(candidate) <= config.reprojectionTolerance;
}

CalibrationAttempt CalibrationEngine::attemptFromCorners(const vector<Point2f>& corners,
                                                         int frameNumber, double timestamp,
                                                         Size imageSize) {
    attemptInProgress = true;
    CalibrationAttempt outcome;
    outcome.attempted = true;
    outcome.frameNumber = frameNumber;

    try {
        if (corners.size() != 4) {
            throw CalibrationError("table corners not found");
        }
        vector<Point2f> ordered = orderQuad(corners);

        if (!isCalibrated() && hypothesis) {
            double agreement = meanPointDistance(ordered, orderQuad(hypothesis->tableCorners));
            if (agreement >= 0 && agreement <= config.residualTolerance &&
                hypothesisConsistent(*hypothesis, imageSize)) {
                auto confirmed = make_shared<CalibrationData>(*hypothesis);
                confirmed->frameNumber = frameNumber;
                confirmed->timestamp = timestamp;
                outcome.candidate = confirmed;
                outcome.fromCache = true;
                return outcome;
            }
            LOGD("[Calibration] Cached calibration disagrees with frame %d (%.1f px)",
                 frameNumber, agreement);
            outcome.hypothesisRejected = true;
        }

        auto candidate = buildCalibration(ordered, imageSize, frameNumber, timestamp);
        if (currentData && currentData->isValid) {
            outcome.cornerShift =
                meanPointDistance(orderQuad(candidate->tableCorners),
                                  orderQuad(currentData->tableCorners));
        }
        outcome.candidate = candidate;
    } catch (const CalibrationError& e) {
        outcome.failureReason = e.what();
    } catch (const cv::Exception& e) {
        outcome.failureReason = string("OpenCV: ") + e.what();
    }
    return outcome;
}

CalibrationAttempt CalibrationEngine::attempt(const Mat& frame, int frameNumber, double timestamp) {
    vector<Point2f> corners;
    try {
        corners = tableDetector.detect(frame);
    } catch (const cv::Exception& e) {
        attemptInProgress = true;
        CalibrationAttempt outcome;
        outcome.attempted = true;
        outcome.frameNumber = frameNumber;
        outcome.failureReason = string("corner detection failed: ") + e.what();
        return outcome;
    }
    return attemptFromCorners(corners, frameNumber, timestamp, frame.size());
}

void CalibrationEngine::commit(const CalibrationAttempt& outcome) {
    attemptInProgress = false;
    if (!outcome.attempted) return;

    statistics.attempts++;
    lastAttemptFrame = outcome.frameNumber;
    if (outcome.hypothesisRejected && hypothesis) {
        LOGW("[Calibration] Cached calibration rejected at frame %d", outcome.frameNumber);
        hypothesis.reset();
    }

    if (outcome.candidate) {
        if (outcome.cornerShift > config.residualTolerance) {
            statistics.cameraMotionEvents++;
            LOGI("[Calibration] Camera motion at frame %d: corners moved %.1f px",
                 outcome.frameNumber, outcome.cornerShift);
        }
        if (outcome.fromCache) {
            statistics.cacheHits++;
            hypothesis.reset();
        }
        currentData = outcome.candidate;
        lastValidData = outcome.candidate;
        committedState = CalibrationState::Calibrated;
        lastCalibrationFrame = outcome.frameNumber;
        recalibrationRequested = false;
        failureStreak = 0;
        statistics.successes++;
        LOGI("[Calibration] Calibrated at frame %d, reprojection error %.3f px",
             outcome.frameNumber, outcome.candidate->reprojectionError);
        return;
    }

    statistics.failures++;
    if (committedState != CalibrationState::Calibrated) {
        committedState = CalibrationState::Uncalibrated;
        LOGD("[Calibration] Frame %d: %s", outcome.frameNumber, outcome.failureReason.c_str());
        return;
    }

    failureStreak++;
    LOGW("[Calibration] Recalibration failed at frame %d (%d/%d): %s", outcome.frameNumber,
         failureStreak, config.maxRecalibrationFailures, outcome.failureReason.c_str());
    if (failureStreak >= config.maxRecalibrationFailures) {
        auto invalidated = make_shared<CalibrationData>(*currentData);
        invalidated->isValid = false;
        currentData = invalidated;
        committedState = CalibrationState::Uncalibrated;
        recalibrationRequested = false;
        failureStreak = 0;
        LOGE("[Calibration] Retry budget exhausted at frame %d, calibration invalidated",
             outcome.frameNumber);
    }
}

void CalibrationEngine::abandon() { attemptInProgress = false; }

shared_ptr<const CalibrationData> CalibrationEngine::calibrate(const Mat& frame, int frameNumber,
                                                               double timestamp) {
    commit(attempt(frame, frameNumber, timestamp));
    return currentData;
}

shared_ptr<const CalibrationData> CalibrationEngine::calibrateFromCorners(
    const vector<Point2f>& corners, int frameNumber, double timestamp, Size imageSize) {
    commit(attemptFromCorners(corners, frameNumber, timestamp, imageSize));
    return currentData;
}

bool CalibrationEngine::needsCalibration(int frameNumber) const {
    if (!isCalibrated()) return true;
    if (recalibrationRequested) return true;
    if (!config.autoRecalibrate) return false;
    if (frameNumber - lastCalibrationFrame < config.recalibrationInterval) return false;

    // Failed scheduled attempts are retried at a tenth of the interval.
    int retryDelay = std::max(1, config.recalibrationInterval / 10);
    return failureStreak == 0 || frameNumber - lastAttemptFrame >= retryDelay;
}

bool CalibrationEngine::residualCheckDue(int frameNumber) const {
    if (!isCalibrated() || config.residualCheckInterval <= 0 || recalibrationRequested) {
        return false;
    }
    int since = frameNumber - std::max({lastCalibrationFrame, lastAttemptFrame,
                                        lastResidualCheckFrame});
    return since >= config.residualCheckInterval;
}

void CalibrationEngine::recordResidualCheck(int frameNumber) {
    lastResidualCheckFrame = frameNumber;
}

double CalibrationEngine::measureResidual(const Mat& frame) const {
    if (!isCalibrated()) return -1.0;
    vector<Point2f> corners = tableDetector.detect(frame);
    if (corners.size() != 4) return -1.0;
    return meanPointDistance(orderQuad(corners), orderQuad(currentData->tableCorners));
}

void CalibrationEngine::requestRecalibration(const string& reason) {
    if (!recalibrationRequested) {
        LOGI("[Calibration] Recalibration requested: %s", reason.c_str());
    }
    recalibrationRequested = true;
}

void CalibrationEngine::offerHypothesis(shared_ptr<const CalibrationData> cached) {
    hypothesis = std::move(cached);
}

CalibrationState CalibrationEngine::state() const {
    if (attemptInProgress) {
        return committedState == CalibrationState::Calibrated ? CalibrationState::Recalibrating
                                                              : CalibrationState::Calibrating;
    }
    return committedState;
}

bool CalibrationEngine::isCalibrated() const {
    return committedState == CalibrationState::Calibrated && currentData && currentData->isValid;
}

Matx33d CalibrationEngine::transformMatrix() const {
    if (!currentData) {
        throw CoordinateError("no calibration available");
    }
    return currentData->homography;
}
