#ifndef CALIBRATION_ENGINE_HPP
#define CALIBRATION_ENGINE_HPP

#include <memory>
#include <opencv2/core.hpp>
#include <string>
#include <vector>

#include "config.hpp"
#include "snooker_types.hpp"
#include "table_detector.hpp"

enum class CalibrationState { Uncalibrated, Calibrating, Calibrated, Recalibrating };

const char* calibrationStateName(CalibrationState state);

// Outcome of a calibration attempt that has not been committed yet.
struct CalibrationAttempt {
    bool attempted = false;
    int frameNumber = -1;
    std::shared_ptr<const CalibrationData> candidate;  // null when the attempt failed
    std::string failureReason;
    double cornerShift = -1.0;  // mean corner displacement from the current calibration, pixels
    bool fromCache = false;
    bool hypothesisRejected = false;  // live corners disagreed with the cached calibration
};

struct CalibrationStats {
    int attempts = 0;
    int successes = 0;
    int failures = 0;
    int cameraMotionEvents = 0;
    int cacheHits = 0;
};

class CalibrationEngine {
   public:
    explicit CalibrationEngine(const CalibrationConfig& config);

    // Attempts calibration on the frame and commits the outcome. Returns the authoritative
    // calibration afterwards, which is unchanged when the attempt fails.
    std::shared_ptr<const CalibrationData> calibrate(const cv::Mat& frame, int frameNumber,
                                                     double timestamp);

    // Same as calibrate() with externally supplied corners (TL, TR, BR, BL).
    std::shared_ptr<const CalibrationData> calibrateFromCorners(
        const std::vector<cv::Point2f>& corners, int frameNumber, double timestamp,
        cv::Size imageSize = cv::Size());

    // Two-phase form used by the frame processor: nothing changes until commit().
    CalibrationAttempt attempt(const cv::Mat& frame, int frameNumber, double timestamp);
    CalibrationAttempt attemptFromCorners(const std::vector<cv::Point2f>& corners,
                                          int frameNumber, double timestamp, cv::Size imageSize);
    void commit(const CalibrationAttempt& outcome);
    void abandon();

    bool needsCalibration(int frameNumber) const;
    // True once residualCheckInterval frames have passed since the last calibration, attempt
    // or recorded residual check.
    bool residualCheckDue(int frameNumber) const;
    void recordResidualCheck(int frameNumber);

    // Mean pixel distance between corners found in the frame and the calibrated corners,
    // or -1 when there is no calibration or no corners were found.
    double measureResidual(const cv::Mat& frame) const;

    // Schedules a recalibration on the next frame; the current calibration stays authoritative.
    void requestRecalibration(const std::string& reason);

    // A persisted calibration to confirm against live frames before it is trusted.
    void offerHypothesis(std::shared_ptr<const CalibrationData> hypothesis);

    CalibrationState state() const;
    bool isCalibrated() const;
    std::shared_ptr<const CalibrationData> current() const { return currentData; }
    std::shared_ptr<const CalibrationData> lastValid() const { return lastValidData; }
    bool hasHypothesis() const { return hypothesis != nullptr; }
    cv::Matx33d transformMatrix() const;
    int consecutiveFailures() const { return failureStreak; }
    const CalibrationStats& stats() const { return statistics; }

    // Fits the pixel -> table homography for an ordered quad and validates it.
    // Throws CalibrationError when the quad or the fitted homography is rejected.
    std::shared_ptr<CalibrationData> buildCalibration(const std::vector<cv::Point2f>& corners,
                                                      cv::Size imageSize, int frameNumber,
                                                      double timestamp) const;

    // Mean pixel distance between the corners and the table rectangle mapped back through the
    // inverse homography.
    static double reprojectionError(const CalibrationData& data);

   private:
    bool hypothesisConsistent(const CalibrationData& hypothesis, cv::Size imageSize) const;

    CalibrationConfig config;
    TableDetector tableDetector;

    CalibrationState committedState = CalibrationState::Uncalibrated;
    bool attemptInProgress = false;
    bool recalibrationRequested = false;
    int lastCalibrationFrame = -1;
    int lastAttemptFrame = -1;
    int lastResidualCheckFrame = -1;
    int failureStreak = 0;

    std::shared_ptr<const CalibrationData> currentData;
    std::shared_ptr<const CalibrationData> lastValidData;
    std::shared_ptr<const CalibrationData> hypothesis;
    CalibrationStats statistics;
};

#endif  // CALIBRATION_ENGINE_HPP
