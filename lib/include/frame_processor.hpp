#ifndef FRAME_PROCESSOR_HPP
#define FRAME_PROCESSOR_HPP

#include <atomic>
#include <memory>
#include <opencv2/core.hpp>

#include "ball_detector.hpp"
#include "ball_tracker.hpp"
#include "calibration_engine.hpp"
#include "calibration_store.hpp"
#include "config.hpp"
#include "snooker_types.hpp"
#include "trajectory_analyzer.hpp"

struct ProcessingStats {
    long framesProcessed = 0;
    long framesDropped = 0;    // over the live-mode budget
    long framesRejected = 0;   // out of order
    long framesCancelled = 0;
    long detectionFailures = 0;
    long calibrationFailures = 0;
    long calibrationSuccesses = 0;
    long coordinateFailures = 0;
    long trackingFailures = 0;
    double meanProcessingTimeMs = 0.0;
};

// Runs one frame through detection, calibration, tracking and table mapping. Frames must arrive
// with strictly increasing frame numbers. Not thread-safe; one caller drives a processor.
class FrameProcessor {
   public:
    // Throws ConfigurationError when the configuration is invalid.
    explicit FrameProcessor(const SessionConfig& config);
    FrameProcessor(const SessionConfig& config, std::unique_ptr<BallClassifier> classifier);

    // Null when the frame is rejected, dropped or the processor was cancelled.
    std::shared_ptr<const FrameAnalysis> process(const cv::Mat& frame, int frameNumber,
                                                 double timestamp);

    // Safe from any thread. The frame in flight is discarded and later frames are refused.
    void cancel() { cancelled = true; }
    bool isCancelled() const { return cancelled; }

    std::shared_ptr<const CalibrationData> calibration() const { return calibrationEngine.current(); }

    const SessionConfig& sessionConfig() const { return config; }
    const BallDetector& detector() const { return ballDetector; }
    const CalibrationEngine& calibrator() const { return calibrationEngine; }
    const BallTracker& tracker() const { return ballTracker; }
    const TrajectoryAnalyzer& analyzer() const { return trajectoryAnalyzer; }
    const ProcessingStats& stats() const { return statistics; }

   private:
    void restoreCachedCalibration();
    void mapToTable(FrameAnalysis& analysis) const;
    static void addDiagnostic(FrameAnalysis& analysis, Subsystem subsystem,
                              const std::string& reason);

    SessionConfig config;
    BallDetector ballDetector;
    CalibrationEngine calibrationEngine;
    BallTracker ballTracker;
    TrajectoryAnalyzer trajectoryAnalyzer;
    std::unique_ptr<CalibrationStore> store;

    std::atomic<bool> cancelled{false};
    int lastFrameNumber = -1;
    bool anyFrame = false;
    ProcessingStats statistics;
};

#endif  // FRAME_PROCESSOR_HPP
