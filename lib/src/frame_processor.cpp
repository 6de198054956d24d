#include "frame_processor.hpp"

#include <chrono>

#include "coordinate_transformer.hpp"
#include "errors.hpp"
#include "utilities.hpp"

using namespace std;
using namespace cv;

namespace {

const SessionConfig& validated(const SessionConfig& config, bool requireModel) {
    config.validate(requireModel);
    return config;
}

}  // namespace

FrameProcessor::FrameProcessor(const SessionConfig& config)
    : config(validated(config, true)),
      ballDetector(config.detection),
      calibrationEngine(config.calibration),
      ballTracker(config.tracking),
      trajectoryAnalyzer(config.analysis) {
    restoreCachedCalibration();
}

FrameProcessor::FrameProcessor(const SessionConfig& config, unique_ptr<BallClassifier> classifier)
    : config(validated(config, false)),
      ballDetector(config.detection, std::move(classifier)),
      calibrationEngine(config.calibration),
      ballTracker(config.tracking),
      trajectoryAnalyzer(config.analysis) {
    restoreCachedCalibration();
}

void FrameProcessor::restoreCachedCalibration() {
    if (config.calibration.cacheDirectory.empty()) return;
    store = make_unique<CalibrationStore>(config.calibration.cacheDirectory,
                                          config.calibration.cacheMaxAgeHours);
    auto cached = store->load(config.cameraId);
    if (cached) calibrationEngine.offerHypothesis(cached);
}

void FrameProcessor::addDiagnostic(FrameAnalysis& analysis, Subsystem subsystem,
                                   const string& reason) {
    analysis.diagnostics.push_back({analysis.frameNumber, subsystem, reason});
    if (subsystem == Subsystem::Coordinates) {
        LOGD("[FrameProcessor] frame %d [%s] %s", analysis.frameNumber, subsystemName(subsystem),
             reason.c_str());
    } else {
        LOGE("[FrameProcessor] frame %d [%s] %s", analysis.frameNumber, subsystemName(subsystem),
             reason.c_str());
    }
}

void FrameProcessor::mapToTable(FrameAnalysis& analysis) const {
    shared_ptr<const CalibrationData> source = analysis.calibrationData;
    bool prior = false;
    if (!source || !source->isValid) {
        source = calibrationEngine.lastValid();
        prior = source != nullptr;
    }

    CoordinateTransformer transformer(source);
    vector<Point2f> centroids;
    centroids.reserve(analysis.detections.size());
    for (const auto& d : analysis.detections) centroids.push_back(d.centroid());

    analysis.detectionTablePositions = transformer.pixelsToTable(centroids);
    for (auto& ball : analysis.trackedBalls) {
        ball.tablePosition = transformer.pixelToTable(ball.currentPosition);
        ball.hasTablePosition = true;
    }
    analysis.usedPriorCalibration = prior;
    analysis.tableCoordinatesValid = !prior;
}

shared_ptr<const FrameAnalysis> FrameProcessor::process(const Mat& frame, int frameNumber,
                                                        double timestamp) {
    auto start = chrono::steady_clock::now();
    auto elapsedMs = [&start]() {
        return chrono::duration<double, milli>(chrono::steady_clock::now() - start).count();
    };

    if (cancelled) {
        statistics.framesCancelled++;
        return nullptr;
    }
    if (anyFrame && frameNumber <= lastFrameNumber) {
        statistics.framesRejected++;
        LOGW("[FrameProcessor] Rejecting frame %d, already at frame %d", frameNumber,
             lastFrameNumber);
        return nullptr;
    }

    auto analysis = make_shared<FrameAnalysis>();
    analysis->frameNumber = frameNumber;
    analysis->timestamp = timestamp;

    analysis->detections = ballDetector.detect(frame, timestamp);
    if (!ballDetector.lastError().empty()) {
        statistics.detectionFailures++;
        addDiagnostic(*analysis, Subsystem::Detection,
                      "DetectionError: " + ballDetector.lastError());
    }

    // Calibration is computed here and committed only once the frame is known to complete.
    CalibrationAttempt attempt;
    double residual = -1.0;
    bool residualChecked = false;
    if (!frame.empty()) {
        if (calibrationEngine.needsCalibration(frameNumber)) {
            attempt = calibrationEngine.attempt(frame, frameNumber, timestamp);
        } else if (calibrationEngine.residualCheckDue(frameNumber)) {
            residualChecked = true;
            try {
                residual = calibrationEngine.measureResidual(frame);
            } catch (const cv::Exception& e) {
                addDiagnostic(*analysis, Subsystem::Calibration,
                              string("CalibrationError: residual check failed: ") + e.what());
            }
        }
    }

    if (cancelled) {
        calibrationEngine.abandon();
        statistics.framesCancelled++;
        LOGI("[FrameProcessor] Cancelled, discarding frame %d", frameNumber);
        return nullptr;
    }
    if (config.liveMode && config.frameBudgetMs > 0.0 && elapsedMs() > config.frameBudgetMs) {
        calibrationEngine.abandon();
        statistics.framesDropped++;
        LOGW("[FrameProcessor] Dropping frame %d, %.1f ms over a %.1f ms budget", frameNumber,
             elapsedMs(), config.frameBudgetMs);
        return nullptr;
    }

    lastFrameNumber = frameNumber;
    anyFrame = true;

    if (attempt.attempted) {
        calibrationEngine.commit(attempt);
        if (attempt.candidate) {
            statistics.calibrationSuccesses++;
            ballTracker.setPocketRegions(attempt.candidate->pocketRegions);
            trajectoryAnalyzer.setPocketRegions(attempt.candidate->pocketRegions);
            if (store && !attempt.fromCache) store->save(*attempt.candidate, config.cameraId);
        } else {
            statistics.calibrationFailures++;
            addDiagnostic(*analysis, Subsystem::Calibration,
                          "CalibrationError: " + attempt.failureReason);
        }
    }
    if (residualChecked) calibrationEngine.recordResidualCheck(frameNumber);
    if (residual > config.calibration.residualTolerance) {
        calibrationEngine.requestRecalibration("table corners moved " + to_string(residual) +
                                               " px");
    }
    analysis->calibrationData = calibrationEngine.current();

    try {
        analysis->trackedBalls = ballTracker.update(analysis->detections, frameNumber);
    } catch (const cv::Exception& e) {
        statistics.trackingFailures++;
        addDiagnostic(*analysis, Subsystem::Tracking, string("TrackingError: ") + e.what());
    }
    for (const auto& e : ballTracker.lastErrors()) {
        statistics.trackingFailures++;
        addDiagnostic(*analysis, Subsystem::Tracking, string("TrackingError: ") + e.what());
    }

    try {
        mapToTable(*analysis);
    } catch (const CoordinateError& e) {
        statistics.coordinateFailures++;
        analysis->detectionTablePositions.clear();
        addDiagnostic(*analysis, Subsystem::Coordinates, string("CoordinateError: ") + e.what());
    }

    try {
        trajectoryAnalyzer.analyze(*analysis);
    } catch (const cv::Exception& e) {
        addDiagnostic(*analysis, Subsystem::Tracking,
                      string("TrackingError: trajectory analysis failed: ") + e.what());
    }

    analysis->processingTime = elapsedMs();
    statistics.framesProcessed++;
    statistics.meanProcessingTimeMs +=
        (analysis->processingTime - statistics.meanProcessingTimeMs) / statistics.framesProcessed;
    return analysis;
}
