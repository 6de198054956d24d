#include <memory>
#include <opencv2/opencv.hpp>
#include <vector>

#include "config.hpp"
#include "errors.hpp"
#include "frame_processor.hpp"
#include "test_utils.hpp"

using namespace cv;
using namespace std;

namespace {

const int kRed = static_cast<int>(BallType::Red);
const Size kFrameSize(1280, 720);
const Rect kSurface(200, 150, 880, 440);

Mat tableFrame() { return makeTableImage(kFrameSize, kSurface); }
Mat blankFrame() { return Mat(kFrameSize, CV_8UC3, Scalar(30, 30, 30)); }

bool hasDiagnostic(const FrameAnalysis& analysis, Subsystem subsystem) {
    for (const auto& d : analysis.diagnostics) {
        if (d.subsystem == subsystem && d.frameNumber == analysis.frameNumber) return true;
    }
    return false;
}

// Ten frames without detections after a ball was established on a calibrated table.
bool emptyDetectionsRetireTracksKeepCalibration() {
    SessionConfig config;
    config.tracking.maxDisappearedFrames = 5;
    auto classifier = make_unique<ScriptedClassifier>(deque<vector<RawDetection>>{
        {makeRaw(kRed, 640, 370, 0.9f)}, {makeRaw(kRed, 640, 370, 0.9f)},
        {makeRaw(kRed, 640, 370, 0.9f)}, {}});
    FrameProcessor processor(config, std::move(classifier));

    shared_ptr<const FrameAnalysis> analysis;
    for (int frame = 0; frame < 3; ++frame) {
        analysis = processor.process(tableFrame(), frame, frame / 30.0);
        CHECK(analysis != nullptr);
    }
    CHECK(analysis->trackedBalls.size() == 1);
    CHECK(analysis->trackedBalls[0].state == TrackState::Active);
    shared_ptr<const CalibrationData> calibration = processor.calibration();
    CHECK(calibration != nullptr && calibration->isValid);
    const Matx33d homography = calibration->homography;

    for (int frame = 3; frame < 13; ++frame) {
        analysis = processor.process(tableFrame(), frame, frame / 30.0);
        CHECK(analysis != nullptr);
        CHECK(analysis->detections.empty());
        CHECK(!hasDiagnostic(*analysis, Subsystem::Tracking));
        CHECK(analysis->calibrationData == calibration);
        CHECK(analysis->tableCoordinatesValid);

        if (frame < 7) {
            CHECK(analysis->trackedBalls.size() == 1);
            CHECK(analysis->trackedBalls[0].state == TrackState::Occluded);
        } else if (frame == 7) {
            // Retired five frames after it was last seen, away from any pocket.
            CHECK(analysis->trackedBalls.size() == 1);
            CHECK(analysis->trackedBalls[0].state == TrackState::Deleted);
            CHECK(analysis->events.empty());
        } else {
            CHECK(analysis->trackedBalls.empty());
            CHECK(analysis->trajectories.empty());
        }
    }

    CHECK(processor.calibration() == calibration);
    CHECK(processor.calibration()->homography == homography);
    CHECK(processor.stats().framesProcessed == 13);
    CHECK(processor.stats().calibrationSuccesses == 1);
    CHECK(processor.stats().trackingFailures == 0);
    CHECK(processor.tracker().stats().tracksDeleted == 1);
    CHECK(processor.analyzer().stats().framesAnalyzed == 13);
    CHECK(processor.analyzer().stats().pottingEvents == 0);
    return true;
}

bool emptyFramesAreAbsorbed() {
    SessionConfig config;
    FrameProcessor processor(config, make_unique<ScriptedClassifier>());
    for (int frame = 0; frame < 10; ++frame) {
        auto analysis = processor.process(Mat(), frame, frame / 30.0);
        CHECK(analysis != nullptr);
        CHECK(analysis->trackedBalls.empty());
        CHECK(hasDiagnostic(*analysis, Subsystem::Detection));
        CHECK(!analysis->tableCoordinatesValid);
    }
    CHECK(processor.stats().detectionFailures == 10);
    return true;
}

bool rejectsOutOfOrderFrames() {
    SessionConfig config;
    FrameProcessor processor(config, make_unique<ScriptedClassifier>());
    CHECK(processor.process(tableFrame(), 5, 0.17) != nullptr);
    CHECK(processor.process(tableFrame(), 3, 0.10) == nullptr);
    CHECK(processor.process(tableFrame(), 5, 0.17) == nullptr);
    CHECK(processor.process(tableFrame(), 6, 0.20) != nullptr);
    CHECK(processor.stats().framesRejected == 2);
    CHECK(processor.stats().framesProcessed == 2);
    return true;
}

bool mapsBallsToTableCoordinates() {
    SessionConfig config;
    auto classifier = make_unique<ScriptedClassifier>(
        deque<vector<RawDetection>>{{makeRaw(kRed, 640, 370, 0.9f)}});
    FrameProcessor processor(config, std::move(classifier));

    shared_ptr<const FrameAnalysis> analysis;
    for (int frame = 0; frame < 3; ++frame) {
        analysis = processor.process(tableFrame(), frame, frame / 30.0);
        CHECK(analysis != nullptr);
    }

    CHECK(processor.calibrator().state() == CalibrationState::Calibrated);
    CHECK(analysis->calibrationData && analysis->calibrationData->isValid);
    CHECK(analysis->tableCoordinatesValid);
    CHECK(!analysis->usedPriorCalibration);

    CHECK(analysis->detections.size() == 1);
    CHECK(analysis->detectionTablePositions.size() == 1);
    const float length = config.calibration.tableLength;
    const float width = config.calibration.tableWidth;
    CHECK_NEAR(analysis->detectionTablePositions[0].x, length / 2, 0.05);
    CHECK_NEAR(analysis->detectionTablePositions[0].y, width / 2, 0.05);

    CHECK(analysis->trackedBalls.size() == 1);
    const TrackedBall& ball = analysis->trackedBalls[0];
    CHECK(ball.state == TrackState::Active);
    CHECK(ball.hasTablePosition);
    CHECK_NEAR(ball.tablePosition.x, length / 2, 0.05);
    return true;
}

bool fallsBackToPriorCalibration() {
    SessionConfig config;
    config.calibration.recalibrationInterval = 1;
    config.calibration.maxRecalibrationFailures = 2;
    auto classifier = make_unique<ScriptedClassifier>(
        deque<vector<RawDetection>>{{makeRaw(kRed, 640, 370, 0.9f)}});
    FrameProcessor processor(config, std::move(classifier));

    auto analysis = processor.process(tableFrame(), 0, 0.0);
    CHECK(analysis->tableCoordinatesValid);

    // First failed recalibration: the existing calibration stays authoritative.
    analysis = processor.process(blankFrame(), 1, 0.033);
    CHECK(hasDiagnostic(*analysis, Subsystem::Calibration));
    CHECK(analysis->tableCoordinatesValid);
    CHECK(processor.calibrator().state() == CalibrationState::Calibrated);

    // Budget exhausted: positions still come from the last valid calibration, flagged as such.
    analysis = processor.process(blankFrame(), 2, 0.067);
    CHECK(processor.calibrator().state() == CalibrationState::Uncalibrated);
    CHECK(!analysis->tableCoordinatesValid);
    CHECK(analysis->usedPriorCalibration);
    CHECK(analysis->detectionTablePositions.size() == 1);
    CHECK(processor.stats().calibrationFailures == 2);
    return true;
}

bool withoutCalibrationReportsCoordinateError() {
    SessionConfig config;
    auto classifier = make_unique<ScriptedClassifier>(
        deque<vector<RawDetection>>{{makeRaw(kRed, 640, 370, 0.9f)}});
    FrameProcessor processor(config, std::move(classifier));

    auto analysis = processor.process(blankFrame(), 0, 0.0);
    CHECK(analysis != nullptr);
    CHECK(analysis->detections.size() == 1);
    CHECK(analysis->detectionTablePositions.empty());
    CHECK(hasDiagnostic(*analysis, Subsystem::Coordinates));
    CHECK(hasDiagnostic(*analysis, Subsystem::Calibration));
    CHECK(!analysis->tableCoordinatesValid);
    return true;
}

bool inferenceFailureKeepsStreamAlive() {
    SessionConfig config;
    config.tracking.minHitsToActivate = 1;
    auto classifier = make_unique<ScriptedClassifier>(
        deque<vector<RawDetection>>{{makeRaw(kRed, 640, 370, 0.9f)}});
    ScriptedClassifier* scripted = classifier.get();
    FrameProcessor processor(config, std::move(classifier));

    processor.process(tableFrame(), 0, 0.0);
    scripted->failNext = true;
    auto failed = processor.process(tableFrame(), 1, 0.033);
    CHECK(failed != nullptr);
    CHECK(failed->detections.empty());
    CHECK(hasDiagnostic(*failed, Subsystem::Detection));

    auto recovered = processor.process(tableFrame(), 2, 0.067);
    CHECK(recovered->detections.size() == 1);
    CHECK(recovered->trackedBalls.size() == 1);
    CHECK(recovered->trackedBalls[0].trackId == 1);
    CHECK(recovered->trackedBalls[0].state == TrackState::Active);
    return true;
}

bool cancelledProcessorRefusesFrames() {
    SessionConfig config;
    FrameProcessor processor(config, make_unique<ScriptedClassifier>());
    CHECK(processor.process(tableFrame(), 0, 0.0) != nullptr);
    processor.cancel();
    CHECK(processor.isCancelled());
    CHECK(processor.process(tableFrame(), 1, 0.033) == nullptr);
    CHECK(processor.stats().framesCancelled == 1);
    return true;
}

bool invalidConfigurationFailsFast() {
    SessionConfig config;
    config.calibration.tableWidth = -1.f;
    CHECK_THROWS(FrameProcessor(config, make_unique<ScriptedClassifier>()), ConfigurationError);

    SessionConfig noModel;
    CHECK_THROWS(FrameProcessor processor(noModel), ConfigurationError);
    return true;
}

}  // namespace

int main() {
    return runTests({
        {"emptyDetectionsRetireTracksKeepCalibration", emptyDetectionsRetireTracksKeepCalibration},
        {"emptyFramesAreAbsorbed", emptyFramesAreAbsorbed},
        {"rejectsOutOfOrderFrames", rejectsOutOfOrderFrames},
        {"mapsBallsToTableCoordinates", mapsBallsToTableCoordinates},
        {"fallsBackToPriorCalibration", fallsBackToPriorCalibration},
        {"withoutCalibrationReportsCoordinateError", withoutCalibrationReportsCoordinateError},
        {"inferenceFailureKeepsStreamAlive", inferenceFailureKeepsStreamAlive},
        {"cancelledProcessorRefusesFrames", cancelledProcessorRefusesFrames},
        {"invalidConfigurationFailsFast", invalidConfigurationFailsFast},
    });
}
