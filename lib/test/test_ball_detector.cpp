#include <limits>
#include <memory>
#include <opencv2/opencv.hpp>
#include <vector>

#include "ball_detector.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "test_utils.hpp"

using namespace cv;
using namespace std;

namespace {

const int kCue = static_cast<int>(BallType::Cue);
const int kRed = static_cast<int>(BallType::Red);
const int kBlue = static_cast<int>(BallType::Blue);
const int kBlack = static_cast<int>(BallType::Black);

Mat frame() { return Mat(480, 640, CV_8UC3, Scalar(40, 120, 40)); }

// Detector driven by a scripted classifier; classifier stays owned by the detector.
unique_ptr<BallDetector> makeDetector(const DetectionConfig& config,
                                      deque<vector<RawDetection>> script,
                                      ScriptedClassifier** classifier = nullptr) {
    auto scripted = make_unique<ScriptedClassifier>(std::move(script));
    if (classifier) *classifier = scripted.get();
    return make_unique<BallDetector>(config, std::move(scripted));
}

bool dropsMalformedOutput() {
    DetectionConfig config;
    const float nan = numeric_limits<float>::quiet_NaN();
    auto detector = makeDetector(config, {{
                                             makeRaw(kRed, 100, 100, 0.9f),
                                             makeRaw(9, 200, 100, 0.9f),
                                             makeRaw(-1, 300, 100, 0.9f),
                                             makeRaw(kBlue, 400, 100, 1.5f),
                                             makeRaw(kBlue, 400, 200, nan),
                                             RawDetection{Rect2f(-20, 10, 10, 10), kCue, 0.9f},
                                             RawDetection{Rect2f(50, 50, 0, 10), kCue, 0.9f},
                                         }});

    vector<Detection> detections = detector->detect(frame(), 1.5);
    CHECK(detector->lastError().empty());
    CHECK(detections.size() == 1);
    CHECK(detections[0].classId == kRed);
    CHECK(detections[0].centroid() == Point2f(100, 100));
    CHECK_NEAR(detections[0].timestamp, 1.5, 1e-9);
    CHECK(detector->stats().droppedInvalid == 6);
    CHECK(detector->stats().droppedUnknownClass == 2);
    CHECK(detector->stats().droppedBadConfidence == 2);
    CHECK(detector->stats().droppedBadBox == 2);
    return true;
}

bool rejectionsAccumulateAcrossFrames() {
    DetectionConfig config;
    auto detector = makeDetector(config, {{makeRaw(kBlack, 100, 100, -0.1f)},
                                          {makeRaw(12, 100, 100, 0.8f),
                                           RawDetection{Rect2f(300, 300, 10, -4), kRed, 0.8f},
                                           makeRaw(kRed, 200, 200, 0.8f)}});

    CHECK(detector->detect(frame(), 0.0).empty());
    CHECK(detector->lastError().empty());
    CHECK(detector->stats().droppedBadConfidence == 1);

    vector<Detection> detections = detector->detect(frame(), 0.04);
    CHECK(detections.size() == 1);
    CHECK(detections[0].classId == kRed);
    CHECK(detector->stats().rawCandidates == 4);
    CHECK(detector->stats().droppedInvalid == 3);
    CHECK(detector->stats().droppedUnknownClass == 1);
    CHECK(detector->stats().droppedBadBox == 1);
    CHECK(detector->stats().droppedLowConfidence == 0);
    return true;
}

bool appliesConfidenceThreshold() {
    DetectionConfig config;
    config.confidenceThreshold = 0.5f;
    auto detector = makeDetector(config, {{makeRaw(kRed, 100, 100, 0.4f),
                                           makeRaw(kRed, 200, 100, 0.6f),
                                           makeRaw(kBlue, 300, 100, 0.5f)}});
    vector<Detection> detections = detector->detect(frame(), 0.0);
    CHECK(detections.size() == 2);
    for (const auto& d : detections) CHECK(d.confidence >= 0.5f);
    CHECK(detector->stats().droppedLowConfidence == 1);

    CHECK(!detector->setConfidenceThreshold(1.5f));
    CHECK(!detector->setConfidenceThreshold(-0.1f));
    CHECK_NEAR(detector->confidenceThreshold(), 0.5, 1e-6);
    CHECK(detector->setConfidenceThreshold(0.8f));
    CHECK_NEAR(detector->confidenceThreshold(), 0.8, 1e-6);
    return true;
}

bool suppressesOverlapsPerClass() {
    DetectionConfig config;
    auto detector = makeDetector(config, {{makeRaw(kRed, 100, 100, 0.9f),
                                           makeRaw(kRed, 101, 100, 0.8f),
                                           makeRaw(kBlue, 100, 101, 0.7f)}});
    vector<Detection> detections = detector->detect(frame(), 0.0);
    CHECK(detections.size() == 2);

    int reds = 0, blues = 0;
    for (const auto& d : detections) {
        if (d.classId == kRed) {
            reds++;
            CHECK_NEAR(d.confidence, 0.9, 1e-6);
        }
        if (d.classId == kBlue) blues++;
    }
    CHECK(reds == 1 && blues == 1);
    CHECK(detector->stats().suppressed == 1);
    return true;
}

bool enforcesBallCounts() {
    DetectionConfig config;
    deque<vector<RawDetection>> script = {
        {makeRaw(kCue, 100, 100, 0.7f), makeRaw(kCue, 400, 300, 0.95f)}};

    auto limited = makeDetector(config, script);
    vector<Detection> detections = limited->detect(frame(), 0.0);
    CHECK(detections.size() == 1);
    CHECK(detections[0].centroid() == Point2f(400, 300));
    CHECK(limited->stats().droppedOverCount == 1);

    config.enforceBallCounts = false;
    auto unlimited = makeDetector(config, script);
    CHECK(unlimited->detect(frame(), 0.0).size() == 2);
    return true;
}

bool absorbsInferenceFailure() {
    DetectionConfig config;
    ScriptedClassifier* classifier = nullptr;
    auto detector = makeDetector(config, {{makeRaw(kRed, 100, 100, 0.9f)}}, &classifier);

    classifier->failNext = true;
    vector<Detection> detections = detector->detect(frame(), 0.0);
    CHECK(detections.empty());
    CHECK(!detector->lastError().empty());
    CHECK(detector->stats().inferenceFailures == 1);

    detections = detector->detect(frame(), 0.033);
    CHECK(detections.size() == 1);
    CHECK(detector->lastError().empty());
    return true;
}

bool rejectsUnusableFrames() {
    DetectionConfig config;
    ScriptedClassifier* classifier = nullptr;
    auto detector = makeDetector(config, {{makeRaw(kRed, 100, 100, 0.9f)}}, &classifier);

    CHECK(detector->detect(Mat(), 0.0).empty());
    CHECK(!detector->lastError().empty());
    CHECK(detector->detect(Mat(480, 640, CV_32FC3, Scalar(0.5, 0.5, 0.5)), 0.0).empty());
    CHECK(!detector->lastError().empty());
    CHECK(detector->detect(Mat(480, 640, CV_8UC2, Scalar(1, 2)), 0.0).empty());
    CHECK(!detector->lastError().empty());
    CHECK(classifier->calls == 0);

    CHECK(detector->detect(Mat(480, 640, CV_8UC1, Scalar(90)), 0.0).size() == 1);
    CHECK(detector->detect(Mat(480, 640, CV_8UC4, Scalar(40, 120, 40, 255)), 0.0).size() == 1);
    CHECK(classifier->calls == 2);
    return true;
}

bool classIdsMapToBallTypes() {
    CHECK(ballTypeFromClassId(0) == BallType::Cue);
    CHECK(ballTypeFromClassId(7) == BallType::Black);
    CHECK_THROWS(ballTypeFromClassId(8), DetectionError);
    CHECK_THROWS(ballTypeFromClassId(-1), DetectionError);
    CHECK(maxBallCount(BallType::Red) == kMaxRedBalls);
    CHECK(isUniqueBallType(BallType::Pink));
    CHECK(!isUniqueBallType(BallType::Red));

    DetectionConfig config;
    auto detector = makeDetector(config, {});
    CHECK(detector->isModelLoaded());
    CHECK(detector->modelName() == "scripted");
    return true;
}

bool missingModelDisablesDetection() {
    DetectionConfig config;
    config.modelPath = "/nonexistent/snooker_balls.onnx";
    BallDetector detector(config);
    CHECK(!detector.isModelLoaded());
    CHECK(!detector.usingFallback());
    CHECK(detector.detect(frame(), 0.0).empty());
    CHECK(!detector.lastError().empty());
    return true;
}

}  // namespace

int main() {
    return runTests({
        {"dropsMalformedOutput", dropsMalformedOutput},
        {"rejectionsAccumulateAcrossFrames", rejectionsAccumulateAcrossFrames},
        {"appliesConfidenceThreshold", appliesConfidenceThreshold},
        {"suppressesOverlapsPerClass", suppressesOverlapsPerClass},
        {"enforcesBallCounts", enforcesBallCounts},
        {"absorbsInferenceFailure", absorbsInferenceFailure},
        {"rejectsUnusableFrames", rejectsUnusableFrames},
        {"classIdsMapToBallTypes", classIdsMapToBallTypes},
        {"missingModelDisablesDetection", missingModelDisablesDetection},
    });
}
