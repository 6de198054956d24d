#include "ball_detector.hpp"

#include "errors.hpp"
#include "utilities.hpp"

#if defined(PLATFORM_ANDROID)
#include <core/session/onnxruntime_cxx_api.h>
#else
#include <onnxruntime_cxx_api.h>
#endif

#include <algorithm>
#include <cmath>
#include <opencv2/dnn/dnn.hpp>
#include <opencv2/imgproc/imgproc.hpp>
#include <vector>

using namespace cv;
using namespace std;

namespace {

// Generic COCO detectors used as a fallback report balls as "sports ball".
constexpr int kCocoClassCount = 80;
constexpr int kCocoSportsBall = 32;

}  // namespace

struct OnnxBallClassifier::Impl {
    Ort::Env env;
    Ort::Session session;
    Ort::AllocatorWithDefaultOptions allocator;

    vector<string> inputNodeNamesStr;
    vector<const char*> inputNodeNames;
    vector<string> outputNodeNamesStr;
    vector<const char*> outputNodeNames;

    string modelPath;
    int inputSize;
    int numClasses;
    bool scoresAreLogits;
    map<int, int> classRemap;

    Impl(const string& modelPath, int inputSize, int numClasses, bool scoresAreLogits,
         map<int, int> classRemap)
        : env(ORT_LOGGING_LEVEL_WARNING, "ball_classifier"),
          session(env, modelPath.c_str(), Ort::SessionOptions{nullptr}),
          modelPath(modelPath),
          inputSize(inputSize),
          numClasses(numClasses),
          scoresAreLogits(scoresAreLogits),
          classRemap(std::move(classRemap)) {
        LOGI("ONNX session created successfully for model: %s", modelPath.c_str());

        size_t numInputNodes = session.GetInputCount();
        inputNodeNamesStr.reserve(numInputNodes);
        for (size_t i = 0; i < numInputNodes; i++) {
            auto name = session.GetInputNameAllocated(i, allocator);
            inputNodeNamesStr.push_back(name.get());
        }
        for (const auto& s : inputNodeNamesStr) inputNodeNames.push_back(s.c_str());

        size_t numOutputNodes = session.GetOutputCount();
        outputNodeNamesStr.reserve(numOutputNodes);
        for (size_t i = 0; i < numOutputNodes; i++) {
            auto name = session.GetOutputNameAllocated(i, allocator);
            outputNodeNamesStr.push_back(name.get());
        }
        for (const auto& s : outputNodeNamesStr) outputNodeNames.push_back(s.c_str());
    }
};

OnnxBallClassifier::OnnxBallClassifier(const string& modelPath, int inputSize, int numClasses,
                                       bool scoresAreLogits, map<int, int> classRemap)
    : pimpl(make_unique<Impl>(modelPath, inputSize, numClasses, scoresAreLogits,
                              std::move(classRemap))) {}

OnnxBallClassifier::~OnnxBallClassifier() = default;

string OnnxBallClassifier::name() const { return pimpl->modelPath; }

vector<RawDetection> OnnxBallClassifier::infer(const Mat& image) {
    const int kTarget = pimpl->inputSize;

    int imgW = image.cols, imgH = image.rows;
    float scale = min(float(kTarget) / imgW, float(kTarget) / imgH);
    int newW = int(round(imgW * scale));
    int newH = int(round(imgH * scale));
    int padLeft = (kTarget - newW) / 2, padTop = (kTarget - newH) / 2;

    Mat resized;
    resize(image, resized, {newW, newH}, 0, 0, INTER_LINEAR);
    Mat input(kTarget, kTarget, CV_8UC3, Scalar(114, 114, 114));
    resized.copyTo(input(Rect(padLeft, padTop, newW, newH)));

    cvtColor(input, input, COLOR_BGR2RGB);
    input.convertTo(input, CV_32F, 1.f / 255.f);

    Mat blob;
    dnn::blobFromImage(input, blob);  // NHWC → NCHW, float32

    vector<int64_t> inputShape = {1, 3, kTarget, kTarget};
    auto memInfo = Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault);
    Ort::Value inputTensor = Ort::Value::CreateTensor<float>(
        memInfo, blob.ptr<float>(), blob.total(), inputShape.data(), inputShape.size());

    auto outputTensors =
        pimpl->session.Run(Ort::RunOptions{nullptr}, pimpl->inputNodeNames.data(), &inputTensor,
                           1, pimpl->outputNodeNames.data(), 1);

    auto shape = outputTensors[0].GetTensorTypeAndShapeInfo().GetShape();
    if (shape.size() != 3 || shape[1] != 4 + pimpl->numClasses) {
        throw DetectionError("unexpected model output shape");
    }
    const float* raw = outputTensors[0].GetTensorData<float>();
    int numPreds = static_cast<int>(shape[2]);

    auto sigmoid = [](float x) { return 1.f / (1.f + exp(-x)); };

    vector<RawDetection> candidates;
    for (int i = 0; i < numPreds; ++i) {
        float cx = raw[0 * numPreds + i];
        float cy = raw[1 * numPreds + i];
        float width = raw[2 * numPreds + i];
        float height = raw[3 * numPreds + i];

        float bestCls = 0.f;
        int classId = -1;
        for (int j = 0; j < pimpl->numClasses; ++j) {
            float clsScore = raw[(4 + j) * numPreds + i];
            if (pimpl->scoresAreLogits) clsScore = sigmoid(clsScore);
            if (clsScore > bestCls) {
                bestCls = clsScore;
                classId = j;
            }
        }
        if (classId < 0) continue;

        if (!pimpl->classRemap.empty()) {
            auto it = pimpl->classRemap.find(classId);
            if (it == pimpl->classRemap.end()) continue;
            classId = it->second;
        }

        float x1 = (cx - width / 2 - padLeft) / scale;
        float y1 = (cy - height / 2 - padTop) / scale;
        float x2 = (cx + width / 2 - padLeft) / scale;
        float y2 = (cy + height / 2 - padTop) / scale;

        x1 = clamp(x1, 0.f, float(imgW - 1));
        y1 = clamp(y1, 0.f, float(imgH - 1));
        x2 = clamp(x2, 0.f, float(imgW - 1));
        y2 = clamp(y2, 0.f, float(imgH - 1));

        candidates.push_back({Rect2f(Point2f(x1, y1), Point2f(x2, y2)), classId, bestCls});
    }
    return candidates;
}

BallDetector::BallDetector(const DetectionConfig& config) : config(config) {
    try {
        classifier = make_unique<OnnxBallClassifier>(config.modelPath, config.inputSize,
                                                     config.numClasses, config.scoresAreLogits);
        return;
    } catch (const std::exception& e) {
        LOGE("[BallDetector] Failed to load model %s: %s", config.modelPath.c_str(), e.what());
    }

    if (config.fallbackModelPath.empty()) {
        LOGE("[BallDetector] No fallback model configured, detection disabled");
        return;
    }
    try {
        map<int, int> remap = {{kCocoSportsBall, static_cast<int>(BallType::Red)}};
        classifier = make_unique<OnnxBallClassifier>(config.fallbackModelPath, config.inputSize,
                                                     kCocoClassCount, false, remap);
        fallback = true;
        LOGW("[BallDetector] Using fallback model %s", config.fallbackModelPath.c_str());
    } catch (const std::exception& e) {
        LOGE("[BallDetector] Failed to load fallback model %s: %s",
             config.fallbackModelPath.c_str(), e.what());
    }
}

BallDetector::BallDetector(const DetectionConfig& config, unique_ptr<BallClassifier> classifier)
    : config(config), classifier(std::move(classifier)) {}

BallDetector::~BallDetector() = default;

string BallDetector::modelName() const { return classifier ? classifier->name() : string(); }

bool BallDetector::setConfidenceThreshold(float threshold) {
    if (!(threshold >= 0.f && threshold <= 1.f)) {
        LOGW("[BallDetector] Ignoring confidence threshold %.3f outside [0, 1]", threshold);
        return false;
    }
    config.confidenceThreshold = threshold;
    return true;
}

const char* BallDetector::rejectionReason(const RawDetection& raw) {
    if (!isValidClassId(raw.classId)) {
        statistics.droppedUnknownClass++;
        return "unknown class id";
    }
    if (!std::isfinite(raw.confidence) || raw.confidence < 0.f || raw.confidence > 1.f) {
        statistics.droppedBadConfidence++;
        return "confidence outside [0, 1]";
    }
    if (!BoundingBox::fromRect(raw.box).isWellFormed()) {
        statistics.droppedBadBox++;
        return "malformed box";
    }
    return nullptr;
}

vector<Detection> BallDetector::applyNms(const vector<Detection>& candidates) {
    vector<Detection> kept;
    for (int classId = 0; classId < kBallTypeCount; ++classId) {
        vector<Rect2d> boxes;
        vector<float> scores;
        vector<int> members;
        for (size_t i = 0; i < candidates.size(); ++i) {
            if (candidates[i].classId != classId) continue;
            const BoundingBox& b = candidates[i].bbox;
            boxes.emplace_back(b.x1, b.y1, b.width(), b.height());
            scores.push_back(candidates[i].confidence);
            members.push_back(static_cast<int>(i));
        }
        if (boxes.empty()) continue;

        vector<int> keep;
        dnn::NMSBoxes(boxes, scores, config.confidenceThreshold, config.nmsThreshold, keep);
        statistics.suppressed += static_cast<long>(boxes.size() - keep.size());
        for (int idx : keep) kept.push_back(candidates[members[idx]]);
    }
    return kept;
}

vector<Detection> BallDetector::limitBallCounts(const vector<Detection>& detections) {
    vector<Detection> sorted = detections;
    stable_sort(sorted.begin(), sorted.end(), [](const Detection& a, const Detection& b) {
        return a.confidence > b.confidence;
    });

    int counts[kBallTypeCount] = {0};
    vector<Detection> kept;
    for (const auto& d : sorted) {
        if (counts[d.classId] >= maxBallCount(d.ballType())) {
            statistics.droppedOverCount++;
            continue;
        }
        counts[d.classId]++;
        kept.push_back(d);
    }
    return kept;
}

vector<Detection> BallDetector::detect(const Mat& frame, double timestamp) {
    error.clear();
    statistics.framesProcessed++;

    if (!classifier) {
        error = "no detection model loaded";
        return {};
    }
    if (frame.empty()) {
        error = "empty frame";
        return {};
    }
    if (frame.depth() != CV_8U) {
        error = "unsupported pixel depth " + to_string(frame.depth());
        return {};
    }

    vector<RawDetection> raw;
    try {
        Mat bgr;
        switch (frame.channels()) {
            case 1:
                cvtColor(frame, bgr, COLOR_GRAY2BGR);
                break;
            case 3:
                bgr = frame;
                break;
            case 4:
                cvtColor(frame, bgr, COLOR_BGRA2BGR);
                break;
            default:
                error = "unsupported channel count " + to_string(frame.channels());
                return {};
        }
        raw = classifier->infer(bgr);
    } catch (const std::exception& e) {
        statistics.inferenceFailures++;
        error = string("inference failed: ") + e.what();
        LOGE("[BallDetector] %s", error.c_str());
        return {};
    }

    statistics.rawCandidates += static_cast<long>(raw.size());

    vector<Detection> candidates;
    for (const auto& r : raw) {
        if (const char* reason = rejectionReason(r)) {
            statistics.droppedInvalid++;
            LOGW("[BallDetector] Dropping output: %s (class %d, confidence %.3f, box %.1f,%.1f "
                 "%.1fx%.1f)",
                 reason, r.classId, r.confidence, r.box.x, r.box.y, r.box.width, r.box.height);
            continue;
        }
        if (r.confidence < config.confidenceThreshold) {
            statistics.droppedLowConfidence++;
            continue;
        }
        Detection d;
        d.bbox = BoundingBox::fromRect(r.box);
        d.classId = r.classId;
        d.confidence = r.confidence;
        d.timestamp = timestamp;
        candidates.push_back(d);
    }

    vector<Detection> result = applyNms(candidates);
    if (config.enforceBallCounts) result = limitBallCounts(result);

    for (const auto& d : result) {
        statistics.detectionsReported++;
        statistics.meanConfidence +=
            (d.confidence - statistics.meanConfidence) / statistics.detectionsReported;
    }
    return result;
}
