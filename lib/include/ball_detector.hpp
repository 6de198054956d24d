#ifndef BALL_DETECTOR_HPP
#define BALL_DETECTOR_HPP

#include <map>
#include <memory>
#include <opencv2/opencv.hpp>
#include <string>
#include <vector>

#include "config.hpp"
#include "snooker_types.hpp"

// Unfiltered classifier output in frame pixels.
struct RawDetection {
    cv::Rect2f box;
    int classId;
    float confidence;
};

// Object detector seam. Implementations may throw; the engine absorbs the failure.
class BallClassifier {
   public:
    virtual ~BallClassifier() = default;
    virtual std::vector<RawDetection> infer(const cv::Mat& bgrImage) = 0;
    virtual std::string name() const = 0;
};

// YOLO-style ONNX model run through ONNX Runtime.
class OnnxBallClassifier : public BallClassifier {
   public:
    // classRemap maps model class ids to ball class ids; when non-empty, unmapped ids are dropped.
    OnnxBallClassifier(const std::string& modelPath, int inputSize, int numClasses,
                       bool scoresAreLogits, std::map<int, int> classRemap = {});
    ~OnnxBallClassifier() override;  // Required for std::unique_ptr with forward-declared type

    std::vector<RawDetection> infer(const cv::Mat& bgrImage) override;
    std::string name() const override;

   private:
    struct Impl;
    std::unique_ptr<Impl> pimpl;
};

struct DetectionStats {
    long framesProcessed = 0;
    long rawCandidates = 0;
    long droppedInvalid = 0;  // sum of the three below
    long droppedUnknownClass = 0;
    long droppedBadConfidence = 0;
    long droppedBadBox = 0;
    long droppedLowConfidence = 0;
    long suppressed = 0;
    long droppedOverCount = 0;
    long inferenceFailures = 0;
    long detectionsReported = 0;
    double meanConfidence = 0.0;
};

class BallDetector {
   public:
    // Loads detection.modelPath, then detection.fallbackModelPath if that fails. With neither
    // loaded every frame yields no detections and an error.
    explicit BallDetector(const DetectionConfig& config);
    BallDetector(const DetectionConfig& config, std::unique_ptr<BallClassifier> classifier);
    ~BallDetector();

    // Never throws. On failure returns an empty list and sets lastError().
    std::vector<Detection> detect(const cv::Mat& frame, double timestamp);

    bool isModelLoaded() const { return classifier != nullptr; }
    bool usingFallback() const { return fallback; }
    std::string modelName() const;

    // Empty when the last detect() succeeded.
    const std::string& lastError() const { return error; }

    // Rejects values outside [0, 1].
    bool setConfidenceThreshold(float threshold);
    float confidenceThreshold() const { return config.confidenceThreshold; }

    const DetectionStats& stats() const { return statistics; }

   private:
    // Null for a usable output, otherwise why it is rejected.
    const char* rejectionReason(const RawDetection& raw);
    std::vector<Detection> applyNms(const std::vector<Detection>& candidates);
    std::vector<Detection> limitBallCounts(const std::vector<Detection>& detections);

    DetectionConfig config;
    std::unique_ptr<BallClassifier> classifier;
    bool fallback = false;
    std::string error;
    DetectionStats statistics;
};

#endif  // BALL_DETECTOR_HPP
