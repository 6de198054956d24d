#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <string>

struct DetectionConfig {
    std::string modelPath;
    std::string fallbackModelPath;  // generic detector used when modelPath fails to load
    float confidenceThreshold = 0.2f;
    float nmsThreshold = 0.5f;
    int inputSize = 640;
    int numClasses = 8;
    bool scoresAreLogits = false;
    bool enforceBallCounts = true;
};

struct TrackingConfig {
    float maxTrackingDistance = 50.f;  // pixels
    int maxDisappearedFrames = 10;
    int minHitsToActivate = 3;
    float processNoise = 0.1f;
    float measurementNoise = 0.1f;
    float distanceWeight = 1.f;
    // Added to the cost of pairing a track with a detection of another ball type.
    // Negative excludes such pairs entirely.
    float classMismatchPenalty = -1.f;
    // Record the Kalman estimate instead of the raw detection centroid.
    bool trajectorySmoothing = false;
};

// Trajectory analysis and event detection. Distances are frame pixels.
struct AnalysisConfig {
    float motionThreshold = 5.f;   // pixels per frame
    float pocketProximity = 30.f;
    float collisionDistance = 25.f;
    double collisionAngle = 45.0;        // degrees of turn within the last few points
    double directionChangeAngle = 30.0;  // degrees
};

struct CalibrationConfig {
    float tableLength = 3.569f;  // metres
    float tableWidth = 1.778f;
    bool autoRecalibrate = true;
    int recalibrationInterval = 100;  // frames
    int residualCheckInterval = 25;   // frames, 0 disables
    double residualTolerance = 50.0;  // pixels of mean corner displacement
    double reprojectionTolerance = 2.0;  // pixels
    int maxRecalibrationFailures = 5;
    float pocketRegionSize = 0.15f;  // metres
    float minTableAreaFraction = 0.05f;

    int processingMaxDimension = 800;
    double cannyLow = 50.0;
    double cannyHigh = 150.0;
    int houghThreshold = 100;
    double lineAngleTolerance = 25.0;  // degrees
    double minLineSeparation = 0.2;    // fraction of the shorter image side

    std::string cacheDirectory;  // empty disables persistence
    double cacheMaxAgeHours = 24.0;
};

struct SessionConfig {
    DetectionConfig detection;
    TrackingConfig tracking;
    CalibrationConfig calibration;
    AnalysisConfig analysis;

    std::string cameraId = "default";
    bool debugMode = false;
    bool liveMode = false;
    double frameBudgetMs = 0.0;  // live mode only, 0 disables
    std::string debugOutputDirectory;
    // Analyses buffered for a stream consumer; the oldest is dropped when full. 0 is unbounded.
    int streamBufferLimit = 512;

    // Throws ConfigurationError naming the first invalid field.
    void validate(bool requireModel = true) const;
};

// Reads YAML or JSON through cv::FileStorage. Missing keys keep their defaults.
SessionConfig loadSessionConfig(const std::string& path);
SessionConfig parseSessionConfig(const std::string& text);

void saveSessionConfig(const SessionConfig& config, const std::string& path);

#endif  // CONFIG_HPP
