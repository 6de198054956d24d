#include "config.hpp"

#include <cmath>
#include <opencv2/core.hpp>

#include "errors.hpp"
#include "utilities.hpp"

using namespace std;
using namespace cv;

namespace {

void require(bool condition, const string& field, const string& reason) {
    if (!condition) {
        throw ConfigurationError("invalid configuration: " + field + " " + reason);
    }
}

template <typename T>
void readValue(const FileNode& node, const char* key, T& value) {
    FileNode child = node[key];
    if (!child.empty()) child >> value;
}

void readValue(const FileNode& node, const char* key, bool& value) {
    FileNode child = node[key];
    if (child.empty()) return;
    int flag = 0;
    child >> flag;
    value = flag != 0;
}

void readValue(const FileNode& node, const char* key, float& value) {
    FileNode child = node[key];
    if (child.empty()) return;
    double d = 0.0;
    child >> d;
    value = static_cast<float>(d);
}

SessionConfig readConfig(const FileStorage& fs) {
    SessionConfig config;
    FileNode root = fs.root();

    readValue(root, "camera_id", config.cameraId);
    readValue(root, "debug_mode", config.debugMode);
    readValue(root, "live_mode", config.liveMode);
    readValue(root, "frame_budget_ms", config.frameBudgetMs);
    readValue(root, "debug_output_directory", config.debugOutputDirectory);
    readValue(root, "stream_buffer_limit", config.streamBufferLimit);

    FileNode det = fs["detection"];
    if (!det.empty()) {
        DetectionConfig& d = config.detection;
        readValue(det, "model_path", d.modelPath);
        readValue(det, "fallback_model_path", d.fallbackModelPath);
        readValue(det, "confidence_threshold", d.confidenceThreshold);
        readValue(det, "nms_threshold", d.nmsThreshold);
        readValue(det, "input_size", d.inputSize);
        readValue(det, "num_classes", d.numClasses);
        readValue(det, "scores_are_logits", d.scoresAreLogits);
        readValue(det, "enforce_ball_counts", d.enforceBallCounts);
    }

    FileNode trk = fs["tracking"];
    if (!trk.empty()) {
        TrackingConfig& t = config.tracking;
        readValue(trk, "max_tracking_distance", t.maxTrackingDistance);
        readValue(trk, "max_disappeared_frames", t.maxDisappearedFrames);
        readValue(trk, "min_hits_to_activate", t.minHitsToActivate);
        readValue(trk, "process_noise", t.processNoise);
        readValue(trk, "measurement_noise", t.measurementNoise);
        readValue(trk, "distance_weight", t.distanceWeight);
        readValue(trk, "class_mismatch_penalty", t.classMismatchPenalty);
        readValue(trk, "trajectory_smoothing", t.trajectorySmoothing);
    }

    FileNode ana = fs["analysis"];
    if (!ana.empty()) {
        AnalysisConfig& a = config.analysis;
        readValue(ana, "motion_threshold", a.motionThreshold);
        readValue(ana, "pocket_proximity", a.pocketProximity);
        readValue(ana, "collision_distance", a.collisionDistance);
        readValue(ana, "collision_angle", a.collisionAngle);
        readValue(ana, "direction_change_angle", a.directionChangeAngle);
    }

    FileNode cal = fs["calibration"];
    if (!cal.empty()) {
        CalibrationConfig& c = config.calibration;
        readValue(cal, "table_length", c.tableLength);
        readValue(cal, "table_width", c.tableWidth);
        readValue(cal, "auto_recalibrate", c.autoRecalibrate);
        readValue(cal, "recalibration_interval", c.recalibrationInterval);
        readValue(cal, "residual_check_interval", c.residualCheckInterval);
        readValue(cal, "residual_tolerance", c.residualTolerance);
        readValue(cal, "reprojection_tolerance", c.reprojectionTolerance);
        readValue(cal, "max_recalibration_failures", c.maxRecalibrationFailures);
        readValue(cal, "pocket_region_size", c.pocketRegionSize);
        readValue(cal, "min_table_area_fraction", c.minTableAreaFraction);
        readValue(cal, "processing_max_dimension", c.processingMaxDimension);
        readValue(cal, "canny_low", c.cannyLow);
        readValue(cal, "canny_high", c.cannyHigh);
        readValue(cal, "hough_threshold", c.houghThreshold);
        readValue(cal, "line_angle_tolerance", c.lineAngleTolerance);
        readValue(cal, "min_line_separation", c.minLineSeparation);
        readValue(cal, "cache_directory", c.cacheDirectory);
        readValue(cal, "cache_max_age_hours", c.cacheMaxAgeHours);
    }
    return config;
}

SessionConfig openAndRead(const string& source, int flags) {
    FileStorage fs;
    try {
        if (!fs.open(source, flags)) {
            throw ConfigurationError("cannot open configuration");
        }
    } catch (const cv::Exception& e) {
        throw ConfigurationError(string("cannot parse configuration: ") + e.what());
    }
    SessionConfig config = readConfig(fs);
    fs.release();
    config.validate(false);
    return config;
}

}  // namespace

void SessionConfig::validate(bool requireModel) const {
    if (requireModel) {
        require(!detection.modelPath.empty(), "detection.model_path", "is required");
    }
    require(detection.confidenceThreshold >= 0.f && detection.confidenceThreshold <= 1.f,
            "detection.confidence_threshold", "must be within [0, 1]");
    require(detection.nmsThreshold >= 0.f && detection.nmsThreshold <= 1.f,
            "detection.nms_threshold", "must be within [0, 1]");
    require(detection.inputSize > 0 && detection.inputSize % 32 == 0, "detection.input_size",
            "must be a positive multiple of 32");
    require(detection.numClasses > 0, "detection.num_classes", "must be positive");

    require(tracking.maxTrackingDistance > 0.f, "tracking.max_tracking_distance",
            "must be positive");
    require(tracking.maxDisappearedFrames > 0, "tracking.max_disappeared_frames",
            "must be positive");
    require(tracking.minHitsToActivate > 0, "tracking.min_hits_to_activate", "must be positive");
    require(tracking.processNoise > 0.f, "tracking.process_noise", "must be positive");
    require(tracking.measurementNoise > 0.f, "tracking.measurement_noise", "must be positive");
    require(tracking.distanceWeight > 0.f, "tracking.distance_weight", "must be positive");
    require(std::isfinite(tracking.classMismatchPenalty), "tracking.class_mismatch_penalty",
            "must be finite");

    require(calibration.tableLength > 0.f, "calibration.table_length", "must be positive");
    require(calibration.tableWidth > 0.f, "calibration.table_width", "must be positive");
    require(calibration.tableLength >= calibration.tableWidth, "calibration.table_length",
            "must not be shorter than calibration.table_width");
    require(calibration.recalibrationInterval > 0, "calibration.recalibration_interval",
            "must be positive");
    require(calibration.residualCheckInterval >= 0, "calibration.residual_check_interval",
            "must not be negative");
    require(calibration.residualTolerance > 0.0, "calibration.residual_tolerance",
            "must be positive");
    require(calibration.reprojectionTolerance > 0.0, "calibration.reprojection_tolerance",
            "must be positive");
    require(calibration.maxRecalibrationFailures > 0, "calibration.max_recalibration_failures",
            "must be positive");
    require(calibration.pocketRegionSize > 0.f, "calibration.pocket_region_size",
            "must be positive");
    require(calibration.minTableAreaFraction >= 0.f && calibration.minTableAreaFraction < 1.f,
            "calibration.min_table_area_fraction", "must be within [0, 1)");
    require(calibration.processingMaxDimension >= 64, "calibration.processing_max_dimension",
            "must be at least 64");
    require(calibration.cannyLow > 0.0 && calibration.cannyHigh > calibration.cannyLow,
            "calibration.canny_high", "must exceed calibration.canny_low");
    require(calibration.houghThreshold > 0, "calibration.hough_threshold", "must be positive");
    require(calibration.lineAngleTolerance > 0.0 && calibration.lineAngleTolerance < 45.0,
            "calibration.line_angle_tolerance", "must be within (0, 45) degrees");
    require(calibration.minLineSeparation > 0.0 && calibration.minLineSeparation < 1.0,
            "calibration.min_line_separation", "must be within (0, 1)");
    require(calibration.cacheMaxAgeHours > 0.0, "calibration.cache_max_age_hours",
            "must be positive");

    require(analysis.motionThreshold >= 0.f, "analysis.motion_threshold", "must not be negative");
    require(analysis.pocketProximity >= 0.f, "analysis.pocket_proximity", "must not be negative");
    require(analysis.collisionDistance > 0.f, "analysis.collision_distance", "must be positive");
    require(analysis.collisionAngle > 0.0 && analysis.collisionAngle < 180.0,
            "analysis.collision_angle", "must be within (0, 180) degrees");
    require(analysis.directionChangeAngle > 0.0 && analysis.directionChangeAngle < 180.0,
            "analysis.direction_change_angle", "must be within (0, 180) degrees");

    require(!cameraId.empty(), "camera_id", "is required");
    require(frameBudgetMs >= 0.0, "frame_budget_ms", "must not be negative");
    require(streamBufferLimit >= 0, "stream_buffer_limit", "must not be negative");
}

SessionConfig loadSessionConfig(const string& path) {
    LOGI("[config] Loading session configuration from %s", path.c_str());
    return openAndRead(path, FileStorage::READ);
}

SessionConfig parseSessionConfig(const string& text) {
    return openAndRead(text, FileStorage::READ | FileStorage::MEMORY);
}

void saveSessionConfig(const SessionConfig& config, const string& path) {
    FileStorage fs(path, FileStorage::WRITE);
    if (!fs.isOpened()) {
        throw ConfigurationError("cannot write configuration to " + path);
    }
    fs << "camera_id" << config.cameraId;
    fs << "debug_mode" << static_cast<int>(config.debugMode);
    fs << "live_mode" << static_cast<int>(config.liveMode);
    fs << "frame_budget_ms" << config.frameBudgetMs;
    fs << "debug_output_directory" << config.debugOutputDirectory;
    fs << "stream_buffer_limit" << config.streamBufferLimit;

    const DetectionConfig& d = config.detection;
    fs << "detection" << "{";
    fs << "model_path" << d.modelPath << "fallback_model_path" << d.fallbackModelPath;
    fs << "confidence_threshold" << d.confidenceThreshold << "nms_threshold" << d.nmsThreshold;
    fs << "input_size" << d.inputSize << "num_classes" << d.numClasses;
    fs << "scores_are_logits" << static_cast<int>(d.scoresAreLogits);
    fs << "enforce_ball_counts" << static_cast<int>(d.enforceBallCounts);
    fs << "}";

    const TrackingConfig& t = config.tracking;
    fs << "tracking" << "{";
    fs << "max_tracking_distance" << t.maxTrackingDistance;
    fs << "max_disappeared_frames" << t.maxDisappearedFrames;
    fs << "min_hits_to_activate" << t.minHitsToActivate;
    fs << "process_noise" << t.processNoise << "measurement_noise" << t.measurementNoise;
    fs << "distance_weight" << t.distanceWeight;
    fs << "class_mismatch_penalty" << t.classMismatchPenalty;
    fs << "trajectory_smoothing" << static_cast<int>(t.trajectorySmoothing);
    fs << "}";

    const AnalysisConfig& a = config.analysis;
    fs << "analysis" << "{";
    fs << "motion_threshold" << a.motionThreshold << "pocket_proximity" << a.pocketProximity;
    fs << "collision_distance" << a.collisionDistance;
    fs << "collision_angle" << a.collisionAngle;
    fs << "direction_change_angle" << a.directionChangeAngle;
    fs << "}";

    const CalibrationConfig& c = config.calibration;
    fs << "calibration" << "{";
    fs << "table_length" << c.tableLength << "table_width" << c.tableWidth;
    fs << "auto_recalibrate" << static_cast<int>(c.autoRecalibrate);
    fs << "recalibration_interval" << c.recalibrationInterval;
    fs << "residual_check_interval" << c.residualCheckInterval;
    fs << "residual_tolerance" << c.residualTolerance;
    fs << "reprojection_tolerance" << c.reprojectionTolerance;
    fs << "max_recalibration_failures" << c.maxRecalibrationFailures;
    fs << "pocket_region_size" << c.pocketRegionSize;
    fs << "min_table_area_fraction" << c.minTableAreaFraction;
    fs << "processing_max_dimension" << c.processingMaxDimension;
    fs << "canny_low" << c.cannyLow << "canny_high" << c.cannyHigh;
    fs << "hough_threshold" << c.houghThreshold;
    fs << "line_angle_tolerance" << c.lineAngleTolerance;
    fs << "min_line_separation" << c.minLineSeparation;
    fs << "cache_directory" << c.cacheDirectory;
    fs << "cache_max_age_hours" << c.cacheMaxAgeHours;
    fs << "}";
    fs.release();
}
