#include <chrono>
#include <filesystem>
#include <string>

#include "config.hpp"
#include "errors.hpp"
#include "test_utils.hpp"

using namespace std;

namespace fs = std::filesystem;

namespace {

SessionConfig validConfig() {
    SessionConfig config;
    config.detection.modelPath = "models/snooker_balls.onnx";
    return config;
}

// Message of the ConfigurationError raised by validate(), or empty when none is raised.
string validationError(const SessionConfig& config, bool requireModel = true) {
    try {
        config.validate(requireModel);
    } catch (const ConfigurationError& e) {
        return e.what();
    }
    return "";
}

bool defaultsAreValid() {
    SessionConfig config = validConfig();
    CHECK(validationError(config).empty());
    CHECK_NEAR(config.calibration.tableLength, 3.569, 1e-4);
    CHECK_NEAR(config.calibration.tableWidth, 1.778, 1e-4);
    CHECK(config.tracking.maxDisappearedFrames == 10);
    CHECK(config.calibration.recalibrationInterval == 100);
    return true;
}

bool modelPathRequiredUnlessInjected() {
    SessionConfig config;
    string error = validationError(config);
    CHECK(error.find("detection.model_path") != string::npos);
    CHECK(validationError(config, false).empty());
    return true;
}

bool rejectsOutOfRangeValues() {
    SessionConfig config = validConfig();
    config.calibration.tableLength = -3.569f;
    CHECK(validationError(config).find("calibration.table_length") != string::npos);

    config = validConfig();
    config.detection.confidenceThreshold = 1.2f;
    CHECK(validationError(config).find("detection.confidence_threshold") != string::npos);

    config = validConfig();
    config.tracking.maxTrackingDistance = 0.f;
    CHECK(validationError(config).find("tracking.max_tracking_distance") != string::npos);

    config = validConfig();
    config.tracking.maxDisappearedFrames = 0;
    CHECK(validationError(config).find("tracking.max_disappeared_frames") != string::npos);

    config = validConfig();
    config.calibration.recalibrationInterval = -1;
    CHECK(validationError(config).find("calibration.recalibration_interval") != string::npos);

    config = validConfig();
    config.detection.inputSize = 500;
    CHECK(validationError(config).find("detection.input_size") != string::npos);

    config = validConfig();
    config.analysis.collisionAngle = 190.0;
    CHECK(validationError(config).find("analysis.collision_angle") != string::npos);

    config = validConfig();
    config.streamBufferLimit = -1;
    CHECK(validationError(config).find("stream_buffer_limit") != string::npos);

    config = validConfig();
    config.cameraId.clear();
    CHECK(validationError(config).find("camera_id") != string::npos);
    return true;
}

bool parsesYamlFromMemory() {
    const string yaml =
        "%YAML:1.0\n"
        "---\n"
        "camera_id: club-table-3\n"
        "debug_mode: 1\n"
        "detection:\n"
        "   model_path: \"models/custom.onnx\"\n"
        "   confidence_threshold: 0.35\n"
        "   scores_are_logits: 1\n"
        "tracking:\n"
        "   max_tracking_distance: 80.\n"
        "   max_disappeared_frames: 15\n"
        "   trajectory_smoothing: 1\n"
        "analysis:\n"
        "   collision_distance: 40.\n"
        "calibration:\n"
        "   table_length: 3.5\n"
        "   table_width: 1.75\n"
        "   recalibration_interval: 250\n";

    SessionConfig config = parseSessionConfig(yaml);
    CHECK(config.cameraId == "club-table-3");
    CHECK(config.debugMode);
    CHECK(!config.liveMode);
    CHECK(config.detection.modelPath == "models/custom.onnx");
    CHECK_NEAR(config.detection.confidenceThreshold, 0.35, 1e-6);
    CHECK(config.detection.scoresAreLogits);
    CHECK_NEAR(config.tracking.maxTrackingDistance, 80.0, 1e-6);
    CHECK(config.tracking.maxDisappearedFrames == 15);
    CHECK(config.tracking.minHitsToActivate == 3);
    CHECK(config.tracking.trajectorySmoothing);
    CHECK_NEAR(config.analysis.collisionDistance, 40.0, 1e-6);
    CHECK_NEAR(config.analysis.motionThreshold, 5.0, 1e-6);
    CHECK_NEAR(config.calibration.tableLength, 3.5, 1e-6);
    CHECK(config.calibration.recalibrationInterval == 250);
    return true;
}

bool parseRejectsInvalidValues() {
    const string yaml =
        "%YAML:1.0\n"
        "---\n"
        "calibration:\n"
        "   table_width: -1.0\n";
    CHECK_THROWS(parseSessionConfig(yaml), ConfigurationError);
    CHECK_THROWS(loadSessionConfig("/nonexistent/session.yml"), ConfigurationError);
    return true;
}

bool saveThenLoad() {
    fs::path path = fs::temp_directory_path() /
                    ("snookerizer_config_" +
                     to_string(chrono::steady_clock::now().time_since_epoch().count()) + ".yml");
    SessionConfig config = validConfig();
    config.cameraId = "practice";
    config.liveMode = true;
    config.frameBudgetMs = 40.0;
    config.tracking.classMismatchPenalty = 25.f;
    config.calibration.cacheDirectory = "/tmp/snookerizer-cache";
    config.analysis.pocketProximity = 45.f;
    config.streamBufferLimit = 64;
    saveSessionConfig(config, path.string());

    SessionConfig loaded = loadSessionConfig(path.string());
    fs::remove(path);
    CHECK(loaded.cameraId == "practice");
    CHECK(loaded.liveMode);
    CHECK_NEAR(loaded.frameBudgetMs, 40.0, 1e-9);
    CHECK_NEAR(loaded.tracking.classMismatchPenalty, 25.0, 1e-6);
    CHECK(loaded.calibration.cacheDirectory == "/tmp/snookerizer-cache");
    CHECK_NEAR(loaded.analysis.pocketProximity, 45.0, 1e-6);
    CHECK(loaded.streamBufferLimit == 64);
    CHECK(loaded.detection.modelPath == config.detection.modelPath);
    return true;
}

}  // namespace

int main() {
    return runTests({
        {"defaultsAreValid", defaultsAreValid},
        {"modelPathRequiredUnlessInjected", modelPathRequiredUnlessInjected},
        {"rejectsOutOfRangeValues", rejectsOutOfRangeValues},
        {"parsesYamlFromMemory", parsesYamlFromMemory},
        {"parseRejectsInvalidValues", parseRejectsInvalidValues},
        {"saveThenLoad", saveThenLoad},
    });
}
