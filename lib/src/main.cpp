#include <cstdio>
#include <filesystem>
#include <iostream>
#include <opencv2/imgcodecs.hpp>
#include <string>

#include "analysis_json.hpp"
#include "snookerizer.hpp"
#include "utilities.hpp"

namespace fs = std::filesystem;
using namespace cv;
using namespace std;

int main(int argc, char* argv[]) {
    if (argc < 2) {
        cerr << "Usage: " << argv[0] << " <video> [config.yml]" << endl;
        return 1;
    }

    const string videoPath = argv[1];

    SessionConfig config;
    try {
        if (argc > 2) config = loadSessionConfig(argv[2]);
        if (config.detection.modelPath.empty()) {
            config.detection.modelPath = "models/snooker_balls.onnx";
        }
        config.validate();
    } catch (const SnookerError& e) {
        cerr << "Error: " << e.what() << endl;
        return 1;
    }

    const bool writeDebugFrames = config.debugMode && !config.debugOutputDirectory.empty();

    try {
        if (writeDebugFrames) {
            fs::create_directories(config.debugOutputDirectory);
        }
        VideoSource source(videoPath);
        DetectionApi api;
        api.createSession(config.cameraId, config);
        cout << "--- Processing " << videoPath << " (" << source.frameSize().width << "x"
             << source.frameSize().height << " @ " << source.fps() << " fps) ---" << endl;

        VideoFrame frame;
        while (source.read(frame)) {
            auto analysis = api.submitFrame(config.cameraId, frame.image, frame.frameNumber,
                                            frame.timestamp);
            if (!analysis) continue;

            cout << formatFrameAnalysisJson(*analysis) << endl;

#if DEBUG_OUTPUT
            if (writeDebugFrames) {
                char name[64];
                snprintf(name, sizeof(name), "frame_%06d.jpg", frame.frameNumber);
                imwrite((fs::path(config.debugOutputDirectory) / name).string(),
                        api.exportAnnotatedFrame(config.cameraId));
                Mat topDown = api.exportAnnotatedFrame(config.cameraId, true);
                if (!topDown.empty()) {
                    snprintf(name, sizeof(name), "table_%06d.jpg", frame.frameNumber);
                    imwrite((fs::path(config.debugOutputDirectory) / name).string(), topDown);
                }
            }
#endif
        }
        api.endStream(config.cameraId);

        const ProcessingStats stats = api.getProcessingStats(config.cameraId);
        cerr << "Frames processed: " << stats.framesProcessed
             << ", rejected: " << stats.framesRejected << ", dropped: " << stats.framesDropped
             << endl;
        cerr << "Detection failures: " << stats.detectionFailures
             << ", calibration failures: " << stats.calibrationFailures
             << ", tracking failures: " << stats.trackingFailures << endl;
        cerr << "Mean processing time: " << stats.meanProcessingTimeMs << " ms" << endl;
        cerr << "Calibration state: "
             << calibrationStateName(api.getCalibrationState(config.cameraId)) << endl;
    } catch (const exception& e) {
        cerr << "Error: " << e.what() << endl;
        return -1;
    }

    return 0;
}
