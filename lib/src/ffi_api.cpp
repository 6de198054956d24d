#include <memory>
#include <opencv2/imgproc.hpp>
#include <string>

#include "analysis_json.hpp"
#include "base64_utils.hpp"
#include "config.hpp"
#include "detection_api.hpp"
#include "snookerizer_ffi.h"
#include "utilities.hpp"

namespace {

const char* kSessionId = "ffi";

// One DetectionApi per handle; the FFI exposes a single session per handle.
struct FfiSession {
    DetectionApi api;
};

FfiSession* asSession(void* handle) { return static_cast<FfiSession*>(handle); }

}  // namespace

extern "C" {

void* create_session(const char* config_path, const char* model_path) {
    try {
        LOGI("create_session called with config: %s, model: %s",
             config_path ? config_path : "NULL", model_path ? model_path : "NULL");
        SessionConfig config;
        if (config_path != nullptr && config_path[0] != '\0') {
            config = loadSessionConfig(config_path);
        }
        if (model_path != nullptr && model_path[0] != '\0') {
            config.detection.modelPath = model_path;
        }

        auto session = std::make_unique<FfiSession>();
        session->api.createSession(kSessionId, config);
        LOGI("Session created successfully");
        return static_cast<void*>(session.release());
    } catch (const std::exception& e) {
        LOGE("Error creating session: %s", e.what());
        return nullptr;
    }
}

const char* process_frame_bgra(void* session, const unsigned char* image_bytes, int width,
                               int height, int stride, int frame_number, double timestamp,
                               int channel_format) {
    thread_local std::string resultStr;
    if (!session) {
        resultStr = formatErrorJson("Invalid session instance");
        return resultStr.c_str();
    }
    if (!image_bytes || width <= 0 || height <= 0 || stride < width * 4) {
        resultStr = formatErrorJson("Invalid image buffer");
        return resultStr.c_str();
    }
    try {
        cv::Mat input(height, width, CV_8UC4, const_cast<unsigned char*>(image_bytes),
                      static_cast<size_t>(stride));

        // channel_format: 0=BGRA, 1=RGBA
        cv::Mat bgr;
        cv::cvtColor(input, bgr, channel_format == 1 ? cv::COLOR_RGBA2BGR : cv::COLOR_BGRA2BGR);

        auto analysis = asSession(session)->api.submitFrame(kSessionId, bgr, frame_number, timestamp);
        if (!analysis) {
            resultStr = formatErrorJson("Frame " + std::to_string(frame_number) +
                                        " was not processed");
            return resultStr.c_str();
        }
        resultStr = formatFrameAnalysisJson(*analysis);
        return resultStr.c_str();
    } catch (const std::exception& e) {
        LOGE("[process_frame_bgra] Exception: %s", e.what());
        resultStr = formatErrorJson(e.what());
        return resultStr.c_str();
    }
}

const char* get_latest_analysis(void* session) {
    thread_local std::string resultStr;
    if (!session) {
        resultStr = formatErrorJson("Invalid session instance");
        return resultStr.c_str();
    }
    try {
        auto analysis = asSession(session)->api.getLatestFrameAnalysis(kSessionId);
        resultStr = analysis ? formatFrameAnalysisJson(*analysis)
                             : formatErrorJson("No frame has been analysed");
        return resultStr.c_str();
    } catch (const std::exception& e) {
        LOGE("[get_latest_analysis] Exception: %s", e.what());
        resultStr = formatErrorJson(e.what());
        return resultStr.c_str();
    }
}

const char* get_calibration(void* session) {
    thread_local std::string resultStr;
    if (!session) {
        resultStr = formatErrorJson("Invalid session instance");
        return resultStr.c_str();
    }
    try {
        DetectionApi& api = asSession(session)->api;
        auto calibration = api.getCalibration(kSessionId);
        resultStr = formatCalibrationJson(calibration.get(), api.getCalibrationState(kSessionId));
        return resultStr.c_str();
    } catch (const std::exception& e) {
        LOGE("[get_calibration] Exception: %s", e.what());
        resultStr = formatErrorJson(e.what());
        return resultStr.c_str();
    }
}

const char* export_annotated_frame_bgra(void* session, int top_down) {
    thread_local std::string resultStr;
    if (!session) {
        resultStr = formatErrorJson("Invalid session instance");
        return resultStr.c_str();
    }
    try {
        cv::Mat annotated = asSession(session)->api.exportAnnotatedFrame(kSessionId, top_down != 0);
        if (annotated.empty()) {
            resultStr = formatErrorJson("No annotated frame available");
            return resultStr.c_str();
        }
        resultStr = "{\"width\": " + std::to_string(annotated.cols) +
                    ", \"height\": " + std::to_string(annotated.rows) + ", \"image\": \"" +
                    Base64Utils::encodeMat(annotated) + "\"}";
        return resultStr.c_str();
    } catch (const std::exception& e) {
        LOGE("[export_annotated_frame_bgra] Exception: %s", e.what());
        resultStr = formatErrorJson(e.what());
        return resultStr.c_str();
    }
}

void release_session(void* session) {
    if (session) {
        delete asSession(session);
    }
}

}  // extern "C"
