#ifndef UTILITIES_HPP
#define UTILITIES_HPP

#include <opencv2/opencv.hpp>
#include <string>
#include <vector>

#ifndef DEBUG_OUTPUT
#define DEBUG_OUTPUT 1
#endif

#if defined(__ANDROID__)
#define PLATFORM_ANDROID 1
#elif defined(__APPLE__)
#include <TargetConditionals.h>
#if TARGET_OS_IPHONE
#define PLATFORM_IOS 1
#else
#define PLATFORM_MACOS 1
#endif
#elif defined(_WIN32) || defined(_WIN64)
#define PLATFORM_WINDOWS 1
#else
#define PLATFORM_LINUX 1
#endif

#if DEBUG_OUTPUT
#ifdef PLATFORM_ANDROID
#include <android/log.h>
#define LOG_TAG "snookerizer"
#define LOGI(...) __android_log_print(ANDROID_LOG_INFO, LOG_TAG, __VA_ARGS__)
#define LOGW(...) __android_log_print(ANDROID_LOG_WARN, LOG_TAG, __VA_ARGS__)
#define LOGE(...) __android_log_print(ANDROID_LOG_ERROR, LOG_TAG, __VA_ARGS__)
#define LOGD(...) __android_log_print(ANDROID_LOG_DEBUG, LOG_TAG, __VA_ARGS__)
#else
#include <cstdio>
#define LOGI(...)            \
    do {                     \
        printf("INFO: ");    \
        printf(__VA_ARGS__); \
        printf("\n");        \
    } while (0)
#define LOGD(...)            \
    do {                     \
        printf("DEBUG: ");   \
        printf(__VA_ARGS__); \
        printf("\n");        \
    } while (0)
#define LOGW(...)                     \
    do {                              \
        fprintf(stderr, "WARN: ");    \
        fprintf(stderr, __VA_ARGS__); \
        fprintf(stderr, "\n");        \
    } while (0)
#define LOGE(...)                     \
    do {                              \
        fprintf(stderr, "ERROR: ");   \
        fprintf(stderr, __VA_ARGS__); \
        fprintf(stderr, "\n");        \
    } while (0)
#endif
#else
#define LOGI(...)
#define LOGW(...)
#define LOGE(...)
#define LOGD(...)
#endif

struct WarpResult {
    cv::Mat warped;     // top-down view of the table
    cv::Mat transform;  // 3x3 pixel -> canvas homography (float64)
};

// Renders the calibrated table top-down. The canvas keeps the table aspect ratio and is outW
// pixels along the long side.
WarpResult warpTable(const cv::Mat& bgrImg, const cv::Matx33d& pixelToTable,
                     const cv::Size2f& tableDimensions, int outW = 1000);

// Orders four points TL, TR, BR, BL by angle around their centroid.
std::vector<cv::Point2f> orderQuad(const std::vector<cv::Point2f>& pts);

// Mean distance between corresponding points, or -1 when the lists differ in size.
double meanPointDistance(const std::vector<cv::Point2f>& a, const std::vector<cv::Point2f>& b);

#endif  // UTILITIES_HPP
