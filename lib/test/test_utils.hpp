#pragma once

#include <cmath>
#include <deque>
#include <functional>
#include <iostream>
#include <opencv2/imgproc.hpp>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "ball_detector.hpp"
#include "snooker_types.hpp"

#define CHECK(cond)                                                                      \
    do {                                                                                 \
        if (!(cond)) {                                                                   \
            std::cerr << __FILE__ << ":" << __LINE__ << ": check failed: " #cond << std::endl; \
            return false;                                                                \
        }                                                                                \
    } while (0)

#define CHECK_NEAR(a, b, tol)                                                                \
    do {                                                                                     \
        double checkA = (a), checkB = (b);                                                   \
        if (!(std::abs(checkA - checkB) <= (tol))) {                                         \
            std::cerr << __FILE__ << ":" << __LINE__ << ": " #a " = " << checkA << ", expected " \
                      << checkB << " +/- " << (tol) << std::endl;                            \
            return false;                                                                    \
        }                                                                                    \
    } while (0)

#define CHECK_THROWS(expr, type)                                                          \
    do {                                                                                  \
        bool threw = false;                                                               \
        try {                                                                             \
            expr;                                                                         \
        } catch (const type&) {                                                           \
            threw = true;                                                                 \
        }                                                                                 \
        if (!threw) {                                                                     \
            std::cerr << __FILE__ << ":" << __LINE__ << ": expected " #type " from " #expr \
                      << std::endl;                                                       \
            return false;                                                                 \
        }                                                                                 \
    } while (0)

// Runs each named case and returns the process exit code.
inline int runTests(const std::vector<std::pair<std::string, std::function<bool()>>>& tests) {
    int failures = 0;
    for (const auto& test : tests) {
        bool passed = false;
        try {
            passed = test.second();
        } catch (const std::exception& e) {
            std::cerr << test.first << ": unexpected exception: " << e.what() << std::endl;
        }
        std::cout << (passed ? "[PASS] " : "[FAIL] ") << test.first << std::endl;
        if (!passed) failures++;
    }
    if (failures > 0) {
        std::cerr << failures << " of " << tests.size() << " tests failed." << std::endl;
        return -1;
    }
    std::cout << "All " << tests.size() << " tests passed." << std::endl;
    return 0;
}

// Ball of the given class centred on (x, y).
inline Detection makeDetection(int classId, float x, float y, float confidence = 0.9f,
                               float radius = 8.f) {
    Detection d;
    d.bbox = BoundingBox(x - radius, y - radius, x + radius, y + radius);
    d.classId = classId;
    d.confidence = confidence;
    return d;
}

inline RawDetection makeRaw(int classId, float x, float y, float confidence, float radius = 8.f) {
    return RawDetection{cv::Rect2f(x - radius, y - radius, 2 * radius, 2 * radius), classId,
                        confidence};
}

// Replays one scripted output per infer() call; repeats the last one when the script runs out.
class ScriptedClassifier : public BallClassifier {
   public:
    explicit ScriptedClassifier(std::deque<std::vector<RawDetection>> script = {})
        : script(std::move(script)) {}

    std::vector<RawDetection> infer(const cv::Mat&) override {
        calls++;
        if (failNext) {
            failNext = false;
            throw std::runtime_error("scripted inference failure");
        }
        if (script.empty()) return last;
        last = script.front();
        script.pop_front();
        return last;
    }

    std::string name() const override { return "scripted"; }

    std::deque<std::vector<RawDetection>> script;
    std::vector<RawDetection> last;
    bool failNext = false;
    int calls = 0;
};

// Dark frame with a green playing surface spanning the given rectangle.
inline cv::Mat makeTableImage(cv::Size size, const cv::Rect& surface) {
    cv::Mat image(size, CV_8UC3, cv::Scalar(30, 30, 30));
    cv::rectangle(image, surface, cv::Scalar(40, 140, 40), cv::FILLED);
    return image;
}
