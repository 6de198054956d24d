#include "snooker_types.hpp"

#include <cmath>

#include "errors.hpp"

bool isValidClassId(int classId) { return classId >= 0 && classId < kBallTypeCount; }

BallType ballTypeFromClassId(int classId) {
    if (!isValidClassId(classId)) {
        throw DetectionError("unknown ball class id " + std::to_string(classId));
    }
    return static_cast<BallType>(classId);
}

const char* ballTypeName(BallType type) {
    switch (type) {
        case BallType::Cue:
            return "cue";
        case BallType::Yellow:
            return "yellow";
        case BallType::Red:
            return "red";
        case BallType::Brown:
            return "brown";
        case BallType::Green:
            return "green";
        case BallType::Pink:
            return "pink";
        case BallType::Blue:
            return "blue";
        case BallType::Black:
            return "black";
    }
    return "unknown";
}

int maxBallCount(BallType type) { return type == BallType::Red ? kMaxRedBalls : 1; }

cv::Scalar ballColor(BallType type) {
    switch (type) {
        case BallType::Cue:
            return cv::Scalar(255, 255, 255);
        case BallType::Yellow:
            return cv::Scalar(0, 255, 255);
        case BallType::Red:
            return cv::Scalar(0, 0, 255);
        case BallType::Brown:
            return cv::Scalar(42, 42, 165);
        case BallType::Green:
            return cv::Scalar(0, 128, 0);
        case BallType::Pink:
            return cv::Scalar(203, 192, 255);
        case BallType::Blue:
            return cv::Scalar(255, 0, 0);
        case BallType::Black:
            return cv::Scalar(0, 0, 0);
    }
    return cv::Scalar(128, 128, 128);
}

BoundingBox BoundingBox::fromRect(const cv::Rect2f& rect) {
    return BoundingBox(rect.x, rect.y, rect.x + rect.width, rect.y + rect.height);
}

bool BoundingBox::isWellFormed() const {
    if (!std::isfinite(x1) || !std::isfinite(y1) || !std::isfinite(x2) || !std::isfinite(y2)) {
        return false;
    }
    return x1 >= 0.f && y1 >= 0.f && x2 > x1 && y2 > y1;
}

const char* trackStateName(TrackState state) {
    switch (state) {
        case TrackState::Tentative:
            return "tentative";
        case TrackState::Active:
            return "active";
        case TrackState::Occluded:
            return "occluded";
        case TrackState::Potted:
            return "potted";
        case TrackState::Deleted:
            return "deleted";
    }
    return "unknown";
}

const char* motionStateName(MotionState state) {
    switch (state) {
        case MotionState::Stationary:
            return "stationary";
        case MotionState::Moving:
            return "moving";
        case MotionState::Collision:
            return "collision";
        case MotionState::Potted:
            return "potted";
        case MotionState::Lost:
            return "lost";
    }
    return "unknown";
}

const char* ballEventTypeName(BallEventType type) {
    switch (type) {
        case BallEventType::Potted:
            return "ball_potted";
        case BallEventType::Collision:
            return "ball_collision";
    }
    return "unknown";
}

const char* subsystemName(Subsystem subsystem) {
    switch (subsystem) {
        case Subsystem::Detection:
            return "detection";
        case Subsystem::Calibration:
            return "calibration";
        case Subsystem::Coordinates:
            return "coordinates";
        case Subsystem::Tracking:
            return "tracking";
        case Subsystem::Pipeline:
            return "pipeline";
    }
    return "unknown";
}
