#ifndef SNOOKER_TYPES_HPP
#define SNOOKER_TYPES_HPP

#include <array>
#include <memory>
#include <opencv2/core.hpp>
#include <string>
#include <vector>

// Ball classes in the order the classifier emits them.
enum class BallType { Cue = 0, Yellow = 1, Red = 2, Brown = 3, Green = 4, Pink = 5, Blue = 6, Black = 7 };

constexpr int kBallTypeCount = 8;
constexpr int kMaxRedBalls = 15;

bool isValidClassId(int classId);
BallType ballTypeFromClassId(int classId);  // throws DetectionError for unknown ids
const char* ballTypeName(BallType type);

// Number of balls of this type that can be on the table at once.
int maxBallCount(BallType type);
inline bool isUniqueBallType(BallType type) { return maxBallCount(type) == 1; }

// BGR drawing colour.
cv::Scalar ballColor(BallType type);

// Axis-aligned box in frame pixels.
struct BoundingBox {
    float x1 = 0.f;
    float y1 = 0.f;
    float x2 = 0.f;
    float y2 = 0.f;

    BoundingBox() = default;
    BoundingBox(float x1, float y1, float x2, float y2) : x1(x1), y1(y1), x2(x2), y2(y2) {}

    static BoundingBox fromRect(const cv::Rect2f& rect);

    float width() const { return x2 - x1; }
    float height() const { return y2 - y1; }
    float area() const { return width() * height(); }
    cv::Point2f center() const { return {(x1 + x2) * 0.5f, (y1 + y2) * 0.5f}; }
    cv::Rect2f toRect() const { return {x1, y1, width(), height()}; }

    bool contains(const cv::Point2f& p) const { return p.x >= x1 && p.x <= x2 && p.y >= y1 && p.y <= y2; }

    // Finite, non-negative and with positive extent.
    bool isWellFormed() const;
};

// One ball candidate reported by the detection engine for a single frame.
struct Detection {
    BoundingBox bbox;
    int classId = 0;
    float confidence = 0.f;
    double timestamp = 0.0;

    cv::Point2f centroid() const { return bbox.center(); }
    BallType ballType() const { return static_cast<BallType>(classId); }
};

// Pixel-to-table mapping. Table space is metres with the origin at the top-left cushion corner
// and x running along the long side. Table corners are (0,0), (L,0), (L,W), (0,W).
struct CalibrationData {
    cv::Matx33d homography = cv::Matx33d::eye();   // pixel -> table
    std::vector<cv::Point2f> tableCorners;         // pixels; corner i maps to table corner i
    cv::Size2f tableDimensions;                    // length x width, metres
    std::vector<BoundingBox> pocketRegions;        // pixels
    cv::Size imageSize;
    double timestamp = 0.0;
    int frameNumber = -1;
    double reprojectionError = 0.0;
    bool isValid = false;
};

enum class TrackState { Tentative, Active, Occluded, Potted, Deleted };

const char* trackStateName(TrackState state);

struct TrackedBall {
    int trackId = 0;
    BallType ballType = BallType::Red;
    cv::Point2f currentPosition;
    cv::Point2f velocity;  // pixels per frame
    std::vector<cv::Point2f> trajectory;
    std::vector<float> confidenceHistory;
    int firstSeenFrame = 0;
    int lastSeenFrame = 0;
    int framesSinceSeen = 0;
    TrackState state = TrackState::Tentative;

    bool hasTablePosition = false;
    cv::Point2f tablePosition;

    bool isLive() const {
        return state == TrackState::Tentative || state == TrackState::Active ||
               state == TrackState::Occluded;
    }
    bool isRetired() const { return state == TrackState::Potted || state == TrackState::Deleted; }
};

// Motion of a ball judged from its velocity and recent trajectory.
enum class MotionState { Stationary, Moving, Collision, Potted, Lost };

constexpr int kMotionStateCount = 5;

const char* motionStateName(MotionState state);

struct TrajectorySummary {
    int trackId = 0;
    BallType ballType = BallType::Red;
    MotionState motion = MotionState::Stationary;
    int trajectoryLength = 0;
    double totalDistance = 0.0;  // pixels
    double averageSpeed = 0.0;   // pixels per frame
    int directionChanges = 0;
    int nearPocket = -1;  // index into CalibrationData::pocketRegions
};

enum class BallEventType { Potted, Collision };

const char* ballEventTypeName(BallEventType type);

struct BallEvent {
    BallEventType type = BallEventType::Potted;
    int frameNumber = 0;
    int trackId = 0;
    BallType ballType = BallType::Red;
    int otherTrackId = -1;  // collisions only
    BallType otherBallType = BallType::Red;
    int pocket = -1;        // pottings only, -1 when no pocket is known
    cv::Point2f position;   // pixels; the contact point for collisions
    float confidence = 0.f;
};

// Totals over the tracks reported in one frame.
struct TrajectoryOverview {
    int totalBalls = 0;
    int activeBalls = 0;
    std::array<int, kMotionStateCount> motionCounts{};  // indexed by MotionState
    long totalEvents = 0;  // since the session started
    double averageTrajectoryLength = 0.0;
    double totalDistance = 0.0;
};

enum class Subsystem { Detection, Calibration, Coordinates, Tracking, Pipeline };

const char* subsystemName(Subsystem subsystem);

// A per-frame failure that was absorbed instead of aborting the stream.
struct Diagnostic {
    int frameNumber = 0;
    Subsystem subsystem = Subsystem::Pipeline;
    std::string reason;
};

// Immutable result of processing one frame.
struct FrameAnalysis {
    int frameNumber = 0;
    double timestamp = 0.0;
    std::vector<Detection> detections;
    std::vector<cv::Point2f> detectionTablePositions;  // parallel to detections when available
    std::vector<TrackedBall> trackedBalls;
    std::shared_ptr<const CalibrationData> calibrationData;
    double processingTime = 0.0;  // milliseconds

    std::vector<TrajectorySummary> trajectories;  // parallel to trackedBalls
    std::vector<BallEvent> events;                // first reported in this frame
    TrajectoryOverview overview;

    bool tableCoordinatesValid = false;
    bool usedPriorCalibration = false;
    std::vector<Diagnostic> diagnostics;
};

#endif  // SNOOKER_TYPES_HPP
