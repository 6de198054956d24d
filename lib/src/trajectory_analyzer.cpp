#include "trajectory_analyzer.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

#include "utilities.hpp"

using namespace std;
using namespace cv;

namespace {

constexpr double kMinSegmentLength = 1.0;  // pixels
constexpr int kRecentPoints = 5;

// Unit directions of the segments long enough to carry one.
vector<Point2d> segmentDirections(vector<Point2f>::const_iterator first,
                                  vector<Point2f>::const_iterator last) {
    vector<Point2d> directions;
    if (first == last) return directions;
    for (auto it = first + 1; it != last; ++it) {
        Point2d step(it->x - (it - 1)->x, it->y - (it - 1)->y);
        double length = norm(step);
        if (!std::isfinite(length) || length < kMinSegmentLength) continue;
        directions.push_back(step / length);
    }
    return directions;
}

double turnDegrees(const Point2d& a, const Point2d& b) {
    double dot = std::clamp(a.dot(b), -1.0, 1.0);
    return std::acos(dot) * 180.0 / CV_PI;
}

double distanceToBox(const Point2f& p, const BoundingBox& box) {
    float dx = std::max({box.x1 - p.x, 0.f, p.x - box.x2});
    float dy = std::max({box.y1 - p.y, 0.f, p.y - box.y2});
    return std::sqrt(static_cast<double>(dx) * dx + static_cast<double>(dy) * dy);
}

// Last measured position, or the estimate when the ball was never measured.
Point2f lastMeasured(const TrackedBall& ball) {
    return ball.trajectory.empty() ? ball.currentPosition : ball.trajectory.back();
}

bool hasMeasuredPosition(const TrackedBall& ball) {
    return ball.state == TrackState::Active || ball.state == TrackState::Tentative;
}

}  // namespace

double trajectoryDistance(const vector<Point2f>& trajectory) {
    double total = 0.0;
    for (size_t i = 1; i < trajectory.size(); ++i) {
        total += norm(trajectory[i] - trajectory[i - 1]);
    }
    return total;
}

int countDirectionChanges(const vector<Point2f>& trajectory, double angleDegrees) {
    vector<Point2d> directions = segmentDirections(trajectory.begin(), trajectory.end());
    int changes = 0;
    for (size_t i = 1; i < directions.size(); ++i) {
        if (turnDegrees(directions[i - 1], directions[i]) > angleDegrees) changes++;
    }
    return changes;
}

TrajectoryAnalyzer::TrajectoryAnalyzer(const AnalysisConfig& config) : config(config) {}

void TrajectoryAnalyzer::setPocketRegions(const vector<BoundingBox>& pockets) {
    pocketRegions = pockets;
}

bool TrajectoryAnalyzer::isMoving(const TrackedBall& ball) const {
    return norm(ball.velocity) > config.motionThreshold;
}

bool TrajectoryAnalyzer::turnedSharply(const TrackedBall& ball) const {
    if (ball.trajectory.size() < static_cast<size_t>(kRecentPoints)) return false;
    vector<Point2d> directions =
        segmentDirections(ball.trajectory.end() - kRecentPoints, ball.trajectory.end());
    for (size_t i = 1; i < directions.size(); ++i) {
        if (turnDegrees(directions[i - 1], directions[i]) > config.collisionAngle) return true;
    }
    return false;
}

MotionState TrajectoryAnalyzer::motionState(const TrackedBall& ball) const {
    if (ball.state == TrackState::Potted) return MotionState::Potted;
    if (!hasMeasuredPosition(ball)) return MotionState::Lost;
    if (!isMoving(ball)) return MotionState::Stationary;
    return turnedSharply(ball) ? MotionState::Collision : MotionState::Moving;
}

int TrajectoryAnalyzer::nearPocket(const Point2f& p) const {
    int best = -1;
    double bestDistance = numeric_limits<double>::infinity();
    for (size_t i = 0; i < pocketRegions.size(); ++i) {
        double d = distanceToBox(p, pocketRegions[i]);
        if (d <= config.pocketProximity && d < bestDistance) {
            best = static_cast<int>(i);
            bestDistance = d;
        }
    }
    return best;
}

TrajectorySummary TrajectoryAnalyzer::summarize(const TrackedBall& ball) const {
    TrajectorySummary summary;
    summary.trackId = ball.trackId;
    summary.ballType = ball.ballType;
    summary.motion = motionState(ball);
    summary.trajectoryLength = static_cast<int>(ball.trajectory.size());
    summary.totalDistance = trajectoryDistance(ball.trajectory);
    int span = ball.lastSeenFrame - ball.firstSeenFrame;
    summary.averageSpeed = span > 0 ? summary.totalDistance / span : 0.0;
    summary.directionChanges = countDirectionChanges(ball.trajectory, config.directionChangeAngle);
    summary.nearPocket = nearPocket(lastMeasured(ball));
    return summary;
}

vector<BallEvent> TrajectoryAnalyzer::detectPottingEvents(const vector<TrackedBall>& balls) {
    vector<BallEvent> events;
    for (const auto& ball : balls) {
        if (ball.state != TrackState::Potted) continue;
        if (!reportedPottings.insert(ball.trackId).second) continue;

        BallEvent event;
        event.type = BallEventType::Potted;
        event.frameNumber = ball.lastSeenFrame;
        event.trackId = ball.trackId;
        event.ballType = ball.ballType;
        event.position = lastMeasured(ball);
        event.pocket = nearPocket(event.position);

        const vector<float>& history = ball.confidenceHistory;
        size_t recent = std::min(history.size(), static_cast<size_t>(kRecentPoints));
        if (recent > 0) {
            float sum = 0.f;
            for (size_t i = history.size() - recent; i < history.size(); ++i) sum += history[i];
            event.confidence = sum / static_cast<float>(recent);
        }
        events.push_back(event);
        statistics.pottingEvents++;
    }
    return events;
}

vector<BallEvent> TrajectoryAnalyzer::detectCollisionEvents(const vector<TrackedBall>& balls) {
    vector<BallEvent> events;
    map<pair<int, int>, bool> touching;

    for (size_t i = 0; i < balls.size(); ++i) {
        const TrackedBall& a = balls[i];
        if (!hasMeasuredPosition(a)) continue;
        for (size_t j = i + 1; j < balls.size(); ++j) {
            const TrackedBall& b = balls[j];
            if (!hasMeasuredPosition(b)) continue;
            if (norm(a.currentPosition - b.currentPosition) > config.collisionDistance) continue;

            const TrackedBall& first = a.trackId < b.trackId ? a : b;
            const TrackedBall& second = a.trackId < b.trackId ? b : a;
            auto key = make_pair(first.trackId, second.trackId);
            auto previous = contacts.find(key);
            bool reported = previous != contacts.end() && previous->second;

            bool struck = (isMoving(a) && turnedSharply(a)) || (isMoving(b) && turnedSharply(b));
            if (!reported && struck) {
                BallEvent event;
                event.type = BallEventType::Collision;
                event.frameNumber = std::max(a.lastSeenFrame, b.lastSeenFrame);
                event.trackId = first.trackId;
                event.ballType = first.ballType;
                event.otherTrackId = second.trackId;
                event.otherBallType = second.ballType;
                event.position = (a.currentPosition + b.currentPosition) * 0.5f;
                event.confidence = std::min(
                    a.confidenceHistory.empty() ? 0.f : a.confidenceHistory.back(),
                    b.confidenceHistory.empty() ? 0.f : b.confidenceHistory.back());
                events.push_back(event);
                statistics.collisionEvents++;
                reported = true;
            }
            touching[key] = reported;
        }
    }
    contacts.swap(touching);
    return events;
}

TrajectoryOverview TrajectoryAnalyzer::overview(const vector<TrackedBall>& balls,
                                                const vector<TrajectorySummary>& summaries) const {
    TrajectoryOverview result;
    result.totalBalls = static_cast<int>(balls.size());
    for (const auto& ball : balls) {
        if (ball.state == TrackState::Active) result.activeBalls++;
    }
    long points = 0;
    for (const auto& summary : summaries) {
        result.motionCounts[static_cast<int>(summary.motion)]++;
        points += summary.trajectoryLength;
        result.totalDistance += summary.totalDistance;
    }
    if (!summaries.empty()) {
        result.averageTrajectoryLength = static_cast<double>(points) / summaries.size();
    }
    result.totalEvents = statistics.pottingEvents + statistics.collisionEvents;
    return result;
}

void TrajectoryAnalyzer::analyze(FrameAnalysis& analysis) {
    statistics.framesAnalyzed++;
    const vector<TrackedBall>& balls = analysis.trackedBalls;

    analysis.trajectories.clear();
    analysis.trajectories.reserve(balls.size());
    for (const auto& ball : balls) analysis.trajectories.push_back(summarize(ball));

    analysis.events = detectPottingEvents(balls);
    vector<BallEvent> collisions = detectCollisionEvents(balls);
    analysis.events.insert(analysis.events.end(), collisions.begin(), collisions.end());
    analysis.overview = overview(balls, analysis.trajectories);

    for (const auto& event : analysis.events) {
        if (event.type == BallEventType::Potted) {
            LOGI("[TrajectoryAnalyzer] Frame %d: %s track %d potted (pocket %d)",
                 analysis.frameNumber, ballTypeName(event.ballType), event.trackId, event.pocket);
        } else {
            LOGI("[TrajectoryAnalyzer] Frame %d: %s track %d hit %s track %d",
                 analysis.frameNumber, ballTypeName(event.ballType), event.trackId,
                 ballTypeName(event.otherBallType), event.otherTrackId);
        }
    }
}

void TrajectoryAnalyzer::reset() {
    reportedPottings.clear();
    contacts.clear();
    statistics = AnalyzerStats();
}
