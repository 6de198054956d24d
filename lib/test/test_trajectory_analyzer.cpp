#include <opencv2/opencv.hpp>
#include <vector>

#include "config.hpp"
#include "trajectory_analyzer.hpp"
#include "test_utils.hpp"

using namespace cv;
using namespace std;

namespace {

TrackedBall makeTrack(int id, BallType type, const vector<Point2f>& trajectory,
                      Point2f velocity = Point2f(0, 0), TrackState state = TrackState::Active) {
    TrackedBall ball;
    ball.trackId = id;
    ball.ballType = type;
    ball.trajectory = trajectory;
    ball.currentPosition = trajectory.back();
    ball.velocity = velocity;
    ball.state = state;
    ball.confidenceHistory.assign(trajectory.size(), 0.9f);
    ball.firstSeenFrame = 0;
    ball.lastSeenFrame = static_cast<int>(trajectory.size()) - 1;
    return ball;
}

// Moving right, then turning a right angle down onto (100, 100).
TrackedBall deflectedCue(int id) {
    return makeTrack(id, BallType::Cue,
                     {{80, 80}, {90, 80}, {100, 80}, {100, 90}, {100, 100}}, Point2f(0, 10));
}

vector<BoundingBox> cornerPockets() {
    return {BoundingBox(0, 0, 20, 20), BoundingBox(200, 0, 220, 20)};
}

bool measuresPathAndTurns() {
    vector<Point2f> path = {{0, 0}, {10, 0}, {20, 0}, {20, 10}, {20, 20}};
    CHECK_NEAR(trajectoryDistance(path), 40.0, 1e-6);
    CHECK(countDirectionChanges(path, 30.0) == 1);
    CHECK(countDirectionChanges(path, 90.0) == 0);

    // A sub-pixel wobble carries no direction.
    vector<Point2f> jitter = {{0, 0}, {10, 0}, {10.5f, 0.3f}, {20, 0}};
    CHECK(countDirectionChanges(jitter, 30.0) == 0);

    CHECK(trajectoryDistance(vector<Point2f>()) == 0.0);
    CHECK(countDirectionChanges(vector<Point2f>{Point2f(5, 5)}, 30.0) == 0);
    return true;
}

bool classifiesMotion() {
    TrajectoryAnalyzer analyzer{AnalysisConfig()};
    vector<Point2f> straight = {{0, 0}, {10, 0}, {20, 0}, {30, 0}, {40, 0}};

    CHECK(analyzer.motionState(makeTrack(1, BallType::Red, straight)) == MotionState::Stationary);
    CHECK(analyzer.motionState(makeTrack(1, BallType::Red, straight, Point2f(10, 0))) ==
          MotionState::Moving);
    CHECK(analyzer.motionState(deflectedCue(1)) == MotionState::Collision);
    CHECK(analyzer.motionState(makeTrack(1, BallType::Red, straight, Point2f(0, 0),
                                         TrackState::Potted)) == MotionState::Potted);
    CHECK(analyzer.motionState(makeTrack(1, BallType::Red, straight, Point2f(10, 0),
                                         TrackState::Occluded)) == MotionState::Lost);
    CHECK(analyzer.motionState(makeTrack(1, BallType::Red, straight, Point2f(0, 0),
                                         TrackState::Deleted)) == MotionState::Lost);
    return true;
}

bool summarizesTrack() {
    TrajectoryAnalyzer analyzer{AnalysisConfig()};
    analyzer.setPocketRegions(cornerPockets());

    TrackedBall ball = makeTrack(
        4, BallType::Pink, {{60, 10}, {50, 10}, {40, 10}, {30, 10}, {25, 10}}, Point2f(-5, 0));
    TrajectorySummary summary = analyzer.summarize(ball);
    CHECK(summary.trackId == 4);
    CHECK(summary.ballType == BallType::Pink);
    CHECK(summary.trajectoryLength == 5);
    CHECK_NEAR(summary.totalDistance, 35.0, 1e-6);
    CHECK_NEAR(summary.averageSpeed, 35.0 / 4, 1e-6);
    CHECK(summary.directionChanges == 0);
    CHECK(summary.nearPocket == 0);

    TrackedBall single = makeTrack(5, BallType::Red, {{110, 200}});
    TrajectorySummary still = analyzer.summarize(single);
    CHECK(still.averageSpeed == 0.0);
    CHECK(still.nearPocket == -1);
    return true;
}

bool findsNearestPocket() {
    TrajectoryAnalyzer analyzer{AnalysisConfig()};
    CHECK(analyzer.nearPocket(Point2f(10, 10)) == -1);  // no pockets known yet

    analyzer.setPocketRegions(cornerPockets());
    CHECK(analyzer.nearPocket(Point2f(10, 10)) == 0);
    CHECK(analyzer.nearPocket(Point2f(25, 25)) == 0);
    CHECK(analyzer.nearPocket(Point2f(195, 10)) == 1);
    CHECK(analyzer.nearPocket(Point2f(110, 10)) == -1);
    CHECK(analyzer.nearPocket(Point2f(10, 60)) == -1);
    return true;
}

bool reportsPottingOnce() {
    TrajectoryAnalyzer analyzer{AnalysisConfig()};
    analyzer.setPocketRegions(cornerPockets());

    TrackedBall ball =
        makeTrack(3, BallType::Black, {{60, 40}, {45, 30}, {30, 20}, {20, 15}, {15, 10}, {12, 8}},
                  Point2f(0, 0), TrackState::Potted);
    ball.confidenceHistory = {0.5f, 0.6f, 0.7f, 0.8f, 0.9f, 1.0f};
    ball.lastSeenFrame = 41;

    vector<BallEvent> events = analyzer.detectPottingEvents({ball});
    CHECK(events.size() == 1);
    const BallEvent& pot = events[0];
    CHECK(pot.type == BallEventType::Potted);
    CHECK(pot.trackId == 3);
    CHECK(pot.ballType == BallType::Black);
    CHECK(pot.frameNumber == 41);
    CHECK(pot.pocket == 0);
    CHECK(pot.position == Point2f(12, 8));
    CHECK_NEAR(pot.confidence, 0.8, 1e-5);

    CHECK(analyzer.detectPottingEvents({ball}).empty());
    CHECK(analyzer.stats().pottingEvents == 1);

    analyzer.reset();
    CHECK(analyzer.detectPottingEvents({ball}).size() == 1);
    return true;
}

bool reportsCollisionOncePerContact() {
    TrajectoryAnalyzer analyzer{AnalysisConfig()};
    TrackedBall cue = deflectedCue(5);
    TrackedBall red = makeTrack(2, BallType::Red, {{110, 100}});

    vector<BallEvent> events = analyzer.detectCollisionEvents({cue, red});
    CHECK(events.size() == 1);
    const BallEvent& hit = events[0];
    CHECK(hit.type == BallEventType::Collision);
    CHECK(hit.trackId == 2);
    CHECK(hit.ballType == BallType::Red);
    CHECK(hit.otherTrackId == 5);
    CHECK(hit.otherBallType == BallType::Cue);
    CHECK(hit.position == Point2f(105, 100));
    CHECK_NEAR(hit.confidence, 0.9, 1e-6);

    // Still touching.
    CHECK(analyzer.detectCollisionEvents({cue, red}).empty());

    // Apart, then together again.
    TrackedBall away = makeTrack(2, BallType::Red, {{300, 100}});
    CHECK(analyzer.detectCollisionEvents({cue, away}).empty());
    CHECK(analyzer.detectCollisionEvents({cue, red}).size() == 1);
    CHECK(analyzer.stats().collisionEvents == 2);
    return true;
}

bool closeBallsWithoutDeflectionDoNotCollide() {
    TrajectoryAnalyzer analyzer{AnalysisConfig()};
    TrackedBall rolling = makeTrack(
        1, BallType::Cue, {{60, 100}, {70, 100}, {80, 100}, {90, 100}, {100, 100}}, Point2f(10, 0));
    TrackedBall red = makeTrack(2, BallType::Red, {{110, 100}});
    CHECK(analyzer.detectCollisionEvents({rolling, red}).empty());

    // A deflected ball next to one that is no longer measured.
    TrackedBall hidden =
        makeTrack(3, BallType::Red, {{105, 100}}, Point2f(0, 0), TrackState::Occluded);
    CHECK(analyzer.detectCollisionEvents({deflectedCue(4), hidden}).empty());
    return true;
}

bool analyzeFillsFrame() {
    TrajectoryAnalyzer analyzer{AnalysisConfig()};
    analyzer.setPocketRegions(cornerPockets());

    FrameAnalysis analysis;
    analysis.frameNumber = 12;
    analysis.trackedBalls = {
        makeTrack(1, BallType::Red, {{300, 200}}),
        makeTrack(2, BallType::Red, {{400, 200}, {400, 200}}),
        makeTrack(3, BallType::Blue, {{30, 30}, {15, 15}}, Point2f(0, 0), TrackState::Potted),
    };
    analyzer.analyze(analysis);

    CHECK(analysis.trajectories.size() == 3);
    CHECK(analysis.trajectories[2].trackId == 3);
    CHECK(analysis.trajectories[2].motion == MotionState::Potted);
    CHECK(analysis.events.size() == 1);
    CHECK(analysis.events[0].type == BallEventType::Potted);

    const TrajectoryOverview& overview = analysis.overview;
    CHECK(overview.totalBalls == 3);
    CHECK(overview.activeBalls == 2);
    CHECK(overview.motionCounts[static_cast<int>(MotionState::Stationary)] == 2);
    CHECK(overview.motionCounts[static_cast<int>(MotionState::Potted)] == 1);
    CHECK(overview.totalEvents == 1);
    CHECK_NEAR(overview.averageTrajectoryLength, 5.0 / 3, 1e-9);

    // The next frame reports no new events but keeps the session total.
    analyzer.analyze(analysis);
    CHECK(analysis.events.empty());
    CHECK(analysis.overview.totalEvents == 1);
    CHECK(analyzer.stats().framesAnalyzed == 2);
    return true;
}

}  // namespace

int main() {
    return runTests({
        {"measuresPathAndTurns", measuresPathAndTurns},
        {"classifiesMotion", classifiesMotion},
        {"summarizesTrack", summarizesTrack},
        {"findsNearestPocket", findsNearestPocket},
        {"reportsPottingOnce", reportsPottingOnce},
        {"reportsCollisionOncePerContact", reportsCollisionOncePerContact},
        {"closeBallsWithoutDeflectionDoNotCollide", closeBallsWithoutDeflectionDoNotCollide},
        {"analyzeFillsFrame", analyzeFillsFrame},
    });
}
