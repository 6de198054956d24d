#ifndef TRAJECTORY_ANALYZER_HPP
#define TRAJECTORY_ANALYZER_HPP

#include <opencv2/core.hpp>
#include <map>
#include <set>
#include <utility>
#include <vector>

#include "config.hpp"
#include "snooker_types.hpp"

struct AnalyzerStats {
    long framesAnalyzed = 0;
    long pottingEvents = 0;
    long collisionEvents = 0;
};

// Summarises track trajectories and reports potting and collision events. Works in frame
// pixels on the tracks the tracker returns for each frame.
class TrajectoryAnalyzer {
   public:
    explicit TrajectoryAnalyzer(const AnalysisConfig& config);

    // Fills trajectories, events and overview of an analysis whose trackedBalls are set.
    void analyze(FrameAnalysis& analysis);

    TrajectorySummary summarize(const TrackedBall& ball) const;
    MotionState motionState(const TrackedBall& ball) const;

    // Each event is reported once: a potting when the track retires as potted, a collision
    // when two balls come into contact.
    std::vector<BallEvent> detectPottingEvents(const std::vector<TrackedBall>& balls);
    std::vector<BallEvent> detectCollisionEvents(const std::vector<TrackedBall>& balls);

    TrajectoryOverview overview(const std::vector<TrackedBall>& balls,
                                const std::vector<TrajectorySummary>& summaries) const;

    // Nearest pocket within pocketProximity of p, or -1.
    int nearPocket(const cv::Point2f& p) const;

    void setPocketRegions(const std::vector<BoundingBox>& pockets);

    const AnalyzerStats& stats() const { return statistics; }

    void reset();

   private:
    bool turnedSharply(const TrackedBall& ball) const;
    bool isMoving(const TrackedBall& ball) const;

    AnalysisConfig config;
    std::vector<BoundingBox> pocketRegions;
    std::set<int> reportedPottings;
    std::map<std::pair<int, int>, bool> contacts;  // touching id pairs -> already reported
    AnalyzerStats statistics;
};

// Path length of a polyline.
double trajectoryDistance(const std::vector<cv::Point2f>& trajectory);

// Turns between consecutive segments larger than angleDegrees. Segments shorter than a pixel
// are skipped.
int countDirectionChanges(const std::vector<cv::Point2f>& trajectory, double angleDegrees);

#endif  // TRAJECTORY_ANALYZER_HPP
