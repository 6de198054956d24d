#ifndef BALL_TRACKER_HPP
#define BALL_TRACKER_HPP

#include <map>
#include <opencv2/video/tracking.hpp>
#include <optional>
#include <string>
#include <vector>

#include "config.hpp"
#include "errors.hpp"
#include "snooker_types.hpp"

struct TrackerStats {
    int framesProcessed = 0;
    int tracksCreated = 0;
    int tracksActivated = 0;
    int tracksPotted = 0;
    int tracksDeleted = 0;
    int reacquisitions = 0;
    int associationFallbacks = 0;
};

// Keeps ball identities across frames. Positions are frame pixels.
class BallTracker {
   public:
    explicit BallTracker(const TrackingConfig& config);

    // Advances every track to frameNumber, associates the detections and returns the live
    // tracks plus those retired during this frame, ordered by track id.
    std::vector<TrackedBall> update(const std::vector<Detection>& detections, int frameNumber);

    // Pixel regions in which a disappearing ball counts as potted.
    void setPocketRegions(const std::vector<BoundingBox>& pockets);

    std::vector<TrackedBall> liveTracks() const;

    // Live tracks of one ball type.
    std::vector<TrackedBall> tracksByType(BallType type) const;

    // Constant-velocity extrapolation of each active track from its last filtered state.
    std::map<int, cv::Point2f> predictPositions(int framesAhead) const;

    // Live or recently retired track by id.
    std::optional<TrackedBall> track(int trackId) const;

    // Association problems absorbed during the last update, empty when none.
    const std::vector<TrackingError>& lastErrors() const { return frameErrors; }

    const TrackerStats& stats() const { return statistics; }

    void reset();

   private:
    struct Track {
        TrackedBall ball;
        cv::KalmanFilter kf;
        cv::Point2f predicted;
        int consecutiveHits = 0;
        int lastUpdateFrame = 0;
        bool disappearedInPocket = false;
    };

    struct Candidate {
        int track;
        int detection;
        double cost;
        bool mismatch;
        float confidence;
        double distance;
    };

    cv::KalmanFilter createFilter(const cv::Point2f& position) const;
    void predict(Track& track, int frameNumber) const;
    void applyMeasurement(Track& track, const Detection& detection, int frameNumber);
    void reacquire(Track& track, const Detection& detection, int frameNumber);
    void startTrack(const Detection& detection, int frameNumber);
    void retire(Track& track, TrackState finalState, int frameNumber);
    bool insidePocket(const cv::Point2f& p) const;

    std::vector<std::vector<double>> buildCostMatrix(const std::vector<Detection>& detections,
                                                     std::vector<Candidate>& candidates) const;
    // Throws TrackingError when the solver rejects the matrix.
    std::vector<int> solve(const std::vector<std::vector<double>>& cost, int frameNumber) const;
    std::vector<int> greedyAssign(std::vector<Candidate> candidates, int trackCount,
                                  int detectionCount) const;

    TrackingConfig config;
    std::vector<Track> tracks;
    std::map<int, std::pair<TrackedBall, int>> retired;  // id -> (ball, retired at frame)
    std::vector<BoundingBox> pocketRegions;
    std::vector<TrackingError> frameErrors;
    std::vector<TrackedBall> retiredThisFrame;
    TrackerStats statistics;
    int nextTrackId = 1;
};

#endif  // BALL_TRACKER_HPP
