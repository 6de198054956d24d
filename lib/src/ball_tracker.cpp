#include "ball_tracker.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>

#include "hungarian.hpp"
#include "utilities.hpp"

using namespace std;
using namespace cv;

namespace {

// Sub-pixel terms that order otherwise equal costs: matching type first, then confidence.
constexpr double kTypeTieBreak = 1e-3;
constexpr double kConfidenceTieBreak = 1e-5;

constexpr float kInitialCovariance = 1000.f;

// Sets F for a constant-velocity step of dt frames.
void setTransition(KalmanFilter& kf, float dt) {
    kf.transitionMatrix.at<float>(0, 2) = dt;
    kf.transitionMatrix.at<float>(1, 3) = dt;
}

// Discrete white-noise acceleration model scaled by s.
void setProcessNoise(KalmanFilter& kf, float dt, float s) {
    float dt2 = dt * dt, dt3 = dt2 * dt, dt4 = dt2 * dt2;
    Mat q = Mat::zeros(4, 4, CV_32F);
    q.at<float>(0, 0) = q.at<float>(1, 1) = dt4 / 4 * s;
    q.at<float>(0, 2) = q.at<float>(1, 3) = dt3 / 2 * s;
    q.at<float>(2, 0) = q.at<float>(3, 1) = dt3 / 2 * s;
    q.at<float>(2, 2) = q.at<float>(3, 3) = dt2 * s;
    kf.processNoiseCov = q;
}

}  // namespace

BallTracker::BallTracker(const TrackingConfig& config) : config(config) {}

KalmanFilter BallTracker::createFilter(const Point2f& position) const {
    KalmanFilter kf(4, 2, 0, CV_32F);

    // State [x, y, vx, vy], measurement [x, y].
    kf.transitionMatrix = (Mat_<float>(4, 4) << 1, 0, 1, 0,
                                                0, 1, 0, 1,
                                                0, 0, 1, 0,
                                                0, 0, 0, 1);
    kf.measurementMatrix = (Mat_<float>(2, 4) << 1, 0, 0, 0,
                                                 0, 1, 0, 0);

    setProcessNoise(kf, 1.f, config.processNoise);
    kf.measurementNoiseCov = Mat::eye(2, 2, CV_32F) * config.measurementNoise;
    kf.errorCovPost = Mat::eye(4, 4, CV_32F) * kInitialCovariance;
    kf.errorCovPre = kf.errorCovPost.clone();
    kf.statePost = (Mat_<float>(4, 1) << position.x, position.y, 0.f, 0.f);
    kf.statePre = kf.statePost.clone();
    return kf;
}

void BallTracker::predict(Track& track, int frameNumber) const {
    float dt = static_cast<float>(std::max(1, frameNumber - track.lastUpdateFrame));
    setTransition(track.kf, dt);
    setProcessNoise(track.kf, dt, config.processNoise);

    const Mat& state = track.kf.predict();
    track.predicted = Point2f(state.at<float>(0), state.at<float>(1));
    track.ball.velocity = Point2f(state.at<float>(2), state.at<float>(3));
    track.lastUpdateFrame = frameNumber;
}

void BallTracker::applyMeasurement(Track& track, const Detection& detection, int frameNumber) {
    Point2f centre = detection.centroid();
    Mat measurement = (Mat_<float>(2, 1) << centre.x, centre.y);
    const Mat& state = track.kf.correct(measurement);

    TrackedBall& ball = track.ball;
    Point2f position = centre;
    if (config.trajectorySmoothing) position = Point2f(state.at<float>(0), state.at<float>(1));
    ball.currentPosition = position;
    ball.velocity = Point2f(state.at<float>(2), state.at<float>(3));
    ball.trajectory.push_back(position);
    ball.confidenceHistory.push_back(detection.confidence);
    ball.lastSeenFrame = frameNumber;
    ball.framesSinceSeen = 0;
    track.consecutiveHits++;
    track.disappearedInPocket = false;

    if (ball.state == TrackState::Tentative && track.consecutiveHits >= config.minHitsToActivate) {
        ball.state = TrackState::Active;
        statistics.tracksActivated++;
    } else if (ball.state == TrackState::Occluded) {
        ball.state = TrackState::Active;
    }
}

void BallTracker::reacquire(Track& track, const Detection& detection, int frameNumber) {
    LOGD("[BallTracker] Frame %d: %s track %d re-acquired at (%.1f, %.1f)", frameNumber,
         ballTypeName(track.ball.ballType), track.ball.trackId, detection.centroid().x,
         detection.centroid().y);
    track.kf = createFilter(detection.centroid());
    track.predicted = detection.centroid();
    track.lastUpdateFrame = frameNumber;
    applyMeasurement(track, detection, frameNumber);
    statistics.reacquisitions++;
}

void BallTracker::startTrack(const Detection& detection, int frameNumber) {
    Track track;
    Point2f centre = detection.centroid();

    TrackedBall& ball = track.ball;
    ball.trackId = nextTrackId++;
    ball.ballType = detection.ballType();
    ball.currentPosition = centre;
    ball.trajectory.push_back(centre);
    ball.confidenceHistory.push_back(detection.confidence);
    ball.firstSeenFrame = frameNumber;
    ball.lastSeenFrame = frameNumber;
    ball.framesSinceSeen = 0;
    ball.state = config.minHitsToActivate <= 1 ? TrackState::Active : TrackState::Tentative;

    track.kf = createFilter(centre);
    track.predicted = centre;
    track.consecutiveHits = 1;
    track.lastUpdateFrame = frameNumber;

    statistics.tracksCreated++;
    if (ball.state == TrackState::Active) statistics.tracksActivated++;
    tracks.push_back(std::move(track));
}

void BallTracker::retire(Track& track, TrackState finalState, int frameNumber) {
    track.ball.state = finalState;
    if (finalState == TrackState::Potted) {
        statistics.tracksPotted++;
        LOGI("[BallTracker] Frame %d: %s track %d potted", frameNumber,
             ballTypeName(track.ball.ballType), track.ball.trackId);
    } else {
        statistics.tracksDeleted++;
    }
    retiredThisFrame.push_back(track.ball);
    retired[track.ball.trackId] = {track.ball, frameNumber};
}

bool BallTracker::insidePocket(const Point2f& p) const {
    for (const auto& pocket : pocketRegions) {
        if (pocket.contains(p)) return true;
    }
    return false;
}

vector<vector<double>> BallTracker::buildCostMatrix(const vector<Detection>& detections,
                                                    vector<Candidate>& candidates) const {
    const double inf = numeric_limits<double>::infinity();
    vector<vector<double>> cost(tracks.size(), vector<double>(detections.size(), inf));

    for (size_t t = 0; t < tracks.size(); ++t) {
        for (size_t d = 0; d < detections.size(); ++d) {
            const Detection& det = detections[d];
            double distance = norm(tracks[t].predicted - det.centroid());
            bool mismatch = tracks[t].ball.ballType != det.ballType();

            if (std::isnan(distance)) {
                cost[t][d] = numeric_limits<double>::quiet_NaN();
                continue;
            }
            if (distance > config.maxTrackingDistance) continue;
            if (mismatch && config.classMismatchPenalty < 0.f) continue;

            double c = config.distanceWeight * distance;
            if (mismatch) c += config.classMismatchPenalty + kTypeTieBreak;
            c += kConfidenceTieBreak * (1.0 - det.confidence);
            cost[t][d] = c;
            candidates.push_back({static_cast<int>(t), static_cast<int>(d), c, mismatch,
                                  det.confidence, distance});
        }
    }
    return cost;
}

vector<int> BallTracker::solve(const vector<vector<double>>& cost, int frameNumber) const {
    vector<int> trackToDetection;
    if (!solveAssignment(cost, trackToDetection)) {
        throw TrackingError("assignment failed at frame " + to_string(frameNumber));
    }
    return trackToDetection;
}

vector<int> BallTracker::greedyAssign(vector<Candidate> candidates, int trackCount,
                                      int detectionCount) const {
    sort(candidates.begin(), candidates.end(), [](const Candidate& a, const Candidate& b) {
        if (a.cost != b.cost) return a.cost < b.cost;
        if (a.mismatch != b.mismatch) return !a.mismatch;
        if (a.confidence != b.confidence) return a.confidence > b.confidence;
        return a.distance < b.distance;
    });

    vector<int> trackToDetection(trackCount, -1);
    vector<bool> detectionTaken(detectionCount, false);
    for (const auto& c : candidates) {
        if (trackToDetection[c.track] != -1 || detectionTaken[c.detection]) continue;
        trackToDetection[c.track] = c.detection;
        detectionTaken[c.detection] = true;
    }
    return trackToDetection;
}

vector<TrackedBall> BallTracker::update(const vector<Detection>& detections, int frameNumber) {
    frameErrors.clear();
    retiredThisFrame.clear();
    statistics.framesProcessed++;

    for (auto& track : tracks) predict(track, frameNumber);

    vector<Detection> usable;
    usable.reserve(detections.size());
    for (const auto& det : detections) {
        if (!isValidClassId(det.classId)) {
            frameErrors.emplace_back("ignoring detection with unknown class id " +
                                     to_string(det.classId));
            continue;
        }
        usable.push_back(det);
    }

    const int trackCount = static_cast<int>(tracks.size());
    const int detectionCount = static_cast<int>(usable.size());

    vector<Candidate> candidates;
    vector<vector<double>> cost = buildCostMatrix(usable, candidates);

    vector<int> trackToDetection;
    try {
        trackToDetection = solve(cost, frameNumber);
    } catch (const TrackingError& e) {
        statistics.associationFallbacks++;
        LOGE("[BallTracker] %s, falling back to greedy matching", e.what());
        frameErrors.push_back(e);
        trackToDetection = greedyAssign(candidates, trackCount, detectionCount);
    }

    vector<bool> trackMatched(trackCount, false);
    vector<bool> detectionUsed(detectionCount, false);
    for (int t = 0; t < trackCount; ++t) {
        int d = trackToDetection[t];
        if (d < 0) continue;
        applyMeasurement(tracks[t], usable[d], frameNumber);
        trackMatched[t] = true;
        detectionUsed[d] = true;
    }

    // Leftover detections, most confident first.
    vector<int> order(detectionCount);
    iota(order.begin(), order.end(), 0);
    stable_sort(order.begin(), order.end(),
                [&](int a, int b) { return usable[a].confidence > usable[b].confidence; });

    for (int d : order) {
        if (detectionUsed[d]) continue;
        const Detection& det = usable[d];
        BallType type = det.ballType();
        if (!std::isfinite(det.centroid().x) || !std::isfinite(det.centroid().y)) continue;

        int sameType = 0;
        int existing = -1;
        for (size_t t = 0; t < tracks.size(); ++t) {
            if (tracks[t].ball.ballType == type && tracks[t].ball.isLive()) {
                sameType++;
                existing = static_cast<int>(t);
            }
        }

        if (isUniqueBallType(type) && existing >= 0) {
            // Only one ball of this type exists: a distant detection is the same ball.
            if (existing < trackCount && !trackMatched[existing]) {
                reacquire(tracks[existing], det, frameNumber);
                trackMatched[existing] = true;
            }
            continue;
        }
        if (sameType >= maxBallCount(type)) continue;

        startTrack(det, frameNumber);
    }

    for (int t = 0; t < trackCount; ++t) {
        if (trackMatched[t]) continue;
        Track& track = tracks[t];
        TrackedBall& ball = track.ball;

        if (ball.state == TrackState::Tentative) {
            retire(track, TrackState::Deleted, frameNumber);
            continue;
        }

        if (ball.state == TrackState::Active) {
            track.disappearedInPocket =
                insidePocket(track.predicted) || insidePocket(ball.currentPosition);
            ball.state = TrackState::Occluded;
        }
        track.consecutiveHits = 0;
        ball.framesSinceSeen = frameNumber - ball.lastSeenFrame;
        ball.currentPosition = track.predicted;

        if (ball.framesSinceSeen >= config.maxDisappearedFrames) {
            retire(track, track.disappearedInPocket ? TrackState::Potted : TrackState::Deleted,
                   frameNumber);
        }
    }

    tracks.erase(remove_if(tracks.begin(), tracks.end(),
                           [](const Track& t) { return t.ball.isRetired(); }),
                 tracks.end());

    const int retention = 2 * config.maxDisappearedFrames;
    for (auto it = retired.begin(); it != retired.end();) {
        if (frameNumber - it->second.second > retention) {
            it = retired.erase(it);
        } else {
            ++it;
        }
    }

    vector<TrackedBall> result = liveTracks();
    result.insert(result.end(), retiredThisFrame.begin(), retiredThisFrame.end());
    sort(result.begin(), result.end(),
         [](const TrackedBall& a, const TrackedBall& b) { return a.trackId < b.trackId; });
    return result;
}

void BallTracker::setPocketRegions(const vector<BoundingBox>& pockets) { pocketRegions = pockets; }

vector<TrackedBall> BallTracker::liveTracks() const {
    vector<TrackedBall> result;
    result.reserve(tracks.size());
    for (const auto& track : tracks) result.push_back(track.ball);
    return result;
}

vector<TrackedBall> BallTracker::tracksByType(BallType type) const {
    vector<TrackedBall> result;
    for (const auto& track : tracks) {
        if (track.ball.ballType == type) result.push_back(track.ball);
    }
    return result;
}

map<int, Point2f> BallTracker::predictPositions(int framesAhead) const {
    map<int, Point2f> result;
    if (framesAhead < 0) return result;
    for (const auto& track : tracks) {
        if (track.ball.state != TrackState::Active) continue;
        const Mat& state = track.kf.statePost;
        float dt = static_cast<float>(framesAhead);
        result[track.ball.trackId] = Point2f(state.at<float>(0) + state.at<float>(2) * dt,
                                             state.at<float>(1) + state.at<float>(3) * dt);
    }
    return result;
}

optional<TrackedBall> BallTracker::track(int trackId) const {
    for (const auto& t : tracks) {
        if (t.ball.trackId == trackId) return t.ball;
    }
    auto it = retired.find(trackId);
    if (it != retired.end()) return it->second.first;
    return nullopt;
}

void BallTracker::reset() {
    tracks.clear();
    retired.clear();
    retiredThisFrame.clear();
    frameErrors.clear();
    // Ids stay monotonic across resets.
}
