#ifndef DETECTION_API_HPP
#define DETECTION_API_HPP

#include <map>
#include <memory>
#include <mutex>
#include <opencv2/core.hpp>
#include <string>

#include "ball_detector.hpp"
#include "calibration_engine.hpp"
#include "config.hpp"
#include "frame_processor.hpp"
#include "snooker_types.hpp"

struct AnalysisChannel;

// Ordered, single-consumer view of the analyses a session produces after the stream is opened.
class AnalysisStream {
   public:
    // Blocks until the next analysis arrives. Null once the session's stream has ended and
    // every buffered analysis was delivered.
    std::shared_ptr<const FrameAnalysis> next();

    // Non-blocking form of next(); null when nothing is buffered.
    std::shared_ptr<const FrameAnalysis> tryNext();

    bool isFinished() const;

    // Analyses discarded because the consumer fell behind by more than the buffer limit.
    long droppedCount() const;

   private:
    friend class DetectionApi;
    explicit AnalysisStream(std::shared_ptr<AnalysisChannel> channel);

    std::shared_ptr<AnalysisChannel> channel;
};

// Session registry and the query boundary consumers use. Each session has a single writer
// (the submitting thread) and any number of readers.
class DetectionApi {
   public:
    DetectionApi();
    ~DetectionApi();

    // Throws ConfigurationError for an invalid configuration or a duplicate session id.
    void createSession(const std::string& sessionId, const SessionConfig& config);
    void createSession(const std::string& sessionId, const SessionConfig& config,
                       std::unique_ptr<BallClassifier> classifier);

    // Processes a frame and publishes its analysis. Null when the frame was rejected, dropped
    // or the session was cancelled. Throws std::invalid_argument for an unknown session.
    std::shared_ptr<const FrameAnalysis> submitFrame(const std::string& sessionId,
                                                     const cv::Mat& frame, int frameNumber,
                                                     double timestamp);

    // No more frames will be submitted; open streams finish after draining.
    void endStream(const std::string& sessionId);

    // Discards the frame in flight and ends the stream.
    void cancelSession(const std::string& sessionId);

    void closeSession(const std::string& sessionId);
    bool hasSession(const std::string& sessionId) const;

    // Null before the first analysis is published.
    std::shared_ptr<const FrameAnalysis> getLatestFrameAnalysis(const std::string& sessionId) const;

    // Opens the session's stream. A session's stream can be opened once; a second call throws
    // std::logic_error.
    AnalysisStream streamFrameAnalyses(const std::string& sessionId);

    std::shared_ptr<const CalibrationData> getCalibration(const std::string& sessionId) const;
    CalibrationState getCalibrationState(const std::string& sessionId) const;
    ProcessingStats getProcessingStats(const std::string& sessionId) const;

    // Latest frame with its analysis drawn on it, or the top-down table view. Empty unless the
    // session runs in debug mode and has processed a frame.
    cv::Mat exportAnnotatedFrame(const std::string& sessionId, bool topDown = false) const;

   private:
    struct Session;
    std::shared_ptr<Session> find(const std::string& sessionId) const;
    void addSession(const std::string& sessionId, std::unique_ptr<FrameProcessor> processor);

    mutable std::mutex registryMutex;
    std::map<std::string, std::shared_ptr<Session>> sessions;
};

#endif  // DETECTION_API_HPP
