#include "detection_api.hpp"

#include <algorithm>
#include <condition_variable>
#include <deque>
#include <stdexcept>

#include "errors.hpp"
#include "image_processing.hpp"
#include "utilities.hpp"

using namespace std;
using namespace cv;

struct AnalysisChannel {
    explicit AnalysisChannel(size_t limit) : limit(limit) {}

    mutex lock;
    condition_variable ready;
    deque<shared_ptr<const FrameAnalysis>> pending;
    size_t limit;  // 0 is unbounded
    long dropped = 0;
    bool closed = false;

    // A full buffer loses its oldest analysis; the producer never waits on the consumer.
    void publish(shared_ptr<const FrameAnalysis> analysis) {
        {
            lock_guard<mutex> guard(lock);
            if (closed) return;
            if (limit > 0 && pending.size() >= limit) {
                LOGW("[DetectionApi] Stream buffer full, dropping analysis of frame %d",
                     pending.front()->frameNumber);
                pending.pop_front();
                dropped++;
            }
            pending.push_back(std::move(analysis));
        }
        ready.notify_one();
    }

    void close() {
        {
            lock_guard<mutex> guard(lock);
            closed = true;
        }
        ready.notify_all();
    }
};

AnalysisStream::AnalysisStream(shared_ptr<AnalysisChannel> channel) : channel(std::move(channel)) {}

shared_ptr<const FrameAnalysis> AnalysisStream::next() {
    unique_lock<mutex> guard(channel->lock);
    channel->ready.wait(guard, [this] { return !channel->pending.empty() || channel->closed; });
    if (channel->pending.empty()) return nullptr;
    auto analysis = channel->pending.front();
    channel->pending.pop_front();
    return analysis;
}

shared_ptr<const FrameAnalysis> AnalysisStream::tryNext() {
    lock_guard<mutex> guard(channel->lock);
    if (channel->pending.empty()) return nullptr;
    auto analysis = channel->pending.front();
    channel->pending.pop_front();
    return analysis;
}

long AnalysisStream::droppedCount() const {
    lock_guard<mutex> guard(channel->lock);
    return channel->dropped;
}

bool AnalysisStream::isFinished() const {
    lock_guard<mutex> guard(channel->lock);
    return channel->closed && channel->pending.empty();
}

struct DetectionApi::Session {
    mutex processMutex;  // one frame at a time
    unique_ptr<FrameProcessor> processor;
    bool debugMode = false;

    // Published state, guarded by publishMutex.
    mutable mutex publishMutex;
    shared_ptr<const FrameAnalysis> latest;
    shared_ptr<const CalibrationData> calibration;
    CalibrationState calibrationState = CalibrationState::Uncalibrated;
    ProcessingStats stats;
    Mat latestFrame;  // debug mode only
    shared_ptr<AnalysisChannel> channel;
    bool streamOpened = false;
    bool ended = false;
};

DetectionApi::DetectionApi() = default;

DetectionApi::~DetectionApi() {
    lock_guard<mutex> guard(registryMutex);
    for (auto& entry : sessions) {
        lock_guard<mutex> publishGuard(entry.second->publishMutex);
        if (entry.second->channel) entry.second->channel->close();
    }
}

void DetectionApi::addSession(const string& sessionId, unique_ptr<FrameProcessor> processor) {
    auto session = make_shared<Session>();
    session->debugMode = processor->sessionConfig().debugMode;
    session->processor = std::move(processor);

    lock_guard<mutex> guard(registryMutex);
    if (sessions.count(sessionId) != 0) {
        throw ConfigurationError("session " + sessionId + " already exists");
    }
    sessions[sessionId] = session;
    LOGI("[DetectionApi] Session %s created", sessionId.c_str());
}

void DetectionApi::createSession(const string& sessionId, const SessionConfig& config) {
    if (sessionId.empty()) throw ConfigurationError("session id is required");
    addSession(sessionId, make_unique<FrameProcessor>(config));
}

void DetectionApi::createSession(const string& sessionId, const SessionConfig& config,
                                 unique_ptr<BallClassifier> classifier) {
    if (sessionId.empty()) throw ConfigurationError("session id is required");
    addSession(sessionId, make_unique<FrameProcessor>(config, std::move(classifier)));
}

shared_ptr<DetectionApi::Session> DetectionApi::find(const string& sessionId) const {
    lock_guard<mutex> guard(registryMutex);
    auto it = sessions.find(sessionId);
    if (it == sessions.end()) {
        throw std::invalid_argument("unknown session " + sessionId);
    }
    return it->second;
}

bool DetectionApi::hasSession(const string& sessionId) const {
    lock_guard<mutex> guard(registryMutex);
    return sessions.count(sessionId) != 0;
}

shared_ptr<const FrameAnalysis> DetectionApi::submitFrame(const string& sessionId,
                                                          const Mat& frame, int frameNumber,
                                                          double timestamp) {
    auto session = find(sessionId);
    lock_guard<mutex> processGuard(session->processMutex);
    {
        lock_guard<mutex> guard(session->publishMutex);
        if (session->ended) {
            LOGW("[DetectionApi] Session %s has ended, ignoring frame %d", sessionId.c_str(),
                 frameNumber);
            return nullptr;
        }
    }

    auto analysis = session->processor->process(frame, frameNumber, timestamp);

    shared_ptr<AnalysisChannel> channel;
    {
        lock_guard<mutex> guard(session->publishMutex);
        session->stats = session->processor->stats();
        session->calibrationState = session->processor->calibrator().state();
        session->calibration = session->processor->calibration();
        if (!analysis) return nullptr;

        session->latest = analysis;
        if (session->debugMode) session->latestFrame = frame.clone();
        channel = session->channel;
    }
    if (channel) channel->publish(analysis);
    return analysis;
}

void DetectionApi::endStream(const string& sessionId) {
    auto session = find(sessionId);
    lock_guard<mutex> guard(session->publishMutex);
    session->ended = true;
    if (session->channel) session->channel->close();
}

void DetectionApi::cancelSession(const string& sessionId) {
    auto session = find(sessionId);
    session->processor->cancel();
    endStream(sessionId);
    LOGI("[DetectionApi] Session %s cancelled", sessionId.c_str());
}

void DetectionApi::closeSession(const string& sessionId) {
    auto session = find(sessionId);
    session->processor->cancel();
    {
        lock_guard<mutex> guard(session->publishMutex);
        session->ended = true;
        if (session->channel) session->channel->close();
    }
    // Wait for a frame in flight before the processor is released.
    lock_guard<mutex> processGuard(session->processMutex);
    lock_guard<mutex> guard(registryMutex);
    sessions.erase(sessionId);
    LOGI("[DetectionApi] Session %s closed", sessionId.c_str());
}

shared_ptr<const FrameAnalysis> DetectionApi::getLatestFrameAnalysis(const string& sessionId) const {
    auto session = find(sessionId);
    lock_guard<mutex> guard(session->publishMutex);
    return session->latest;
}

AnalysisStream DetectionApi::streamFrameAnalyses(const string& sessionId) {
    auto session = find(sessionId);
    lock_guard<mutex> guard(session->publishMutex);
    if (session->streamOpened) {
        throw std::logic_error("stream for session " + sessionId + " was already opened");
    }
    session->streamOpened = true;
    int limit = session->processor->sessionConfig().streamBufferLimit;
    session->channel = make_shared<AnalysisChannel>(static_cast<size_t>(std::max(limit, 0)));
    if (session->ended) session->channel->close();
    return AnalysisStream(session->channel);
}

shared_ptr<const CalibrationData> DetectionApi::getCalibration(const string& sessionId) const {
    auto session = find(sessionId);
    lock_guard<mutex> guard(session->publishMutex);
    return session->calibration;
}

CalibrationState DetectionApi::getCalibrationState(const string& sessionId) const {
    auto session = find(sessionId);
    lock_guard<mutex> guard(session->publishMutex);
    return session->calibrationState;
}

ProcessingStats DetectionApi::getProcessingStats(const string& sessionId) const {
    auto session = find(sessionId);
    lock_guard<mutex> guard(session->publishMutex);
    return session->stats;
}

Mat DetectionApi::exportAnnotatedFrame(const string& sessionId, bool topDown) const {
    auto session = find(sessionId);
    shared_ptr<const FrameAnalysis> analysis;
    Mat frame;
    {
        lock_guard<mutex> guard(session->publishMutex);
        if (!session->debugMode || !session->latest) return Mat();
        analysis = session->latest;
        frame = session->latestFrame;
    }
    return topDown ? drawTopDownView(frame, *analysis) : drawFrameAnalysis(frame, *analysis);
}
