#ifndef SESSION_COORDINATOR_HPP
#define SESSION_COORDINATOR_HPP

#include "audio/audio_capture.hpp"
#include "pipeline/processing_pipeline.hpp"
#include "session/debouncer.hpp"
#include "session/session_observer.hpp"
#include "session/session_types.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

// Push-to-talk state machine. Hotkey edges may arrive on any thread; they are
// queued and handled in arrival order on one coordinator thread, which is also
// the only caller of AudioCapture. Pipeline work runs on a detached worker per
// session and reports back through the same queue.
class SessionCoordinator {
public:
    struct Config {
        std::chrono::milliseconds debounceWindow{100};
        std::chrono::milliseconds failsafeTimeout{30000};
        std::chrono::milliseconds maxRecording{120000};
    };

    struct Stats {
        uint64_t acceptedEvents = 0;
        uint64_t debouncedEvents = 0;
        uint64_t ignoredEvents = 0;
        uint64_t sessionsStarted = 0;
        uint64_t dispatches = 0;
        uint64_t staleResults = 0;
        uint64_t failsafeTimeouts = 0;
    };

    SessionCoordinator(AudioCapture& capture, std::shared_ptr<ProcessingPipeline> pipeline, Config config);
    ~SessionCoordinator();

    SessionCoordinator(const SessionCoordinator&) = delete;
    SessionCoordinator& operator=(const SessionCoordinator&) = delete;

    // Observers must be added before start().
    void addObserver(std::shared_ptr<SessionObserver> observer);

    // start() after stop() reopens the queue; events posted while stopped are lost.
    void start();
    void stop();

    void onHotkey(const HotkeyEvent& event);
    void cancel();
    // Types the last delivered text again, as a session of its own. Idle only.
    void repeatLast();

    // Blocks until every message posted before the call has been handled.
    void flush();

    SessionState state() const;
    uint64_t currentSessionId() const;
    bool waitForState(SessionState state, std::chrono::milliseconds timeout) const;
    Stats stats() const;

private:
    struct Message;
    struct Mailbox;

    struct RecordingSession {
        uint64_t id = 0;
        SteadyClock::time_point startedAt{};
        double audioSeconds = 0.0;
    };

    void run();
    void handle(Message& message);

    void onPressed();
    void onReleased();
    void onCancel();
    void onRepeat();
    void onPipelineDone(uint64_t id, const PipelineResult& result, const PipelineTimings& timings);
    void onDeadline();
    void shutdown();

    using Job = std::function<PipelineResult(ProcessingPipeline& pipeline,
                                             const ProcessingPipeline::DeliveryGate& mayDeliver,
                                             PipelineTimings& timings)>;

    void beginSession(uint64_t id);
    void endRecording();
    void enterProcessing();
    void dispatch(Job job);
    void failsafe();

    void arm(std::chrono::milliseconds after);
    void setState(SessionState to, bool forced = false);
    void finish(SessionReport report);
    void notice(uint64_t sessionId, const std::string& message);
    double sinceStartMs() const;

    AudioCapture& capture_;
    std::shared_ptr<ProcessingPipeline> pipeline_;
    Config config_;
    std::vector<std::shared_ptr<SessionObserver>> observers_;

    std::shared_ptr<Mailbox> mailbox_;
    std::thread thread_;
    std::atomic<bool> running_{false};

    // Coordinator thread only
    Debouncer debouncer_;
    uint64_t nextId_ = 0;
    RecordingSession session_;
    std::string lastDelivered_;
    bool deadlineArmed_ = false;
    SteadyClock::time_point deadline_{};

    mutable std::mutex stateMutex_;
    mutable std::condition_variable stateCv_;
    SessionState state_ = SessionState::Idle;
    Stats stats_;
};

#endif
