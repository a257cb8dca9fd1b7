#include "session/session_coordinator.hpp"

#include <deque>
#include <future>
#include <iostream>
#include <system_error>
#include <utility>

struct SessionCoordinator::Message {
    enum class Type { Hotkey, Cancel, Repeat, PipelineDone, Barrier, Stop };

    Type type = Type::Barrier;
    HotkeyEvent event;
    uint64_t sessionId = 0;
    PipelineResult result;
    PipelineTimings timings;
    std::shared_ptr<std::promise<void>> barrier;
};

// Shared with detached pipeline workers, so it may outlive the coordinator.
struct SessionCoordinator::Mailbox {
    std::mutex mutex;
    std::condition_variable cv;
    std::deque<Message> queue;
    bool closed = false;

    // Session whose pipeline may still deliver; 0 when none.
    uint64_t deliverable = 0;

    bool post(Message message) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (closed) return false;
            queue.push_back(std::move(message));
        }
        cv.notify_one();
        return true;
    }

    // Grants delivery at most once, and only to the still-current session
    bool claimDelivery(uint64_t id) {
        std::lock_guard<std::mutex> lock(mutex);
        if (closed || deliverable != id) return false;
        deliverable = 0;
        return true;
    }

    void setDeliverable(uint64_t id) {
        std::lock_guard<std::mutex> lock(mutex);
        deliverable = id;
    }

    // Workers of an earlier run still hold this mailbox; their ids are never deliverable again
    void reopen() {
        std::lock_guard<std::mutex> lock(mutex);
        closed = false;
        deliverable = 0;
    }

    void close() {
        std::deque<Message> pending;
        {
            std::lock_guard<std::mutex> lock(mutex);
            closed = true;
            deliverable = 0;
            pending.swap(queue);
        }
        for (auto& m : pending) {
            if (m.barrier) m.barrier->set_value();
        }
    }
};

static SessionOutcome outcomeOf(const PipelineResult& result) {
    switch (result.kind) {
        case PipelineResult::Kind::Delivered: return SessionOutcome::Delivered;
        case PipelineResult::Kind::Skipped:   return SessionOutcome::Skipped;
        case PipelineResult::Kind::Failed:    return SessionOutcome::Failed;
    }
    return SessionOutcome::Failed;
}

// Constructor
SessionCoordinator::SessionCoordinator(AudioCapture& capture, std::shared_ptr<ProcessingPipeline> pipeline,
                                       Config config)
    : capture_(capture),
      pipeline_(std::move(pipeline)),
      config_(config),
      mailbox_(std::make_shared<Mailbox>()),
      debouncer_(config.debounceWindow) {}

// Destructor
SessionCoordinator::~SessionCoordinator() { stop(); }

void SessionCoordinator::addObserver(std::shared_ptr<SessionObserver> observer) {
    if (observer) observers_.push_back(std::move(observer));
}

// Starts the coordinator thread
void SessionCoordinator::start() {
    if (running_.exchange(true)) return;
    mailbox_->reopen();
    thread_ = std::thread(&SessionCoordinator::run, this);
}

// Stops the coordinator thread, cancelling any live session
void SessionCoordinator::stop() {
    if (!running_.exchange(false)) return;

    Message m;
    m.type = Message::Type::Stop;
    {
        std::lock_guard<std::mutex> lock(mailbox_->mutex);
        mailbox_->queue.push_back(std::move(m));
    }
    mailbox_->cv.notify_one();

    if (thread_.joinable()) thread_.join();
}

void SessionCoordinator::onHotkey(const HotkeyEvent& event) {
    Message m;
    m.type = Message::Type::Hotkey;
    m.event = event;
    if (!mailbox_->post(std::move(m))) {
        std::cout << "[Session] [WARN] Coordinator stopped, dropping hotkey " << toString(event.kind) << std::endl;
    }
}

void SessionCoordinator::cancel() {
    Message m;
    m.type = Message::Type::Cancel;
    mailbox_->post(std::move(m));
}

void SessionCoordinator::repeatLast() {
    Message m;
    m.type = Message::Type::Repeat;
    mailbox_->post(std::move(m));
}

void SessionCoordinator::flush() {
    if (!running_.load()) return;

    Message m;
    m.type = Message::Type::Barrier;
    m.barrier = std::make_shared<std::promise<void>>();
    std::future<void> done = m.barrier->get_future();
    if (!mailbox_->post(std::move(m))) return;
    done.wait();
}

SessionState SessionCoordinator::state() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return state_;
}

uint64_t SessionCoordinator::currentSessionId() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return state_ == SessionState::Idle ? 0 : session_.id;
}

bool SessionCoordinator::waitForState(SessionState state, std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(stateMutex_);
    return stateCv_.wait_for(lock, timeout, [&] { return state_ == state; });
}

SessionCoordinator::Stats SessionCoordinator::stats() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return stats_;
}

// Coordinator thread: handles queued messages in order, and deadlines when the queue is empty
void SessionCoordinator::run() {
    while (true) {
        Message m;
        bool deadlineHit = false;
        {
            std::unique_lock<std::mutex> lock(mailbox_->mutex);
            while (mailbox_->queue.empty()) {
                if (!deadlineArmed_) {
                    mailbox_->cv.wait(lock);
                } else if (mailbox_->cv.wait_until(lock, deadline_) == std::cv_status::timeout) {
                    deadlineHit = mailbox_->queue.empty();
                    break;
                }
            }
            if (!deadlineHit) {
                m = std::move(mailbox_->queue.front());
                mailbox_->queue.pop_front();
            }
        }

        if (deadlineHit) {
            onDeadline();
            continue;
        }
        if (m.type == Message::Type::Stop) {
            shutdown();
            return;
        }
        handle(m);
    }
}

void SessionCoordinator::handle(Message& m) {
    switch (m.type) {
        case Message::Type::Hotkey:
            if (!debouncer_.accept(m.event)) {
                std::lock_guard<std::mutex> lock(stateMutex_);
                ++stats_.debouncedEvents;
                return;
            }
            {
                std::lock_guard<std::mutex> lock(stateMutex_);
                ++stats_.acceptedEvents;
            }
            if (m.event.kind == HotkeyKind::Pressed) {
                onPressed();
            } else {
                onReleased();
            }
            break;
        case Message::Type::Cancel:
            onCancel();
            break;
        case Message::Type::Repeat:
            onRepeat();
            break;
        case Message::Type::PipelineDone:
            onPipelineDone(m.sessionId, m.result, m.timings);
            break;
        case Message::Type::Barrier:
            if (m.barrier) m.barrier->set_value();
            break;
        case Message::Type::Stop:
            break;
    }
}

// Idle --Pressed--> Recording
void SessionCoordinator::onPressed() {
    if (state_ != SessionState::Idle) {
        {
            std::lock_guard<std::mutex> lock(stateMutex_);
            ++stats_.ignoredEvents;
        }
        if (state_ == SessionState::Recording) {
            std::cout << "[Session] [WARN] Already recording, ignoring" << std::endl;
        } else {
            std::cout << "[Session] [WARN] Still processing previous recording, ignoring" << std::endl;
        }
        return;
    }

    const uint64_t id = ++nextId_;
    bool started = false;
    std::string error;
    try {
        capture_.start();
        started = true;
    } catch (const CaptureError& e) {
        error = e.what();
    } catch (const std::exception& e) {
        error = e.what();
        capture_.cancel();
    }

    if (!started) {
        std::cerr << "[Session] [ERROR] Error starting recording: " << error << std::endl;
        SessionReport report;
        report.sessionId = id;
        report.outcome = SessionOutcome::Failed;
        report.detail = "microphone unavailable: " + error;
        notice(id, "Microphone error: " + error);
        finish(report);
        return;
    }

    beginSession(id);
    setState(SessionState::Recording);
    arm(config_.maxRecording);
}

// Idle --repeat--> Processing, with the last delivered text in place of a recording
void SessionCoordinator::onRepeat() {
    if (state_ != SessionState::Idle) {
        std::cout << "[Session] [WARN] Busy, ignoring repeat" << std::endl;
        std::lock_guard<std::mutex> lock(stateMutex_);
        ++stats_.ignoredEvents;
        return;
    }
    if (lastDelivered_.empty()) {
        notice(0, "Nothing to repeat yet");
        return;
    }

    beginSession(++nextId_);
    std::cout << "[Session] Repeating last transcription" << std::endl;
    enterProcessing();

    const std::string text = lastDelivered_;
    dispatch([text](ProcessingPipeline& pipeline, const ProcessingPipeline::DeliveryGate& mayDeliver,
                    PipelineTimings& timings) { return pipeline.redeliver(text, mayDeliver, timings); });
}

void SessionCoordinator::beginSession(uint64_t id) {
    std::lock_guard<std::mutex> lock(stateMutex_);
    ++stats_.sessionsStarted;
    session_ = RecordingSession();
    session_.id = id;
    session_.startedAt = SteadyClock::now();
}

// Recording --Released--> Processing (or Idle when too short)
void SessionCoordinator::onReleased() {
    if (state_ != SessionState::Recording) {
        std::lock_guard<std::mutex> lock(stateMutex_);
        ++stats_.ignoredEvents;
        return;
    }
    endRecording();
}

void SessionCoordinator::onCancel() {
    if (state_ != SessionState::Recording) {
        std::cout << "[Session] Nothing to cancel in state " << toString(state_) << std::endl;
        return;
    }

    deadlineArmed_ = false;
    capture_.cancel();

    SessionReport report;
    report.sessionId = session_.id;
    report.outcome = SessionOutcome::Cancelled;
    report.totalMs = sinceStartMs();
    setState(SessionState::Idle);
    finish(report);
}

void SessionCoordinator::endRecording() {
    deadlineArmed_ = false;

    SampleBuffer samples;
    try {
        samples = capture_.stop();
    } catch (const CaptureError& e) {
        std::cout << "[Session] Recording discarded: " << e.what() << std::endl;
        SessionReport report;
        report.sessionId = session_.id;
        report.outcome = SessionOutcome::Skipped;
        report.skipReason = SkipReason::TooShort;
        report.totalMs = sinceStartMs();
        setState(SessionState::Idle);
        finish(report);
        return;
    }

    session_.audioSeconds = samples.seconds();
    std::cout << "[Session] Recorded " << session_.audioSeconds << "s" << std::endl;

    enterProcessing();
    dispatch([samples = std::move(samples)](ProcessingPipeline& pipeline,
                                            const ProcessingPipeline::DeliveryGate& mayDeliver,
                                            PipelineTimings& timings) { return pipeline.run(samples, mayDeliver, timings); });
}

void SessionCoordinator::enterProcessing() {
    mailbox_->setDeliverable(session_.id);
    setState(SessionState::Processing);
    arm(config_.failsafeTimeout);
}

// Runs the job on a detached worker; its result comes back as a message
void SessionCoordinator::dispatch(Job job) {
    std::shared_ptr<Mailbox> mailbox = mailbox_;
    std::shared_ptr<ProcessingPipeline> pipeline = pipeline_;
    const uint64_t id = session_.id;

    try {
        std::thread([mailbox, pipeline, id, job = std::move(job)]() {
            Message m;
            m.type = Message::Type::PipelineDone;
            m.sessionId = id;
            try {
                m.result = job(*pipeline, [mailbox, id] { return mailbox->claimDelivery(id); }, m.timings);
            } catch (const std::exception& e) {
                std::cerr << "[Session] [ERROR] Pipeline threw: " << e.what() << std::endl;
                m.result = PipelineResult::failed(e.what());
            }
            mailbox->post(std::move(m));
        }).detach();
    } catch (const std::system_error& e) {
        std::cerr << "[Session] [ERROR] Could not start pipeline worker: " << e.what() << std::endl;
        Message m;
        m.type = Message::Type::PipelineDone;
        m.sessionId = id;
        m.result = PipelineResult::failed(std::string("worker unavailable: ") + e.what());
        mailbox_->post(std::move(m));
        return;
    }

    std::lock_guard<std::mutex> lock(stateMutex_);
    ++stats_.dispatches;
}

// Processing --result--> Idle. Results for any other session are dropped.
void SessionCoordinator::onPipelineDone(uint64_t id, const PipelineResult& result, const PipelineTimings& timings) {
    if (state_ != SessionState::Processing || id != session_.id) {
        std::cout << "[Session] [WARN] Discarding stale result for session #" << id << std::endl;
        std::lock_guard<std::mutex> lock(stateMutex_);
        ++stats_.staleResults;
        return;
    }

    deadlineArmed_ = false;
    mailbox_->setDeliverable(0);

    SessionReport report;
    report.sessionId = id;
    report.outcome = outcomeOf(result);
    report.skipReason = result.skipReason;
    report.text = result.text;
    report.rawText = result.rawText;
    report.detail = result.cause;
    report.audioSeconds = session_.audioSeconds;
    report.transcribeMs = timings.transcribeMs;
    report.cleanupMs = timings.cleanupMs;
    report.totalMs = sinceStartMs();

    if (report.outcome == SessionOutcome::Delivered) lastDelivered_ = result.text;

    setState(SessionState::Idle);
    if (report.outcome == SessionOutcome::Failed) notice(id, "Session failed: " + result.cause);
    finish(report);
}

void SessionCoordinator::onDeadline() {
    deadlineArmed_ = false;
    if (state_ == SessionState::Recording) {
        std::cout << "[Session] Max recording time reached" << std::endl;
        endRecording();
    } else if (state_ == SessionState::Processing) {
        failsafe();
    }
}

// Processing --deadline--> ShuttingDown(forced) --> Idle. The worker keeps running detached.
void SessionCoordinator::failsafe() {
    std::cout << "[Session] [WARN] Failsafe triggered - forcing cleanup after "
              << config_.failsafeTimeout.count() << "ms" << std::endl;

    mailbox_->setDeliverable(0);
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        ++stats_.failsafeTimeouts;
    }
    setState(SessionState::ShuttingDown, true);

    SessionReport report;
    report.sessionId = session_.id;
    report.outcome = SessionOutcome::TimedOut;
    report.audioSeconds = session_.audioSeconds;
    report.detail = "processing exceeded " + std::to_string(config_.failsafeTimeout.count()) + "ms";
    report.totalMs = sinceStartMs();

    setState(SessionState::Idle);
    notice(report.sessionId, "Took too long, ready again");
    finish(report);
}

void SessionCoordinator::shutdown() {
    deadlineArmed_ = false;

    if (state_ == SessionState::Recording || state_ == SessionState::Processing) {
        const bool recording = state_ == SessionState::Recording;
        mailbox_->setDeliverable(0);
        setState(SessionState::ShuttingDown, false);
        if (recording) capture_.cancel();

        SessionReport report;
        report.sessionId = session_.id;
        report.outcome = SessionOutcome::Cancelled;
        report.audioSeconds = session_.audioSeconds;
        report.detail = "coordinator stopped";
        report.totalMs = sinceStartMs();
        setState(SessionState::Idle);
        finish(report);
    }

    mailbox_->close();
}

void SessionCoordinator::arm(std::chrono::milliseconds after) {
    deadlineArmed_ = true;
    deadline_ = SteadyClock::now() + after;
}

void SessionCoordinator::setState(SessionState to, bool forced) {
    StateTransition t;
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        t.sessionId = session_.id;
        t.from = state_;
        t.to = to;
        t.forced = forced;
        state_ = to;
    }
    stateCv_.notify_all();

    for (auto& o : observers_) o->onStateChanged(t);
}

void SessionCoordinator::finish(SessionReport report) {
    for (auto& o : observers_) o->onSessionFinished(report);
}

void SessionCoordinator::notice(uint64_t sessionId, const std::string& message) {
    for (auto& o : observers_) o->onNotice(sessionId, message);
}

double SessionCoordinator::sinceStartMs() const {
    return std::chrono::duration<double, std::milli>(SteadyClock::now() - session_.startedAt).count();
}
