#ifndef SESSION_OBSERVER_HPP
#define SESSION_OBSERVER_HPP

#include "session/session_types.hpp"

#include <string>

// Push-only event stream out of the coordinator. Called on the coordinator's
// thread; implementations must return quickly and must not call back into it.
class SessionObserver {
public:
    virtual ~SessionObserver() = default;

    virtual void onStateChanged(const StateTransition&) {}
    virtual void onSessionFinished(const SessionReport&) {}

    // User-visible notices (microphone errors, failed sessions, timeouts).
    virtual void onNotice(uint64_t, const std::string&) {}
};

// Logs reports and notices to the console.
class ConsoleObserver : public SessionObserver {
public:
    void onStateChanged(const StateTransition& t) override;
    void onSessionFinished(const SessionReport& report) override;
    void onNotice(uint64_t sessionId, const std::string& message) override;
};

#endif
