#ifndef SESSION_PUBLISHER_HPP
#define SESSION_PUBLISHER_HPP

#include "hotkey/hotkey_channel.hpp"
#include "session/session_observer.hpp"

#include <cstdint>
#include <string>

// Forwards the session event stream as one-line JSON datagrams to the most
// recent hotkey client, and to a fixed UI endpoint when one is configured.
class SessionPublisher : public SessionObserver {
public:
    SessionPublisher(HotkeyChannel& channel, std::string eventsIp = "", uint16_t eventsPort = 0);

    void onStateChanged(const StateTransition& t) override;
    void onSessionFinished(const SessionReport& report) override;
    void onNotice(uint64_t sessionId, const std::string& message) override;

    static std::string stateJson(const StateTransition& t, double ts);
    static std::string reportJson(const SessionReport& report, double ts);
    static std::string noticeJson(uint64_t sessionId, const std::string& message, double ts);

    static std::string escape(const std::string& s);

private:
    void publish(const std::string& payload);

    HotkeyChannel& channel_;
    std::string eventsIp_;
    uint16_t eventsPort_;
};

#endif
