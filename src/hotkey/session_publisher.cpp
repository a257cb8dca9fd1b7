#include "hotkey/session_publisher.hpp"

#include <cstdio>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <utility>

static double now() { return (double)std::time(nullptr); }

// Constructor
SessionPublisher::SessionPublisher(HotkeyChannel& channel, std::string eventsIp, uint16_t eventsPort)
    : channel_(channel), eventsIp_(std::move(eventsIp)), eventsPort_(eventsPort) {}

void SessionPublisher::onStateChanged(const StateTransition& t) {
    publish(stateJson(t, now()));
}

void SessionPublisher::onSessionFinished(const SessionReport& report) {
    publish(reportJson(report, now()));
}

void SessionPublisher::onNotice(uint64_t sessionId, const std::string& message) {
    publish(noticeJson(sessionId, message, now()));
}

// Best effort: a UI that is not listening must not hold up the coordinator
void SessionPublisher::publish(const std::string& payload) {
    channel_.sendToActive(payload);

    if (eventsPort_ != 0 && !channel_.sendTo(eventsIp_, eventsPort_, payload)) {
        std::cout << "[Hotkey Channel] [WARN] Could not send event to " << eventsIp_ << ":" << eventsPort_
                  << std::endl;
    }
}

std::string SessionPublisher::stateJson(const StateTransition& t, double ts) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(0)
        << "{\"type\":\"state\""
        << ",\"session\":" << t.sessionId
        << ",\"from\":\"" << toString(t.from) << "\""
        << ",\"to\":\"" << toString(t.to) << "\""
        << ",\"forced\":" << (t.forced ? "true" : "false")
        << ",\"ts\":" << ts << "}";
    return out.str();
}

std::string SessionPublisher::reportJson(const SessionReport& report, double ts) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(3)
        << "{\"type\":\"session_done\""
        << ",\"session\":" << report.sessionId
        << ",\"outcome\":\"" << toString(report.outcome) << "\""
        << ",\"reason\":\"" << toString(report.skipReason) << "\""
        << ",\"text\":\"" << escape(report.text) << "\""
        << ",\"raw\":\"" << escape(report.rawText) << "\""
        << ",\"detail\":\"" << escape(report.detail) << "\""
        << ",\"audio_s\":" << report.audioSeconds
        << ",\"transcribe_ms\":" << report.transcribeMs
        << ",\"cleanup_ms\":" << report.cleanupMs
        << ",\"total_ms\":" << report.totalMs
        << std::setprecision(0)
        << ",\"ts\":" << ts << "}";
    return out.str();
}

std::string SessionPublisher::noticeJson(uint64_t sessionId, const std::string& message, double ts) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(0)
        << "{\"type\":\"notice\""
        << ",\"session\":" << sessionId
        << ",\"message\":\"" << escape(message) << "\""
        << ",\"ts\":" << ts << "}";
    return out.str();
}

std::string SessionPublisher::escape(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if ((unsigned char)c < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", (unsigned)(unsigned char)c);
                    out += buf;
                } else {
                    out += c;
                }
        }
    }
    return out;
}
