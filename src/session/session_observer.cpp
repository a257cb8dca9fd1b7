#include "session/session_observer.hpp"

#include <iomanip>
#include <iostream>
#include <sstream>

void ConsoleObserver::onStateChanged(const StateTransition& t) {
    std::cout << "[Session] #" << t.sessionId << " " << toString(t.from) << " -> " << toString(t.to)
              << (t.forced ? " (forced)" : "") << std::endl;
}

void ConsoleObserver::onSessionFinished(const SessionReport& report) {
    std::ostringstream line;
    line << std::fixed << std::setprecision(2)
         << "[Session] #" << report.sessionId << " " << toString(report.outcome);
    if (report.outcome == SessionOutcome::Skipped) line << " (" << toString(report.skipReason) << ")";
    line << " audio=" << report.audioSeconds << "s"
         << " transcribe=" << report.transcribeMs << "ms"
         << " cleanup=" << report.cleanupMs << "ms"
         << " total=" << report.totalMs << "ms";
    if (!report.detail.empty()) line << " : " << report.detail;

    if (report.outcome == SessionOutcome::Failed) {
        std::cerr << line.str() << std::endl;
    } else {
        std::cout << line.str() << std::endl;
    }
}

void ConsoleObserver::onNotice(uint64_t sessionId, const std::string& message) {
    std::cout << "[Session] [NOTICE] #" << sessionId << " " << message << std::endl;
}
