#ifndef SESSION_TYPES_HPP
#define SESSION_TYPES_HPP

#include <chrono>
#include <cstdint>
#include <string>

using SteadyClock = std::chrono::steady_clock;

enum class HotkeyKind {
    Pressed,
    Released
};

struct HotkeyEvent {
    HotkeyKind kind = HotkeyKind::Pressed;
    SteadyClock::time_point at{};
};

enum class SessionState {
    Idle,
    Recording,
    Processing,
    ShuttingDown
};

enum class SkipReason {
    None,
    TooShort,
    Empty,
    Superseded
};

enum class SessionOutcome {
    Delivered,
    Skipped,
    Failed,
    Cancelled,
    TimedOut
};

// Terminal result of one pipeline run.
struct PipelineResult {
    enum class Kind { Delivered, Skipped, Failed };

    Kind kind = Kind::Failed;
    std::string text;
    std::string rawText;
    SkipReason skipReason = SkipReason::None;
    std::string cause;

    static PipelineResult delivered(std::string text, std::string rawText);
    static PipelineResult skipped(SkipReason reason);
    static PipelineResult failed(std::string cause);
};

struct PipelineTimings {
    double transcribeMs = 0.0;
    double cleanupMs = 0.0;
    double deliverMs = 0.0;
};

struct StateTransition {
    uint64_t sessionId = 0;
    SessionState from = SessionState::Idle;
    SessionState to = SessionState::Idle;
    bool forced = false;
};

// One entry of the read-only event stream consumed by history/statistics views.
struct SessionReport {
    uint64_t sessionId = 0;
    SessionOutcome outcome = SessionOutcome::Failed;
    SkipReason skipReason = SkipReason::None;
    std::string text;
    std::string rawText;
    std::string detail;
    double audioSeconds = 0.0;
    double transcribeMs = 0.0;
    double cleanupMs = 0.0;
    double totalMs = 0.0;
};

const char* toString(HotkeyKind kind);
const char* toString(SessionState state);
const char* toString(SkipReason reason);
const char* toString(SessionOutcome outcome);

#endif
