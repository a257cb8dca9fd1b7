#include "session/session_types.hpp"

#include <utility>

PipelineResult PipelineResult::delivered(std::string text, std::string rawText) {
    PipelineResult r;
    r.kind = Kind::Delivered;
    r.text = std::move(text);
    r.rawText = std::move(rawText);
    return r;
}

PipelineResult PipelineResult::skipped(SkipReason reason) {
    PipelineResult r;
    r.kind = Kind::Skipped;
    r.skipReason = reason;
    return r;
}

PipelineResult PipelineResult::failed(std::string cause) {
    PipelineResult r;
    r.kind = Kind::Failed;
    r.cause = std::move(cause);
    return r;
}

const char* toString(HotkeyKind kind) {
    switch (kind) {
        case HotkeyKind::Pressed:  return "pressed";
        case HotkeyKind::Released: return "released";
    }
    return "unknown";
}

const char* toString(SessionState state) {
    switch (state) {
        case SessionState::Idle:         return "idle";
        case SessionState::Recording:    return "recording";
        case SessionState::Processing:   return "processing";
        case SessionState::ShuttingDown: return "shutting_down";
    }
    return "unknown";
}

const char* toString(SkipReason reason) {
    switch (reason) {
        case SkipReason::None:       return "none";
        case SkipReason::TooShort:   return "too_short";
        case SkipReason::Empty:      return "empty";
        case SkipReason::Superseded: return "superseded";
    }
    return "unknown";
}

const char* toString(SessionOutcome outcome) {
    switch (outcome) {
        case SessionOutcome::Delivered: return "delivered";
        case SessionOutcome::Skipped:   return "skipped";
        case SessionOutcome::Failed:    return "failed";
        case SessionOutcome::Cancelled: return "cancelled";
        case SessionOutcome::TimedOut:  return "timed_out";
    }
    return "unknown";
}
