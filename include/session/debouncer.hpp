#ifndef DEBOUNCER_HPP
#define DEBOUNCER_HPP

#include "session/session_types.hpp"

#include <chrono>

// Drops an edge event that arrives within `window` of the last accepted event
// of the same kind. A release is only ever a duplicate of the previous release:
// the first release after an accepted press always passes.
class Debouncer {
public:
    explicit Debouncer(std::chrono::milliseconds window) : window_(window) {}

    bool accept(const HotkeyEvent& event);

private:
    struct Slot {
        bool seen = false;
        SteadyClock::time_point lastAcceptedAt{};

        bool within(SteadyClock::time_point at, std::chrono::milliseconds window) const {
            return seen && at - lastAcceptedAt < window;
        }
    };

    std::chrono::milliseconds window_;
    Slot pressed_;
    Slot released_;
    bool pressOpen_ = false;
};

#endif
