#include "session/debouncer.hpp"

bool Debouncer::accept(const HotkeyEvent& event) {
    if (event.kind == HotkeyKind::Pressed) {
        if (pressed_.within(event.at, window_)) return false;
        pressed_.seen = true;
        pressed_.lastAcceptedAt = event.at;
        pressOpen_ = true;
        return true;
    }

    if (!pressOpen_ && released_.within(event.at, window_)) return false;
    released_.seen = true;
    released_.lastAcceptedAt = event.at;
    pressOpen_ = false;
    return true;
}
