#include "output/typing_sink.hpp"
#include "util/subprocess.hpp"

#include <cstdlib>
#include <cstring>
#include <iostream>
#include <stdexcept>

// Constructor
TypingSink::TypingSink(const std::string& tool) {
    tool_ = parseTool(tool);
    if (tool == "auto") tool_ = detect();

    if (tool_ == Tool::None) {
        std::cout << "[Typing Sink] [WARN] No working typing tool found (need wtype, ydotool, or xdotool)" << std::endl;
    } else {
        std::cout << "[Typing Sink] Delivery will use " << toString(tool_) << std::endl;
    }
}

TypingSink::Tool TypingSink::parseTool(const std::string& name) {
    if (name == "auto" || name == "none") return Tool::None;
    if (name == "wtype") return Tool::Wtype;
    if (name == "ydotool") return Tool::Ydotool;
    if (name == "xdotool") return Tool::Xdotool;
    throw std::invalid_argument("unknown typing tool: " + name);
}

const char* TypingSink::toString(Tool tool) {
    switch (tool) {
        case Tool::None:    return "none";
        case Tool::Wtype:   return "wtype";
        case Tool::Ydotool: return "ydotool";
        case Tool::Xdotool: return "xdotool";
    }
    return "unknown";
}

std::vector<std::string> TypingSink::commandFor(Tool tool, const std::string& text) {
    switch (tool) {
        case Tool::Wtype:   return {"wtype", "--", text};
        case Tool::Ydotool: return {"ydotool", "type", "--", text};
        case Tool::Xdotool: return {"xdotool", "type", "--clearmodifiers", "--", text};
        case Tool::None:    break;
    }
    return {};
}

bool TypingSink::isWaylandSession() {
    const char* type = std::getenv("XDG_SESSION_TYPE");
    if (type && std::strcmp(type, "wayland") == 0) return true;
    return std::getenv("WAYLAND_DISPLAY") != nullptr;
}

// Runs each candidate with empty input; the first that exits cleanly wins
TypingSink::Tool TypingSink::detect() {
    const Tool candidates[] = {Tool::Wtype, Tool::Ydotool, Tool::Xdotool};

    for (Tool t : candidates) {
        if (!isWaylandSession() && t != Tool::Xdotool) continue;
        try {
            if (!commandExists(toString(t))) continue;
            const std::vector<std::string> probe =
                t == Tool::Wtype ? std::vector<std::string>{"wtype", ""} : commandFor(t, "");
            if (runProcess(probe, false).exitStatus == 0) return t;
        } catch (const std::exception& e) {
            std::cerr << "[Typing Sink] [ERROR] Probing " << toString(t) << " failed: " << e.what() << std::endl;
        }
    }
    return Tool::None;
}

void TypingSink::deliver(const std::string& text) {
    if (tool_ == Tool::None) {
        throw DeliveryError(DeliveryError::Kind::SinkUnavailable, "no typing tool available");
    }
    if (text.empty()) return;

    ProcessResult r;
    try {
        r = runProcess(commandFor(tool_, text), false);
    } catch (const std::runtime_error& e) {
        throw DeliveryError(DeliveryError::Kind::SinkUnavailable, e.what());
    }
    if (r.exitStatus != 0) {
        throw DeliveryError(DeliveryError::Kind::SinkUnavailable,
                            std::string(toString(tool_)) + " exited with status " + std::to_string(r.exitStatus));
    }
}
