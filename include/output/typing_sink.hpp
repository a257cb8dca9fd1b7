#ifndef TYPING_SINK_HPP
#define TYPING_SINK_HPP

#include "pipeline/engines.hpp"

#include <string>
#include <vector>

// Types delivered text into the focused window through wtype, ydotool or xdotool.
class TypingSink : public DeliverySink {
public:
    enum class Tool { None, Wtype, Ydotool, Xdotool };

    // "auto" probes the session; anything else forces that tool.
    explicit TypingSink(const std::string& tool = "auto");

    void deliver(const std::string& text) override;

    Tool tool() const { return tool_; }

    static Tool parseTool(const std::string& name);
    static const char* toString(Tool tool);
    static std::vector<std::string> commandFor(Tool tool, const std::string& text);

private:
    static bool isWaylandSession();
    static Tool detect();

    Tool tool_ = Tool::None;
};

#endif
