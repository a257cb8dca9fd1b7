#include "output/typing_sink.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

TEST(TypingSinkTest, ParsesToolNames) {
    EXPECT_EQ(TypingSink::parseTool("wtype"), TypingSink::Tool::Wtype);
    EXPECT_EQ(TypingSink::parseTool("ydotool"), TypingSink::Tool::Ydotool);
    EXPECT_EQ(TypingSink::parseTool("xdotool"), TypingSink::Tool::Xdotool);
    EXPECT_EQ(TypingSink::parseTool("none"), TypingSink::Tool::None);
    EXPECT_THROW(TypingSink::parseTool("keyboard"), std::invalid_argument);
}

TEST(TypingSinkTest, CommandLinesPassTextAfterOptionTerminator) {
    const std::string text = "-rf starts with a dash";

    EXPECT_EQ(TypingSink::commandFor(TypingSink::Tool::Wtype, text),
              (std::vector<std::string>{"wtype", "--", text}));
    EXPECT_EQ(TypingSink::commandFor(TypingSink::Tool::Ydotool, text),
              (std::vector<std::string>{"ydotool", "type", "--", text}));
    EXPECT_EQ(TypingSink::commandFor(TypingSink::Tool::Xdotool, text),
              (std::vector<std::string>{"xdotool", "type", "--clearmodifiers", "--", text}));
    EXPECT_TRUE(TypingSink::commandFor(TypingSink::Tool::None, text).empty());
}

TEST(TypingSinkTest, NoToolMeansSinkUnavailable) {
    TypingSink sink("none");
    EXPECT_EQ(sink.tool(), TypingSink::Tool::None);

    try {
        sink.deliver("hello");
        FAIL() << "expected DeliveryError";
    } catch (const DeliveryError& e) {
        EXPECT_EQ(e.kind(), DeliveryError::Kind::SinkUnavailable);
    }
}

TEST(TypingSinkTest, ForcedToolSkipsDetection) {
    TypingSink sink("xdotool");
    EXPECT_EQ(sink.tool(), TypingSink::Tool::Xdotool);
    EXPECT_STREQ(TypingSink::toString(sink.tool()), "xdotool");
}
