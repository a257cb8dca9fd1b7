#include "pipeline/text_formatter.hpp"

#include <gtest/gtest.h>

#include <string>

using namespace text_formatter;

TEST(TextFormatterTest, CommentaryPreambleIsStripped) {
    EXPECT_EQ(formatTranscript("Here's the cleaned version: hello world"), "Hello world.");
    EXPECT_EQ(formatTranscript("Output: see you tomorrow"), "See you tomorrow.");
    EXPECT_EQ(stripPreamble("- hello"), "hello");
}

TEST(TextFormatterTest, CapitalisesAndTerminates) {
    EXPECT_EQ(formatTranscript("hello world"), "Hello world.");
    EXPECT_EQ(formatTranscript("is this working?"), "Is this working?");
    EXPECT_EQ(formatTranscript("first sentence. second one"), "First sentence. Second one.");
    EXPECT_EQ(formatTranscript("i think i can"), "I think I can.");
}

TEST(TextFormatterTest, TrailingSeparatorBecomesPeriod) {
    EXPECT_EQ(formatTranscript("hello, world,"), "Hello, world.");
}

TEST(TextFormatterTest, FillersAndStuttersAreRemoved) {
    EXPECT_EQ(formatTranscript("um so I I think the the plan is good"), "So I think the plan is good.");
    EXPECT_EQ(formatTranscript("you know, basically it works"), "It works.");
    EXPECT_EQ(collapseRepeats("go go go now"), "go now");
    EXPECT_EQ(collapseRepeats("The the cat sat."), "The cat sat.");
}

TEST(TextFormatterTest, FillerInsideWordIsKept) {
    EXPECT_EQ(formatTranscript("her summer was great"), "Her summer was great.");
}

TEST(TextFormatterTest, LeadingPunctuationAndWhitespaceAreDropped) {
    EXPECT_EQ(formatTranscript("  ,, leading   junk  "), "Leading junk.");
    EXPECT_EQ(formatTranscript("   "), "");
    EXPECT_EQ(formatTranscript(""), "");
}

TEST(TextFormatterTest, WordCountAndTrim) {
    EXPECT_EQ(wordCount("  one two\tthree\n"), 3u);
    EXPECT_EQ(wordCount(""), 0u);
    EXPECT_EQ(trim("\t hi there \n"), "hi there");
}

TEST(TextFormatterTest, CommentaryDetection) {
    EXPECT_TRUE(hasCommentary("hello world", "Here is the text: hello world"));
    EXPECT_TRUE(hasCommentary("hello world", "It seems you said hello world"));
    EXPECT_TRUE(hasCommentary("hello world", "- hello world"));
    EXPECT_FALSE(hasCommentary("hello world", "Hello world."));
}

TEST(TextFormatterTest, PhrasesSpokenByTheUserAreNotCommentary) {
    EXPECT_FALSE(hasCommentary("however you want it", "However you want it."));
    EXPECT_FALSE(hasCommentary("i can do that", "I can do that."));
}

TEST(TextFormatterTest, OutputContract) {
    const std::string input = "this is a reasonably long sentence for testing";

    EXPECT_FALSE(violatesContract(input, "This is a reasonably long sentence for testing."));
    EXPECT_TRUE(violatesContract(input, ""));
    EXPECT_TRUE(violatesContract(input, "ok"));
    EXPECT_TRUE(violatesContract(input, std::string(input.size() * 3 + 41, 'x')));
    EXPECT_TRUE(violatesContract(input, "Here's the formatted text: This is a reasonably long sentence for testing."));
}
