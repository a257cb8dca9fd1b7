#ifndef TEXT_FORMATTER_HPP
#define TEXT_FORMATTER_HPP

#include <cstddef>
#include <string>

// Deterministic local formatting used when the cleanup engine is disabled,
// unavailable, or breaks its output contract.
namespace text_formatter {

std::string trim(const std::string& s);
std::size_t wordCount(const std::string& s);

// Drops a leading "Here's the cleaned version:"-style preamble and leading dash.
std::string stripPreamble(const std::string& s);

std::string removeFillers(const std::string& s);

// Collapses immediate word repetitions ("the the" -> "the").
std::string collapseRepeats(const std::string& s);

// Capitalisation and basic punctuation.
std::string formatTranscript(const std::string& s);

// True when the engine output contains commentary instead of just the text.
// Phrases already present in the input do not count.
bool hasCommentary(const std::string& input, const std::string& output);

bool violatesContract(const std::string& input, const std::string& output);

} // namespace text_formatter

#endif
