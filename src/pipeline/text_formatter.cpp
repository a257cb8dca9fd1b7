#include "pipeline/text_formatter.hpp"

#include <algorithm>
#include <cctype>
#include <regex>
#include <sstream>
#include <vector>

namespace text_formatter {

static const std::regex::flag_type kIcase = std::regex::ECMAScript | std::regex::icase;

static std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return (char)std::tolower(c); });
    return s;
}

static bool isTerminal(char c) { return c == '.' || c == '!' || c == '?'; }
static bool isClosing(char c) { return c == '"' || c == '\'' || c == ')'; }

std::string trim(const std::string& s) {
    const auto begin = std::find_if_not(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
    const auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    return begin < end ? std::string(begin, end) : std::string();
}

std::size_t wordCount(const std::string& s) {
    std::istringstream in(s);
    std::size_t n = 0;
    std::string w;
    while (in >> w) ++n;
    return n;
}

std::string stripPreamble(const std::string& s) {
    static const std::regex preamble(
        R"(^\s*(here['"]?s|here is|the cleaned|cleaned text|output|result|formatted)\b[^:\n]{0,40}:\s*)", kIcase);
    static const std::regex dash(R"(^\s*-\s*)");

    std::string out = std::regex_replace(s, preamble, "", std::regex_constants::format_first_only);
    out = std::regex_replace(out, dash, "", std::regex_constants::format_first_only);
    return out;
}

std::string removeFillers(const std::string& s) {
    static const std::vector<std::regex> fillers = {
        std::regex(R"(\b(um+|uh+|er+|ah+)\b)", kIcase),
        std::regex(R"(\blike,\s*)", kIcase),
        std::regex(R"(\b(you know,?\s*)+)", kIcase),
        std::regex(R"(\b(basically,?\s*)+)", kIcase),
        std::regex(R"(\b(actually,?\s*)+)", kIcase),
        std::regex(R"(\b(literally,?\s*)+)", kIcase),
        std::regex(R"(\bso,?\s+yeah\b)", kIcase),
        std::regex(R"(\b(I mean,?\s*)+)", kIcase),
        std::regex(R"(\b(kind of|kinda)\s+)", kIcase),
        std::regex(R"(\b(sort of|sorta)\s+)", kIcase),
    };

    std::string out = s;
    for (const auto& re : fillers) out = std::regex_replace(out, re, " ");
    return out;
}

std::string collapseRepeats(const std::string& s) {
    auto isWord = [](const std::string& w) {
        return !w.empty() && std::all_of(w.begin(), w.end(), [](unsigned char c) { return std::isalnum(c) || c == '\''; });
    };

    std::istringstream in(s);
    std::vector<std::string> out;
    std::string token;
    while (in >> token) {
        std::size_t coreLen = token.size();
        while (coreLen > 0 && std::ispunct((unsigned char)token[coreLen - 1]) && token[coreLen - 1] != '\'') --coreLen;
        const std::string core = token.substr(0, coreLen);

        if (!out.empty() && isWord(out.back()) && isWord(core) && lowercase(out.back()) == lowercase(core)) {
            out.back() += token.substr(coreLen);
            continue;
        }
        out.push_back(token);
    }

    std::string joined;
    for (std::size_t i = 0; i < out.size(); ++i) {
        if (i) joined += ' ';
        joined += out[i];
    }
    return joined;
}

std::string formatTranscript(const std::string& s) {
    static const std::regex spaces(R"(\s+)");
    static const std::regex spaceBeforePunct(R"(\s+([,.;:!?]))");
    static const std::regex repeatedSeparators(R"(([,;:])[,;:]+)");
    static const std::regex leadingJunk(R"(^[\s,;:.]+)");
    static const std::regex pronounI(R"(\bi\b)");

    std::string out = stripPreamble(trim(s));
    out = removeFillers(out);
    out = collapseRepeats(out);
    out = std::regex_replace(out, spaces, " ");
    out = std::regex_replace(out, spaceBeforePunct, "$1");
    out = std::regex_replace(out, repeatedSeparators, "$1");
    out = std::regex_replace(out, leadingJunk, "");
    out = trim(out);
    if (out.empty()) return out;

    out = std::regex_replace(out, pronounI, "I");

    // Sentence starts
    bool capitalizeNext = true;
    for (char& c : out) {
        if (capitalizeNext && std::isalpha((unsigned char)c)) {
            c = (char)std::toupper((unsigned char)c);
            capitalizeNext = false;
        } else if (isTerminal(c)) {
            capitalizeNext = true;
        } else if (capitalizeNext && std::isdigit((unsigned char)c)) {
            capitalizeNext = false;
        }
    }

    // Terminal punctuation
    std::size_t last = out.size() - 1;
    while (last > 0 && isClosing(out[last])) --last;
    if (isTerminal(out[last])) return out;
    if (out[last] == ',' || out[last] == ';' || out[last] == ':') {
        out[last] = '.';
        return out;
    }
    out += '.';
    return out;
}

bool hasCommentary(const std::string& input, const std::string& output) {
    static const std::regex prefix(
        R"(^\s*(here['"]?s\b|here is\b|the cleaned\b|cleaned text\b|output\b|result\b|formatted\b|-))", kIcase);
    static const std::vector<std::regex> phrases = {
        std::regex(R"(\bit seems\b)", kIcase),
        std::regex(R"(\bi can\b)", kIcase),
        std::regex(R"(\bthe text\b)", kIcase),
        std::regex(R"(\bhowever\b)", kIcase),
        std::regex(R"(\bhere is\b)", kIcase),
    };

    if (std::regex_search(output, prefix) && !std::regex_search(input, prefix)) return true;
    for (const auto& re : phrases) {
        if (std::regex_search(output, re) && !std::regex_search(input, re)) return true;
    }
    return false;
}

bool violatesContract(const std::string& input, const std::string& output) {
    const std::string in = trim(input);
    const std::string out = trim(output);

    if (out.empty()) return true;
    if (hasCommentary(in, out)) return true;
    if ((double)out.size() < (double)in.size() * 0.3) return true;
    if (out.size() > in.size() * 3 + 40) return true;
    return false;
}

} // namespace text_formatter
