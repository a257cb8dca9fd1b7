#ifndef COMMAND_CLEANUP_HPP
#define COMMAND_CLEANUP_HPP

#include "pipeline/engines.hpp"

#include <string>
#include <vector>

// Cleanup engine that runs a local LLM command line (llama.cpp's llama-cli by
// default) once per transcript with the formatting prompt.
class CommandCleanupEngine : public CleanupEngine {
public:
    struct Config {
        std::string command = "llama-cli";
        std::string modelPath;
        int maxTokens = 200;
    };

    explicit CommandCleanupEngine(Config config);

    bool available() const override { return available_; }
    std::string clean(const std::string& transcript) override;

    static std::string buildPrompt(const std::string& transcript);
    std::vector<std::string> buildArgs(const std::string& transcript) const;

private:
    Config config_;
    bool available_ = false;
};

#endif
