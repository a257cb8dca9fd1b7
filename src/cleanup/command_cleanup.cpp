#include "cleanup/command_cleanup.hpp"
#include "pipeline/text_formatter.hpp"
#include "util/subprocess.hpp"

#include <algorithm>
#include <iostream>
#include <utility>

#include <unistd.h>

static const char* kPrompt =
    "Format this transcription. Output ONLY the formatted text.\n"
    "\n"
    "Rules:\n"
    "- Fix grammar and punctuation\n"
    "- Add quotation marks around dialogue (spoken words)\n"
    "- Remove filler words (um, uh, like, you know)\n"
    "- Keep all meaning and content intact\n"
    "- Output the formatted text only, no explanations\n"
    "\n"
    "Example:\n"
    "Input: he said what are you doing here I said I dont know\n"
    "Output: He said, \"What are you doing here?\" I said, \"I don't know.\"\n"
    "\n"
    "Input: ";

// Constructor. Probes the command and model up front so the first session does not stall.
CommandCleanupEngine::CommandCleanupEngine(Config config) : config_(std::move(config)) {
    if (config_.modelPath.empty()) {
        std::cout << "[Cleanup] No cleanup model configured, using local formatter only" << std::endl;
        return;
    }
    if (::access(config_.modelPath.c_str(), R_OK) != 0) {
        std::cout << "[Cleanup] [WARN] Model not readable: " << config_.modelPath << ", using local formatter" << std::endl;
        return;
    }

    try {
        available_ = commandExists(config_.command);
    } catch (const std::exception& e) {
        std::cerr << "[Cleanup] [ERROR] Probing " << config_.command << " failed: " << e.what() << std::endl;
        available_ = false;
    }

    if (available_) {
        std::cout << "[Cleanup] Using " << config_.command << " with " << config_.modelPath << std::endl;
    } else {
        std::cout << "[Cleanup] [WARN] " << config_.command << " not found, using local formatter" << std::endl;
    }
}

std::string CommandCleanupEngine::buildPrompt(const std::string& transcript) {
    return std::string(kPrompt) + transcript + "\nOutput:";
}

std::vector<std::string> CommandCleanupEngine::buildArgs(const std::string& transcript) const {
    const int budget = std::max(16, std::min((int)text_formatter::wordCount(transcript) * 2, config_.maxTokens));
    return {
        config_.command,
        "-m", config_.modelPath,
        "-p", buildPrompt(transcript),
        "-n", std::to_string(budget),
        "--temp", "0",
        "--no-display-prompt",
        "-no-cnv",
    };
}

std::string CommandCleanupEngine::clean(const std::string& transcript) {
    if (!available_) {
        throw PipelineError(PipelineError::Kind::EngineUnavailable, "cleanup engine not available");
    }

    ProcessResult r;
    try {
        r = runProcess(buildArgs(transcript));
    } catch (const std::runtime_error& e) {
        throw PipelineError(PipelineError::Kind::EngineUnavailable, e.what());
    }

    if (r.exitStatus != 0) {
        throw PipelineError(PipelineError::Kind::EngineUnavailable,
                            config_.command + " exited with status " + std::to_string(r.exitStatus));
    }

    std::string out = r.output;
    const auto end = out.find("[end of text]");
    if (end != std::string::npos) out.erase(end);
    return text_formatter::trim(out);
}
