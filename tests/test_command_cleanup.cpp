#include "cleanup/command_cleanup.hpp"
#include "util/subprocess.hpp"

#include <gtest/gtest.h>

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <sys/stat.h>
#include <unistd.h>

namespace {

// Temporary file removed at scope exit
class TempFile {
public:
    explicit TempFile(const std::string& contents, bool executable = false) {
        char name[] = "/tmp/holdtype_testXXXXXX";
        const int fd = ::mkstemp(name);
        if (fd >= 0) ::close(fd);
        path_ = name;

        std::ofstream out(path_);
        out << contents;
        out.close();
        if (executable) ::chmod(path_.c_str(), 0700);
    }

    ~TempFile() { std::remove(path_.c_str()); }

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

} // namespace

TEST(CommandCleanupTest, PromptEndsWithTranscript) {
    const std::string prompt = CommandCleanupEngine::buildPrompt("hello world");

    EXPECT_NE(prompt.find("Output ONLY the formatted text"), std::string::npos);
    const std::string tail = "Input: hello world\nOutput:";
    ASSERT_GE(prompt.size(), tail.size());
    EXPECT_EQ(prompt.substr(prompt.size() - tail.size()), tail);
}

TEST(CommandCleanupTest, TokenBudgetScalesWithTranscript) {
    CommandCleanupEngine::Config config;
    config.modelPath = "/nonexistent/model.gguf";
    CommandCleanupEngine engine(config);

    std::vector<std::string> args = engine.buildArgs("three short words");
    ASSERT_GE(args.size(), 7u);
    EXPECT_EQ(args[0], "llama-cli");
    EXPECT_EQ(args[1], "-m");
    EXPECT_EQ(args[2], "/nonexistent/model.gguf");
    EXPECT_EQ(args[5], "-n");
    EXPECT_EQ(args[6], "16");

    std::string longText;
    for (int i = 0; i < 150; ++i) longText += "word ";
    args = engine.buildArgs(longText);
    EXPECT_EQ(args[6], "200");
}

TEST(CommandCleanupTest, NoModelMeansUnavailable) {
    CommandCleanupEngine engine(CommandCleanupEngine::Config{});
    EXPECT_FALSE(engine.available());

    try {
        engine.clean("anything");
        FAIL() << "expected PipelineError";
    } catch (const PipelineError& e) {
        EXPECT_EQ(e.kind(), PipelineError::Kind::EngineUnavailable);
    }
}

TEST(CommandCleanupTest, UnreadableModelMeansUnavailable) {
    CommandCleanupEngine::Config config;
    config.command = "sh";
    config.modelPath = "/nonexistent/model.gguf";
    EXPECT_FALSE(CommandCleanupEngine(config).available());
}

TEST(CommandCleanupTest, MissingCommandMeansUnavailable) {
    TempFile model("weights");
    CommandCleanupEngine::Config config;
    config.command = "holdtype-no-such-llm-binary";
    config.modelPath = model.path();
    EXPECT_FALSE(CommandCleanupEngine(config).available());
}

TEST(CommandCleanupTest, RunsCommandAndStripsEndMarker) {
    TempFile model("weights");
    TempFile script("#!/bin/sh\nprintf 'Hello there, world. [end of text]\\n'\n", true);

    CommandCleanupEngine::Config config;
    config.command = script.path();
    config.modelPath = model.path();
    CommandCleanupEngine engine(config);

    ASSERT_TRUE(engine.available());
    EXPECT_EQ(engine.clean("hello there world"), "Hello there, world.");
}

TEST(CommandCleanupTest, NonZeroExitIsEngineUnavailable) {
    TempFile model("weights");
    TempFile script("#!/bin/sh\nexit 3\n", true);

    CommandCleanupEngine::Config config;
    config.command = script.path();
    config.modelPath = model.path();
    CommandCleanupEngine engine(config);

    ASSERT_TRUE(engine.available());
    try {
        engine.clean("hello there world");
        FAIL() << "expected PipelineError";
    } catch (const PipelineError& e) {
        EXPECT_EQ(e.kind(), PipelineError::Kind::EngineUnavailable);
    }
}

TEST(SubprocessTest, CapturesStdoutAndExitStatus) {
    const ProcessResult ok = runProcess({"sh", "-c", "printf hi; exit 0"});
    EXPECT_EQ(ok.exitStatus, 0);
    EXPECT_EQ(ok.output, "hi");

    const ProcessResult failed = runProcess({"sh", "-c", "exit 5"});
    EXPECT_EQ(failed.exitStatus, 5);
}

TEST(SubprocessTest, MissingProgramExitsWith127) {
    EXPECT_EQ(runProcess({"holdtype-no-such-program"}, false).exitStatus, 127);
    EXPECT_THROW(runProcess({}), std::runtime_error);
}

TEST(SubprocessTest, CommandExists) {
    EXPECT_TRUE(commandExists("sh"));
    EXPECT_FALSE(commandExists("holdtype-no-such-program"));
    EXPECT_FALSE(commandExists(""));
}
