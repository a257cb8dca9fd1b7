#ifndef APP_CONFIG_HPP
#define APP_CONFIG_HPP

#include <cstdint>
#include <functional>
#include <ostream>
#include <string>
#include <vector>

// Daemon configuration. Precedence: defaults < environment < command line.
struct AppConfig {
    struct Audio {
        int sampleRate = 16000;
        int channels = 1;
        int framesPerBuffer = 512;
        int minRecordingMs = 500;
        std::string deviceName;     // substring match, empty = auto
    };

    struct Session {
        int debounceMs = 100;
        int failsafeMs = 30000;
        int maxRecordingMs = 120000;
    };

    struct Stt {
        std::string modelPath = "models/whisper/ggml-base.en-q5_1.bin";
        int threads = 4;
        std::string language = "en";
    };

    struct Cleanup {
        bool enabled = true;
        std::string command = "llama-cli";
        std::string modelPath;      // empty = local formatter only
        int minWords = 5;
        int maxTokens = 200;
    };

    struct Output {
        std::string typingTool = "auto";
    };

    struct Pipeline {
        float silenceRms = 0.003f;
    };

    struct Hotkey {
        std::string bindIp = "127.0.0.1";
        int port = 3939;
    };

    struct Events {
        std::string ip;
        uint16_t port = 0;          // 0 = reply to the active hotkey client only
    };

    Audio audio;
    Session session;
    Stt stt;
    Cleanup cleanup;
    Output output;
    Pipeline pipeline;
    Hotkey hotkey;
    Events events;

    bool showHelp = false;

    using EnvLookup = std::function<const char*(const char*)>;

    // args excludes the program name. Throws std::invalid_argument.
    static AppConfig parse(const std::vector<std::string>& args, const EnvLookup& env);
    static AppConfig fromArgs(int argc, char** argv);

    static void printUsage(std::ostream& out, const std::string& program);

    void validate() const;
};

#endif
