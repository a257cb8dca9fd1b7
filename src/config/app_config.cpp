#include "config/app_config.hpp"
#include "output/typing_sink.hpp"

#include <cstdlib>
#include <stdexcept>

static int toInt(const std::string& flag, const std::string& value) {
    std::size_t pos = 0;
    int n = 0;
    try {
        n = std::stoi(value, &pos);
    } catch (const std::logic_error&) {
        throw std::invalid_argument(flag + ": not a number: '" + value + "'");
    }
    if (pos != value.size()) throw std::invalid_argument(flag + ": not a number: '" + value + "'");
    return n;
}

static float toFloat(const std::string& flag, const std::string& value) {
    std::size_t pos = 0;
    float f = 0.0f;
    try {
        f = std::stof(value, &pos);
    } catch (const std::logic_error&) {
        throw std::invalid_argument(flag + ": not a number: '" + value + "'");
    }
    if (pos != value.size()) throw std::invalid_argument(flag + ": not a number: '" + value + "'");
    return f;
}

static uint16_t toPort(const std::string& flag, const std::string& value) {
    const int port = toInt(flag, value);
    if (port < 1 || port > 65535) throw std::invalid_argument(flag + ": port out of range: " + value);
    return static_cast<uint16_t>(port);
}

static void parseEndpoint(const std::string& value, std::string& ip, uint16_t& port) {
    const auto colon = value.rfind(':');
    if (colon == std::string::npos || colon == 0) {
        throw std::invalid_argument("--events: expected host:port, got '" + value + "'");
    }
    ip = value.substr(0, colon);
    port = toPort("--events", value.substr(colon + 1));
}

AppConfig AppConfig::parse(const std::vector<std::string>& args, const EnvLookup& env) {
    AppConfig config;

    if (env) {
        if (const char* v = env("HOLDTYPE_MODEL")) {
            if (*v) config.stt.modelPath = v;
        }
        if (const char* v = env("HOLDTYPE_CLEANUP_MODEL")) {
            if (*v) config.cleanup.modelPath = v;
        }
        if (const char* v = env("HOLDTYPE_PORT")) {
            if (*v) config.hotkey.port = toPort("HOLDTYPE_PORT", v);
        }
    }

    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& flag = args[i];

        auto value = [&]() -> const std::string& {
            if (i + 1 >= args.size()) throw std::invalid_argument(flag + ": missing value");
            return args[++i];
        };

        if (flag == "-h" || flag == "--help") {
            config.showHelp = true;
        } else if (flag == "--model") {
            config.stt.modelPath = value();
        } else if (flag == "--threads") {
            config.stt.threads = toInt(flag, value());
        } else if (flag == "--language") {
            config.stt.language = value();
        } else if (flag == "--device") {
            config.audio.deviceName = value();
        } else if (flag == "--min-ms") {
            config.audio.minRecordingMs = toInt(flag, value());
        } else if (flag == "--debounce-ms") {
            config.session.debounceMs = toInt(flag, value());
        } else if (flag == "--failsafe-ms") {
            config.session.failsafeMs = toInt(flag, value());
        } else if (flag == "--max-record-ms") {
            config.session.maxRecordingMs = toInt(flag, value());
        } else if (flag == "--no-cleanup") {
            config.cleanup.enabled = false;
        } else if (flag == "--cleanup-command") {
            config.cleanup.command = value();
        } else if (flag == "--cleanup-model") {
            config.cleanup.modelPath = value();
        } else if (flag == "--typing-tool") {
            config.output.typingTool = value();
        } else if (flag == "--bind") {
            config.hotkey.bindIp = value();
        } else if (flag == "--port") {
            config.hotkey.port = toPort(flag, value());
        } else if (flag == "--events") {
            parseEndpoint(value(), config.events.ip, config.events.port);
        } else if (flag == "--silence-rms") {
            config.pipeline.silenceRms = toFloat(flag, value());
        } else {
            throw std::invalid_argument("unknown option: " + flag);
        }
    }

    config.validate();
    return config;
}

AppConfig AppConfig::fromArgs(int argc, char** argv) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) args.emplace_back(argv[i]);
    return parse(args, [](const char* name) -> const char* { return std::getenv(name); });
}

void AppConfig::validate() const {
    if (stt.modelPath.empty()) throw std::invalid_argument("--model: path is empty");
    if (stt.threads < 1) throw std::invalid_argument("--threads: must be at least 1");
    if (audio.minRecordingMs < 0) throw std::invalid_argument("--min-ms: must not be negative");
    if (session.debounceMs < 0) throw std::invalid_argument("--debounce-ms: must not be negative");
    if (session.failsafeMs <= 0) throw std::invalid_argument("--failsafe-ms: must be positive");
    if (session.maxRecordingMs <= 0) throw std::invalid_argument("--max-record-ms: must be positive");
    if (pipeline.silenceRms < 0.0f) throw std::invalid_argument("--silence-rms: must not be negative");
    if (cleanup.command.empty()) throw std::invalid_argument("--cleanup-command: command is empty");

    // Throws for an unknown tool name
    TypingSink::parseTool(output.typingTool);
}

void AppConfig::printUsage(std::ostream& out, const std::string& program) {
    const AppConfig d;
    out << "Usage: " << program << " [options]\n"
        << "\n"
        << "Push-to-talk dictation daemon. Hold the hotkey to record, release to type.\n"
        << "\n"
        << "  --model PATH           whisper model (default " << d.stt.modelPath << ", env HOLDTYPE_MODEL)\n"
        << "  --threads N            transcription threads (default " << d.stt.threads << ")\n"
        << "  --language CODE        spoken language (default " << d.stt.language << ")\n"
        << "  --device NAME          input device name substring (default: auto)\n"
        << "  --min-ms N             shortest recording kept (default " << d.audio.minRecordingMs << ")\n"
        << "  --debounce-ms N        hotkey debounce window (default " << d.session.debounceMs << ")\n"
        << "  --failsafe-ms N        processing time limit (default " << d.session.failsafeMs << ")\n"
        << "  --max-record-ms N      longest recording (default " << d.session.maxRecordingMs << ")\n"
        << "  --no-cleanup           type the raw transcript\n"
        << "  --cleanup-command CMD  LLM command line (default " << d.cleanup.command << ")\n"
        << "  --cleanup-model PATH   LLM model (env HOLDTYPE_CLEANUP_MODEL, empty: local formatter only)\n"
        << "  --typing-tool TOOL     auto|wtype|ydotool|xdotool (default " << d.output.typingTool << ")\n"
        << "  --bind IP              hotkey channel address (default " << d.hotkey.bindIp << ")\n"
        << "  --port N               hotkey channel port (default " << d.hotkey.port << ", env HOLDTYPE_PORT)\n"
        << "  --events HOST:PORT     also send session events to this endpoint\n"
        << "  --silence-rms X        skip clips quieter than this (default " << d.pipeline.silenceRms << ")\n"
        << "  -h, --help             show this help\n";
}
