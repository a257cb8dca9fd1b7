#include "audio/audio_capture.hpp"
#include "audio/portaudio_device.hpp"
#include "cleanup/command_cleanup.hpp"
#include "config/app_config.hpp"
#include "hotkey/hotkey_channel.hpp"
#include "hotkey/session_publisher.hpp"
#include "output/typing_sink.hpp"
#include "pipeline/processing_pipeline.hpp"
#include "session/session_coordinator.hpp"
#include "session/session_observer.hpp"
#include "stt/whisper_stt.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <thread>

static std::atomic<bool> g_stop{false};

static void onSignal(int) { g_stop = true; }

int main(int argc, char** argv) {
    AppConfig config;
    try {
        config = AppConfig::fromArgs(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << "[Config] [ERROR] " << e.what() << std::endl;
        AppConfig::printUsage(std::cerr, argv[0]);
        return 1;
    }
    if (config.showHelp) {
        AppConfig::printUsage(std::cout, argv[0]);
        return 0;
    }

    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);

    try {
        // Audio backend init
        PortAudioDevice device(config.audio.deviceName);
        PortAudioDevice::listDevices();

        AudioCapture::Config captureConfig;
        captureConfig.sampleRate = config.audio.sampleRate;
        captureConfig.channels = config.audio.channels;
        captureConfig.framesPerBuffer = config.audio.framesPerBuffer;
        captureConfig.minRecordingMs = config.audio.minRecordingMs;
        AudioCapture capture(device, captureConfig);

        // STT model init
        WhisperSTT::Config sttConfig;
        sttConfig.modelPath = config.stt.modelPath;
        sttConfig.threads = config.stt.threads;
        sttConfig.language = config.stt.language;
        auto stt = std::make_shared<WhisperSTT>(sttConfig);

        CommandCleanupEngine::Config cleanupConfig;
        cleanupConfig.command = config.cleanup.command;
        cleanupConfig.modelPath = config.cleanup.modelPath;
        cleanupConfig.maxTokens = config.cleanup.maxTokens;
        auto cleaner = std::make_shared<CommandCleanupEngine>(cleanupConfig);

        auto sink = std::make_shared<TypingSink>(config.output.typingTool);

        ProcessingPipeline::Options options;
        options.cleanupEnabled = config.cleanup.enabled;
        options.cleanupMinWords = static_cast<std::size_t>(config.cleanup.minWords);
        options.silenceRms = config.pipeline.silenceRms;
        auto pipeline = std::make_shared<ProcessingPipeline>(stt, cleaner, sink, options);

        SessionCoordinator::Config sessionConfig;
        sessionConfig.debounceWindow = std::chrono::milliseconds(config.session.debounceMs);
        sessionConfig.failsafeTimeout = std::chrono::milliseconds(config.session.failsafeMs);
        sessionConfig.maxRecording = std::chrono::milliseconds(config.session.maxRecordingMs);
        SessionCoordinator coordinator(capture, pipeline, sessionConfig);

        // HotkeyChannel init
        HotkeyChannel channel(config.hotkey.bindIp, config.hotkey.port,
            [&](HotkeyChannel::Command command, SteadyClock::time_point at, const std::string&, uint16_t) {
            switch (command) {
                case HotkeyChannel::Command::Press:
                    coordinator.onHotkey(HotkeyEvent{HotkeyKind::Pressed, at});
                    break;
                case HotkeyChannel::Command::Release:
                    coordinator.onHotkey(HotkeyEvent{HotkeyKind::Released, at});
                    break;
                case HotkeyChannel::Command::Cancel:
                    coordinator.cancel();
                    break;
                case HotkeyChannel::Command::Repeat:
                    coordinator.repeatLast();
                    break;
                case HotkeyChannel::Command::CleanupOn:
                case HotkeyChannel::Command::CleanupOff:
                    pipeline->setCleanupEnabled(command == HotkeyChannel::Command::CleanupOn);
                    std::cout << "[Hotkey Channel] Cleanup " << (pipeline->cleanupEnabled() ? "enabled" : "disabled")
                              << std::endl;
                    break;
                case HotkeyChannel::Command::Unknown:
                    break;
            }
        });

        coordinator.addObserver(std::make_shared<ConsoleObserver>());
        coordinator.addObserver(std::make_shared<SessionPublisher>(channel, config.events.ip, config.events.port));

        coordinator.start();
        channel.start();

        std::cout << "\nholdtype running... Send SIGINT or SIGTERM to quit." << std::endl;
        while (!g_stop.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        std::cout << "[Session] Shutting down" << std::endl;
        channel.stop();
        coordinator.stop();
    } catch (const std::exception& e) {
        std::cerr << "[holdtype] [ERROR] " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
