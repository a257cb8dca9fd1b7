#include "audio/audio_capture.hpp"

#include <iostream>
#include <utility>

// Constructor
AudioCapture::AudioCapture(InputDevice& device, Config config)
    : device_(device), config_(config) {}

// Destructor
AudioCapture::~AudioCapture() { cancel(); }

// Opens a fresh input stream, clearing any stream left over from a previous session
void AudioCapture::start() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (stream_) {
        std::cout << "[Audio Capture] [WARN] Stale stream found on start, releasing it first" << std::endl;
        release(std::move(stream_), true, "start");
    }

    InputDevice::StreamParams params;
    params.sampleRate = config_.sampleRate;
    params.channels = config_.channels;
    params.framesPerBuffer = config_.framesPerBuffer;

    stream_ = device_.open(params);
    if (!stream_) {
        throw CaptureError(CaptureError::Kind::DeviceUnavailable, "input device returned no stream");
    }
}

// Flushes and closes the stream, returning the captured samples
SampleBuffer AudioCapture::stop() {
    std::unique_ptr<InputStream> stream;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stream = std::move(stream_);
    }

    if (!stream) {
        throw CaptureError(CaptureError::Kind::TooShort, "no active stream");
    }

    SampleBuffer buffer;
    buffer.sampleRate = config_.sampleRate;

    try {
        stream->stop();
    } catch (const std::exception& e) {
        std::cerr << "[Audio Capture] [ERROR] stop failed: " << e.what() << std::endl;
    }

    try {
        buffer.pcm = stream->takeSamples();
    } catch (const std::exception& e) {
        std::cerr << "[Audio Capture] [ERROR] reading samples failed: " << e.what() << std::endl;
    }
    release(std::move(stream), false, "stop");

    const double ms = buffer.seconds() * 1000.0;
    if (ms < config_.minRecordingMs) {
        throw CaptureError(CaptureError::Kind::TooShort,
                           "recording too short (" + std::to_string((int)ms) + " ms < " +
                           std::to_string(config_.minRecordingMs) + " ms)");
    }
    return buffer;
}

// Closes the stream without retrieving samples. Never throws.
void AudioCapture::cancel() {
    std::unique_ptr<InputStream> stream;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stream = std::move(stream_);
    }
    if (stream) release(std::move(stream), false, "cancel");
}

bool AudioCapture::isOpen() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stream_ != nullptr;
}

// Single close attempt for a stream; errors from a stream in a bad state are logged and dropped
void AudioCapture::release(std::unique_ptr<InputStream> stream, bool flush, const char* context) {
    if (flush) {
        try {
            stream->stop();
        } catch (const std::exception& e) {
            std::cerr << "[Audio Capture] [ERROR] " << context << ": stop failed: " << e.what() << std::endl;
        }
    }
    try {
        stream->close();
    } catch (const std::exception& e) {
        std::cerr << "[Audio Capture] [ERROR] " << context << ": close failed: " << e.what() << std::endl;
    }
}
