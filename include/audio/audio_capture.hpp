#ifndef AUDIO_CAPTURE_HPP
#define AUDIO_CAPTURE_HPP

#include "audio/sample_buffer.hpp"

#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

class CaptureError : public std::runtime_error {
public:
    enum class Kind { DeviceUnavailable, TooShort };

    CaptureError(Kind kind, const std::string& what)
        : std::runtime_error(what), kind_(kind) {}

    Kind kind() const { return kind_; }

private:
    Kind kind_;
};

// One open hardware input stream. Owned exclusively by AudioCapture.
class InputStream {
public:
    virtual ~InputStream() = default;

    // Stops the stream and flushes pending buffers. May throw.
    virtual void stop() = 0;

    // Releases the hardware handle. May throw.
    virtual void close() = 0;

    // Moves out everything captured so far.
    virtual std::vector<float> takeSamples() = 0;
};

class InputDevice {
public:
    struct StreamParams {
        int sampleRate = 16000;
        int channels = 1;
        int framesPerBuffer = 512;
    };

    virtual ~InputDevice() = default;

    // Opens and starts a stream. Throws CaptureError(DeviceUnavailable).
    virtual std::unique_ptr<InputStream> open(const StreamParams& params) = 0;
};

class AudioCapture {
public:
    struct Config {
        int sampleRate = 16000;
        int channels = 1;
        int framesPerBuffer = 512;
        int minRecordingMs = 500;
    };

    AudioCapture(InputDevice& device, Config config);
    ~AudioCapture();

    AudioCapture(const AudioCapture&) = delete;
    AudioCapture& operator=(const AudioCapture&) = delete;

    void start();
    SampleBuffer stop();
    void cancel();

    bool isOpen() const;

private:
    void release(std::unique_ptr<InputStream> stream, bool flush, const char* context);

    InputDevice& device_;
    Config config_;

    mutable std::mutex mutex_;
    std::unique_ptr<InputStream> stream_;
};

#endif
