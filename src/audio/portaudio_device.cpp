#include "audio/portaudio_device.hpp"

#include <portaudio.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <utility>
#include <vector>

static void pa_check(PaError e, const char* msg) {
    if (e != paNoError) {
        throw std::runtime_error(std::string(msg) + " (" + std::to_string((int)e) + "): " + Pa_GetErrorText(e));
    }
}

static std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return (char)std::tolower(c); });
    return s;
}

static bool isVirtualDevice(const std::string& name) {
    static const char* kVirtual[] = {"blackhole", "soundflower", "loopback", "virtual"};
    const std::string lower = lowercase(name);
    for (const char* v : kVirtual) {
        if (lower.find(v) != std::string::npos) return true;
    }
    return false;
}

namespace {

class PortAudioStream : public InputStream {
public:
    PortAudioStream(int device, const InputDevice::StreamParams& params)
        : channels_(std::max(1, params.channels)) {
        const PaDeviceInfo* info = Pa_GetDeviceInfo(device);

        PaStreamParameters inParams{};
        inParams.device = device;
        inParams.channelCount = channels_;
        inParams.sampleFormat = paInt16;
        inParams.suggestedLatency = info ? info->defaultLowInputLatency : 0.05;
        inParams.hostApiSpecificStreamInfo = nullptr;

        pa_check(
            Pa_OpenStream(&stream_, &inParams, nullptr,
                          params.sampleRate, params.framesPerBuffer,
                          paNoFlag, &PortAudioStream::callback, this),
            "Pa_OpenStream"
        );

        const PaError e = Pa_StartStream(stream_);
        if (e != paNoError) {
            abandon();
            pa_check(e, "Pa_StartStream");
        }
    }

    ~PortAudioStream() override { abandon(); }

    void stop() override {
        if (!stream_) return;
        pa_check(Pa_StopStream(stream_), "Pa_StopStream");

        const unsigned long overflows = overflows_.exchange(0);
        if (overflows > 0) {
            std::cout << "[PortAudio] [WARN] Input overflowed " << overflows << " time(s)" << std::endl;
        }
    }

    void close() override {
        if (!stream_) return;
        PaStream* s = stream_;
        stream_ = nullptr;
        pa_check(Pa_CloseStream(s), "Pa_CloseStream");
    }

    std::vector<float> takeSamples() override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<float> out;
        out.swap(samples_);
        return out;
    }

private:
    static int callback(const void* input, void*, unsigned long frames,
                        const PaStreamCallbackTimeInfo*, PaStreamCallbackFlags status, void* userData) {
        auto* self = static_cast<PortAudioStream*>(userData);
        // Real-time thread: count only, reported from stop()
        if (status & paInputOverflow) ++self->overflows_;
        if (!input) return paContinue;

        const int16_t* in = static_cast<const int16_t*>(input);
        std::lock_guard<std::mutex> lock(self->mutex_);
        if (self->channels_ == 1) {
            appendInt16(self->samples_, in, (int)frames);
        } else {
            for (unsigned long i = 0; i < frames; ++i) {
                int acc = 0;
                for (int c = 0; c < self->channels_; ++c) acc += in[i * self->channels_ + c];
                self->samples_.push_back((float)acc / (32768.0f * self->channels_));
            }
        }
        return paContinue;
    }

    // Hardware-level cleanup for a stream that was never closed cleanly
    void abandon() {
        if (!stream_) return;
        PaStream* s = stream_;
        stream_ = nullptr;
        PaError e = Pa_AbortStream(s);
        if (e != paNoError && e != paStreamIsStopped) {
            std::cerr << "[PortAudio] [ERROR] Pa_AbortStream: " << Pa_GetErrorText(e) << std::endl;
        }
        e = Pa_CloseStream(s);
        if (e != paNoError) {
            std::cerr << "[PortAudio] [ERROR] Pa_CloseStream: " << Pa_GetErrorText(e) << std::endl;
        }
    }

    PaStream* stream_ = nullptr;
    int channels_;
    std::atomic<unsigned long> overflows_{0};

    std::mutex mutex_;
    std::vector<float> samples_;
};

} // namespace

// Constructor
PortAudioDevice::PortAudioDevice(std::string preferredName)
    : preferredName_(std::move(preferredName)) {
    pa_check(Pa_Initialize(), "Pa_Initialize");
}

// Destructor
PortAudioDevice::~PortAudioDevice() {
    const PaError e = Pa_Terminate();
    if (e != paNoError) {
        std::cerr << "[PortAudio] [ERROR] Pa_Terminate: " << Pa_GetErrorText(e) << std::endl;
    }
}

// Picks the configured device, else the first real microphone, else the default input
int PortAudioDevice::findInputDevice() const {
    const int count = Pa_GetDeviceCount();
    int firstReal = paNoDevice;

    for (int i = 0; i < count; ++i) {
        const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
        if (!info || info->maxInputChannels < 1) continue;

        const std::string name = info->name ? info->name : "";
        if (!preferredName_.empty() && lowercase(name).find(lowercase(preferredName_)) != std::string::npos) {
            return i;
        }
        if (firstReal == paNoDevice && !isVirtualDevice(name)) firstReal = i;
    }

    if (!preferredName_.empty()) {
        std::cout << "[PortAudio] [WARN] No input device matches \"" << preferredName_ << "\"" << std::endl;
    }

    const int def = Pa_GetDefaultInputDevice();
    if (def != paNoDevice) {
        const PaDeviceInfo* info = Pa_GetDeviceInfo(def);
        if (info && info->maxInputChannels > 0 && !isVirtualDevice(info->name ? info->name : "")) return def;
    }
    if (firstReal != paNoDevice) return firstReal;
    return def;
}

std::unique_ptr<InputStream> PortAudioDevice::open(const StreamParams& params) {
    const int device = findInputDevice();
    if (device == paNoDevice) {
        throw CaptureError(CaptureError::Kind::DeviceUnavailable, "No default input device");
    }

    try {
        return std::make_unique<PortAudioStream>(device, params);
    } catch (const CaptureError&) {
        throw;
    } catch (const std::runtime_error& e) {
        throw CaptureError(CaptureError::Kind::DeviceUnavailable, e.what());
    }
}

void PortAudioDevice::listDevices() {
    const int count = Pa_GetDeviceCount();
    for (int i = 0; i < count; ++i) {
        const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
        if (!info || info->maxInputChannels < 1) continue;
        std::cout << "[PortAudio] Input device " << i << ": " << (info->name ? info->name : "(unknown)")
                  << " (" << info->maxInputChannels << " ch, " << info->defaultSampleRate << " Hz)"
                  << (isVirtualDevice(info->name ? info->name : "") ? " [virtual]" : "") << std::endl;
    }
}
