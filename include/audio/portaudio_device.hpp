#ifndef PORTAUDIO_DEVICE_HPP
#define PORTAUDIO_DEVICE_HPP

#include "audio/audio_capture.hpp"

#include <memory>
#include <string>

// InputDevice backed by PortAudio. Pa_Initialize runs in the constructor so the
// first hotkey press does not pay for backend startup.
class PortAudioDevice : public InputDevice {
public:
    explicit PortAudioDevice(std::string preferredName = "");
    ~PortAudioDevice() override;

    PortAudioDevice(const PortAudioDevice&) = delete;
    PortAudioDevice& operator=(const PortAudioDevice&) = delete;

    std::unique_ptr<InputStream> open(const StreamParams& params) override;

    static void listDevices();

private:
    int findInputDevice() const;

    std::string preferredName_;
};

#endif
