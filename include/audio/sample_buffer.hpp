#ifndef SAMPLE_BUFFER_HPP
#define SAMPLE_BUFFER_HPP

#include <cstdint>
#include <vector>

// Mono float PCM in [-1, 1] captured for one session.
struct SampleBuffer {
    std::vector<float> pcm;
    int sampleRate = 16000;

    double seconds() const;
    float rms() const;
    bool empty() const { return pcm.empty(); }
};

void appendInt16(std::vector<float>& out, const int16_t* samples, int frames);

#endif
