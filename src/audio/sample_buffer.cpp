#include "audio/sample_buffer.hpp"

#include <algorithm>
#include <cmath>

double SampleBuffer::seconds() const {
    if (sampleRate <= 0) return 0.0;
    return (double)pcm.size() / (double)sampleRate;
}

float SampleBuffer::rms() const {
    const int n = (int)pcm.size();
    double acc = 0.0;
    for (int i = 0; i < n; ++i) acc += (double)pcm[i] * (double)pcm[i];
    acc /= std::max(1, n);
    return (float)std::sqrt(acc);
}

// Converts int16 frames to float and appends them
void appendInt16(std::vector<float>& out, const int16_t* samples, int frames) {
    out.reserve(out.size() + frames);
    for (int i = 0; i < frames; ++i) out.push_back((float)samples[i] / 32768.0f);
}
