#include "stt/whisper_stt.hpp"

#include <whisper.h>

#include <algorithm>
#include <cmath>
#include <iostream>
#include <utility>

// Constructor
WhisperSTT::WhisperSTT(Config config) : config_(std::move(config)) {
    whisper_context_params cparams = whisper_context_default_params();
    cparams.use_gpu = config_.useGpu;
    cparams.flash_attn = false;

    context_ = whisper_init_from_file_with_params(config_.modelPath.c_str(), cparams);
    if (!context_) {
        throw PipelineError(PipelineError::Kind::EngineUnavailable,
                            "whisper_init_from_file_with_params failed: " + config_.modelPath);
    }
    std::cout << "[Whisper STT] Model loaded: " << config_.modelPath << std::endl;
}

// Destructor
WhisperSTT::~WhisperSTT() {
    if (context_) whisper_free(context_);
}

// Converts a session's samples into text. One inference at a time per context.
std::string WhisperSTT::transcribe(const SampleBuffer& samples) {
    if (samples.empty()) return {};

    std::lock_guard<std::mutex> lock(mutex_);

    const std::vector<float> resampled =
        samples.sampleRate == WHISPER_SAMPLE_RATE ? std::vector<float>() : resampleTo16k(samples.pcm, samples.sampleRate);
    const std::vector<float>& pcm = samples.sampleRate == WHISPER_SAMPLE_RATE ? samples.pcm : resampled;

    whisper_full_params params = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);

    params.n_threads = config_.threads;
    params.language = config_.language.c_str();
    params.translate = false;

    params.print_progress = false;
    params.print_realtime = false;
    params.print_timestamps = false;
    params.no_timestamps = true;
    params.suppress_blank = true;

    params.no_speech_thold = 0.6f;

    const int rc = whisper_full(context_, params, pcm.data(), (int)pcm.size());
    if (rc != 0) {
        throw PipelineError(PipelineError::Kind::EngineUnavailable, "whisper_full failed (" + std::to_string(rc) + ")");
    }

    std::string out;
    const int n_segments = whisper_full_n_segments(context_);
    for (int i = 0; i < n_segments; ++i) {
        const char* text = whisper_full_get_segment_text(context_, i);
        if (text) out += text;
    }
    return out;
}

// Linear interpolation to whisper's native rate
std::vector<float> WhisperSTT::resampleTo16k(const std::vector<float>& input, int inRate) {
    if (input.empty() || inRate <= 0) return {};

    const double ratio = (double)WHISPER_SAMPLE_RATE / (double)inRate;
    const size_t outLen = (size_t)std::ceil((double)input.size() * ratio);

    std::vector<float> output(outLen);
    for (size_t i = 0; i < outLen; ++i) {
        const double src = (double)i / ratio;
        const size_t i0 = std::min((size_t)src, input.size() - 1);
        const size_t i1 = std::min(i0 + 1, input.size() - 1);
        const double frac = src - (double)i0;
        output[i] = (float)(input[i0] * (1.0 - frac) + input[i1] * frac);
    }
    return output;
}
