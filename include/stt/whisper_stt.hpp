#ifndef WHISPER_STT_HPP
#define WHISPER_STT_HPP

#include "pipeline/engines.hpp"

#include <mutex>
#include <string>
#include <vector>

struct whisper_context;

class WhisperSTT : public TranscriptionEngine {
public:
    struct Config {
        std::string modelPath = "models/whisper/ggml-base.en-q5_1.bin";
        int threads = 4;
        std::string language = "en";
        bool useGpu = false;
    };

    explicit WhisperSTT(Config config);
    ~WhisperSTT() override;

    WhisperSTT(const WhisperSTT&) = delete;
    WhisperSTT& operator=(const WhisperSTT&) = delete;

    std::string transcribe(const SampleBuffer& samples) override;

private:
    static std::vector<float> resampleTo16k(const std::vector<float>& input, int inRate);

    Config config_;
    whisper_context* context_ = nullptr;
    std::mutex mutex_;
};

#endif
