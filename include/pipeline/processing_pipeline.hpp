#ifndef PROCESSING_PIPELINE_HPP
#define PROCESSING_PIPELINE_HPP

#include "audio/sample_buffer.hpp"
#include "pipeline/engines.hpp"
#include "session/session_types.hpp"

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>

// transcribe -> cleanup -> deliver. Every stage blocks on an external
// collaborator, so run() is only ever called from a worker thread.
class ProcessingPipeline {
public:
    struct Options {
        bool cleanupEnabled = true;
        std::size_t cleanupMinWords = 5;
        float silenceRms = 0.003f;
    };

    // Asked right before delivery; false means the session was superseded.
    using DeliveryGate = std::function<bool()>;

    ProcessingPipeline(std::shared_ptr<TranscriptionEngine> transcriber,
                       std::shared_ptr<CleanupEngine> cleaner,
                       std::shared_ptr<DeliverySink> sink,
                       Options options);

    std::string transcribe(const SampleBuffer& samples);
    std::string cleanup(const std::string& transcript, bool enabled);
    // Cleanup engine only. Throws PipelineError(EngineUnavailable or Malformed).
    std::string cleanWithEngine(const std::string& transcript);
    void deliver(const std::string& text);

    PipelineResult run(const SampleBuffer& samples, const DeliveryGate& mayDeliver, PipelineTimings& timings);

    // Delivers already formatted text again, behind the same gate as run().
    PipelineResult redeliver(const std::string& text, const DeliveryGate& mayDeliver, PipelineTimings& timings);

    bool cleanupEnabled() const { return cleanupEnabled_.load(); }
    void setCleanupEnabled(bool enabled) { cleanupEnabled_.store(enabled); }

private:
    PipelineResult gatedDeliver(const std::string& text, const std::string& raw,
                                const DeliveryGate& mayDeliver, PipelineTimings& timings);

    std::shared_ptr<TranscriptionEngine> transcriber_;
    std::shared_ptr<CleanupEngine> cleaner_;
    std::shared_ptr<DeliverySink> sink_;
    Options options_;

    std::atomic<bool> cleanupEnabled_;
};

#endif
