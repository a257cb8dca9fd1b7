#include "pipeline/processing_pipeline.hpp"
#include "pipeline/text_formatter.hpp"

#include <chrono>
#include <iostream>
#include <utility>

static double elapsedMs(SteadyClock::time_point since) {
    return std::chrono::duration<double, std::milli>(SteadyClock::now() - since).count();
}

// Constructor
ProcessingPipeline::ProcessingPipeline(std::shared_ptr<TranscriptionEngine> transcriber,
                                       std::shared_ptr<CleanupEngine> cleaner,
                                       std::shared_ptr<DeliverySink> sink,
                                       Options options)
    : transcriber_(std::move(transcriber)),
      cleaner_(std::move(cleaner)),
      sink_(std::move(sink)),
      options_(options),
      cleanupEnabled_(options.cleanupEnabled) {}

std::string ProcessingPipeline::transcribe(const SampleBuffer& samples) {
    if (!transcriber_) {
        throw PipelineError(PipelineError::Kind::EngineUnavailable, "no transcription engine");
    }

    std::string text;
    try {
        text = transcriber_->transcribe(samples);
    } catch (const PipelineError&) {
        throw;
    } catch (const std::exception& e) {
        throw PipelineError(PipelineError::Kind::EngineUnavailable, e.what());
    }

    text = text_formatter::trim(text);
    if (text.empty()) throw PipelineError(PipelineError::Kind::Empty, "no speech detected");
    return text;
}

// Never fails outwardly: engine trouble falls back to the local formatter
std::string ProcessingPipeline::cleanup(const std::string& transcript, bool enabled) {
    const std::string in = text_formatter::trim(transcript);
    if (!enabled) return in;

    if (text_formatter::wordCount(in) < options_.cleanupMinWords || !cleaner_ || !cleaner_->available()) {
        return text_formatter::formatTranscript(in);
    }

    try {
        return cleanWithEngine(in);
    } catch (const PipelineError& e) {
        std::cout << "[Cleanup] [WARN] " << e.what() << ", using local formatter" << std::endl;
        return text_formatter::formatTranscript(in);
    }
}

std::string ProcessingPipeline::cleanWithEngine(const std::string& transcript) {
    if (!cleaner_) throw PipelineError(PipelineError::Kind::EngineUnavailable, "no cleanup engine");

    std::string out;
    try {
        out = cleaner_->clean(transcript);
    } catch (const PipelineError&) {
        throw;
    } catch (const std::exception& e) {
        throw PipelineError(PipelineError::Kind::EngineUnavailable, e.what());
    }

    if (text_formatter::violatesContract(transcript, out)) {
        throw PipelineError(PipelineError::Kind::Malformed, "engine output is not a plain transcript");
    }
    return text_formatter::trim(out);
}

void ProcessingPipeline::deliver(const std::string& text) {
    if (!sink_) throw DeliveryError(DeliveryError::Kind::SinkUnavailable, "no delivery sink");
    sink_->deliver(text);
}

PipelineResult ProcessingPipeline::run(const SampleBuffer& samples, const DeliveryGate& mayDeliver,
                                       PipelineTimings& timings) {
    if (samples.rms() < options_.silenceRms) {
        std::cout << "[Pipeline] Clip is silent (rms " << samples.rms() << "), skipping transcription" << std::endl;
        return PipelineResult::skipped(SkipReason::Empty);
    }

    std::string raw;
    auto t = SteadyClock::now();
    try {
        raw = transcribe(samples);
    } catch (const PipelineError& e) {
        timings.transcribeMs = elapsedMs(t);
        if (e.kind() == PipelineError::Kind::Empty) {
            std::cout << "[Pipeline] No speech detected in audio" << std::endl;
            return PipelineResult::skipped(SkipReason::Empty);
        }
        std::cerr << "[Pipeline] [ERROR] Transcription failed: " << e.what() << std::endl;
        return PipelineResult::failed(std::string("transcription failed: ") + e.what());
    }
    timings.transcribeMs = elapsedMs(t);
    std::cout << "[Pipeline] Raw transcription: '" << raw << "'" << std::endl;

    t = SteadyClock::now();
    const std::string text = cleanup(raw, cleanupEnabled());
    timings.cleanupMs = elapsedMs(t);

    if (text.empty()) return PipelineResult::skipped(SkipReason::Empty);

    return gatedDeliver(text, raw, mayDeliver, timings);
}

PipelineResult ProcessingPipeline::redeliver(const std::string& text, const DeliveryGate& mayDeliver,
                                             PipelineTimings& timings) {
    if (text.empty()) return PipelineResult::skipped(SkipReason::Empty);
    return gatedDeliver(text, text, mayDeliver, timings);
}

PipelineResult ProcessingPipeline::gatedDeliver(const std::string& text, const std::string& raw,
                                                const DeliveryGate& mayDeliver, PipelineTimings& timings) {
    if (mayDeliver && !mayDeliver()) {
        std::cout << "[Pipeline] [WARN] Session superseded, dropping result" << std::endl;
        return PipelineResult::skipped(SkipReason::Superseded);
    }

    const auto t = SteadyClock::now();
    try {
        deliver(text);
    } catch (const std::exception& e) {
        timings.deliverMs = elapsedMs(t);
        std::cerr << "[Pipeline] [ERROR] Delivery failed: " << e.what() << std::endl;
        return PipelineResult::failed(std::string("delivery failed: ") + e.what());
    }
    timings.deliverMs = elapsedMs(t);

    return PipelineResult::delivered(text, raw);
}
