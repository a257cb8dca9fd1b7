#ifndef ENGINES_HPP
#define ENGINES_HPP

#include "audio/sample_buffer.hpp"

#include <stdexcept>
#include <string>

class PipelineError : public std::runtime_error {
public:
    enum class Kind { EngineUnavailable, Empty, Malformed };

    PipelineError(Kind kind, const std::string& what)
        : std::runtime_error(what), kind_(kind) {}

    Kind kind() const { return kind_; }

private:
    Kind kind_;
};

class DeliveryError : public std::runtime_error {
public:
    enum class Kind { SinkUnavailable };

    DeliveryError(Kind kind, const std::string& what)
        : std::runtime_error(what), kind_(kind) {}

    Kind kind() const { return kind_; }

private:
    Kind kind_;
};

// Speech-to-text collaborator. Throws PipelineError(EngineUnavailable).
class TranscriptionEngine {
public:
    virtual ~TranscriptionEngine() = default;
    virtual std::string transcribe(const SampleBuffer& samples) = 0;
};

// Text cleanup collaborator. Output is untrusted and may not honour the prompt.
class CleanupEngine {
public:
    virtual ~CleanupEngine() = default;
    virtual bool available() const = 0;
    virtual std::string clean(const std::string& transcript) = 0;
};

// Receives final text, e.g. by typing it into the focused window.
class DeliverySink {
public:
    virtual ~DeliverySink() = default;
    virtual void deliver(const std::string& text) = 0;
};

#endif
