#pragma once

#include "errors.hpp"

#include <cstdint>
#include <expected>
#include <span>
#include <stop_token>
#include <string>

// Opaque speech-to-text collaborator: mono float samples at sample_rate() in,
// UTF-8 text out. transcribe() may block for a long time; implementations
// should return early once `stop` is triggered.
class SpeechModel {
public:
    virtual ~SpeechModel() = default;

    virtual std::string name() const = 0;
    virtual uint32_t sample_rate() const = 0;

    // Seconds of processing per second of audio.
    virtual double realtime_factor() const { return 0.1; }

    virtual std::expected<std::string, Error>
        transcribe(std::span<const float> mono, std::stop_token stop) = 0;
};
