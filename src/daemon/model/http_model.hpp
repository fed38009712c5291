#pragma once

#include "model/speech_model.hpp"

#include <string>

// Speech model served over HTTP by a whisper.cpp server or an
// OpenAI-compatible transcription endpoint.
class HttpSpeechModel : public SpeechModel {
public:
    struct Settings {
        std::string url = "http://localhost:8080";
        std::string api_format = "whisper.cpp"; // "whisper.cpp" or "openai"
        std::string model;                      // openai only
        std::string language = "en";
        std::string device;                     // forwarded when non-empty
        uint32_t timeout_s = 120;
        uint32_t sample_rate = 16000;
    };

    explicit HttpSpeechModel(Settings settings);

    std::string name() const override;
    uint32_t sample_rate() const override { return settings_.sample_rate; }

    std::expected<std::string, Error>
        transcribe(std::span<const float> mono, std::stop_token stop) override;

    const Settings& settings() const { return settings_; }

private:
    Settings settings_;
};
