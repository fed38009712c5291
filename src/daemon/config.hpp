#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

struct Config {
    // 0 means one worker per available processing unit.
    uint32_t workers = 0;

    struct Audio {
        uint32_t sample_rate = 16000;
        uint16_t channels = 1;
        uint32_t max_seconds = 600;

        // Computed from max_seconds, sample_rate and channels (no independent config key).
        size_t ring_buffer_samples() const {
            return static_cast<size_t>(max_seconds) * sample_rate * channels;
        }
    } audio;

    struct Recording {
        bool keep_partial_on_cancel = false;
    } recording;

    struct Model {
        std::string url = "http://localhost:8080";
        std::string api_format = "whisper.cpp"; // "whisper.cpp" or "openai"
        std::string language = "en";
        uint32_t timeout_s = 120;
    } model;

    struct Document {
        std::string path;
        size_t max_undo = 1000;
    } document;

    // Runner instances created at startup.
    struct ProfileInstance {
        std::string type;
        std::string name;
        nlohmann::json params = nlohmann::json::object();
    };
    std::vector<ProfileInstance> profiles;

    // Resolved pool size, never less than 1.
    uint32_t worker_count() const;

    static Config load(const std::string& path);
    static Config load_default();
};
