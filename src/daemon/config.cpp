#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <print>
#include <thread>

namespace fs = std::filesystem;
using json = nlohmann::json;

uint32_t Config::worker_count() const {
    if (workers > 0) return workers;
    return std::max(1u, std::thread::hardware_concurrency());
}

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("workers")) cfg.workers = j["workers"].get<uint32_t>();

        if (j.contains("audio")) {
            auto& a = j["audio"];
            if (a.contains("sample_rate")) cfg.audio.sample_rate = a["sample_rate"].get<uint32_t>();
            if (a.contains("channels")) cfg.audio.channels = a["channels"].get<uint16_t>();
            if (a.contains("max_seconds")) cfg.audio.max_seconds = a["max_seconds"].get<uint32_t>();
        }

        if (j.contains("recording")) {
            auto& r = j["recording"];
            if (r.contains("keep_partial_on_cancel"))
                cfg.recording.keep_partial_on_cancel = r["keep_partial_on_cancel"].get<bool>();
        }

        if (j.contains("model")) {
            auto& m = j["model"];
            if (m.contains("url")) cfg.model.url = m["url"].get<std::string>();
            if (m.contains("api_format")) cfg.model.api_format = m["api_format"].get<std::string>();
            if (m.contains("language")) cfg.model.language = m["language"].get<std::string>();
            if (m.contains("timeout_s")) cfg.model.timeout_s = m["timeout_s"].get<uint32_t>();
        }

        if (j.contains("document")) {
            auto& d = j["document"];
            if (d.contains("path")) cfg.document.path = d["path"].get<std::string>();
            if (d.contains("max_undo")) cfg.document.max_undo = d["max_undo"].get<size_t>();
        }

        if (j.contains("profiles")) {
            for (auto& p : j["profiles"]) {
                ProfileInstance inst;
                inst.type = p.value("type", "");
                inst.name = p.value("name", inst.type);
                if (p.contains("params")) inst.params = p["params"];
                if (inst.type.empty()) {
                    std::println(stderr, "config: skipping profile entry without type");
                    continue;
                }
                cfg.profiles.push_back(std::move(inst));
            }
        }

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
        return Config{};
    }

    if (cfg.audio.sample_rate == 0 || cfg.audio.channels == 0) {
        std::println(stderr, "config: audio sample_rate and channels must be positive, using defaults");
        cfg.audio = Audio{};
    }

    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return Config{};
}
