#include "profiles/builtin_profiles.hpp"
#include "model/http_model.hpp"

#include <array>
#include <format>

namespace {

constexpr uint32_t MODEL_SAMPLE_RATE = 16000;

std::vector<ParamSpec> window_params() {
    return {
        {.name = "max_window_seconds", .type = ParamType::Float, .default_value = 60.0,
         .min = 0.1, .max = 100000.0,
         .description = "Longest stretch of audio sent to the model at once"},
        {.name = "window_overlap_ratio", .type = ParamType::Float, .default_value = 0.05,
         .min = 0.0, .max = 0.99,
         .description = "Fraction of each window shared with the next one"},
        {.name = "amplitude_ratio", .type = ParamType::Float, .default_value = 1.0,
         .min = 0.0, .max = 10.0,
         .description = "Gain applied after normalization"},
        {.name = "normalize", .type = ParamType::Bool, .default_value = true,
         .description = "Remove DC offset and scale the peak to 1"},
        {.name = "record_and_run", .type = ParamType::Bool, .default_value = false,
         .description = "Running this profile records first and transcribes on stop"},
    };
}

ProfileDescriptor silero_descriptor(const std::string& lang, const Config& config) {
    ProfileDescriptor desc{
        .id = "silero-" + lang,
        .display_name = std::format("Speech to text (Silero, {})", lang),
        .params = {
            {.name = "device", .type = ParamType::Choice, .default_value = std::string("cpu"),
             .choices = {"cpu", "cuda"},
             .description = "Device the server runs the model on"},
        },
    };
    for (auto& p : window_params()) desc.params.push_back(std::move(p));
    desc.params.push_back({.name = "url", .type = ParamType::String, .default_value = config.model.url,
                           .description = "Inference server base URL"});
    return desc;
}

ProfileDescriptor whisper_descriptor(const Config& config) {
    ProfileDescriptor desc{
        .id = "whisper-lan",
        .display_name = "Speech to text (whisper.cpp server)",
        .params = {
            {.name = "url", .type = ParamType::String, .default_value = config.model.url,
             .description = "Inference server base URL"},
            {.name = "api_format", .type = ParamType::Choice, .default_value = config.model.api_format,
             .choices = {"whisper.cpp", "openai"},
             .description = "Request layout understood by the server"},
            {.name = "language", .type = ParamType::String, .default_value = config.model.language,
             .description = "Spoken language, empty for auto-detect"},
        },
    };
    for (auto& p : window_params()) desc.params.push_back(std::move(p));
    return desc;
}

} // namespace

WindowSettings window_settings_from(const ProfileParams& params) {
    WindowSettings s;
    s.max_window_seconds = params.get_double("max_window_seconds", s.max_window_seconds);
    s.overlap_ratio = params.get_double("window_overlap_ratio", s.overlap_ratio);
    s.amplitude_ratio = params.get_double("amplitude_ratio", s.amplitude_ratio);
    s.normalize = params.get_bool("normalize", s.normalize);
    return s;
}

std::expected<void, Error> register_builtin_profiles(ProfileRegistry& registry, const Config& config) {
    const uint32_t timeout_s = config.model.timeout_s;

    for (const char* lang : std::array{"en", "de", "es"}) {
        auto desc = silero_descriptor(lang, config);
        auto id = desc.id;
        auto factory = [id, lang = std::string(lang), timeout_s](const ProfileParams& params)
            -> std::unique_ptr<JobRunner> {
            HttpSpeechModel::Settings settings{
                .url = params.get_string("url"),
                .api_format = "openai",
                .model = "silero_stt",
                .language = lang,
                .device = params.get_string("device", "cpu"),
                .timeout_s = timeout_s,
                .sample_rate = MODEL_SAMPLE_RATE,
            };
            return std::make_unique<WindowedSpeechRunner>(
                id, params, std::make_unique<HttpSpeechModel>(std::move(settings)),
                window_settings_from(params));
        };
        if (auto r = registry.register_profile(std::move(desc), std::move(factory)); !r) return r;
    }

    auto factory = [timeout_s](const ProfileParams& params) -> std::unique_ptr<JobRunner> {
        HttpSpeechModel::Settings settings{
            .url = params.get_string("url"),
            .api_format = params.get_string("api_format", "whisper.cpp"),
            .language = params.get_string("language"),
            .timeout_s = timeout_s,
            .sample_rate = MODEL_SAMPLE_RATE,
        };
        return std::make_unique<WindowedSpeechRunner>(
            "whisper-lan", params, std::make_unique<HttpSpeechModel>(std::move(settings)),
            window_settings_from(params));
    };
    return registry.register_profile(whisper_descriptor(config), std::move(factory));
}
