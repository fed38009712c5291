#pragma once

#include "model/speech_model.hpp"
#include "runner/job_runner.hpp"

#include <memory>
#include <optional>
#include <vector>

struct WindowSettings {
    double max_window_seconds = 60.0;
    double overlap_ratio = 0.05;   // fraction of a window shared with the next
    double amplitude_ratio = 1.0;
    bool normalize = true;
    double merge_threshold = 0.9;
    size_t max_overlap_chars = 1000;
};

// Runs a speech model over a long clip in fixed-size, overlapping windows and
// stitches the window transcripts back together.
class WindowedSpeechRunner : public JobRunner {
public:
    // Cancellation is observed once per preprocessing chunk and before each window.
    static constexpr double PREPROCESS_CHUNK_SECONDS = 1.0;
    static constexpr double PREPROCESS_SHARE = 0.1;

    WindowedSpeechRunner(std::string profile_id, ProfileParams params,
                         std::unique_ptr<SpeechModel> model, WindowSettings settings);

    double estimate_duration(const AudioBuffer& audio) const override;

    const WindowSettings& settings() const { return settings_; }
    const SpeechModel& model() const { return *model_; }

    struct Window {
        size_t begin = 0;
        size_t length = 0; // samples taken from the clip; the rest is zero padding
    };

    // Window size is min(max_window, n); consecutive windows start
    // size * (1 - overlap_ratio) samples apart (at least 1).
    static std::vector<Window> layout(size_t n, size_t max_window, double overlap_ratio, size_t& window_size);

protected:
    RunOutcome do_run(const AudioBuffer& audio, const ProgressCallback& progress,
                      std::stop_token stop) override;

private:
    // Mono, model-rate, normalized and scaled samples. nullopt when cancelled.
    std::optional<std::vector<float>> prepare(const AudioBuffer& audio, const ProgressCallback& progress,
                                              std::stop_token stop) const;

    std::unique_ptr<SpeechModel> model_;
    WindowSettings settings_;
};
