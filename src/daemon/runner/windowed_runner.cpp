#include "runner/windowed_runner.hpp"
#include "audio/dsp.hpp"
#include "runner/text_merge.hpp"

#include <algorithm>
#include <cmath>

WindowedSpeechRunner::WindowedSpeechRunner(std::string profile_id, ProfileParams params,
                                           std::unique_ptr<SpeechModel> model,
                                           WindowSettings settings)
    : JobRunner(std::move(profile_id), std::move(params)),
      model_(std::move(model)), settings_(settings) {}

double WindowedSpeechRunner::estimate_duration(const AudioBuffer& audio) const {
    return audio.duration() * model_->realtime_factor();
}

std::vector<WindowedSpeechRunner::Window>
WindowedSpeechRunner::layout(size_t n, size_t max_window, double overlap_ratio, size_t& window_size) {
    std::vector<Window> windows;
    window_size = std::min(std::max<size_t>(max_window, 1), n);
    if (n == 0) return windows;

    auto overlap = static_cast<size_t>(std::clamp(overlap_ratio, 0.0, 1.0) * static_cast<double>(window_size));
    size_t stride = window_size > overlap ? window_size - overlap : 1;

    for (size_t begin = 0; begin < n; begin += stride) {
        windows.push_back({begin, std::min(window_size, n - begin)});
    }
    return windows;
}

std::optional<std::vector<float>>
WindowedSpeechRunner::prepare(const AudioBuffer& audio, const ProgressCallback& progress,
                              std::stop_token stop) const {
    const uint32_t in_rate = audio.sample_rate();
    const uint32_t out_rate = model_->sample_rate();
    const size_t frames = audio.frame_count();

    // Mix down, one chunk per checkpoint: first half of the preprocessing share.
    std::vector<float> mono(frames);
    const auto in_chunk = std::max<size_t>(static_cast<size_t>(in_rate * PREPROCESS_CHUNK_SECONDS), 1);
    for (size_t f = 0; f < frames; f += in_chunk) {
        if (stop.stop_requested()) return std::nullopt;
        size_t count = std::min(in_chunk, frames - f);
        dsp::mix_to_mono(audio.frames(f, count), audio.channels(), std::span(mono).subspan(f, count));
        progress(PREPROCESS_SHARE * 0.5 * static_cast<double>(f + count) / static_cast<double>(frames));
    }

    if (in_rate == out_rate) {
        if (stop.stop_requested()) return std::nullopt;
    } else {
        std::vector<float> resampled(dsp::resampled_length(mono.size(), in_rate, out_rate));
        const auto out_chunk = std::max<size_t>(static_cast<size_t>(out_rate * PREPROCESS_CHUNK_SECONDS), 1);
        for (size_t i = 0; i < resampled.size(); i += out_chunk) {
            if (stop.stop_requested()) return std::nullopt;
            size_t count = std::min(out_chunk, resampled.size() - i);
            dsp::resample_linear(mono, in_rate, out_rate, i, std::span(resampled).subspan(i, count));
            progress(PREPROCESS_SHARE * (0.5 + 0.5 * static_cast<double>(i + count) /
                                                   static_cast<double>(resampled.size())));
        }
        mono = std::move(resampled);
    }

    if (settings_.normalize) dsp::normalize(mono);
    dsp::apply_gain(mono, static_cast<float>(settings_.amplitude_ratio));
    progress(PREPROCESS_SHARE);
    return mono;
}

RunOutcome WindowedSpeechRunner::do_run(const AudioBuffer& audio, const ProgressCallback& progress,
                                        std::stop_token stop) {
    if (audio.empty()) {
        return RunOutcome::failed({ErrorCode::EmptyAudio, "audio buffer has no samples"});
    }

    auto prepared = prepare(audio, progress, stop);
    if (!prepared) return RunOutcome::cancelled();
    if (prepared->empty()) {
        return RunOutcome::failed({ErrorCode::EmptyAudio, "audio too short for the model sample rate"});
    }

    const auto max_window = static_cast<size_t>(
        std::max(settings_.max_window_seconds, 0.0) * model_->sample_rate());
    size_t window_size = 0;
    auto windows = layout(prepared->size(), max_window, settings_.overlap_ratio, window_size);

    std::vector<float> batch(window_size);
    std::string merged;

    for (size_t i = 0; i < windows.size(); ++i) {
        if (stop.stop_requested()) return RunOutcome::cancelled();

        const auto& w = windows[i];
        std::fill(batch.begin(), batch.end(), 0.0f);
        std::copy_n(prepared->begin() + static_cast<std::ptrdiff_t>(w.begin), w.length, batch.begin());

        auto text = model_->transcribe(batch, stop);
        if (!text) {
            if (stop.stop_requested()) return RunOutcome::cancelled();
            return RunOutcome::failed(text.error());
        }

        if (merged.empty()) {
            merged = std::move(*text);
        } else if (!text->empty()) {
            auto m = text_merge::merge_overlapping(merged, *text, settings_.merge_threshold,
                                                   settings_.max_overlap_chars);
            merged = m.match > 0 ? std::move(m.text) : merged + " " + *text;
        }

        progress(PREPROCESS_SHARE + (1.0 - PREPROCESS_SHARE) *
                 static_cast<double>(i + 1) / static_cast<double>(windows.size()));
    }

    auto first = merged.find_first_not_of(" \t\n\r");
    if (first == std::string::npos) return RunOutcome::succeeded({});
    auto last = merged.find_last_not_of(" \t\n\r");
    return RunOutcome::succeeded(merged.substr(first, last - first + 1));
}
