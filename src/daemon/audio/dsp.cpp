#include "audio/dsp.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace dsp {

void mix_to_mono(std::span<const float> interleaved, uint16_t channels, std::span<float> out) {
    if (channels == 1) {
        std::copy_n(interleaved.begin(), std::min(interleaved.size(), out.size()), out.begin());
        return;
    }

    const float scale = 1.0f / static_cast<float>(channels);
    for (size_t f = 0; f < out.size(); ++f) {
        float sum = 0.0f;
        for (uint16_t c = 0; c < channels; ++c) {
            sum += interleaved[f * channels + c];
        }
        out[f] = sum * scale;
    }
}

size_t resampled_length(size_t input_len, uint32_t from_rate, uint32_t to_rate) {
    if (from_rate == to_rate) return input_len;
    return static_cast<size_t>(static_cast<double>(input_len) * to_rate / from_rate);
}

void resample_linear(std::span<const float> input, uint32_t from_rate, uint32_t to_rate,
                     size_t out_first, std::span<float> out) {
    if (input.empty()) {
        std::fill(out.begin(), out.end(), 0.0f);
        return;
    }

    const double step = static_cast<double>(from_rate) / to_rate;
    const size_t last = input.size() - 1;

    for (size_t i = 0; i < out.size(); ++i) {
        double pos = static_cast<double>(out_first + i) * step;
        auto idx = static_cast<size_t>(pos);
        if (idx >= last) {
            out[i] = input[last];
            continue;
        }
        auto frac = static_cast<float>(pos - static_cast<double>(idx));
        out[i] = input[idx] + (input[idx + 1] - input[idx]) * frac;
    }
}

std::vector<float> resample_linear(std::span<const float> input, uint32_t from_rate, uint32_t to_rate) {
    if (from_rate == to_rate) return {input.begin(), input.end()};

    std::vector<float> out(resampled_length(input.size(), from_rate, to_rate));
    resample_linear(input, from_rate, to_rate, 0, out);
    return out;
}

void normalize(std::span<float> samples) {
    if (samples.empty()) return;

    double mean = std::accumulate(samples.begin(), samples.end(), 0.0) / static_cast<double>(samples.size());
    float peak = 0.0f;
    for (auto& s : samples) {
        s -= static_cast<float>(mean);
        peak = std::max(peak, std::fabs(s));
    }

    if (peak <= 0.0f) return;
    apply_gain(samples, 1.0f / peak);
}

void apply_gain(std::span<float> samples, float gain) {
    if (gain == 1.0f) return;
    for (auto& s : samples) s *= gain;
}

} // namespace dsp
