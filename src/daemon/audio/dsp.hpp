#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

// Sample-level helpers used to bring a clip into the format a speech model expects.
namespace dsp {

// Averages interleaved channels into out (out.size() frames).
void mix_to_mono(std::span<const float> interleaved, uint16_t channels, std::span<float> out);

size_t resampled_length(size_t input_len, uint32_t from_rate, uint32_t to_rate);

// Linear interpolation resampler. Writes output samples
// [out_first, out_first + out.size()) so long inputs can be converted in pieces.
void resample_linear(std::span<const float> input, uint32_t from_rate, uint32_t to_rate,
                     size_t out_first, std::span<float> out);

std::vector<float> resample_linear(std::span<const float> input, uint32_t from_rate, uint32_t to_rate);

// Removes the DC offset and scales the peak to 1. Silence is left untouched.
void normalize(std::span<float> samples);

void apply_gain(std::span<float> samples, float gain);

} // namespace dsp
