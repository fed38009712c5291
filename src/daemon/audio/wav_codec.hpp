#pragma once

#include "errors.hpp"

#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <vector>

// RIFF/WAVE encode and decode for interleaved float samples.
namespace wav {

enum class SampleFormat { Pcm16, Float32 };

struct Decoded {
    uint32_t sample_rate = 0;
    uint16_t channels = 0;
    std::vector<float> samples; // interleaved, [-1, 1]
};

std::vector<uint8_t> encode(std::span<const float> samples, uint32_t sample_rate,
                            uint16_t channels, SampleFormat format = SampleFormat::Pcm16);

// Accepts integer PCM (8/16/24/32 bit), IEEE float (32/64 bit) and
// WAVE_FORMAT_EXTENSIBLE wrapping either. Unknown chunks are skipped.
std::expected<Decoded, Error> decode(std::span<const uint8_t> bytes);

std::expected<std::vector<uint8_t>, Error> read_file(const std::string& path);
std::expected<void, Error> write_file(const std::string& path, std::span<const uint8_t> bytes);

} // namespace wav
