#pragma once

#include "audio/wav_codec.hpp"
#include "errors.hpp"

#include <cstdint>
#include <expected>
#include <memory>
#include <span>
#include <string>
#include <vector>

// Decoded PCM clip. Immutable once created; copies share the sample storage,
// so a buffer can be handed to worker threads without locking.
class AudioBuffer {
public:
    static constexpr const char* RECORDED = "recorded";

    // Empty buffer (no samples, no format). Rejected by the job pipeline.
    AudioBuffer() = default;

    // Validates format and the samples.size() % channels == 0 invariant.
    // Zero samples are allowed here.
    static std::expected<AudioBuffer, Error> from_samples(uint32_t sample_rate, uint16_t channels,
                                                          std::vector<float> samples,
                                                          std::string source);

    // DecodeError on unsupported or corrupt data, EmptyAudioError on zero samples.
    static std::expected<AudioBuffer, Error> decode(std::span<const uint8_t> bytes, std::string source);
    static std::expected<AudioBuffer, Error> decode_file(const std::string& path);

    std::expected<void, Error> save(const std::string& path,
                                    wav::SampleFormat format = wav::SampleFormat::Pcm16) const;

    uint32_t sample_rate() const { return sample_rate_; }
    uint16_t channels() const { return channels_; }
    const std::string& source() const { return source_; }
    bool is_recorded() const { return source_ == RECORDED; }

    size_t sample_count() const { return samples_ ? samples_->size() : 0; }
    size_t frame_count() const { return channels_ ? sample_count() / channels_ : 0; }
    bool empty() const { return sample_count() == 0; }
    double duration() const;

    std::span<const float> samples() const;

    // Interleaved view of [first, first + count) frames, clamped to the clip.
    std::span<const float> frames(size_t first, size_t count) const;
    std::span<const float> slice_seconds(double begin, double end) const;

private:
    AudioBuffer(uint32_t sample_rate, uint16_t channels,
                std::shared_ptr<const std::vector<float>> samples, std::string source);

    uint32_t sample_rate_ = 0;
    uint16_t channels_ = 0;
    std::shared_ptr<const std::vector<float>> samples_;
    std::string source_;
};
