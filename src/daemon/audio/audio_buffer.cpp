#include "audio/audio_buffer.hpp"

#include <algorithm>
#include <cmath>

AudioBuffer::AudioBuffer(uint32_t sample_rate, uint16_t channels,
                         std::shared_ptr<const std::vector<float>> samples, std::string source)
    : sample_rate_(sample_rate), channels_(channels),
      samples_(std::move(samples)), source_(std::move(source)) {}

std::expected<AudioBuffer, Error> AudioBuffer::from_samples(uint32_t sample_rate, uint16_t channels,
                                                            std::vector<float> samples,
                                                            std::string source) {
    if (sample_rate == 0) {
        return std::unexpected(Error{ErrorCode::Decode, "sample rate must be positive"});
    }
    if (channels == 0) {
        return std::unexpected(Error{ErrorCode::Decode, "channel count must be positive"});
    }
    if (samples.size() % channels != 0) {
        return std::unexpected(Error{ErrorCode::Decode,
            "sample count " + std::to_string(samples.size()) +
            " is not a multiple of " + std::to_string(channels) + " channels"});
    }

    auto shared = std::make_shared<const std::vector<float>>(std::move(samples));
    return AudioBuffer(sample_rate, channels, std::move(shared), std::move(source));
}

std::expected<AudioBuffer, Error> AudioBuffer::decode(std::span<const uint8_t> bytes, std::string source) {
    auto decoded = wav::decode(bytes);
    if (!decoded) return std::unexpected(decoded.error());

    if (decoded->samples.empty()) {
        return std::unexpected(Error{ErrorCode::EmptyAudio, source + " contains no samples"});
    }

    return from_samples(decoded->sample_rate, decoded->channels,
                        std::move(decoded->samples), std::move(source));
}

std::expected<AudioBuffer, Error> AudioBuffer::decode_file(const std::string& path) {
    auto bytes = wav::read_file(path);
    if (!bytes) return std::unexpected(bytes.error());
    return decode(*bytes, path);
}

std::expected<void, Error> AudioBuffer::save(const std::string& path, wav::SampleFormat format) const {
    if (empty()) {
        return std::unexpected(Error{ErrorCode::EmptyAudio, "nothing to save"});
    }
    auto bytes = wav::encode(samples(), sample_rate_, channels_, format);
    return wav::write_file(path, bytes);
}

double AudioBuffer::duration() const {
    if (sample_rate_ == 0) return 0.0;
    return static_cast<double>(frame_count()) / sample_rate_;
}

std::span<const float> AudioBuffer::samples() const {
    if (!samples_) return {};
    return {samples_->data(), samples_->size()};
}

std::span<const float> AudioBuffer::frames(size_t first, size_t count) const {
    const size_t total = frame_count();
    if (first >= total) return {};
    count = std::min(count, total - first);
    return samples().subspan(first * channels_, count * channels_);
}

std::span<const float> AudioBuffer::slice_seconds(double begin, double end) const {
    if (sample_rate_ == 0 || end <= begin) return {};
    auto to_frame = [this](double t) {
        return static_cast<size_t>(std::llround(std::max(0.0, t) * sample_rate_));
    };
    size_t first = to_frame(begin);
    size_t last = to_frame(end);
    return frames(first, last - first);
}
