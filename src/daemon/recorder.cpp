#include "recorder.hpp"

#include <algorithm>
#include <print>

Recorder::Recorder(RingBuffer& ring_buf, AudioCapture& capture)
    : ring_buf_(ring_buf), capture_(capture) {}

std::expected<void, Error> Recorder::start() {
    if (state_ != RecorderState::Idle) {
        return std::unexpected(Error{ErrorCode::InvalidState, "already recording"});
    }

    ring_buf_.reset();
    if (!capture_.start()) {
        return std::unexpected(Error{ErrorCode::Io, "failed to start audio capture"});
    }

    record_start_ = std::chrono::steady_clock::now();
    state_ = RecorderState::Recording;
    return {};
}

std::expected<AudioBuffer, Error> Recorder::finish() {
    if (state_ != RecorderState::Recording) {
        return std::unexpected(Error{ErrorCode::InvalidState, "not recording"});
    }

    auto clip = collect();
    if (clip && clip->empty()) {
        return std::unexpected(Error{ErrorCode::EmptyAudio, "no audio captured"});
    }
    return clip;
}

std::optional<AudioBuffer> Recorder::cancel(bool keep_partial) {
    if (state_ != RecorderState::Recording) return std::nullopt;

    auto clip = collect();
    if (!keep_partial || !clip || clip->empty()) return std::nullopt;
    return std::move(*clip);
}

double Recorder::duration() const {
    if (state_ != RecorderState::Recording) return 0.0;
    auto now = std::chrono::steady_clock::now();
    return std::min(std::chrono::duration<double>(now - record_start_).count(), max_duration());
}

double Recorder::max_duration() const {
    double rate = static_cast<double>(capture_.sample_rate()) * capture_.channels();
    return rate > 0 ? static_cast<double>(ring_buf_.capacity()) / rate : 0.0;
}

double Recorder::dropped_seconds() const {
    double rate = static_cast<double>(capture_.sample_rate()) * capture_.channels();
    return rate > 0 ? static_cast<double>(dropped_samples()) / rate : 0.0;
}

std::expected<AudioBuffer, Error> Recorder::collect() {
    capture_.stop();
    state_ = RecorderState::Idle;

    if (auto dropped = ring_buf_.dropped(); dropped > 0) {
        std::println(stderr, "recorder: buffer full, dropped {} samples", dropped);
    }

    auto samples = ring_buf_.drain_all(capture_.channels());
    return AudioBuffer::from_samples(capture_.sample_rate(), capture_.channels(),
                                     std::move(samples), AudioBuffer::RECORDED);
}
