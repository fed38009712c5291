#pragma once

#include "audio/audio_buffer.hpp"
#include "errors.hpp"
#include "platform/audio_capture.hpp"
#include "ring_buffer.hpp"

#include <chrono>
#include <expected>
#include <optional>

enum class RecorderState { Idle, Recording };

// Turns a capture session into an AudioBuffer with source "recorded".
class Recorder {
public:
    Recorder(RingBuffer& ring_buf, AudioCapture& capture);

    std::expected<void, Error> start();

    // Stops capture. EmptyAudioError when nothing was captured.
    std::expected<AudioBuffer, Error> finish();

    // Stops capture. Returns the partial clip only when keep_partial is set
    // and something was captured.
    std::optional<AudioBuffer> cancel(bool keep_partial);

    RecorderState state() const { return state_; }

    // Wall-clock time since start, capped at max_duration().
    double duration() const;

    // Longest recording the ring buffer holds.
    double max_duration() const;

    // Audio lost past the cap, for the current or the last finished recording.
    size_t dropped_samples() const { return ring_buf_.dropped(); }
    double dropped_seconds() const;
    bool limit_reached() const { return dropped_samples() > 0; }

private:
    std::expected<AudioBuffer, Error> collect();

    RingBuffer& ring_buf_;
    AudioCapture& capture_;
    RecorderState state_ = RecorderState::Idle;
    std::chrono::steady_clock::time_point record_start_;
};
