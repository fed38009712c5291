#pragma once

#include "audio/audio_buffer.hpp"
#include "errors.hpp"

#include <chrono>
#include <cstdint>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>

enum class JobState { Pending, Running, Succeeded, Failed, Cancelled };

std::string_view job_state_name(JobState state);

// One run of a runner against one clip. Terminal states absorb: every
// transition method returns false once the job has finished.
// Thread-safe; workers drive the transitions, the interactive thread reads.
class TranscriptionJob {
public:
    using Clock = std::chrono::system_clock;

    TranscriptionJob(uint64_t id, std::string runner_id, AudioBuffer audio, size_t caret_offset);

    uint64_t id() const { return id_; }
    const std::string& runner_id() const { return runner_id_; }
    const AudioBuffer& audio() const { return audio_; }
    size_t caret_offset() const { return caret_offset_; }

    JobState state() const;
    bool is_terminal() const;
    double progress() const;
    std::optional<std::string> result() const;
    std::optional<Error> error() const;

    // Pending -> Running
    bool start();
    // Running -> Succeeded; refuses an empty result.
    bool succeed(std::string text);
    // Pending or Running -> Failed
    bool fail(Error error);
    // Running -> Cancelled
    bool finish_cancelled();

    // Kept strictly below 1.0 while Running, non-decreasing. Ignored in other states.
    void set_progress(double p);

    void request_cancel() { stop_source_.request_stop(); }
    bool cancel_requested() const { return stop_source_.stop_requested(); }
    std::stop_token stop_token() const { return stop_source_.get_token(); }

    // One-shot; true only for the first caller.
    bool mark_delivered();
    bool delivered() const;

    Clock::time_point created_at() const { return created_at_; }
    std::optional<Clock::time_point> started_at() const;
    std::optional<Clock::time_point> finished_at() const;

    // Seconds between start and finish, 0 if it never ran.
    double processing_seconds() const;

    nlohmann::json to_json() const;

private:
    static bool terminal(JobState s) {
        return s == JobState::Succeeded || s == JobState::Failed || s == JobState::Cancelled;
    }

    const uint64_t id_;
    const std::string runner_id_;
    const AudioBuffer audio_;
    const size_t caret_offset_;
    const Clock::time_point created_at_;

    mutable std::mutex mutex_;
    JobState state_ = JobState::Pending;
    double progress_ = 0.0;
    std::optional<std::string> result_;
    std::optional<Error> error_;
    bool delivered_ = false;
    std::optional<Clock::time_point> started_at_;
    std::optional<Clock::time_point> finished_at_;

    std::stop_source stop_source_;
};
