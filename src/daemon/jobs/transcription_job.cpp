#include "jobs/transcription_job.hpp"

#include <algorithm>
#include <cmath>

using json = nlohmann::json;

namespace {

// Largest double below 1.0.
const double RUNNING_PROGRESS_CAP = std::nextafter(1.0, 0.0);

} // namespace

std::string_view job_state_name(JobState state) {
    switch (state) {
        case JobState::Pending: return "pending";
        case JobState::Running: return "running";
        case JobState::Succeeded: return "succeeded";
        case JobState::Failed: return "failed";
        case JobState::Cancelled: return "cancelled";
    }
    return "unknown";
}

TranscriptionJob::TranscriptionJob(uint64_t id, std::string runner_id, AudioBuffer audio,
                                   size_t caret_offset)
    : id_(id), runner_id_(std::move(runner_id)), audio_(std::move(audio)),
      caret_offset_(caret_offset), created_at_(Clock::now()) {}

JobState TranscriptionJob::state() const {
    std::lock_guard lock(mutex_);
    return state_;
}

bool TranscriptionJob::is_terminal() const {
    std::lock_guard lock(mutex_);
    return terminal(state_);
}

double TranscriptionJob::progress() const {
    std::lock_guard lock(mutex_);
    return progress_;
}

std::optional<std::string> TranscriptionJob::result() const {
    std::lock_guard lock(mutex_);
    return result_;
}

std::optional<Error> TranscriptionJob::error() const {
    std::lock_guard lock(mutex_);
    return error_;
}

bool TranscriptionJob::start() {
    std::lock_guard lock(mutex_);
    if (state_ != JobState::Pending) return false;
    state_ = JobState::Running;
    started_at_ = Clock::now();
    return true;
}

bool TranscriptionJob::succeed(std::string text) {
    std::lock_guard lock(mutex_);
    if (state_ != JobState::Running || text.empty()) return false;
    state_ = JobState::Succeeded;
    result_ = std::move(text);
    progress_ = 1.0;
    finished_at_ = Clock::now();
    return true;
}

bool TranscriptionJob::fail(Error error) {
    std::lock_guard lock(mutex_);
    if (state_ != JobState::Pending && state_ != JobState::Running) return false;
    state_ = JobState::Failed;
    error_ = std::move(error);
    finished_at_ = Clock::now();
    return true;
}

bool TranscriptionJob::finish_cancelled() {
    std::lock_guard lock(mutex_);
    if (state_ != JobState::Running) return false;
    state_ = JobState::Cancelled;
    finished_at_ = Clock::now();
    return true;
}

void TranscriptionJob::set_progress(double p) {
    std::lock_guard lock(mutex_);
    if (state_ != JobState::Running) return;
    progress_ = std::max(progress_, std::clamp(p, 0.0, RUNNING_PROGRESS_CAP));
}

bool TranscriptionJob::mark_delivered() {
    std::lock_guard lock(mutex_);
    if (delivered_) return false;
    delivered_ = true;
    return true;
}

bool TranscriptionJob::delivered() const {
    std::lock_guard lock(mutex_);
    return delivered_;
}

std::optional<TranscriptionJob::Clock::time_point> TranscriptionJob::started_at() const {
    std::lock_guard lock(mutex_);
    return started_at_;
}

std::optional<TranscriptionJob::Clock::time_point> TranscriptionJob::finished_at() const {
    std::lock_guard lock(mutex_);
    return finished_at_;
}

double TranscriptionJob::processing_seconds() const {
    std::lock_guard lock(mutex_);
    if (!started_at_ || !finished_at_) return 0.0;
    return std::chrono::duration<double>(*finished_at_ - *started_at_).count();
}

json TranscriptionJob::to_json() const {
    std::lock_guard lock(mutex_);
    json j = {
        {"id", id_},
        {"runner", runner_id_},
        {"audio_source", audio_.source()},
        {"audio_duration", audio_.duration()},
        {"caret", caret_offset_},
        {"state", job_state_name(state_)},
        {"progress", progress_},
        {"delivered", delivered_},
    };
    if (result_) j["text"] = *result_;
    if (error_) {
        j["error"] = error_name(error_->code);
        j["message"] = error_->message;
    }
    return j;
}
