#pragma once

#include "audio/audio_buffer.hpp"
#include "errors.hpp"
#include "profiles/profile.hpp"

#include <atomic>
#include <functional>
#include <optional>
#include <stop_token>
#include <string>

using ProgressCallback = std::function<void(double)>;

struct RunOutcome {
    enum class Kind { Succeeded, Failed, Cancelled };

    Kind kind = Kind::Failed;
    std::string text;
    std::optional<Error> error;

    static RunOutcome succeeded(std::string text) { return {Kind::Succeeded, std::move(text), std::nullopt}; }
    static RunOutcome failed(Error err) { return {Kind::Failed, {}, std::move(err)}; }
    static RunOutcome cancelled() { return {Kind::Cancelled, {}, std::nullopt}; }
};

// One configured transcription backend. Subclasses implement do_run();
// run() is the only entry point and enforces the outcome contract.
class JobRunner {
public:
    JobRunner(std::string profile_id, ProfileParams params);
    virtual ~JobRunner() = default;

    JobRunner(const JobRunner&) = delete;
    JobRunner& operator=(const JobRunner&) = delete;

    // Expected processing time in seconds.
    virtual double estimate_duration(const AudioBuffer& audio) const = 0;

    // Never throws. Progress reaching the callback is clamped to [0, 1] and
    // non-decreasing. An empty transcript is reported as a model failure.
    RunOutcome run(const AudioBuffer& audio, const ProgressCallback& progress,
                   std::stop_token stop);

    const std::string& profile_id() const { return profile_id_; }
    const ProfileParams& params() const { return params_; }
    bool record_and_run() const { return params_.get_bool("record_and_run"); }

    // A runner serves at most one job at a time.
    bool try_acquire();
    void release();
    bool busy() const { return busy_.load(std::memory_order_acquire); }

protected:
    virtual RunOutcome do_run(const AudioBuffer& audio, const ProgressCallback& progress,
                              std::stop_token stop) = 0;

private:
    std::string profile_id_;
    ProfileParams params_;
    std::atomic<bool> busy_{false};
};
