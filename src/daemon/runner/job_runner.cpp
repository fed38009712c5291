#include "runner/job_runner.hpp"

#include <algorithm>
#include <format>
#include <new>
#include <print>

JobRunner::JobRunner(std::string profile_id, ProfileParams params)
    : profile_id_(std::move(profile_id)), params_(std::move(params)) {}

RunOutcome JobRunner::run(const AudioBuffer& audio, const ProgressCallback& progress,
                          std::stop_token stop) {
    double last = 0.0;
    ProgressCallback monotonic = [&last, &progress](double p) {
        p = std::clamp(p, 0.0, 1.0);
        if (p < last) return;
        last = p;
        if (progress) progress(p);
    };

    RunOutcome outcome;
    try {
        outcome = do_run(audio, monotonic, stop);
    } catch (const std::bad_alloc&) {
        std::println(stderr, "runner: {}: out of memory", profile_id_);
        return RunOutcome::failed({ErrorCode::Model, "out of memory"});
    } catch (const std::exception& e) {
        std::println(stderr, "runner: {}: {}", profile_id_, e.what());
        return RunOutcome::failed({ErrorCode::Model, e.what()});
    }

    if (outcome.kind == RunOutcome::Kind::Succeeded && outcome.text.empty()) {
        return RunOutcome::failed({ErrorCode::Model, "model returned no text"});
    }
    if (outcome.kind == RunOutcome::Kind::Failed && !outcome.error) {
        outcome.error = Error{ErrorCode::Model, std::format("{} failed", profile_id_)};
    }
    return outcome;
}

bool JobRunner::try_acquire() {
    bool expected = false;
    return busy_.compare_exchange_strong(expected, true, std::memory_order_acq_rel);
}

void JobRunner::release() {
    busy_.store(false, std::memory_order_release);
}
