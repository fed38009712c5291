#include "jobs/job_executor.hpp"

#include <algorithm>
#include <format>
#include <print>

JobExecutor::JobExecutor(uint32_t workers, CompletionCallback on_complete, ProgressCallback on_progress)
    : on_complete_(std::move(on_complete)), on_progress_(std::move(on_progress)) {
    workers = std::max<uint32_t>(workers, 1);
    workers_.reserve(workers);
    for (uint32_t i = 0; i < workers; ++i) {
        workers_.emplace_back([this](std::stop_token st) { worker_loop(st); });
    }
}

JobExecutor::~JobExecutor() {
    shutdown();
}

std::expected<std::shared_ptr<TranscriptionJob>, Error>
JobExecutor::submit(std::shared_ptr<JobRunner> runner, AudioBuffer audio, size_t caret_offset) {
    if (!runner) {
        return std::unexpected(Error{ErrorCode::UnknownRunner, "no runner"});
    }

    {
        std::lock_guard lock(mutex_);
        if (stopped_) {
            return std::unexpected(Error{ErrorCode::InvalidState, "executor is shut down"});
        }
    }

    if (!runner->try_acquire()) {
        return std::unexpected(Error{ErrorCode::RunnerBusy,
                                     std::format("runner '{}' already has a job in flight", runner->profile_id())});
    }

    auto job = std::make_shared<TranscriptionJob>(next_id_.fetch_add(1), runner->profile_id(),
                                                  std::move(audio), caret_offset);

    if (job->audio().empty()) {
        runner->release();
        job->fail({ErrorCode::EmptyAudio, "audio buffer has no samples"});
        if (on_complete_) on_complete_(job);
        return job;
    }

    {
        std::lock_guard lock(mutex_);
        queue_.push_back({job, std::move(runner)});
    }
    cv_.notify_one();
    return job;
}

std::expected<JobExecutor::CancelResult, Error> JobExecutor::cancel(uint64_t job_id) {
    std::shared_ptr<JobRunner> discarded_runner;
    {
        std::lock_guard lock(mutex_);

        auto it = std::ranges::find_if(queue_, [job_id](const Entry& e) { return e.job->id() == job_id; });
        if (it != queue_.end()) {
            discarded_runner = std::move(it->runner);
            queue_.erase(it);
        } else if (auto r = running_.find(job_id); r != running_.end()) {
            r->second.job->request_cancel();
            return CancelResult::Requested;
        } else {
            return std::unexpected(Error{ErrorCode::UnknownJob, std::format("no active job {}", job_id)});
        }
    }

    discarded_runner->release();
    return CancelResult::Discarded;
}

std::shared_ptr<TranscriptionJob> JobExecutor::find(uint64_t job_id) const {
    std::lock_guard lock(mutex_);
    if (auto r = running_.find(job_id); r != running_.end()) return r->second.job;
    auto it = std::ranges::find_if(queue_, [job_id](const Entry& e) { return e.job->id() == job_id; });
    return it != queue_.end() ? it->job : nullptr;
}

size_t JobExecutor::pending_count() const {
    std::lock_guard lock(mutex_);
    return queue_.size();
}

size_t JobExecutor::running_count() const {
    std::lock_guard lock(mutex_);
    return running_.size();
}

void JobExecutor::shutdown() {
    std::deque<Entry> dropped;
    {
        std::lock_guard lock(mutex_);
        if (stopped_) return;
        stopped_ = true;
        dropped.swap(queue_);
        for (auto& [id, entry] : running_) {
            entry.job->request_cancel();
        }
    }

    for (auto& e : dropped) e.runner->release();

    for (auto& w : workers_) w.request_stop();
    cv_.notify_all();
    workers_.clear(); // joins
}

void JobExecutor::worker_loop(std::stop_token stop) {
    for (;;) {
        Entry entry;
        {
            std::unique_lock lock(mutex_);
            if (!cv_.wait(lock, stop, [this] { return !queue_.empty(); })) return;
            entry = std::move(queue_.front());
            queue_.pop_front();
            running_.emplace(entry.job->id(), entry);
        }
        execute(entry);
    }
}

void JobExecutor::execute(Entry& entry) {
    auto& job = entry.job;

    if (job->start()) {
        auto progress = [this, &job](double p) {
            job->set_progress(p);
            if (on_progress_) on_progress_(job, job->progress());
        };

        auto outcome = entry.runner->run(job->audio(), progress, job->stop_token());

        switch (outcome.kind) {
            case RunOutcome::Kind::Succeeded:
                job->succeed(std::move(outcome.text));
                break;
            case RunOutcome::Kind::Failed:
                job->fail(outcome.error.value_or(Error{ErrorCode::Model, "runner failed"}));
                break;
            case RunOutcome::Kind::Cancelled:
                job->finish_cancelled();
                break;
        }
    } else {
        std::println(stderr, "executor: job {} was not pending at dispatch", job->id());
    }

    {
        std::lock_guard lock(mutex_);
        running_.erase(job->id());
    }
    entry.runner->release();

    if (on_complete_) on_complete_(job);
}
