#pragma once

#include "audio/audio_buffer.hpp"
#include "errors.hpp"
#include "jobs/transcription_job.hpp"
#include "runner/job_runner.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <expected>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

// Fixed pool of worker threads running TranscriptionJobs.
// submit() and cancel() are called from the interactive thread and never block
// on a runner. Callbacks fire on the worker that ran the job (or on the
// submitting thread for jobs that fail before dispatch).
class JobExecutor {
public:
    using CompletionCallback = std::function<void(std::shared_ptr<TranscriptionJob>)>;
    using ProgressCallback = std::function<void(const std::shared_ptr<TranscriptionJob>&, double)>;

    enum class CancelResult { Discarded, Requested, AlreadyFinished };

    JobExecutor(uint32_t workers, CompletionCallback on_complete, ProgressCallback on_progress = {});
    ~JobExecutor();

    JobExecutor(const JobExecutor&) = delete;
    JobExecutor& operator=(const JobExecutor&) = delete;

    // UnknownRunnerError for a null runner, RunnerBusyError when the runner
    // already has a pending or running job. An empty clip yields a job that
    // went straight from Pending to Failed.
    std::expected<std::shared_ptr<TranscriptionJob>, Error>
        submit(std::shared_ptr<JobRunner> runner, AudioBuffer audio, size_t caret_offset);

    // Pending jobs are dropped from the queue and their runner released.
    // Running jobs get a cooperative stop request.
    std::expected<CancelResult, Error> cancel(uint64_t job_id);

    // Pending or running job, nullptr once finished.
    std::shared_ptr<TranscriptionJob> find(uint64_t job_id) const;

    size_t pending_count() const;
    size_t running_count() const;
    uint32_t worker_count() const { return static_cast<uint32_t>(workers_.size()); }

    // Drops queued jobs, asks running ones to stop and joins the workers.
    void shutdown();

private:
    struct Entry {
        std::shared_ptr<TranscriptionJob> job;
        std::shared_ptr<JobRunner> runner;
    };

    void worker_loop(std::stop_token stop);
    void execute(Entry& entry);

    CompletionCallback on_complete_;
    ProgressCallback on_progress_;

    mutable std::mutex mutex_;
    std::condition_variable_any cv_;
    std::deque<Entry> queue_;
    std::map<uint64_t, Entry> running_;
    std::atomic<uint64_t> next_id_{1};
    bool stopped_ = false;

    std::vector<std::jthread> workers_;
};
