#pragma once

#include <deque>
#include <functional>
#include <mutex>
#include <thread>

// Hand-off from worker threads to the interactive (event loop) thread.
// post() may be called from any thread; drain() runs on the owner thread,
// which the event loop wakes through the notify callback.
class InteractiveQueue {
public:
    using Task = std::function<void()>;
    using NotifyCallback = std::function<void()>;

    // The constructing thread becomes the owner.
    InteractiveQueue();

    void set_notify(NotifyCallback notify);
    void set_owner(std::thread::id owner);

    bool on_owner_thread() const { return std::this_thread::get_id() == owner_; }

    void post(Task task);

    // Runs queued tasks, including ones posted while draining. Returns the count.
    size_t drain();

    size_t pending() const;

private:
    std::thread::id owner_;
    NotifyCallback notify_;
    mutable std::mutex mutex_;
    std::deque<Task> tasks_;
};
