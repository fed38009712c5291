#include "jobs/interactive_queue.hpp"

InteractiveQueue::InteractiveQueue()
    : owner_(std::this_thread::get_id()) {}

void InteractiveQueue::set_notify(NotifyCallback notify) {
    std::lock_guard lock(mutex_);
    notify_ = std::move(notify);
}

void InteractiveQueue::set_owner(std::thread::id owner) {
    owner_ = owner;
}

void InteractiveQueue::post(Task task) {
    NotifyCallback notify;
    {
        std::lock_guard lock(mutex_);
        tasks_.push_back(std::move(task));
        notify = notify_;
    }
    if (notify) notify();
}

size_t InteractiveQueue::drain() {
    size_t ran = 0;
    for (;;) {
        std::deque<Task> batch;
        {
            std::lock_guard lock(mutex_);
            if (tasks_.empty()) break;
            batch.swap(tasks_);
        }
        for (auto& task : batch) {
            task();
            ++ran;
        }
    }
    return ran;
}

size_t InteractiveQueue::pending() const {
    std::lock_guard lock(mutex_);
    return tasks_.size();
}
