#include "task_queue.hpp"
#include <stdexcept>

void TaskQueue::push(int priority, Task task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.emplace(std::make_pair(priority, next_sequence_++), std::move(task));
        ++unfinished_;
    }
    available_.notify_one();
}

Task TaskQueue::pop() {
    std::unique_lock<std::mutex> lock(mutex_);
    available_.wait(lock, [this] { return !entries_.empty(); });
    auto node = entries_.extract(entries_.begin());
    return std::move(node.mapped());
}

void TaskQueue::taskDone() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (unfinished_ == 0) {
        throw std::logic_error("taskDone() called more times than there were tasks");
    }
    if (--unfinished_ == 0) {
        finished_.notify_all();
    }
}

void TaskQueue::join() {
    std::unique_lock<std::mutex> lock(mutex_);
    finished_.wait(lock, [this] { return unfinished_ == 0; });
}

bool TaskQueue::empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.empty();
}

size_t TaskQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

size_t TaskQueue::pendingWork() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t count = 0;
    for (const auto& entry : entries_) {
        if (!std::holds_alternative<StopTask>(entry.second)) {
            ++count;
        }
    }
    return count;
}
