#pragma once
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <utility>
#include "task.hpp"

// Unbounded priority queue shared by the workers. Lower priority values are
// served first, entries of equal priority in arrival order.
class TaskQueue {
public:
    static constexpr int PRIORITY_INTERRUPT = 0;
    static constexpr int PRIORITY_NORMAL = 5;
    static constexpr int PRIORITY_DRAIN = 10;

    void push(int priority, Task task);

    // Blocks until an entry is available.
    Task pop();

    // Acknowledges one popped entry.
    void taskDone();

    // Blocks until every pushed entry has been acknowledged.
    void join();

    bool empty() const;
    size_t size() const;

    // Number of queued entries other than stop signals.
    size_t pendingWork() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable available_;
    std::condition_variable finished_;
    std::map<std::pair<int, uint64_t>, Task> entries_;
    uint64_t next_sequence_ = 0;
    size_t unfinished_ = 0;
};

// Blocking FIFO used to hand results back from the workers.
template <typename T>
class ResultChannel {
public:
    void push(T value) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            values_.push_back(std::move(value));
        }
        available_.notify_one();
    }

    T pop() {
        std::unique_lock<std::mutex> lock(mutex_);
        available_.wait(lock, [this] { return !values_.empty(); });
        T value = std::move(values_.front());
        values_.pop_front();
        return value;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return values_.size();
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable available_;
    std::deque<T> values_;
};
