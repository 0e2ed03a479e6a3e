#pragma once

#include <condition_variable>
#include <deque>
#include <mutex>
#include <utility>

namespace rangeget {

/// Unbounded multi-producer/single-consumer queue. Workers push from their own
/// threads; the coordinator is the only consumer.
template <typename T>
class EventChannel {
public:
    void push(T value) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            queue_.push_back(std::move(value));
        }
        ready_.notify_one();
    }

    // Blocks until an event is available.
    [[nodiscard]] T pop() {
        std::unique_lock<std::mutex> lock(mutex_);
        ready_.wait(lock, [this] { return !queue_.empty(); });
        T value = std::move(queue_.front());
        queue_.pop_front();
        return value;
    }

private:
    std::mutex mutex_;
    std::condition_variable ready_;
    std::deque<T> queue_;
};

} // namespace rangeget
