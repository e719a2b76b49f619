#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace scalpengine {

// 루프 간 전달용 bounded 큐. 가득 차면 가장 오래된 값을 버림 (생산자는 대기하지 않음)
template <typename T>
class Channel {
public:
    explicit Channel(std::size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

    // 닫힌 뒤에는 false
    bool push(T value) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return false;
            }
            if (queue_.size() >= capacity_) {
                queue_.pop_front();
                ++dropped_;
            }
            queue_.push_back(std::move(value));
        }
        cv_.notify_one();
        return true;
    }

    // timeout 까지 대기. 시간 초과 또는 닫힌 뒤 비었으면 nullopt
    template <typename Rep, typename Period>
    std::optional<T> popFor(std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, timeout, [this] { return closed_ || !queue_.empty(); });
        if (queue_.empty()) {
            return std::nullopt;
        }
        T value = std::move(queue_.front());
        queue_.pop_front();
        return value;
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    std::size_t droppedCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return dropped_;
    }

private:
    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<T> queue_;
    std::size_t dropped_ = 0;
    bool closed_ = false;
};

} // namespace scalpengine
