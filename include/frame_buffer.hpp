#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <queue>
#include <vector>

namespace spex {

// Simple thread-safe bounded queue for facts and inbound utterances.
template <typename T>
class FrameBuffer {
public:
    explicit FrameBuffer(size_t max_items = 4) : max_items_(max_items) {}

    void push(const T& item) {
        std::unique_lock<std::mutex> lock(mu_);
        cv_full_.wait(lock, [&] { return queue_.size() < max_items_ || stopped_; });
        if (stopped_) return;
        queue_.push(item);
        lock.unlock();
        cv_empty_.notify_one();
    }

    // Never blocks; returns false (item dropped) when full or stopped.
    bool try_push(const T& item) {
        std::unique_lock<std::mutex> lock(mu_);
        if (stopped_ || queue_.size() >= max_items_) return false;
        queue_.push(item);
        lock.unlock();
        cv_empty_.notify_one();
        return true;
    }

    bool pop(T& out) {
        std::unique_lock<std::mutex> lock(mu_);
        cv_empty_.wait(lock, [&] { return !queue_.empty() || stopped_; });
        if (stopped_ && queue_.empty()) return false;
        out = std::move(queue_.front());
        queue_.pop();
        lock.unlock();
        cv_full_.notify_one();
        return true;
    }

    template <typename Rep, typename Period>
    bool pop_for(T& out, const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock<std::mutex> lock(mu_);
        if (!cv_empty_.wait_for(lock, timeout, [&] { return !queue_.empty() || stopped_; })) {
            return false;
        }
        if (queue_.empty()) return false;
        out = std::move(queue_.front());
        queue_.pop();
        lock.unlock();
        cv_full_.notify_one();
        return true;
    }

    // Takes everything currently queued, including after stop().
    std::vector<T> drain() {
        std::vector<T> out;
        {
            std::lock_guard<std::mutex> lock(mu_);
            while (!queue_.empty()) {
                out.push_back(std::move(queue_.front()));
                queue_.pop();
            }
        }
        cv_full_.notify_all();
        return out;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mu_);
        return queue_.size();
    }

    void stop() {
        {
            std::lock_guard<std::mutex> lock(mu_);
            stopped_ = true;
        }
        cv_empty_.notify_all();
        cv_full_.notify_all();
    }

private:
    size_t max_items_;
    std::queue<T> queue_;
    mutable std::mutex mu_;
    std::condition_variable cv_empty_;
    std::condition_variable cv_full_;
    bool stopped_{false};
};

}  // namespace spex
