#pragma once
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace pagezip {

// Unbounded multi-producer queue. pop() blocks until an item arrives or the
// channel is closed and drained, in which case it returns nullopt.
template <typename T>
class Channel {
public:
    void push(T value) {
        {
            std::lock_guard<std::mutex> lock(mu_);
            q_.push_back(std::move(value));
        }
        cv_.notify_one();
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mu_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    std::optional<T> pop() {
        std::unique_lock<std::mutex> lock(mu_);
        cv_.wait(lock, [this] { return !q_.empty() || closed_; });
        if (q_.empty()) return std::nullopt;
        T v = std::move(q_.front());
        q_.pop_front();
        return v;
    }

private:
    std::mutex mu_;
    std::condition_variable cv_;
    std::deque<T> q_;
    bool closed_ = false;
};

// Completion barrier: wait() returns once done() has balanced every add().
class WaitGroup {
public:
    void add(size_t n = 1) {
        std::lock_guard<std::mutex> lock(mu_);
        pending_ += n;
    }

    void done() {
        std::lock_guard<std::mutex> lock(mu_);
        if (pending_ > 0 && --pending_ == 0) cv_.notify_all();
    }

    void wait() {
        std::unique_lock<std::mutex> lock(mu_);
        cv_.wait(lock, [this] { return pending_ == 0; });
    }

private:
    std::mutex mu_;
    std::condition_variable cv_;
    size_t pending_ = 0;
};

// Counting semaphore; a limit of 0 means unlimited and never blocks.
class Semaphore {
public:
    explicit Semaphore(size_t limit) : limit_(limit) {}

    void acquire() {
        if (limit_ == 0) return;
        std::unique_lock<std::mutex> lock(mu_);
        cv_.wait(lock, [this] { return in_use_ < limit_; });
        ++in_use_;
    }

    void release() {
        if (limit_ == 0) return;
        {
            std::lock_guard<std::mutex> lock(mu_);
            --in_use_;
        }
        cv_.notify_one();
    }

private:
    const size_t limit_;
    std::mutex mu_;
    std::condition_variable cv_;
    size_t in_use_ = 0;
};

} // namespace pagezip
