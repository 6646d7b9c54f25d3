#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

#include "utils/cancel_token.hpp"

namespace swiftget {

// Counting semaphore whose waits can be abandoned through a CancelToken.
class PermitPool {
public:
    explicit PermitPool(int permits) : available_(permits > 0 ? permits : 1), capacity_(available_) {}

    PermitPool(const PermitPool&) = delete;
    PermitPool& operator=(const PermitPool&) = delete;

    // Blocks until a permit is free. Returns false if cancelled first.
    bool acquire(const CancelToken& token) {
        std::unique_lock<std::mutex> lock(mutex_);
        while (available_ == 0) {
            if (token.isCancelled()) return false;
            cv_.wait_for(lock, std::chrono::milliseconds(50));
        }
        if (token.isCancelled()) return false;
        --available_;
        return true;
    }

    void release() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (available_ < capacity_) ++available_;
        }
        cv_.notify_one();
    }

    // Wakes waiters so they re-check their cancellation tokens.
    void interrupt() { cv_.notify_all(); }

    int available() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return available_;
    }

    int capacity() const { return capacity_; }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    int available_;
    const int capacity_;
};

}  // namespace swiftget
