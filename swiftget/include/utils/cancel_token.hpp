#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace swiftget {

/**
 * Cooperative cancellation flag shared by every copy of the token.
 * Long waits (backoff, permit acquisition) use waitFor() so that cancel()
 * wakes them up instead of letting them sleep to the end.
 */
class CancelToken {
public:
    CancelToken() : state_(std::make_shared<State>()) {}

    void cancel() {
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            state_->cancelled.store(true);
        }
        state_->cv.notify_all();
    }

    bool isCancelled() const { return state_->cancelled.load(); }

    // Returns true if the token was cancelled before the timeout expired.
    bool waitFor(std::chrono::milliseconds timeout) const {
        std::unique_lock<std::mutex> lock(state_->mutex);
        return state_->cv.wait_for(lock, timeout, [this] { return state_->cancelled.load(); });
    }

private:
    struct State {
        std::atomic<bool> cancelled{false};
        std::mutex mutex;
        std::condition_variable cv;
    };

    std::shared_ptr<State> state_;
};

}  // namespace swiftget
