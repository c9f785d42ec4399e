#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace lucid::anchor {

/// One-shot stop request that wakes anyone waiting on it.
class StopSignal {
public:
    StopSignal() = default;
    StopSignal(const StopSignal&) = delete;
    StopSignal& operator=(const StopSignal&) = delete;

    void Request() {
        {
            std::lock_guard guard(lock_);
            requested_ = true;
        }
        changed_.notify_all();
    }

    [[nodiscard]] bool Requested() const {
        std::lock_guard guard(lock_);
        return requested_;
    }

    /// Blocks for up to @p delay. Returns true as soon as a stop is requested.
    [[nodiscard]] bool WaitFor(const std::chrono::milliseconds delay) const {
        std::unique_lock guard(lock_);
        return changed_.wait_for(guard, delay, [this] { return requested_; });
    }

private:
    mutable std::mutex lock_;
    mutable std::condition_variable changed_;
    bool requested_ = false;
};

}
