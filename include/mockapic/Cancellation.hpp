#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>

namespace mockapic {

// Shared stop signal for timed waits. cancel() wakes every waiter at once.
class CancellationSource {
public:
    void cancel();
    bool isCancelled() const { return cancelled_.load(); }

    // Waits up to `timeout`. Returns true if the full timeout elapsed, false
    // if cancelled first. `abandoned`, when set, is polled every `pollEvery`
    // and ends the wait early the same way cancel() does.
    bool waitFor(std::chrono::nanoseconds timeout,
                 const std::function<bool()>& abandoned = {},
                 std::chrono::milliseconds pollEvery = std::chrono::milliseconds(100)) const;

private:
    std::atomic<bool> cancelled_{false};
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
};

} // namespace mockapic
