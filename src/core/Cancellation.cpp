#include "mockapic/Cancellation.hpp"

#include <algorithm>

namespace mockapic {

void CancellationSource::cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_.store(true);
    }
    cv_.notify_all();
}

bool CancellationSource::waitFor(std::chrono::nanoseconds timeout,
                                 const std::function<bool()>& abandoned,
                                 std::chrono::milliseconds pollEvery) const {
    using clock = std::chrono::steady_clock;
    const auto deadline = clock::now() + timeout;

    std::unique_lock<std::mutex> lock(mutex_);
    while (!cancelled_.load()) {
        auto now = clock::now();
        if (now >= deadline) return true;

        auto until = deadline;
        if (abandoned) until = std::min(deadline, now + pollEvery);
        cv_.wait_until(lock, until, [this] { return cancelled_.load(); });

        if (!cancelled_.load() && abandoned && clock::now() < deadline) {
            lock.unlock();
            bool gone = abandoned();
            lock.lock();
            if (gone) return false;
        }
    }
    return false;
}

} // namespace mockapic
