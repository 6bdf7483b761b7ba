#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace coursedl {

// Cooperative stop flag shared by the coordinator and all workers.
class CancellationToken {
public:
    void requestStop();
    void reset();

    [[nodiscard]] bool stopRequested() const noexcept { return stopped_.load(std::memory_order_acquire); }

    // Sleeps for `duration` unless a stop is requested first. Returns true if stopped.
    bool waitFor(std::chrono::milliseconds duration);

private:
    std::atomic<bool> stopped_{false};
    std::mutex mutex_;
    std::condition_variable cv_;
};

} // namespace coursedl
