#include "coursedl/cancellation.hpp"

namespace coursedl {

void CancellationToken::requestStop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopped_.store(true, std::memory_order_release);
    }
    cv_.notify_all();
}

void CancellationToken::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    stopped_.store(false, std::memory_order_release);
}

bool CancellationToken::waitFor(std::chrono::milliseconds duration) {
    if (duration.count() <= 0) {
        return stopRequested();
    }
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, duration, [this] { return stopRequested(); });
}

} // namespace coursedl
