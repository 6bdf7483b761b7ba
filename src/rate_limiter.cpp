#include "coursedl/rate_limiter.hpp"

#include <algorithm>
#include <thread>

namespace coursedl {

RateLimiter::RateLimiter(std::optional<std::uint64_t> bytes_per_sec, std::size_t burst)
    : rate_(bytes_per_sec),
      last_refill_(std::chrono::steady_clock::now()) {
    if (rate_ && *rate_ == 0) {
        rate_.reset();
    }
    if (rate_) {
        capacity_ = std::max<std::uint64_t>(1, std::min<std::uint64_t>(*rate_, burst));
    }
}

void RateLimiter::acquire(std::uint64_t bytes) {
    if (!rate_) {
        granted_ += bytes;
        return;
    }

    std::uint64_t remaining = bytes;
    while (remaining > 0) {
        const std::uint64_t slice = std::min(remaining, capacity_);
        std::chrono::nanoseconds wait{0};
        while (!tryTake(slice, wait)) {
            std::this_thread::sleep_for(wait);
        }
        granted_ += slice;
        remaining -= slice;
    }
}

bool RateLimiter::tryTake(std::uint64_t bytes, std::chrono::nanoseconds& wait) {
    std::lock_guard<std::mutex> lock(mutex_);

    const auto now = std::chrono::steady_clock::now();
    const std::chrono::duration<double> elapsed = now - last_refill_;
    last_refill_ = now;

    const double rate = static_cast<double>(*rate_);
    tokens_ = std::min(static_cast<double>(capacity_), tokens_ + elapsed.count() * rate);

    const double needed = static_cast<double>(bytes);
    if (tokens_ >= needed) {
        tokens_ -= needed;
        return true;
    }

    const double missing_sec = (needed - tokens_) / rate;
    wait = std::max(std::chrono::nanoseconds{1000},
                    std::chrono::duration_cast<std::chrono::nanoseconds>(
                        std::chrono::duration<double>(missing_sec)));
    return false;
}

} // namespace coursedl
