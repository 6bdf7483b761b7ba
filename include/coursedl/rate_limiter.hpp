#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>

namespace coursedl {

// Token bucket shared by every worker of a run. Capacity is `burst` bytes,
// never more than one second of tokens, so any 1 s window grants at most
// rate + burst. The bucket starts empty and refills continuously.
class RateLimiter {
public:
    static constexpr std::size_t kDefaultBurst = 64 * 1024;

    explicit RateLimiter(std::optional<std::uint64_t> bytes_per_sec, std::size_t burst = kDefaultBurst);

    // Blocks until `bytes` tokens were debited. Returns immediately when unlimited.
    void acquire(std::uint64_t bytes);

    [[nodiscard]] bool limited() const noexcept { return rate_.has_value(); }
    [[nodiscard]] std::uint64_t capacity() const noexcept { return capacity_; }
    [[nodiscard]] std::uint64_t grantedBytes() const noexcept { return granted_.load(); }

private:
    // Takes `bytes` tokens if available, otherwise reports how long to wait.
    bool tryTake(std::uint64_t bytes, std::chrono::nanoseconds& wait);

    std::optional<std::uint64_t> rate_;
    std::uint64_t capacity_{0};
    double tokens_{0.0};
    std::chrono::steady_clock::time_point last_refill_;
    std::mutex mutex_;
    std::atomic<std::uint64_t> granted_{0};
};

} // namespace coursedl
