#pragma once

#include "errors.hpp"

#include <chrono>
#include <cstdint>
#include <mutex>
#include <random>

namespace coursedl {

struct RetryDecision {
    bool retry{false};
    std::chrono::milliseconds delay{0};
    // Attempt count to persist; unchanged for non-retryable errors.
    std::uint32_t attempt_count{0};
};

class RetryPolicy {
public:
    RetryPolicy(std::uint32_t max_attempts,
                std::chrono::milliseconds base_delay,
                std::chrono::milliseconds max_delay,
                std::uint32_t seed = std::random_device{}());

    [[nodiscard]] static bool isRetryable(const TransferError& error) noexcept;

    // min(base * 2^attempt_count, max) plus jitter drawn from [0, delay).
    [[nodiscard]] std::chrono::milliseconds backoffDelay(std::uint32_t attempt_count);

    // `attempt_count` is the persisted count before this failure.
    [[nodiscard]] RetryDecision decide(const TransferError& error, std::uint32_t attempt_count);

    [[nodiscard]] std::uint32_t maxAttempts() const noexcept { return max_attempts_; }

private:
    std::uint32_t max_attempts_;
    std::chrono::milliseconds base_delay_;
    std::chrono::milliseconds max_delay_;
    std::mt19937 rng_;
    std::mutex rng_mutex_;
};

} // namespace coursedl
