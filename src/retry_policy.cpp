#include "coursedl/retry_policy.hpp"

#include <algorithm>

namespace coursedl {

RetryPolicy::RetryPolicy(std::uint32_t max_attempts,
                         std::chrono::milliseconds base_delay,
                         std::chrono::milliseconds max_delay,
                         std::uint32_t seed)
    : max_attempts_(std::max<std::uint32_t>(1, max_attempts)),
      base_delay_(base_delay),
      max_delay_(std::max(base_delay, max_delay)),
      rng_(seed) {}

bool RetryPolicy::isRetryable(const TransferError& error) noexcept {
    switch (error.kind) {
        case ErrorKind::TransientNetwork:
        case ErrorKind::RangeUnsupported:
        case ErrorKind::IntegrityMismatch:
        case ErrorKind::LocalIo:
            return true;
        case ErrorKind::AuthExpired:
        case ErrorKind::Client:
        case ErrorKind::Persistence:
        case ErrorKind::Cancelled:
            return false;
    }
    return false;
}

std::chrono::milliseconds RetryPolicy::backoffDelay(std::uint32_t attempt_count) {
    // Cap the exponent before shifting so large counts cannot overflow.
    const std::uint32_t exponent = std::min<std::uint32_t>(attempt_count, 30);
    const long long base = base_delay_.count();
    if (base <= 0) {
        return std::chrono::milliseconds{0};
    }
    long long delay = max_delay_.count();
    if (base <= (max_delay_.count() >> exponent)) {
        delay = base << exponent;
    }
    delay = std::min(delay, static_cast<long long>(max_delay_.count()));
    if (delay <= 0) {
        return std::chrono::milliseconds{0};
    }

    std::lock_guard<std::mutex> lock(rng_mutex_);
    std::uniform_int_distribution<long long> jitter(0, delay - 1);
    return std::chrono::milliseconds{delay + jitter(rng_)};
}

RetryDecision RetryPolicy::decide(const TransferError& error, std::uint32_t attempt_count) {
    RetryDecision decision;
    decision.attempt_count = attempt_count;
    if (!isRetryable(error)) {
        return decision;
    }

    decision.attempt_count = attempt_count + 1;
    if (decision.attempt_count >= max_attempts_) {
        return decision;
    }

    decision.retry = true;
    decision.delay = backoffDelay(attempt_count);
    return decision;
}

} // namespace coursedl
