#include "coursedl/config.hpp"

#include <stdexcept>

#include <fmt/format.h>

namespace coursedl {

void validateConfig(const EngineConfig& config) {
    if (config.concurrency < kMinConcurrency || config.concurrency > kMaxConcurrency) {
        throw std::invalid_argument(fmt::format("concurrency must be between {} and {}, got {}",
                                                kMinConcurrency, kMaxConcurrency, config.concurrency));
    }
    if (config.retry_attempts < kMinRetryAttempts || config.retry_attempts > kMaxRetryAttempts) {
        throw std::invalid_argument(fmt::format("retry_attempts must be between {} and {}, got {}",
                                                kMinRetryAttempts, kMaxRetryAttempts, config.retry_attempts));
    }
    if (config.connect_timeout.count() <= 0 || config.read_timeout.count() <= 0) {
        throw std::invalid_argument("timeouts must be positive");
    }
    if (config.rate_limit_bytes_per_sec && *config.rate_limit_bytes_per_sec == 0) {
        throw std::invalid_argument("rate limit must be positive when set");
    }
    if (config.inter_task_delay.count() < 0) {
        throw std::invalid_argument("inter_task_delay must not be negative");
    }
    if (config.retry_base_delay.count() < 0 || config.retry_max_delay < config.retry_base_delay) {
        throw std::invalid_argument("retry delays must satisfy 0 <= base <= max");
    }
    if (config.chunk_size == 0) {
        throw std::invalid_argument("chunk_size must be positive");
    }
    if (config.checksum_algorithm.empty()) {
        throw std::invalid_argument("checksum_algorithm must not be empty");
    }
}

} // namespace coursedl
