#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace coursedl {

constexpr int kMinConcurrency = 1;
constexpr int kMaxConcurrency = 10;
constexpr int kMinRetryAttempts = 1;
constexpr int kMaxRetryAttempts = 10;

struct EngineConfig {
    int concurrency{3};
    int retry_attempts{3};

    std::chrono::milliseconds connect_timeout{15000};
    std::chrono::milliseconds read_timeout{60000};

    // Aggregate ceiling across all workers; unset means unlimited.
    std::optional<std::uint64_t> rate_limit_bytes_per_sec;

    // Pause a worker takes before each task after its first.
    std::chrono::milliseconds inter_task_delay{1000};

    bool validate_integrity{true};
    bool resume_on_restart{true};

    std::chrono::milliseconds retry_base_delay{1000};
    std::chrono::milliseconds retry_max_delay{30000};

    std::size_t chunk_size{64 * 1024};

    std::chrono::milliseconds progress_flush_interval{1000};
    std::uint64_t progress_flush_bytes{4ULL * 1024 * 1024};

    // Empty keeps the status store in memory only.
    std::filesystem::path status_file;

    std::string checksum_algorithm{"md5"};
    std::string user_agent{"coursedl/1.0"};
};

// Throws std::invalid_argument describing the first out-of-range option.
void validateConfig(const EngineConfig& config);

} // namespace coursedl
