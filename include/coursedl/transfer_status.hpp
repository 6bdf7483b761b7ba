#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace coursedl {

enum class TransferStatus {
    Queued,
    InProgress,
    Completed,
    Failed,
    Paused,
    Skipped
};

[[nodiscard]] const char* statusLabel(TransferStatus status) noexcept;
[[nodiscard]] std::optional<TransferStatus> parseStatus(const std::string& label);

// Completed, Failed and Skipped end a task for the current run.
[[nodiscard]] bool isTerminal(TransferStatus status) noexcept;

struct ResumeRecord {
    std::string task_id;
    TransferStatus status{TransferStatus::Queued};
    std::uint64_t bytes_downloaded{0};
    std::optional<std::uint64_t> total_bytes;
    std::optional<std::string> checksum;
    std::uint32_t attempt_count{0};
    std::int64_t updated_at{0}; // unix epoch milliseconds
    std::optional<std::string> last_error;
    std::string destination;
};

[[nodiscard]] std::int64_t nowEpochMillis();

} // namespace coursedl
