#pragma once

#include "download_task.hpp"
#include "errors.hpp"
#include "transfer_status.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace coursedl {

class EngineContext;

struct TransferOutcome {
    enum class Kind {
        Success,   // artifact written and validated
        Skip,      // artifact was already complete on disk, nothing fetched
        Retryable,
        Fatal,
        Cancelled  // stopped at a chunk boundary, partial bytes kept
    };

    Kind kind{Kind::Fatal};
    std::optional<TransferError> error;
    std::string skip_reason;
    std::uint64_t bytes_on_disk{0};
    std::optional<std::uint64_t> total_bytes;
    std::optional<std::string> checksum;
    // The partial file is unusable; the next attempt must start at offset 0.
    bool restart_from_zero{false};
};

[[nodiscard]] const char* outcomeLabel(TransferOutcome::Kind kind) noexcept;

struct AttemptOptions {
    bool force_restart{false};
};

// (bytes on disk, total if known)
using ByteProgress = std::function<void(std::uint64_t, std::optional<std::uint64_t>)>;

// Runs single transfer attempts. Never throws; every failure becomes an outcome.
class TransferExecutor {
public:
    explicit TransferExecutor(EngineContext& context);

    // `record` is what the store knows about the task before this attempt.
    TransferOutcome execute(const DownloadTask& task,
                            const ResumeRecord& record,
                            const AttemptOptions& options,
                            const ByteProgress& progress);

private:
    EngineContext& context_;
};

} // namespace coursedl
