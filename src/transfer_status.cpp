#include "coursedl/transfer_status.hpp"

#include <chrono>

namespace coursedl {

const char* statusLabel(TransferStatus status) noexcept {
    switch (status) {
        case TransferStatus::Queued: return "queued";
        case TransferStatus::InProgress: return "in_progress";
        case TransferStatus::Completed: return "completed";
        case TransferStatus::Failed: return "failed";
        case TransferStatus::Paused: return "paused";
        case TransferStatus::Skipped: return "skipped";
    }
    return "unknown";
}

std::optional<TransferStatus> parseStatus(const std::string& label) {
    if (label == "queued") return TransferStatus::Queued;
    if (label == "in_progress") return TransferStatus::InProgress;
    if (label == "completed") return TransferStatus::Completed;
    if (label == "failed") return TransferStatus::Failed;
    if (label == "paused") return TransferStatus::Paused;
    if (label == "skipped") return TransferStatus::Skipped;
    return std::nullopt;
}

bool isTerminal(TransferStatus status) noexcept {
    return status == TransferStatus::Completed || status == TransferStatus::Failed ||
           status == TransferStatus::Skipped;
}

std::int64_t nowEpochMillis() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

} // namespace coursedl
