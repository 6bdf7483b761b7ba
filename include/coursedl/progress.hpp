#pragma once

#include "transfer_status.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace coursedl {

struct ProgressEvent {
    std::string task_id;
    TransferStatus status{TransferStatus::Queued};
    std::uint64_t bytes_downloaded{0};
    std::optional<std::uint64_t> total_bytes;
    std::int64_t timestamp{0}; // unix epoch milliseconds
};

// Called from the coordinator thread only.
using ProgressSink = std::function<void(const ProgressEvent&)>;

} // namespace coursedl
