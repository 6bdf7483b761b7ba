#pragma once

#include <optional>
#include <stdexcept>
#include <string>

namespace coursedl {

enum class ErrorKind {
    TransientNetwork,  // timeouts, resets, 5xx, 429
    RangeUnsupported,  // server ignored or rejected a byte range
    IntegrityMismatch, // size or checksum differs after transfer
    AuthExpired,       // 401 / 403
    Client,            // other 4xx, malformed URL, unsupported protocol
    LocalIo,           // destination could not be opened or written
    Persistence,       // status document could not be written
    Cancelled
};

[[nodiscard]] const char* errorKindLabel(ErrorKind kind) noexcept;

struct TransferError {
    ErrorKind kind{ErrorKind::TransientNetwork};
    long http_status{0};
    std::string message;

    [[nodiscard]] std::string describe() const;
};

// Maps a non-success HTTP status to an error. Returns nullopt for 2xx.
[[nodiscard]] std::optional<TransferError> classifyHttpStatus(long status);

class StatusStoreError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class ResolveError : public std::runtime_error {
public:
    ResolveError(const std::string& message, bool retryable = false)
        : std::runtime_error(message), retryable_(retryable) {}

    [[nodiscard]] bool retryable() const noexcept { return retryable_; }

private:
    bool retryable_;
};

} // namespace coursedl
