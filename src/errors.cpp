#include "coursedl/errors.hpp"

#include <fmt/format.h>

namespace coursedl {

const char* errorKindLabel(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::TransientNetwork: return "TransientNetwork";
        case ErrorKind::RangeUnsupported: return "RangeUnsupported";
        case ErrorKind::IntegrityMismatch: return "IntegrityMismatch";
        case ErrorKind::AuthExpired: return "AuthExpired";
        case ErrorKind::Client: return "Client";
        case ErrorKind::LocalIo: return "LocalIo";
        case ErrorKind::Persistence: return "Persistence";
        case ErrorKind::Cancelled: return "Cancelled";
    }
    return "Unknown";
}

std::string TransferError::describe() const {
    if (http_status > 0) {
        return fmt::format("{} (HTTP {}): {}", errorKindLabel(kind), http_status, message);
    }
    return fmt::format("{}: {}", errorKindLabel(kind), message);
}

std::optional<TransferError> classifyHttpStatus(long status) {
    if (status >= 200 && status < 300) {
        return std::nullopt;
    }

    TransferError error;
    error.http_status = status;
    if (status == 401 || status == 403) {
        error.kind = ErrorKind::AuthExpired;
        error.message = "credentials rejected by server";
    } else if (status == 416) {
        error.kind = ErrorKind::RangeUnsupported;
        error.message = "requested range not satisfiable";
    } else if (status == 429) {
        error.kind = ErrorKind::TransientNetwork;
        error.message = "server is rate limiting requests";
    } else if (status >= 500 && status < 600) {
        error.kind = ErrorKind::TransientNetwork;
        error.message = "server error";
    } else if (status >= 400 && status < 500) {
        error.kind = ErrorKind::Client;
        error.message = "request rejected by server";
    } else {
        error.kind = ErrorKind::Client;
        error.message = "unexpected response status";
    }
    return error;
}

} // namespace coursedl
