#pragma once

#include "download_task.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace coursedl {

struct HttpRequest {
    std::string url;
    HeaderList headers;
    // Sends "Range: bytes=<start>-" when set.
    std::optional<std::uint64_t> range_start;
    std::chrono::milliseconds connect_timeout{15000};
    // No bytes for this long aborts the transfer.
    std::chrono::milliseconds read_timeout{60000};
};

struct ContentRange {
    std::uint64_t start{0};
    std::uint64_t end{0};
    std::optional<std::uint64_t> total;
};

// Parses "bytes <start>-<end>/<total|*>".
[[nodiscard]] std::optional<ContentRange> parseContentRange(const std::string& value);

struct HttpResponseHead {
    long status{0};
    std::optional<std::uint64_t> content_length;
    std::optional<ContentRange> content_range;
};

// Receives one response. Returning false from either callback aborts the transfer.
class ResponseHandler {
public:
    virtual ~ResponseHandler() = default;

    virtual bool onResponse(const HttpResponseHead& head) = 0;
    virtual bool onBody(const char* data, std::size_t size) = 0;

    // Polled while the transfer is idle or waiting for data. Returning false aborts it.
    virtual bool keepWaiting() { return true; }
};

enum class TransportError {
    None,
    Timeout,
    ConnectFailed,
    ConnectionReset,
    Protocol,
    BadUrl,
    Aborted,
    Other
};

[[nodiscard]] const char* transportErrorLabel(TransportError error) noexcept;

struct HttpResult {
    TransportError error{TransportError::None};
    long status{0};
    std::string message;

    [[nodiscard]] bool ok() const noexcept { return error == TransportError::None; }
};

class HttpClient {
public:
    virtual ~HttpClient() = default;

    // Streams one GET. Transport failures are reported in the result, never thrown.
    virtual HttpResult get(const HttpRequest& request, ResponseHandler& handler) = 0;
};

} // namespace coursedl
