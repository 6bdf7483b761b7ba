#include "coursedl/http_client.hpp"

#include <cctype>
#include <cstdlib>

namespace coursedl {

namespace {

std::optional<std::uint64_t> parseNumber(const std::string& text) {
    if (text.empty()) {
        return std::nullopt;
    }
    for (const char ch : text) {
        if (!std::isdigit(static_cast<unsigned char>(ch))) {
            return std::nullopt;
        }
    }
    return std::strtoull(text.c_str(), nullptr, 10);
}

std::string trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

} // namespace

std::optional<ContentRange> parseContentRange(const std::string& value) {
    const std::string text = trim(value);
    constexpr const char* kUnit = "bytes ";
    if (text.compare(0, 6, kUnit) != 0) {
        return std::nullopt;
    }

    const auto dash = text.find('-', 6);
    const auto slash = text.find('/', 6);
    if (dash == std::string::npos || slash == std::string::npos || dash > slash) {
        return std::nullopt;
    }

    const auto start = parseNumber(trim(text.substr(6, dash - 6)));
    const auto end = parseNumber(trim(text.substr(dash + 1, slash - dash - 1)));
    if (!start || !end || *end < *start) {
        return std::nullopt;
    }

    ContentRange range;
    range.start = *start;
    range.end = *end;
    const std::string total = trim(text.substr(slash + 1));
    if (total != "*") {
        range.total = parseNumber(total);
        if (!range.total) {
            return std::nullopt;
        }
    }
    return range;
}

const char* transportErrorLabel(TransportError error) noexcept {
    switch (error) {
        case TransportError::None: return "none";
        case TransportError::Timeout: return "timeout";
        case TransportError::ConnectFailed: return "connect failed";
        case TransportError::ConnectionReset: return "connection reset";
        case TransportError::Protocol: return "protocol error";
        case TransportError::BadUrl: return "bad url";
        case TransportError::Aborted: return "aborted";
        case TransportError::Other: return "transport error";
    }
    return "unknown";
}

} // namespace coursedl
