#include "coursedl/curl_http_client.hpp"
#include "coursedl/detail/curl_utils.hpp"
#include "coursedl/log.hpp"

#include <algorithm>
#include <cctype>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

#include <curl/curl.h>
#include <fmt/format.h>

namespace coursedl {

namespace {

using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
using HeaderSlist = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

struct TransferContext {
    ResponseHandler* handler{nullptr};
    CURL* curl{nullptr};
    HttpResponseHead head;
    bool head_delivered{false};
    bool aborted{false};
};

bool startsWithNoCase(const std::string& text, const char* prefix) {
    const std::size_t len = std::char_traits<char>::length(prefix);
    if (text.size() < len) {
        return false;
    }
    for (std::size_t i = 0; i < len; ++i) {
        if (std::tolower(static_cast<unsigned char>(text[i])) != std::tolower(static_cast<unsigned char>(prefix[i]))) {
            return false;
        }
    }
    return true;
}

bool deliverHead(TransferContext& ctx) {
    if (ctx.head_delivered) {
        return !ctx.aborted;
    }
    ctx.head_delivered = true;

    long code = 0;
    curl_easy_getinfo(ctx.curl, CURLINFO_RESPONSE_CODE, &code);
    ctx.head.status = code;

    if (!ctx.head.content_length) {
        curl_off_t length = -1;
        if (curl_easy_getinfo(ctx.curl, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length) == CURLE_OK && length >= 0) {
            ctx.head.content_length = static_cast<std::uint64_t>(length);
        }
    }

    if (!ctx.handler->onResponse(ctx.head)) {
        ctx.aborted = true;
    }
    return !ctx.aborted;
}

size_t headerCallback(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* ctx = static_cast<TransferContext*>(userdata);
    const size_t total = size * nitems;
    if (!ctx) {
        return 0;
    }

    std::string line(buffer, total);
    if (startsWithNoCase(line, "HTTP/")) {
        // Each redirect hop starts a new response; only the last one counts.
        ctx->head = HttpResponseHead{};
    } else if (startsWithNoCase(line, "Content-Range:")) {
        ctx->head.content_range = parseContentRange(line.substr(14));
    } else if (startsWithNoCase(line, "Content-Length:")) {
        try {
            ctx->head.content_length = std::stoull(line.substr(15));
        } catch (const std::exception&) {
            ctx->head.content_length.reset();
        }
    }
    return total;
}

size_t writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* ctx = static_cast<TransferContext*>(userdata);
    const size_t total = size * nmemb;
    if (!ctx || !deliverHead(*ctx)) {
        return 0;
    }
    if (total == 0) {
        return 0;
    }
    if (!ctx->handler->onBody(ptr, total)) {
        ctx->aborted = true;
        return 0;
    }
    return total;
}

int progressCallback(void* clientp, curl_off_t /*dltotal*/, curl_off_t /*dlnow*/, curl_off_t /*ultotal*/,
                     curl_off_t /*ulnow*/) {
    auto* ctx = static_cast<TransferContext*>(clientp);
    if (!ctx || ctx->handler->keepWaiting()) {
        return 0;
    }
    ctx->aborted = true;
    return 1;
}

TransportError mapCurlCode(CURLcode code) {
    switch (code) {
        case CURLE_OK:
            return TransportError::None;
        case CURLE_OPERATION_TIMEDOUT:
            return TransportError::Timeout;
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_CONNECT:
        case CURLE_SSL_CONNECT_ERROR:
            return TransportError::ConnectFailed;
        case CURLE_PARTIAL_FILE:
        case CURLE_GOT_NOTHING:
        case CURLE_SEND_ERROR:
        case CURLE_RECV_ERROR:
            return TransportError::ConnectionReset;
        case CURLE_HTTP2:
        case CURLE_HTTP2_STREAM:
        case CURLE_BAD_CONTENT_ENCODING:
        case CURLE_WEIRD_SERVER_REPLY:
            return TransportError::Protocol;
        case CURLE_UNSUPPORTED_PROTOCOL:
        case CURLE_URL_MALFORMAT:
            return TransportError::BadUrl;
        case CURLE_ABORTED_BY_CALLBACK:
            return TransportError::Aborted;
        default:
            return TransportError::Other;
    }
}

} // namespace

CurlHttpClient::CurlHttpClient(std::string user_agent) : user_agent_(std::move(user_agent)) {
    detail::ensureCurlInitialized();
}

HttpResult CurlHttpClient::get(const HttpRequest& request, ResponseHandler& handler) {
    HttpResult result;

    CurlHandle curl{curl_easy_init(), &curl_easy_cleanup};
    if (!curl) {
        result.error = TransportError::Other;
        result.message = "Failed to allocate curl handle";
        return result;
    }

    HeaderSlist header_list{nullptr, &curl_slist_free_all};
    for (const auto& [name, value] : request.headers) {
        const std::string line = fmt::format("{}: {}", name, value);
        curl_slist* appended = curl_slist_append(header_list.get(), line.c_str());
        if (!appended) {
            result.error = TransportError::Other;
            result.message = "Failed to build request headers";
            return result;
        }
        header_list.release();
        header_list.reset(appended);
    }

    TransferContext ctx;
    ctx.handler = &handler;
    ctx.curl = curl.get();

    // The read timeout is expressed as "less than 1 byte/s for N seconds".
    const long low_speed_seconds =
        std::max<long>(1, static_cast<long>((request.read_timeout.count() + 999) / 1000));
    const std::string range = request.range_start ? fmt::format("{}-", *request.range_start) : std::string{};

    curl_easy_setopt(curl.get(), CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_MAXREDIRS, 10L);
    // Also called about once a second on a stalled connection, so a stop
    // request does not wait for the next body bytes.
    curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, &progressCallback);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &ctx);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(request.connect_timeout.count()));
    curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_TIME, low_speed_seconds);
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, user_agent_.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, &headerCallback);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &ctx);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &writeCallback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &ctx);
    if (header_list) {
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, header_list.get());
    }
    if (!range.empty()) {
        curl_easy_setopt(curl.get(), CURLOPT_RANGE, range.c_str());
    }

    const CURLcode res = curl_easy_perform(curl.get());

    // Responses without a body never reach the write callback.
    if (res == CURLE_OK && !ctx.head_delivered) {
        deliverHead(ctx);
    }

    long code = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &code);
    result.status = code;

    if (ctx.aborted) {
        result.error = TransportError::Aborted;
        result.message = "transfer aborted by handler";
    } else if (res != CURLE_OK) {
        result.error = mapCurlCode(res);
        result.message = fmt::format("curl error: {}", curl_easy_strerror(res));
        log::get()->debug("GET {} failed: {}", request.url, result.message);
    }
    return result;
}

} // namespace coursedl
