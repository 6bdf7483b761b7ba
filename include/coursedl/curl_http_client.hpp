#pragma once

#include "http_client.hpp"

#include <string>

namespace coursedl {

// libcurl-backed client. One easy handle per request, so a single instance
// can be shared by all workers.
class CurlHttpClient : public HttpClient {
public:
    explicit CurlHttpClient(std::string user_agent);

    HttpResult get(const HttpRequest& request, ResponseHandler& handler) override;

private:
    std::string user_agent_;
};

} // namespace coursedl
