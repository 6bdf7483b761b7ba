#include "coursedl/detail/curl_utils.hpp"
#include "coursedl/log.hpp"

#include <cstdlib>
#include <mutex>
#include <stdexcept>
#include <string>

#include <curl/curl.h>

namespace coursedl::detail {

void ensureCurlInitialized() {
    static std::once_flag flag;
    std::call_once(flag, [] {
        const CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
        if (rc != CURLE_OK) {
            throw std::runtime_error(std::string{"Failed to initialize libcurl: "} + curl_easy_strerror(rc));
        }
        std::atexit([] { curl_global_cleanup(); });
        log::get()->debug("libcurl initialized: {}", curl_version());
    });
}

} // namespace coursedl::detail
