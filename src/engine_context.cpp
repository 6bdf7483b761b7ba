#include "coursedl/engine_context.hpp"
#include "coursedl/curl_http_client.hpp"
#include "coursedl/log.hpp"

#include <exception>
#include <utility>

namespace coursedl {

namespace {

const EngineConfig& checked(const EngineConfig& config) {
    validateConfig(config);
    return config;
}

} // namespace

EngineContext::EngineContext(EngineConfig config, std::shared_ptr<HttpClient> client)
    : config_(checked(config)),
      store_(config_.status_file),
      rate_limiter_(config_.rate_limit_bytes_per_sec, config_.chunk_size),
      retry_policy_(static_cast<std::uint32_t>(config_.retry_attempts), config_.retry_base_delay,
                    config_.retry_max_delay),
      validator_(config_.validate_integrity, config_.checksum_algorithm),
      http_(client ? std::move(client) : std::make_shared<CurlHttpClient>(config_.user_agent)) {
    load_source_ = store_.load();
    log::get()->debug("status store {} loaded from {} ({} records)", config_.status_file.string(),
                      loadSourceLabel(load_source_), store_.size());
}

void EngineContext::setProgressSink(ProgressSink sink) {
    sink_ = std::move(sink);
}

void EngineContext::emit(const ProgressEvent& event) const {
    if (!sink_) {
        return;
    }
    try {
        sink_(event);
    } catch (const std::exception& ex) {
        log::get()->warn("progress sink failed for task {}: {}", event.task_id, ex.what());
    }
}

} // namespace coursedl
