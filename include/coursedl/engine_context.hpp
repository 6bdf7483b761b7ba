#pragma once

#include "cancellation.hpp"
#include "config.hpp"
#include "content_resolver.hpp"
#include "http_client.hpp"
#include "progress.hpp"
#include "rate_limiter.hpp"
#include "retry_policy.hpp"
#include "status_store.hpp"
#include "validator.hpp"

#include <memory>

namespace coursedl {

// Everything one engine run shares: configuration, the status store, the rate
// limiter, retry policy, validator, HTTP client, resolvers and the stop token.
class EngineContext {
public:
    // Validates `config` (std::invalid_argument) and loads the status store.
    // A null client selects CurlHttpClient.
    explicit EngineContext(EngineConfig config, std::shared_ptr<HttpClient> client = nullptr);

    EngineContext(const EngineContext&) = delete;
    EngineContext& operator=(const EngineContext&) = delete;

    [[nodiscard]] const EngineConfig& config() const noexcept { return config_; }
    [[nodiscard]] LoadSource loadSource() const noexcept { return load_source_; }

    [[nodiscard]] StatusStore& store() noexcept { return store_; }
    [[nodiscard]] const StatusStore& store() const noexcept { return store_; }
    [[nodiscard]] RateLimiter& rateLimiter() noexcept { return rate_limiter_; }
    [[nodiscard]] RetryPolicy& retryPolicy() noexcept { return retry_policy_; }
    [[nodiscard]] const Validator& validator() const noexcept { return validator_; }
    [[nodiscard]] HttpClient& http() noexcept { return *http_; }
    [[nodiscard]] ResolverRegistry& resolvers() noexcept { return resolvers_; }
    [[nodiscard]] CancellationToken& cancellation() noexcept { return cancellation_; }

    void setProgressSink(ProgressSink sink);
    // Forwards to the sink, if any. Sink exceptions are logged.
    void emit(const ProgressEvent& event) const;

private:
    EngineConfig config_;
    StatusStore store_;
    LoadSource load_source_{LoadSource::Empty};
    RateLimiter rate_limiter_;
    RetryPolicy retry_policy_;
    Validator validator_;
    std::shared_ptr<HttpClient> http_;
    ResolverRegistry resolvers_;
    CancellationToken cancellation_;
    ProgressSink sink_;
};

} // namespace coursedl
