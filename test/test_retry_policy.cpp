#include <catch2/catch.hpp>

#include "coursedl/retry_policy.hpp"

using namespace coursedl;
using std::chrono::milliseconds;

namespace {

TransferError errorOf(ErrorKind kind) {
    return TransferError{kind, 0, "test"};
}

} // namespace

TEST_CASE("RetryPolicy classifies error kinds", "[retry]") {
    CHECK(RetryPolicy::isRetryable(errorOf(ErrorKind::TransientNetwork)));
    CHECK(RetryPolicy::isRetryable(errorOf(ErrorKind::RangeUnsupported)));
    CHECK(RetryPolicy::isRetryable(errorOf(ErrorKind::IntegrityMismatch)));
    CHECK(RetryPolicy::isRetryable(errorOf(ErrorKind::LocalIo)));
    CHECK_FALSE(RetryPolicy::isRetryable(errorOf(ErrorKind::AuthExpired)));
    CHECK_FALSE(RetryPolicy::isRetryable(errorOf(ErrorKind::Client)));
    CHECK_FALSE(RetryPolicy::isRetryable(errorOf(ErrorKind::Cancelled)));
}

TEST_CASE("RetryPolicy backoff doubles, caps and adds bounded jitter", "[retry]") {
    RetryPolicy policy(5, milliseconds(100), milliseconds(1000), 42);

    for (int i = 0; i < 50; ++i) {
        const auto first = policy.backoffDelay(0);
        CHECK(first >= milliseconds(100));
        CHECK(first < milliseconds(200));

        const auto third = policy.backoffDelay(2);
        CHECK(third >= milliseconds(400));
        CHECK(third < milliseconds(800));

        const auto capped = policy.backoffDelay(10);
        CHECK(capped >= milliseconds(1000));
        CHECK(capped < milliseconds(2000));
    }

    CHECK(policy.backoffDelay(1000) >= milliseconds(1000));
}

TEST_CASE("RetryPolicy with a zero base delay retries immediately", "[retry]") {
    RetryPolicy policy(3, milliseconds(0), milliseconds(30000));
    CHECK(policy.backoffDelay(0) == milliseconds(0));
    CHECK(policy.backoffDelay(7) == milliseconds(0));
}

TEST_CASE("RetryPolicy decide counts attempts up to the budget", "[retry]") {
    RetryPolicy policy(3, milliseconds(10), milliseconds(100), 1);
    const auto transient = errorOf(ErrorKind::TransientNetwork);

    auto decision = policy.decide(transient, 0);
    CHECK(decision.retry);
    CHECK(decision.attempt_count == 1);
    CHECK(decision.delay >= milliseconds(10));

    decision = policy.decide(transient, 1);
    CHECK(decision.retry);
    CHECK(decision.attempt_count == 2);
    CHECK(decision.delay >= milliseconds(20));

    decision = policy.decide(transient, 2);
    CHECK_FALSE(decision.retry);
    CHECK(decision.attempt_count == 3);
}

TEST_CASE("RetryPolicy fails fatal errors without consuming budget", "[retry]") {
    RetryPolicy policy(3, milliseconds(10), milliseconds(100));

    const auto decision = policy.decide(errorOf(ErrorKind::AuthExpired), 1);
    CHECK_FALSE(decision.retry);
    CHECK(decision.attempt_count == 1);
}
