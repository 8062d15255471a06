#include <iostream>
#include <cassert>
#include <stdexcept>
#include "botfleet/resilience/retry_policy.hpp"
#include "test_support.hpp"

using namespace botfleet::resilience;
using botfleet::resilience::testing::make_observability;
using botfleet::resilience::testing::near;

namespace {

RetryConfig deterministic_config() {
    RetryConfig config;
    config.transient_network.jitter = false;
    config.unknown.jitter = false;
    return config;
}

CategoryRetryPolicy policy(BackoffStrategy strategy, int64_t base_ms, int64_t max_ms) {
    CategoryRetryPolicy p;
    p.strategy = strategy;
    p.base_delay = std::chrono::milliseconds(base_ms);
    p.max_delay = std::chrono::milliseconds(max_ms);
    p.exponential_base = 2.0;
    p.jitter = false;
    return p;
}

template <class E>
Classification classify_thrown(const ErrorClassifier& classifier, const E& e) {
    try {
        throw e;
    } catch (...) {
        return classifier.classify(std::current_exception());
    }
}

} // namespace

void test_transient_then_success() {
    std::cout << "Testing transient failures are retried..." << std::endl;

    auto clock = std::make_shared<ManualClock>();
    RetryExecutor retry(deterministic_config(), nullptr, clock, make_observability());

    int calls = 0;
    RetryTrace trace;
    int result = retry.run([&calls]() {
        if (++calls <= 2) {
            throw UpstreamError(ErrorCategory::transient_network, "connection reset");
        }
        return 42;
    }, &trace);

    assert(result == 42);
    assert(calls == 3);
    assert(trace.calls == 3);
    assert(trace.delays.size() == 2);
    assert(near(trace.delays[0], 1.0));
    assert(near(trace.delays[1], 2.0));
    auto sleeps = clock->sleeps();
    assert(sleeps.size() == 2);
    assert(near(sleeps[0], 1.0) && near(sleeps[1], 2.0));

    std::cout << "✓ Transient retry test passed" << std::endl;
}

void test_permanent_is_not_retried() {
    std::cout << "Testing permanent failures fail after one call..." << std::endl;

    auto clock = std::make_shared<ManualClock>();
    RetryExecutor retry(deterministic_config(), nullptr, clock, make_observability());

    int calls = 0;
    try {
        retry.run([&calls]() {
            ++calls;
            throw std::runtime_error("401 Unauthorized: auth_key revoked");
        });
        assert(false);
    } catch (const NonRetryableError& e) {
        assert(e.code() == ErrorCode::permanent);
        assert(e.original_message().find("401") != std::string::npos);
    }
    assert(calls == 1);
    assert(clock->sleeps().empty());

    std::cout << "✓ Permanent failure test passed" << std::endl;
}

void test_budget_exhaustion_rethrows_original() {
    std::cout << "Testing exhausted budget rethrows the original error..." << std::endl;

    auto clock = std::make_shared<ManualClock>();
    RetryExecutor retry(deterministic_config(), nullptr, clock, make_observability());

    int calls = 0;
    try {
        retry.run([&calls]() {
            ++calls;
            throw std::logic_error("something odd");
        });
        assert(false);
    } catch (const std::logic_error& e) {
        assert(std::string(e.what()) == "something odd");
    }
    // unknown: two retries
    assert(calls == 3);

    std::cout << "✓ Budget exhaustion test passed" << std::endl;
}

void test_local_rejections_surface_immediately() {
    std::cout << "Testing local rejections are not retried..." << std::endl;

    auto clock = std::make_shared<ManualClock>();
    RetryExecutor retry(deterministic_config(), nullptr, clock, make_observability());

    int calls = 0;
    RetryTrace trace;
    try {
        retry.run([&calls]() {
            ++calls;
            throw CircuitOpenError("t1", 12.0);
        }, &trace);
        assert(false);
    } catch (const CircuitOpenError& e) {
        assert(near(e.timeout_remaining_seconds(), 12.0));
    }
    assert(calls == 1);
    assert(!trace.last_failure.has_value());

    std::cout << "✓ Local rejection test passed" << std::endl;
}

void test_rate_limit_hint_is_honored() {
    std::cout << "Testing server wait hints..." << std::endl;

    auto clock = std::make_shared<ManualClock>();
    RetryExecutor retry(deterministic_config(), nullptr, clock, make_observability());

    int calls = 0;
    RetryTrace trace;
    retry.run([&calls]() {
        if (++calls == 1) {
            throw UpstreamError(ErrorCategory::rate_limited, "FLOOD_WAIT", 7.0);
        }
    }, &trace);
    assert(calls == 2);
    assert(trace.delays.size() == 1);
    assert(near(trace.delays[0], 7.0));

    // A hint beyond max_delay (60 s) stops the loop
    calls = 0;
    try {
        retry.run([&calls]() {
            ++calls;
            throw UpstreamError(ErrorCategory::rate_limited, "FLOOD_WAIT", 3600.0);
        });
        assert(false);
    } catch (const UpstreamError& e) {
        assert(e.retry_after_seconds().value() == 3600.0);
    }
    assert(calls == 1);

    std::cout << "✓ Wait hint test passed" << std::endl;
}

void test_cancellation_stops_retries() {
    std::cout << "Testing cancellation stops the retry loop..." << std::endl;

    auto clock = std::make_shared<ManualClock>();
    RetryExecutor retry(deterministic_config(), nullptr, clock, make_observability());
    CancellationToken cancel;

    int calls = 0;
    try {
        retry.run([&]() {
            ++calls;
            cancel.cancel();
            throw std::runtime_error("network unreachable");
        }, nullptr, &cancel);
        assert(false);
    } catch (const OperationCancelled&) {
    }
    assert(calls == 1);

    std::cout << "✓ Cancellation test passed" << std::endl;
}

void test_backoff_formulas() {
    std::cout << "Testing backoff formulas..." << std::endl;

    auto exp = policy(BackoffStrategy::exponential, 1000, 100000);
    assert(near(BackoffCalculator::raw_delay(exp, 0), 1.0));
    assert(near(BackoffCalculator::raw_delay(exp, 3), 8.0));

    auto lin = policy(BackoffStrategy::linear, 500, 100000);
    assert(near(BackoffCalculator::raw_delay(lin, 0), 0.5));
    assert(near(BackoffCalculator::raw_delay(lin, 3), 2.0));

    auto fixed = policy(BackoffStrategy::fixed, 2000, 100000);
    assert(near(BackoffCalculator::raw_delay(fixed, 5), 2.0));

    auto fib = policy(BackoffStrategy::fibonacci, 1000, 100000);
    double expected[] = {1.0, 1.0, 2.0, 3.0, 5.0, 8.0};
    for (int i = 0; i < 6; ++i) {
        assert(near(BackoffCalculator::raw_delay(fib, i), expected[i]));
    }

    std::cout << "✓ Backoff formula test passed" << std::endl;
}

void test_backoff_clamp_and_jitter() {
    std::cout << "Testing backoff clamping and jitter bounds..." << std::endl;

    BackoffCalculator backoff(1234);
    auto capped = policy(BackoffStrategy::exponential, 1000, 30000);
    assert(near(backoff.delay(capped, 10), 30.0));
    // Overflowing exponents clamp to max_delay
    assert(near(backoff.delay(capped, 5000), 30.0));

    auto jittered = policy(BackoffStrategy::fixed, 4000, 100000);
    jittered.jitter = true;
    for (int i = 0; i < 200; ++i) {
        double d = backoff.delay(jittered, 0);
        assert(d >= 3.0 - 1e-9 && d <= 5.0 + 1e-9);
    }

    auto honoring = policy(BackoffStrategy::exponential, 1000, 60000);
    honoring.honor_retry_after = true;
    assert(near(backoff.delay_for(honoring, 0, 12.5).value(), 12.5));
    assert(!backoff.delay_for(honoring, 0, 61.0).has_value());
    assert(near(backoff.delay_for(honoring, 2, std::nullopt).value(), 4.0));

    std::cout << "✓ Clamp and jitter test passed" << std::endl;
}

void test_legacy_classifier() {
    std::cout << "Testing message based classification..." << std::endl;

    auto flood = LegacyMessageClassifier::classify_message("FLOOD_WAIT_42 (caused by SendMessage)");
    assert(flood.category == ErrorCategory::rate_limited);
    assert(near(flood.retry_after_seconds.value(), 42.0));

    auto http = LegacyMessageClassifier::classify_message("HTTP 429 Too Many Requests, retry after 3");
    assert(http.category == ErrorCategory::rate_limited);
    assert(near(http.retry_after_seconds.value(), 3.0));

    auto bare = LegacyMessageClassifier::classify_message("rate limit hit");
    assert(bare.category == ErrorCategory::rate_limited);
    assert(!bare.retry_after_seconds.has_value());

    assert(LegacyMessageClassifier::classify_message("User is banned").category ==
           ErrorCategory::permanent);
    assert(LegacyMessageClassifier::classify_message("403 Forbidden").category ==
           ErrorCategory::permanent);
    assert(LegacyMessageClassifier::classify_message("Connection timed out").category ==
           ErrorCategory::transient_network);
    assert(LegacyMessageClassifier::classify_message("502 Bad Gateway").category ==
           ErrorCategory::transient_network);
    assert(LegacyMessageClassifier::classify_message("weird").category ==
           ErrorCategory::unknown);

    DefaultErrorClassifier classifier;
    auto typed = classify_thrown(classifier,
                                 UpstreamError(ErrorCategory::permanent, "timeout text ignored"));
    assert(typed.category == ErrorCategory::permanent);

    auto hint_dropped = classify_thrown(
        classifier, UpstreamError(ErrorCategory::transient_network, "reset", 5.0));
    assert(!hint_dropped.retry_after_seconds.has_value());

    auto untyped = classify_thrown(classifier, std::runtime_error("network is unreachable"));
    assert(untyped.category == ErrorCategory::transient_network);

    std::cout << "✓ Classifier test passed" << std::endl;
}

int main() {
    std::cout << "Running retry policy tests..." << std::endl;

    test_transient_then_success();
    test_permanent_is_not_retried();
    test_budget_exhaustion_rethrows_original();
    test_local_rejections_surface_immediately();
    test_rate_limit_hint_is_honored();
    test_cancellation_stops_retries();
    test_backoff_formulas();
    test_backoff_clamp_and_jitter();
    test_legacy_classifier();

    std::cout << "All retry policy tests passed!" << std::endl;
    return 0;
}
