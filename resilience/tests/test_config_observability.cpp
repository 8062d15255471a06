#include <iostream>
#include <cassert>
#include <cstdlib>
#include <string>
#include <nlohmann/json.hpp>
#include "botfleet/resilience/config.hpp"
#include "botfleet/resilience/feature_flags.hpp"
#include "botfleet/resilience/guard_options.hpp"
#include "botfleet/resilience/observability.hpp"
#include "botfleet/resilience/report_converter.hpp"
#include "test_support.hpp"

using namespace botfleet::resilience;
using botfleet::resilience::testing::LogCapture;
using json = nlohmann::json;

namespace {

bool same_policy(const CategoryRetryPolicy& a, const CategoryRetryPolicy& b) {
    return a.max_retries == b.max_retries && a.base_delay == b.base_delay &&
           a.max_delay == b.max_delay && a.strategy == b.strategy &&
           a.exponential_base == b.exponential_base && a.jitter == b.jitter &&
           a.honor_retry_after == b.honor_retry_after;
}

bool rejected(const ResilienceConfig& config) {
    auto result = validate(config);
    return !result && error_code_of(result.error()) == ErrorCode::invalid_config;
}

} // namespace

void test_default_config_is_valid() {
    std::cout << "Testing default configuration..." << std::endl;

    ResilienceConfig config;
    assert(validate(config));
    assert(config.retry.for_category(ErrorCategory::permanent).max_retries == 0);
    assert(config.retry.for_category(ErrorCategory::rate_limited).honor_retry_after);

    std::cout << "✓ Default configuration test passed" << std::endl;
}

void test_invalid_configs_rejected() {
    std::cout << "Testing invalid configurations are rejected..." << std::endl;

    ResilienceConfig config;
    config.rate_limiter.tenant_bucket.capacity = 0.0;
    assert(rejected(config));

    config = ResilienceConfig{};
    config.rate_limiter.global_bucket.refill_per_second = -1.0;
    assert(rejected(config));

    config = ResilienceConfig{};
    config.breaker.failure_threshold = 0;
    assert(rejected(config));

    config = ResilienceConfig{};
    config.health.warning_error_rate = 0.6;
    assert(rejected(config));

    config = ResilienceConfig{};
    config.health.latency_ema_alpha = 0.0;
    assert(rejected(config));

    config = ResilienceConfig{};
    config.retry.transient_network.max_delay = std::chrono::milliseconds(10);
    assert(rejected(config));

    config = ResilienceConfig{};
    config.retry.permanent.max_retries = 1;
    assert(rejected(config));

    config = ResilienceConfig{};
    config.session_pool.max_total_connections = 0;
    assert(rejected(config));

    config = ResilienceConfig{};
    config.worker_threads = 0;
    assert(rejected(config));

    std::cout << "✓ Invalid configuration test passed" << std::endl;
}

void test_backoff_strategy_names() {
    std::cout << "Testing backoff strategy names..." << std::endl;

    for (auto strategy : {BackoffStrategy::exponential, BackoffStrategy::linear,
                          BackoffStrategy::fixed, BackoffStrategy::fibonacci}) {
        auto parsed = parse_backoff_strategy(to_string(strategy));
        assert(parsed && *parsed == strategy);
    }
    assert(!parse_backoff_strategy("random"));

    std::cout << "✓ Backoff strategy name test passed" << std::endl;
}

void test_guard_options_mapping() {
    std::cout << "Testing command-line options map onto the configuration..." << std::endl;

    // Defaults line up with ResilienceConfig
    auto defaults = to_resilience_config(GuardOptions{});
    assert(defaults);
    RetryConfig retry_defaults;
    for (auto category : {ErrorCategory::rate_limited, ErrorCategory::transient_network,
                          ErrorCategory::permanent, ErrorCategory::unknown}) {
        assert(same_policy(defaults->retry.for_category(category),
                           retry_defaults.for_category(category)));
    }

    GuardOptions options;
    options.retry_rate_limited.base_delay_ms = 250;
    options.retry_rate_limited.max_delay_ms = 90000;
    options.retry_rate_limited.strategy = "fixed";
    options.retry_rate_limited.honor_retry_after = false;
    options.retry_transient.strategy = "fibonacci";
    options.retry_transient.jitter = false;
    options.retry_unknown.base_delay_ms = 4000;
    options.retry_unknown.max_delay_ms = 8000;
    options.retry_unknown.max_retries = 1;
    options.breaker_transition_history = 7;
    options.session_history_size = 64;
    options.session_metrics_window_ms = 600000;
    options.latency_ema_alpha = 0.5;

    auto config = to_resilience_config(options);
    assert(config);
    const auto& rate_limited = config->retry.rate_limited;
    assert(rate_limited.base_delay == std::chrono::milliseconds(250));
    assert(rate_limited.max_delay == std::chrono::milliseconds(90000));
    assert(rate_limited.strategy == BackoffStrategy::fixed);
    assert(!rate_limited.honor_retry_after);
    assert(config->retry.transient_network.strategy == BackoffStrategy::fibonacci);
    assert(!config->retry.transient_network.jitter);
    assert(config->retry.unknown.base_delay == std::chrono::milliseconds(4000));
    assert(config->retry.unknown.max_delay == std::chrono::milliseconds(8000));
    assert(config->retry.unknown.max_retries == 1);
    assert(config->retry.permanent.max_retries == 0);
    assert(config->breaker.transition_history == 7);
    assert(config->session_pool.history_size == 64);
    assert(config->session_pool.metrics_window == std::chrono::milliseconds(600000));
    assert(config->health.latency_ema_alpha == 0.5);

    // Bad values are refused rather than silently replaced
    options.retry_unknown.strategy = "random";
    auto bad_strategy = to_resilience_config(options);
    assert(!bad_strategy);
    assert(error_code_of(bad_strategy.error()) == ErrorCode::invalid_config);

    options.retry_unknown.strategy = "linear";
    options.retry_unknown.base_delay_ms = 9000;
    assert(!to_resilience_config(options));

    std::cout << "✓ Option mapping test passed" << std::endl;
}

void test_json_log_format() {
    std::cout << "Testing JSON log format..." << std::endl;

    Observability observability("guard-1");
    auto line = observability.format_json_log("WARN", "Circuit breaker opened", "tenant_42",
                                              {{"from", "closed"}, {"to", "open"}});
    auto entry = json::parse(line);
    assert(entry["level"] == "WARN");
    assert(entry["component"] == "resilience");
    assert(entry["message"] == "Circuit breaker opened");
    assert(entry["tenant_id"] == "tenant_42");
    assert(entry["context"]["instance_id"] == "guard-1");
    assert(entry["context"]["to"] == "open");

    std::string timestamp = entry["timestamp"];
    assert(timestamp.size() == 27);
    assert(timestamp[10] == 'T' && timestamp.back() == 'Z');

    // No tenant, no tenant_id field
    auto bare = json::parse(observability.format_json_log("INFO", "started", "", {}));
    assert(!bare.contains("tenant_id"));

    std::cout << "✓ JSON log format test passed" << std::endl;
}

void test_secret_redaction() {
    std::cout << "Testing secret context redaction..." << std::endl;

    Observability observability("guard-1");
    auto entry = json::parse(observability.format_json_log(
        "INFO", "Session opened", "tenant_42",
        {{"session_string", "1BQANOTEuMTA4LjU2LjE3MQG7"},
         {"api_hash", "0123456789abcdef"},
         {"Bot_Token", "123:ABC"},
         {"phone", "+15550100"},
         {"channel", "news"}}));
    assert(entry["context"]["session_string"] == "[REDACTED]");
    assert(entry["context"]["api_hash"] == "[REDACTED]");
    assert(entry["context"]["Bot_Token"] == "[REDACTED]");
    assert(entry["context"]["phone"] == "[REDACTED]");
    assert(entry["context"]["channel"] == "news");

    std::cout << "✓ Redaction test passed" << std::endl;
}

void test_log_level_filter_and_sink() {
    std::cout << "Testing log level filtering..." << std::endl;

    Observability observability("guard-1");
    LogCapture capture;
    capture.attach(observability);

    observability.set_log_level(LogLevel::warn);
    observability.log_debug("hidden");
    observability.log_info("hidden");
    observability.log_warn("shown");
    observability.log_error("shown too");
    assert(capture.count(LogLevel::debug) == 0);
    assert(capture.count(LogLevel::info) == 0);
    assert(capture.count(LogLevel::warn) == 1);
    assert(capture.count(LogLevel::error) == 1);

    assert(parse_log_level("debug") == LogLevel::debug);
    assert(parse_log_level("warning") == LogLevel::warn);
    assert(parse_log_level("verbose") == LogLevel::info);

    std::cout << "✓ Log level test passed" << std::endl;
}

void test_metrics_follow_feature_flag() {
    std::cout << "Testing metrics feature flag..." << std::endl;

    unsetenv("BOTFLEET_METRICS_ENABLED");
    {
        Observability observability("guard-1");
        observability.record_call("success", 0.2);
        assert(observability.get_metrics_response().empty());
    }

    setenv("BOTFLEET_METRICS_ENABLED", "true", 1);
    assert(FeatureFlags::is_metrics_enabled());
    {
        Observability observability("guard-1");
        observability.record_rate_limit_decision("tenant", false);
        observability.record_breaker_transition("open");
        observability.record_retry("transient_network");
        observability.record_call("success", 0.2);
        observability.set_active_sessions(3);
        observability.set_tenant_status_count("healthy", 7);
        auto text = observability.get_metrics_response();
        assert(text.find("botfleet_rate_limit_decisions_total") != std::string::npos);
        assert(text.find("botfleet_breaker_transitions_total") != std::string::npos);
        assert(text.find("botfleet_call_duration_seconds") != std::string::npos);
        assert(text.find("botfleet_active_sessions") != std::string::npos);
    }
    unsetenv("BOTFLEET_METRICS_ENABLED");

    setenv("BOTFLEET_SHARED_BUCKET_STORE_ENABLED", "yes", 1);
    assert(FeatureFlags::is_shared_bucket_store_enabled());
    setenv("BOTFLEET_SHARED_BUCKET_STORE_ENABLED", "off", 1);
    assert(!FeatureFlags::is_shared_bucket_store_enabled());
    unsetenv("BOTFLEET_SHARED_BUCKET_STORE_ENABLED");

    std::cout << "✓ Metrics flag test passed" << std::endl;
}

void test_report_shapes() {
    std::cout << "Testing admin report shapes..." << std::endl;

    WallTime epoch_plus = WallTime(std::chrono::microseconds(1500000));
    assert(ReportConverter::format_timestamp(epoch_plus) == "1970-01-01T00:00:01.500000Z");

    HealthMetrics metrics;
    metrics.tenant_id = "t1";
    metrics.status = HealthStatus::degraded;
    auto metrics_json = ReportConverter::to_json(metrics);
    assert(metrics_json["status"] == "degraded");
    assert(metrics_json["last_success"].is_null());

    BreakerSnapshot breaker;
    breaker.tenant_id = "t1";
    breaker.state = BreakerState::half_open;
    TransitionEvent event;
    event.from = BreakerState::open;
    event.to = BreakerState::half_open;
    event.at = epoch_plus;
    event.reason = "cool-down elapsed";
    breaker.history.push_back(event);
    auto breaker_json = ReportConverter::to_json(breaker);
    assert(breaker_json["state"] == "half_open");
    assert(breaker_json["opened_at"].is_null());
    assert(breaker_json["history"][0]["from"] == "open");

    HealthSummary summary;
    summary.healthy = 3;
    auto summary_json = ReportConverter::to_json(summary);
    assert(summary_json["status_counts"]["healthy"] == 3);
    assert(summary_json["health_band"] == "excellent");

    PoolStatus pool;
    pool.max_connections = 50;
    pool.available = 50;
    auto pool_json = ReportConverter::to_json(pool);
    assert(pool_json["available"] == 50);
    assert(pool_json["counters"]["exhausted"] == 0);

    std::map<std::string, BreakerSnapshot> breakers{{"t1", breaker}};
    assert(ReportConverter::breakers_to_json(breakers).contains("t1"));
    assert(ReportConverter::tenants_to_json({metrics}).size() == 1);

    std::cout << "✓ Report shape test passed" << std::endl;
}

int main() {
    std::cout << "Running configuration and observability tests..." << std::endl;

    test_default_config_is_valid();
    test_invalid_configs_rejected();
    test_backoff_strategy_names();
    test_guard_options_mapping();
    test_json_log_format();
    test_secret_redaction();
    test_log_level_filter_and_sink();
    test_metrics_follow_feature_flag();
    test_report_shapes();

    std::cout << "All configuration and observability tests passed!" << std::endl;
    return 0;
}
