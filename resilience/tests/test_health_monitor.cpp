#include <iostream>
#include <cassert>
#include "botfleet/resilience/health_monitor.hpp"
#include "test_support.hpp"

using namespace botfleet::resilience;
using botfleet::resilience::testing::LogCapture;
using botfleet::resilience::testing::make_observability;
using botfleet::resilience::testing::near;

namespace {

HealthMonitor make_monitor(std::shared_ptr<ManualClock> clock,
                           std::shared_ptr<Observability> observability = make_observability()) {
    return HealthMonitor(HealthThresholds{}, std::move(clock), std::move(observability));
}

} // namespace

void test_new_tenant_is_healthy() {
    std::cout << "Testing new tenants start healthy..." << std::endl;

    auto monitor = make_monitor(std::make_shared<ManualClock>());
    assert(!monitor.get_metrics("t1").has_value());

    monitor.record_success("t1", 120.0);
    auto metrics = monitor.get_metrics("t1").value();
    assert(metrics.status == HealthStatus::healthy);
    assert(metrics.total_requests == 1);
    assert(near(metrics.avg_latency_ms, 120.0));
    assert(metrics.last_success.has_value());
    assert(!metrics.last_failure.has_value());

    std::cout << "✓ New tenant test passed" << std::endl;
}

void test_error_rate_drives_status() {
    std::cout << "Testing error rate drives status..." << std::endl;

    LogCapture capture;
    auto monitor = make_monitor(std::make_shared<ManualClock>(), make_observability(&capture));

    // 10 requests, 6 failures, never more than 2 in a row
    const bool outcomes[] = {false, false, true, false, false, true, false, false, true, true};
    for (bool ok : outcomes) {
        if (ok) {
            monitor.record_success("t1", 50.0);
        } else {
            monitor.record_failure("t1", ErrorCategory::transient_network, "timeout");
        }
    }
    auto metrics = monitor.get_metrics("t1").value();
    assert(metrics.total_requests == 10);
    assert(metrics.failed_requests == 6);
    assert(near(metrics.error_rate, 0.6));
    assert(metrics.status == HealthStatus::unhealthy);
    assert(capture.contains("Tenant health status changed"));

    monitor.record_failure("t1", ErrorCategory::transient_network, "timeout");
    monitor.record_success("t1", 50.0);
    metrics = monitor.get_metrics("t1").value();
    assert(metrics.consecutive_failures == 0);
    // 7 / 12 is still above the critical rate
    assert(metrics.status == HealthStatus::unhealthy);

    std::cout << "✓ Error rate test passed" << std::endl;
}

void test_consecutive_failures() {
    std::cout << "Testing consecutive failures mark a tenant unhealthy..." << std::endl;

    auto monitor = make_monitor(std::make_shared<ManualClock>());
    for (int i = 0; i < 95; ++i) {
        monitor.record_success("t1", 10.0);
    }
    for (int i = 0; i < 4; ++i) {
        monitor.record_failure("t1", ErrorCategory::unknown, "boom");
    }
    assert(monitor.get_metrics("t1")->status == HealthStatus::healthy);
    monitor.record_failure("t1", ErrorCategory::unknown, "boom");
    assert(monitor.get_metrics("t1")->status == HealthStatus::unhealthy);
    assert(monitor.get_metrics("t1")->last_error_type == "boom");

    // A success drops the streak; 5% error rate is healthy again
    monitor.record_success("t1", 10.0);
    assert(monitor.get_metrics("t1")->status == HealthStatus::healthy);

    std::cout << "✓ Consecutive failure test passed" << std::endl;
}

void test_latency_ema_and_degraded() {
    std::cout << "Testing latency EMA and degraded status..." << std::endl;

    auto monitor = make_monitor(std::make_shared<ManualClock>());
    monitor.record_success("t1", 100.0);
    monitor.record_success("t1", 200.0);
    // 0.3 * 200 + 0.7 * 100
    assert(near(monitor.get_metrics("t1")->avg_latency_ms, 130.0));

    monitor.record_success("t2", 1500.0);
    assert(monitor.get_metrics("t2")->status == HealthStatus::degraded);
    monitor.record_success("t3", 9000.0);
    assert(monitor.get_metrics("t3")->status == HealthStatus::degraded);

    std::cout << "✓ Latency test passed" << std::endl;
}

void test_rate_limited_flag() {
    std::cout << "Testing rate-limited flag..." << std::endl;

    auto monitor = make_monitor(std::make_shared<ManualClock>());
    monitor.record_failure("t1", ErrorCategory::rate_limited, "rate_limited");
    assert(monitor.get_metrics("t1")->is_rate_limited);
    monitor.record_success("t1", 10.0);
    assert(!monitor.get_metrics("t1")->is_rate_limited);

    std::cout << "✓ Rate-limited flag test passed" << std::endl;
}

void test_suspend_and_resume() {
    std::cout << "Testing suspend and resume..." << std::endl;

    auto monitor = make_monitor(std::make_shared<ManualClock>());
    monitor.record_success("t1", 10.0);
    monitor.suspend("t1", "abuse report");
    assert(monitor.is_suspended("t1"));

    // Records do not lift a suspension
    monitor.record_success("t1", 10.0);
    auto metrics = monitor.get_metrics("t1").value();
    assert(metrics.status == HealthStatus::suspended);
    assert(metrics.suspension_reason == "abuse report");

    // Reset keeps the suspension
    assert(monitor.reset_metrics("t1"));
    metrics = monitor.get_metrics("t1").value();
    assert(metrics.status == HealthStatus::suspended);
    assert(metrics.total_requests == 0);

    assert(monitor.get_unhealthy_tenants().size() == 1);

    assert(monitor.resume("t1"));
    assert(!monitor.resume("t1"));
    assert(monitor.get_metrics("t1")->status == HealthStatus::healthy);
    assert(monitor.get_metrics("t1")->suspension_reason.empty());

    assert(!monitor.resume("unknown"));
    assert(!monitor.reset_metrics("unknown"));

    std::cout << "✓ Suspend and resume test passed" << std::endl;
}

void test_summary() {
    std::cout << "Testing health summary..." << std::endl;

    auto monitor = make_monitor(std::make_shared<ManualClock>());
    auto empty = monitor.get_health_summary();
    assert(empty.total_tenants == 0);
    assert(near(empty.healthy_fraction, 1.0));
    assert(empty.health_band == "excellent");

    monitor.record_success("a", 100.0);
    monitor.record_success("b", 300.0);
    monitor.record_success("c", 200.0);
    for (int i = 0; i < 5; ++i) {
        monitor.record_failure("d", ErrorCategory::transient_network, "timeout");
    }
    monitor.suspend("e", "manual");

    auto summary = monitor.get_health_summary();
    assert(summary.total_tenants == 5);
    assert(summary.healthy == 3);
    assert(summary.unhealthy == 1);
    assert(summary.suspended == 1);
    assert(summary.total_requests == 8);
    assert(summary.failed_requests == 5);
    assert(near(summary.global_error_rate, 5.0 / 8.0));
    // "d" counts with zero latency, "e" has no requests
    assert(near(summary.average_latency_ms, 150.0));
    assert(near(summary.healthy_fraction, 0.6));
    assert(summary.health_band == "fair");

    assert(health_band_for(0.95) == "excellent");
    assert(health_band_for(0.8) == "good");
    assert(health_band_for(0.2) == "poor");

    std::cout << "✓ Summary test passed" << std::endl;
}

void test_restore_and_remove() {
    std::cout << "Testing restore and remove..." << std::endl;

    auto monitor = make_monitor(std::make_shared<ManualClock>());
    HealthMetrics persisted;
    persisted.tenant_id = "t1";
    persisted.status = HealthStatus::degraded;
    persisted.total_requests = 40;
    persisted.failed_requests = 8;
    persisted.error_rate = 0.2;
    assert(monitor.restore(persisted));
    assert(!monitor.restore(persisted));
    assert(monitor.get_metrics("t1")->status == HealthStatus::degraded);

    monitor.remove("t1");
    assert(monitor.size() == 0);

    assert(parse_health_status("suspended") == HealthStatus::suspended);
    assert(!parse_health_status("bogus").has_value());

    std::cout << "✓ Restore test passed" << std::endl;
}

int main() {
    std::cout << "Running health monitor tests..." << std::endl;

    test_new_tenant_is_healthy();
    test_error_rate_drives_status();
    test_consecutive_failures();
    test_latency_ema_and_degraded();
    test_rate_limited_flag();
    test_suspend_and_resume();
    test_summary();
    test_restore_and_remove();

    std::cout << "All health monitor tests passed!" << std::endl;
    return 0;
}
