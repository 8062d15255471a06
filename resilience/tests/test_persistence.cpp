#include <iostream>
#include <cassert>
#include <cstdio>
#include <filesystem>
#include <thread>
#include <sqlite3.h>
#include "botfleet/resilience/health_persistence.hpp"
#include "botfleet/resilience/report_converter.hpp"
#include "botfleet/resilience/snapshot_store.hpp"
#include "test_support.hpp"

using namespace botfleet::resilience;
using botfleet::resilience::testing::make_observability;
using botfleet::resilience::testing::near;

namespace {

HealthSnapshot snapshot_of(const std::string& tenant_id, HealthStatus status,
                           std::optional<BreakerState> breaker = std::nullopt) {
    HealthSnapshot snapshot;
    snapshot.metrics.tenant_id = tenant_id;
    snapshot.metrics.status = status;
    snapshot.metrics.total_requests = 20;
    snapshot.metrics.successful_requests = 15;
    snapshot.metrics.failed_requests = 5;
    snapshot.metrics.error_rate = 0.25;
    snapshot.metrics.avg_latency_ms = 180.5;
    snapshot.metrics.consecutive_failures = 2;
    snapshot.metrics.last_error_type = "transient_network";
    snapshot.metrics.latency_seeded = true;
    if (status == HealthStatus::suspended) {
        snapshot.metrics.suspension_reason = "manual";
    }
    snapshot.breaker_state = breaker;
    return snapshot;
}

void exercise_store(SnapshotStore& store) {
    auto base = std::chrono::system_clock::now();
    auto t0 = base - std::chrono::hours(48);
    auto t1 = base - std::chrono::hours(2);
    auto t2 = base - std::chrono::hours(1);

    assert(store.load_latest()->empty());

    assert(store.store_snapshot("a", snapshot_of("a", HealthStatus::unhealthy), t0));
    assert(store.store_snapshot("a", snapshot_of("a", HealthStatus::degraded), t1));
    assert(store.store_snapshot("b", snapshot_of("b", HealthStatus::suspended,
                                                 BreakerState::open), t1));
    assert(store.store_snapshot("a", snapshot_of("a", HealthStatus::unhealthy,
                                                 BreakerState::half_open), t2));
    assert(store.store_snapshot("b", snapshot_of("b", HealthStatus::healthy), t2));

    // Oldest first
    auto history = store.load_history("a", base - std::chrono::hours(72));
    assert(history);
    assert(history->size() == 3);
    assert(history->front().snapshot.metrics.status == HealthStatus::unhealthy);
    assert(history->back().snapshot.breaker_state == BreakerState::half_open);

    auto recent = store.load_history("a", base - std::chrono::hours(24));
    assert(recent->size() == 2);

    // Every row from the last persist run
    auto latest = store.load_latest();
    assert(latest);
    assert(latest->size() == 2);
    for (const auto& row : *latest) {
        assert(std::chrono::duration_cast<std::chrono::microseconds>(row.timestamp - t2).count() == 0);
    }

    // Newest first, unhealthy and suspended only
    auto unhealthy = store.load_unhealthy_since(base - std::chrono::hours(24));
    assert(unhealthy);
    assert(unhealthy->size() == 2);
    assert(unhealthy->front().tenant_id == "a");
    assert(unhealthy->back().tenant_id == "b");
    assert(unhealthy->back().snapshot.metrics.status == HealthStatus::suspended);
    assert(unhealthy->back().snapshot.metrics.suspension_reason == "manual");
    assert(unhealthy->back().snapshot.breaker_state == BreakerState::open);

    const auto& restored = latest->front().snapshot.metrics;
    assert(restored.total_requests == 20);
    assert(restored.failed_requests == 5);
    assert(near(restored.error_rate, 0.25));
    assert(near(restored.avg_latency_ms, 180.5));
    assert(restored.consecutive_failures == 2);
    assert(restored.last_error_type == "transient_network");
    assert(restored.latency_seeded);

    auto removed = store.cleanup_older_than(base - std::chrono::hours(24));
    assert(removed);
    assert(*removed == 1);
    assert(store.load_history("a", base - std::chrono::hours(72))->size() == 2);
}

} // namespace

void test_in_memory_store() {
    std::cout << "Testing in-memory snapshot store..." << std::endl;

    InMemorySnapshotStore store;
    exercise_store(store);
    assert(store.size() == 4);

    std::cout << "✓ In-memory store test passed" << std::endl;
}

void test_sqlite_store() {
    std::cout << "Testing SQLite snapshot store..." << std::endl;

    auto store = SqliteSnapshotStore::open(":memory:");
    assert(store);
    exercise_store(**store);

    auto bad = SqliteSnapshotStore::open("/nonexistent-dir/health.db");
    assert(!bad);
    assert(error_code_of(bad.error()) == ErrorCode::store_unavailable);

    std::cout << "✓ SQLite store test passed" << std::endl;
}

void test_batch_is_all_or_nothing() {
    std::cout << "Testing a failed snapshot batch leaves no partial set..." << std::endl;

    auto path = (std::filesystem::temp_directory_path() / "botfleet_batch_test.db").string();
    std::remove(path.c_str());

    auto opened = SqliteSnapshotStore::open(path);
    assert(opened);
    auto& store = **opened;

    auto t1 = std::chrono::system_clock::now() - std::chrono::minutes(10);
    auto t2 = t1 + std::chrono::minutes(5);
    std::vector<StoredSnapshot> first{
        {"a", t1, snapshot_of("a", HealthStatus::healthy)},
        {"b", t1, snapshot_of("b", HealthStatus::degraded)},
    };
    assert(store.store_batch(first));

    // Reject one tenant's row from a second connection
    sqlite3* db = nullptr;
    assert(sqlite3_open(path.c_str(), &db) == SQLITE_OK);
    assert(sqlite3_exec(db,
                        "CREATE TRIGGER reject_bad BEFORE INSERT ON health_snapshots"
                        " WHEN NEW.tenant_id = 'bad'"
                        " BEGIN SELECT RAISE(ABORT, 'rejected'); END;",
                        nullptr, nullptr, nullptr) == SQLITE_OK);
    sqlite3_close(db);

    std::vector<StoredSnapshot> second{
        {"a", t2, snapshot_of("a", HealthStatus::unhealthy)},
        {"bad", t2, snapshot_of("bad", HealthStatus::healthy)},
        {"b", t2, snapshot_of("b", HealthStatus::healthy)},
    };
    auto failed = store.store_batch(second);
    assert(!failed);
    assert(error_code_of(failed.error()) == ErrorCode::store_unavailable);

    // The earlier complete set is still the latest one
    auto latest = store.load_latest();
    assert(latest && latest->size() == 2);
    for (const auto& row : *latest) {
        assert(row.timestamp == std::chrono::time_point_cast<std::chrono::microseconds>(t1));
    }
    assert(store.load_history("a", t1 - std::chrono::minutes(1))->size() == 1);

    // The connection is usable after the rollback
    second.erase(second.begin() + 1);
    assert(store.store_batch(second));
    assert(store.load_latest()->size() == 2);

    opened->reset();
    std::remove(path.c_str());

    std::cout << "✓ Batch atomicity test passed" << std::endl;
}

void test_persist_and_restore() {
    std::cout << "Testing persist and restore through the service..." << std::endl;

    auto clock = std::make_shared<ManualClock>();
    auto observability = make_observability();
    auto store = std::make_shared<InMemorySnapshotStore>();
    PersistenceConfig config;
    config.enabled = true;
    config.retention = std::chrono::hours(24);

    {
        auto health = std::make_shared<HealthMonitor>(HealthThresholds{}, clock, observability);
        auto breakers = std::make_shared<BreakerRegistry>(BreakerConfig{}, clock, observability);
        HealthPersistenceService service(config, store, health, breakers, clock, observability);

        assert(*service.persist_all() == 0);

        health->record_success("t1", 40.0);
        for (int i = 0; i < 5; ++i) {
            health->record_failure("t2", ErrorCategory::transient_network, "timeout");
        }
        breakers->get_breaker("t2")->on_failure("timeout");

        assert(*service.persist_all() == 2);
        clock->advance(Seconds(3600.0));
        health->suspend("t1", "review");
        assert(*service.persist_all() == 2);

        auto history = service.get_tenant_history("t1", std::chrono::hours(2));
        assert(history && history->size() == 2);
        auto unhealthy = service.get_unhealthy_history(std::chrono::hours(2));
        assert(unhealthy && unhealthy->size() == 3);
        assert(unhealthy->front().timestamp >= unhealthy->back().timestamp);

        auto json = ReportConverter::snapshots_to_json(*history);
        assert(json.size() == 2);
        assert(json[1]["status"] == "suspended");
        assert(json[0]["breaker_state"].is_null());

        clock->advance(Seconds(24.0 * 3600.0));
        assert(*service.cleanup_old_snapshots() == 2);
    }

    // A fresh monitor picks up the last snapshot set
    auto health = std::make_shared<HealthMonitor>(HealthThresholds{}, clock, observability);
    auto breakers = std::make_shared<BreakerRegistry>(BreakerConfig{}, clock, observability);
    HealthPersistenceService service(config, store, health, breakers, clock, observability);
    auto restored = service.restore_latest();
    assert(restored && *restored == 2);
    assert(health->is_suspended("t1"));
    assert(health->get_metrics("t2")->status == HealthStatus::unhealthy);
    assert(health->get_metrics("t2")->failed_requests == 5);

    // Tenants already tracked are left alone
    assert(*service.restore_latest() == 0);

    std::cout << "✓ Persist and restore test passed" << std::endl;
}

void test_periodic_persistence() {
    std::cout << "Testing periodic persistence lifecycle..." << std::endl;

    auto clock = std::make_shared<ManualClock>();
    auto observability = make_observability();
    auto store = std::make_shared<InMemorySnapshotStore>();
    auto health = std::make_shared<HealthMonitor>(HealthThresholds{}, clock, observability);
    auto breakers = std::make_shared<BreakerRegistry>(BreakerConfig{}, clock, observability);
    health->record_success("t1", 10.0);

    PersistenceConfig disabled;
    disabled.enabled = false;
    HealthPersistenceService off(disabled, store, health, breakers, clock, observability);
    off.start();
    assert(!off.running());

    PersistenceConfig config;
    config.enabled = true;
    config.persist_interval = std::chrono::milliseconds(10);
    HealthPersistenceService service(config, store, health, breakers, clock, observability);
    service.start();
    assert(service.running());
    for (int i = 0; i < 500 && store->size() == 0; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    service.stop();
    assert(!service.running());
    assert(store->size() > 0);

    std::cout << "✓ Periodic persistence test passed" << std::endl;
}

int main() {
    std::cout << "Running persistence tests..." << std::endl;

    test_in_memory_store();
    test_sqlite_store();
    test_batch_is_all_or_nothing();
    test_persist_and_restore();
    test_periodic_persistence();

    std::cout << "All persistence tests passed!" << std::endl;
    return 0;
}
