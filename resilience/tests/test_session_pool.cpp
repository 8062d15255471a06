#include <iostream>
#include <cassert>
#include <atomic>
#include <thread>
#include <vector>
#include "botfleet/resilience/session_pool.hpp"
#include "test_support.hpp"

using namespace botfleet::resilience;
using botfleet::resilience::testing::make_observability;
using botfleet::resilience::testing::near;

namespace {

SessionPoolConfig pool_config(size_t max_connections, int64_t acquire_timeout_ms) {
    SessionPoolConfig config;
    config.max_total_connections = max_connections;
    config.acquire_timeout = std::chrono::milliseconds(acquire_timeout_ms);
    config.session_timeout = std::chrono::milliseconds(300000);
    config.history_size = 4;
    return config;
}

} // namespace

void test_acquire_and_release() {
    std::cout << "Testing acquire and release..." << std::endl;

    auto clock = std::make_shared<ManualClock>();
    SessionPool pool(pool_config(2, 100), clock, make_observability());

    auto slot = pool.acquire_session("t1");
    assert(slot);
    assert(slot->tenant_id == "t1");
    assert(slot->status == SessionStatus::open);
    assert(pool.has_open_session("t1"));

    assert(pool.record_activity("t1", SessionStats{3, 1, 0}));
    assert(!pool.record_activity("t2", SessionStats{1, 0, 0}));

    clock->advance(Seconds(12.0));
    auto record = pool.release_session("t1", SessionStats{2, 0, 1});
    assert(record);
    assert(record->stats.messages == 5);
    assert(record->stats.channels == 1);
    assert(record->stats.errors == 1);
    assert(near(record->duration_seconds, 12.0));
    assert(!record->forced);
    assert(!pool.has_open_session("t1"));

    auto again = pool.release_session("t1");
    assert(!again);
    assert(error_code_of(again.error()) == ErrorCode::not_found);

    std::cout << "✓ Acquire and release test passed" << std::endl;
}

void test_single_flight_per_tenant() {
    std::cout << "Testing one open session per tenant..." << std::endl;

    auto clock = std::make_shared<ManualClock>();
    SessionPool pool(pool_config(5, 100), clock, make_observability());

    assert(pool.acquire_session("t1"));
    auto second = pool.acquire_session("t1");
    assert(!second);
    assert(error_code_of(second.error()) == ErrorCode::session_busy);
    assert(pool.get_pool_status().busy_rejections == 1);
    assert(pool.acquire_session("t2"));

    std::cout << "✓ Single-flight test passed" << std::endl;
}

void test_pool_exhaustion() {
    std::cout << "Testing pool exhaustion..." << std::endl;

    auto clock = std::make_shared<ManualClock>();
    SessionPool pool(pool_config(2, 50), clock, make_observability());

    assert(pool.acquire_session("t1"));
    assert(pool.acquire_session("t2"));
    auto third = pool.acquire_session("t3");
    assert(!third);
    assert(error_code_of(third.error()) == ErrorCode::pool_exhausted);

    auto status = pool.get_pool_status();
    assert(status.active_sessions == 2);
    assert(status.available == 0);
    assert(status.exhausted == 1);
    assert(status.pending == 0);

    std::cout << "✓ Exhaustion test passed" << std::endl;
}

void test_waiter_gets_released_permit() {
    std::cout << "Testing a waiter receives a released permit..." << std::endl;

    auto clock = std::make_shared<ManualClock>();
    SessionPool pool(pool_config(1, 5000), clock, make_observability());
    assert(pool.acquire_session("t1"));

    std::atomic<bool> acquired{false};
    std::thread waiter([&]() {
        auto slot = pool.acquire_session("t2");
        acquired = static_cast<bool>(slot);
    });

    // While t2 waits, a second acquire for it is busy
    while (pool.get_pool_status().pending == 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    auto duplicate = pool.acquire_session("t2");
    assert(!duplicate);
    assert(error_code_of(duplicate.error()) == ErrorCode::session_busy);

    assert(pool.release_session("t1"));
    waiter.join();
    assert(acquired);
    assert(pool.has_open_session("t2"));

    std::cout << "✓ Waiter test passed" << std::endl;
}

void test_cancelled_wait() {
    std::cout << "Testing a cancelled acquire..." << std::endl;

    auto clock = std::make_shared<ManualClock>();
    SessionPool pool(pool_config(1, 5000), clock, make_observability());
    assert(pool.acquire_session("t1"));

    CancellationToken cancel;
    cancel.cancel();
    auto slot = pool.acquire_session("t2", &cancel);
    assert(!slot);
    assert(error_code_of(slot.error()) == ErrorCode::cancelled);
    assert(pool.get_pool_status().pending == 0);

    std::cout << "✓ Cancellation test passed" << std::endl;
}

void test_cap_never_exceeded() {
    std::cout << "Testing concurrent acquires never exceed the cap..." << std::endl;

    auto clock = std::make_shared<ManualClock>();
    SessionPool pool(pool_config(3, 2000), clock, make_observability());

    std::atomic<int> open{0};
    std::atomic<int> peak{0};
    std::atomic<int> served{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 12; ++i) {
        threads.emplace_back([&, i]() {
            auto tenant = "tenant_" + std::to_string(i);
            auto slot = pool.acquire_session(tenant);
            if (!slot) {
                return;
            }
            int now_open = ++open;
            int seen = peak.load();
            while (now_open > seen && !peak.compare_exchange_weak(seen, now_open)) {
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
            --open;
            auto released = pool.release_session(tenant);
            assert(released);
            ++served;
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    assert(peak.load() <= 3);
    assert(served.load() == 12);
    assert(pool.get_pool_status().active_sessions == 0);

    std::cout << "✓ Cap test passed" << std::endl;
}

void test_stale_sweep() {
    std::cout << "Testing stale session sweep..." << std::endl;

    auto clock = std::make_shared<ManualClock>();
    SessionPool pool(pool_config(3, 100), clock, make_observability());

    auto old_slot = pool.acquire_session("t1");
    assert(old_slot);
    clock->advance(Seconds(200.0));
    assert(pool.acquire_session("t2"));
    clock->advance(Seconds(101.0));

    auto swept = pool.sweep_stale();
    assert(swept.size() == 1);
    assert(swept[0].tenant_id == "t1");
    assert(swept[0].forced);
    assert(swept[0].stats.errors == 1);
    assert(!pool.has_open_session("t1"));
    assert(pool.has_open_session("t2"));
    assert(pool.get_pool_status().stale_released == 1);

    // The tenant can open a new session; the old id no longer releases it
    auto fresh = pool.acquire_session("t1");
    assert(fresh);
    assert(!pool.release_session("t1", {}, old_slot->session_id));
    assert(pool.has_open_session("t1"));

    std::cout << "✓ Stale sweep test passed" << std::endl;
}

void test_lease_releases_on_scope_exit() {
    std::cout << "Testing session lease RAII..." << std::endl;

    auto clock = std::make_shared<ManualClock>();
    SessionPool pool(pool_config(2, 100), clock, make_observability());

    {
        auto slot = pool.acquire_session("t1");
        assert(slot);
        SessionLease lease(pool, *slot);
        lease.add_stats(SessionStats{4, 2, 0});
        assert(lease.active());

        SessionLease moved(std::move(lease));
        assert(!lease.active());
        assert(moved.active());
    }
    assert(!pool.has_open_session("t1"));
    auto history = pool.history();
    assert(history.size() == 1);
    assert(history[0].stats.messages == 4);
    assert(history[0].stats.channels == 2);

    // A lease outliving a forced release does not close the next session
    auto slot = pool.acquire_session("t2");
    assert(slot);
    {
        SessionLease lease(pool, *slot);
        clock->advance(Seconds(301.0));
        pool.sweep_stale();
        assert(pool.acquire_session("t2"));
    }
    assert(pool.has_open_session("t2"));

    std::cout << "✓ Lease test passed" << std::endl;
}

void test_status_window_and_history_cap() {
    std::cout << "Testing pool status aggregates..." << std::endl;

    auto clock = std::make_shared<ManualClock>();
    SessionPool pool(pool_config(2, 100), clock, make_observability());

    for (int i = 0; i < 6; ++i) {
        assert(pool.acquire_session("t1"));
        clock->advance(Seconds(10.0));
        assert(pool.release_session("t1", SessionStats{static_cast<uint64_t>(i), 0, 0}));
    }
    assert(pool.history().size() == 4);

    auto status = pool.get_pool_status();
    assert(status.acquired == 6);
    assert(status.released == 6);
    assert(status.recent_sessions == 4);
    assert(near(status.avg_duration_seconds, 10.0));
    // messages 2, 3, 4, 5
    assert(near(status.avg_messages, 3.5));

    clock->advance(Seconds(7200.0));
    assert(pool.get_pool_status().recent_sessions == 0);

    std::cout << "✓ Pool status test passed" << std::endl;
}

int main() {
    std::cout << "Running session pool tests..." << std::endl;

    test_acquire_and_release();
    test_single_flight_per_tenant();
    test_pool_exhaustion();
    test_waiter_gets_released_permit();
    test_cancelled_wait();
    test_cap_never_exceeded();
    test_stale_sweep();
    test_lease_releases_on_scope_exit();
    test_status_window_and_history_cap();

    std::cout << "All session pool tests passed!" << std::endl;
    return 0;
}
