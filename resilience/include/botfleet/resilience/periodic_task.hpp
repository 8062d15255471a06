#pragma once

#include "botfleet/resilience/clock.hpp"
#include "botfleet/resilience/observability.hpp"
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace botfleet {
namespace resilience {

/**
 * Background job run every interval on its own thread.
 *
 * stop() interrupts the wait and joins; the destructor stops. A job that
 * throws is logged and scheduled again on the next tick.
 */
class PeriodicTask {
public:
    PeriodicTask(std::string name, Seconds interval, std::function<void()> job,
                 std::shared_ptr<Observability> observability);
    ~PeriodicTask();

    PeriodicTask(const PeriodicTask&) = delete;
    PeriodicTask& operator=(const PeriodicTask&) = delete;

    void start();
    void stop();

    // Runs the job once on the calling thread
    void run_once();

    bool running() const { return running_; }
    uint64_t runs() const { return runs_; }
    uint64_t failures() const { return failures_; }
    const std::string& name() const { return name_; }

private:
    std::string name_;
    Seconds interval_;
    std::function<void()> job_;
    std::shared_ptr<Observability> observability_;

    std::mutex lifecycle_mutex_;
    std::unique_ptr<CancellationToken> cancel_;
    std::thread thread_;
    std::atomic<bool> running_{false};
    std::atomic<uint64_t> runs_{0};
    std::atomic<uint64_t> failures_{0};

    void loop(CancellationToken* cancel);
};

} // namespace resilience
} // namespace botfleet
