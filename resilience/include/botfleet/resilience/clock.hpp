#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <vector>

namespace botfleet {
namespace resilience {

using Seconds = std::chrono::duration<double>;
using TimePoint = std::chrono::steady_clock::time_point;
using WallTime = std::chrono::system_clock::time_point;

inline double to_seconds(std::chrono::steady_clock::duration d) {
    return std::chrono::duration_cast<Seconds>(d).count();
}

inline std::chrono::steady_clock::duration from_seconds(double seconds) {
    return std::chrono::duration_cast<std::chrono::steady_clock::duration>(Seconds(seconds));
}

/**
 * Cooperative cancellation flag shared between a caller and a guarded call.
 *
 * Waits performed through wait_for() return early once cancel() is called.
 */
class CancellationToken {
public:
    void cancel();
    bool is_cancelled() const { return cancelled_.load(); }

    // Returns false if cancelled before the duration elapsed
    bool wait_for(Seconds duration) const;

private:
    std::atomic<bool> cancelled_{false};
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
};

// Time source for every component; injected so tests can control time
class Clock {
public:
    virtual ~Clock() = default;

    virtual TimePoint now() const = 0;
    virtual WallTime wall_now() const = 0;

    // Suspends the calling thread only. Returns false if cancelled.
    virtual bool sleep_for(Seconds duration, const CancellationToken* cancel = nullptr) = 0;
};

class SystemClock : public Clock {
public:
    TimePoint now() const override { return std::chrono::steady_clock::now(); }
    WallTime wall_now() const override { return std::chrono::system_clock::now(); }
    bool sleep_for(Seconds duration, const CancellationToken* cancel = nullptr) override;
};

/**
 * Virtual clock. sleep_for() advances time instantly and records the request,
 * which makes backoff schedules observable.
 */
class ManualClock : public Clock {
public:
    ManualClock();

    TimePoint now() const override;
    WallTime wall_now() const override;
    bool sleep_for(Seconds duration, const CancellationToken* cancel = nullptr) override;

    void advance(Seconds duration);
    std::vector<double> sleeps() const;
    void clear_sleeps();

private:
    mutable std::mutex mutex_;
    TimePoint now_;
    WallTime wall_base_;
    TimePoint steady_base_;
    std::vector<double> sleeps_;
};

} // namespace resilience
} // namespace botfleet
