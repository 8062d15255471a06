#pragma once

#include "botfleet/resilience/clock.hpp"
#include "botfleet/resilience/config.hpp"
#include "botfleet/resilience/errors.hpp"
#include "botfleet/resilience/observability.hpp"
#include <cstdint>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <type_traits>
#include <vector>

namespace botfleet {
namespace resilience {

struct Classification {
    ErrorCategory category = ErrorCategory::unknown;
    std::optional<double> retry_after_seconds;  // Server-provided wait, rate limits only
    std::string message;
};

// Maps a failure of the real operation to exactly one ErrorCategory
class ErrorClassifier {
public:
    virtual ~ErrorClassifier() = default;
    virtual Classification classify(const std::exception_ptr& error) const = 0;
};

/**
 * Fallback for untyped upstream errors: substring checks on the message text.
 *
 * Rate-limit markers win over everything else ("429", "too many requests",
 * "flood", "rate limit"), then permanent identity failures ("401", "403",
 * "unauthorized", "forbidden", "banned", "deactivated"), then network
 * failures ("timeout", "connection", "network", 5xx codes). A wait hint is
 * read from "FLOOD_WAIT_<n>", "retry after <n>" or "retry_after=<n>".
 */
class LegacyMessageClassifier : public ErrorClassifier {
public:
    Classification classify(const std::exception_ptr& error) const override;

    static Classification classify_message(const std::string& message);
};

// Typed UpstreamError first, legacy message matching for anything else
class DefaultErrorClassifier : public ErrorClassifier {
public:
    Classification classify(const std::exception_ptr& error) const override;

private:
    LegacyMessageClassifier legacy_;
};

/**
 * Delay computation for one retry policy (attempt is 0-indexed):
 *   exponential: base * exponential_base^attempt
 *   linear:      base * (attempt + 1)
 *   fixed:       base
 *   fibonacci:   base * fib(attempt), fib = 1, 1, 2, 3, 5, ...
 * Jitter perturbs the result by up to +/-25%. The result is clamped to [0, max_delay].
 */
class BackoffCalculator {
public:
    BackoffCalculator();
    explicit BackoffCalculator(uint64_t seed);

    // Before jitter and clamping, in seconds
    static double raw_delay(const CategoryRetryPolicy& policy, int32_t attempt);
    static double fibonacci(int32_t n);

    double delay(const CategoryRetryPolicy& policy, int32_t attempt);

    // Honors a server hint verbatim when the policy allows it.
    // Returns nullopt when the hint exceeds max_delay: the call is not retried.
    std::optional<double> delay_for(const CategoryRetryPolicy& policy, int32_t attempt,
                                    std::optional<double> server_hint);

private:
    std::mutex rng_mutex_;
    std::mt19937_64 rng_;
};

// Per-call record of what the retry loop did
struct RetryTrace {
    int32_t calls = 0;
    std::vector<double> delays;
    std::vector<ErrorCategory> categories;
    std::optional<Classification> last_failure;
};

/**
 * Runs an operation under the per-category retry policies.
 *
 * Permanent failures become NonRetryableError after one call. Local decisions
 * (anything derived from ResilienceError, e.g. an open breaker) surface
 * immediately and do not consume retry budget. Once the budget is spent the
 * original exception is rethrown unchanged.
 */
class RetryExecutor {
public:
    RetryExecutor(const RetryConfig& config,
                  std::shared_ptr<ErrorClassifier> classifier,
                  std::shared_ptr<Clock> clock,
                  std::shared_ptr<Observability> observability);

    template <class F>
    auto run(F&& op, RetryTrace* trace = nullptr, const CancellationToken* cancel = nullptr)
        -> decltype(op()) {
        for (int32_t attempt = 0;; ++attempt) {
            if (cancel && cancel->is_cancelled()) {
                throw OperationCancelled();
            }
            if (trace) {
                trace->calls++;
            }
            try {
                if constexpr (std::is_void<decltype(op())>::value) {
                    op();
                    return;
                } else {
                    return op();
                }
            } catch (const ResilienceError&) {
                throw;
            } catch (...) {
                auto step = next_step(std::current_exception(), attempt, trace);
                if (step.action == Action::fail_permanent) {
                    throw NonRetryableError(step.classification.message);
                }
                if (step.action == Action::give_up) {
                    throw;
                }
                if (!clock_->sleep_for(Seconds(step.delay_seconds), cancel)) {
                    throw OperationCancelled();
                }
            }
        }
    }

    Classification classify(const std::exception_ptr& error) const {
        return classifier_->classify(error);
    }

    const RetryConfig& config() const { return config_; }
    BackoffCalculator& backoff() { return backoff_; }

private:
    enum class Action { retry, give_up, fail_permanent };

    struct Step {
        Action action = Action::give_up;
        double delay_seconds = 0.0;
        Classification classification;
    };

    RetryConfig config_;
    std::shared_ptr<ErrorClassifier> classifier_;
    std::shared_ptr<Clock> clock_;
    std::shared_ptr<Observability> observability_;
    BackoffCalculator backoff_;

    Step next_step(const std::exception_ptr& error, int32_t attempt, RetryTrace* trace);
};

} // namespace resilience
} // namespace botfleet
