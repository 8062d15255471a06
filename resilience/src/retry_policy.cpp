#include "botfleet/resilience/retry_policy.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <regex>

namespace botfleet {
namespace resilience {

namespace {

std::string lowercase(const std::string& text) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

bool contains_any(const std::string& text, std::initializer_list<const char*> needles) {
    for (const char* needle : needles) {
        if (text.find(needle) != std::string::npos) {
            return true;
        }
    }
    return false;
}

std::optional<double> extract_wait_hint(const std::string& lower) {
    static const std::regex patterns[] = {
        std::regex(R"(flood_wait_(\d+(?:\.\d+)?))"),
        std::regex(R"(retry[ _-]after[ =:]*(\d+(?:\.\d+)?))"),
        std::regex(R"(wait (?:of )?(\d+(?:\.\d+)?) ?s)"),
    };
    std::smatch match;
    for (const auto& pattern : patterns) {
        if (std::regex_search(lower, match, pattern)) {
            return std::stod(match[1].str());
        }
    }
    return std::nullopt;
}

std::string describe(const std::exception_ptr& error) {
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "non-standard exception";
    }
}

} // namespace

// Classifiers

Classification LegacyMessageClassifier::classify_message(const std::string& message) {
    Classification result;
    result.message = message;
    auto lower = lowercase(message);

    if (contains_any(lower, {"429", "too many requests", "flood", "rate limit", "ratelimit",
                             "slowmode"})) {
        result.category = ErrorCategory::rate_limited;
        result.retry_after_seconds = extract_wait_hint(lower);
    } else if (contains_any(lower, {"401", "403", "unauthorized", "forbidden", "banned",
                                    "deactivated", "auth_key", "session revoked"})) {
        result.category = ErrorCategory::permanent;
    } else if (contains_any(lower, {"timeout", "timed out", "connection", "network",
                                    "unreachable", "reset by peer", "500", "502", "503", "504",
                                    "temporarily unavailable"})) {
        result.category = ErrorCategory::transient_network;
    } else {
        result.category = ErrorCategory::unknown;
    }
    return result;
}

Classification LegacyMessageClassifier::classify(const std::exception_ptr& error) const {
    return classify_message(describe(error));
}

Classification DefaultErrorClassifier::classify(const std::exception_ptr& error) const {
    try {
        std::rethrow_exception(error);
    } catch (const UpstreamError& e) {
        Classification result;
        result.category = e.category();
        result.message = e.what();
        if (e.category() == ErrorCategory::rate_limited) {
            result.retry_after_seconds = e.retry_after_seconds();
        }
        return result;
    } catch (const std::exception& e) {
        return legacy_.classify_message(e.what());
    } catch (...) {
        Classification result;
        result.message = "non-standard exception";
        return result;
    }
}

// BackoffCalculator

BackoffCalculator::BackoffCalculator() : rng_(std::random_device{}()) {}

BackoffCalculator::BackoffCalculator(uint64_t seed) : rng_(seed) {}

double BackoffCalculator::fibonacci(int32_t n) {
    double previous = 1.0;
    double current = 1.0;
    for (int32_t i = 1; i < n; ++i) {
        double next = previous + current;
        previous = current;
        current = next;
    }
    return current;
}

double BackoffCalculator::raw_delay(const CategoryRetryPolicy& policy, int32_t attempt) {
    double base = std::chrono::duration_cast<Seconds>(policy.base_delay).count();
    attempt = std::max<int32_t>(0, attempt);
    switch (policy.strategy) {
        case BackoffStrategy::exponential:
            return base * std::pow(policy.exponential_base, attempt);
        case BackoffStrategy::linear:
            return base * (attempt + 1);
        case BackoffStrategy::fixed:
            return base;
        case BackoffStrategy::fibonacci:
            return base * fibonacci(attempt);
    }
    return base;
}

double BackoffCalculator::delay(const CategoryRetryPolicy& policy, int32_t attempt) {
    double value = raw_delay(policy, attempt);
    if (policy.jitter) {
        std::uniform_real_distribution<double> spread(-0.25, 0.25);
        double factor;
        {
            std::lock_guard<std::mutex> lock(rng_mutex_);
            factor = spread(rng_);
        }
        value *= 1.0 + factor;
    }
    double max_delay = std::chrono::duration_cast<Seconds>(policy.max_delay).count();
    if (!std::isfinite(value)) {
        return max_delay;
    }
    return std::min(std::max(0.0, value), max_delay);
}

std::optional<double> BackoffCalculator::delay_for(const CategoryRetryPolicy& policy,
                                                   int32_t attempt,
                                                   std::optional<double> server_hint) {
    if (server_hint && policy.honor_retry_after) {
        double max_delay = std::chrono::duration_cast<Seconds>(policy.max_delay).count();
        if (*server_hint > max_delay) {
            return std::nullopt;
        }
        return std::max(0.0, *server_hint);
    }
    return delay(policy, attempt);
}

// RetryExecutor

RetryExecutor::RetryExecutor(const RetryConfig& config,
                             std::shared_ptr<ErrorClassifier> classifier,
                             std::shared_ptr<Clock> clock,
                             std::shared_ptr<Observability> observability)
    : config_(config),
      classifier_(classifier ? std::move(classifier)
                             : std::make_shared<DefaultErrorClassifier>()),
      clock_(std::move(clock)),
      observability_(std::move(observability)) {}

RetryExecutor::Step RetryExecutor::next_step(const std::exception_ptr& error, int32_t attempt,
                                             RetryTrace* trace) {
    Step step;
    step.classification = classifier_->classify(error);
    const auto& category = step.classification.category;
    if (trace) {
        trace->categories.push_back(category);
        trace->last_failure = step.classification;
    }

    if (category == ErrorCategory::permanent) {
        step.action = Action::fail_permanent;
        observability_->log_warn("Permanent failure, not retrying", "",
                                 {{"error", step.classification.message}});
        return step;
    }

    const auto& policy = config_.for_category(category);
    if (attempt >= policy.max_retries) {
        step.action = Action::give_up;
        observability_->log_debug("Retry budget exhausted", "",
                                  {{"category", to_string(category)},
                                   {"attempts", std::to_string(attempt + 1)}});
        return step;
    }

    auto delay = backoff_.delay_for(policy, attempt, step.classification.retry_after_seconds);
    if (!delay) {
        step.action = Action::give_up;
        observability_->log_info("Server wait exceeds retry ceiling, not retrying", "",
                                 {{"category", to_string(category)},
                                  {"retry_after",
                                   std::to_string(*step.classification.retry_after_seconds)}});
        return step;
    }

    step.action = Action::retry;
    step.delay_seconds = *delay;
    if (trace) {
        trace->delays.push_back(*delay);
    }
    observability_->record_retry(to_string(category));
    observability_->log_debug("Retrying after failure", "",
                              {{"category", to_string(category)},
                               {"attempt", std::to_string(attempt + 1)},
                               {"delay_seconds", std::to_string(*delay)}});
    return step;
}

} // namespace resilience
} // namespace botfleet
