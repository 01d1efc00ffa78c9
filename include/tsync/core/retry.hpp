#pragma once

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <functional>
#include <thread>
#include <type_traits>

namespace tsync {

/**
 * @brief Bounded retry parameters
 *
 * One policy type drives both transport-level retries (a handful of quick
 * attempts) and job-level retries (a configured count with long backoff).
 * `sleep` is injectable so callers can make waits interruptible and tests
 * can make them instantaneous.
 */
struct RetryPolicy {
    using Backoff = std::function<std::chrono::milliseconds(std::size_t attempt)>;
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    std::size_t max_attempts = 1;
    Backoff backoff;
    Sleeper sleep;

    [[nodiscard]] std::chrono::milliseconds delay_for(std::size_t attempt) const {
        return backoff ? backoff(attempt) : std::chrono::milliseconds{0};
    }

    void wait(std::chrono::milliseconds delay) const {
        if (delay.count() <= 0) {
            return;
        }
        if (sleep) {
            sleep(delay);
        } else {
            std::this_thread::sleep_for(delay);
        }
    }

    static RetryPolicy none() {
        return RetryPolicy{};
    }

    static RetryPolicy fixed(std::size_t attempts, std::chrono::milliseconds delay) {
        RetryPolicy policy;
        policy.max_attempts = std::max<std::size_t>(1, attempts);
        policy.backoff = [delay](std::size_t) { return delay; };
        return policy;
    }

    /// delay(n) = base * 2^(n-1), capped at `cap`
    static RetryPolicy exponential(std::size_t attempts,
                                   std::chrono::milliseconds base,
                                   std::chrono::milliseconds cap) {
        RetryPolicy policy;
        policy.max_attempts = std::max<std::size_t>(1, attempts);
        policy.backoff = [base, cap](std::size_t attempt) {
            auto delay = base;
            for (std::size_t i = 1; i < attempt && delay < cap; ++i) {
                delay *= 2;
            }
            return std::min(delay, cap);
        };
        return policy;
    }
};

/**
 * @brief Invoke `op(attempt)` until it succeeds, the predicate declines, or
 * attempts run out. Returns the last outcome unchanged.
 */
template<typename Op, typename ShouldRetry>
auto retry_call(const RetryPolicy& policy, Op&& op, ShouldRetry&& should_retry)
    -> std::invoke_result_t<Op&, std::size_t> {
    const std::size_t attempts = std::max<std::size_t>(1, policy.max_attempts);
    for (std::size_t attempt = 1;; ++attempt) {
        auto outcome = op(attempt);
        if (attempt >= attempts || !should_retry(outcome)) {
            return outcome;
        }
        policy.wait(policy.delay_for(attempt));
    }
}

/**
 * @brief retry_call specialised for Result-returning operations: only
 * retryable error kinds are attempted again.
 */
template<typename Op>
auto retry_result(const RetryPolicy& policy, Op&& op, const char* what = "operation")
    -> std::invoke_result_t<Op&, std::size_t> {
    return retry_call(policy, std::forward<Op>(op), [&](const auto& result) {
        if (result.is_ok() || !result.error().retryable()) {
            return false;
        }
        spdlog::warn("{} failed ({}), retrying", what, result.error().describe());
        return true;
    });
}

} // namespace tsync
