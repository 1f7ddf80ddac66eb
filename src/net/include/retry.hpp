#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <type_traits>
#include <utility>

#include <spdlog/spdlog.h>

#include "net_error.hpp"

namespace tad::net
{
    /**
     * @brief Bounded exponential backoff with jitter for outbound calls.
     *
     * Attempt n (1-based) that fails transiently waits
     * min(initial_backoff * multiplier^(n-1), max_backoff) scaled by a random factor
     * in [1 - jitter, 1 + jitter] before the next attempt.
     */
    struct RetryPolicy
    {
        std::size_t max_attempts = 3;
        std::chrono::milliseconds initial_backoff{250};
        double multiplier = 2.0;
        std::chrono::milliseconds max_backoff{2000};
        double jitter = 0.2;
    };

    using SleepFn = std::function<void(std::chrono::milliseconds)>;

    /**
     * @brief Process failures, timeouts, HTTP 429 and HTTP 5xx are worth another attempt.
     */
    bool isTransient(const Error & error);

    /**
     * @brief Backoff before the attempt following `attempt`.
     *
     * @param unit_random Uniform sample in [0, 1] mapped onto the jitter interval.
     */
    std::chrono::milliseconds backoffFor(const RetryPolicy & policy, std::size_t attempt, double unit_random);

    double randomUnit();

    void sleepFor(std::chrono::milliseconds duration);

    /**
     * @brief Runs `call` until it succeeds, fails permanently or the policy is exhausted.
     *
     * @param call Callable returning net::Result<T>.
     * @param what Short label for log lines.
     */
    template<class Callable>
    auto withRetry(const RetryPolicy & policy, Callable && call, const std::string & what, const SleepFn & sleep = sleepFor)
        -> std::invoke_result_t<Callable>
    {
        const std::size_t attempts = policy.max_attempts == 0 ? 1 : policy.max_attempts;

        for(std::size_t attempt = 1; ; ++attempt)
        {
            auto result = call();
            if(result || attempt >= attempts || !isTransient(result.error()))
            {
                return result;
            }

            const auto delay = backoffFor(policy, attempt, randomUnit());
            spdlog::debug("{} failed ({}: {}), attempt {}/{} - retrying in {} ms",
                what, std::format("{}", result.error().kind), result.error().message, attempt, attempts, delay.count());

            if(sleep)
            {
                sleep(delay);
            }
        }
    }
}
