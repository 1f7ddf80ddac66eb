#include "retry.hpp"

#include <algorithm>
#include <cmath>
#include <random>
#include <thread>

namespace tad::net
{
    bool isTransient(const Error & error)
    {
        switch(error.kind)
        {
            case Error::Kind::PROCESS_FAILED:
            case Error::Kind::TIMEOUT:
                return true;
            case Error::Kind::HTTP_STATUS:
                return error.status == 429 || error.status >= 500;
            default:
                return false;
        }
    }

    std::chrono::milliseconds backoffFor(const RetryPolicy & policy, std::size_t attempt, double unit_random)
    {
        const double exponent = static_cast<double>(attempt == 0 ? 0 : attempt - 1);
        const double base = static_cast<double>(policy.initial_backoff.count()) * std::pow(policy.multiplier, exponent);
        const double capped = std::min(base, static_cast<double>(policy.max_backoff.count()));

        const double jitter = std::clamp(policy.jitter, 0.0, 1.0);
        const double factor = 1.0 - jitter + (2.0 * jitter * std::clamp(unit_random, 0.0, 1.0));

        return std::chrono::milliseconds(static_cast<std::int64_t>(std::llround(std::max(0.0, capped * factor))));
    }

    double randomUnit()
    {
        thread_local std::mt19937_64 engine{std::random_device{}()};
        std::uniform_real_distribution<double> distribution(0.0, 1.0);
        return distribution(engine);
    }

    void sleepFor(std::chrono::milliseconds duration)
    {
        std::this_thread::sleep_for(duration);
    }
}
