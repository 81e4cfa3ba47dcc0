#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <stop_token>

#include <nlohmann/json.hpp>

namespace recall::resilience {

/**
 * @brief Bounded retries with jittered exponential backoff
 */
struct RetryPolicy {
    // Retries after the first attempt; 2 means up to 3 physical calls
    size_t maxRetries = 2;
    std::chrono::milliseconds attemptTimeout{8000};
    std::chrono::milliseconds backoffBase{200};
    // Upper bound of the random extra delay, as a fraction of the nominal backoff
    double jitterRatio = 0.25;

    size_t maxAttempts() const noexcept { return maxRetries + 1; }

    /**
     * @brief Delay before retry @p retry (1-based): base * 2^(retry-1) * (1 + jitterRatio * u)
     *
     * @param unitJitter Random draw in [0,1)
     */
    std::chrono::milliseconds backoffFor(size_t retry, double unitJitter) const;

    nlohmann::json toJson() const;
};

// Sleeps for the given duration; returns false if woken early by a stop request
using Sleeper = std::function<bool(std::chrono::milliseconds, std::stop_token)>;

// Uniform draw in [0,1)
using JitterSource = std::function<double()>;

/**
 * @brief Interruptible sleep used when no sleeper is injected
 */
bool interruptibleSleep(std::chrono::milliseconds duration, std::stop_token stop);

/**
 * @brief Thread-local uniform [0,1) generator used when no jitter source is injected
 */
double defaultJitter();

} // namespace recall::resilience
