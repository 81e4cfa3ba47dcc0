#include <recall/resilience/retry_policy.h>

#include <algorithm>
#include <cmath>
#include <condition_variable>
#include <mutex>
#include <random>

namespace recall::resilience {

std::chrono::milliseconds RetryPolicy::backoffFor(size_t retry, double unitJitter) const {
    if (retry == 0 || backoffBase.count() <= 0) {
        return std::chrono::milliseconds{0};
    }
    // Cap the exponent so a misconfigured retry count cannot overflow
    const double exponent = static_cast<double>(std::min<size_t>(retry - 1, 16));
    const double jitter = std::clamp(std::isfinite(unitJitter) ? unitJitter : 0.0, 0.0, 1.0);
    const double ratio = std::max(0.0, jitterRatio);
    const double nominal = static_cast<double>(backoffBase.count()) * std::pow(2.0, exponent);
    return std::chrono::milliseconds{
        static_cast<std::chrono::milliseconds::rep>(std::llround(nominal * (1.0 + ratio * jitter)))};
}

nlohmann::json RetryPolicy::toJson() const {
    return nlohmann::json{{"max_retries", maxRetries},
                          {"attempt_timeout_ms", attemptTimeout.count()},
                          {"backoff_base_ms", backoffBase.count()},
                          {"jitter_ratio", jitterRatio}};
}

bool interruptibleSleep(std::chrono::milliseconds duration, std::stop_token stop) {
    if (duration.count() <= 0) {
        return !stop.stop_requested();
    }
    std::mutex m;
    std::condition_variable_any cv;
    std::unique_lock<std::mutex> lock(m);
    // Nothing notifies the condition; only the deadline or a stop request ends the wait
    cv.wait_for(lock, stop, duration, [] { return false; });
    return !stop.stop_requested();
}

double defaultJitter() {
    thread_local std::mt19937_64 rng{std::random_device{}()};
    std::uniform_real_distribution<double> dist(0.0, 1.0);
    return dist(rng);
}

} // namespace recall::resilience
