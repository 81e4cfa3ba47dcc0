#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <mutex>
#include <string>

namespace recall::resilience {

/**
 * @brief Circuit breaker guarding a flaky dependency.
 *
 * Counts consecutive failed logical calls. After failureLimit of them the circuit opens and
 * every caller is rejected until openDuration has elapsed. The first caller after that gets
 * the single half-open probe; any other caller is rejected while the probe is in flight.
 * A successful probe closes the circuit, a failed one reopens it and restarts the timer.
 *
 * Thread-safe.
 */
class CircuitBreaker {
public:
    using Clock = std::chrono::steady_clock;
    using ClockFn = std::function<Clock::time_point()>;

    enum class State {
        Closed,  // Normal operation
        Open,    // Failing, reject requests
        HalfOpen // Testing recovery
    };

    enum class Permit {
        Allowed, // closed circuit
        Probe,   // the single half-open trial call
        Rejected
    };

    struct Config {
        size_t failureLimit = 3;
        std::chrono::milliseconds openDuration{20000};
    };

    CircuitBreaker();
    explicit CircuitBreaker(Config config, ClockFn clock = {});

    // Ask to make a call; a Probe must be followed by recordSuccess/recordFailure/releaseProbe
    Permit acquire();

    void recordSuccess();
    void recordFailure();

    // Hand back an unused probe (call cancelled before it completed)
    void releaseProbe();

    // True while calls are being rejected; does not advance the state machine
    bool isOpen() const;

    State state() const;
    size_t consecutiveFailures() const;
    const Config& config() const noexcept { return config_; }

private:
    void transitionTo(State newState);
    bool openWindowElapsed() const;
    Clock::time_point now() const { return clock_ ? clock_() : Clock::now(); }

    Config config_;
    ClockFn clock_;

    mutable std::mutex mutex_;
    State state_ = State::Closed;
    size_t consecutiveFailures_ = 0;
    bool probeInFlight_ = false;
    Clock::time_point openedAt_{};
};

const char* toString(CircuitBreaker::State state) noexcept;
const char* toString(CircuitBreaker::Permit permit) noexcept;

} // namespace recall::resilience
