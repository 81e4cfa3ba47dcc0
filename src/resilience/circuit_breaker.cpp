#include <recall/resilience/circuit_breaker.h>

#include <spdlog/spdlog.h>

namespace recall::resilience {

const char* toString(CircuitBreaker::State state) noexcept {
    switch (state) {
        case CircuitBreaker::State::Closed: return "closed";
        case CircuitBreaker::State::Open: return "open";
        case CircuitBreaker::State::HalfOpen: return "half-open";
    }
    return "unknown";
}

const char* toString(CircuitBreaker::Permit permit) noexcept {
    switch (permit) {
        case CircuitBreaker::Permit::Allowed: return "allowed";
        case CircuitBreaker::Permit::Probe: return "probe";
        case CircuitBreaker::Permit::Rejected: return "rejected";
    }
    return "unknown";
}

CircuitBreaker::CircuitBreaker() : CircuitBreaker(Config{}) {}

CircuitBreaker::CircuitBreaker(Config config, ClockFn clock)
    : config_(config), clock_(std::move(clock)) {
    if (config_.failureLimit == 0) {
        config_.failureLimit = 1;
    }
}

CircuitBreaker::Permit CircuitBreaker::acquire() {
    std::lock_guard<std::mutex> lock(mutex_);
    switch (state_) {
        case State::Closed:
            return Permit::Allowed;
        case State::Open:
            if (openWindowElapsed()) {
                transitionTo(State::HalfOpen);
                probeInFlight_ = true;
                return Permit::Probe;
            }
            return Permit::Rejected;
        case State::HalfOpen:
            if (!probeInFlight_) {
                // A previous probe was released unused; hand out a fresh one
                probeInFlight_ = true;
                return Permit::Probe;
            }
            return Permit::Rejected;
    }
    return Permit::Rejected;
}

void CircuitBreaker::recordSuccess() {
    std::lock_guard<std::mutex> lock(mutex_);
    consecutiveFailures_ = 0;
    if (state_ != State::Closed) {
        transitionTo(State::Closed);
    }
}

void CircuitBreaker::recordFailure() {
    std::lock_guard<std::mutex> lock(mutex_);
    consecutiveFailures_++;

    if (state_ == State::Closed && consecutiveFailures_ >= config_.failureLimit) {
        transitionTo(State::Open);
    } else if (state_ == State::HalfOpen) {
        transitionTo(State::Open);
    }
}

void CircuitBreaker::releaseProbe() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == State::HalfOpen) {
        probeInFlight_ = false;
    }
}

bool CircuitBreaker::isOpen() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == State::Open) {
        return !openWindowElapsed();
    }
    return state_ == State::HalfOpen && probeInFlight_;
}

CircuitBreaker::State CircuitBreaker::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

size_t CircuitBreaker::consecutiveFailures() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return consecutiveFailures_;
}

void CircuitBreaker::transitionTo(State newState) {
    const State previous = state_;
    state_ = newState;
    probeInFlight_ = false;

    switch (newState) {
        case State::Open:
            openedAt_ = now();
            spdlog::warn("Circuit breaker {} -> open after {} consecutive failure(s); rejecting "
                         "calls for {} ms",
                         toString(previous), consecutiveFailures_, config_.openDuration.count());
            break;
        case State::HalfOpen:
            spdlog::info("Circuit breaker half-open; allowing one probe call");
            break;
        case State::Closed:
            spdlog::info("Circuit breaker closed");
            break;
    }
}

bool CircuitBreaker::openWindowElapsed() const {
    return now() - openedAt_ >= config_.openDuration;
}

} // namespace recall::resilience
