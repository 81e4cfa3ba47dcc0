#pragma once

#include <recall/core/types.h>
#include <recall/resilience/circuit_breaker.h>
#include <recall/resilience/retry_policy.h>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>

namespace recall::resilience {

enum class CallStatus {
    Ok,
    CircuitOpen, // rejected by the breaker, operation never invoked
    Failed,      // every attempt failed or timed out
    Cancelled,   // stop requested before an outcome was known
    Saturated    // no free worker, dependency not contacted
};

const char* toString(CallStatus status) noexcept;

template <typename T> struct CallOutcome {
    std::optional<T> value;
    CallStatus status = CallStatus::Failed;
    size_t attempts = 0;
    std::optional<Error> lastError;

    bool ok() const noexcept { return status == CallStatus::Ok; }
};

/**
 * @brief The single retry/timeout/circuit-breaker wrapper for external calls.
 *
 * One logical call makes up to policy.maxAttempts() sequential physical attempts. Each attempt
 * runs on a worker pool and is abandoned once attemptTimeout elapses; the breaker sees one
 * success or one failure per logical call. A cancelled call only counts as a failure if some
 * attempt had already failed or timed out.
 *
 * An abandoned attempt keeps its worker until the operation returns. Admission is bounded by the
 * pool size: when every worker is busy the call ends Saturated without touching the breaker.
 * Attempts abandoned before a worker picked them up never invoke the operation.
 */
class ResilientCall {
public:
    struct Options {
        size_t workerThreads = 2;
        // Extra workers that absorb attempts abandoned on timeout
        size_t spareWorkers = 2;
        // Granularity at which waits notice a stop request
        std::chrono::milliseconds pollInterval{10};
        // How long destruction waits for in-flight attempts before detaching them
        std::chrono::milliseconds shutdownGrace{1000};
    };

    ResilientCall(RetryPolicy policy, std::shared_ptr<CircuitBreaker> breaker);
    ResilientCall(RetryPolicy policy, std::shared_ptr<CircuitBreaker> breaker, Options options,
                  Sleeper sleeper = {}, JitterSource jitter = {});
    ~ResilientCall();

    ResilientCall(const ResilientCall&) = delete;
    ResilientCall& operator=(const ResilientCall&) = delete;

    template <typename T>
    CallOutcome<T> run(const std::string& name, std::function<Result<T>()> op,
                       std::stop_token stop = {});

    const RetryPolicy& policy() const noexcept { return policy_; }
    const std::shared_ptr<CircuitBreaker>& breaker() const noexcept { return breaker_; }

    /// Attempts currently holding a worker, abandoned ones included
    size_t busyWorkers() const;

private:
    // Counts attempts that hold a worker; shared with the workers so it outlives the caller
    struct WorkerGate {
        std::mutex mutex;
        std::condition_variable idle;
        size_t inFlight = 0;
        size_t capacity = 0;

        bool tryEnter();
        void leave();
        bool waitIdle(std::chrono::milliseconds timeout);
    };

    template <typename T>
    Result<T> runAttempt(const std::function<Result<T>()>& op, const std::stop_token& stop);

    bool sleepBackoff(std::chrono::milliseconds delay, const std::stop_token& stop);
    double drawJitter();

    RetryPolicy policy_;
    std::shared_ptr<CircuitBreaker> breaker_;
    Options options_;
    Sleeper sleeper_;
    JitterSource jitter_;
    std::shared_ptr<WorkerGate> gate_;
    std::unique_ptr<boost::asio::thread_pool> pool_;
};

template <typename T>
Result<T> ResilientCall::runAttempt(const std::function<Result<T>()>& op,
                                    const std::stop_token& stop) {
    if (!gate_->tryEnter()) {
        return Error{ErrorCode::ResourceExhausted, "no free worker for attempt"};
    }

    auto promise = std::make_shared<std::promise<Result<T>>>();
    auto future = promise->get_future();
    auto abandoned = std::make_shared<std::atomic<bool>>(false);

    boost::asio::post(*pool_, [op, promise, abandoned, gate = gate_]() {
        struct Leave {
            WorkerGate& gate;
            ~Leave() { gate.leave(); }
        } leave{*gate};
        if (abandoned->load()) {
            promise->set_value(Error{ErrorCode::OperationCancelled, "attempt abandoned"});
            return;
        }
        try {
            promise->set_value(op());
        } catch (const std::exception& e) {
            promise->set_value(
                Error{ErrorCode::InternalError, std::string("operation threw: ") + e.what()});
        } catch (...) {
            promise->set_value(Error{ErrorCode::Unknown, "operation threw unknown exception"});
        }
    });

    const auto deadline = std::chrono::steady_clock::now() + policy_.attemptTimeout;
    while (true) {
        if (stop.stop_requested()) {
            abandoned->store(true);
            return Error{ErrorCode::OperationCancelled, "cancelled while waiting for attempt"};
        }
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            // The worker keeps the promise alive; its late result is discarded
            abandoned->store(true);
            return Error{ErrorCode::Timeout, "attempt exceeded " +
                                                 std::to_string(policy_.attemptTimeout.count()) +
                                                 " ms"};
        }
        auto slice = std::min<std::chrono::steady_clock::duration>(options_.pollInterval,
                                                                   deadline - now);
        if (future.wait_for(slice) == std::future_status::ready) {
            return future.get();
        }
    }
}

template <typename T>
CallOutcome<T> ResilientCall::run(const std::string& name, std::function<Result<T>()> op,
                                  std::stop_token stop) {
    CallOutcome<T> outcome;

    const auto permit = breaker_->acquire();
    if (permit == CircuitBreaker::Permit::Rejected) {
        spdlog::warn("{}: circuit open, call rejected without contacting the dependency", name);
        outcome.status = CallStatus::CircuitOpen;
        return outcome;
    }

    bool definitiveFailure = false;
    bool cancelled = false;
    bool saturated = false;
    for (size_t attempt = 0; attempt < policy_.maxAttempts(); ++attempt) {
        if (stop.stop_requested()) {
            cancelled = true;
            break;
        }
        if (attempt > 0) {
            auto delay = policy_.backoffFor(attempt, drawJitter());
            spdlog::debug("{}: retry {}/{} in {} ms", name, attempt, policy_.maxRetries,
                          delay.count());
            if (!sleepBackoff(delay, stop)) {
                cancelled = true;
                break;
            }
        }

        ++outcome.attempts;
        auto result = runAttempt<T>(op, stop);
        if (result) {
            breaker_->recordSuccess();
            outcome.value = std::move(result).value();
            outcome.status = CallStatus::Ok;
            return outcome;
        }
        if (result.error().code == ErrorCode::OperationCancelled) {
            cancelled = true;
            break;
        }
        if (result.error().code == ErrorCode::ResourceExhausted) {
            // Never started, so it says nothing about the dependency
            --outcome.attempts;
            outcome.lastError = result.error();
            saturated = true;
            break;
        }
        definitiveFailure = true;
        outcome.lastError = result.error();
        spdlog::debug("{}: attempt {} failed: {}", name, outcome.attempts,
                      result.error().message);
    }

    if (saturated) {
        outcome.status = CallStatus::Saturated;
        if (definitiveFailure) {
            breaker_->recordFailure();
        } else if (permit == CircuitBreaker::Permit::Probe) {
            breaker_->releaseProbe();
        }
        spdlog::warn("{}: all {} workers busy, giving up after {} attempt(s)", name,
                     gate_->capacity, outcome.attempts);
        return outcome;
    }

    if (cancelled) {
        outcome.status = CallStatus::Cancelled;
        if (definitiveFailure) {
            breaker_->recordFailure();
        } else if (permit == CircuitBreaker::Permit::Probe) {
            breaker_->releaseProbe();
        }
        spdlog::debug("{}: cancelled after {} attempt(s)", name, outcome.attempts);
        return outcome;
    }

    breaker_->recordFailure();
    outcome.status = CallStatus::Failed;
    spdlog::warn("{}: failed after {} attempt(s): {}", name, outcome.attempts,
                 outcome.lastError ? outcome.lastError->message : std::string("unknown error"));
    return outcome;
}

} // namespace recall::resilience
