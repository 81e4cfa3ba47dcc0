#include <recall/resilience/resilient_call.h>

#include <algorithm>
#include <thread>

namespace recall::resilience {

const char* toString(CallStatus status) noexcept {
    switch (status) {
        case CallStatus::Ok: return "ok";
        case CallStatus::CircuitOpen: return "circuit_open";
        case CallStatus::Failed: return "failed";
        case CallStatus::Cancelled: return "cancelled";
        case CallStatus::Saturated: return "saturated";
    }
    return "unknown";
}

ResilientCall::ResilientCall(RetryPolicy policy, std::shared_ptr<CircuitBreaker> breaker)
    : ResilientCall(std::move(policy), std::move(breaker), Options{}) {}

ResilientCall::ResilientCall(RetryPolicy policy, std::shared_ptr<CircuitBreaker> breaker,
                             Options options, Sleeper sleeper, JitterSource jitter)
    : policy_(std::move(policy)), breaker_(std::move(breaker)), options_(options),
      sleeper_(std::move(sleeper)), jitter_(std::move(jitter)) {
    if (!breaker_) {
        breaker_ = std::make_shared<CircuitBreaker>();
    }
    if (options_.pollInterval.count() <= 0) {
        options_.pollInterval = std::chrono::milliseconds{10};
    }
    const size_t threads = std::max<size_t>(1, options_.workerThreads) + options_.spareWorkers;
    gate_ = std::make_shared<WorkerGate>();
    gate_->capacity = threads;
    pool_ = std::make_unique<boost::asio::thread_pool>(threads);
}

ResilientCall::~ResilientCall() {
    if (!pool_) {
        return;
    }
    if (gate_->waitIdle(options_.shutdownGrace)) {
        pool_->join();
        return;
    }
    // A hung operation cannot be interrupted; the pool is joined off this thread once it returns
    spdlog::warn("Shutting down with {} attempt(s) still running; detaching worker pool",
                 busyWorkers());
    pool_->stop();
    std::thread([pool = std::move(pool_)]() { pool->join(); }).detach();
}

size_t ResilientCall::busyWorkers() const {
    std::lock_guard<std::mutex> lock(gate_->mutex);
    return gate_->inFlight;
}

bool ResilientCall::WorkerGate::tryEnter() {
    std::lock_guard<std::mutex> lock(mutex);
    if (inFlight >= capacity) {
        return false;
    }
    ++inFlight;
    return true;
}

void ResilientCall::WorkerGate::leave() {
    {
        std::lock_guard<std::mutex> lock(mutex);
        --inFlight;
    }
    idle.notify_all();
}

bool ResilientCall::WorkerGate::waitIdle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex);
    return idle.wait_for(lock, timeout, [this]() { return inFlight == 0; });
}

bool ResilientCall::sleepBackoff(std::chrono::milliseconds delay, const std::stop_token& stop) {
    if (sleeper_) {
        return sleeper_(delay, stop);
    }
    return interruptibleSleep(delay, stop);
}

double ResilientCall::drawJitter() {
    return jitter_ ? jitter_() : defaultJitter();
}

} // namespace recall::resilience
