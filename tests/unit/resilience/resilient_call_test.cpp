#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <stop_token>
#include <thread>
#include <vector>
#include <gtest/gtest.h>
#include <recall/resilience/resilient_call.h>

using namespace recall;
using namespace recall::resilience;
using namespace std::chrono_literals;

namespace {

struct RecordingSleeper {
    std::shared_ptr<std::vector<std::chrono::milliseconds>> delays =
        std::make_shared<std::vector<std::chrono::milliseconds>>();

    Sleeper fn() const {
        auto d = delays;
        return [d](std::chrono::milliseconds delay, std::stop_token stop) {
            d->push_back(delay);
            return !stop.stop_requested();
        };
    }
};

// Blocks callers until released
class Latch {
public:
    void wait() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this]() { return open_; });
    }
    void release() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            open_ = true;
        }
        cv_.notify_all();
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    bool open_ = false;
};

// An operation whose first `hangs` invocations block on the latch
std::function<Result<int>()> hangingOp(std::shared_ptr<Latch> latch,
                                       std::shared_ptr<std::atomic<int>> invocations, int hangs) {
    return [latch, invocations, hangs]() -> Result<int> {
        if (invocations->fetch_add(1) < hangs) {
            latch->wait();
        }
        return 1;
    };
}

} // namespace

class ResilientCallTest : public ::testing::Test {
protected:
    void SetUp() override {
        now_ = std::make_shared<CircuitBreaker::Clock::time_point>(CircuitBreaker::Clock::now());
        auto now = now_;
        breaker_ = std::make_shared<CircuitBreaker>(CircuitBreaker::Config{3, 1000ms},
                                                    [now]() { return *now; });
        policy_.maxRetries = 2;
        policy_.attemptTimeout = 2000ms;
        policy_.backoffBase = 100ms;
        policy_.jitterRatio = 0.25;
    }

    std::unique_ptr<ResilientCall> makeCall() {
        return std::make_unique<ResilientCall>(policy_, breaker_, ResilientCall::Options{},
                                               sleeper_.fn(), []() { return 0.0; });
    }

    std::unique_ptr<ResilientCall> makeCall(ResilientCall::Options options) {
        return std::make_unique<ResilientCall>(policy_, breaker_, options, sleeper_.fn(),
                                               []() { return 0.0; });
    }

    std::shared_ptr<CircuitBreaker::Clock::time_point> now_;
    std::shared_ptr<CircuitBreaker> breaker_;
    RetryPolicy policy_;
    RecordingSleeper sleeper_;
};

TEST(RetryPolicyTest, ExponentialBackoffWithJitter) {
    RetryPolicy p;
    p.backoffBase = 200ms;
    p.jitterRatio = 0.25;
    EXPECT_EQ(p.backoffFor(0, 0.5), 0ms);
    EXPECT_EQ(p.backoffFor(1, 0.0), 200ms);
    EXPECT_EQ(p.backoffFor(2, 0.0), 400ms);
    EXPECT_EQ(p.backoffFor(3, 0.0), 800ms);
    EXPECT_EQ(p.backoffFor(1, 1.0), 250ms);
    EXPECT_EQ(p.maxAttempts(), 3u);
}

TEST_F(ResilientCallTest, FirstAttemptSuccess) {
    auto call = makeCall();
    auto outcome = call->run<int>("op", []() -> Result<int> { return 7; });
    ASSERT_TRUE(outcome.ok());
    EXPECT_EQ(*outcome.value, 7);
    EXPECT_EQ(outcome.attempts, 1u);
    EXPECT_TRUE(sleeper_.delays->empty());
}

TEST_F(ResilientCallTest, RetriesWithBackoffThenSucceeds) {
    auto call = makeCall();
    auto calls = std::make_shared<std::atomic<int>>(0);
    auto outcome = call->run<int>("op", [calls]() -> Result<int> {
        if (++*calls < 3) {
            return Error{ErrorCode::NetworkError, "flaky"};
        }
        return 42;
    });
    ASSERT_TRUE(outcome.ok());
    EXPECT_EQ(outcome.attempts, 3u);
    EXPECT_EQ(*sleeper_.delays, (std::vector<std::chrono::milliseconds>{100ms, 200ms}));
    EXPECT_EQ(breaker_->consecutiveFailures(), 0u);
}

TEST_F(ResilientCallTest, ExhaustedRetriesCountAsOneFailure) {
    auto call = makeCall();
    auto outcome = call->run<int>(
        "op", []() -> Result<int> { return Error{ErrorCode::StoreUnavailable, "down"}; });
    EXPECT_EQ(outcome.status, CallStatus::Failed);
    EXPECT_EQ(outcome.attempts, 3u);
    ASSERT_TRUE(outcome.lastError.has_value());
    EXPECT_EQ(outcome.lastError->code, ErrorCode::StoreUnavailable);
    EXPECT_EQ(breaker_->consecutiveFailures(), 1u);
}

TEST_F(ResilientCallTest, ExceptionsBecomeFailures) {
    policy_.maxRetries = 0;
    auto call = makeCall();
    auto outcome =
        call->run<int>("op", []() -> Result<int> { throw std::runtime_error("boom"); });
    EXPECT_EQ(outcome.status, CallStatus::Failed);
    ASSERT_TRUE(outcome.lastError.has_value());
    EXPECT_EQ(outcome.lastError->code, ErrorCode::InternalError);
}

TEST_F(ResilientCallTest, OpenCircuitSkipsOperation) {
    policy_.maxRetries = 0;
    auto call = makeCall();
    auto invoked = std::make_shared<std::atomic<int>>(0);
    auto failing = [invoked]() -> Result<int> {
        ++*invoked;
        return Error{ErrorCode::Timeout, "slow"};
    };
    for (int i = 0; i < 3; ++i) {
        EXPECT_EQ(call->run<int>("op", failing).status, CallStatus::Failed);
    }
    EXPECT_TRUE(breaker_->isOpen());

    auto rejected = call->run<int>("op", failing);
    EXPECT_EQ(rejected.status, CallStatus::CircuitOpen);
    EXPECT_EQ(rejected.attempts, 0u);
    EXPECT_EQ(invoked->load(), 3);
}

TEST_F(ResilientCallTest, AttemptTimeoutIsEnforced) {
    policy_.maxRetries = 0;
    policy_.attemptTimeout = 30ms;
    auto call = makeCall();
    auto start = std::chrono::steady_clock::now();
    auto outcome = call->run<int>("op", []() -> Result<int> {
        std::this_thread::sleep_for(300ms);
        return 1;
    });
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_EQ(outcome.status, CallStatus::Failed);
    ASSERT_TRUE(outcome.lastError.has_value());
    EXPECT_EQ(outcome.lastError->code, ErrorCode::Timeout);
    EXPECT_LT(elapsed, 250ms);
}

TEST_F(ResilientCallTest, CancelledBeforeAttemptLeavesBreakerUntouched) {
    auto call = makeCall();
    std::stop_source source;
    source.request_stop();
    auto invoked = std::make_shared<std::atomic<int>>(0);
    auto outcome = call->run<int>(
        "op",
        [invoked]() -> Result<int> {
            ++*invoked;
            return 1;
        },
        source.get_token());
    EXPECT_EQ(outcome.status, CallStatus::Cancelled);
    EXPECT_EQ(invoked->load(), 0);
    EXPECT_EQ(breaker_->consecutiveFailures(), 0u);
    EXPECT_EQ(breaker_->state(), CircuitBreaker::State::Closed);
}

TEST_F(ResilientCallTest, CancelledProbeIsReturned) {
    policy_.maxRetries = 0;
    auto call = makeCall();
    for (int i = 0; i < 3; ++i) {
        call->run<int>("op", []() -> Result<int> { return Error{ErrorCode::Timeout, "slow"}; });
    }
    ASSERT_EQ(breaker_->state(), CircuitBreaker::State::Open);
    *now_ += 1000ms;

    std::stop_source source;
    source.request_stop();
    auto outcome =
        call->run<int>("op", []() -> Result<int> { return 1; }, source.get_token());
    EXPECT_EQ(outcome.status, CallStatus::Cancelled);
    EXPECT_EQ(breaker_->state(), CircuitBreaker::State::HalfOpen);
    EXPECT_EQ(breaker_->acquire(), CircuitBreaker::Permit::Probe);
}

TEST_F(ResilientCallTest, CancellationAfterFailureStillCounts) {
    auto call = std::make_unique<ResilientCall>(
        policy_, breaker_, ResilientCall::Options{},
        [](std::chrono::milliseconds, std::stop_token) { return false; },
        []() { return 0.0; });
    auto outcome = call->run<int>(
        "op", []() -> Result<int> { return Error{ErrorCode::NetworkError, "reset"}; });
    EXPECT_EQ(outcome.status, CallStatus::Cancelled);
    EXPECT_EQ(outcome.attempts, 1u);
    EXPECT_EQ(breaker_->consecutiveFailures(), 1u);
}

TEST_F(ResilientCallTest, HungAttemptsDoNotStarveLaterCalls) {
    policy_.maxRetries = 0;
    policy_.attemptTimeout = 50ms;
    ResilientCall::Options options;
    options.workerThreads = 2;
    options.spareWorkers = 2;
    auto call = makeCall(options);
    auto latch = std::make_shared<Latch>();
    auto invocations = std::make_shared<std::atomic<int>>(0);
    auto op = hangingOp(latch, invocations, 2);

    EXPECT_EQ(call->run<int>("op", op).status, CallStatus::Failed);
    EXPECT_EQ(call->run<int>("op", op).status, CallStatus::Failed);
    EXPECT_EQ(breaker_->consecutiveFailures(), 2u);
    EXPECT_EQ(call->busyWorkers(), 2u);

    auto third = call->run<int>("op", op);
    ASSERT_TRUE(third.ok());
    EXPECT_EQ(third.attempts, 1u);
    EXPECT_EQ(invocations->load(), 3);
    EXPECT_EQ(breaker_->consecutiveFailures(), 0u);

    latch->release();
}

TEST_F(ResilientCallTest, SaturatedPoolIsNotCountedAgainstTheDependency) {
    policy_.maxRetries = 0;
    policy_.attemptTimeout = 50ms;
    ResilientCall::Options options;
    options.workerThreads = 2;
    options.spareWorkers = 0;
    auto call = makeCall(options);
    auto latch = std::make_shared<Latch>();
    auto invocations = std::make_shared<std::atomic<int>>(0);
    auto op = hangingOp(latch, invocations, 2);

    EXPECT_EQ(call->run<int>("op", op).status, CallStatus::Failed);
    EXPECT_EQ(call->run<int>("op", op).status, CallStatus::Failed);

    for (int i = 0; i < 3; ++i) {
        auto rejected = call->run<int>("op", op);
        EXPECT_EQ(rejected.status, CallStatus::Saturated);
        EXPECT_EQ(rejected.attempts, 0u);
        ASSERT_TRUE(rejected.lastError.has_value());
        EXPECT_EQ(rejected.lastError->code, ErrorCode::ResourceExhausted);
    }
    EXPECT_EQ(invocations->load(), 2);
    EXPECT_EQ(breaker_->consecutiveFailures(), 2u);
    EXPECT_EQ(breaker_->state(), CircuitBreaker::State::Closed);

    latch->release();
    auto deadline = std::chrono::steady_clock::now() + 2s;
    while (call->busyWorkers() > 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(5ms);
    }
    ASSERT_EQ(call->busyWorkers(), 0u);

    auto recovered = call->run<int>("op", op);
    ASSERT_TRUE(recovered.ok());
    EXPECT_EQ(invocations->load(), 3);
    EXPECT_EQ(breaker_->consecutiveFailures(), 0u);
}

TEST_F(ResilientCallTest, ShutdownDoesNotWaitForHungAttempts) {
    policy_.maxRetries = 0;
    policy_.attemptTimeout = 20ms;
    ResilientCall::Options options;
    options.shutdownGrace = 50ms;
    auto call = makeCall(options);
    auto latch = std::make_shared<Latch>();
    auto invocations = std::make_shared<std::atomic<int>>(0);

    EXPECT_EQ(call->run<int>("op", hangingOp(latch, invocations, 1)).status, CallStatus::Failed);

    auto start = std::chrono::steady_clock::now();
    call.reset();
    EXPECT_LT(std::chrono::steady_clock::now() - start, 1s);

    latch->release();
}
