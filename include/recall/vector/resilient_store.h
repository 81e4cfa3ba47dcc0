#pragma once

#include <recall/memory/candidate.h>
#include <recall/resilience/circuit_breaker.h>
#include <recall/resilience/resilient_call.h>
#include <recall/vector/store_client.h>

#include <memory>
#include <stop_token>
#include <vector>

namespace recall::vector {

enum class FetchReason {
    Ok,          // store answered with hits
    Empty,       // store answered, nothing matched
    CircuitOpen, // rejected without contacting the store
    Failed,      // all attempts failed or timed out
    Cancelled
};

const char* toString(FetchReason reason) noexcept;

struct FetchOutcome {
    std::vector<memory::RawHit> hits;
    FetchReason reason = FetchReason::Failed;
    size_t attempts = 0;
    resilience::CircuitBreaker::State breakerState = resilience::CircuitBreaker::State::Closed;

    bool degraded() const noexcept {
        return reason != FetchReason::Ok && reason != FetchReason::Empty;
    }
};

/**
 * @brief Store access that never throws.
 *
 * Wraps an IStoreClient with per-attempt timeouts, jittered retries and a circuit breaker.
 * Every failure mode collapses to an empty hit list plus a reason.
 */
class ResilientStoreAccess {
public:
    ResilientStoreAccess(std::shared_ptr<IStoreClient> client,
                         std::shared_ptr<resilience::ResilientCall> call);

    FetchOutcome fetch(const std::vector<float>& queryVector, size_t topK,
                       std::stop_token stop = {});

    const std::shared_ptr<resilience::CircuitBreaker>& breaker() const noexcept {
        return call_->breaker();
    }

private:
    std::shared_ptr<IStoreClient> client_;
    std::shared_ptr<resilience::ResilientCall> call_;
};

} // namespace recall::vector
