#include <recall/vector/resilient_store.h>

#include <spdlog/spdlog.h>

namespace recall::vector {

const char* toString(FetchReason reason) noexcept {
    switch (reason) {
        case FetchReason::Ok: return "ok";
        case FetchReason::Empty: return "empty";
        case FetchReason::CircuitOpen: return "circuit_open";
        case FetchReason::Failed: return "failed";
        case FetchReason::Cancelled: return "cancelled";
    }
    return "unknown";
}

ResilientStoreAccess::ResilientStoreAccess(std::shared_ptr<IStoreClient> client,
                                           std::shared_ptr<resilience::ResilientCall> call)
    : client_(std::move(client)), call_(std::move(call)) {
    if (!call_) {
        call_ = std::make_shared<resilience::ResilientCall>(
            resilience::RetryPolicy{}, std::make_shared<resilience::CircuitBreaker>());
    }
}

FetchOutcome ResilientStoreAccess::fetch(const std::vector<float>& queryVector, size_t topK,
                                         std::stop_token stop) {
    FetchOutcome out;
    if (!client_) {
        out.reason = FetchReason::Failed;
        out.breakerState = call_->breaker()->state();
        spdlog::error("Vector store fetch requested without a store client");
        return out;
    }

    // The attempt may outlive this frame after a timeout, so it owns its inputs
    auto client = client_;
    std::function<Result<std::vector<memory::RawHit>>()> op = [client, queryVector, topK]() {
        auto hits = client->search(queryVector, topK);
        if (!hits) {
            return hits;
        }
        for (const auto& hit : hits.value()) {
            if (!hit.payload.is_object() && !hit.payload.is_null()) {
                return Result<std::vector<memory::RawHit>>(
                    Error{ErrorCode::InvalidData, "malformed payload for hit '" + hit.id + "'"});
            }
        }
        return hits;
    };

    auto result = call_->run<std::vector<memory::RawHit>>("vector_store.search", std::move(op),
                                                          stop);
    out.attempts = result.attempts;
    out.breakerState = call_->breaker()->state();

    switch (result.status) {
        case resilience::CallStatus::Ok:
            out.hits = std::move(*result.value);
            out.reason = out.hits.empty() ? FetchReason::Empty : FetchReason::Ok;
            break;
        case resilience::CallStatus::CircuitOpen:
            out.reason = FetchReason::CircuitOpen;
            break;
        case resilience::CallStatus::Failed:
        case resilience::CallStatus::Saturated:
            out.reason = FetchReason::Failed;
            break;
        case resilience::CallStatus::Cancelled:
            out.reason = FetchReason::Cancelled;
            break;
    }
    return out;
}

} // namespace recall::vector
