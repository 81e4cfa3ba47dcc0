#pragma once

#include <recall/config/recall_config.h>
#include <recall/core/types.h>
#include <recall/memory/active_beliefs.h>
#include <recall/resilience/resilient_call.h>
#include <recall/search/arbitration.h>
#include <recall/search/candidate_selector.h>
#include <recall/search/composite_scorer.h>
#include <recall/vector/resilient_store.h>
#include <recall/vector/store_client.h>

#include <nlohmann/json.hpp>

#include <memory>
#include <stop_token>
#include <string>
#include <vector>

namespace recall::search {

struct RankedCandidate {
    std::string id;
    double finalScore = 0.0;
    ScoreBreakdown breakdown;
    memory::Candidate candidate;
    ProvenanceClass provenance = ProvenanceClass::Base;
};

struct RetrievalResponse {
    std::vector<RankedCandidate> results;
    RecallReason reason = RecallReason::Ok;
    QueryIntent intent = QueryIntent::Fact;
    SelectionFallbacks fallbacks;
    size_t fetchAttempts = 0;
    vector::FetchReason fetchReason = vector::FetchReason::Ok;

    bool empty() const noexcept { return results.empty(); }
    nlohmann::json toJson() const;
};

/**
 * @brief Build the shared retry/timeout/breaker wrapper from the resilience settings
 */
std::shared_ptr<resilience::ResilientCall>
makeResilientCall(const config::ResilienceConfig& config);

/**
 * @brief Query entry point of the recall core.
 *
 * embed -> resilient fetch -> normalize -> select -> composite score -> arbitration ->
 * MMR over final scores -> top-K. Store and embedder problems produce an empty result with a
 * reason; only an embedding dimension mismatch is reported as an error.
 *
 * Thread-safe: concurrent queries share the breaker and read immutable snapshots of the
 * active beliefs and the learned profile.
 */
class Retriever {
public:
    Retriever(const config::RecallConfig& config, std::shared_ptr<vector::IStoreClient> store,
              std::shared_ptr<vector::IEmbeddingProvider> embedder,
              std::shared_ptr<const memory::ActiveBeliefSet> beliefs,
              std::shared_ptr<ArbitrationProfileStore> profiles,
              std::shared_ptr<resilience::ResilientCall> storeCall = nullptr,
              std::shared_ptr<resilience::ResilientCall> embedCall = nullptr);

    Result<RetrievalResponse> retrieve(const std::string& query, size_t topK,
                                       std::stop_token stop = {});

    /**
     * @brief Same as retrieve() with a precomputed query embedding
     *
     * @param query Used for intent detection, keyword boost and telemetry only
     */
    Result<RetrievalResponse> retrieveByVector(const std::string& query,
                                               const std::vector<float>& queryVector,
                                               size_t topK, std::stop_token stop = {});

    // Publish a new active-belief snapshot for subsequent queries
    void setActiveBeliefs(std::shared_ptr<const memory::ActiveBeliefSet> beliefs);
    std::shared_ptr<const memory::ActiveBeliefSet> activeBeliefs() const {
        return std::atomic_load_explicit(&beliefs_, std::memory_order_acquire);
    }

    const std::shared_ptr<resilience::CircuitBreaker>& breaker() const noexcept {
        return storeAccess_.breaker();
    }
    const config::RecallConfig& config() const noexcept { return config_; }

private:
    Result<RetrievalResponse> rank(const std::string& query,
                                   const std::vector<float>& queryVector, size_t topK,
                                   const std::stop_token& stop);

    void emitTelemetry(const std::string& query, size_t rawCount,
                       const SelectionOutcome& selection,
                       const std::vector<RankedCandidate>& results) const;

    config::RecallConfig config_;
    std::shared_ptr<vector::IEmbeddingProvider> embedder_;
    std::shared_ptr<const memory::ActiveBeliefSet> beliefs_;
    std::shared_ptr<ArbitrationProfileStore> profiles_;
    std::shared_ptr<resilience::ResilientCall> embedCall_;

    vector::ResilientStoreAccess storeAccess_;
    CandidateSelector selector_;
    CompositeScorer scorer_;
    ArbitrationRanker arbitration_;
};

} // namespace recall::search
