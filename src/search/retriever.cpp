#include <recall/search/mmr_reranker.h>
#include <recall/search/retriever.h>
#include <recall/search/telemetry.h>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace recall::search {

namespace {

RecallReason reasonFor(vector::FetchReason reason) {
    switch (reason) {
        case vector::FetchReason::Ok: return RecallReason::Ok;
        case vector::FetchReason::Empty: return RecallReason::NoCandidates;
        case vector::FetchReason::CircuitOpen: return RecallReason::CircuitOpen;
        case vector::FetchReason::Failed: return RecallReason::StoreFailure;
        case vector::FetchReason::Cancelled: return RecallReason::Cancelled;
    }
    return RecallReason::StoreFailure;
}

RankedCandidate toRanked(ArbitratedCandidate&& item) {
    RankedCandidate out;
    out.id = item.id();
    out.finalScore = item.arbitratedScore;
    out.breakdown = item.scored.breakdown;
    out.breakdown.final = item.arbitratedScore;
    out.candidate = std::move(item.scored.candidate);
    out.provenance = item.provenance;
    return out;
}

} // namespace

nlohmann::json RetrievalResponse::toJson() const {
    nlohmann::json items = nlohmann::json::array();
    for (const auto& r : results) {
        items.push_back({{"id", r.id},
                         {"final_score", r.finalScore},
                         {"provenance", provenanceToString(r.provenance)},
                         {"breakdown", r.breakdown.toJson()},
                         {"tags", r.candidate.provenanceTags}});
    }
    return nlohmann::json{{"results", std::move(items)},
                          {"reason", recallReasonToString(reason)},
                          {"intent", intentToString(intent)},
                          {"fallbacks", fallbacks.toJson()},
                          {"fetch_attempts", fetchAttempts},
                          {"fetch_reason", vector::toString(fetchReason)}};
}

std::shared_ptr<resilience::ResilientCall>
makeResilientCall(const config::ResilienceConfig& config) {
    resilience::CircuitBreaker::Config breakerConfig;
    breakerConfig.failureLimit = config.failureLimit;
    breakerConfig.openDuration = config.openDuration;

    resilience::RetryPolicy policy;
    policy.maxRetries = config.maxRetries;
    policy.attemptTimeout = config.attemptTimeout;
    policy.backoffBase = config.backoffBase;
    policy.jitterRatio = config.jitterRatio;

    resilience::ResilientCall::Options options;
    options.workerThreads = config.workerThreads;
    options.spareWorkers = config.spareWorkers;

    return std::make_shared<resilience::ResilientCall>(
        policy, std::make_shared<resilience::CircuitBreaker>(breakerConfig), options);
}

Retriever::Retriever(const config::RecallConfig& config,
                     std::shared_ptr<vector::IStoreClient> store,
                     std::shared_ptr<vector::IEmbeddingProvider> embedder,
                     std::shared_ptr<const memory::ActiveBeliefSet> beliefs,
                     std::shared_ptr<ArbitrationProfileStore> profiles,
                     std::shared_ptr<resilience::ResilientCall> storeCall,
                     std::shared_ptr<resilience::ResilientCall> embedCall)
    : config_(config), embedder_(std::move(embedder)), beliefs_(std::move(beliefs)),
      profiles_(std::move(profiles)), embedCall_(std::move(embedCall)),
      storeAccess_(std::move(store),
                   storeCall ? std::move(storeCall) : makeResilientCall(config.resilience)),
      scorer_(ContradictionPenaltyHook(config.contradiction)), arbitration_(config.arbitration) {
    if (!beliefs_) {
        beliefs_ = std::make_shared<const memory::ActiveBeliefSet>();
    }
    if (!profiles_) {
        profiles_ = std::make_shared<ArbitrationProfileStore>();
    }
    if (!embedCall_) {
        embedCall_ = makeResilientCall(config.resilience);
    }
}

void Retriever::setActiveBeliefs(std::shared_ptr<const memory::ActiveBeliefSet> beliefs) {
    if (!beliefs) {
        beliefs = std::make_shared<const memory::ActiveBeliefSet>();
    }
    std::atomic_store_explicit(&beliefs_, std::move(beliefs), std::memory_order_release);
}

Result<RetrievalResponse> Retriever::retrieve(const std::string& query, size_t topK,
                                              std::stop_token stop) {
    if (!embedder_) {
        spdlog::error("Recall query without an embedding provider");
        RetrievalResponse response;
        response.reason = RecallReason::StoreFailure;
        response.intent = detectQueryIntent(query);
        return response;
    }

    auto embedder = embedder_;
    std::function<Result<std::vector<float>>()> op = [embedder, query]() {
        return embedder->embed(query);
    };
    auto embedded = embedCall_->run<std::vector<float>>("embedder.embed", std::move(op), stop);
    if (!embedded.ok() || !embedded.value || embedded.value->empty()) {
        RetrievalResponse response;
        response.intent = detectQueryIntent(query);
        response.reason = embedded.status == resilience::CallStatus::Cancelled
                              ? RecallReason::Cancelled
                              : RecallReason::StoreFailure;
        spdlog::warn("Query embedding unavailable ({}), returning no results",
                     resilience::toString(embedded.status));
        return response;
    }
    return rank(query, *embedded.value, topK, stop);
}

Result<RetrievalResponse> Retriever::retrieveByVector(const std::string& query,
                                                      const std::vector<float>& queryVector,
                                                      size_t topK, std::stop_token stop) {
    return rank(query, queryVector, topK, stop);
}

Result<RetrievalResponse> Retriever::rank(const std::string& query,
                                          const std::vector<float>& queryVector, size_t topK,
                                          const std::stop_token& stop) {
    RetrievalResponse response;
    response.intent = detectQueryIntent(query);
    if (topK == 0) {
        response.reason = RecallReason::NoCandidates;
        return response;
    }

    auto fetched = storeAccess_.fetch(queryVector, topK, stop);
    response.fetchAttempts = fetched.attempts;
    response.fetchReason = fetched.reason;
    if (fetched.degraded()) {
        response.reason = reasonFor(fetched.reason);
        if (fetched.reason == vector::FetchReason::CircuitOpen) {
            spdlog::warn("Recall degraded: vector store circuit is open");
        }
        return response;
    }

    auto hits = memory::normalizeHits(fetched.hits);
    auto selection = selector_.select(query, hits, config_.selection);
    response.fallbacks = selection.fallbacks;
    if (selection.empty()) {
        response.reason = selection.reason;
        emitTelemetry(query, hits.size(), selection, response.results);
        return response;
    }
    if (stop.stop_requested()) {
        response.reason = RecallReason::Cancelled;
        return response;
    }

    ScoringContext context;
    context.beliefs = activeBeliefs();
    auto scored =
        scorer_.scoreSequential(selection.candidates, queryVector, config_.scoring, context);
    if (!scored) {
        spdlog::error("Recall aborted: {}", scored.error().message);
        return scored.error();
    }

    auto profile = profiles_->snapshot();
    auto arbitrated = arbitration_.rank(std::move(scored).value(), response.intent,
                                        profile.get());

    std::vector<RankedCandidate> ranked;
    ranked.reserve(arbitrated.size());
    for (auto& item : arbitrated) {
        ranked.push_back(toRanked(std::move(item)));
    }

    if (config_.selection.mmrEnabled && ranked.size() > 1) {
        std::vector<MmrItem> items;
        items.reserve(ranked.size());
        for (const auto& r : ranked) {
            items.push_back(MmrItem{r.finalScore, &r.candidate.embedding});
        }
        try {
            auto order = mmrSelect(items, topK, config_.selection.mmrLambda);
            std::vector<RankedCandidate> diversified;
            diversified.reserve(order.size());
            for (size_t idx : order) {
                diversified.push_back(std::move(ranked[idx]));
            }
            ranked = std::move(diversified);
        } catch (const DimensionMismatchError& e) {
            spdlog::error("Recall aborted during diversification: {}", e.what());
            return Error{ErrorCode::DimensionMismatch, e.what()};
        }
    }

    if (ranked.size() > topK) {
        ranked.resize(topK);
    }
    response.results = std::move(ranked);
    response.reason = RecallReason::Ok;
    emitTelemetry(query, hits.size(), selection, response.results);
    return response;
}

void Retriever::emitTelemetry(const std::string& query, size_t rawCount,
                              const SelectionOutcome& selection,
                              const std::vector<RankedCandidate>& results) const {
    if (!config_.telemetry.enabled) {
        return;
    }
    std::vector<TelemetrySample> samples;
    for (const auto& r : results) {
        samples.push_back(TelemetrySample{r.id, r.finalScore, r.candidate.text});
    }
    emitRecallTelemetry(buildRecallTelemetry(query, rawCount, config_.selection, selection,
                                             samples, config_.telemetry.previewChars));
}

} // namespace recall::search
