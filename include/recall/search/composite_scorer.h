#pragma once

#include <recall/core/types.h>
#include <recall/memory/active_beliefs.h>
#include <recall/memory/candidate.h>
#include <recall/search/contradiction_hook.h>

#include <nlohmann/json.hpp>

#include <memory>
#include <string>
#include <unordered_set>
#include <vector>

namespace recall::search {

/**
 * @brief Non-negative factor weights and tuning constants for the composite score
 */
struct ScoringWeights {
    double sim = 1.0;
    double rec = 0.6;
    double cred = 0.5;
    double conf = 0.3;
    double bel = 0.4;
    double use = 0.2;
    double nov = 0.1;

    // Recency decay per day
    double decayLambda = 0.015;

    bool beliefsEnabled = true;
    double beliefAlpha = 0.1;
    double beliefImportanceBoost = 0.1;
    std::vector<std::string> importantPrefixes{"core.identity", "core.ethic"};

    nlohmann::json toJson() const;
};

/**
 * @brief Per-candidate factor record; produced fresh per query and never persisted
 */
struct ScoreBreakdown {
    double similarity = 0.0;
    double recency = 0.0;
    double credibility = 0.0;
    double confidence = 0.0;
    double beliefAlignment = 0.0;
    double usage = 0.0;
    double novelty = 0.0;
    double conflictPenalty = 0.0;
    double final = 0.0;

    nlohmann::json toJson() const;
};

struct ScoredCandidate {
    memory::Candidate candidate;
    ScoreBreakdown breakdown;

    double finalScore() const noexcept { return breakdown.final; }
};

/**
 * @brief Read-only inputs shared by every candidate of one query
 */
struct ScoringContext {
    std::shared_ptr<const memory::ActiveBeliefSet> beliefs;
    // Ids currently ranked ahead; a candidate contradicting one of them is penalized
    std::unordered_set<std::string> favoredIds;
    TimePoint now = std::chrono::system_clock::now();
};

// Individual factors, exposed for tests and diagnostics
double recencyScore(const std::optional<TimePoint>& timestamp, TimePoint now, double decayLambda);
double beliefAlignmentScore(const std::vector<std::string>& candidateTags,
                            const memory::ActiveBeliefSet* beliefs, const ScoringWeights& weights);
double usageScore(uint32_t timesUsed);
double noveltyScore(const std::vector<float>& embedding,
                    const std::vector<const memory::Candidate*>& alreadySelected);

/**
 * @brief Multi-factor scoring of retrieved candidates.
 *
 * final = w_sim * similarity * multiplier, where the multiplier combines recency,
 * credibility, confidence, belief alignment, usage and novelty, reduced by the contradiction
 * penalty when it applies. Scoring is deterministic for identical inputs.
 */
class CompositeScorer {
public:
    static constexpr size_t PARALLEL_THRESHOLD = 64;

    CompositeScorer() = default;
    explicit CompositeScorer(ContradictionPenaltyHook hook) : hook_(std::move(hook)) {}

    /**
     * @brief Score a single candidate
     *
     * @param alreadySelected Candidates accepted ahead of this one (novelty reference)
     * @return Scored candidate, or ErrorCode::DimensionMismatch
     */
    Result<ScoredCandidate> score(const memory::Candidate& candidate,
                                  const std::vector<float>& queryVector,
                                  const std::vector<const memory::Candidate*>& alreadySelected,
                                  const ScoringWeights& weights,
                                  const ScoringContext& context) const;

    /**
     * @brief Score a batch independently (novelty against nothing) and sort by final score
     *        descending, ties broken by id.
     *
     * Large batches are scored in parallel; the output order does not depend on it.
     */
    Result<std::vector<ScoredCandidate>> scoreAll(const std::vector<memory::Candidate>& candidates,
                                                  const std::vector<float>& queryVector,
                                                  const ScoringWeights& weights,
                                                  const ScoringContext& context) const;

    /**
     * @brief Greedy novelty-aware scoring.
     *
     * Repeatedly rescores the remaining candidates against the ones already accepted and
     * accepts the best. Accepted ids become the favored set for the contradiction hook.
     * Output is in acceptance order.
     */
    Result<std::vector<ScoredCandidate>>
    scoreSequential(const std::vector<memory::Candidate>& candidates,
                    const std::vector<float>& queryVector, const ScoringWeights& weights,
                    const ScoringContext& context) const;

    const ContradictionPenaltyHook& hook() const noexcept { return hook_; }

private:
    ContradictionPenaltyHook hook_;
};

/**
 * @brief Stable sort by final score descending, then id ascending
 */
void sortByFinalScore(std::vector<ScoredCandidate>& scored);

} // namespace recall::search
