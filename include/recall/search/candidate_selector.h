#pragma once

#include <recall/memory/candidate.h>
#include <recall/search/mmr_reranker.h>

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace recall::search {

/**
 * @brief Why a query produced the result set it did
 */
enum class RecallReason {
    Ok,
    NoCandidates,
    BelowThreshold,
    CircuitOpen,
    StoreFailure,
    Cancelled,
    DimensionMismatch
};

const char* recallReasonToString(RecallReason reason) noexcept;

/**
 * @brief Candidate selection stages; every optional stage defaults to off
 */
struct SelectionConfig {
    double threshold = 0.30;

    bool dynamicThresholdEnabled = false;
    double floorThreshold = 0.15;

    bool top1FallbackEnabled = false;
    size_t minResults = 0;

    bool keywordBoostEnabled = false;
    std::vector<std::string> keywordFields{"content", "tags"};
    double keywordBoostUnit = 0.05;

    bool dedupeEnabled = false;
    double dedupeThreshold = 0.85;

    bool mmrEnabled = false;
    double mmrLambda = kDefaultMmrLambda;
    size_t mmrK = kDefaultMmrK;

    nlohmann::json toJson() const;
};

/**
 * @brief Which fallbacks/optional stages actually changed the outcome
 */
struct SelectionFallbacks {
    bool dynamicThreshold = false;
    bool keywordBoost = false;
    bool dedupe = false;
    bool mmr = false;
    bool top1 = false;
    bool minResults = false;

    bool any() const noexcept {
        return dynamicThreshold || keywordBoost || dedupe || mmr || top1 || minResults;
    }
    nlohmann::json toJson() const;
};

struct SelectionOutcome {
    std::vector<memory::Candidate> candidates;
    // Ranking similarity per selected candidate (raw similarity plus any keyword boost)
    std::vector<double> rankingSimilarity;
    double usedThreshold = 0.0;
    size_t aboveThreshold = 0;
    RecallReason reason = RecallReason::Ok;
    SelectionFallbacks fallbacks;

    bool empty() const noexcept { return candidates.empty(); }
};

/**
 * @brief Lowercase word tokens (runs of alphanumerics or '_')
 */
std::vector<std::string> tokenize(const std::string& text);

/**
 * @brief Jaccard overlap of whitespace-separated, lowercased words; 1.0 when both are empty
 */
double shingleJaccard(const std::string& a, const std::string& b);

/**
 * @brief Multi-stage selection of which hits are considered at all.
 *
 * Stages, in order: threshold filter, dynamic threshold, keyword boost, near-duplicate
 * suppression, MMR, top-1 fallback, minimum-results backfill. With every optional stage
 * disabled the output is exactly the hits with rawSimilarity >= threshold, in input order.
 * The selector is stateless; identical input yields identical output.
 */
class CandidateSelector {
public:
    SelectionOutcome select(const std::string& query,
                            const std::vector<memory::Candidate>& hits,
                            const SelectionConfig& config) const;
};

} // namespace recall::search
