#include <recall/memory/time_utils.h>
#include <recall/search/composite_scorer.h>
#include <recall/vector/vector_math.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <future>
#include <optional>
#include <set>

namespace recall::search {

namespace {

bool hasImportantPrefix(const std::string& tag, const std::vector<std::string>& prefixes) {
    return std::any_of(prefixes.begin(), prefixes.end(), [&](const std::string& prefix) {
        return !prefix.empty() && tag.compare(0, prefix.size(), prefix) == 0;
    });
}

double clamp01(double v) {
    if (!std::isfinite(v)) {
        return 0.0;
    }
    return std::clamp(v, 0.0, 1.0);
}

Error dimensionError(const DimensionMismatchError& e, const std::string& id) {
    spdlog::error("Embedding dimension mismatch for candidate '{}': {} vs {}", id, e.lhs(),
                  e.rhs());
    return Error{ErrorCode::DimensionMismatch,
                 "candidate '" + id + "': " + std::string(e.what())};
}

} // namespace

nlohmann::json ScoringWeights::toJson() const {
    return nlohmann::json{{"sim", sim},
                          {"rec", rec},
                          {"cred", cred},
                          {"conf", conf},
                          {"bel", bel},
                          {"use", use},
                          {"nov", nov},
                          {"decay_lambda", decayLambda},
                          {"beliefs_enabled", beliefsEnabled},
                          {"belief_alpha", beliefAlpha},
                          {"belief_importance_boost", beliefImportanceBoost},
                          {"important_prefixes", importantPrefixes}};
}

nlohmann::json ScoreBreakdown::toJson() const {
    return nlohmann::json{{"similarity", similarity},
                          {"recency", recency},
                          {"credibility", credibility},
                          {"confidence", confidence},
                          {"belief_alignment", beliefAlignment},
                          {"usage", usage},
                          {"novelty", novelty},
                          {"conflict_penalty", conflictPenalty},
                          {"final", final}};
}

double recencyScore(const std::optional<TimePoint>& timestamp, TimePoint now, double decayLambda) {
    double ageDays = memory::ageInDays(timestamp, now);
    return std::exp(-std::max(0.0, decayLambda) * ageDays);
}

double beliefAlignmentScore(const std::vector<std::string>& candidateTags,
                            const memory::ActiveBeliefSet* beliefs, const ScoringWeights& weights) {
    if (!weights.beliefsEnabled) {
        return 0.5;
    }
    const double alpha = weights.beliefAlpha > 0.0 ? weights.beliefAlpha : 0.1;

    std::set<std::string> mine;
    for (const auto& tag : candidateTags) {
        auto n = memory::normalizeBeliefTag(tag);
        if (!n.empty()) {
            mine.insert(std::move(n));
        }
    }

    static const std::set<std::string> kNoTags;
    const auto& active = beliefs ? beliefs->tags() : kNoTags;

    size_t intersection = 0;
    bool importantOverlap = false;
    for (const auto& tag : mine) {
        if (active.count(tag)) {
            ++intersection;
            if (!importantOverlap && hasImportantPrefix(tag, weights.importantPrefixes)) {
                importantOverlap = true;
            }
        }
    }
    const size_t unionSize = mine.size() + active.size() - intersection;

    if (unionSize == 0) {
        // Nothing on either side: the smoothing term alone
        return clamp01(alpha);
    }

    double align = (static_cast<double>(intersection) + alpha) /
                   (static_cast<double>(unionSize) + alpha);
    if (importantOverlap && weights.beliefImportanceBoost > 0.0) {
        align = std::min(1.0, align + weights.beliefImportanceBoost);
    }
    return clamp01(align);
}

double usageScore(uint32_t timesUsed) {
    return 1.0 - std::exp(-0.1 * static_cast<double>(timesUsed));
}

double noveltyScore(const std::vector<float>& embedding,
                    const std::vector<const memory::Candidate*>& alreadySelected) {
    if (embedding.empty() || alreadySelected.empty()) {
        return 0.0;
    }
    std::vector<const std::vector<float>*> others;
    others.reserve(alreadySelected.size());
    for (const auto* c : alreadySelected) {
        if (c && c->hasEmbedding()) {
            others.push_back(&c->embedding);
        }
    }
    if (others.empty()) {
        return 0.0;
    }
    return std::max(0.0, 1.0 - vector::meanCosineSimilarity(embedding, others));
}

Result<ScoredCandidate>
CompositeScorer::score(const memory::Candidate& candidate, const std::vector<float>& queryVector,
                       const std::vector<const memory::Candidate*>& alreadySelected,
                       const ScoringWeights& weights, const ScoringContext& context) const {
    ScoredCandidate out{candidate, {}};
    if (!candidate.hasEmbedding()) {
        return out;
    }

    auto& b = out.breakdown;
    try {
        b.similarity = vector::cosineSimilarity(candidate.embedding, queryVector);
        b.novelty = noveltyScore(candidate.embedding, alreadySelected);
    } catch (const DimensionMismatchError& e) {
        return dimensionError(e, candidate.id);
    }

    b.recency = recencyScore(candidate.timestamp, context.now, weights.decayLambda);
    b.credibility = clamp01(candidate.sourceTrust);
    b.confidence = clamp01(candidate.confidence);
    b.beliefAlignment =
        beliefAlignmentScore(candidate.beliefTags, context.beliefs.get(), weights);
    b.usage = usageScore(candidate.timesUsed);
    b.conflictPenalty = hook_.penaltyFor(candidate, context.favoredIds);

    const double base = weights.sim * b.similarity;
    double multiplier = (1.0 + weights.rec * b.recency) *
                        (1.0 + weights.cred * (b.credibility - 0.5)) *
                        (1.0 + weights.conf * (b.confidence - 0.5)) *
                        (1.0 + weights.bel * (b.beliefAlignment - 0.5)) *
                        (1.0 + weights.use * b.usage) * (1.0 + weights.nov * b.novelty);
    if (b.conflictPenalty > 0.0) {
        multiplier = std::max(0.0, multiplier * (1.0 - b.conflictPenalty));
    }
    b.final = base * multiplier;
    return out;
}

Result<std::vector<ScoredCandidate>>
CompositeScorer::scoreAll(const std::vector<memory::Candidate>& candidates,
                          const std::vector<float>& queryVector, const ScoringWeights& weights,
                          const ScoringContext& context) const {
    std::vector<ScoredCandidate> scored;
    scored.reserve(candidates.size());
    const std::vector<const memory::Candidate*> none;

    if (candidates.size() >= PARALLEL_THRESHOLD) {
        // Each candidate is independent; results are collected in input order
        std::vector<std::future<Result<ScoredCandidate>>> futures;
        futures.reserve(candidates.size());
        for (const auto& c : candidates) {
            futures.push_back(std::async(std::launch::async, [&, this]() {
                return score(c, queryVector, none, weights, context);
            }));
        }
        std::optional<Error> firstError;
        for (auto& f : futures) {
            auto r = f.get();
            if (!r) {
                if (!firstError) {
                    firstError = r.error();
                }
                continue;
            }
            scored.push_back(std::move(r).value());
        }
        if (firstError) {
            return *firstError;
        }
    } else {
        for (const auto& c : candidates) {
            auto r = score(c, queryVector, none, weights, context);
            if (!r) {
                return r.error();
            }
            scored.push_back(std::move(r).value());
        }
    }

    sortByFinalScore(scored);
    return scored;
}

Result<std::vector<ScoredCandidate>>
CompositeScorer::scoreSequential(const std::vector<memory::Candidate>& candidates,
                                 const std::vector<float>& queryVector,
                                 const ScoringWeights& weights,
                                 const ScoringContext& context) const {
    std::vector<ScoredCandidate> accepted;
    accepted.reserve(candidates.size());

    std::vector<bool> taken(candidates.size(), false);
    std::vector<const memory::Candidate*> selected;
    ScoringContext ctx = context;

    for (size_t round = 0; round < candidates.size(); ++round) {
        std::optional<ScoredCandidate> best;
        size_t bestIdx = 0;
        for (size_t i = 0; i < candidates.size(); ++i) {
            if (taken[i]) {
                continue;
            }
            auto r = score(candidates[i], queryVector, selected, weights, ctx);
            if (!r) {
                return r.error();
            }
            auto& sc = r.value();
            if (!best || sc.breakdown.final > best->breakdown.final ||
                (sc.breakdown.final == best->breakdown.final &&
                 sc.candidate.id < best->candidate.id)) {
                best = std::move(sc);
                bestIdx = i;
            }
        }
        if (!best) {
            break;
        }
        taken[bestIdx] = true;
        selected.push_back(&candidates[bestIdx]);
        ctx.favoredIds.insert(candidates[bestIdx].id);
        accepted.push_back(std::move(*best));
    }
    return accepted;
}

void sortByFinalScore(std::vector<ScoredCandidate>& scored) {
    std::stable_sort(scored.begin(), scored.end(),
                     [](const ScoredCandidate& a, const ScoredCandidate& b) {
                         if (a.breakdown.final != b.breakdown.final) {
                             return a.breakdown.final > b.breakdown.final;
                         }
                         return a.candidate.id < b.candidate.id;
                     });
}

} // namespace recall::search
