#include <recall/search/candidate_selector.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <sstream>
#include <unordered_set>

namespace recall::search {

namespace {

struct Working {
    size_t index; // position in the input hits
    double similarity;
};

std::vector<Working> sortedByRaw(const std::vector<memory::Candidate>& hits) {
    std::vector<Working> all;
    all.reserve(hits.size());
    for (size_t i = 0; i < hits.size(); ++i) {
        all.push_back({i, hits[i].rawSimilarity});
    }
    std::stable_sort(all.begin(), all.end(),
                     [](const Working& a, const Working& b) { return a.similarity > b.similarity; });
    return all;
}

std::string keywordHaystack(const memory::Candidate& c, const std::vector<std::string>& fields) {
    std::string out;
    for (const auto& raw : fields) {
        std::string field = raw;
        std::transform(field.begin(), field.end(), field.begin(),
                       [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
        if (field == "content" || field == "text") {
            out += c.text;
            out += '\n';
        } else if (field == "tags") {
            for (const auto& tag : c.tags) {
                out += tag;
                out += ' ';
            }
            out += '\n';
        }
    }
    return out;
}

std::unordered_set<std::string> wordSet(const std::string& text) {
    std::unordered_set<std::string> words;
    std::istringstream in(text);
    std::string w;
    while (in >> w) {
        std::transform(w.begin(), w.end(), w.begin(),
                       [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
        words.insert(std::move(w));
    }
    return words;
}

double jaccard(const std::unordered_set<std::string>& a, const std::unordered_set<std::string>& b) {
    if (a.empty() && b.empty()) {
        return 1.0;
    }
    size_t inter = 0;
    for (const auto& w : a) {
        inter += b.count(w);
    }
    const size_t uni = a.size() + b.size() - inter;
    return uni == 0 ? 0.0 : static_cast<double>(inter) / static_cast<double>(uni);
}

} // namespace

const char* recallReasonToString(RecallReason reason) noexcept {
    switch (reason) {
        case RecallReason::Ok: return "ok";
        case RecallReason::NoCandidates: return "no_candidates";
        case RecallReason::BelowThreshold: return "below_threshold";
        case RecallReason::CircuitOpen: return "circuit_open";
        case RecallReason::StoreFailure: return "store_failure";
        case RecallReason::Cancelled: return "cancelled";
        case RecallReason::DimensionMismatch: return "dimension_mismatch";
    }
    return "unknown";
}

nlohmann::json SelectionConfig::toJson() const {
    return nlohmann::json{{"threshold", threshold},
                          {"dynamic", dynamicThresholdEnabled},
                          {"floor", floorThreshold},
                          {"top1", top1FallbackEnabled},
                          {"min_results", minResults},
                          {"keyword_boost", keywordBoostEnabled},
                          {"keyword_fields", keywordFields},
                          {"keyword_boost_unit", keywordBoostUnit},
                          {"dedupe", dedupeEnabled},
                          {"dedupe_threshold", dedupeThreshold},
                          {"mmr", mmrEnabled},
                          {"mmr_lambda", mmrLambda},
                          {"mmr_k", mmrK}};
}

nlohmann::json SelectionFallbacks::toJson() const {
    return nlohmann::json{{"dynamic_threshold", dynamicThreshold}, {"keyword_boost", keywordBoost},
                          {"dedupe", dedupe},
                          {"mmr", mmr},
                          {"top1", top1},
                          {"min_results", minResults}};
}

std::vector<std::string> tokenize(const std::string& text) {
    std::vector<std::string> tokens;
    std::string current;
    for (unsigned char ch : text) {
        if (std::isalnum(ch) || ch == '_' || ch >= 0x80) {
            current.push_back(static_cast<char>(std::tolower(ch)));
        } else if (!current.empty()) {
            tokens.push_back(std::move(current));
            current.clear();
        }
    }
    if (!current.empty()) {
        tokens.push_back(std::move(current));
    }
    return tokens;
}

double shingleJaccard(const std::string& a, const std::string& b) {
    return jaccard(wordSet(a), wordSet(b));
}

SelectionOutcome CandidateSelector::select(const std::string& query,
                                           const std::vector<memory::Candidate>& hits,
                                           const SelectionConfig& config) const {
    SelectionOutcome outcome;
    outcome.usedThreshold = config.threshold;

    if (hits.empty()) {
        outcome.reason = RecallReason::NoCandidates;
        return outcome;
    }

    // 1. Threshold filter (input order preserved)
    std::vector<Working> filtered;
    for (size_t i = 0; i < hits.size(); ++i) {
        if (hits[i].rawSimilarity >= config.threshold) {
            filtered.push_back({i, hits[i].rawSimilarity});
        }
    }
    outcome.aboveThreshold = filtered.size();

    // 2. Dynamic threshold
    if (filtered.empty() && config.dynamicThresholdEnabled) {
        auto sorted = sortedByRaw(hits);
        const double top = sorted.front().similarity;
        const double used =
            std::min(config.threshold, std::max(config.floorThreshold, top * 0.98));
        for (const auto& w : sorted) {
            if (w.similarity >= used) {
                filtered.push_back(w);
            }
        }
        if (!filtered.empty()) {
            outcome.usedThreshold = used;
            outcome.fallbacks.dynamicThreshold = true;
            spdlog::debug("Dynamic threshold {:.3f} admitted {} hit(s)", used, filtered.size());
        }
    }

    // 3. Keyword boost, ranking only
    if (config.keywordBoostEnabled && !filtered.empty()) {
        auto queryTokens = tokenize(query);
        std::unordered_set<std::string> qset(queryTokens.begin(), queryTokens.end());
        if (!qset.empty()) {
            for (auto& w : filtered) {
                auto hayTokens = tokenize(keywordHaystack(hits[w.index], config.keywordFields));
                std::unordered_set<std::string> hset(hayTokens.begin(), hayTokens.end());
                size_t overlap = 0;
                for (const auto& t : qset) {
                    overlap += hset.count(t);
                }
                const double extra =
                    std::min(0.15, std::max(0.0, config.keywordBoostUnit) * overlap);
                if (extra > 0.0) {
                    w.similarity = std::min(1.0, w.similarity + extra);
                    outcome.fallbacks.keywordBoost = true;
                }
            }
            std::stable_sort(filtered.begin(), filtered.end(),
                             [](const Working& a, const Working& b) {
                                 return a.similarity > b.similarity;
                             });
        }
    }

    // 4. Near-duplicate suppression; the earlier (better ranked) item wins
    if (config.dedupeEnabled && filtered.size() > 1) {
        std::vector<Working> kept;
        std::vector<std::unordered_set<std::string>> seen;
        for (const auto& w : filtered) {
            const auto& text = hits[w.index].text;
            if (text.find_first_not_of(" \t\r\n") == std::string::npos) {
                kept.push_back(w);
                continue;
            }
            auto words = wordSet(text);
            bool dup = std::any_of(seen.begin(), seen.end(), [&](const auto& s) {
                return jaccard(words, s) >= config.dedupeThreshold;
            });
            if (!dup) {
                seen.push_back(std::move(words));
                kept.push_back(w);
            }
        }
        if (kept.size() != filtered.size()) {
            spdlog::debug("Dropped {} near-duplicate hit(s)", filtered.size() - kept.size());
            outcome.fallbacks.dedupe = true;
            filtered = std::move(kept);
        }
    }

    // 5. MMR, only when every candidate carries an embedding
    if (config.mmrEnabled && !filtered.empty()) {
        const bool allEmbedded = std::all_of(filtered.begin(), filtered.end(), [&](const Working& w) {
            return hits[w.index].hasEmbedding();
        });
        if (allEmbedded) {
            std::vector<MmrItem> items;
            items.reserve(filtered.size());
            for (const auto& w : filtered) {
                items.push_back({w.similarity, &hits[w.index].embedding});
            }
            try {
                auto order = mmrSelect(items, std::max<size_t>(1, config.mmrK), config.mmrLambda);
                std::vector<Working> reranked;
                reranked.reserve(order.size());
                for (size_t idx : order) {
                    reranked.push_back(filtered[idx]);
                }
                filtered = std::move(reranked);
                outcome.fallbacks.mmr = true;
            } catch (const DimensionMismatchError& e) {
                spdlog::error("MMR skipped, candidate embeddings disagree: {}", e.what());
            }
        }
    }

    // 6. Top-1 fallback
    if (filtered.empty() && config.top1FallbackEnabled) {
        filtered.push_back(sortedByRaw(hits).front());
        outcome.fallbacks.top1 = true;
    }

    // 7. Minimum-results backfill
    if (filtered.empty() && config.minResults > 0) {
        auto sorted = sortedByRaw(hits);
        sorted.resize(std::min(sorted.size(), config.minResults));
        filtered = std::move(sorted);
        outcome.fallbacks.minResults = true;
    }

    outcome.candidates.reserve(filtered.size());
    outcome.rankingSimilarity.reserve(filtered.size());
    for (const auto& w : filtered) {
        outcome.candidates.push_back(hits[w.index]);
        outcome.rankingSimilarity.push_back(w.similarity);
    }
    outcome.reason = outcome.candidates.empty() ? RecallReason::BelowThreshold : RecallReason::Ok;
    return outcome;
}

} // namespace recall::search
