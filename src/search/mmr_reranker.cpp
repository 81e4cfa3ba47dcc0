#include <recall/search/mmr_reranker.h>
#include <recall/vector/vector_math.h>

#include <algorithm>
#include <cmath>
#include <limits>

namespace recall::search {

std::vector<size_t> mmrSelect(const std::vector<MmrItem>& items, size_t k, double lambda) {
    std::vector<size_t> result;
    const size_t limit = std::min(k, items.size());
    if (limit == 0) {
        return result;
    }
    result.reserve(limit);

    if (!std::isfinite(lambda)) {
        lambda = kDefaultMmrLambda;
    }
    lambda = std::clamp(lambda, 0.0, 1.0);

    std::vector<size_t> remaining;
    std::vector<size_t> plain;
    for (size_t i = 0; i < items.size(); ++i) {
        (items[i].hasEmbedding() ? remaining : plain).push_back(i);
    }

    // Max similarity of each remaining item to the selected set (never below 0), updated
    // incrementally so each round is O(n)
    std::vector<double> maxSim(items.size(), 0.0);

    while (result.size() < limit && !remaining.empty()) {
        auto bestPos = remaining.size();
        double bestScore = -std::numeric_limits<double>::infinity();
        for (size_t pos = 0; pos < remaining.size(); ++pos) {
            const size_t i = remaining[pos];
            const double score = result.empty()
                                     ? items[i].relevance
                                     : lambda * items[i].relevance - (1.0 - lambda) * maxSim[i];
            if (score > bestScore) {
                bestScore = score;
                bestPos = pos;
            }
        }
        if (bestPos == remaining.size()) {
            break;
        }

        const size_t chosen = remaining[bestPos];
        remaining.erase(remaining.begin() + static_cast<std::ptrdiff_t>(bestPos));
        result.push_back(chosen);

        for (size_t i : remaining) {
            double s = vector::cosineSimilarity(*items[i].embedding, *items[chosen].embedding);
            if (s > maxSim[i]) {
                maxSim[i] = s;
            }
        }
    }

    for (size_t i : plain) {
        if (result.size() >= limit) {
            break;
        }
        result.push_back(i);
    }
    return result;
}

std::vector<memory::Candidate>
mmrRerank(const std::vector<memory::Candidate>& candidates, size_t k, double lambda,
          const std::function<double(size_t)>& relevance) {
    std::vector<MmrItem> items;
    items.reserve(candidates.size());
    for (size_t i = 0; i < candidates.size(); ++i) {
        items.push_back(MmrItem{relevance ? relevance(i) : candidates[i].rawSimilarity,
                                &candidates[i].embedding});
    }

    std::vector<memory::Candidate> out;
    for (size_t idx : mmrSelect(items, k, lambda)) {
        out.push_back(candidates[idx]);
    }
    return out;
}

} // namespace recall::search
