#pragma once

#include <recall/memory/candidate.h>

#include <cstddef>
#include <functional>
#include <vector>

namespace recall::search {

inline constexpr double kDefaultMmrLambda = 0.70;
inline constexpr size_t kDefaultMmrK = 5;

/**
 * @brief One MMR input: a relevance value and an optional (non-owning) embedding
 */
struct MmrItem {
    double relevance = 0.0;
    const std::vector<float>* embedding = nullptr;

    bool hasEmbedding() const noexcept { return embedding && !embedding->empty(); }
};

/**
 * @brief Maximal Marginal Relevance selection.
 *
 * Greedy: the most relevant item first, then repeatedly the unselected item maximizing
 * lambda * relevance(i) - (1 - lambda) * max cosine(i, selected). Ties go to the lower input
 * index. Items without an embedding take no part in the diversity trade-off; they follow the
 * MMR picks in input order. When no item has an embedding the input order is kept.
 *
 * @param lambda Clamped to [0,1]; 1.0 is pure relevance ordering
 * @return Indices into @p items, at most min(k, items.size()) of them
 * @throws DimensionMismatchError if two embeddings differ in size
 */
std::vector<size_t> mmrSelect(const std::vector<MmrItem>& items, size_t k, double lambda);

/**
 * @brief Convenience wrapper over candidates.
 *
 * @param relevance Returns the relevance of the i-th candidate
 */
std::vector<memory::Candidate>
mmrRerank(const std::vector<memory::Candidate>& candidates, size_t k, double lambda,
          const std::function<double(size_t)>& relevance);

} // namespace recall::search
