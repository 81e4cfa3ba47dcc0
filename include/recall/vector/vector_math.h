#pragma once

#include <recall/core/types.h>

#include <vector>

namespace recall::vector {

/**
 * @brief Cosine similarity between two embeddings.
 *
 * Returns 0.0 when either vector is empty or has zero magnitude.
 *
 * @throws DimensionMismatchError if both vectors are present and their sizes differ.
 */
double cosineSimilarity(const std::vector<float>& a, const std::vector<float>& b);

/**
 * @brief Mean cosine similarity of @p vec against every non-empty vector in @p others.
 *
 * Returns 0.0 if @p vec is empty or @p others holds no usable vectors.
 */
double meanCosineSimilarity(const std::vector<float>& vec,
                            const std::vector<const std::vector<float>*>& others);

/**
 * @brief Normalize a vector to unit length (zero vectors are returned unchanged)
 */
std::vector<float> normalizeVector(const std::vector<float>& vec);

} // namespace recall::vector
