#include <recall/vector/vector_math.h>

#include <cmath>

namespace recall::vector {

double cosineSimilarity(const std::vector<float>& a, const std::vector<float>& b) {
    if (a.empty() || b.empty()) {
        return 0.0;
    }
    if (a.size() != b.size()) {
        throw DimensionMismatchError(a.size(), b.size());
    }

    double dot_product = 0.0;
    double norm_a = 0.0;
    double norm_b = 0.0;

    for (size_t i = 0; i < a.size(); ++i) {
        dot_product += static_cast<double>(a[i]) * static_cast<double>(b[i]);
        norm_a += static_cast<double>(a[i]) * static_cast<double>(a[i]);
        norm_b += static_cast<double>(b[i]) * static_cast<double>(b[i]);
    }

    norm_a = std::sqrt(norm_a);
    norm_b = std::sqrt(norm_b);

    if (norm_a == 0.0 || norm_b == 0.0) {
        return 0.0;
    }

    return dot_product / (norm_a * norm_b);
}

double meanCosineSimilarity(const std::vector<float>& vec,
                            const std::vector<const std::vector<float>*>& others) {
    if (vec.empty()) {
        return 0.0;
    }
    double sum = 0.0;
    size_t count = 0;
    for (const auto* other : others) {
        if (!other || other->empty()) {
            continue;
        }
        sum += cosineSimilarity(vec, *other);
        ++count;
    }
    return count == 0 ? 0.0 : sum / static_cast<double>(count);
}

std::vector<float> normalizeVector(const std::vector<float>& vec) {
    double norm = 0.0;
    for (float v : vec) {
        norm += static_cast<double>(v) * static_cast<double>(v);
    }
    norm = std::sqrt(norm);
    if (norm == 0.0) {
        return vec;
    }

    std::vector<float> normalized;
    normalized.reserve(vec.size());
    for (float v : vec) {
        normalized.push_back(static_cast<float>(static_cast<double>(v) / norm));
    }
    return normalized;
}

} // namespace recall::vector
