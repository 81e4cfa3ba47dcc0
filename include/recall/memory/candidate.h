#pragma once

#include <recall/core/types.h>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace recall::memory {

inline constexpr float kDefaultSourceTrust = 0.6f;
inline constexpr float kDefaultConfidence = 0.5f;
inline constexpr float kDefaultImportance = 0.5f;

/**
 * @brief A raw nearest-neighbour hit as returned by the store client
 */
struct RawHit {
    std::string id;
    double similarity = 0.0;
    nlohmann::json payload = nlohmann::json::object();
};

/**
 * @brief One retrieved memory/belief item under consideration.
 *
 * Produced only through normalizeHit(); every numeric field is already coerced and clamped
 * when a Candidate reaches scoring.
 */
struct Candidate {
    std::string id;
    std::vector<float> embedding; // empty = absent
    float rawSimilarity = 0.0f;
    std::string text;
    std::vector<std::string> tags;
    std::optional<TimePoint> timestamp; // absent = "now" for recency

    float sourceTrust = kDefaultSourceTrust;
    float confidence = kDefaultConfidence;
    float importance = kDefaultImportance;

    std::vector<std::string> beliefTags;
    uint32_t timesUsed = 0;

    bool contradictionFlag = false;
    float conflictScore = 0.0f;
    std::vector<std::string> contradicts; // ids of items this one conflicts with

    std::string assertionKey;
    std::string itemType;
    std::vector<std::string> provenanceTags; // annotations added during arbitration

    bool hasEmbedding() const noexcept { return !embedding.empty(); }

    bool hasTag(const std::string& tag) const;
};

/**
 * @brief Convert a raw store hit into a strict Candidate.
 *
 * Missing fields take documented defaults; malformed values (wrong JSON type, NaN,
 * unparseable timestamp) are coerced to those defaults. Never throws.
 */
Candidate normalizeHit(const RawHit& hit);

/**
 * @brief Normalize a batch of hits, preserving input order
 */
std::vector<Candidate> normalizeHits(const std::vector<RawHit>& hits);

/**
 * @brief Clamp into [0,1], mapping NaN/inf to @p fallback
 */
float clampUnit(double value, float fallback) noexcept;

} // namespace recall::memory
