#pragma once

#include <recall/search/candidate_selector.h>

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace recall::search {

/**
 * @brief Replace e-mail addresses, URLs and API-key-like tokens with placeholders
 *
 * Only the first 2 KiB of @p text are examined and returned.
 */
std::string scrubPreview(const std::string& text);

struct TelemetrySample {
    std::string id;
    double score = 0.0;
    std::string text;
};

/**
 * @brief One recall telemetry record: config summary, counts, fallbacks and up to three
 *        scrubbed, truncated previews.
 */
nlohmann::json buildRecallTelemetry(const std::string& query, size_t rawCount,
                                    const SelectionConfig& config,
                                    const SelectionOutcome& selection,
                                    const std::vector<TelemetrySample>& samples,
                                    size_t previewChars);

/**
 * @brief Log the record as a single JSON line at info level. Never throws.
 */
void emitRecallTelemetry(const nlohmann::json& record);

} // namespace recall::search
