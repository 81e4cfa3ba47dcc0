#include <recall/search/telemetry.h>

#include <spdlog/spdlog.h>

#include <chrono>
#include <cmath>
#include <regex>

namespace recall::search {

namespace {

constexpr size_t kMaxQueryChars = 200;
constexpr size_t kMaxSamples = 3;
// std::regex recurses per matched character; longer inputs can exhaust the stack
constexpr size_t kMaxScrubInput = 2048;
// Text examined per preview, as a multiple of the preview length
constexpr size_t kScrubWindowFactor = 4;

const std::regex& emailPattern() {
    static const std::regex re(R"([A-Za-z0-9._%+-]+@[A-Za-z0-9.-]+\.[A-Za-z]{2,})");
    return re;
}

const std::regex& urlPattern() {
    static const std::regex re(R"(https?://[^\s]+)");
    return re;
}

const std::regex& secretPattern() {
    static const std::regex re(
        R"((sk-[A-Za-z0-9]{16,}|api[_-]?key[:=][^\s]+|Bearer\s+[A-Za-z0-9._-]{16,}))",
        std::regex::icase);
    return re;
}

// Truncate without splitting a UTF-8 sequence
std::string truncateUtf8(const std::string& s, size_t maxBytes) {
    if (s.size() <= maxBytes) {
        return s;
    }
    size_t cut = maxBytes;
    while (cut > 0 && (static_cast<unsigned char>(s[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return s.substr(0, cut);
}

} // namespace

std::string scrubPreview(const std::string& text) {
    if (text.empty()) {
        return {};
    }
    try {
        auto s = std::regex_replace(truncateUtf8(text, kMaxScrubInput), emailPattern(), "[EMAIL]");
        s = std::regex_replace(s, urlPattern(), "[URL]");
        s = std::regex_replace(s, secretPattern(), "[SECRET]");
        return s;
    } catch (const std::regex_error& e) {
        // Never leak the raw text when scrubbing fails
        spdlog::debug("Preview scrub failed: {}", e.what());
        return "[REDACTED]";
    }
}

nlohmann::json buildRecallTelemetry(const std::string& query, size_t rawCount,
                                    const SelectionConfig& config,
                                    const SelectionOutcome& selection,
                                    const std::vector<TelemetrySample>& samples,
                                    size_t previewChars) {
    auto ts = std::chrono::duration<double>(
                  std::chrono::system_clock::now().time_since_epoch())
                  .count();

    nlohmann::json top = nlohmann::json::array();
    for (size_t i = 0; i < samples.size() && i < kMaxSamples; ++i) {
        const auto& s = samples[i];
        top.push_back({{"id", s.id},
                       {"score", std::round(s.score * 10000.0) / 10000.0},
                       {"preview",
                        truncateUtf8(scrubPreview(truncateUtf8(s.text,
                                                               previewChars * kScrubWindowFactor)),
                                     previewChars)}});
    }

    return nlohmann::json{{"ts", ts},
                          {"event", "vector_recall"},
                          {"query", truncateUtf8(query, kMaxQueryChars)},
                          {"cfg",
                           {{"threshold", config.threshold},
                            {"used_threshold", selection.usedThreshold},
                            {"dynamic", config.dynamicThresholdEnabled},
                            {"floor", config.floorThreshold},
                            {"top1", config.top1FallbackEnabled},
                            {"min_results", config.minResults},
                            {"keyword_boost", config.keywordBoostEnabled},
                            {"dedupe", config.dedupeEnabled},
                            {"mmr", config.mmrEnabled}}},
                          {"counts",
                           {{"raw", rawCount},
                            {"above_threshold", selection.aboveThreshold},
                            {"selected", selection.candidates.size()}}},
                          {"fallbacks", selection.fallbacks.toJson()},
                          {"reason", recallReasonToString(selection.reason)},
                          {"top_samples", std::move(top)},
                          {"source", "recall"},
                          {"version", 1}};
}

void emitRecallTelemetry(const nlohmann::json& record) {
    try {
        spdlog::info("{}", record.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
    } catch (const std::exception& e) {
        spdlog::debug("Recall telemetry dropped: {}", e.what());
    }
}

} // namespace recall::search
