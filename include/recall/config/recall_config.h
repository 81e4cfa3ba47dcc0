#pragma once

#include <recall/search/arbitration.h>
#include <recall/search/arbitration_learner.h>
#include <recall/search/candidate_selector.h>
#include <recall/search/composite_scorer.h>
#include <recall/search/contradiction_hook.h>

#include <nlohmann/json.hpp>

#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace recall::config {

struct ResilienceConfig {
    size_t failureLimit = 3;
    std::chrono::milliseconds openDuration{20000};
    size_t maxRetries = 2;
    std::chrono::milliseconds attemptTimeout{8000};
    std::chrono::milliseconds backoffBase{200};
    double jitterRatio = 0.25;
    size_t workerThreads = 2;
    size_t spareWorkers = 2;

    nlohmann::json toJson() const;
};

struct TelemetryConfig {
    bool enabled = false;
    static constexpr size_t kMinPreviewChars = 24;
    size_t previewChars = 160;

    nlohmann::json toJson() const;
};

/**
 * @brief Every tunable of the recall core, validated once and passed by const reference
 */
struct RecallConfig {
    search::SelectionConfig selection;
    search::ScoringWeights scoring;
    search::ContradictionConfig contradiction;
    search::ArbitrationConfig arbitration;
    search::LearningConfig learning;
    ResilienceConfig resilience;
    TelemetryConfig telemetry;

    std::filesystem::path activeBeliefsPath;
    std::filesystem::path profilePath;

    nlohmann::json toJson() const;
};

// Returns the value of an environment variable, if set
using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

std::optional<std::string> processEnv(const std::string& name);

struct ConfigLoadOptions {
    // Explicit file; empty means get_config_path()
    std::filesystem::path path;
    EnvLookup env = processEnv;
};

struct ConfigLoadReport {
    std::filesystem::path source;
    bool fileFound = false;
    // "section.key" entries that fell back to their default
    std::vector<std::string> fallbacks;
};

/**
 * @brief Build the configuration: defaults, then the TOML file, then RECALL_<SECTION>_<KEY>
 *        environment variables.
 *
 * Never fails. A value that does not parse or is out of range keeps its default, and a
 * warning is logged once per key for the lifetime of the process.
 */
RecallConfig loadRecallConfig(const ConfigLoadOptions& options = {},
                              ConfigLoadReport* report = nullptr);

/**
 * @brief Environment variable consulted for a config key, e.g. RECALL_SELECTION_THRESHOLD
 */
std::string envNameFor(const std::string& section, const std::string& key);

} // namespace recall::config
