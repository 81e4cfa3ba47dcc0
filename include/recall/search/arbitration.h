#pragma once

#include <recall/core/types.h>
#include <recall/search/composite_scorer.h>

#include <nlohmann/json.hpp>

#include <array>
#include <atomic>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace recall::search {

enum class QueryIntent { Fact, How, Why };

enum class ProvenanceClass : size_t { Base = 0, Episodic = 1, Procedural = 2, Abstraction = 3 };

inline constexpr size_t kProvenanceClassCount = 4;

using ClassWeights = std::array<double, kProvenanceClassCount>;

const char* intentToString(QueryIntent intent) noexcept;
std::optional<QueryIntent> parseIntent(const std::string& name);

const char* provenanceToString(ProvenanceClass cls) noexcept;
std::optional<ProvenanceClass> parseProvenance(const std::string& name);

inline constexpr size_t indexOf(ProvenanceClass cls) noexcept {
    return static_cast<size_t>(cls);
}

/**
 * @brief Lexical intent classification: "how" -> How, "why" -> Why, anything else -> Fact
 */
QueryIntent detectQueryIntent(const std::string& query);

/**
 * @brief Provenance class of a candidate from its type and activation tags
 */
ProvenanceClass provenanceOf(const memory::Candidate& candidate);

enum class ArbitrationMode { Off, Static, Context };

enum class ConflictPolicy { Hierarchical, Confidence, Recency, Uncertain };

const char* arbitrationModeToString(ArbitrationMode mode) noexcept;
std::optional<ArbitrationMode> parseArbitrationMode(const std::string& name);

const char* conflictPolicyToString(ConflictPolicy policy) noexcept;
std::optional<ConflictPolicy> parseConflictPolicy(const std::string& name);

/// Tag added to candidates whose conflict could not be settled confidently
inline constexpr const char* kUncertainTag = "arb_uncertain";

struct ArbitrationConfig {
    bool enabled = false;
    ArbitrationMode mode = ArbitrationMode::Context;

    ClassWeights baseWeights{0.30, 0.25, 0.30, 0.30};
    ClassWeights factMultipliers{1.3, 1.3, 0.9, 0.9};
    ClassWeights howMultipliers{0.8, 1.0, 1.5, 0.9};
    ClassWeights whyMultipliers{0.8, 1.0, 0.9, 1.5};

    // How strongly class weights bend the final score (0 = not at all)
    double strength = 0.5;

    ConflictPolicy conflictPolicy = ConflictPolicy::Hierarchical;
    double conflictEpsilon = 0.10;
    double uncertainThreshold = 0.20;

    // Blend the learned profile into effective weights
    bool metaEnabled = false;

    bool active() const noexcept { return enabled && mode != ArbitrationMode::Off; }
    const ClassWeights& multipliersFor(QueryIntent intent) const noexcept;
    nlohmann::json toJson() const;
};

/**
 * @brief Learned, normalized weighting of provenance classes.
 *
 * Components sum to 1.0 and none drops below the floor.
 */
struct ArbitrationProfile {
    static constexpr double kDefaultFloor = 0.05;

    ClassWeights weights{0.25, 0.25, 0.25, 0.25};

    double operator[](ProvenanceClass cls) const noexcept { return weights[indexOf(cls)]; }
    double sum() const noexcept;

    static ArbitrationProfile uniform() { return {}; }

    /**
     * @brief Raise components to @p floor and renormalize the rest so the total is 1.0.
     *        Non-finite or negative entries are treated as 0.
     */
    static ClassWeights project(ClassWeights weights, double floor = kDefaultFloor);

    nlohmann::json toJson() const;
    static Result<ArbitrationProfile> fromJson(const nlohmann::json& j);
};

/**
 * @brief base x intent multiplier (context mode) x 4*profile (when meta-arbitration is on),
 *        renormalized to sum to 1.0
 */
ClassWeights computeEffectiveWeights(QueryIntent intent, const ArbitrationConfig& config,
                                     const ArbitrationProfile* profile);

/**
 * @brief Process-wide holder of the learned profile.
 *
 * Readers take an immutable snapshot; apply() is the only mutation path.
 */
class ArbitrationProfileStore {
public:
    ArbitrationProfileStore();
    explicit ArbitrationProfileStore(ArbitrationProfile initial);

    std::shared_ptr<const ArbitrationProfile> snapshot() const {
        return std::atomic_load_explicit(&current_, std::memory_order_acquire);
    }

    /**
     * @brief Publish a new profile (projected onto the floor/sum constraints first)
     * @return Monotonic version of the published profile
     */
    uint64_t apply(const ArbitrationProfile& next);

    uint64_t version() const noexcept { return version_.load(std::memory_order_acquire); }

    // Floor used when projecting applied profiles
    void setFloor(double floor) noexcept { floor_.store(floor, std::memory_order_release); }
    double floor() const noexcept { return floor_.load(std::memory_order_acquire); }

    /**
     * @brief Load the sidecar; a missing or malformed file leaves the uniform profile in place
     * @return true if a profile was read from disk
     */
    bool load(const std::filesystem::path& path);

    Result<void> save(const std::filesystem::path& path) const;

private:
    mutable std::mutex mutex_;
    std::shared_ptr<const ArbitrationProfile> current_;
    std::atomic<uint64_t> version_{0};
    std::atomic<double> floor_{ArbitrationProfile::kDefaultFloor};
};

struct ArbitratedCandidate {
    ScoredCandidate scored;
    ProvenanceClass provenance = ProvenanceClass::Base;
    double arbitratedScore = 0.0;

    const std::string& id() const noexcept { return scored.candidate.id; }
};

/**
 * @brief Intent-sensitive reweighting and assertion-conflict resolution.
 *
 * When inactive the output is the input in final-score order with arbitratedScore equal to
 * the final score.
 */
class ArbitrationRanker {
public:
    explicit ArbitrationRanker(ArbitrationConfig config) : config_(std::move(config)) {}

    std::vector<ArbitratedCandidate> rank(std::vector<ScoredCandidate> scored,
                                          QueryIntent intent,
                                          const ArbitrationProfile* profile = nullptr) const;

    const ArbitrationConfig& config() const noexcept { return config_; }

private:
    void resolveConflicts(std::vector<ArbitratedCandidate>& ranked) const;

    ArbitrationConfig config_;
};

} // namespace recall::search
