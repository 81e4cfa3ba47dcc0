#pragma once

#include <recall/core/types.h>
#include <recall/search/arbitration.h>

#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>

namespace recall::search {

/**
 * @brief Bounds and cadence of the profile learning step
 */
struct LearningConfig {
    bool enabled = false;
    bool observeOnly = false;
    double maxShift = 0.10;
    double damping = 0.20;
    double floor = ArbitrationProfile::kDefaultFloor;
    // Gain applied to the centred per-class signal when proposing a delta
    double gain = 0.10;
    std::chrono::seconds minInterval{3600};
    // Trailing window handed to the signal source
    size_t windowTurns = 200;

    nlohmann::json toJson() const;
};

/**
 * @brief Aggregate downstream observations per provenance class over a trailing window
 */
struct ArbitrationSignals {
    ClassWeights keptRate{};
    ClassWeights uncertainRate{};
    ClassWeights contradictionSeverity{};
    ClassWeights retrievalUsefulness{};
    // Positive when reinforcement outpaces decay, in [-1, 1]
    ClassWeights reinforcementVsDecay{};
    ClassWeights recentVariance{};
    ClassWeights confidenceMargin{};

    static ArbitrationSignals fromJson(const nlohmann::json& j);
};

class IArbitrationSignalSource {
public:
    virtual ~IArbitrationSignalSource() = default;

    virtual Result<ArbitrationSignals> observe(size_t windowTurns) = 0;
};

/**
 * @brief Proposed per-class change; positive favors the class.
 *
 * Each class gets a merit from kept rate, usefulness, reinforcement and confidence margin,
 * less uncertainty, contradiction severity and variance. The delta is the merit's deviation
 * from the class mean times @p gain, so it sums to zero.
 */
ClassWeights proposeDelta(const ArbitrationSignals& signals, double gain = 0.10);

/**
 * @brief Bounded application of a delta.
 *
 * Clamp each component to +/-maxShift, damp, apply, floor-clamp and renormalize, then pull
 * the result back toward @p profile if any class moved by more than maxShift.
 */
ArbitrationProfile applyDelta(const ArbitrationProfile& profile, const ClassWeights& delta,
                              const LearningConfig& config);

struct LearningOutcome {
    enum class Status { Applied, ObservedOnly, Disabled, TooSoon, NoSignals };

    Status status = Status::Disabled;
    ArbitrationProfile before;
    ArbitrationProfile after;
    ClassWeights delta{};
    bool persisted = false;
};

const char* learningStatusToString(LearningOutcome::Status status) noexcept;

/**
 * @brief The low-frequency learning loop; one cycle at a time.
 */
class ArbitrationLearner {
public:
    ArbitrationLearner(LearningConfig config, std::shared_ptr<ArbitrationProfileStore> store,
                       std::shared_ptr<IArbitrationSignalSource> source,
                       std::filesystem::path profilePath = {});

    LearningOutcome runCycle(std::chrono::steady_clock::time_point now);

    const LearningConfig& config() const noexcept { return config_; }

private:
    LearningConfig config_;
    std::shared_ptr<ArbitrationProfileStore> store_;
    std::shared_ptr<IArbitrationSignalSource> source_;
    std::filesystem::path profilePath_;

    std::mutex cycleMutex_;
    std::optional<std::chrono::steady_clock::time_point> lastRun_;
};

} // namespace recall::search
