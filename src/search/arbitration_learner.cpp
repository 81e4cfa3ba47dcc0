#include <recall/search/arbitration_learner.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>

namespace recall::search {

namespace {

double finiteOr(double v, double fallback) {
    return std::isfinite(v) ? v : fallback;
}

ClassWeights readClassMap(const nlohmann::json& j, const char* key, double lo, double hi) {
    ClassWeights out{};
    if (!j.is_object()) {
        return out;
    }
    auto it = j.find(key);
    if (it == j.end() || !it->is_object()) {
        return out;
    }
    for (size_t i = 0; i < kProvenanceClassCount; ++i) {
        const char* name = provenanceToString(static_cast<ProvenanceClass>(i));
        auto v = it->find(name);
        if (v != it->end() && v->is_number()) {
            out[i] = std::clamp(finiteOr(v->get<double>(), 0.0), lo, hi);
        }
    }
    return out;
}

std::string formatWeights(const ClassWeights& w) {
    return fmt::format("base={:.4f} episodic={:.4f} procedural={:.4f} abstraction={:.4f}", w[0],
                       w[1], w[2], w[3]);
}

} // namespace

nlohmann::json LearningConfig::toJson() const {
    return nlohmann::json{{"enabled", enabled},
                          {"observe_only", observeOnly},
                          {"max_shift", maxShift},
                          {"damping", damping},
                          {"floor", floor},
                          {"gain", gain},
                          {"min_interval_s", minInterval.count()},
                          {"window_turns", windowTurns}};
}

ArbitrationSignals ArbitrationSignals::fromJson(const nlohmann::json& j) {
    ArbitrationSignals s;
    s.keptRate = readClassMap(j, "kept_rate", 0.0, 1.0);
    s.uncertainRate = readClassMap(j, "uncertain_rate", 0.0, 1.0);
    s.contradictionSeverity = readClassMap(j, "contradiction_severity", 0.0, 1.0);
    s.retrievalUsefulness = readClassMap(j, "retrieval_usefulness", 0.0, 1.0);
    s.reinforcementVsDecay = readClassMap(j, "reinforcement_vs_decay", -1.0, 1.0);
    s.recentVariance = readClassMap(j, "recent_variance", 0.0, 1.0);
    s.confidenceMargin = readClassMap(j, "confidence_margin", 0.0, 1.0);
    return s;
}

ClassWeights proposeDelta(const ArbitrationSignals& signals, double gain) {
    ClassWeights merit{};
    double mean = 0.0;
    for (size_t i = 0; i < kProvenanceClassCount; ++i) {
        merit[i] = signals.keptRate[i] + signals.retrievalUsefulness[i] +
                   0.5 * signals.reinforcementVsDecay[i] + signals.confidenceMargin[i] -
                   signals.uncertainRate[i] - signals.contradictionSeverity[i] -
                   0.5 * signals.recentVariance[i];
        merit[i] = finiteOr(merit[i], 0.0);
        mean += merit[i];
    }
    mean /= static_cast<double>(kProvenanceClassCount);

    ClassWeights delta{};
    for (size_t i = 0; i < kProvenanceClassCount; ++i) {
        delta[i] = finiteOr(gain, 0.0) * (merit[i] - mean);
    }
    return delta;
}

ArbitrationProfile applyDelta(const ArbitrationProfile& profile, const ClassWeights& delta,
                              const LearningConfig& config) {
    const double maxShift = std::max(0.0, finiteOr(config.maxShift, 0.10));
    const double damping = std::clamp(finiteOr(config.damping, 0.20), 0.0, 1.0);
    const auto old = ArbitrationProfile::project(profile.weights, config.floor);

    ClassWeights next{};
    for (size_t i = 0; i < kProvenanceClassCount; ++i) {
        const double step = std::clamp(finiteOr(delta[i], 0.0), -maxShift, maxShift) * damping;
        next[i] = old[i] + step;
    }
    next = ArbitrationProfile::project(next, config.floor);

    // Renormalization can move untouched classes; pull the whole vector back along the
    // segment from the old profile until no class exceeds maxShift
    double worst = 0.0;
    for (size_t i = 0; i < kProvenanceClassCount; ++i) {
        worst = std::max(worst, std::abs(next[i] - old[i]));
    }
    if (worst > maxShift && worst > 0.0) {
        const double t = maxShift / worst;
        for (size_t i = 0; i < kProvenanceClassCount; ++i) {
            next[i] = old[i] + t * (next[i] - old[i]);
        }
    }

    ArbitrationProfile out;
    out.weights = next;
    return out;
}

const char* learningStatusToString(LearningOutcome::Status status) noexcept {
    switch (status) {
        case LearningOutcome::Status::Applied: return "applied";
        case LearningOutcome::Status::ObservedOnly: return "observed_only";
        case LearningOutcome::Status::Disabled: return "disabled";
        case LearningOutcome::Status::TooSoon: return "too_soon";
        case LearningOutcome::Status::NoSignals: return "no_signals";
    }
    return "unknown";
}

ArbitrationLearner::ArbitrationLearner(LearningConfig config,
                                       std::shared_ptr<ArbitrationProfileStore> store,
                                       std::shared_ptr<IArbitrationSignalSource> source,
                                       std::filesystem::path profilePath)
    : config_(std::move(config)), store_(std::move(store)), source_(std::move(source)),
      profilePath_(std::move(profilePath)) {
    if (store_) {
        store_->setFloor(config_.floor);
    }
}

LearningOutcome ArbitrationLearner::runCycle(std::chrono::steady_clock::time_point now) {
    std::lock_guard<std::mutex> lock(cycleMutex_);

    LearningOutcome outcome;
    if (store_) {
        outcome.before = *store_->snapshot();
        outcome.after = outcome.before;
    }

    if (!config_.enabled || !store_ || !source_) {
        outcome.status = LearningOutcome::Status::Disabled;
        return outcome;
    }
    if (lastRun_ && now - *lastRun_ < config_.minInterval) {
        outcome.status = LearningOutcome::Status::TooSoon;
        return outcome;
    }
    lastRun_ = now;

    auto signals = source_->observe(config_.windowTurns);
    if (!signals) {
        spdlog::warn("Arbitration learning skipped: {}", signals.error().message);
        outcome.status = LearningOutcome::Status::NoSignals;
        return outcome;
    }

    outcome.delta = proposeDelta(signals.value(), config_.gain);
    outcome.after = applyDelta(outcome.before, outcome.delta, config_);

    if (config_.observeOnly) {
        outcome.status = LearningOutcome::Status::ObservedOnly;
        spdlog::info("Arbitration learning (observe only): {} -> {}",
                     formatWeights(outcome.before.weights), formatWeights(outcome.after.weights));
        return outcome;
    }

    auto version = store_->apply(outcome.after);
    outcome.after = *store_->snapshot();
    outcome.status = LearningOutcome::Status::Applied;
    spdlog::info("Arbitration profile v{} applied: {} -> {}", version,
                 formatWeights(outcome.before.weights), formatWeights(outcome.after.weights));

    if (!profilePath_.empty()) {
        auto saved = store_->save(profilePath_);
        if (!saved) {
            spdlog::warn("Failed to persist arbitration profile: {}", saved.error().message);
        } else {
            outcome.persisted = true;
        }
    }
    return outcome;
}

} // namespace recall::search
