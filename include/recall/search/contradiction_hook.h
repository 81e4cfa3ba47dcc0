#pragma once

#include <recall/memory/candidate.h>

#include <string>
#include <unordered_set>

namespace recall::search {

/**
 * @brief Configuration for the contradiction penalty
 */
struct ContradictionConfig {
    bool enabled = false;
    double penalty = 0.05;
};

/**
 * @brief Decides whether a candidate conflicts with what is currently favored.
 *
 * A candidate is penalized when contradiction detection is enabled and either
 *  - its payload flags it (contradiction_flag, or conflict_score > 0), or
 *  - it names, in its `contradicts` list, an item that is currently favored.
 */
class ContradictionPenaltyHook {
public:
    ContradictionPenaltyHook() = default;
    explicit ContradictionPenaltyHook(ContradictionConfig config) : config_(config) {}

    /**
     * @return the penalty in [0,1) to apply to the score multiplier, or 0.0
     */
    double penaltyFor(const memory::Candidate& candidate,
                      const std::unordered_set<std::string>& favoredIds) const;

    bool isContradicted(const memory::Candidate& candidate,
                        const std::unordered_set<std::string>& favoredIds) const;

    const ContradictionConfig& config() const noexcept { return config_; }

private:
    ContradictionConfig config_;
};

} // namespace recall::search
