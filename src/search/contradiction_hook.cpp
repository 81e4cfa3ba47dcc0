#include <recall/search/contradiction_hook.h>

#include <algorithm>

namespace recall::search {

bool ContradictionPenaltyHook::isContradicted(
    const memory::Candidate& candidate, const std::unordered_set<std::string>& favoredIds) const {
    if (candidate.contradictionFlag || candidate.conflictScore > 0.0f) {
        return true;
    }
    return std::any_of(candidate.contradicts.begin(), candidate.contradicts.end(),
                       [&](const std::string& id) {
                           return id != candidate.id && favoredIds.count(id) > 0;
                       });
}

double ContradictionPenaltyHook::penaltyFor(
    const memory::Candidate& candidate, const std::unordered_set<std::string>& favoredIds) const {
    if (!config_.enabled || config_.penalty <= 0.0) {
        return 0.0;
    }
    if (!isContradicted(candidate, favoredIds)) {
        return 0.0;
    }
    return std::clamp(config_.penalty, 0.0, 1.0);
}

} // namespace recall::search
