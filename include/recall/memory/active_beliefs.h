#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace recall::memory {

/**
 * @brief Normalize a belief tag: trim, lowercase, replace characters outside
 *        [alnum : _ .] with '_', and strip leading/trailing '_'.
 */
std::string normalizeBeliefTag(const std::string& tag);

/**
 * @brief Immutable snapshot of what the system currently considers relevant.
 *
 * Loaded once per query (or less often) and read by belief alignment only. A new version is
 * published by building a new set; existing snapshots are never mutated.
 */
class ActiveBeliefSet {
public:
    ActiveBeliefSet() = default;
    ActiveBeliefSet(const std::vector<std::string>& tags, uint64_t version = 0);

    bool contains(const std::string& normalizedTag) const {
        return tags_.find(normalizedTag) != tags_.end();
    }
    const std::set<std::string>& tags() const noexcept { return tags_; }
    bool empty() const noexcept { return tags_.empty(); }
    size_t size() const noexcept { return tags_.size(); }
    uint64_t version() const noexcept { return version_; }

private:
    std::set<std::string> tags_;
    uint64_t version_ = 0;
};

/**
 * @brief Aggregate active beliefs from a JSON sidecar, session and system tags, and the
 *        RECALL_ACTIVE_BELIEFS_JSON environment override.
 *
 * The sidecar holds either a JSON array of strings or a single string. A missing or
 * malformed sidecar contributes nothing.
 */
std::shared_ptr<const ActiveBeliefSet>
loadActiveBeliefs(const std::filesystem::path& sidecar,
                  const std::vector<std::string>& sessionTags = {},
                  const std::vector<std::string>& systemTags = {});

} // namespace recall::memory
