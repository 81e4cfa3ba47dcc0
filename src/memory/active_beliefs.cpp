#include <recall/memory/active_beliefs.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <atomic>
#include <cctype>
#include <cstdlib>
#include <fstream>

namespace recall::memory {

namespace {

std::atomic<uint64_t> g_beliefVersion{0};

void collectTags(const nlohmann::json& obj, std::vector<std::string>& out) {
    if (obj.is_array()) {
        for (const auto& item : obj) {
            if (item.is_string()) {
                out.push_back(item.get<std::string>());
            }
        }
    } else if (obj.is_string()) {
        out.push_back(obj.get<std::string>());
    }
}

} // namespace

std::string normalizeBeliefTag(const std::string& tag) {
    std::string out;
    out.reserve(tag.size());
    auto first = tag.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return out;
    }
    auto last = tag.find_last_not_of(" \t\r\n");
    for (size_t i = first; i <= last; ++i) {
        auto ch = static_cast<unsigned char>(tag[i]);
        if (std::isalnum(ch) || ch == ':' || ch == '_' || ch == '.') {
            out.push_back(static_cast<char>(std::tolower(ch)));
        } else {
            out.push_back('_');
        }
    }
    auto begin = out.find_first_not_of('_');
    if (begin == std::string::npos) {
        return {};
    }
    auto end = out.find_last_not_of('_');
    return out.substr(begin, end - begin + 1);
}

ActiveBeliefSet::ActiveBeliefSet(const std::vector<std::string>& tags, uint64_t version)
    : version_(version) {
    for (const auto& t : tags) {
        auto n = normalizeBeliefTag(t);
        if (!n.empty()) {
            tags_.insert(std::move(n));
        }
    }
}

std::shared_ptr<const ActiveBeliefSet>
loadActiveBeliefs(const std::filesystem::path& sidecar,
                  const std::vector<std::string>& sessionTags,
                  const std::vector<std::string>& systemTags) {
    std::vector<std::string> all;

    if (!sidecar.empty()) {
        std::error_code ec;
        if (std::filesystem::exists(sidecar, ec)) {
            std::ifstream in(sidecar);
            auto parsed = nlohmann::json::parse(in, nullptr, false);
            if (parsed.is_discarded()) {
                spdlog::warn("Active beliefs sidecar {} is not valid JSON; ignoring",
                             sidecar.string());
            } else {
                collectTags(parsed, all);
            }
        }
    }

    all.insert(all.end(), sessionTags.begin(), sessionTags.end());
    all.insert(all.end(), systemTags.begin(), systemTags.end());

    if (const char* env = std::getenv("RECALL_ACTIVE_BELIEFS_JSON"); env && *env) {
        auto parsed = nlohmann::json::parse(env, nullptr, false);
        if (parsed.is_discarded()) {
            spdlog::warn("RECALL_ACTIVE_BELIEFS_JSON is not valid JSON; ignoring");
        } else {
            collectTags(parsed, all);
        }
    }

    auto set = std::make_shared<const ActiveBeliefSet>(all, ++g_beliefVersion);
    spdlog::debug("Loaded {} active belief tags (version {})", set->size(), set->version());
    return set;
}

} // namespace recall::memory
