#include <recall/memory/candidate.h>
#include <recall/memory/time_utils.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cmath>

namespace recall::memory {

namespace {

using nlohmann::json;

const json* findField(const json& payload, std::initializer_list<const char*> keys) {
    if (!payload.is_object()) {
        return nullptr;
    }
    for (const char* key : keys) {
        auto it = payload.find(key);
        if (it != payload.end() && !it->is_null()) {
            return &(*it);
        }
    }
    return nullptr;
}

std::optional<double> asNumber(const json* value) {
    if (!value) {
        return std::nullopt;
    }
    if (value->is_number()) {
        double v = value->get<double>();
        if (std::isfinite(v)) {
            return v;
        }
        return std::nullopt;
    }
    if (value->is_boolean()) {
        return value->get<bool>() ? 1.0 : 0.0;
    }
    if (value->is_string()) {
        try {
            size_t consumed = 0;
            const auto& s = value->get_ref<const std::string&>();
            double v = std::stod(s, &consumed);
            if (consumed > 0 && std::isfinite(v)) {
                return v;
            }
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

bool asBool(const json* value) {
    if (!value) {
        return false;
    }
    if (value->is_boolean()) {
        return value->get<bool>();
    }
    if (value->is_number()) {
        return value->get<double>() != 0.0;
    }
    if (value->is_string()) {
        auto s = value->get<std::string>();
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
        return s == "1" || s == "true" || s == "yes" || s == "y";
    }
    return false;
}

std::string asString(const json* value) {
    if (!value) {
        return {};
    }
    if (value->is_string()) {
        return value->get<std::string>();
    }
    if (value->is_number() || value->is_boolean()) {
        return value->dump();
    }
    return {};
}

std::vector<std::string> asStringList(const json* value) {
    std::vector<std::string> out;
    if (!value) {
        return out;
    }
    if (value->is_string()) {
        auto s = value->get<std::string>();
        if (!s.empty()) {
            out.push_back(std::move(s));
        }
        return out;
    }
    if (!value->is_array()) {
        return out;
    }
    for (const auto& item : *value) {
        if (item.is_string()) {
            auto s = item.get<std::string>();
            if (!s.empty()) {
                out.push_back(std::move(s));
            }
        } else if (item.is_number()) {
            out.push_back(item.dump());
        }
    }
    return out;
}

// Beliefs may be plain strings or objects carrying a tag-like field
std::vector<std::string> extractBeliefTags(const json* value) {
    std::vector<std::string> out;
    if (!value || !value->is_array()) {
        return asStringList(value);
    }
    for (const auto& item : *value) {
        std::string tag;
        if (item.is_string()) {
            tag = item.get<std::string>();
        } else if (item.is_object()) {
            tag = asString(findField(item, {"tag", "label", "key"}));
        }
        auto first = tag.find_first_not_of(" \t\r\n");
        if (first == std::string::npos) {
            continue;
        }
        auto last = tag.find_last_not_of(" \t\r\n");
        out.push_back(tag.substr(first, last - first + 1));
    }
    return out;
}

std::vector<float> asEmbedding(const json* value) {
    std::vector<float> out;
    if (!value || !value->is_array()) {
        return out;
    }
    out.reserve(value->size());
    for (const auto& item : *value) {
        if (!item.is_number()) {
            return {};
        }
        double v = item.get<double>();
        if (!std::isfinite(v)) {
            return {};
        }
        out.push_back(static_cast<float>(v));
    }
    return out;
}

double resolveSimilarity(const RawHit& hit) {
    if (std::isfinite(hit.similarity) && hit.similarity != 0.0) {
        return hit.similarity;
    }
    const auto& payload = hit.payload;
    if (payload.is_object()) {
        if (auto add = payload.find("_additional"); add != payload.end() && add->is_object()) {
            if (auto v = asNumber(findField(*add, {"certainty"}))) {
                return *v;
            }
        }
        if (auto v = asNumber(findField(payload, {"_similarity", "score"}))) {
            return *v;
        }
    }
    return std::isfinite(hit.similarity) ? hit.similarity : 0.0;
}

} // namespace

bool Candidate::hasTag(const std::string& tag) const {
    return std::find(tags.begin(), tags.end(), tag) != tags.end();
}

float clampUnit(double value, float fallback) noexcept {
    if (!std::isfinite(value)) {
        return fallback;
    }
    return static_cast<float>(std::clamp(value, 0.0, 1.0));
}

Candidate normalizeHit(const RawHit& hit) {
    Candidate c;
    c.id = hit.id;
    try {
        const auto& p = hit.payload;

        c.rawSimilarity = clampUnit(resolveSimilarity(hit), 0.0f);
        c.text = asString(findField(p, {"content", "text"}));
        c.tags = asStringList(findField(p, {"tags"}));

        if (const auto* ts = findField(p, {"timestamp", "created_at"})) {
            c.timestamp = parseTimestamp(*ts);
        }

        if (auto v = asNumber(findField(p, {"source_trust"}))) {
            c.sourceTrust = clampUnit(*v, kDefaultSourceTrust);
        }
        if (auto v = asNumber(findField(p, {"confidence"}))) {
            c.confidence = clampUnit(*v, kDefaultConfidence);
        }
        if (auto v = asNumber(findField(p, {"importance"}))) {
            c.importance = clampUnit(*v, kDefaultImportance);
        }

        c.beliefTags = extractBeliefTags(findField(p, {"beliefs"}));

        if (auto v = asNumber(findField(p, {"times_used"}))) {
            c.timesUsed = *v > 0.0 ? static_cast<uint32_t>(std::min(*v, 1.0e9)) : 0u;
        }

        c.contradictionFlag = asBool(findField(p, {"contradiction_flag"}));
        if (auto v = asNumber(findField(p, {"conflict_score"}))) {
            c.conflictScore = static_cast<float>(std::max(0.0, *v));
        }
        c.contradicts = asStringList(findField(p, {"contradicts"}));

        c.assertionKey = asString(findField(p, {"assertion_key"}));
        c.itemType = asString(findField(p, {"type"}));

        c.embedding = asEmbedding(findField(p, {"vector", "embedding"}));
        if (c.embedding.empty()) {
            if (auto add = p.find("_additional"); p.is_object() && add != p.end() &&
                                                   add->is_object()) {
                c.embedding = asEmbedding(findField(*add, {"vector"}));
            }
        }

        if (c.id.empty()) {
            c.id = asString(findField(p, {"id"}));
        }
    } catch (const std::exception& e) {
        // Keep whatever was coerced so far; the remaining fields stay at their defaults
        spdlog::debug("normalizeHit: payload for '{}' partially malformed: {}", hit.id, e.what());
    }
    return c;
}

std::vector<Candidate> normalizeHits(const std::vector<RawHit>& hits) {
    std::vector<Candidate> out;
    out.reserve(hits.size());
    for (const auto& hit : hits) {
        out.push_back(normalizeHit(hit));
    }
    return out;
}

} // namespace recall::memory
