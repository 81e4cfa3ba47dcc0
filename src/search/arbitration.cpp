#include <recall/search/arbitration.h>
#include <recall/search/candidate_selector.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <fstream>
#include <map>
#include <numeric>

namespace recall::search {

namespace {

constexpr std::array<const char*, kProvenanceClassCount> kClassNames{"base", "episodic",
                                                                      "procedural", "abstraction"};

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return s;
}

ClassWeights renormalize(ClassWeights w) {
    double total = 0.0;
    for (auto& v : w) {
        if (!std::isfinite(v) || v < 0.0) {
            v = 0.0;
        }
        total += v;
    }
    if (total <= 0.0) {
        w.fill(1.0 / static_cast<double>(kProvenanceClassCount));
        return w;
    }
    for (auto& v : w) {
        v /= total;
    }
    return w;
}

nlohmann::json weightsToJson(const ClassWeights& w) {
    nlohmann::json j = nlohmann::json::object();
    for (size_t i = 0; i < kProvenanceClassCount; ++i) {
        j[kClassNames[i]] = w[i];
    }
    return j;
}

bool newerThan(const memory::Candidate& a, const memory::Candidate& b) {
    // An absent timestamp counts as "now", the newest possible
    if (!a.timestamp) {
        return b.timestamp.has_value();
    }
    if (!b.timestamp) {
        return false;
    }
    return *a.timestamp > *b.timestamp;
}

void addTag(memory::Candidate& c, const char* tag) {
    if (std::find(c.provenanceTags.begin(), c.provenanceTags.end(), tag) ==
        c.provenanceTags.end()) {
        c.provenanceTags.emplace_back(tag);
    }
}

} // namespace

const char* intentToString(QueryIntent intent) noexcept {
    switch (intent) {
        case QueryIntent::Fact: return "fact";
        case QueryIntent::How: return "how";
        case QueryIntent::Why: return "why";
    }
    return "fact";
}

std::optional<QueryIntent> parseIntent(const std::string& name) {
    auto n = lower(name);
    if (n == "fact") return QueryIntent::Fact;
    if (n == "how") return QueryIntent::How;
    if (n == "why") return QueryIntent::Why;
    return std::nullopt;
}

const char* provenanceToString(ProvenanceClass cls) noexcept {
    return kClassNames[indexOf(cls)];
}

std::optional<ProvenanceClass> parseProvenance(const std::string& name) {
    auto n = lower(name);
    for (size_t i = 0; i < kProvenanceClassCount; ++i) {
        if (n == kClassNames[i]) {
            return static_cast<ProvenanceClass>(i);
        }
    }
    return std::nullopt;
}

const char* arbitrationModeToString(ArbitrationMode mode) noexcept {
    switch (mode) {
        case ArbitrationMode::Off: return "off";
        case ArbitrationMode::Static: return "static";
        case ArbitrationMode::Context: return "context";
    }
    return "off";
}

std::optional<ArbitrationMode> parseArbitrationMode(const std::string& name) {
    auto n = lower(name);
    if (n == "off") return ArbitrationMode::Off;
    if (n == "static") return ArbitrationMode::Static;
    if (n == "context") return ArbitrationMode::Context;
    return std::nullopt;
}

const char* conflictPolicyToString(ConflictPolicy policy) noexcept {
    switch (policy) {
        case ConflictPolicy::Hierarchical: return "hierarchical";
        case ConflictPolicy::Confidence: return "confidence";
        case ConflictPolicy::Recency: return "recency";
        case ConflictPolicy::Uncertain: return "uncertain";
    }
    return "hierarchical";
}

std::optional<ConflictPolicy> parseConflictPolicy(const std::string& name) {
    auto n = lower(name);
    if (n == "hierarchical") return ConflictPolicy::Hierarchical;
    if (n == "confidence") return ConflictPolicy::Confidence;
    if (n == "recency") return ConflictPolicy::Recency;
    if (n == "uncertain") return ConflictPolicy::Uncertain;
    return std::nullopt;
}

QueryIntent detectQueryIntent(const std::string& query) {
    auto tokens = tokenize(query);
    for (size_t i = 0; i < tokens.size(); ++i) {
        if (tokens[i] == "why") {
            return QueryIntent::Why;
        }
        if (tokens[i] == "how") {
            // "how come" asks for a reason, not a procedure
            if (i + 1 < tokens.size() && tokens[i + 1] == "come") {
                return QueryIntent::Why;
            }
            return QueryIntent::How;
        }
    }
    return QueryIntent::Fact;
}

ProvenanceClass provenanceOf(const memory::Candidate& candidate) {
    auto type = lower(candidate.itemType);
    if (type == "abstraction" || candidate.hasTag("abstraction_active")) {
        return ProvenanceClass::Abstraction;
    }
    if (type == "procedural" || candidate.hasTag("procedural_active")) {
        return ProvenanceClass::Procedural;
    }
    if (type == "episodic" || candidate.hasTag("episodic_active")) {
        return ProvenanceClass::Episodic;
    }
    return ProvenanceClass::Base;
}

const ClassWeights& ArbitrationConfig::multipliersFor(QueryIntent intent) const noexcept {
    switch (intent) {
        case QueryIntent::How: return howMultipliers;
        case QueryIntent::Why: return whyMultipliers;
        case QueryIntent::Fact: break;
    }
    return factMultipliers;
}

nlohmann::json ArbitrationConfig::toJson() const {
    return nlohmann::json{{"enabled", enabled},
                          {"mode", arbitrationModeToString(mode)},
                          {"base_weights", weightsToJson(baseWeights)},
                          {"multipliers",
                           {{"fact", weightsToJson(factMultipliers)},
                            {"how", weightsToJson(howMultipliers)},
                            {"why", weightsToJson(whyMultipliers)}}},
                          {"strength", strength},
                          {"conflict_policy", conflictPolicyToString(conflictPolicy)},
                          {"conflict_epsilon", conflictEpsilon},
                          {"uncertain_threshold", uncertainThreshold},
                          {"meta_enabled", metaEnabled}};
}

double ArbitrationProfile::sum() const noexcept {
    return std::accumulate(weights.begin(), weights.end(), 0.0);
}

ClassWeights ArbitrationProfile::project(ClassWeights w, double floor) {
    constexpr double n = static_cast<double>(kProvenanceClassCount);
    floor = std::clamp(floor, 0.0, 1.0 / n);
    w = renormalize(w);

    // Water-fill: pin components at the floor and rescale the rest until stable
    std::array<bool, kProvenanceClassCount> pinned{};
    for (size_t round = 0; round < kProvenanceClassCount; ++round) {
        double freeMass = 0.0;
        size_t pinnedCount = 0;
        for (size_t i = 0; i < kProvenanceClassCount; ++i) {
            if (pinned[i]) {
                ++pinnedCount;
            } else {
                freeMass += w[i];
            }
        }
        const double budget = 1.0 - floor * static_cast<double>(pinnedCount);
        bool changed = false;
        for (size_t i = 0; i < kProvenanceClassCount; ++i) {
            if (pinned[i]) {
                w[i] = floor;
                continue;
            }
            w[i] = freeMass > 0.0 ? w[i] * budget / freeMass
                                  : budget / (n - static_cast<double>(pinnedCount));
            if (w[i] < floor) {
                pinned[i] = true;
                changed = true;
            }
        }
        if (!changed) {
            break;
        }
    }
    for (size_t i = 0; i < kProvenanceClassCount; ++i) {
        if (pinned[i]) {
            w[i] = floor;
        }
    }
    return w;
}

nlohmann::json ArbitrationProfile::toJson() const {
    return weightsToJson(weights);
}

Result<ArbitrationProfile> ArbitrationProfile::fromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        return Error{ErrorCode::InvalidData, "arbitration profile must be a JSON object"};
    }
    ArbitrationProfile p;
    for (size_t i = 0; i < kProvenanceClassCount; ++i) {
        auto it = j.find(kClassNames[i]);
        if (it == j.end() || !it->is_number()) {
            return Error{ErrorCode::InvalidData,
                         std::string("arbitration profile missing numeric '") + kClassNames[i] +
                             "'"};
        }
        p.weights[i] = it->get<double>();
    }
    p.weights = project(p.weights);
    return p;
}

ClassWeights computeEffectiveWeights(QueryIntent intent, const ArbitrationConfig& config,
                                     const ArbitrationProfile* profile) {
    ClassWeights w = config.baseWeights;
    if (config.mode == ArbitrationMode::Context) {
        const auto& mult = config.multipliersFor(intent);
        for (size_t i = 0; i < kProvenanceClassCount; ++i) {
            w[i] *= mult[i];
        }
    }
    if (config.metaEnabled && profile) {
        for (size_t i = 0; i < kProvenanceClassCount; ++i) {
            // A uniform profile (0.25 each) is neutral
            w[i] *= profile->weights[i] * static_cast<double>(kProvenanceClassCount);
        }
    }
    return renormalize(w);
}

ArbitrationProfileStore::ArbitrationProfileStore()
    : current_(std::make_shared<const ArbitrationProfile>()) {}

ArbitrationProfileStore::ArbitrationProfileStore(ArbitrationProfile initial) {
    initial.weights = ArbitrationProfile::project(initial.weights);
    current_ = std::make_shared<const ArbitrationProfile>(initial);
}

uint64_t ArbitrationProfileStore::apply(const ArbitrationProfile& next) {
    ArbitrationProfile projected = next;
    projected.weights = ArbitrationProfile::project(next.weights, floor());

    std::lock_guard<std::mutex> lock(mutex_);
    std::atomic_store_explicit(&current_,
                               std::shared_ptr<const ArbitrationProfile>(
                                   std::make_shared<const ArbitrationProfile>(projected)),
                               std::memory_order_release);
    return version_.fetch_add(1, std::memory_order_acq_rel) + 1;
}

bool ArbitrationProfileStore::load(const std::filesystem::path& path) {
    std::error_code ec;
    if (path.empty() || !std::filesystem::exists(path, ec)) {
        spdlog::debug("No arbitration profile at '{}', using uniform weights", path.string());
        return false;
    }
    std::ifstream in(path);
    auto parsed = nlohmann::json::parse(in, nullptr, false);
    if (parsed.is_discarded()) {
        spdlog::warn("Arbitration profile '{}' is not valid JSON; using uniform weights",
                     path.string());
        return false;
    }
    auto profile = ArbitrationProfile::fromJson(parsed);
    if (!profile) {
        spdlog::warn("Arbitration profile '{}' ignored: {}", path.string(),
                     profile.error().message);
        return false;
    }
    apply(profile.value());
    spdlog::info("Loaded arbitration profile from '{}'", path.string());
    return true;
}

Result<void> ArbitrationProfileStore::save(const std::filesystem::path& path) const {
    if (path.empty()) {
        return Error{ErrorCode::InvalidArgument, "empty arbitration profile path"};
    }
    auto snap = snapshot();
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
    }

    // Write to a sibling and rename so readers never see a partial file
    auto tmp = path;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) {
            return Error{ErrorCode::InternalError, "cannot open " + tmp.string()};
        }
        out << snap->toJson().dump(2);
        if (!out) {
            return Error{ErrorCode::InternalError, "failed writing " + tmp.string()};
        }
    }
    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        std::filesystem::remove(tmp, ec);
        return Error{ErrorCode::InternalError, "cannot replace " + path.string()};
    }
    return {};
}

std::vector<ArbitratedCandidate> ArbitrationRanker::rank(std::vector<ScoredCandidate> scored,
                                                         QueryIntent intent,
                                                         const ArbitrationProfile* profile) const {
    std::vector<ArbitratedCandidate> out;
    out.reserve(scored.size());

    if (!config_.active()) {
        sortByFinalScore(scored);
        for (auto& s : scored) {
            auto cls = provenanceOf(s.candidate);
            double final = s.breakdown.final;
            out.push_back({std::move(s), cls, final});
        }
        return out;
    }

    const auto weights = computeEffectiveWeights(intent, config_, profile);
    const double strength = std::max(0.0, config_.strength);
    for (auto& s : scored) {
        auto cls = provenanceOf(s.candidate);
        const double factor =
            std::max(0.0, 1.0 + strength * (4.0 * weights[indexOf(cls)] - 1.0));
        double arbitrated = s.breakdown.final * factor;
        out.push_back({std::move(s), cls, arbitrated});
    }
    std::stable_sort(out.begin(), out.end(),
                     [](const ArbitratedCandidate& a, const ArbitratedCandidate& b) {
                         if (a.arbitratedScore != b.arbitratedScore) {
                             return a.arbitratedScore > b.arbitratedScore;
                         }
                         return a.id() < b.id();
                     });

    resolveConflicts(out);
    return out;
}

void ArbitrationRanker::resolveConflicts(std::vector<ArbitratedCandidate>& ranked) const {
    // Positions of each assertion key, in ranked order
    std::map<std::string, std::vector<size_t>> groups;
    for (size_t i = 0; i < ranked.size(); ++i) {
        const auto& key = ranked[i].scored.candidate.assertionKey;
        if (!key.empty()) {
            groups[key].push_back(i);
        }
    }

    for (auto& [key, positions] : groups) {
        if (positions.size() < 2) {
            continue;
        }
        const auto& leader = ranked[positions.front()];
        const double leaderConf = leader.scored.candidate.confidence;

        std::vector<size_t> contested{positions.front()};
        for (size_t p = 1; p < positions.size(); ++p) {
            double conf = ranked[positions[p]].scored.candidate.confidence;
            if (std::abs(conf - leaderConf) <= config_.conflictEpsilon + 1e-9) {
                contested.push_back(positions[p]);
            }
        }
        if (contested.size() < 2) {
            continue;
        }

        switch (config_.conflictPolicy) {
            case ConflictPolicy::Hierarchical: {
                const double top = ranked[contested[0]].arbitratedScore;
                const double runnerUp = ranked[contested[1]].arbitratedScore;
                const double margin = top > 0.0 ? (top - runnerUp) / top : 0.0;
                if (margin < config_.uncertainThreshold) {
                    addTag(ranked[contested[0]].scored.candidate, kUncertainTag);
                }
                break;
            }
            case ConflictPolicy::Uncertain:
                for (size_t pos : contested) {
                    addTag(ranked[pos].scored.candidate, kUncertainTag);
                }
                break;
            case ConflictPolicy::Confidence:
            case ConflictPolicy::Recency: {
                // Reorder the contested items among the slots they already occupy
                std::vector<ArbitratedCandidate> members;
                members.reserve(contested.size());
                for (size_t pos : contested) {
                    members.push_back(std::move(ranked[pos]));
                }
                const bool byConfidence = config_.conflictPolicy == ConflictPolicy::Confidence;
                std::stable_sort(members.begin(), members.end(),
                                 [byConfidence](const ArbitratedCandidate& a,
                                                const ArbitratedCandidate& b) {
                                     if (byConfidence) {
                                         return a.scored.candidate.confidence >
                                                b.scored.candidate.confidence;
                                     }
                                     return newerThan(a.scored.candidate, b.scored.candidate);
                                 });
                for (size_t m = 0; m < contested.size(); ++m) {
                    ranked[contested[m]] = std::move(members[m]);
                }
                break;
            }
        }
        spdlog::debug("Assertion '{}' contested by {} candidates ({})", key, contested.size(),
                      conflictPolicyToString(config_.conflictPolicy));
    }
}

} // namespace recall::search
