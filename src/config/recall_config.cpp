#include <recall/config/config_helpers.h>
#include <recall/config/recall_config.h>

#include <spdlog/spdlog.h>

#include <cmath>
#include <cstdlib>
#include <mutex>
#include <set>

namespace recall::config {

namespace {

// Keys already warned about in this process
std::mutex g_warnMutex;
std::set<std::string> g_warnedKeys;

void warnOnce(const std::string& key, const std::string& raw, const std::string& why) {
    std::lock_guard<std::mutex> lock(g_warnMutex);
    if (g_warnedKeys.insert(key).second) {
        spdlog::warn("Config '{}' = '{}' ignored ({}); using built-in default", key, raw, why);
    }
}

std::string upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char ch) {
        return std::isalnum(ch) ? static_cast<char>(std::toupper(ch)) : '_';
    });
    return s;
}

class Reader {
public:
    Reader(ConfigMap file, EnvLookup env, ConfigLoadReport* report)
        : file_(std::move(file)), env_(std::move(env)), report_(report) {}

    void number(const std::string& section, const std::string& key, double& target,
                double lo = -HUGE_VAL, double hi = HUGE_VAL) {
        auto raw = lookup(section, key);
        if (!raw) {
            return;
        }
        auto v = parse_double(*raw);
        if (!v || !std::isfinite(*v)) {
            fallback(section, key, *raw, "not a number");
            return;
        }
        if (*v < lo || *v > hi) {
            fallback(section, key, *raw, fmt::format("outside [{}, {}]", lo, hi));
            return;
        }
        target = *v;
    }

    template <typename Int>
    void integer(const std::string& section, const std::string& key, Int& target,
                 long long lo, long long hi) {
        auto raw = lookup(section, key);
        if (!raw) {
            return;
        }
        auto v = parse_integer(*raw);
        if (!v) {
            fallback(section, key, *raw, "not an integer");
            return;
        }
        if (*v < lo || *v > hi) {
            fallback(section, key, *raw, fmt::format("outside [{}, {}]", lo, hi));
            return;
        }
        target = static_cast<Int>(*v);
    }

    void millis(const std::string& section, const std::string& key,
                std::chrono::milliseconds& target, long long lo, long long hi) {
        long long v = target.count();
        integer(section, key, v, lo, hi);
        target = std::chrono::milliseconds{v};
    }

    void seconds(const std::string& section, const std::string& key, std::chrono::seconds& target,
                 long long lo, long long hi) {
        long long v = target.count();
        integer(section, key, v, lo, hi);
        target = std::chrono::seconds{v};
    }

    void flag(const std::string& section, const std::string& key, bool& target) {
        auto raw = lookup(section, key);
        if (!raw) {
            return;
        }
        auto v = parse_bool(*raw);
        if (!v) {
            fallback(section, key, *raw, "not a boolean");
            return;
        }
        target = *v;
    }

    void path(const std::string& section, const std::string& key,
              std::filesystem::path& target) {
        if (auto raw = lookup(section, key); raw && !raw->empty()) {
            target = expand_tilde(unquote(*raw));
        }
    }

    void list(const std::string& section, const std::string& key,
              std::vector<std::string>& target) {
        auto raw = lookup(section, key);
        if (!raw) {
            return;
        }
        auto items = parse_list(*raw);
        if (items.empty()) {
            fallback(section, key, *raw, "empty list");
            return;
        }
        target = std::move(items);
    }

    template <typename Enum, typename Parser>
    void choice(const std::string& section, const std::string& key, Enum& target,
                Parser parser) {
        auto raw = lookup(section, key);
        if (!raw) {
            return;
        }
        auto v = parser(unquote(*raw));
        if (!v) {
            fallback(section, key, *raw, "unknown value");
            return;
        }
        target = *v;
    }

    void fallback(const std::string& section, const std::string& key, const std::string& raw,
                  const std::string& why) {
        auto full = section + "." + key;
        if (report_) {
            report_->fallbacks.push_back(full);
        }
        warnOnce(full, raw, why);
    }

private:
    std::optional<std::string> lookup(const std::string& section, const std::string& key) {
        if (env_) {
            if (auto v = env_(envNameFor(section, key)); v && !v->empty()) {
                return v;
            }
        }
        auto it = file_.find(section + "." + key);
        if (it != file_.end()) {
            return it->second;
        }
        return std::nullopt;
    }

    ConfigMap file_;
    EnvLookup env_;
    ConfigLoadReport* report_;
};

void readClassWeights(Reader& r, const std::string& section, const std::string& prefix,
                      search::ClassWeights& target, double lo, double hi) {
    for (size_t i = 0; i < search::kProvenanceClassCount; ++i) {
        r.number(section, prefix + search::provenanceToString(static_cast<search::ProvenanceClass>(i)),
                 target[i], lo, hi);
    }
}

} // namespace

std::optional<std::string> processEnv(const std::string& name) {
    if (const char* v = std::getenv(name.c_str())) {
        return std::string(v);
    }
    return std::nullopt;
}

std::string envNameFor(const std::string& section, const std::string& key) {
    return "RECALL_" + upper(section) + "_" + upper(key);
}

nlohmann::json ResilienceConfig::toJson() const {
    return nlohmann::json{{"failure_limit", failureLimit},
                          {"open_duration_ms", openDuration.count()},
                          {"max_retries", maxRetries},
                          {"attempt_timeout_ms", attemptTimeout.count()},
                          {"backoff_base_ms", backoffBase.count()},
                          {"jitter_ratio", jitterRatio},
                          {"worker_threads", workerThreads},
                          {"spare_workers", spareWorkers}};
}

nlohmann::json TelemetryConfig::toJson() const {
    return nlohmann::json{{"enabled", enabled}, {"preview_chars", previewChars}};
}

nlohmann::json RecallConfig::toJson() const {
    return nlohmann::json{{"selection", selection.toJson()},
                          {"scoring", scoring.toJson()},
                          {"contradiction",
                           {{"enabled", contradiction.enabled},
                            {"penalty", contradiction.penalty}}},
                          {"arbitration", arbitration.toJson()},
                          {"learning", learning.toJson()},
                          {"resilience", resilience.toJson()},
                          {"telemetry", telemetry.toJson()},
                          {"paths",
                           {{"active_beliefs", activeBeliefsPath.string()},
                            {"profile", profilePath.string()}}}};
}

RecallConfig loadRecallConfig(const ConfigLoadOptions& options, ConfigLoadReport* report) {
    RecallConfig cfg;

    auto path = options.path.empty() ? get_config_path() : options.path;
    std::error_code ec;
    const bool found = !path.empty() && std::filesystem::exists(path, ec);
    ConfigMap file;
    if (found) {
        file = parse_config_file(path);
        spdlog::debug("Loaded {} config value(s) from {}", file.size(), path.string());
    }
    if (report) {
        report->source = path;
        report->fileFound = found;
    }

    Reader r(std::move(file), options.env, report);

    auto& sel = cfg.selection;
    r.number("selection", "threshold", sel.threshold, 0.0, 1.0);
    r.flag("selection", "dynamic_threshold", sel.dynamicThresholdEnabled);
    r.number("selection", "floor_threshold", sel.floorThreshold, 0.0, 1.0);
    r.flag("selection", "top1_fallback", sel.top1FallbackEnabled);
    r.integer("selection", "min_results", sel.minResults, 0, 1000);
    r.flag("selection", "keyword_boost", sel.keywordBoostEnabled);
    r.list("selection", "keyword_fields", sel.keywordFields);
    r.number("selection", "keyword_boost_unit", sel.keywordBoostUnit, 0.0, 0.15);
    r.flag("selection", "dedupe", sel.dedupeEnabled);
    r.number("selection", "dedupe_threshold", sel.dedupeThreshold, 0.0, 1.0);
    r.flag("selection", "mmr_enabled", sel.mmrEnabled);
    r.number("selection", "mmr_lambda", sel.mmrLambda, 0.0, 1.0);
    r.integer("selection", "mmr_k", sel.mmrK, 1, 1000);

    auto& w = cfg.scoring;
    r.number("scoring", "w_sim", w.sim, 0.0, 100.0);
    r.number("scoring", "w_rec", w.rec, 0.0, 100.0);
    r.number("scoring", "w_cred", w.cred, 0.0, 100.0);
    r.number("scoring", "w_conf", w.conf, 0.0, 100.0);
    r.number("scoring", "w_bel", w.bel, 0.0, 100.0);
    r.number("scoring", "w_use", w.use, 0.0, 100.0);
    r.number("scoring", "w_nov", w.nov, 0.0, 100.0);
    r.number("scoring", "decay_lambda", w.decayLambda, 0.0, 10.0);
    r.flag("scoring", "beliefs_enabled", w.beliefsEnabled);
    r.number("scoring", "belief_alpha", w.beliefAlpha, 1e-6, 10.0);
    r.number("scoring", "belief_importance_boost", w.beliefImportanceBoost, 0.0, 1.0);
    r.list("scoring", "important_prefixes", w.importantPrefixes);

    r.flag("contradiction", "enabled", cfg.contradiction.enabled);
    r.number("contradiction", "penalty", cfg.contradiction.penalty, 0.0, 1.0);

    auto& arb = cfg.arbitration;
    r.flag("arbitration", "enabled", arb.enabled);
    r.choice("arbitration", "mode", arb.mode, search::parseArbitrationMode);
    readClassWeights(r, "arbitration", "w_", arb.baseWeights, 0.0, 10.0);
    readClassWeights(r, "arbitration", "mult_fact_", arb.factMultipliers, 0.0, 10.0);
    readClassWeights(r, "arbitration", "mult_how_", arb.howMultipliers, 0.0, 10.0);
    readClassWeights(r, "arbitration", "mult_why_", arb.whyMultipliers, 0.0, 10.0);
    r.number("arbitration", "strength", arb.strength, 0.0, 1.0);
    r.choice("arbitration", "conflict_policy", arb.conflictPolicy, search::parseConflictPolicy);
    r.number("arbitration", "conflict_epsilon", arb.conflictEpsilon, 0.0, 1.0);
    r.number("arbitration", "uncertain_threshold", arb.uncertainThreshold, 0.0, 1.0);
    r.flag("arbitration", "meta_enabled", arb.metaEnabled);

    auto& learn = cfg.learning;
    r.flag("learning", "enabled", learn.enabled);
    r.flag("learning", "observe_only", learn.observeOnly);
    r.number("learning", "max_shift", learn.maxShift, 0.0, 1.0);
    r.number("learning", "damping", learn.damping, 0.0, 1.0);
    r.number("learning", "floor", learn.floor, 0.0, 0.25);
    r.number("learning", "gain", learn.gain, 0.0, 10.0);
    r.seconds("learning", "min_interval_s", learn.minInterval, 0, 7LL * 24 * 3600);
    r.integer("learning", "window_turns", learn.windowTurns, 1, 1000000);

    auto& res = cfg.resilience;
    r.integer("resilience", "failure_limit", res.failureLimit, 1, 1000);
    r.millis("resilience", "open_duration_ms", res.openDuration, 0, 3600LL * 1000);
    r.integer("resilience", "max_retries", res.maxRetries, 0, 10);
    r.millis("resilience", "attempt_timeout_ms", res.attemptTimeout, 1, 600LL * 1000);
    r.millis("resilience", "backoff_base_ms", res.backoffBase, 0, 60LL * 1000);
    r.number("resilience", "jitter_ratio", res.jitterRatio, 0.0, 1.0);
    r.integer("resilience", "worker_threads", res.workerThreads, 1, 64);
    r.integer("resilience", "spare_workers", res.spareWorkers, 0, 64);

    r.flag("telemetry", "enabled", cfg.telemetry.enabled);
    r.integer("telemetry", "preview_chars", cfg.telemetry.previewChars, 0, 100000);
    cfg.telemetry.previewChars =
        std::max(TelemetryConfig::kMinPreviewChars, cfg.telemetry.previewChars);

    r.path("paths", "active_beliefs", cfg.activeBeliefsPath);
    r.path("paths", "profile", cfg.profilePath);

    // The floor may not exceed the primary threshold
    if (sel.floorThreshold > sel.threshold) {
        r.fallback("selection", "floor_threshold", std::to_string(sel.floorThreshold),
                   "above threshold");
        sel.floorThreshold = std::min(search::SelectionConfig{}.floorThreshold, sel.threshold);
    }
    return cfg;
}

} // namespace recall::config
