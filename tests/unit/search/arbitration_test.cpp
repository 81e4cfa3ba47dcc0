#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <numeric>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include <recall/search/arbitration.h>

using namespace recall;
using namespace recall::search;
using recall::memory::Candidate;

namespace {

ScoredCandidate scored(const std::string& id, double final, const std::string& type = {},
                       const std::string& assertionKey = {}, float confidence = 0.5f) {
    ScoredCandidate s;
    s.candidate.id = id;
    s.candidate.itemType = type;
    s.candidate.assertionKey = assertionKey;
    s.candidate.confidence = confidence;
    s.breakdown.final = final;
    return s;
}

ArbitrationConfig neutralConfig(ConflictPolicy policy) {
    ArbitrationConfig cfg;
    cfg.enabled = true;
    cfg.mode = ArbitrationMode::Static;
    cfg.baseWeights = {1.0, 1.0, 1.0, 1.0};
    cfg.conflictPolicy = policy;
    return cfg;
}

bool hasUncertainTag(const ArbitratedCandidate& c) {
    const auto& tags = c.scored.candidate.provenanceTags;
    return std::find(tags.begin(), tags.end(), kUncertainTag) != tags.end();
}

} // namespace

TEST(QueryIntentTest, DetectsLexicalIntent) {
    EXPECT_EQ(detectQueryIntent("Why is the sky blue?"), QueryIntent::Why);
    EXPECT_EQ(detectQueryIntent("how do I reset my password"), QueryIntent::How);
    EXPECT_EQ(detectQueryIntent("How come it failed?"), QueryIntent::Why);
    EXPECT_EQ(detectQueryIntent("What is the capital of France"), QueryIntent::Fact);
    EXPECT_EQ(detectQueryIntent(""), QueryIntent::Fact);
    EXPECT_EQ(detectQueryIntent("showhow"), QueryIntent::Fact);
}

TEST(ProvenanceTest, ClassifiesByTypeAndTags) {
    Candidate c;
    EXPECT_EQ(provenanceOf(c), ProvenanceClass::Base);
    c.itemType = "Procedural";
    EXPECT_EQ(provenanceOf(c), ProvenanceClass::Procedural);
    c.itemType = "episodic";
    EXPECT_EQ(provenanceOf(c), ProvenanceClass::Episodic);
    c.tags = {"abstraction_active"};
    EXPECT_EQ(provenanceOf(c), ProvenanceClass::Abstraction);

    EXPECT_EQ(parseProvenance("ABSTRACTION"), ProvenanceClass::Abstraction);
    EXPECT_FALSE(parseProvenance("semantic").has_value());
    EXPECT_STREQ(provenanceToString(ProvenanceClass::Episodic), "episodic");
}

TEST(ArbitrationProfileTest, ProjectionHonorsFloorAndSum) {
    auto w = ArbitrationProfile::project({0.97, 0.01, 0.01, 0.01}, 0.05);
    EXPECT_NEAR(std::accumulate(w.begin(), w.end(), 0.0), 1.0, 1e-12);
    for (double v : w) {
        EXPECT_GE(v, 0.05 - 1e-12);
    }
    EXPECT_NEAR(w[0], 0.85, 1e-12);

    auto bad = ArbitrationProfile::project({-1.0, std::nan(""), 0.0, 0.0}, 0.05);
    for (double v : bad) {
        EXPECT_NEAR(v, 0.25, 1e-12);
    }
}

TEST(ArbitrationProfileTest, JsonRequiresEveryClass) {
    auto ok = ArbitrationProfile::fromJson(
        {{"base", 2.0}, {"episodic", 1.0}, {"procedural", 1.0}, {"abstraction", 0.0}});
    ASSERT_TRUE(ok.has_value());
    EXPECT_NEAR(ok.value().sum(), 1.0, 1e-12);
    EXPECT_GE(ok.value()[ProvenanceClass::Abstraction], ArbitrationProfile::kDefaultFloor - 1e-12);

    auto missing = ArbitrationProfile::fromJson({{"base", 1.0}});
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code, ErrorCode::InvalidData);

    EXPECT_FALSE(ArbitrationProfile::fromJson(nlohmann::json::array()).has_value());
}

TEST(EffectiveWeightsTest, ContextModeAppliesIntentMultipliers) {
    ArbitrationConfig cfg;
    cfg.enabled = true;

    auto how = computeEffectiveWeights(QueryIntent::How, cfg, nullptr);
    auto why = computeEffectiveWeights(QueryIntent::Why, cfg, nullptr);
    EXPECT_NEAR(std::accumulate(how.begin(), how.end(), 0.0), 1.0, 1e-12);
    EXPECT_GT(how[indexOf(ProvenanceClass::Procedural)], how[indexOf(ProvenanceClass::Base)]);
    EXPECT_GT(why[indexOf(ProvenanceClass::Abstraction)], why[indexOf(ProvenanceClass::Base)]);

    cfg.mode = ArbitrationMode::Static;
    EXPECT_EQ(computeEffectiveWeights(QueryIntent::How, cfg, nullptr),
              computeEffectiveWeights(QueryIntent::Why, cfg, nullptr));
}

TEST(EffectiveWeightsTest, UniformProfileIsNeutral) {
    ArbitrationConfig cfg;
    cfg.enabled = true;
    cfg.metaEnabled = true;
    auto uniform = ArbitrationProfile::uniform();
    auto with = computeEffectiveWeights(QueryIntent::Fact, cfg, &uniform);
    auto without = computeEffectiveWeights(QueryIntent::Fact, cfg, nullptr);
    for (size_t i = 0; i < kProvenanceClassCount; ++i) {
        EXPECT_NEAR(with[i], without[i], 1e-12);
    }

    ArbitrationProfile skewed;
    skewed.weights = {0.05, 0.05, 0.85, 0.05};
    auto tilted = computeEffectiveWeights(QueryIntent::Fact, cfg, &skewed);
    EXPECT_GT(tilted[indexOf(ProvenanceClass::Procedural)],
              without[indexOf(ProvenanceClass::Procedural)]);
}

TEST(ArbitrationRankerTest, InactiveKeepsFinalScoreOrder) {
    ArbitrationRanker ranker{ArbitrationConfig{}};
    auto out = ranker.rank({scored("b", 0.5), scored("a", 0.5), scored("c", 0.9, "procedural")},
                           QueryIntent::How);
    ASSERT_EQ(out.size(), 3u);
    EXPECT_EQ(out[0].id(), "c");
    EXPECT_EQ(out[1].id(), "a");
    EXPECT_EQ(out[2].id(), "b");
    EXPECT_DOUBLE_EQ(out[0].arbitratedScore, 0.9);
    EXPECT_EQ(out[0].provenance, ProvenanceClass::Procedural);
}

TEST(ArbitrationRankerTest, HowQueriesFavorProcedures) {
    ArbitrationConfig cfg;
    cfg.enabled = true;
    ArbitrationRanker ranker(cfg);

    auto out = ranker.rank({scored("fact", 1.0), scored("steps", 0.8, "procedural")},
                           QueryIntent::How);
    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[0].id(), "steps");
    EXPECT_GT(out[0].arbitratedScore, 0.8);
    EXPECT_LT(out[1].arbitratedScore, 1.0);

    auto fact = ranker.rank({scored("fact", 1.0), scored("steps", 0.8, "procedural")},
                            QueryIntent::Fact);
    EXPECT_EQ(fact[0].id(), "fact");
}

TEST(ArbitrationRankerTest, HierarchicalTagsNarrowLeader) {
    ArbitrationRanker ranker(neutralConfig(ConflictPolicy::Hierarchical));
    auto out = ranker.rank({scored("x", 1.0, {}, "sky.color"), scored("y", 0.95, {}, "sky.color"),
                            scored("z", 0.5, {}, "other")},
                           QueryIntent::Fact);
    ASSERT_EQ(out.size(), 3u);
    EXPECT_EQ(out[0].id(), "x");
    EXPECT_TRUE(hasUncertainTag(out[0]));
    EXPECT_FALSE(hasUncertainTag(out[1]));

    auto clear = ranker.rank({scored("x", 1.0, {}, "k"), scored("y", 0.5, {}, "k")},
                             QueryIntent::Fact);
    EXPECT_FALSE(hasUncertainTag(clear[0]));
}

TEST(ArbitrationRankerTest, ConfidenceGapOutsideEpsilonIsNotContested) {
    ArbitrationRanker ranker(neutralConfig(ConflictPolicy::Uncertain));
    auto out = ranker.rank(
        {scored("x", 1.0, {}, "k", 0.9f), scored("y", 0.95, {}, "k", 0.5f)}, QueryIntent::Fact);
    EXPECT_FALSE(hasUncertainTag(out[0]));
    EXPECT_FALSE(hasUncertainTag(out[1]));
}

TEST(ArbitrationRankerTest, UncertainPolicyTagsAllContested) {
    ArbitrationRanker ranker(neutralConfig(ConflictPolicy::Uncertain));
    auto out = ranker.rank({scored("x", 1.0, {}, "k", 0.5f), scored("y", 0.4, {}, "k", 0.55f)},
                           QueryIntent::Fact);
    EXPECT_TRUE(hasUncertainTag(out[0]));
    EXPECT_TRUE(hasUncertainTag(out[1]));
}

TEST(ArbitrationRankerTest, ConfidencePolicyReordersWithinSlots) {
    ArbitrationRanker ranker(neutralConfig(ConflictPolicy::Confidence));
    auto out = ranker.rank({scored("x", 1.0, {}, "k", 0.50f), scored("mid", 0.7),
                            scored("y", 0.6, {}, "k", 0.58f)},
                           QueryIntent::Fact);
    ASSERT_EQ(out.size(), 3u);
    EXPECT_EQ(out[0].id(), "y");
    EXPECT_EQ(out[1].id(), "mid");
    EXPECT_EQ(out[2].id(), "x");
}

TEST(ArbitrationRankerTest, RecencyPolicyPrefersNewer) {
    auto now = std::chrono::system_clock::now();
    auto older = scored("old", 1.0, {}, "k");
    older.candidate.timestamp = now - std::chrono::hours(240);
    auto newer = scored("new", 0.9, {}, "k");
    newer.candidate.timestamp = now - std::chrono::hours(1);

    ArbitrationRanker ranker(neutralConfig(ConflictPolicy::Recency));
    auto out = ranker.rank({older, newer}, QueryIntent::Fact);
    EXPECT_EQ(out[0].id(), "new");
    EXPECT_EQ(out[1].id(), "old");
}

class ArbitrationProfileStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() /
               ("recall_profile_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()));
        std::filesystem::create_directories(dir_);
        path_ = dir_ / "arbitration_profile.json";
    }
    void TearDown() override { std::filesystem::remove_all(dir_); }

    std::filesystem::path dir_;
    std::filesystem::path path_;
};

TEST_F(ArbitrationProfileStoreTest, SaveLoadRoundTrip) {
    ArbitrationProfileStore store;
    ArbitrationProfile p;
    p.weights = {0.4, 0.3, 0.2, 0.1};
    EXPECT_EQ(store.apply(p), 1u);
    ASSERT_TRUE(store.save(path_).has_value());
    EXPECT_FALSE(std::filesystem::exists(path_.string() + ".tmp"));

    ArbitrationProfileStore restored;
    EXPECT_TRUE(restored.load(path_));
    for (size_t i = 0; i < kProvenanceClassCount; ++i) {
        EXPECT_NEAR(restored.snapshot()->weights[i], p.weights[i], 1e-9);
    }
}

TEST_F(ArbitrationProfileStoreTest, MissingOrCorruptSidecarKeepsCurrentProfile) {
    ArbitrationProfileStore store;
    ArbitrationProfile p;
    p.weights = {0.1, 0.2, 0.3, 0.4};
    store.apply(p);
    ASSERT_TRUE(store.save(path_).has_value());
    std::filesystem::remove(path_);

    EXPECT_FALSE(store.load(path_));
    EXPECT_NEAR(store.snapshot()->weights[3], 0.4, 1e-9);

    {
        std::ofstream out(path_);
        out << "{\"base\": 0.5";
    }
    EXPECT_FALSE(store.load(path_));
    EXPECT_NEAR(store.snapshot()->weights[3], 0.4, 1e-9);
    EXPECT_EQ(store.version(), 1u);
}

TEST_F(ArbitrationProfileStoreTest, SnapshotsAreImmutable) {
    ArbitrationProfileStore store;
    auto before = store.snapshot();
    ArbitrationProfile p;
    p.weights = {0.7, 0.1, 0.1, 0.1};
    store.apply(p);
    EXPECT_NEAR(before->weights[0], 0.25, 1e-12);
    EXPECT_NEAR(store.snapshot()->weights[0], 0.7, 1e-12);
}
