#include <cmath>
#include <filesystem>
#include <memory>
#include <numeric>
#include <random>
#include <gtest/gtest.h>
#include <recall/search/arbitration_learner.h>

using namespace recall;
using namespace recall::search;
using namespace std::chrono_literals;

namespace {

class FakeSignalSource : public IArbitrationSignalSource {
public:
    Result<ArbitrationSignals> observe(size_t windowTurns) override {
        ++calls;
        lastWindow = windowTurns;
        if (fail) {
            return Error{ErrorCode::NotFound, "no turns recorded"};
        }
        return signals;
    }

    ArbitrationSignals signals;
    bool fail = false;
    int calls = 0;
    size_t lastWindow = 0;
};

ArbitrationSignals favorProcedural() {
    ArbitrationSignals s;
    s.keptRate = {0.2, 0.2, 0.9, 0.2};
    s.retrievalUsefulness = {0.1, 0.1, 0.8, 0.1};
    s.uncertainRate = {0.3, 0.3, 0.0, 0.3};
    return s;
}

double sum(const ClassWeights& w) {
    return std::accumulate(w.begin(), w.end(), 0.0);
}

} // namespace

TEST(ArbitrationLearningTest, ProposedDeltaIsCentred) {
    auto delta = proposeDelta(favorProcedural(), 0.1);
    EXPECT_NEAR(sum(delta), 0.0, 1e-12);
    EXPECT_GT(delta[indexOf(ProvenanceClass::Procedural)], 0.0);
    EXPECT_LT(delta[indexOf(ProvenanceClass::Base)], 0.0);
}

TEST(ArbitrationLearningTest, SingleStepIsBoundedAndNormalized) {
    std::mt19937 rng(1234);
    std::uniform_real_distribution<double> weight(0.0, 1.0);
    std::uniform_real_distribution<double> push(-5.0, 5.0);

    for (int trial = 0; trial < 500; ++trial) {
        LearningConfig cfg;
        cfg.maxShift = 0.02 + 0.2 * weight(rng);
        cfg.damping = weight(rng);

        ArbitrationProfile old;
        old.weights = ArbitrationProfile::project(
            {weight(rng), weight(rng), weight(rng), weight(rng)}, cfg.floor);
        ClassWeights delta{push(rng), push(rng), push(rng), push(rng)};

        auto next = applyDelta(old, delta, cfg);
        EXPECT_NEAR(next.sum(), 1.0, 1e-9);
        for (size_t i = 0; i < kProvenanceClassCount; ++i) {
            EXPECT_LE(std::abs(next.weights[i] - old.weights[i]), cfg.maxShift + 1e-9)
                << "trial " << trial << " class " << i;
            EXPECT_GE(next.weights[i], cfg.floor - 1e-9);
        }
    }
}

TEST(ArbitrationLearningTest, ZeroDampingChangesNothing) {
    LearningConfig cfg;
    cfg.damping = 0.0;
    ArbitrationProfile old;
    old.weights = {0.4, 0.3, 0.2, 0.1};
    auto next = applyDelta(old, {0.5, -0.5, 0.5, -0.5}, cfg);
    for (size_t i = 0; i < kProvenanceClassCount; ++i) {
        EXPECT_NEAR(next.weights[i], old.weights[i], 1e-12);
    }
}

TEST(ArbitrationLearningTest, SignalsFromJsonClampRanges) {
    auto s = ArbitrationSignals::fromJson(
        {{"kept_rate", {{"procedural", 1.7}, {"base", 0.4}}},
         {"reinforcement_vs_decay", {{"episodic", -3.0}}},
         {"recent_variance", "garbage"}});
    EXPECT_DOUBLE_EQ(s.keptRate[indexOf(ProvenanceClass::Procedural)], 1.0);
    EXPECT_DOUBLE_EQ(s.keptRate[indexOf(ProvenanceClass::Base)], 0.4);
    EXPECT_DOUBLE_EQ(s.reinforcementVsDecay[indexOf(ProvenanceClass::Episodic)], -1.0);
    EXPECT_DOUBLE_EQ(s.recentVariance[0], 0.0);
}

class ArbitrationLearnerTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_shared<ArbitrationProfileStore>();
        source_ = std::make_shared<FakeSignalSource>();
        source_->signals = favorProcedural();
        config_.enabled = true;
        config_.damping = 1.0;
        config_.gain = 0.5;
        now_ = std::chrono::steady_clock::now();
    }

    std::shared_ptr<ArbitrationProfileStore> store_;
    std::shared_ptr<FakeSignalSource> source_;
    LearningConfig config_;
    std::chrono::steady_clock::time_point now_;
};

TEST_F(ArbitrationLearnerTest, DisabledDoesNothing) {
    config_.enabled = false;
    ArbitrationLearner learner(config_, store_, source_);
    auto outcome = learner.runCycle(now_);
    EXPECT_EQ(outcome.status, LearningOutcome::Status::Disabled);
    EXPECT_EQ(source_->calls, 0);
    EXPECT_EQ(store_->version(), 0u);
}

TEST_F(ArbitrationLearnerTest, AppliesBoundedUpdateAndRespectsCadence) {
    ArbitrationLearner learner(config_, store_, source_);

    auto first = learner.runCycle(now_);
    ASSERT_EQ(first.status, LearningOutcome::Status::Applied);
    EXPECT_EQ(store_->version(), 1u);
    EXPECT_EQ(source_->lastWindow, config_.windowTurns);
    auto snap = store_->snapshot();
    EXPECT_GT((*snap)[ProvenanceClass::Procedural], 0.25);
    for (size_t i = 0; i < kProvenanceClassCount; ++i) {
        EXPECT_LE(std::abs(snap->weights[i] - 0.25), config_.maxShift + 1e-9);
    }

    auto early = learner.runCycle(now_ + 10min);
    EXPECT_EQ(early.status, LearningOutcome::Status::TooSoon);
    EXPECT_EQ(store_->version(), 1u);

    auto later = learner.runCycle(now_ + 2h);
    EXPECT_EQ(later.status, LearningOutcome::Status::Applied);
    EXPECT_EQ(store_->version(), 2u);
}

TEST_F(ArbitrationLearnerTest, ObserveOnlyNeverPublishes) {
    config_.observeOnly = true;
    auto path = std::filesystem::temp_directory_path() / "recall_observe_only_profile.json";
    std::filesystem::remove(path);
    ArbitrationLearner learner(config_, store_, source_, path);

    auto outcome = learner.runCycle(now_);
    EXPECT_EQ(outcome.status, LearningOutcome::Status::ObservedOnly);
    EXPECT_GT(outcome.after[ProvenanceClass::Procedural], outcome.before[ProvenanceClass::Procedural]);
    EXPECT_EQ(store_->version(), 0u);
    EXPECT_NEAR((*store_->snapshot())[ProvenanceClass::Procedural], 0.25, 1e-12);
    EXPECT_FALSE(outcome.persisted);
    EXPECT_FALSE(std::filesystem::exists(path));
}

TEST_F(ArbitrationLearnerTest, PersistsAppliedProfile) {
    auto dir = std::filesystem::temp_directory_path() / "recall_learner_persist";
    std::filesystem::remove_all(dir);
    auto path = dir / "profile.json";
    ArbitrationLearner learner(config_, store_, source_, path);

    auto outcome = learner.runCycle(now_);
    ASSERT_EQ(outcome.status, LearningOutcome::Status::Applied);
    EXPECT_TRUE(outcome.persisted);

    ArbitrationProfileStore reloaded;
    ASSERT_TRUE(reloaded.load(path));
    for (size_t i = 0; i < kProvenanceClassCount; ++i) {
        EXPECT_NEAR(reloaded.snapshot()->weights[i], store_->snapshot()->weights[i], 1e-9);
    }
    std::filesystem::remove_all(dir);
}

TEST_F(ArbitrationLearnerTest, SourceFailureLeavesProfileAlone) {
    source_->fail = true;
    ArbitrationLearner learner(config_, store_, source_);
    auto outcome = learner.runCycle(now_);
    EXPECT_EQ(outcome.status, LearningOutcome::Status::NoSignals);
    EXPECT_EQ(store_->version(), 0u);
}
