#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <thread>
#include <vector>
#include <gtest/gtest.h>
#include <recall/search/retriever.h>

using namespace recall;
using namespace recall::search;
using namespace std::chrono_literals;

namespace {

class FakeStore : public vector::IStoreClient {
public:
    Result<std::vector<memory::RawHit>> search(const std::vector<float>&, size_t) override {
        ++calls;
        if (delay.count() > 0) {
            std::this_thread::sleep_for(delay);
        }
        std::lock_guard<std::mutex> lock(mutex);
        if (error) {
            return *error;
        }
        return hits;
    }

    void setHits(std::vector<memory::RawHit> next) {
        std::lock_guard<std::mutex> lock(mutex);
        hits = std::move(next);
    }

    std::mutex mutex;
    std::vector<memory::RawHit> hits;
    std::optional<Error> error;
    std::chrono::milliseconds delay{0};
    std::atomic<int> calls{0};
};

class FakeEmbedder : public vector::IEmbeddingProvider {
public:
    Result<std::vector<float>> embed(const std::string&) override {
        ++calls;
        if (fail) {
            return Error{ErrorCode::NetworkError, "embedding service unreachable"};
        }
        return output;
    }
    size_t dimension() const override { return output.size(); }

    std::vector<float> output{1.0f, 0.0f};
    bool fail = false;
    std::atomic<int> calls{0};
};

long long unixSecondsAgo(std::chrono::hours age) {
    return std::chrono::duration_cast<std::chrono::seconds>(
               (std::chrono::system_clock::now() - age).time_since_epoch())
        .count();
}

memory::RawHit hit(const std::string& id, double similarity, std::vector<float> vec,
                   nlohmann::json extra = nlohmann::json::object()) {
    nlohmann::json payload = std::move(extra);
    if (!payload.contains("content")) {
        payload["content"] = "memory " + id;
    }
    payload["vector"] = std::move(vec);
    return memory::RawHit{id, similarity, std::move(payload)};
}

} // namespace

class RetrieverTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_shared<FakeStore>();
        embedder_ = std::make_shared<FakeEmbedder>();
        config_.resilience.maxRetries = 0;
        config_.resilience.attemptTimeout = 2000ms;
        config_.resilience.openDuration = 60000ms;
    }

    std::unique_ptr<Retriever> makeRetriever() {
        return std::make_unique<Retriever>(config_, store_, embedder_, nullptr, nullptr);
    }

    config::RecallConfig config_;
    std::shared_ptr<FakeStore> store_;
    std::shared_ptr<FakeEmbedder> embedder_;
};

TEST_F(RetrieverTest, FreshMemoryOutranksMonthOldTwin) {
    store_->setHits({hit("B", 1.0, {1.0f, 0.0f}, {{"timestamp", unixSecondsAgo(24h * 30)}}),
                     hit("A", 1.0, {1.0f, 0.0f}, {{"timestamp", unixSecondsAgo(0h)}})});
    auto retriever = makeRetriever();

    auto r = retriever->retrieve("what do I know", 5);
    ASSERT_TRUE(r);
    const auto& response = r.value();
    EXPECT_EQ(response.reason, RecallReason::Ok);
    ASSERT_EQ(response.results.size(), 2u);
    EXPECT_EQ(response.results[0].id, "A");
    EXPECT_EQ(response.results[1].id, "B");
    EXPECT_GT(response.results[0].finalScore, response.results[1].finalScore);
    EXPECT_GT(response.results[0].breakdown.recency, response.results[1].breakdown.recency);
    EXPECT_EQ(embedder_->calls.load(), 1);
}

TEST_F(RetrieverTest, RepeatedStoreTimeoutsOpenTheCircuit) {
    store_->error = Error{ErrorCode::Timeout, "store deadline exceeded"};
    auto retriever = makeRetriever();

    for (int i = 0; i < 3; ++i) {
        auto r = retriever->retrieveByVector("anything", {1.0f, 0.0f}, 5);
        ASSERT_TRUE(r);
        EXPECT_TRUE(r.value().empty());
        EXPECT_EQ(r.value().reason, RecallReason::StoreFailure);
    }
    EXPECT_TRUE(retriever->breaker()->isOpen());

    auto rejected = retriever->retrieveByVector("anything", {1.0f, 0.0f}, 5);
    ASSERT_TRUE(rejected);
    EXPECT_TRUE(rejected.value().empty());
    EXPECT_EQ(rejected.value().reason, RecallReason::CircuitOpen);
    EXPECT_EQ(rejected.value().toJson()["reason"], "circuit_open");
    EXPECT_EQ(store_->calls.load(), 3);
}

TEST_F(RetrieverTest, SlowStoreIsCutOffByAttemptTimeout) {
    config_.resilience.attemptTimeout = 30ms;
    store_->delay = 300ms;
    store_->setHits({hit("a", 0.9, {1.0f, 0.0f})});
    auto retriever = makeRetriever();

    auto r = retriever->retrieveByVector("anything", {1.0f, 0.0f}, 5);
    ASSERT_TRUE(r);
    EXPECT_TRUE(r.value().empty());
    EXPECT_EQ(r.value().reason, RecallReason::StoreFailure);
    EXPECT_EQ(r.value().fetchReason, vector::FetchReason::Failed);
    EXPECT_EQ(retriever->breaker()->consecutiveFailures(), 1u);
}

TEST_F(RetrieverTest, ThresholdAndDynamicFallback) {
    store_->setHits({hit("a", 0.29, {1.0f, 0.0f}), hit("b", 0.10, {0.0f, 1.0f})});

    auto strict = makeRetriever()->retrieveByVector("anything", {1.0f, 0.0f}, 5);
    ASSERT_TRUE(strict);
    EXPECT_TRUE(strict.value().empty());
    EXPECT_EQ(strict.value().reason, RecallReason::BelowThreshold);

    config_.selection.dynamicThresholdEnabled = true;
    config_.selection.floorThreshold = 0.15;
    auto relaxed = makeRetriever()->retrieveByVector("anything", {1.0f, 0.0f}, 5);
    ASSERT_TRUE(relaxed);
    ASSERT_EQ(relaxed.value().results.size(), 1u);
    EXPECT_EQ(relaxed.value().results[0].id, "a");
    EXPECT_TRUE(relaxed.value().fallbacks.dynamicThreshold);
}

TEST_F(RetrieverTest, DimensionMismatchIsAnError) {
    store_->setHits({hit("a", 0.9, {1.0f, 0.0f, 0.0f})});
    auto r = makeRetriever()->retrieveByVector("anything", {1.0f, 0.0f}, 5);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::DimensionMismatch);
}

TEST_F(RetrieverTest, EmbeddingFailureYieldsEmptyResult) {
    embedder_->fail = true;
    auto r = makeRetriever()->retrieve("anything", 5);
    ASSERT_TRUE(r);
    EXPECT_TRUE(r.value().empty());
    EXPECT_EQ(r.value().reason, RecallReason::StoreFailure);
    EXPECT_EQ(store_->calls.load(), 0);
}

TEST_F(RetrieverTest, CancelledQueryNeverReachesTheStore) {
    store_->setHits({hit("a", 0.9, {1.0f, 0.0f})});
    std::stop_source source;
    source.request_stop();
    auto r = makeRetriever()->retrieve("anything", 5, source.get_token());
    ASSERT_TRUE(r);
    EXPECT_EQ(r.value().reason, RecallReason::Cancelled);
    EXPECT_EQ(store_->calls.load(), 0);
}

TEST_F(RetrieverTest, HowQueriesPreferProcedures) {
    config_.arbitration.enabled = true;
    store_->setHits({hit("fact", 0.9, {1.0f, 0.0f}),
                     hit("steps", 0.85, {0.95f, 0.3122499f}, {{"type", "procedural"}})});
    auto retriever = makeRetriever();

    auto r = retriever->retrieveByVector("how do I rotate the logs", {1.0f, 0.0f}, 5);
    ASSERT_TRUE(r);
    const auto& response = r.value();
    EXPECT_EQ(response.intent, QueryIntent::How);
    ASSERT_EQ(response.results.size(), 2u);
    EXPECT_EQ(response.results[0].id, "steps");
    EXPECT_EQ(response.results[0].provenance, ProvenanceClass::Procedural);

    auto j = response.toJson();
    EXPECT_EQ(j["intent"], "how");
    EXPECT_EQ(j["results"][0]["provenance"], "procedural");
}

TEST_F(RetrieverTest, TelemetryDoesNotDisturbResults) {
    config_.telemetry.enabled = true;
    config_.selection.mmrEnabled = true;
    store_->setHits({hit("a", 0.9, {1.0f, 0.0f}, {{"content", "reach me at a@b.example"}}),
                     hit("b", 0.8, {0.0f, 1.0f})});
    auto r = makeRetriever()->retrieve("contact details", 1);
    ASSERT_TRUE(r);
    EXPECT_EQ(r.value().reason, RecallReason::Ok);
    EXPECT_EQ(r.value().results.size(), 1u);
}

TEST_F(RetrieverTest, ZeroTopKReturnsNothing) {
    store_->setHits({hit("a", 0.9, {1.0f, 0.0f})});
    auto r = makeRetriever()->retrieveByVector("anything", {1.0f, 0.0f}, 0);
    ASSERT_TRUE(r);
    EXPECT_TRUE(r.value().empty());
    EXPECT_EQ(r.value().reason, RecallReason::NoCandidates);
    EXPECT_EQ(store_->calls.load(), 0);
}
