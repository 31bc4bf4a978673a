// File: tests/retrieval/ranking_engine_test.cpp
#include "retrieval/ranking_engine.hpp"
#include "storage/memory_backend.hpp"
#include "core/errors.hpp"
#include "../support/record_fixtures.hpp"
#include <gtest/gtest.h>
#include <future>

namespace careledger {
namespace {

using testing_support::MakeRecord;
using testing_support::MakeScoredRecord;
using testing_support::QueryAxis;
using testing_support::ReferenceTime;
using testing_support::VectorWithCosine;
using testing_support::DaysAgo;

class RankingEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        store = std::make_shared<MemoryBackend>(MemoryBackend::Config{});
        locks = std::make_shared<OwnerLockTable>();
        ranker = std::make_unique<TimeWeightedRanker>(store, locks);
    }

    Record Add(Record record) {
        EXPECT_TRUE(store->Store(record));
        return record;
    }

    RankingQuery Query(const std::string& owner, float floor = 0.5f, size_t limit = 10) const {
        RankingQuery query;
        query.owner_id = owner;
        query.query_embedding = QueryAxis();
        query.similarity_floor = floor;
        query.result_limit = limit;
        return query;
    }

    std::shared_ptr<MemoryBackend> store;
    std::shared_ptr<OwnerLockTable> locks;
    std::unique_ptr<TimeWeightedRanker> ranker;
};

// ============================================================================
// Scoring
// ============================================================================

TEST_F(RankingEngineTest, ScoreCombinesSimilarityRecencyAndWeight) {
    Record record = MakeScoredRecord("p", 0.8f, 9);
    record.SetMemoryWeight(1.5);

    RankedCandidate c = TimeWeightedRanker::Score(record, QueryAxis(), 0.3, ReferenceTime(), 180);

    EXPECT_NEAR(0.8f, c.similarity_score, 1e-6f);
    EXPECT_EQ(9, c.age_days);
    EXPECT_NEAR(0.1, c.recency_score, 1e-9);
    EXPECT_NEAR(0.7 * 0.8 + 0.3 * 0.1, c.time_weighted_score, 1e-6);
    EXPECT_NEAR((0.7 * 0.8 + 0.3 * 0.1) * 1.5, c.final_score, 1e-6);
    EXPECT_EQ(Partition::RECENT, c.partition);
}

TEST_F(RankingEngineTest, RecencyScoreIsStrictlyDecreasingAndBounded) {
    double previous = 2.0;
    for (int64_t age : {0, 1, 10, 100, 1000}) {
        RankedCandidate c = TimeWeightedRanker::Score(MakeScoredRecord("p", 0.9f, age),
                                                      QueryAxis(), 0.3, ReferenceTime(), 180);
        EXPECT_GT(c.recency_score, 0.0);
        EXPECT_LE(c.recency_score, 1.0);
        EXPECT_LT(c.recency_score, previous);
        previous = c.recency_score;
    }
}

TEST_F(RankingEngineTest, PartitionBoundaryIsRecentWindow) {
    auto at = [](int64_t age) {
        return TimeWeightedRanker::Score(MakeScoredRecord("p", 0.9f, age), QueryAxis(), 0.3,
                                         ReferenceTime(), 180).partition;
    };
    EXPECT_EQ(Partition::RECENT, at(179));
    EXPECT_EQ(Partition::OLD, at(180));
    EXPECT_EQ(Partition::OLD, at(400));
}

// ============================================================================
// Ranking
// ============================================================================

TEST_F(RankingEngineTest, EmptyOwnerYieldsEmptyResult) {
    RankingResult result = ranker->Rank(Query("nobody"), ReferenceTime());
    EXPECT_TRUE(result.candidates.empty());
    EXPECT_EQ(0u, result.records_scanned);
}

TEST_F(RankingEngineTest, NeverReturnsCandidatesBelowFloor) {
    for (float cosine : {0.95f, 0.7f, 0.55f, 0.51f, 0.45f, 0.2f, -0.3f}) {
        Add(MakeScoredRecord("p", cosine, 30));
    }

    RankingResult result = ranker->Rank(Query("p", 0.5f), ReferenceTime());
    EXPECT_EQ(7u, result.records_scanned);
    ASSERT_EQ(4u, result.candidates.size());
    for (const auto& c : result.candidates) {
        EXPECT_GE(c.similarity_score, 0.5f);
    }
}

TEST_F(RankingEngineTest, OrdersByFinalScoreAndTruncates) {
    Record best = Add(MakeScoredRecord("p", 0.95f, 10));
    Record second = Add(MakeScoredRecord("p", 0.85f, 10));
    Add(MakeScoredRecord("p", 0.75f, 10));

    RankingResult result = ranker->Rank(Query("p", 0.5f, 2), ReferenceTime());
    ASSERT_EQ(2u, result.candidates.size());
    EXPECT_EQ(best.GetID(), result.candidates[0].record_id);
    EXPECT_EQ(second.GetID(), result.candidates[1].record_id);
}

TEST_F(RankingEngineTest, MemoryWeightChangesOrder) {
    Record plain = Add(MakeScoredRecord("p", 0.9f, 10));
    Record boosted = MakeScoredRecord("p", 0.8f, 10);
    boosted.SetMemoryWeight(1.5);
    Add(boosted);

    RankingResult result = ranker->Rank(Query("p"), ReferenceTime());
    ASSERT_EQ(2u, result.candidates.size());
    EXPECT_EQ(boosted.GetID(), result.candidates[0].record_id);
    EXPECT_EQ(plain.GetID(), result.candidates[1].record_id);
}

TEST_F(RankingEngineTest, TiesGoToNewerRecordThenLowerId) {
    // Same similarity and weight; time_weight 0 removes the recency term
    Record older = Add(MakeScoredRecord("p", 0.9f, 100));
    Record newer = Add(MakeScoredRecord("p", 0.9f, 10));
    Record newer_twin = Add(MakeRecord("p", "twin", VectorWithCosine(0.9f), DaysAgo(10)));

    RankingQuery query = Query("p");
    query.time_weight = 0.0;
    RankingResult result = ranker->Rank(query, ReferenceTime());

    ASSERT_EQ(3u, result.candidates.size());
    EXPECT_EQ(newer.GetID(), result.candidates[0].record_id);
    EXPECT_EQ(newer_twin.GetID(), result.candidates[1].record_id);
    EXPECT_EQ(older.GetID(), result.candidates[2].record_id);
}

TEST_F(RankingEngineTest, IdenticalInputsGiveIdenticalOutput) {
    for (int i = 0; i < 20; ++i) {
        Add(MakeScoredRecord("p", 0.5f + 0.02f * static_cast<float>(i % 10), 30 * i));
    }

    RankingResult first = ranker->Rank(Query("p", 0.5f, 15), ReferenceTime());
    RankingResult second = ranker->Rank(Query("p", 0.5f, 15), ReferenceTime());

    ASSERT_EQ(first.candidates.size(), second.candidates.size());
    for (size_t i = 0; i < first.candidates.size(); ++i) {
        EXPECT_EQ(first.candidates[i].record_id, second.candidates[i].record_id);
        EXPECT_DOUBLE_EQ(first.candidates[i].final_score, second.candidates[i].final_score);
    }
}

TEST_F(RankingEngineTest, NeverReturnsOtherOwnersRecords) {
    Add(MakeScoredRecord("owner-a", 0.9f, 10));
    Add(MakeScoredRecord("owner-b", 0.99f, 10));
    Add(MakeScoredRecord("owner-b", 0.98f, 400));

    RankingResult result = ranker->Rank(Query("owner-a"), ReferenceTime());
    ASSERT_EQ(1u, result.candidates.size());
    for (const auto& c : result.candidates) {
        auto record = store->Retrieve(c.record_id);
        ASSERT_TRUE(record.has_value());
        EXPECT_EQ("owner-a", record->GetOwnerID());
    }
}

TEST_F(RankingEngineTest, SplitsRecentAndOldInRankedOrder) {
    Add(MakeScoredRecord("p", 0.9f, 20));
    Add(MakeScoredRecord("p", 0.95f, 400));
    Add(MakeScoredRecord("p", 0.7f, 500));

    RankingResult result = ranker->Rank(Query("p"), ReferenceTime());
    ASSERT_EQ(3u, result.candidates.size());
    ASSERT_EQ(1u, result.recent.size());
    ASSERT_EQ(2u, result.old.size());
    EXPECT_GE(result.old[0].final_score, result.old[1].final_score);
    for (const auto& c : result.old) {
        EXPECT_GE(c.age_days, 180);
    }
}

TEST_F(RankingEngineTest, SkipsRecordsWithMismatchedDimension) {
    Add(MakeScoredRecord("p", 0.9f, 20));
    Add(MakeRecord("p", "legacy", Embedding(3, 1.0f), DaysAgo(20)));

    RankingResult result = ranker->Rank(Query("p"), ReferenceTime());
    EXPECT_EQ(2u, result.records_scanned);
    EXPECT_EQ(1u, result.records_skipped);
    EXPECT_EQ(1u, result.candidates.size());
}

TEST_F(RankingEngineTest, RankingDoesNotMutateRecords) {
    Record record = Add(MakeScoredRecord("p", 0.9f, 20));
    ranker->Rank(Query("p"), ReferenceTime());

    auto stored = store->Retrieve(record.GetID());
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(0u, stored->GetAccessCount());
    EXPECT_DOUBLE_EQ(1.0, stored->GetMemoryWeight());
}

TEST_F(RankingEngineTest, LockedOwnerRaisesConcurrencyConflict) {
    OwnerLockTable::Config fast;
    fast.timeout = std::chrono::milliseconds(10);
    fast.retries = 0;
    auto fast_locks = std::make_shared<OwnerLockTable>(fast);
    TimeWeightedRanker fast_ranker(store, fast_locks);
    Add(MakeScoredRecord("p", 0.9f, 20));

    auto writer = fast_locks->LockExclusive("p");
    auto ranked = std::async(std::launch::async, [&]() {
        return fast_ranker.Rank(Query("p"), ReferenceTime()).candidates.size();
    });
    EXPECT_THROW(ranked.get(), ConcurrencyConflictError);
}

TEST_F(RankingEngineTest, RejectsInvalidConstruction) {
    EXPECT_THROW(TimeWeightedRanker r(nullptr, locks), std::invalid_argument);

    TimeWeightedRanker::Config config;
    config.recent_window_days = 0;
    EXPECT_THROW(TimeWeightedRanker r(store, locks, config), std::invalid_argument);
}

} // namespace
} // namespace careledger
