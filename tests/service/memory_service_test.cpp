// File: tests/service/memory_service_test.cpp
#include "service/memory_service.hpp"
#include "embedding/hashing_embedder.hpp"
#include "storage/memory_backend.hpp"
#include "core/errors.hpp"
#include "../support/record_fixtures.hpp"
#include <gtest/gtest.h>
#include <thread>

namespace careledger {
namespace {

using testing_support::DaysAgo;
using testing_support::ReferenceTime;

class SlowEmbedder : public IEmbeddingProvider {
public:
    size_t Dimension() const override { return 4; }
    Embedding Embed(const std::string&) const override {
        std::this_thread::sleep_for(std::chrono::milliseconds(500));
        return Embedding(4, 0.5f);
    }
    std::string Name() const override { return "slow"; }
};

class ShortEmbedder : public IEmbeddingProvider {
public:
    size_t Dimension() const override { return 8; }
    Embedding Embed(const std::string&) const override { return Embedding(3, 1.0f); }
    std::string Name() const override { return "short"; }
};

class FixedSummarizer : public ISummarizer {
public:
    std::string Summarize(const std::string&, const std::vector<RankedCandidate>& candidates,
                          const std::vector<Insight>&) const override {
        return "custom summary of " + std::to_string(candidates.size());
    }
};

RecordContent Content(const std::string& text, const std::string& category = "note") {
    RecordContent content;
    content.text = text;
    content.category = category;
    return content;
}

class MemoryServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        store = std::make_shared<MemoryBackend>(MemoryBackend::Config{});
        service = std::make_unique<MemoryService>(store, std::make_shared<HashingEmbedder>());
    }

    /// Typical knee history: a recent symptom, an old recommendation, an unrelated entry
    void IngestKneeHistory() {
        recent_id = service->Ingest("p1", Content("Knee pain after running", "symptom"), DaysAgo(10));
        old_id = service->Ingest("p1",
                                 Content("Doctor recommended physical therapy for knee pain.",
                                         "doctor_note"),
                                 DaysAgo(400));
        flu_id = service->Ingest("p1", Content("Flu vaccination", "vaccination"), DaysAgo(20));
    }

    QueryRequest KneeQuery() {
        QueryRequest request;
        request.owner_id = "p1";
        request.query_text = "knee pain";
        request.as_of = ReferenceTime();
        return request;
    }

    std::shared_ptr<MemoryBackend> store;
    std::unique_ptr<MemoryService> service;
    RecordID recent_id;
    RecordID old_id;
    RecordID flu_id;
};

// ============================================================================
// Construction
// ============================================================================

TEST_F(MemoryServiceTest, RequiresStoreAndEmbedder) {
    std::shared_ptr<RecordStore> no_store;
    EXPECT_THROW(MemoryService bad(no_store, std::make_shared<HashingEmbedder>()),
                 std::invalid_argument);
    EXPECT_THROW(MemoryService bad(store, nullptr), std::invalid_argument);
}

// ============================================================================
// Ingest
// ============================================================================

TEST_F(MemoryServiceTest, IngestStoresFreshRecord) {
    RecordID id = service->Ingest("p1", Content("Knee pain after running", "symptom"), DaysAgo(3));

    Record record = service->GetRecord(id);
    EXPECT_EQ("p1", record.GetOwnerID());
    EXPECT_EQ("Knee pain after running", record.GetContent().text);
    EXPECT_EQ("symptom", record.GetContent().category);
    EXPECT_EQ(DaysAgo(3), record.GetCreatedAt());
    EXPECT_EQ(384u, record.GetEmbedding().size());
    EXPECT_EQ(0u, record.GetAccessCount());
    EXPECT_DOUBLE_EQ(1.0, record.GetMemoryWeight());
    EXPECT_EQ(0u, record.GetReinforcementLevel());
}

TEST_F(MemoryServiceTest, IngestAssignsDistinctIds) {
    RecordID a = service->Ingest("p1", Content("first"));
    RecordID b = service->Ingest("p1", Content("first"));
    EXPECT_NE(a, b);
    EXPECT_EQ(2u, store->CountByOwner("p1"));
}

TEST_F(MemoryServiceTest, IngestRejectsBadInput) {
    EXPECT_THROW(service->Ingest("p1", Content("   ")), ValidationError);
    EXPECT_THROW(service->Ingest("bad owner", Content("text")), ValidationError);
    EXPECT_THROW(service->Ingest("", Content("text")), ValidationError);
    EXPECT_EQ(0u, store->Count());
}

TEST_F(MemoryServiceTest, IngestTimesOutOnSlowEmbedder) {
    ServiceConfig config;
    config.pipeline.collaborator_timeout = std::chrono::milliseconds(50);
    MemoryService slow(store, std::make_shared<SlowEmbedder>(), config);

    EXPECT_THROW(slow.Ingest("p1", Content("text")), CollaboratorTimeoutError);
    EXPECT_EQ(0u, store->Count());
}

TEST_F(MemoryServiceTest, IngestRejectsWrongDimension) {
    MemoryService broken(store, std::make_shared<ShortEmbedder>());
    EXPECT_THROW(broken.Ingest("p1", Content("text")), StorageError);
}

// ============================================================================
// Query
// ============================================================================

TEST_F(MemoryServiceTest, QueryRanksReinforcesAndFindsInsight) {
    IngestKneeHistory();

    QueryOutcome outcome = service->Query(KneeQuery());

    EXPECT_EQ(QueryStatus::ACCEPTED, outcome.status);
    ASSERT_EQ(2u, outcome.result.ranked_candidates.size());
    EXPECT_EQ(recent_id, outcome.result.ranked_candidates[0].record_id);
    EXPECT_EQ(old_id, outcome.result.ranked_candidates[1].record_id);

    ASSERT_EQ(1u, outcome.result.insights.size());
    EXPECT_EQ(old_id, outcome.result.insights[0].source_record_id);
    EXPECT_EQ("Unfollowed recommendation from 13 months ago: physical therapy for knee pain.",
              outcome.result.insights[0].text);

    EXPECT_EQ(1u, service->GetRecord(recent_id).GetAccessCount());
    EXPECT_EQ(1u, service->GetRecord(old_id).GetAccessCount());
    EXPECT_EQ(0u, service->GetRecord(flu_id).GetAccessCount());
}

TEST_F(MemoryServiceTest, QueryForUnknownOwnerIsEmptyNotAnError) {
    QueryRequest request = KneeQuery();
    request.owner_id = "nobody";

    QueryOutcome outcome = service->Query(request);

    EXPECT_EQ(QueryStatus::ACCEPTED, outcome.status);
    EXPECT_TRUE(outcome.result.ranked_candidates.empty());
    ASSERT_TRUE(outcome.result.summary.has_value());
}

TEST_F(MemoryServiceTest, CustomCollaboratorIsUsed) {
    ServiceCollaborators collaborators;
    collaborators.summarizer = std::make_shared<FixedSummarizer>();
    MemoryService custom(store, std::make_shared<HashingEmbedder>(), ServiceConfig{}, collaborators);
    custom.Ingest("p1", Content("Knee pain after running"), DaysAgo(10));

    QueryOutcome outcome = custom.Query(KneeQuery());

    ASSERT_TRUE(outcome.result.summary.has_value());
    EXPECT_EQ("custom summary of 1", *outcome.result.summary);
}

// ============================================================================
// Maintenance and purge
// ============================================================================

TEST_F(MemoryServiceTest, MaintainDecaysOnlyOldRecords) {
    IngestKneeHistory();

    DecayReport report = service->Maintain("p1", ReferenceTime());

    EXPECT_EQ(3u, report.examined);
    EXPECT_EQ(1u, report.decayed_count);
    EXPECT_EQ(2u, report.skipped_young);
    EXPECT_NEAR(0.965, service->GetRecord(old_id).GetMemoryWeight(), 1e-9);
    EXPECT_DOUBLE_EQ(1.0, service->GetRecord(recent_id).GetMemoryWeight());
}

TEST_F(MemoryServiceTest, MaintainTwiceWithDefaultTimeDecaysOnce) {
    RecordID id = service->Ingest("p1", Content("Annual physical exam", "report"),
                                  Timestamp::Now().PlusDays(-730));

    DecayReport first = service->Maintain("p1");
    double after_first = service->GetRecord(id).GetMemoryWeight();
    DecayReport second = service->Maintain("p1");

    EXPECT_EQ(1u, first.decayed_count);
    EXPECT_NEAR(0.635, after_first, 1e-9);
    EXPECT_EQ(0u, second.decayed_count);
    EXPECT_EQ(1u, second.skipped_current);
    EXPECT_DOUBLE_EQ(after_first, service->GetRecord(id).GetMemoryWeight());
}

TEST_F(MemoryServiceTest, MaintainValidatesOwner) {
    EXPECT_THROW(service->Maintain("bad owner"), ValidationError);
}

TEST_F(MemoryServiceTest, PurgeIsCompleteAndIdempotent) {
    IngestKneeHistory();
    RecordID other = service->Ingest("p2", Content("Knee pain"), DaysAgo(5));

    EXPECT_EQ(3u, service->Purge("p1"));
    EXPECT_EQ(0u, service->Purge("p1"));

    EXPECT_TRUE(service->Timeline("p1").empty());
    EXPECT_THROW(service->GetRecord(recent_id), NotFoundError);

    QueryOutcome outcome = service->Query(KneeQuery());
    EXPECT_TRUE(outcome.result.ranked_candidates.empty());

    EXPECT_NO_THROW(service->GetRecord(other));
}

// ============================================================================
// History access
// ============================================================================

TEST_F(MemoryServiceTest, TimelineIsChronologicalAndBounded) {
    IngestKneeHistory();

    auto all = service->Timeline("p1");
    ASSERT_EQ(3u, all.size());
    EXPECT_EQ(old_id, all[0].GetID());
    EXPECT_EQ(flu_id, all[1].GetID());
    EXPECT_EQ(recent_id, all[2].GetID());

    auto recent_only = service->Timeline("p1", DaysAgo(30));
    EXPECT_EQ(2u, recent_only.size());

    auto window = service->Timeline("p1", DaysAgo(500), DaysAgo(100));
    ASSERT_EQ(1u, window.size());
    EXPECT_EQ(old_id, window[0].GetID());
}

TEST_F(MemoryServiceTest, SummaryDescribesHistory) {
    IngestKneeHistory();

    MemorySummary summary = service->Summary("p1", ReferenceTime());

    EXPECT_EQ("p1", summary.owner_id);
    EXPECT_EQ(3u, summary.total_records);
    EXPECT_EQ(1u, summary.records_by_category["symptom"]);
    EXPECT_EQ(390, summary.span_days);
    EXPECT_NE("empty", summary.health.status);
}

TEST_F(MemoryServiceTest, SummaryIncludesTimelineInsights) {
    IngestKneeHistory();

    MemorySummary summary = service->Summary("p1", ReferenceTime());

    ASSERT_EQ(1u, summary.timeline_insights.size());
    EXPECT_EQ("documentation", summary.timeline_insights[0].type);
}

TEST_F(MemoryServiceTest, SymptomProgressionTracksMentionsInWindow) {
    IngestKneeHistory();
    service->Ingest("p1", Content("Knee pain flared up again", "symptom"), DaysAgo(40));
    service->Ingest("p2", Content("Knee pain", "symptom"), DaysAgo(15));

    SymptomProgression year =
        service->SymptomProgressionFor("p1", "Knee Pain", 365, ReferenceTime());
    EXPECT_EQ(2u, year.occurrences);
    EXPECT_EQ("isolated", year.trend);
    ASSERT_TRUE(year.first_occurrence.has_value());
    EXPECT_EQ(DaysAgo(40), *year.first_occurrence);
    EXPECT_DOUBLE_EQ(15.0, year.average_frequency_days);

    SymptomProgression longer =
        service->SymptomProgressionFor("p1", "knee pain", 730, ReferenceTime());
    EXPECT_EQ(3u, longer.occurrences);
    EXPECT_EQ("recurring", longer.trend);
    EXPECT_EQ(old_id, longer.timeline.front().record_id);
}

TEST_F(MemoryServiceTest, SymptomProgressionDoesNotReinforce) {
    IngestKneeHistory();
    service->SymptomProgressionFor("p1", "knee pain", 730, ReferenceTime());
    EXPECT_EQ(0u, service->GetRecord(recent_id).GetAccessCount());
    EXPECT_EQ(0u, service->GetRecord(old_id).GetAccessCount());
}

TEST_F(MemoryServiceTest, SymptomProgressionValidatesInput) {
    EXPECT_THROW(service->SymptomProgressionFor("bad owner", "knee pain"), ValidationError);
    EXPECT_THROW(service->SymptomProgressionFor("p1", "  "), ValidationError);
    EXPECT_THROW(service->SymptomProgressionFor("p1", "knee pain", 0), ValidationError);
}

TEST_F(MemoryServiceTest, ServicesOverSeparateStoresAreIndependent) {
    auto other_store = std::make_shared<MemoryBackend>(MemoryBackend::Config{});
    MemoryService other(other_store, std::make_shared<HashingEmbedder>());

    IngestKneeHistory();

    QueryOutcome outcome = other.Query(KneeQuery());
    EXPECT_TRUE(outcome.result.ranked_candidates.empty());
    EXPECT_EQ(0u, other_store->Count());
}

} // namespace
} // namespace careledger
