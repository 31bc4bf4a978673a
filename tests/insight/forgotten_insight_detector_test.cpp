// File: tests/insight/forgotten_insight_detector_test.cpp
#include "insight/forgotten_insight_detector.hpp"
#include "storage/memory_backend.hpp"
#include "../support/record_fixtures.hpp"
#include <gtest/gtest.h>

namespace careledger {
namespace {

using testing_support::MakeScoredRecord;
using testing_support::QueryAxis;
using testing_support::ReferenceTime;

class ForgottenInsightDetectorTest : public ::testing::Test {
protected:
    void SetUp() override {
        store = std::make_shared<MemoryBackend>(MemoryBackend::Config{});
        detector = std::make_unique<ForgottenInsightDetector>(store);
    }

    /// Store a record and return it as a ranked candidate
    RankedCandidate Candidate(const std::string& text, int64_t age_days,
                              const std::string& owner = "p") {
        Record record = MakeScoredRecord(owner, 0.9f, age_days, text);
        EXPECT_TRUE(store->Store(record));
        return TimeWeightedRanker::Score(record, QueryAxis(), 0.3, ReferenceTime(), 180);
    }

    std::shared_ptr<MemoryBackend> store;
    std::unique_ptr<ForgottenInsightDetector> detector;
};

// ============================================================================
// Action Extraction
// ============================================================================

TEST_F(ForgottenInsightDetectorTest, ExtractsActionAfterMarker) {
    std::string marker;
    EXPECT_EQ("physical therapy for knee pain",
              detector->ExtractAction("Doctor recommended physical therapy for knee pain.", &marker));
    EXPECT_EQ("recommended", marker);
}

TEST_F(ForgottenInsightDetectorTest, ExtractionStopsAtClauseEndAndDropsFiller) {
    EXPECT_EQ("low sodium diet",
              detector->ExtractAction("Cardiologist advised the patient to start a low sodium diet; "
                                      "blood pressure 150/95."));
}

TEST_F(ForgottenInsightDetectorTest, MarkersAreCaseInsensitive) {
    EXPECT_EQ("dermatologist",
              detector->ExtractAction("REFERRED to dermatologist, rash unchanged"));
}

TEST_F(ForgottenInsightDetectorTest, EarliestMarkerWins) {
    std::string marker;
    detector->ExtractAction("Suggested sleep study; also recommended blood work.", &marker);
    EXPECT_EQ("suggested", marker);
}

TEST_F(ForgottenInsightDetectorTest, NoMarkerMeansNoAction) {
    EXPECT_EQ("", detector->ExtractAction("Knee pain after running."));
}

TEST_F(ForgottenInsightDetectorTest, ActionIsCappedInLength) {
    std::string action = detector->ExtractAction(
        "Recommended one two three four five six seven eight nine ten.");
    EXPECT_EQ("one two three four five six seven eight", action);
}

TEST_F(ForgottenInsightDetectorTest, MentionsActionByPhraseOrTopicWords) {
    EXPECT_TRUE(ForgottenInsightDetector::MentionsAction(
        "Started physical therapy for knee pain today", "physical therapy for knee pain"));
    EXPECT_TRUE(ForgottenInsightDetector::MentionsAction(
        "First Physical Therapy session went well", "physical therapy for knee pain"));
    EXPECT_FALSE(ForgottenInsightDetector::MentionsAction(
        "Knee pain is worse", "physical therapy for knee pain"));
    EXPECT_FALSE(ForgottenInsightDetector::MentionsAction("anything", ""));
}

TEST_F(ForgottenInsightDetectorTest, SignificantWordsStopAtTopicBreak) {
    auto words = ForgottenInsightDetector::SignificantWords("physical therapy for knee pain");
    ASSERT_EQ(2u, words.size());
    EXPECT_EQ("physical", words[0]);
    EXPECT_EQ("therapy", words[1]);
}

TEST_F(ForgottenInsightDetectorTest, InsightTextFormat) {
    EXPECT_EQ("Unfollowed recommendation from 13 months ago: physical therapy for knee pain.",
              ForgottenInsightDetector::FormatInsight(13, "physical therapy for knee pain"));
    EXPECT_EQ("Unfollowed recommendation from 1 month ago: x ray.",
              ForgottenInsightDetector::FormatInsight(1, "x ray"));
}

// ============================================================================
// Detection
// ============================================================================

TEST_F(ForgottenInsightDetectorTest, UnfollowedRecommendationBecomesInsight) {
    RankedCandidate old = Candidate("Doctor recommended physical therapy for knee pain.", 400);
    RankedCandidate recent = Candidate("Knee pain again after walking.", 5);

    auto insights = detector->Detect("p", {recent}, {old}, "knee pain", ReferenceTime());

    ASSERT_EQ(1u, insights.size());
    EXPECT_EQ(old.record_id, insights[0].source_record_id);
    EXPECT_EQ(400, insights[0].age_days);
    EXPECT_EQ(13, insights[0].months_ago);
    EXPECT_EQ("recommended", insights[0].marker);
    EXPECT_EQ("physical therapy for knee pain", insights[0].action);
    EXPECT_NE(std::string::npos, insights[0].text.find("13 months"));
    EXPECT_NE(std::string::npos, insights[0].text.find("physical therapy"));
}

TEST_F(ForgottenInsightDetectorTest, FollowUpInRecentCandidatesSuppressesInsight) {
    RankedCandidate old = Candidate("Doctor recommended physical therapy for knee pain.", 400);
    RankedCandidate recent = Candidate("Started physical therapy twice a week.", 20);

    EXPECT_TRUE(detector->Detect("p", {recent}, {old}, "knee", ReferenceTime()).empty());
}

TEST_F(ForgottenInsightDetectorTest, FollowUpAnywhereLaterInHistorySuppressesInsight) {
    RankedCandidate old = Candidate("Doctor recommended physical therapy for knee pain.", 400);
    // Stored but not among the ranked candidates
    Candidate("Completed six weeks of physical therapy.", 300);

    EXPECT_TRUE(detector->Detect("p", {}, {old}, "knee", ReferenceTime()).empty());
}

TEST_F(ForgottenInsightDetectorTest, EarlierMentionDoesNotCountAsFollowUp) {
    Candidate("Asked about physical therapy options.", 500);
    RankedCandidate old = Candidate("Doctor recommended physical therapy for knee pain.", 400);

    EXPECT_EQ(1u, detector->Detect("p", {}, {old}, "knee", ReferenceTime()).size());
}

TEST_F(ForgottenInsightDetectorTest, OtherOwnersRecordsAreIgnored) {
    RankedCandidate old = Candidate("Doctor recommended physical therapy for knee pain.", 400);
    Candidate("Started physical therapy.", 100, "someone-else");

    EXPECT_EQ(1u, detector->Detect("p", {}, {old}, "knee", ReferenceTime()).size());
}

TEST_F(ForgottenInsightDetectorTest, OnlyOldCandidatesAreConsidered) {
    RankedCandidate recent = Candidate("Doctor recommended physical therapy.", 30);
    EXPECT_TRUE(detector->Detect("p", {recent}, {}, "knee", ReferenceTime()).empty());
}

TEST_F(ForgottenInsightDetectorTest, InsightsAreOldestFirstDeduplicatedAndCapped) {
    RankedCandidate a = Candidate("Recommended a sleep study.", 300);
    RankedCandidate b = Candidate("Referred to cardiology for palpitations.", 700);
    RankedCandidate c = Candidate("Recommended a sleep study.", 500);
    RankedCandidate d = Candidate("Advised daily blood pressure log.", 600);
    RankedCandidate e = Candidate("Suggested an eye exam.", 400);

    auto insights = detector->Detect("p", {}, {a, b, c, d, e}, "", ReferenceTime());

    ASSERT_EQ(3u, insights.size());
    EXPECT_EQ(b.record_id, insights[0].source_record_id);
    EXPECT_EQ(d.record_id, insights[1].source_record_id);
    EXPECT_EQ(c.record_id, insights[2].source_record_id);
}

TEST_F(ForgottenInsightDetectorTest, RepeatsActionComparesTopicWords) {
    EXPECT_TRUE(ForgottenInsightDetector::RepeatsAction(
        "physical therapy twice weekly", "physical therapy for knee pain"));
    EXPECT_TRUE(ForgottenInsightDetector::RepeatsAction("sleep study", "sleep study"));
    EXPECT_FALSE(ForgottenInsightDetector::RepeatsAction(
        "knee brace", "physical therapy for knee pain"));
    EXPECT_FALSE(ForgottenInsightDetector::RepeatsAction("", "physical therapy"));
}

TEST_F(ForgottenInsightDetectorTest, RewordedRepeatIsNotFollowUp) {
    RankedCandidate old = Candidate("Doctor recommended physical therapy for knee pain.", 400);
    RankedCandidate repeat = Candidate("Doctor recommended physical therapy twice weekly.", 20);
    Candidate("Recommended physical therapy again at the annual visit.", 250);

    auto insights = detector->Detect("p", {repeat}, {old}, "knee", ReferenceTime());

    ASSERT_EQ(1u, insights.size());
    EXPECT_EQ(old.record_id, insights[0].source_record_id);
    EXPECT_FALSE(detector->IsFollowUp("Doctor recommended physical therapy twice weekly.",
                                      "physical therapy for knee pain"));
    EXPECT_TRUE(detector->IsFollowUp("Started physical therapy twice weekly.",
                                     "physical therapy for knee pain"));
}

TEST_F(ForgottenInsightDetectorTest, RewordedRepeatsYieldOneInsight) {
    RankedCandidate first = Candidate("Doctor recommended physical therapy for knee pain.", 500);
    RankedCandidate second = Candidate("Recommended physical therapy twice weekly.", 300);

    auto insights = detector->Detect("p", {}, {second, first}, "knee", ReferenceTime());

    ASSERT_EQ(1u, insights.size());
    EXPECT_EQ(first.record_id, insights[0].source_record_id);
}

TEST_F(ForgottenInsightDetectorTest, CustomMarkers) {
    ForgottenInsightDetector::Config config;
    config.markers = {"Prescribed"};
    ForgottenInsightDetector custom(store, config);

    RankedCandidate old = Candidate("Prescribed orthotic insoles.", 400);
    auto insights = custom.Detect("p", {}, {old}, "", ReferenceTime());

    ASSERT_EQ(1u, insights.size());
    EXPECT_EQ("prescribed", insights[0].marker);
    EXPECT_EQ("orthotic insoles", insights[0].action);
}

TEST_F(ForgottenInsightDetectorTest, RequiresStore) {
    EXPECT_THROW(ForgottenInsightDetector bad(nullptr), std::invalid_argument);
}

} // namespace
} // namespace careledger
