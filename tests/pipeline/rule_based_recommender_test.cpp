// File: tests/pipeline/rule_based_recommender_test.cpp
#include "pipeline/rule_based_recommender.hpp"
#include "../support/record_fixtures.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <cctype>

namespace careledger {
namespace {

using testing_support::MakeRecord;
using testing_support::DaysAgo;
using testing_support::QueryAxis;
using testing_support::ReferenceTime;

RankedCandidate Candidate(int64_t age_days, const std::string& category = "note") {
    Record record = MakeRecord("p", "entry", QueryAxis(), DaysAgo(age_days), category);
    return TimeWeightedRanker::Score(record, QueryAxis(), 0.3, ReferenceTime(), 180);
}

bool HasText(const std::vector<std::string>& items, const std::string& fragment) {
    return std::any_of(items.begin(), items.end(), [&fragment](const std::string& item) {
        return item.find(fragment) != std::string::npos;
    });
}

TEST(RuleBasedRecommenderTest, OutputIsInPriorityOrder) {
    RuleBasedRecommender recommender;
    auto recommendations = recommender.Recommend(
        "Knee pain and medication questions",
        {Candidate(10), Candidate(50), Candidate(400)}, {}, ReferenceTime());

    ASSERT_FALSE(recommendations.empty());
    for (size_t i = 1; i < recommendations.size(); ++i) {
        EXPECT_LE(static_cast<int>(recommendations[i - 1].type),
                  static_cast<int>(recommendations[i].type));
    }
    EXPECT_EQ(RecommendationType::DOCTOR_QUESTION, recommendations.front().type);
    EXPECT_LE(recommendations.size(), recommender.GetConfig().max_total);
}

TEST(RuleBasedRecommenderTest, DoctorQuestionsReflectHistory) {
    RuleBasedRecommender recommender;

    auto with_treatment = recommender.DoctorQuestions(
        "knee", {Candidate(10, "treatment")}, {});
    EXPECT_TRUE(HasText(with_treatment, "past 6 months"));
    EXPECT_TRUE(HasText(with_treatment, "previous treatments"));

    auto old_only = recommender.DoctorQuestions("knee", {Candidate(400)}, {Insight{}});
    EXPECT_FALSE(HasText(old_only, "past 6 months"));
    EXPECT_TRUE(HasText(old_only, "older medical records"));
}

TEST(RuleBasedRecommenderTest, QueryKeywordsDriveMonitoring) {
    RuleBasedRecommender recommender;
    auto suggestions = recommender.MonitoringSuggestions("migraine with poor sleep", {});
    EXPECT_TRUE(HasText(suggestions, "symptom journal"));
    EXPECT_TRUE(HasText(suggestions, "headache diary"));
    EXPECT_TRUE(HasText(suggestions, "sleep patterns"));
}

TEST(RuleBasedRecommenderTest, CheckupReminderWhenLatestRecordIsOld) {
    RuleBasedRecommender recommender;
    EXPECT_TRUE(HasText(recommender.Reminders({Candidate(120)}, ReferenceTime()), "check-up"));
    EXPECT_FALSE(HasText(recommender.Reminders({Candidate(120), Candidate(5)}, ReferenceTime()),
                         "check-up"));
    EXPECT_TRUE(recommender.Reminders({}, ReferenceTime()).empty());
}

TEST(RuleBasedRecommenderTest, InformationActionsFromKeywords) {
    RuleBasedRecommender recommender;
    auto actions = recommender.InformationActions("family history of allergy", {});
    EXPECT_TRUE(HasText(actions, "allergies"));
    EXPECT_TRUE(HasText(actions, "family medical history"));
}

TEST(RuleBasedRecommenderTest, NeverUsesDiagnosticLanguage) {
    RuleBasedRecommender recommender;
    auto recommendations = recommender.Recommend(
        "pain symptom headache sleep allergy family medication",
        {Candidate(10, "prescription"), Candidate(20), Candidate(400)}, {Insight{}},
        ReferenceTime());

    for (const auto& recommendation : recommendations) {
        std::string lowered = recommendation.text;
        std::transform(lowered.begin(), lowered.end(), lowered.begin(), ::tolower);
        EXPECT_EQ(std::string::npos, lowered.find("you have"));
        EXPECT_EQ(std::string::npos, lowered.find("diagnosed"));
    }
}

TEST(RuleBasedRecommenderTest, TotalIsCapped) {
    RuleBasedRecommender::Config config;
    config.max_total = 2;
    RuleBasedRecommender recommender(config);
    EXPECT_EQ(2u, recommender.Recommend("pain", {Candidate(10)}, {}, ReferenceTime()).size());
}

} // namespace
} // namespace careledger
