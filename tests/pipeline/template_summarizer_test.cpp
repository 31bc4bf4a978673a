// File: tests/pipeline/template_summarizer_test.cpp
#include "pipeline/template_summarizer.hpp"
#include "../support/record_fixtures.hpp"
#include <gtest/gtest.h>

namespace careledger {
namespace {

using testing_support::MakeScoredRecord;
using testing_support::QueryAxis;
using testing_support::ReferenceTime;

RankedCandidate Candidate(float cosine, int64_t age_days) {
    Record record = MakeScoredRecord("p", cosine, age_days);
    return TimeWeightedRanker::Score(record, QueryAxis(), 0.3, ReferenceTime(), 180);
}

TEST(TemplateSummarizerTest, NoCandidates) {
    TemplateSummarizer summarizer;
    EXPECT_EQ("No earlier records related to \"knee\" were found.",
              summarizer.Summarize("knee", {}, {}));
}

TEST(TemplateSummarizerTest, CountsPartitionsAndDescribesClosest) {
    TemplateSummarizer summarizer;
    std::string summary = summarizer.Summarize(
        "knee", {Candidate(0.9f, 10), Candidate(0.65f, 400)}, {});

    EXPECT_NE(std::string::npos,
              summary.find("Found 2 earlier records related to \"knee\": 1 recent and 1 older."));
    EXPECT_NE(std::string::npos, summary.find("The closest match, a note from"));
    EXPECT_NE(std::string::npos, summary.find("(10 days ago) shows high similarity."));
    EXPECT_NE(std::string::npos, summary.find("(400 days ago) shows moderate similarity."));
}

TEST(TemplateSummarizerTest, DescribesAtMostConfiguredCount) {
    TemplateSummarizer::Config config;
    config.max_described = 1;
    TemplateSummarizer summarizer(config);

    std::string summary = summarizer.Summarize(
        "knee", {Candidate(0.9f, 10), Candidate(0.8f, 20)}, {});
    EXPECT_EQ(std::string::npos, summary.find("(20 days ago)"));
}

TEST(TemplateSummarizerTest, MentionsOpenFollowUps) {
    TemplateSummarizer summarizer;
    Insight insight;
    std::string summary = summarizer.Summarize("knee", {Candidate(0.9f, 400)}, {insight});
    EXPECT_NE(std::string::npos,
              summary.find("1 older record mentions a follow-up that was not found later."));
}

TEST(TemplateSummarizerTest, SimilarityBands) {
    EXPECT_STREQ("high", TemplateSummarizer::SimilarityBand(0.8f));
    EXPECT_STREQ("moderate", TemplateSummarizer::SimilarityBand(0.6f));
    EXPECT_STREQ("low", TemplateSummarizer::SimilarityBand(0.59f));
}

} // namespace
} // namespace careledger
