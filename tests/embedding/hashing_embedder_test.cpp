// File: tests/embedding/hashing_embedder_test.cpp
#include "embedding/hashing_embedder.hpp"
#include "similarity/cosine_similarity.hpp"
#include <gtest/gtest.h>

namespace careledger {
namespace {

TEST(HashingEmbedderTest, ProducesConfiguredDimension) {
    HashingEmbedder embedder;
    EXPECT_EQ(384u, embedder.Dimension());
    EXPECT_EQ(384u, embedder.Embed("knee pain").size());
    EXPECT_EQ("hashing-fnv1a-384", embedder.Name());

    HashingEmbedder::Config config;
    config.dimension = 64;
    HashingEmbedder small(config);
    EXPECT_EQ(64u, small.Embed("knee pain").size());
}

TEST(HashingEmbedderTest, ZeroDimensionRejected) {
    HashingEmbedder::Config config;
    config.dimension = 0;
    EXPECT_THROW(HashingEmbedder embedder(config), std::invalid_argument);
}

TEST(HashingEmbedderTest, EmbeddingIsDeterministic) {
    HashingEmbedder a;
    HashingEmbedder b;
    EXPECT_EQ(a.Embed("Recurring headache in the morning"),
              b.Embed("Recurring headache in the morning"));
}

TEST(HashingEmbedderTest, EmbeddingIsUnitLength) {
    HashingEmbedder embedder;
    EXPECT_NEAR(1.0f, L2Norm(embedder.Embed("Blood pressure checked at clinic")), 1e-5f);
}

TEST(HashingEmbedderTest, TextWithoutTokensGivesZeroVector) {
    HashingEmbedder embedder;
    Embedding v = embedder.Embed("the and of");
    EXPECT_FLOAT_EQ(0.0f, L2Norm(v));
}

TEST(HashingEmbedderTest, TokenizeLowercasesAndDropsStopWords) {
    HashingEmbedder embedder;
    auto tokens = embedder.Tokenize("The Knee, and THE pain!");
    ASSERT_EQ(2u, tokens.size());
    EXPECT_EQ("knee", tokens[0]);
    EXPECT_EQ("pain", tokens[1]);

    HashingEmbedder::Config keep;
    keep.remove_stop_words = false;
    EXPECT_EQ(5u, HashingEmbedder(keep).Tokenize("The Knee, and THE pain!").size());
}

TEST(HashingEmbedderTest, CaseAndPunctuationDoNotMatter) {
    HashingEmbedder embedder;
    EXPECT_NEAR(1.0f, CosineSimilarity(embedder.Embed("Knee pain."),
                                       embedder.Embed("knee   PAIN")), 1e-6f);
}

TEST(HashingEmbedderTest, SharedVocabularyScoresHigherThanUnrelatedText) {
    HashingEmbedder embedder;
    Embedding query = embedder.Embed("knee pain after running");
    Embedding related = embedder.Embed("Sharp knee pain after a long run, worse after running");
    Embedding unrelated = embedder.Embed("Prescription refill for thyroid medication");

    EXPECT_GT(CosineSimilarity(query, related), CosineSimilarity(query, unrelated));
    EXPECT_GT(CosineSimilarity(query, related), 0.3f);
}

TEST(HashingEmbedderTest, Fnv1aKnownValues) {
    EXPECT_EQ(14695981039346656037ULL, HashingEmbedder::Fnv1a(""));
    EXPECT_EQ(0xaf63dc4c8601ec8cULL, HashingEmbedder::Fnv1a("a"));
}

} // namespace
} // namespace careledger
