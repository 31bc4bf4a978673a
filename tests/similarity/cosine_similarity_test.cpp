// File: tests/similarity/cosine_similarity_test.cpp
#include "similarity/cosine_similarity.hpp"
#include <gtest/gtest.h>
#include <cmath>

namespace careledger {
namespace {

TEST(CosineSimilarityTest, IdenticalVectorsScoreOne) {
    Embedding v{0.3f, -0.4f, 1.2f};
    EXPECT_NEAR(1.0f, CosineSimilarity(v, v), 1e-6f);
}

TEST(CosineSimilarityTest, OrthogonalVectorsScoreZero) {
    EXPECT_NEAR(0.0f, CosineSimilarity({1.0f, 0.0f}, {0.0f, 1.0f}), 1e-6f);
}

TEST(CosineSimilarityTest, OppositeVectorsScoreMinusOne) {
    EXPECT_NEAR(-1.0f, CosineSimilarity({1.0f, 2.0f}, {-1.0f, -2.0f}), 1e-6f);
}

TEST(CosineSimilarityTest, IgnoresMagnitude) {
    Embedding a{1.0f, 1.0f, 0.0f};
    Embedding b{10.0f, 10.0f, 0.0f};
    EXPECT_NEAR(1.0f, CosineSimilarity(a, b), 1e-6f);

    Embedding c{1.0f, 0.0f, 0.0f};
    EXPECT_NEAR(1.0f / std::sqrt(2.0f), CosineSimilarity(a, c), 1e-6f);
}

TEST(CosineSimilarityTest, ZeroVectorScoresZero) {
    EXPECT_FLOAT_EQ(0.0f, CosineSimilarity({0.0f, 0.0f}, {1.0f, 0.0f}));
}

TEST(CosineSimilarityTest, DimensionMismatchThrows) {
    EXPECT_THROW(CosineSimilarity({1.0f, 0.0f}, {1.0f, 0.0f, 0.0f}), std::invalid_argument);
    EXPECT_THROW(DotProduct({1.0f}, {1.0f, 2.0f}), std::invalid_argument);
}

TEST(CosineSimilarityTest, DotProductAndNorm) {
    EXPECT_FLOAT_EQ(11.0f, DotProduct({1.0f, 2.0f}, {3.0f, 4.0f}));
    EXPECT_FLOAT_EQ(5.0f, L2Norm({3.0f, 4.0f}));
}

TEST(CosineSimilarityTest, NormalizeInPlaceProducesUnitVector) {
    Embedding v{3.0f, 4.0f};
    NormalizeInPlace(v);
    EXPECT_NEAR(1.0f, L2Norm(v), 1e-6f);
    EXPECT_NEAR(0.6f, v[0], 1e-6f);

    Embedding zero{0.0f, 0.0f};
    NormalizeInPlace(zero);
    EXPECT_FLOAT_EQ(0.0f, zero[0]);
}

} // namespace
} // namespace careledger
