// File: src/embedding/hashing_embedder.hpp
#pragma once

#include "embedding/embedding_provider.hpp"
#include <string>
#include <vector>

namespace careledger {

/// Deterministic feature-hashing text embedder
///
/// Text is lower-cased and split into alphanumeric tokens; common English
/// stop words are dropped. Each remaining token, and each pair of adjacent
/// tokens, is hashed with 64-bit FNV-1a into one of `dimension` buckets with a
/// hash-derived sign. The result is L2-normalized, so cosine similarity
/// between two embeddings measures their shared vocabulary.
///
/// Runs fully offline. Swap in a model-backed IEmbeddingProvider for real
/// semantic similarity.
class HashingEmbedder : public IEmbeddingProvider {
public:
    struct Config {
        /// Output vector length
        size_t dimension{384};

        /// Contribution of a single token
        float token_weight{1.0f};

        /// Contribution of an adjacent token pair
        float bigram_weight{0.5f};

        /// Drop common English stop words before hashing
        bool remove_stop_words{true};
    };

    HashingEmbedder();
    explicit HashingEmbedder(const Config& config);

    size_t Dimension() const override { return config_.dimension; }
    Embedding Embed(const std::string& text) const override;
    std::string Name() const override;

    /// Lower-cased alphanumeric tokens of `text`, stop words removed if enabled
    std::vector<std::string> Tokenize(const std::string& text) const;

    /// 64-bit FNV-1a hash
    static uint64_t Fnv1a(const std::string& value);

private:
    Config config_;

    void AddFeature(Embedding& vec, const std::string& feature, float weight) const;
};

} // namespace careledger
