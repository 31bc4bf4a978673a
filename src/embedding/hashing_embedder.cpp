// File: src/embedding/hashing_embedder.cpp
#include "embedding/hashing_embedder.hpp"
#include "similarity/cosine_similarity.hpp"
#include <cctype>
#include <stdexcept>
#include <unordered_set>

namespace careledger {

namespace {

constexpr uint64_t kFnvOffsetBasis = 14695981039346656037ULL;
constexpr uint64_t kFnvPrime = 1099511628211ULL;

const std::unordered_set<std::string>& StopWords() {
    static const std::unordered_set<std::string> words = {
        "a", "an", "the", "and", "or", "but", "of", "to", "in", "on", "at",
        "for", "with", "by", "from", "is", "are", "was", "were", "be", "been",
        "it", "its", "this", "that", "these", "those", "as", "so", "if",
        "i", "me", "my", "we", "our", "you", "your", "he", "she", "his",
        "her", "they", "them", "their", "has", "have", "had", "do", "does",
        "did", "not", "no", "any", "some", "about", "into", "than", "then",
    };
    return words;
}

} // namespace

HashingEmbedder::HashingEmbedder()
    : HashingEmbedder(Config{}) {
}

HashingEmbedder::HashingEmbedder(const Config& config)
    : config_(config) {
    if (config_.dimension == 0) {
        throw std::invalid_argument("Embedding dimension must be positive");
    }
}

std::string HashingEmbedder::Name() const {
    return "hashing-fnv1a-" + std::to_string(config_.dimension);
}

uint64_t HashingEmbedder::Fnv1a(const std::string& value) {
    uint64_t hash = kFnvOffsetBasis;
    for (unsigned char c : value) {
        hash ^= c;
        hash *= kFnvPrime;
    }
    return hash;
}

std::vector<std::string> HashingEmbedder::Tokenize(const std::string& text) const {
    std::vector<std::string> tokens;
    std::string current;

    auto flush = [&]() {
        if (current.empty()) {
            return;
        }
        if (!config_.remove_stop_words || StopWords().count(current) == 0) {
            tokens.push_back(current);
        }
        current.clear();
    };

    for (unsigned char c : text) {
        if (std::isalnum(c)) {
            current.push_back(static_cast<char>(std::tolower(c)));
        } else {
            flush();
        }
    }
    flush();

    return tokens;
}

void HashingEmbedder::AddFeature(Embedding& vec, const std::string& feature, float weight) const {
    uint64_t hash = Fnv1a(feature);
    size_t bucket = static_cast<size_t>(hash % config_.dimension);
    float sign = ((hash >> 63) & 1ULL) ? -1.0f : 1.0f;
    vec[bucket] += sign * weight;
}

Embedding HashingEmbedder::Embed(const std::string& text) const {
    Embedding vec(config_.dimension, 0.0f);
    std::vector<std::string> tokens = Tokenize(text);

    for (size_t i = 0; i < tokens.size(); ++i) {
        AddFeature(vec, tokens[i], config_.token_weight);
        if (i + 1 < tokens.size()) {
            AddFeature(vec, tokens[i] + " " + tokens[i + 1], config_.bigram_weight);
        }
    }

    NormalizeInPlace(vec);
    return vec;
}

} // namespace careledger
