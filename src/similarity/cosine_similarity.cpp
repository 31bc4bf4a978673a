// File: src/similarity/cosine_similarity.cpp
#include "similarity/cosine_similarity.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace careledger {

namespace {

void CheckDimensions(const Embedding& a, const Embedding& b) {
    if (a.size() != b.size()) {
        throw std::invalid_argument("Embedding dimension mismatch: " +
                                    std::to_string(a.size()) + " vs " +
                                    std::to_string(b.size()));
    }
}

} // namespace

float DotProduct(const Embedding& a, const Embedding& b) {
    CheckDimensions(a, b);

    // Accumulate in double
    double sum = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        sum += static_cast<double>(a[i]) * b[i];
    }
    return static_cast<float>(sum);
}

float L2Norm(const Embedding& v) {
    double sum = 0.0;
    for (float x : v) {
        sum += static_cast<double>(x) * x;
    }
    return static_cast<float>(std::sqrt(sum));
}

void NormalizeInPlace(Embedding& v) {
    float norm = L2Norm(v);
    if (norm <= 0.0f) {
        return;
    }
    for (float& x : v) {
        x /= norm;
    }
}

float CosineSimilarity(const Embedding& a, const Embedding& b) {
    CheckDimensions(a, b);

    double dot = 0.0;
    double norm_a = 0.0;
    double norm_b = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        dot += static_cast<double>(a[i]) * b[i];
        norm_a += static_cast<double>(a[i]) * a[i];
        norm_b += static_cast<double>(b[i]) * b[i];
    }

    if (norm_a <= 0.0 || norm_b <= 0.0) {
        return 0.0f;
    }

    double cosine = dot / (std::sqrt(norm_a) * std::sqrt(norm_b));
    return static_cast<float>(std::clamp(cosine, -1.0, 1.0));
}

} // namespace careledger
