// File: src/similarity/cosine_similarity.hpp
#pragma once

#include "core/types.hpp"

namespace careledger {

/// Dot product of two embeddings
/// @throws std::invalid_argument if dimensions differ
float DotProduct(const Embedding& a, const Embedding& b);

/// Euclidean (L2) norm
float L2Norm(const Embedding& v);

/// Scale to unit length in place; a zero vector is left unchanged
void NormalizeInPlace(Embedding& v);

/// Cosine similarity in [-1, 1]
///
/// Returns 0.0 when either vector has zero length. The result is clamped to
/// [-1, 1] to absorb floating point drift.
/// @throws std::invalid_argument if dimensions differ
float CosineSimilarity(const Embedding& a, const Embedding& b);

} // namespace careledger
