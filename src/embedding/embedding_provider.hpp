// File: src/embedding/embedding_provider.hpp
#pragma once

#include "core/types.hpp"
#include <string>

namespace careledger {

/// Maps raw content to a fixed-length numeric vector
///
/// Implementations must be deterministic for a given model version: the same
/// text always produces the same vector, and every vector has Dimension()
/// entries. Embed() may block (remote models); callers bound it with a
/// deadline.
class IEmbeddingProvider {
public:
    virtual ~IEmbeddingProvider() = default;

    /// Length of every vector this provider returns
    virtual size_t Dimension() const = 0;

    /// Embed a piece of text
    /// @throws std::runtime_error if the provider cannot produce a vector
    virtual Embedding Embed(const std::string& text) const = 0;

    /// Model name and version, for logs
    virtual std::string Name() const = 0;
};

} // namespace careledger
