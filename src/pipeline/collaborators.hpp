// File: src/pipeline/collaborators.hpp
#pragma once

#include "pipeline/query_result.hpp"
#include <string>
#include <vector>

namespace careledger {

/// Produces a natural-language explanation of ranked records
///
/// May be slow or remote; the orchestrator calls it off the request thread
/// with a deadline. Implementations must not keep references to the inputs.
class ISummarizer {
public:
    virtual ~ISummarizer() = default;

    /// @throws std::exception on failure; the Summarize stage then degrades
    virtual std::string Summarize(const std::string& query_text,
                                  const std::vector<RankedCandidate>& candidates,
                                  const std::vector<Insight>& insights) const = 0;
};

/// Produces actionable, non-diagnostic suggestions
class IRecommender {
public:
    virtual ~IRecommender() = default;

    /// @throws std::exception on failure; the Recommend stage then degrades
    virtual std::vector<Recommendation> Recommend(const std::string& query_text,
                                                  const std::vector<RankedCandidate>& candidates,
                                                  const std::vector<Insight>& insights,
                                                  Timestamp as_of) const = 0;
};

/// Sanitizes a result before it leaves the pipeline
///
/// May append disclaimers, flag or strip disallowed phrasing in generated
/// text, and attach an evidence trace. Must never remove ranked candidates,
/// partitions, insights or evidence.
class IOutputValidator {
public:
    virtual ~IOutputValidator() = default;

    virtual QueryResult Validate(QueryResult result) const = 0;
};

} // namespace careledger
