// File: src/pipeline/template_summarizer.hpp
#pragma once

#include "pipeline/collaborators.hpp"

namespace careledger {

/// Deterministic, template-based summary of ranked records
///
/// Describes how many related records were found, the closest few (type,
/// date, age and similarity band) and how many older records carry open
/// follow-up items. Stands in for a model-backed summarizer.
class TemplateSummarizer : public ISummarizer {
public:
    struct Config {
        /// Candidates described individually
        size_t max_described{3};
    };

    TemplateSummarizer();
    explicit TemplateSummarizer(const Config& config);

    std::string Summarize(const std::string& query_text,
                          const std::vector<RankedCandidate>& candidates,
                          const std::vector<Insight>& insights) const override;

    /// "high" (>= 0.8), "moderate" (>= 0.6) or "low"
    static const char* SimilarityBand(float similarity);

private:
    Config config_;
};

} // namespace careledger
