// File: src/pipeline/safety_validator.hpp
#pragma once

#include "pipeline/collaborators.hpp"
#include <string>
#include <vector>

namespace careledger {

/// Output validation: disclaimers, diagnostic-language screening, evidence
///
/// Generated text (summary sentences and recommendations) containing a
/// diagnostic phrase is flagged and removed. Insights are record-derived
/// evidence: they are flagged but kept. Ranked candidates, partitions and
/// insights are never touched. Every ranked candidate gets an evidence
/// entry explaining why it was included.
class SafetyValidator : public IOutputValidator {
public:
    struct Config {
        Config() = default;

        /// Case-insensitive phrases treated as diagnostic language
        std::vector<std::string> diagnostic_phrases{
            "you have", "you are diagnosed", "this is definitely",
            "you suffer from", "you are experiencing", "treatment for",
            "take this medication", "prescribe", "medical advice"};

        /// Characters of record content shown in evidence entries
        size_t preview_length{150};
    };

    SafetyValidator();
    explicit SafetyValidator(const Config& config);

    QueryResult Validate(QueryResult result) const override;

    /// Diagnostic phrases contained in `text`
    std::vector<std::string> FindDiagnosticPhrases(const std::string& text) const;

    /// Drop sentences with diagnostic phrases; flags go to `flags`
    std::string StripDiagnosticSentences(const std::string& text,
                                         std::vector<SafetyFlag>& flags) const;

    static const std::string& StandardDisclaimer();

    const Config& GetConfig() const { return config_; }

private:
    Config config_;

    EvidenceItem BuildEvidence(const RankedCandidate& candidate) const;
};

} // namespace careledger
