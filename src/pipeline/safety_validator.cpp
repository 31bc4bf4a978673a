// File: src/pipeline/safety_validator.cpp
#include "pipeline/safety_validator.hpp"
#include "core/logging.hpp"
#include <algorithm>
#include <cctype>
#include <spdlog/fmt/fmt.h>

namespace careledger {

namespace {

std::string ToLower(const std::string& text) {
    std::string lowered = text;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered;
}

// Split after '.', '!' or '?', keeping the terminator with its sentence
std::vector<std::string> SplitSentences(const std::string& text) {
    std::vector<std::string> sentences;
    std::string current;
    for (char c : text) {
        current.push_back(c);
        if (c == '.' || c == '!' || c == '?') {
            sentences.push_back(current);
            current.clear();
        }
    }
    if (!current.empty()) {
        sentences.push_back(current);
    }
    return sentences;
}

SafetyFlag MakeFlag(const std::string& field, const std::string& phrase) {
    SafetyFlag flag;
    flag.field = field;
    flag.phrase = phrase;
    flag.issue = "Potentially diagnostic language detected: '" + phrase + "'";
    return flag;
}

} // namespace

SafetyValidator::SafetyValidator()
    : config_() {
}

SafetyValidator::SafetyValidator(const Config& config)
    : config_(config) {
}

const std::string& SafetyValidator::StandardDisclaimer() {
    static const std::string disclaimer =
        "IMPORTANT: This is a decision support tool, not medical diagnosis. "
        "All information should be discussed with your healthcare provider. "
        "In case of emergency, contact emergency services immediately.";
    return disclaimer;
}

std::vector<std::string> SafetyValidator::FindDiagnosticPhrases(const std::string& text) const {
    std::vector<std::string> found;
    std::string lowered = ToLower(text);
    for (const auto& phrase : config_.diagnostic_phrases) {
        if (lowered.find(ToLower(phrase)) != std::string::npos) {
            found.push_back(phrase);
        }
    }
    return found;
}

std::string SafetyValidator::StripDiagnosticSentences(const std::string& text,
                                                      std::vector<SafetyFlag>& flags) const {
    std::string kept;
    for (const auto& sentence : SplitSentences(text)) {
        auto phrases = FindDiagnosticPhrases(sentence);
        if (phrases.empty()) {
            kept += sentence;
            continue;
        }
        for (const auto& phrase : phrases) {
            flags.push_back(MakeFlag("summary", phrase));
        }
    }

    // Trim the leading space left by a removed first sentence
    size_t first = kept.find_first_not_of(' ');
    return first == std::string::npos ? std::string() : kept.substr(first);
}

EvidenceItem SafetyValidator::BuildEvidence(const RankedCandidate& candidate) const {
    EvidenceItem item;
    item.record_id = candidate.record_id;
    item.date = candidate.created_at.ToDateString();
    item.category = candidate.content.category.empty() ? "unknown" : candidate.content.category;
    item.similarity_score = candidate.similarity_score;

    item.reason = fmt::format("Semantic similarity {:.0f}%, {} days old ({}), memory weight {:.2f}",
                              candidate.similarity_score * 100.0f, candidate.age_days,
                              ToString(candidate.partition), candidate.memory_weight);

    const std::string& text = candidate.content.text;
    if (text.size() > config_.preview_length) {
        item.content_preview = text.substr(0, config_.preview_length) + "...";
    } else {
        item.content_preview = text;
    }
    return item;
}

QueryResult SafetyValidator::Validate(QueryResult result) const {
    result.safety_disclaimer = StandardDisclaimer();

    if (result.summary) {
        result.summary = StripDiagnosticSentences(*result.summary, result.safety_flags);
    }

    if (result.recommendations) {
        std::vector<Recommendation> kept;
        for (auto& recommendation : *result.recommendations) {
            auto phrases = FindDiagnosticPhrases(recommendation.text);
            if (phrases.empty()) {
                kept.push_back(std::move(recommendation));
                continue;
            }
            for (const auto& phrase : phrases) {
                result.safety_flags.push_back(MakeFlag("recommendation", phrase));
            }
        }
        result.recommendations = std::move(kept);
    }

    for (const auto& insight : result.insights) {
        for (const auto& phrase : FindDiagnosticPhrases(insight.text)) {
            result.safety_flags.push_back(MakeFlag("insight", phrase));
        }
    }

    result.evidence.clear();
    result.evidence.reserve(result.ranked_candidates.size());
    for (const auto& candidate : result.ranked_candidates) {
        result.evidence.push_back(BuildEvidence(candidate));
    }

    if (!result.safety_flags.empty()) {
        GetLogger()->warn("Output for {} flagged {} time(s) for diagnostic language",
                          result.owner_id, result.safety_flags.size());
    }

    result.validated = true;
    return result;
}

} // namespace careledger
