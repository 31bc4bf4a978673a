// File: src/pipeline/template_summarizer.cpp
#include "pipeline/template_summarizer.hpp"
#include <spdlog/fmt/fmt.h>
#include <algorithm>

namespace careledger {

TemplateSummarizer::TemplateSummarizer()
    : config_() {
}

TemplateSummarizer::TemplateSummarizer(const Config& config)
    : config_(config) {
}

const char* TemplateSummarizer::SimilarityBand(float similarity) {
    if (similarity >= 0.8f) return "high";
    if (similarity >= 0.6f) return "moderate";
    return "low";
}

std::string TemplateSummarizer::Summarize(const std::string& query_text,
                                          const std::vector<RankedCandidate>& candidates,
                                          const std::vector<Insight>& insights) const {
    if (candidates.empty()) {
        return fmt::format("No earlier records related to \"{}\" were found.", query_text);
    }

    size_t recent = static_cast<size_t>(
        std::count_if(candidates.begin(), candidates.end(),
                      [](const RankedCandidate& c) { return c.partition == Partition::RECENT; }));

    std::string summary = fmt::format(
        "Found {} earlier record{} related to \"{}\": {} recent and {} older.",
        candidates.size(), candidates.size() == 1 ? "" : "s", query_text,
        recent, candidates.size() - recent);

    size_t described = std::min(config_.max_described, candidates.size());
    for (size_t i = 0; i < described; ++i) {
        const auto& c = candidates[i];
        std::string category = c.content.category.empty() ? "record" : c.content.category;
        summary += fmt::format(" {} {} from {} ({} days ago) shows {} similarity.",
                               i == 0 ? "The closest match, a" : "A",
                               category, c.created_at.ToDateString(), c.age_days,
                               SimilarityBand(c.similarity_score));
    }

    if (!insights.empty()) {
        summary += fmt::format(" {} older record{} mention{} a follow-up that was not found later.",
                               insights.size(), insights.size() == 1 ? "" : "s",
                               insights.size() == 1 ? "s" : "");
    }
    return summary;
}

} // namespace careledger
