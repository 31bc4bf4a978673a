// File: src/pipeline/rule_based_recommender.hpp
#pragma once

#include "pipeline/collaborators.hpp"

namespace careledger {

/// Keyword and history driven recommendations
///
/// Produces questions for the doctor, self-monitoring suggestions, follow-up
/// reminders and information-gathering actions from the query wording and
/// the ranked records. Output is ordered by type priority
/// (doctor question, reminder, self-monitoring, information).
class RuleBasedRecommender : public IRecommender {
public:
    struct Config {
        size_t max_doctor_questions{3};
        size_t max_monitoring{3};
        size_t max_reminders{2};
        size_t max_information{2};
        size_t max_total{10};

        /// Latest record older than this triggers a check-up reminder
        int64_t checkup_after_days{90};

        /// Records younger than this count as recent history
        int64_t recent_window_days{180};
    };

    RuleBasedRecommender();
    explicit RuleBasedRecommender(const Config& config);

    std::vector<Recommendation> Recommend(const std::string& query_text,
                                          const std::vector<RankedCandidate>& candidates,
                                          const std::vector<Insight>& insights,
                                          Timestamp as_of) const override;

    std::vector<std::string> DoctorQuestions(const std::string& query_lower,
                                             const std::vector<RankedCandidate>& candidates,
                                             const std::vector<Insight>& insights) const;
    std::vector<std::string> MonitoringSuggestions(const std::string& query_lower,
                                                   const std::vector<RankedCandidate>& candidates) const;
    std::vector<std::string> Reminders(const std::vector<RankedCandidate>& candidates,
                                       Timestamp as_of) const;
    std::vector<std::string> InformationActions(const std::string& query_lower,
                                                const std::vector<RankedCandidate>& candidates) const;

    const Config& GetConfig() const { return config_; }

private:
    Config config_;
};

} // namespace careledger
