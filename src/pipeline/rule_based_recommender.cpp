// File: src/pipeline/rule_based_recommender.cpp
#include "pipeline/rule_based_recommender.hpp"
#include <algorithm>
#include <cctype>
#include <initializer_list>

namespace careledger {

namespace {

std::string ToLower(const std::string& text) {
    std::string lowered = text;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered;
}

bool ContainsAny(const std::string& text, std::initializer_list<const char*> words) {
    for (const char* word : words) {
        if (text.find(word) != std::string::npos) {
            return true;
        }
    }
    return false;
}

void Truncate(std::vector<std::string>& items, size_t limit) {
    if (items.size() > limit) {
        items.resize(limit);
    }
}

} // namespace

RuleBasedRecommender::RuleBasedRecommender()
    : config_() {
}

RuleBasedRecommender::RuleBasedRecommender(const Config& config)
    : config_(config) {
}

std::vector<std::string> RuleBasedRecommender::DoctorQuestions(
        const std::string& query_lower,
        const std::vector<RankedCandidate>& candidates,
        const std::vector<Insight>& insights) const {
    std::vector<std::string> questions;

    bool has_recent = false;
    bool has_treatment_history = false;
    for (const auto& c : candidates) {
        if (c.age_days < config_.recent_window_days) {
            has_recent = true;
            if (c.content.category == "prescription" || c.content.category == "treatment") {
                has_treatment_history = true;
            }
        }
    }

    if (has_recent) {
        questions.push_back(
            "Should we review the pattern of symptoms I've experienced over the past 6 months?");
        if (has_treatment_history) {
            questions.push_back(
                "Based on my previous treatments, what approach would you recommend this time?");
        }
    }

    if (!insights.empty()) {
        questions.push_back(
            "There are some older medical records that might be relevant - should we review them together?");
    }

    if (query_lower.find("pain") != std::string::npos) {
        questions.push_back(
            "What tests or examinations would help determine the cause of this pain?");
    }

    if (query_lower.find("symptom") != std::string::npos) {
        questions.push_back(
            "What warning signs should I watch for that would require immediate attention?");
    }

    Truncate(questions, config_.max_doctor_questions);
    return questions;
}

std::vector<std::string> RuleBasedRecommender::MonitoringSuggestions(
        const std::string& query_lower,
        const std::vector<RankedCandidate>& candidates) const {
    std::vector<std::string> suggestions;

    suggestions.push_back(
        "Keep a daily symptom journal noting intensity, duration, and triggers");

    if (candidates.size() >= 3) {
        suggestions.push_back(
            "Track any patterns - note if symptoms occur at specific times or in specific situations");
    }

    if (query_lower.find("pain") != std::string::npos) {
        suggestions.push_back(
            "Rate your pain on a scale of 1-10 and note what activities make it better or worse");
    }

    if (ContainsAny(query_lower, {"headache", "migraine"})) {
        suggestions.push_back(
            "Keep a headache diary tracking possible triggers (food, sleep, stress, weather)");
    }

    if (ContainsAny(query_lower, {"sleep", "insomnia", "tired"})) {
        suggestions.push_back(
            "Track your sleep patterns including hours slept, wake times, and sleep quality");
    }

    Truncate(suggestions, config_.max_monitoring);
    return suggestions;
}

std::vector<std::string> RuleBasedRecommender::Reminders(
        const std::vector<RankedCandidate>& candidates,
        Timestamp as_of) const {
    std::vector<std::string> reminders;
    if (candidates.empty()) {
        return reminders;
    }

    auto latest = std::max_element(candidates.begin(), candidates.end(),
                                   [](const RankedCandidate& a, const RankedCandidate& b) {
                                       return a.created_at < b.created_at;
                                   });
    if (AgeInDays(latest->created_at, as_of) > config_.checkup_after_days) {
        reminders.push_back(
            "Consider scheduling a check-up - it's been over 3 months since your last recorded visit");
    }

    if (candidates.size() >= 3) {
        reminders.push_back(
            "Schedule a follow-up appointment to discuss the pattern of recurring symptoms");
    }

    reminders.push_back(
        "Keep all current medications and supplements list updated for your next doctor visit");

    Truncate(reminders, config_.max_reminders);
    return reminders;
}

std::vector<std::string> RuleBasedRecommender::InformationActions(
        const std::string& query_lower,
        const std::vector<RankedCandidate>& candidates) const {
    std::vector<std::string> actions;

    if (!candidates.empty()) {
        actions.push_back(
            "Upload any recent test results or reports to maintain a complete record");
    }

    if (ContainsAny(query_lower, {"allergy", "allergic", "reaction"})) {
        actions.push_back(
            "Document all known allergies and any adverse reactions to medications or foods");
    }

    if (ContainsAny(query_lower, {"family", "genetic", "hereditary"})) {
        actions.push_back(
            "Gather family medical history, especially for conditions that run in families");
    }

    if (ContainsAny(query_lower, {"medication", "medicine", "drug"})) {
        actions.push_back(
            "Create a complete list of all medications, dosages, and when you started taking them");
    }

    Truncate(actions, config_.max_information);
    return actions;
}

std::vector<Recommendation> RuleBasedRecommender::Recommend(
        const std::string& query_text,
        const std::vector<RankedCandidate>& candidates,
        const std::vector<Insight>& insights,
        Timestamp as_of) const {
    std::string query_lower = ToLower(query_text);
    std::vector<Recommendation> recommendations;

    auto append = [&recommendations](RecommendationType type,
                                     const std::vector<std::string>& texts) {
        for (const auto& text : texts) {
            recommendations.push_back(Recommendation{type, text});
        }
    };

    // Appended in priority order
    append(RecommendationType::DOCTOR_QUESTION, DoctorQuestions(query_lower, candidates, insights));
    append(RecommendationType::REMINDER, Reminders(candidates, as_of));
    append(RecommendationType::SELF_MONITORING, MonitoringSuggestions(query_lower, candidates));
    append(RecommendationType::INFORMATION, InformationActions(query_lower, candidates));

    if (recommendations.size() > config_.max_total) {
        recommendations.resize(config_.max_total);
    }
    return recommendations;
}

} // namespace careledger
