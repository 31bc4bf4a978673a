// File: src/memory/memory_health.cpp
#include "memory/memory_health.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <set>

namespace careledger {

namespace {

std::string CategoryOf(const Record& record) {
    const std::string& category = record.GetContent().category;
    return category.empty() ? "unknown" : category;
}

std::string ToLower(const std::string& text) {
    std::string lowered = text;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered;
}

/// Mean days per record over the span of `dates` (sorted); 0 for a zero span
double MeanDaysPerRecord(const std::vector<Timestamp>& dates) {
    if (dates.size() < 2) {
        return 0.0;
    }
    int64_t span = AgeInDays(dates.front(), dates.back());
    return span > 0 ? static_cast<double>(span) / static_cast<double>(dates.size()) : 0.0;
}

} // namespace

std::string HealthStatusFor(double score) {
    if (score > 0.8) return "excellent";
    if (score > 0.6) return "good";
    if (score > 0.4) return "fair";
    return "needs_improvement";
}

MemoryHealth AssessMemoryHealth(const std::vector<Record>& records,
                                Timestamp as_of,
                                const MemoryHealthConfig& config) {
    MemoryHealth health;
    if (records.empty()) {
        return health;
    }

    const double total = static_cast<double>(records.size());

    // Recency
    size_t recent_count = 0;
    for (const auto& record : records) {
        if (record.AgeInDaysAt(as_of) <= config.recent_days) {
            ++recent_count;
        }
    }
    double recent_target = std::max(1.0, total * config.recent_share_target);
    health.recency_score = std::min(1.0, static_cast<double>(recent_count) / recent_target);

    // Diversity
    std::set<std::string> categories;
    for (const auto& record : records) {
        categories.insert(CategoryOf(record));
    }
    health.diversity_score = std::min(1.0, static_cast<double>(categories.size()) /
                                           config.ideal_category_count);

    // Continuity
    if (records.size() > 1) {
        std::vector<Timestamp> dates;
        dates.reserve(records.size());
        for (const auto& record : records) {
            dates.push_back(record.GetCreatedAt());
        }
        std::sort(dates.begin(), dates.end());

        double gap_sum = 0.0;
        for (size_t i = 0; i + 1 < dates.size(); ++i) {
            gap_sum += static_cast<double>(AgeInDays(dates[i], dates[i + 1]));
        }
        double avg_gap = gap_sum / static_cast<double>(dates.size() - 1);
        health.continuity_score = std::max(0.0, 1.0 - avg_gap / config.continuity_gap_days);
    } else {
        health.continuity_score = 0.5;
    }

    health.score = health.recency_score * 0.4 +
                   health.diversity_score * 0.3 +
                   health.continuity_score * 0.3;
    health.status = HealthStatusFor(health.score);

    if (health.recency_score < 0.5) {
        health.suggestions.push_back(
            "Consider adding recent medical records to improve memory accuracy");
    }
    if (health.diversity_score < 0.4) {
        health.suggestions.push_back(
            "Adding different types of records (symptoms, scans, reports) would provide better context");
    }
    if (health.continuity_score < 0.4) {
        health.suggestions.push_back(
            "Regular updates to the medical history help identify patterns over time");
    }

    return health;
}

std::vector<RecurringPattern> FindRecurringPatterns(const std::vector<Record>& records,
                                                    Timestamp as_of,
                                                    const MemoryHealthConfig& config) {
    Timestamp window_start = as_of.PlusDays(-config.consolidation_window_days);

    std::map<std::string, size_t> counts;
    for (const auto& record : records) {
        Timestamp created = record.GetCreatedAt();
        if (created >= window_start && created <= as_of) {
            ++counts[CategoryOf(record)];
        }
    }

    std::vector<RecurringPattern> patterns;
    for (const auto& [category, count] : counts) {
        if (count < config.pattern_threshold) {
            continue;
        }
        RecurringPattern pattern;
        pattern.category = category;
        pattern.count = count;
        pattern.description = "Recurring " + category + " records (" + std::to_string(count) +
                              " occurrences in " +
                              std::to_string(config.consolidation_window_days) + " days)";
        patterns.push_back(std::move(pattern));
    }
    return patterns;
}

SymptomProgression AnalyzeSymptomProgression(const std::vector<Record>& records,
                                             const std::string& symptom,
                                             int64_t window_days,
                                             Timestamp as_of,
                                             const MemoryHealthConfig& config) {
    SymptomProgression progression;
    progression.symptom = symptom;
    progression.window_days = window_days;

    std::string needle = ToLower(symptom);
    if (needle.empty()) {
        return progression;
    }

    Timestamp window_start = as_of.PlusDays(-window_days);
    for (const auto& record : records) {
        Timestamp created = record.GetCreatedAt();
        if (created < window_start || created > as_of) {
            continue;
        }
        if (ToLower(record.GetContent().text).find(needle) == std::string::npos) {
            continue;
        }
        progression.timeline.push_back({record.GetID(), created, CategoryOf(record)});
    }

    if (progression.timeline.empty()) {
        return progression;
    }

    std::stable_sort(progression.timeline.begin(), progression.timeline.end(),
                     [](const SymptomOccurrence& a, const SymptomOccurrence& b) {
                         return a.date < b.date;
                     });

    std::vector<Timestamp> dates;
    dates.reserve(progression.timeline.size());
    for (const auto& occurrence : progression.timeline) {
        dates.push_back(occurrence.date);
    }

    progression.occurrences = progression.timeline.size();
    progression.first_occurrence = dates.front();
    progression.latest_occurrence = dates.back();
    progression.average_frequency_days = std::round(MeanDaysPerRecord(dates) * 10.0) / 10.0;
    progression.trend = progression.occurrences >= config.recurring_symptom_count
                            ? "recurring" : "isolated";
    return progression;
}

std::vector<TimelineInsight> DeriveTimelineInsights(const std::vector<Record>& records,
                                                    const MemoryHealthConfig& config) {
    std::vector<TimelineInsight> insights;
    if (records.empty()) {
        return insights;
    }

    if (records.size() >= config.frequency_min_records) {
        std::vector<Timestamp> dates;
        dates.reserve(records.size());
        for (const auto& record : records) {
            dates.push_back(record.GetCreatedAt());
        }
        std::sort(dates.begin(), dates.end());

        double mean_days = MeanDaysPerRecord(dates);
        if (mean_days < config.frequent_care_days) {
            insights.push_back({"frequency",
                                "You have frequent medical interactions (average every few weeks). "
                                "Consider discussing ongoing management with your doctor."});
        } else if (mean_days > config.infrequent_care_days) {
            insights.push_back({"frequency",
                                "You have infrequent medical records. "
                                "Consider regular check-ups for preventive care."});
        }
    }

    size_t symptoms = 0;
    size_t reports = 0;
    for (const auto& record : records) {
        const std::string category = CategoryOf(record);
        if (category == "symptom") ++symptoms;
        if (category == "report") ++reports;
    }
    if (symptoms > reports) {
        insights.push_back({"documentation",
                            "You track symptoms well. "
                            "Consider uploading more medical reports for complete context."});
    }

    return insights;
}

MemorySummary SummarizeMemory(const std::string& owner_id,
                              const std::vector<Record>& records,
                              Timestamp as_of,
                              const MemoryHealthConfig& config) {
    MemorySummary summary;
    summary.owner_id = owner_id;
    summary.total_records = records.size();

    for (const auto& record : records) {
        ++summary.records_by_category[CategoryOf(record)];

        Timestamp created = record.GetCreatedAt();
        if (!summary.earliest || created < *summary.earliest) {
            summary.earliest = created;
        }
        if (!summary.latest || created > *summary.latest) {
            summary.latest = created;
        }
    }

    if (summary.earliest && summary.latest) {
        summary.span_days = AgeInDays(*summary.earliest, *summary.latest);
    }

    summary.health = AssessMemoryHealth(records, as_of, config);
    summary.recurring_patterns = FindRecurringPatterns(records, as_of, config);
    summary.timeline_insights = DeriveTimelineInsights(records, config);
    return summary;
}

} // namespace careledger
