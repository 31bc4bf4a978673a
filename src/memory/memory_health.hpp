// File: src/memory/memory_health.hpp
#pragma once

#include "core/record.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace careledger {

/// Quality assessment of one owner's record history
struct MemoryHealth {
    /// "excellent", "good", "fair", "needs_improvement", or "empty"
    std::string status{"empty"};

    /// 0.4 * recency + 0.3 * diversity + 0.3 * continuity
    double score{0.0};

    /// Share of records from the last 90 days, relative to 30% of the total
    double recency_score{0.0};

    /// Distinct categories / 5, capped at 1
    double diversity_score{0.0};

    /// 1 - mean gap between consecutive records / 180 days, floored at 0
    double continuity_score{0.0};

    /// Suggestions for improving the history
    std::vector<std::string> suggestions;
};

/// A category that occurs repeatedly within a short window
struct RecurringPattern {
    std::string category;
    size_t count{0};
    std::string description;
};

/// Observation about the shape of a record history as a whole
struct TimelineInsight {
    /// "frequency" or "documentation"
    std::string type;
    std::string text;
};

/// One record mentioning a tracked symptom
struct SymptomOccurrence {
    RecordID record_id;
    Timestamp date;
    std::string category;
};

/// How often a symptom was recorded within a window
struct SymptomProgression {
    std::string symptom;
    int64_t window_days{0};
    size_t occurrences{0};

    std::optional<Timestamp> first_occurrence;
    std::optional<Timestamp> latest_occurrence;

    /// Days between first and latest occurrence / occurrences, one decimal.
    /// 0 for fewer than two occurrences or a single-day span.
    double average_frequency_days{0.0};

    /// "recurring", "isolated", or "none" when nothing matched
    std::string trend{"none"};

    /// Matching records, oldest first
    std::vector<SymptomOccurrence> timeline;
};

/// Overview of one owner's record history
struct MemorySummary {
    std::string owner_id;
    size_t total_records{0};

    /// Record count per category ("unknown" for records without one)
    std::map<std::string, size_t> records_by_category;

    std::optional<Timestamp> earliest;
    std::optional<Timestamp> latest;
    int64_t span_days{0};

    MemoryHealth health;

    /// Categories with repeated records in the consolidation window
    std::vector<RecurringPattern> recurring_patterns;

    std::vector<TimelineInsight> timeline_insights;
};

/// Tunables for the health assessment
struct MemoryHealthConfig {
    /// Records at most this many days old count as recent
    int64_t recent_days{90};

    /// Fraction of the total that must be recent for a full recency score
    double recent_share_target{0.3};

    /// Distinct categories needed for a full diversity score
    double ideal_category_count{5.0};

    /// Mean gap (days) at which continuity reaches zero
    double continuity_gap_days{180.0};

    /// Window for recurring pattern detection
    int64_t consolidation_window_days{30};

    /// Occurrences within the window that make a pattern
    size_t pattern_threshold{3};

    /// Symptom occurrences at which the trend is "recurring"
    size_t recurring_symptom_count{3};

    /// Records needed before the visit frequency is judged
    size_t frequency_min_records{5};

    /// Mean days per record below which care counts as frequent
    double frequent_care_days{30.0};

    /// Mean days per record above which care counts as infrequent
    double infrequent_care_days{180.0};
};

/// Assess record history quality as of `as_of`
MemoryHealth AssessMemoryHealth(const std::vector<Record>& records,
                                Timestamp as_of,
                                const MemoryHealthConfig& config = {});

/// Categories with at least `pattern_threshold` records created within the
/// consolidation window ending at `as_of`
std::vector<RecurringPattern> FindRecurringPatterns(const std::vector<Record>& records,
                                                    Timestamp as_of,
                                                    const MemoryHealthConfig& config = {});

/// Records whose text mentions `symptom` (case-insensitive) created within
/// `window_days` before `as_of`
SymptomProgression AnalyzeSymptomProgression(const std::vector<Record>& records,
                                             const std::string& symptom,
                                             int64_t window_days,
                                             Timestamp as_of,
                                             const MemoryHealthConfig& config = {});

/// Visit frequency and documentation balance across a whole history
std::vector<TimelineInsight> DeriveTimelineInsights(const std::vector<Record>& records,
                                                    const MemoryHealthConfig& config = {});

/// Build a full summary for one owner
MemorySummary SummarizeMemory(const std::string& owner_id,
                              const std::vector<Record>& records,
                              Timestamp as_of,
                              const MemoryHealthConfig& config = {});

/// Health label for an overall score
std::string HealthStatusFor(double score);

} // namespace careledger
