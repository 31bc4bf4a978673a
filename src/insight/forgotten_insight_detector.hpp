// File: src/insight/forgotten_insight_detector.hpp
#pragma once

#include "retrieval/ranking_engine.hpp"
#include "storage/record_store.hpp"
#include <memory>
#include <string>
#include <vector>

namespace careledger {

/// An old, relevant record that shows no evidence of follow-through
struct Insight {
    /// Record the insight was derived from
    RecordID source_record_id;

    int64_t age_days{0};

    /// age_days / 30
    int64_t months_ago{0};

    /// Marker that identified the unresolved action ("recommended", ...)
    std::string marker;

    /// Action phrase following the marker
    std::string action;

    /// "Unfollowed recommendation from N months ago: <action>."
    std::string text;
};

/// Finds forgotten insights in a ranked result
class IInsightDetector {
public:
    virtual ~IInsightDetector() = default;

    virtual std::vector<Insight> Detect(const std::string& owner_id,
                                        const std::vector<RankedCandidate>& recent,
                                        const std::vector<RankedCandidate>& old,
                                        const std::string& query_text,
                                        Timestamp as_of) = 0;
};

/// Lexical forgotten-insight detector
///
/// For every old candidate whose content contains an unresolved-action
/// marker, the action is the text after the first marker up to the end of
/// its clause, minus leading filler words. The action counts as followed
/// through when a recent candidate, or any record of the owner created after
/// the old one, contains the action phrase or every significant word of it
/// without recommending the same topic again (its own action covers the
/// significant words of the old one). Otherwise an insight is
/// emitted; a recommendation repeated over time yields one insight, taken
/// from its oldest occurrence.
///
/// This is keyword matching, not semantic entailment: paraphrased follow-ups
/// are missed and unrelated mentions of the same words count as follow-up.
class ForgottenInsightDetector : public IInsightDetector {
public:
    struct Config {
        Config() = default;

        /// Unresolved-action markers, matched case-insensitively
        std::vector<std::string> markers{
            "recommended", "follow-up", "suggested", "referred", "advised"};

        /// Maximum number of insights returned
        size_t max_insights{3};

        /// Maximum words kept in an extracted action
        size_t max_action_words{8};
    };

    explicit ForgottenInsightDetector(std::shared_ptr<RecordStore> store);
    ForgottenInsightDetector(std::shared_ptr<RecordStore> store, const Config& config);

    std::vector<Insight> Detect(const std::string& owner_id,
                                const std::vector<RankedCandidate>& recent,
                                const std::vector<RankedCandidate>& old,
                                const std::string& query_text,
                                Timestamp as_of) override;

    /// Action phrase following the first marker in `text`, or empty
    /// @param marker_out Receives the marker that matched
    std::string ExtractAction(const std::string& text, std::string* marker_out = nullptr) const;

    /// True if `text` mentions `action` (whole phrase or all significant words)
    static bool MentionsAction(const std::string& text, const std::string& action);

    /// True if `text` acts on `action` rather than repeating the recommendation
    bool IsFollowUp(const std::string& text, const std::string& action) const;

    /// True if `later_action` recommends the same thing as `action`:
    /// identical, or containing every significant word of `action`
    static bool RepeatsAction(const std::string& later_action, const std::string& action);

    /// Words of `action` that carry meaning (3+ letters, not filler)
    static std::vector<std::string> SignificantWords(const std::string& action);

    /// Insight sentence for an action of the given age
    static std::string FormatInsight(int64_t months_ago, const std::string& action);

    const Config& GetConfig() const { return config_; }

private:
    std::shared_ptr<RecordStore> store_;
    Config config_;
};

} // namespace careledger
