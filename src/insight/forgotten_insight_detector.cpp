// File: src/insight/forgotten_insight_detector.cpp
#include "insight/forgotten_insight_detector.hpp"
#include "core/logging.hpp"
#include <algorithm>
#include <cctype>
#include <set>
#include <sstream>
#include <stdexcept>
#include <unordered_set>

namespace careledger {

namespace {

const std::unordered_set<std::string>& FillerWords() {
    static const std::unordered_set<std::string> words = {
        "to", "a", "an", "the", "that", "you", "patient", "he", "she", "they",
        "we", "start", "starting", "begin", "beginning", "try", "trying",
        "consider", "considering", "doing", "do", "get", "getting", "with",
        "for", "of", "on", "by", "up", "some", "more", "regular", "be", "is",
        "was", "and", "or", "should", "would", "could", "it",
    };
    return words;
}

// Words that end the topic of an action ("physical therapy | for knee pain")
const std::unordered_set<std::string>& TopicBreakWords() {
    static const std::unordered_set<std::string> words = {
        "for", "to", "with", "in", "at", "on", "after", "before", "because",
        "due", "if", "when", "and", "or", "but", "until", "within", "every",
    };
    return words;
}

std::string ToLower(const std::string& text) {
    std::string lowered = text;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered;
}

// Lower-cased alphanumeric words
std::vector<std::string> Words(const std::string& text) {
    std::vector<std::string> words;
    std::string current;
    for (unsigned char c : text) {
        if (std::isalnum(c)) {
            current.push_back(static_cast<char>(std::tolower(c)));
        } else if (!current.empty()) {
            words.push_back(current);
            current.clear();
        }
    }
    if (!current.empty()) {
        words.push_back(current);
    }
    return words;
}

bool IsClauseEnd(char c) {
    return c == '.' || c == ';' || c == '!' || c == '?' || c == ',' || c == '\n';
}

std::string Join(const std::vector<std::string>& words) {
    std::ostringstream oss;
    for (size_t i = 0; i < words.size(); ++i) {
        if (i > 0) oss << ' ';
        oss << words[i];
    }
    return oss.str();
}

} // namespace

// ============================================================================
// Construction
// ============================================================================

ForgottenInsightDetector::ForgottenInsightDetector(std::shared_ptr<RecordStore> store)
    : ForgottenInsightDetector(std::move(store), Config{}) {
}

ForgottenInsightDetector::ForgottenInsightDetector(std::shared_ptr<RecordStore> store,
                                                   const Config& config)
    : store_(std::move(store)),
      config_(config) {
    if (!store_) {
        throw std::invalid_argument("ForgottenInsightDetector requires a store");
    }
    for (auto& marker : config_.markers) {
        marker = ToLower(marker);
    }
    config_.markers.erase(std::remove(config_.markers.begin(), config_.markers.end(), ""),
                          config_.markers.end());
}

// ============================================================================
// Lexical helpers
// ============================================================================

std::string ForgottenInsightDetector::ExtractAction(const std::string& text,
                                                    std::string* marker_out) const {
    std::string lowered = ToLower(text);

    size_t best_pos = std::string::npos;
    std::string best_marker;
    for (const auto& marker : config_.markers) {
        size_t pos = lowered.find(marker);
        if (pos != std::string::npos && (best_pos == std::string::npos || pos < best_pos)) {
            best_pos = pos;
            best_marker = marker;
        }
    }
    if (best_pos == std::string::npos) {
        return "";
    }

    size_t start = best_pos + best_marker.size();
    size_t end = start;
    while (end < lowered.size() && !IsClauseEnd(lowered[end])) {
        ++end;
    }

    std::vector<std::string> words = Words(lowered.substr(start, end - start));

    // Drop leading filler ("recommended that the patient start ...")
    size_t first = 0;
    while (first < words.size() && FillerWords().count(words[first]) > 0) {
        ++first;
    }
    words.erase(words.begin(), words.begin() + static_cast<std::ptrdiff_t>(first));

    if (words.size() > config_.max_action_words) {
        words.resize(config_.max_action_words);
    }

    if (marker_out) {
        *marker_out = best_marker;
    }
    return Join(words);
}

std::vector<std::string> ForgottenInsightDetector::SignificantWords(const std::string& action) {
    std::vector<std::string> significant;
    for (const auto& word : Words(action)) {
        if (TopicBreakWords().count(word) > 0 && !significant.empty()) {
            break;  // topic ends at the first preposition
        }
        if (word.size() >= 3 && FillerWords().count(word) == 0) {
            significant.push_back(word);
        }
    }
    return significant;
}

bool ForgottenInsightDetector::MentionsAction(const std::string& text, const std::string& action) {
    if (action.empty()) {
        return false;
    }

    std::vector<std::string> text_words = Words(text);
    std::string normalized_text = " " + Join(text_words) + " ";
    if (normalized_text.find(" " + Join(Words(action)) + " ") != std::string::npos) {
        return true;
    }

    std::vector<std::string> significant = SignificantWords(action);
    if (significant.empty()) {
        return false;
    }

    std::set<std::string> present(text_words.begin(), text_words.end());
    return std::all_of(significant.begin(), significant.end(),
                       [&present](const std::string& word) { return present.count(word) > 0; });
}

bool ForgottenInsightDetector::RepeatsAction(const std::string& later_action,
                                             const std::string& action) {
    if (later_action.empty() || action.empty()) {
        return false;
    }
    if (later_action == action) {
        return true;
    }

    std::vector<std::string> significant = SignificantWords(action);
    if (significant.empty()) {
        return false;
    }
    std::vector<std::string> later_words = Words(later_action);
    std::set<std::string> present(later_words.begin(), later_words.end());
    return std::all_of(significant.begin(), significant.end(),
                       [&present](const std::string& word) { return present.count(word) > 0; });
}

bool ForgottenInsightDetector::IsFollowUp(const std::string& text, const std::string& action) const {
    // Repeating the same recommendation is not acting on it
    return MentionsAction(text, action) && !RepeatsAction(ExtractAction(text), action);
}

std::string ForgottenInsightDetector::FormatInsight(int64_t months_ago, const std::string& action) {
    return "Unfollowed recommendation from " + std::to_string(months_ago) +
           (months_ago == 1 ? " month" : " months") + " ago: " + action + ".";
}

// ============================================================================
// Detection
// ============================================================================

std::vector<Insight> ForgottenInsightDetector::Detect(const std::string& owner_id,
                                                      const std::vector<RankedCandidate>& recent,
                                                      const std::vector<RankedCandidate>& old,
                                                      const std::string& query_text,
                                                      Timestamp as_of) {
    std::vector<Insight> insights;
    if (old.empty() || config_.max_insights == 0) {
        return insights;
    }

    // Oldest first
    std::vector<const RankedCandidate*> ordered;
    ordered.reserve(old.size());
    for (const auto& candidate : old) {
        ordered.push_back(&candidate);
    }
    std::sort(ordered.begin(), ordered.end(),
              [](const RankedCandidate* a, const RankedCandidate* b) {
                  if (a->created_at != b->created_at) {
                      return a->created_at < b->created_at;
                  }
                  return a->record_id < b->record_id;
              });

    // Later records are loaded once and filtered per candidate
    std::vector<Record> owner_records;
    bool loaded = false;
    std::vector<std::string> emitted_actions;

    for (const RankedCandidate* candidate : ordered) {
        std::string marker;
        std::string action = ExtractAction(candidate->content.text, &marker);
        if (action.empty() ||
            std::any_of(emitted_actions.begin(), emitted_actions.end(),
                        [&action](const std::string& emitted) {
                            return RepeatsAction(action, emitted);
                        })) {
            continue;
        }

        bool followed = false;
        for (const auto& later : recent) {
            if (later.record_id != candidate->record_id &&
                IsFollowUp(later.content.text, action)) {
                followed = true;
                break;
            }
        }

        if (!followed) {
            if (!loaded) {
                RecordQueryOptions options;
                options.created_after = candidate->created_at;
                owner_records = store_->FindByOwner(owner_id, options);
                loaded = true;
            }
            for (const auto& record : owner_records) {
                if (record.GetCreatedAt() > candidate->created_at &&
                    record.GetID() != candidate->record_id &&
                    IsFollowUp(record.GetContent().text, action)) {
                    followed = true;
                    break;
                }
            }
        }

        if (followed) {
            GetLogger()->debug("Action '{}' from {} was followed up", action,
                               candidate->record_id.ToString());
            continue;
        }

        Insight insight;
        insight.source_record_id = candidate->record_id;
        insight.age_days = AgeInDays(candidate->created_at, as_of);
        insight.months_ago = insight.age_days / 30;
        insight.marker = marker;
        insight.action = action;
        insight.text = FormatInsight(insight.months_ago, action);
        insights.push_back(std::move(insight));
        emitted_actions.push_back(action);

        if (insights.size() >= config_.max_insights) {
            break;
        }
    }

    GetLogger()->debug("Insight detection for {} ('{}'): {} old candidates, {} insights",
                       owner_id, query_text.substr(0, 40), old.size(), insights.size());
    return insights;
}

} // namespace careledger
