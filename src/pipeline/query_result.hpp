// File: src/pipeline/query_result.hpp
#pragma once

#include "retrieval/ranking_engine.hpp"
#include "insight/forgotten_insight_detector.hpp"
#include "memory/reinforcement_engine.hpp"
#include <optional>
#include <string>
#include <vector>

namespace careledger {

/// Caller-facing query parameters
struct QueryRequest {
    std::string owner_id;
    std::string query_text;

    /// Defaults come from the service configuration when unset
    std::optional<size_t> result_limit;
    std::optional<float> similarity_floor;
    std::optional<double> time_weight;

    /// Reference time for ages; now when unset
    std::optional<Timestamp> as_of;
};

/// Stages of the query pipeline, in execution order
enum class PipelineState : uint8_t {
    VALIDATE_INPUT = 0,
    RETRIEVE = 1,
    REINFORCE = 2,
    SUMMARIZE = 3,
    RECOMMEND = 4,
    VALIDATE_OUTPUT = 5,
    DONE = 6,
    REJECTED = 7,
    DEGRADED = 8,
    CANCELLED = 9,
};

const char* ToString(PipelineState state);

/// Terminal outcome of a query
enum class QueryStatus : uint8_t {
    ACCEPTED = 0,   // every stage succeeded
    REJECTED = 1,   // emergency input short-circuited the pipeline
    DEGRADED = 2,   // a stage failed; partial data, failed stages listed
    CANCELLED = 3,  // the caller cancelled between stages
};

const char* ToString(QueryStatus status);

/// Recommendation kinds, in priority order
enum class RecommendationType : uint8_t {
    DOCTOR_QUESTION = 0,
    REMINDER = 1,
    SELF_MONITORING = 2,
    INFORMATION = 3,
    SAFETY = 4,
};

const char* ToString(RecommendationType type);

struct Recommendation {
    RecommendationType type{RecommendationType::INFORMATION};
    std::string text;
};

/// Why a ranked record is part of the answer
struct EvidenceItem {
    RecordID record_id;
    std::string date;
    std::string category;
    float similarity_score{0.0f};
    std::string reason;
    std::string content_preview;
};

/// A diagnostic-language finding from output validation
struct SafetyFlag {
    /// "summary", "recommendation" or "insight"
    std::string field;
    std::string phrase;
    std::string issue;
};

/// Data accumulated by the pipeline stages
///
/// Optional fields stay empty when the stage producing them failed or never
/// ran; they are never filled with placeholder values.
struct QueryResult {
    std::string owner_id;
    std::string query_text;

    std::vector<RankedCandidate> ranked_candidates;
    std::vector<RankedCandidate> recent;
    std::vector<RankedCandidate> old;
    std::vector<Insight> insights;
    size_t records_scanned{0};

    std::optional<std::string> summary;
    std::optional<std::vector<Recommendation>> recommendations;

    /// Fixed safety response, set for Rejected queries
    std::optional<std::string> emergency_message;
    std::vector<std::string> emergency_keywords;

    // Filled by output validation
    std::string safety_disclaimer;
    std::vector<SafetyFlag> safety_flags;
    std::vector<EvidenceItem> evidence;
    bool validated{false};
};

/// Result of QueryOrchestrator::Run
struct QueryOutcome {
    QueryStatus status{QueryStatus::ACCEPTED};

    /// True for any outcome with failed stages
    bool degraded{false};

    /// Stages that failed, in order
    std::vector<PipelineState> failed_stages;

    /// Error message per failed stage, same order as failed_stages
    std::vector<std::string> stage_errors;

    /// Every state entered, in order, ending with a terminal one
    std::vector<PipelineState> visited_states;

    QueryResult result;

    /// Reinforcement applied to the returned records
    ReinforcementReport reinforcement;

    bool HasFailed(PipelineState state) const;
};

} // namespace careledger
