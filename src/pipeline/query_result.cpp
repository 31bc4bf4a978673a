// File: src/pipeline/query_result.cpp
#include "pipeline/query_result.hpp"
#include <algorithm>

namespace careledger {

const char* ToString(PipelineState state) {
    switch (state) {
        case PipelineState::VALIDATE_INPUT: return "ValidateInput";
        case PipelineState::RETRIEVE: return "Retrieve";
        case PipelineState::REINFORCE: return "Reinforce";
        case PipelineState::SUMMARIZE: return "Summarize";
        case PipelineState::RECOMMEND: return "Recommend";
        case PipelineState::VALIDATE_OUTPUT: return "ValidateOutput";
        case PipelineState::DONE: return "Done";
        case PipelineState::REJECTED: return "Rejected";
        case PipelineState::DEGRADED: return "Degraded";
        case PipelineState::CANCELLED: return "Cancelled";
        default: return "Unknown";
    }
}

const char* ToString(QueryStatus status) {
    switch (status) {
        case QueryStatus::ACCEPTED: return "accepted";
        case QueryStatus::REJECTED: return "rejected";
        case QueryStatus::DEGRADED: return "degraded";
        case QueryStatus::CANCELLED: return "cancelled";
        default: return "unknown";
    }
}

const char* ToString(RecommendationType type) {
    switch (type) {
        case RecommendationType::DOCTOR_QUESTION: return "doctor_question";
        case RecommendationType::REMINDER: return "reminder";
        case RecommendationType::SELF_MONITORING: return "self_monitoring";
        case RecommendationType::INFORMATION: return "information";
        case RecommendationType::SAFETY: return "safety";
        default: return "unknown";
    }
}

bool QueryOutcome::HasFailed(PipelineState state) const {
    return std::find(failed_stages.begin(), failed_stages.end(), state) != failed_stages.end();
}

} // namespace careledger
