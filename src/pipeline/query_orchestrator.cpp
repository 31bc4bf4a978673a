// File: src/pipeline/query_orchestrator.cpp
#include "pipeline/query_orchestrator.hpp"
#include "pipeline/safety_validator.hpp"
#include "core/errors.hpp"
#include "core/logging.hpp"

namespace careledger {

// ============================================================================
// Construction
// ============================================================================

QueryOrchestrator::QueryOrchestrator(Components components, InputValidator input_validator)
    : QueryOrchestrator(std::move(components), std::move(input_validator), Config{}) {
}

QueryOrchestrator::QueryOrchestrator(Components components,
                                     InputValidator input_validator,
                                     const Config& config)
    : components_(std::move(components)),
      input_validator_(std::move(input_validator)),
      config_(config) {
    if (!components_.embedder || !components_.ranker || !components_.reinforcer ||
        !components_.detector || !components_.summarizer || !components_.recommender ||
        !components_.output_validator) {
        throw std::invalid_argument("QueryOrchestrator requires every pipeline component");
    }
    if (config_.collaborator_timeout.count() <= 0) {
        throw std::invalid_argument("collaborator_timeout must be positive");
    }
}

// ============================================================================
// Pipeline
// ============================================================================

QueryOutcome QueryOrchestrator::Run(const QueryRequest& request, const CancellationToken& cancel) {
    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        ++stats_.queries;
    }

    QueryOutcome outcome;
    outcome.visited_states.push_back(PipelineState::VALIDATE_INPUT);

    QueryRequest validated;
    try {
        validated = input_validator_.Validate(request);
    } catch (const ValidationError&) {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        ++stats_.validation_errors;
        throw;
    }

    Timestamp as_of = validated.as_of.value_or(Timestamp::Now());
    outcome.result.owner_id = validated.owner_id;
    outcome.result.query_text = validated.query_text;

    EmergencyCheck emergency = input_validator_.CheckEmergency(validated.query_text);
    if (emergency.detected) {
        std::string keywords;
        for (const auto& keyword : emergency.keywords) {
            keywords += (keywords.empty() ? "" : ", ") + keyword;
        }
        GetLogger()->warn("Emergency indicators in query for {}: {}", validated.owner_id, keywords);
        outcome.status = QueryStatus::REJECTED;
        outcome.result.emergency_message = emergency.message;
        outcome.result.emergency_keywords = emergency.keywords;
        outcome.result.recommendations = std::vector<Recommendation>{
            Recommendation{RecommendationType::SAFETY, emergency.message}};
        return Finish(std::move(outcome));
    }

    if (CheckCancelled(cancel, outcome)) {
        return Finish(std::move(outcome));
    }

    outcome.visited_states.push_back(PipelineState::RETRIEVE);
    if (!RunRetrieve(validated, as_of, outcome)) {
        return Finish(std::move(outcome));
    }

    if (CheckCancelled(cancel, outcome)) {
        return Finish(std::move(outcome));
    }

    outcome.visited_states.push_back(PipelineState::REINFORCE);
    RunReinforce(validated.owner_id, as_of, outcome);

    if (CheckCancelled(cancel, outcome)) {
        return Finish(std::move(outcome));
    }

    outcome.visited_states.push_back(PipelineState::SUMMARIZE);
    RunSummarize(outcome);

    if (CheckCancelled(cancel, outcome)) {
        return Finish(std::move(outcome));
    }

    outcome.visited_states.push_back(PipelineState::RECOMMEND);
    RunRecommend(as_of, outcome);

    return Finish(std::move(outcome));
}

bool QueryOrchestrator::RunRetrieve(const QueryRequest& request,
                                    Timestamp as_of,
                                    QueryOutcome& outcome) {
    RankingQuery query;
    query.owner_id = request.owner_id;
    query.result_limit = request.result_limit.value_or(config_.default_result_limit);
    query.similarity_floor = request.similarity_floor.value_or(config_.default_similarity_floor);
    query.time_weight = request.time_weight.value_or(config_.default_time_weight);

    try {
        auto embedder = components_.embedder;
        std::string text = request.query_text;
        query.query_embedding = collaborator_calls_.Call(
            "embedding provider", config_.collaborator_timeout,
            [embedder, text]() { return embedder->Embed(text); });

        RankingResult ranking = components_.ranker->Rank(query, as_of);
        outcome.result.ranked_candidates = std::move(ranking.candidates);
        outcome.result.recent = std::move(ranking.recent);
        outcome.result.old = std::move(ranking.old);
        outcome.result.records_scanned = ranking.records_scanned;
    } catch (const std::exception& e) {
        FailStage(outcome, PipelineState::RETRIEVE, e);
        return false;
    }

    // Ranked data stays usable even if insight detection fails
    try {
        outcome.result.insights = components_.detector->Detect(
            request.owner_id, outcome.result.recent, outcome.result.old,
            request.query_text, as_of);
    } catch (const std::exception& e) {
        FailStage(outcome, PipelineState::RETRIEVE, e);
    }
    return true;
}

void QueryOrchestrator::RunReinforce(const std::string& owner_id,
                                     Timestamp as_of,
                                     QueryOutcome& outcome) {
    std::vector<RecordID> ids;
    ids.reserve(outcome.result.ranked_candidates.size());
    for (const auto& candidate : outcome.result.ranked_candidates) {
        ids.push_back(candidate.record_id);
    }

    try {
        outcome.reinforcement = components_.reinforcer->ReinforceBatch(owner_id, ids, as_of);
    } catch (const std::exception& e) {
        // Weight updates never fail a query
        GetLogger()->warn("Reinforcement for {} skipped: {}", owner_id, e.what());
        outcome.reinforcement.failed = ids.size();
        outcome.reinforcement.failed_ids = ids;
    }
}

void QueryOrchestrator::RunSummarize(QueryOutcome& outcome) {
    try {
        auto summarizer = components_.summarizer;
        std::string text = outcome.result.query_text;
        std::vector<RankedCandidate> candidates = outcome.result.ranked_candidates;
        std::vector<Insight> insights = outcome.result.insights;

        outcome.result.summary = collaborator_calls_.Call(
            "summarizer", config_.collaborator_timeout,
            [summarizer, text, candidates, insights]() {
                return summarizer->Summarize(text, candidates, insights);
            });
    } catch (const std::exception& e) {
        FailStage(outcome, PipelineState::SUMMARIZE, e);
    }
}

void QueryOrchestrator::RunRecommend(Timestamp as_of, QueryOutcome& outcome) {
    try {
        auto recommender = components_.recommender;
        std::string text = outcome.result.query_text;
        std::vector<RankedCandidate> candidates = outcome.result.ranked_candidates;
        std::vector<Insight> insights = outcome.result.insights;

        outcome.result.recommendations = collaborator_calls_.Call(
            "recommender", config_.collaborator_timeout,
            [recommender, text, candidates, insights, as_of]() {
                return recommender->Recommend(text, candidates, insights, as_of);
            });
    } catch (const std::exception& e) {
        FailStage(outcome, PipelineState::RECOMMEND, e);
    }
}

void QueryOrchestrator::RunValidateOutput(QueryOutcome& outcome) {
    outcome.visited_states.push_back(PipelineState::VALIDATE_OUTPUT);

    try {
        // Copy in, so a throwing validator leaves the result intact
        outcome.result = components_.output_validator->Validate(outcome.result);
    } catch (const std::exception& e) {
        // Generated text cannot be vouched for without validation
        FailStage(outcome, PipelineState::VALIDATE_OUTPUT, e);
        outcome.result.summary.reset();
        outcome.result.recommendations.reset();
        outcome.result.safety_disclaimer = SafetyValidator::StandardDisclaimer();
        outcome.result.validated = true;
    }
}

QueryOutcome QueryOrchestrator::Finish(QueryOutcome outcome) {
    RunValidateOutput(outcome);

    outcome.degraded = !outcome.failed_stages.empty();

    PipelineState terminal = PipelineState::DONE;
    if (outcome.status == QueryStatus::REJECTED) {
        terminal = PipelineState::REJECTED;
    } else if (outcome.status == QueryStatus::CANCELLED) {
        terminal = PipelineState::CANCELLED;
    } else if (outcome.degraded) {
        outcome.status = QueryStatus::DEGRADED;
        terminal = PipelineState::DEGRADED;
    }
    outcome.visited_states.push_back(terminal);

    GetLogger()->debug("Query for {} finished {} ({} candidates, {} insights, {} failed stages)",
                       outcome.result.owner_id, ToString(outcome.status),
                       outcome.result.ranked_candidates.size(), outcome.result.insights.size(),
                       outcome.failed_stages.size());

    std::lock_guard<std::mutex> lock(stats_mutex_);
    switch (outcome.status) {
        case QueryStatus::ACCEPTED: ++stats_.accepted; break;
        case QueryStatus::REJECTED: ++stats_.rejected; break;
        case QueryStatus::DEGRADED: ++stats_.degraded; break;
        case QueryStatus::CANCELLED: ++stats_.cancelled; break;
    }
    return outcome;
}

void QueryOrchestrator::FailStage(QueryOutcome& outcome,
                                  PipelineState stage,
                                  const std::exception& error) {
    GetLogger()->warn("Stage {} failed for {}: {}", ToString(stage),
                      outcome.result.owner_id, error.what());

    if (!outcome.HasFailed(stage)) {
        outcome.failed_stages.push_back(stage);
    }
    outcome.stage_errors.push_back(std::string(ToString(stage)) + ": " + error.what());

    if (dynamic_cast<const CollaboratorTimeoutError*>(&error) != nullptr) {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        ++stats_.collaborator_timeouts;
    }
}

bool QueryOrchestrator::CheckCancelled(const CancellationToken& cancel,
                                       QueryOutcome& outcome) const {
    if (!cancel.IsCancelled()) {
        return false;
    }
    GetLogger()->info("Query for {} cancelled after {}", outcome.result.owner_id,
                      ToString(outcome.visited_states.back()));
    outcome.status = QueryStatus::CANCELLED;
    return true;
}

QueryOrchestrator::Stats QueryOrchestrator::GetStats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return stats_;
}

} // namespace careledger
