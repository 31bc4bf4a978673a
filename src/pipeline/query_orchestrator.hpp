// File: src/pipeline/query_orchestrator.hpp
#pragma once

#include "pipeline/query_result.hpp"
#include "pipeline/collaborators.hpp"
#include "pipeline/cancellation.hpp"
#include "pipeline/input_validator.hpp"
#include "pipeline/deadline.hpp"
#include "embedding/embedding_provider.hpp"
#include "retrieval/ranking_engine.hpp"
#include "memory/reinforcement_engine.hpp"
#include "insight/forgotten_insight_detector.hpp"
#include <chrono>
#include <memory>
#include <mutex>

namespace careledger {

/// QueryOrchestrator: fixed-sequence query pipeline
///
/// States run strictly in order with no backward transitions:
///   ValidateInput -> Retrieve -> Reinforce -> Summarize -> Recommend
///   -> ValidateOutput -> Done
///
/// - ValidateInput throws ValidationError for malformed input. Emergency
///   phrases end the query as Rejected with a fixed safety message.
/// - Retrieve embeds the query, ranks the owner's records and detects
///   forgotten insights. If ranking fails nothing later can run and the
///   query goes straight to ValidateOutput.
/// - Reinforce applies one access to every returned record. Per-record
///   failures are logged and never fail the query.
/// - Summarize and Recommend call collaborators with a deadline. A timeout
///   or error marks the stage failed and leaves its output empty.
/// - ValidateOutput always runs, for every outcome.
///
/// A cancelled token is honored at each state boundary; reinforcement that
/// already ran stays applied.
class QueryOrchestrator {
public:
    struct Config {
        Config() = default;

        size_t default_result_limit{10};
        float default_similarity_floor{0.5f};
        double default_time_weight{0.3};

        /// Deadline for each embedding, summarizer and recommender call
        std::chrono::milliseconds collaborator_timeout{2000};
    };

    /// Every pipeline component, explicitly constructed by the caller
    struct Components {
        std::shared_ptr<IEmbeddingProvider> embedder;
        std::shared_ptr<IRankingEngine> ranker;
        std::shared_ptr<IReinforcementEngine> reinforcer;
        std::shared_ptr<IInsightDetector> detector;
        std::shared_ptr<ISummarizer> summarizer;
        std::shared_ptr<IRecommender> recommender;
        std::shared_ptr<IOutputValidator> output_validator;
    };

    /// @throws std::invalid_argument if a component is missing
    QueryOrchestrator(Components components, InputValidator input_validator);
    QueryOrchestrator(Components components, InputValidator input_validator, const Config& config);

    /// Run one query through the pipeline
    /// @throws ValidationError for malformed input (no state is mutated)
    QueryOutcome Run(const QueryRequest& request,
                     const CancellationToken& cancel = CancellationToken());

    struct Stats {
        uint64_t queries{0};
        uint64_t accepted{0};
        uint64_t rejected{0};
        uint64_t degraded{0};
        uint64_t cancelled{0};
        uint64_t validation_errors{0};
        uint64_t collaborator_timeouts{0};
    };

    Stats GetStats() const;

    const Config& GetConfig() const { return config_; }

    /// Timed-out collaborator calls still running
    size_t GetPendingCollaboratorCalls() const { return collaborator_calls_.PendingCount(); }

private:
    Components components_;
    InputValidator input_validator_;
    Config config_;

    mutable std::mutex stats_mutex_;
    Stats stats_;

    // Declared last: joins late collaborator calls before the rest is torn down
    DeadlineExecutor collaborator_calls_;

    // Pipeline stages
    bool RunRetrieve(const QueryRequest& request, Timestamp as_of, QueryOutcome& outcome);
    void RunReinforce(const std::string& owner_id, Timestamp as_of, QueryOutcome& outcome);
    void RunSummarize(QueryOutcome& outcome);
    void RunRecommend(Timestamp as_of, QueryOutcome& outcome);
    void RunValidateOutput(QueryOutcome& outcome);

    /// Enter ValidateOutput, then the terminal state for the outcome
    QueryOutcome Finish(QueryOutcome outcome);

    /// Record a failed stage and its error
    void FailStage(QueryOutcome& outcome, PipelineState stage, const std::exception& error);

    /// True (and outcome marked Cancelled) if the token was cancelled
    bool CheckCancelled(const CancellationToken& cancel, QueryOutcome& outcome) const;
};

} // namespace careledger
