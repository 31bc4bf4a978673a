// File: src/service/memory_service.hpp
#pragma once

#include "storage/record_store.hpp"
#include "storage/owner_lock_table.hpp"
#include "embedding/embedding_provider.hpp"
#include "retrieval/ranking_engine.hpp"
#include "memory/reinforcement_engine.hpp"
#include "memory/memory_health.hpp"
#include "insight/forgotten_insight_detector.hpp"
#include "pipeline/query_orchestrator.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace careledger {

/// Tunables for every component the service wires together
struct ServiceConfig {
    OwnerLockTable::Config locks;
    TimeWeightedRanker::Config ranking;
    ReinforcementEngine::Config memory;
    ForgottenInsightDetector::Config insight;
    QueryOrchestrator::Config pipeline;
    InputValidator::Config input;
    MemoryHealthConfig health;
};

/// Optional collaborator overrides; empty members get the built-in ones
struct ServiceCollaborators {
    std::shared_ptr<ISummarizer> summarizer;
    std::shared_ptr<IRecommender> recommender;
    std::shared_ptr<IOutputValidator> output_validator;
};

/// MemoryService: the boundary operations of the memory core
///
/// Owns the lock table, ranking engine, reinforcement engine, insight
/// detector and query pipeline, all built around the store and embedding
/// provider handed in by the caller. There is no process-wide state: two
/// services over two stores are fully independent.
///
/// Usage:
///   auto store = std::shared_ptr<RecordStore>(CreateRecordStore(store_config));
///   MemoryService service(store, std::make_shared<HashingEmbedder>());
///   RecordID id = service.Ingest("patient-1", {"Knee pain after running", "symptom", {}});
///   QueryOutcome outcome = service.Query({"patient-1", "knee pain"});
class MemoryService {
public:
    MemoryService(std::shared_ptr<RecordStore> store,
                  std::shared_ptr<IEmbeddingProvider> embedder,
                  const ServiceConfig& config = {},
                  ServiceCollaborators collaborators = {});

    MemoryService(const MemoryService&) = delete;
    MemoryService& operator=(const MemoryService&) = delete;

    // ========================================================================
    // Boundary operations
    // ========================================================================

    /// Embed and store a new record
    /// @param created_at Creation time; now when unset
    /// @throws ValidationError for a malformed owner id or empty text
    /// @throws CollaboratorTimeoutError if embedding exceeds its deadline
    /// @throws StorageError if the store rejects the record
    RecordID Ingest(const std::string& owner_id,
                    const RecordContent& content,
                    std::optional<Timestamp> created_at = std::nullopt);

    /// Run the query pipeline
    /// @throws ValidationError for malformed input
    QueryOutcome Query(const QueryRequest& request,
                       const CancellationToken& cancel = CancellationToken());

    /// Apply decay to an owner's records
    /// @param as_of Reference time; now when unset
    /// @throws ValidationError for a malformed owner id
    DecayReport Maintain(const std::string& owner_id,
                         std::optional<Timestamp> as_of = std::nullopt);

    /// Hard-delete every record of an owner
    /// @return Number of records deleted; 0 for an owner without records
    /// @throws ValidationError for a malformed owner id
    size_t Purge(const std::string& owner_id);

    // ========================================================================
    // History access
    // ========================================================================

    /// Records of an owner in chronological order, optionally bounded
    std::vector<Record> Timeline(const std::string& owner_id,
                                 std::optional<Timestamp> from = std::nullopt,
                                 std::optional<Timestamp> to = std::nullopt);

    /// @throws NotFoundError if no record has this id
    Record GetRecord(RecordID id);

    /// Category counts, date span, health and recurring patterns
    MemorySummary Summary(const std::string& owner_id,
                          std::optional<Timestamp> as_of = std::nullopt);

    /// Occurrences of a symptom in the `window_days` before `as_of` (now when unset)
    /// @throws ValidationError for a malformed owner id, a blank symptom or
    ///         a non-positive window
    SymptomProgression SymptomProgressionFor(const std::string& owner_id,
                                             const std::string& symptom,
                                             int64_t window_days = 365,
                                             std::optional<Timestamp> as_of = std::nullopt);

    // ========================================================================
    // Accessors
    // ========================================================================

    std::shared_ptr<RecordStore> GetStore() const { return store_; }
    std::shared_ptr<IEmbeddingProvider> GetEmbedder() const { return embedder_; }
    const ReinforcementEngine& GetReinforcementEngine() const { return *reinforcer_; }
    const QueryOrchestrator& GetOrchestrator() const { return *orchestrator_; }
    const OwnerLockTable& GetLockTable() const { return *locks_; }
    const ServiceConfig& GetConfig() const { return config_; }

private:
    ServiceConfig config_;
    InputValidator input_validator_;

    std::shared_ptr<RecordStore> store_;
    std::shared_ptr<IEmbeddingProvider> embedder_;
    std::shared_ptr<OwnerLockTable> locks_;
    std::shared_ptr<TimeWeightedRanker> ranker_;
    std::shared_ptr<ReinforcementEngine> reinforcer_;
    std::shared_ptr<ForgottenInsightDetector> detector_;
    std::unique_ptr<QueryOrchestrator> orchestrator_;

    // Ingest embedding calls
    DeadlineExecutor collaborator_calls_;
};

} // namespace careledger
