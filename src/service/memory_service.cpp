// File: src/service/memory_service.cpp
#include "service/memory_service.hpp"
#include "pipeline/template_summarizer.hpp"
#include "pipeline/rule_based_recommender.hpp"
#include "pipeline/safety_validator.hpp"
#include "core/errors.hpp"
#include "core/logging.hpp"

namespace careledger {

MemoryService::MemoryService(std::shared_ptr<RecordStore> store,
                             std::shared_ptr<IEmbeddingProvider> embedder,
                             const ServiceConfig& config,
                             ServiceCollaborators collaborators)
    : config_(config),
      input_validator_(config.input),
      store_(std::move(store)),
      embedder_(std::move(embedder)) {
    if (!store_ || !embedder_) {
        throw std::invalid_argument("MemoryService requires a store and an embedding provider");
    }

    locks_ = std::make_shared<OwnerLockTable>(config_.locks);
    ranker_ = std::make_shared<TimeWeightedRanker>(store_, locks_, config_.ranking);
    reinforcer_ = std::make_shared<ReinforcementEngine>(store_, locks_, config_.memory);
    detector_ = std::make_shared<ForgottenInsightDetector>(store_, config_.insight);

    if (!collaborators.summarizer) {
        collaborators.summarizer = std::make_shared<TemplateSummarizer>();
    }
    if (!collaborators.recommender) {
        RuleBasedRecommender::Config recommender_config;
        recommender_config.recent_window_days = config_.ranking.recent_window_days;
        collaborators.recommender = std::make_shared<RuleBasedRecommender>(recommender_config);
    }
    if (!collaborators.output_validator) {
        collaborators.output_validator = std::make_shared<SafetyValidator>();
    }

    QueryOrchestrator::Components components;
    components.embedder = embedder_;
    components.ranker = ranker_;
    components.reinforcer = reinforcer_;
    components.detector = detector_;
    components.summarizer = collaborators.summarizer;
    components.recommender = collaborators.recommender;
    components.output_validator = collaborators.output_validator;

    orchestrator_ = std::make_unique<QueryOrchestrator>(std::move(components),
                                                        input_validator_,
                                                        config_.pipeline);

    GetLogger()->info("Memory service ready (embedder {}, {} records stored)",
                      embedder_->Name(), store_->Count());
}

// ============================================================================
// Boundary operations
// ============================================================================

RecordID MemoryService::Ingest(const std::string& owner_id,
                               const RecordContent& content,
                               std::optional<Timestamp> created_at) {
    input_validator_.ValidateOwnerId(owner_id);
    if (content.text.find_first_not_of(" \t\r\n") == std::string::npos) {
        throw ValidationError("Record text cannot be empty");
    }

    auto embedder = embedder_;
    std::string text = content.text;
    Embedding embedding = collaborator_calls_.Call(
        "embedding provider", config_.pipeline.collaborator_timeout,
        [embedder, text]() { return embedder->Embed(text); });

    if (embedding.size() != embedder_->Dimension()) {
        throw StorageError("Embedding provider returned " + std::to_string(embedding.size()) +
                           " values, expected " + std::to_string(embedder_->Dimension()));
    }

    Record record(RecordID::Generate(), owner_id, content, std::move(embedding),
                  created_at.value_or(Timestamp::Now()));

    {
        auto guard = locks_->LockExclusive(owner_id);
        if (!store_->Store(record)) {
            throw StorageError("Store rejected record " + record.GetID().ToString());
        }
    }

    GetLogger()->debug("Ingested {}", record.ToString());
    return record.GetID();
}

QueryOutcome MemoryService::Query(const QueryRequest& request, const CancellationToken& cancel) {
    return orchestrator_->Run(request, cancel);
}

DecayReport MemoryService::Maintain(const std::string& owner_id, std::optional<Timestamp> as_of) {
    input_validator_.ValidateOwnerId(owner_id);
    return reinforcer_->ApplyDecay(owner_id, as_of.value_or(Timestamp::Now()));
}

size_t MemoryService::Purge(const std::string& owner_id) {
    input_validator_.ValidateOwnerId(owner_id);

    size_t deleted = 0;
    {
        auto guard = locks_->LockExclusive(owner_id);
        deleted = store_->PurgeOwner(owner_id);
    }

    GetLogger()->info("Purged {} record(s) for {}", deleted, owner_id);
    return deleted;
}

// ============================================================================
// History access
// ============================================================================

std::vector<Record> MemoryService::Timeline(const std::string& owner_id,
                                            std::optional<Timestamp> from,
                                            std::optional<Timestamp> to) {
    input_validator_.ValidateOwnerId(owner_id);

    RecordQueryOptions options;
    options.created_after = from;
    options.created_before = to;

    auto guard = locks_->LockShared(owner_id);
    return store_->FindByOwner(owner_id, options);
}

Record MemoryService::GetRecord(RecordID id) {
    auto record = store_->Retrieve(id);
    if (!record) {
        throw NotFoundError("Record " + id.ToString() + " not found");
    }
    return *record;
}

MemorySummary MemoryService::Summary(const std::string& owner_id, std::optional<Timestamp> as_of) {
    std::vector<Record> records = Timeline(owner_id);
    return SummarizeMemory(owner_id, records, as_of.value_or(Timestamp::Now()), config_.health);
}

SymptomProgression MemoryService::SymptomProgressionFor(const std::string& owner_id,
                                                        const std::string& symptom,
                                                        int64_t window_days,
                                                        std::optional<Timestamp> as_of) {
    input_validator_.ValidateOwnerId(owner_id);
    if (symptom.find_first_not_of(" \t\r\n") == std::string::npos) {
        throw ValidationError("Symptom cannot be empty");
    }
    if (window_days <= 0) {
        throw ValidationError("Window must be at least one day, got " + std::to_string(window_days));
    }

    Timestamp end = as_of.value_or(Timestamp::Now());
    std::vector<Record> records = Timeline(owner_id, end.PlusDays(-window_days), end);
    return AnalyzeSymptomProgression(records, symptom, window_days, end, config_.health);
}

} // namespace careledger
