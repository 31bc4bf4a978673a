// File: src/retrieval/ranking_engine.cpp
#include "retrieval/ranking_engine.hpp"
#include "similarity/cosine_similarity.hpp"
#include "core/logging.hpp"
#include <algorithm>
#include <stdexcept>

namespace careledger {

TimeWeightedRanker::TimeWeightedRanker(std::shared_ptr<RecordStore> store,
                                       std::shared_ptr<OwnerLockTable> locks)
    : TimeWeightedRanker(std::move(store), std::move(locks), Config{}) {
}

TimeWeightedRanker::TimeWeightedRanker(std::shared_ptr<RecordStore> store,
                                       std::shared_ptr<OwnerLockTable> locks,
                                       const Config& config)
    : store_(std::move(store)),
      locks_(std::move(locks)),
      config_(config) {
    if (!store_ || !locks_) {
        throw std::invalid_argument("TimeWeightedRanker requires a store and a lock table");
    }
    if (config_.recent_window_days <= 0) {
        throw std::invalid_argument("recent_window_days must be positive");
    }
}

RankedCandidate TimeWeightedRanker::Score(const Record& record,
                                          const Embedding& query_embedding,
                                          double time_weight,
                                          Timestamp as_of,
                                          int64_t recent_window_days) {
    RankedCandidate candidate;
    candidate.record_id = record.GetID();
    candidate.similarity_score = CosineSimilarity(query_embedding, record.GetEmbedding());
    candidate.age_days = record.AgeInDaysAt(as_of);
    candidate.recency_score = 1.0 / (1.0 + static_cast<double>(candidate.age_days));
    candidate.time_weighted_score = (1.0 - time_weight) * candidate.similarity_score +
                                    time_weight * candidate.recency_score;
    candidate.memory_weight = record.GetMemoryWeight();
    candidate.final_score = candidate.time_weighted_score * candidate.memory_weight;
    candidate.partition = candidate.age_days < recent_window_days ? Partition::RECENT
                                                                  : Partition::OLD;
    candidate.created_at = record.GetCreatedAt();
    candidate.content = record.GetContent();
    return candidate;
}

bool TimeWeightedRanker::RanksBefore(const RankedCandidate& a, const RankedCandidate& b) {
    if (a.final_score != b.final_score) {
        return a.final_score > b.final_score;
    }
    if (a.created_at != b.created_at) {
        return a.created_at > b.created_at;
    }
    return a.record_id < b.record_id;
}

RankingResult TimeWeightedRanker::Rank(const RankingQuery& query, Timestamp as_of) {
    RankingResult result;

    // Snapshot the owner's records under the shared lock
    std::vector<Record> records;
    {
        auto guard = locks_->LockShared(query.owner_id);
        records = store_->FindByOwner(query.owner_id);
    }
    result.records_scanned = records.size();

    std::vector<RankedCandidate> scored;
    scored.reserve(records.size());

    for (const auto& record : records) {
        // Stores never mix owners; a mismatch here is a store bug
        if (record.GetOwnerID() != query.owner_id) {
            GetLogger()->error("Store returned {} for owner {}", record.ToString(), query.owner_id);
            continue;
        }
        if (record.GetEmbedding().size() != query.query_embedding.size()) {
            GetLogger()->warn("Skipping {}: embedding dimension {} != {}",
                              record.GetID().ToString(), record.GetEmbedding().size(),
                              query.query_embedding.size());
            ++result.records_skipped;
            continue;
        }

        RankedCandidate candidate = Score(record, query.query_embedding, query.time_weight,
                                          as_of, config_.recent_window_days);
        if (candidate.similarity_score < query.similarity_floor) {
            continue;
        }
        scored.push_back(std::move(candidate));
    }

    std::sort(scored.begin(), scored.end(), RanksBefore);
    if (scored.size() > query.result_limit) {
        scored.resize(query.result_limit);
    }

    for (const auto& candidate : scored) {
        if (candidate.partition == Partition::RECENT) {
            result.recent.push_back(candidate);
        } else {
            result.old.push_back(candidate);
        }
    }
    result.candidates = std::move(scored);

    GetLogger()->debug("Ranked owner {}: {} scanned, {} returned ({} recent, {} old)",
                       query.owner_id, result.records_scanned, result.candidates.size(),
                       result.recent.size(), result.old.size());
    return result;
}

} // namespace careledger
