// File: src/retrieval/ranking_engine.hpp
#pragma once

#include "core/record.hpp"
#include "storage/record_store.hpp"
#include "storage/owner_lock_table.hpp"
#include <memory>
#include <string>
#include <vector>

namespace careledger {

/// Ranking request for one owner
struct RankingQuery {
    std::string owner_id;

    /// Embedding of the query text
    Embedding query_embedding;

    /// Maximum number of candidates returned
    size_t result_limit{10};

    /// Candidates with cosine similarity below this are discarded
    float similarity_floor{0.5f};

    /// Blend between similarity (0.0) and recency (1.0)
    double time_weight{0.3};
};

/// One scored record; never persisted
struct RankedCandidate {
    RecordID record_id;

    /// Cosine similarity in [-1, 1]
    float similarity_score{0.0f};

    /// 1 / (1 + age_days), in (0, 1]
    double recency_score{0.0};

    /// (1 - time_weight) * similarity + time_weight * recency
    double time_weighted_score{0.0};

    /// Record weight at ranking time
    double memory_weight{Record::kInitialMemoryWeight};

    /// time_weighted_score * memory_weight
    double final_score{0.0};

    int64_t age_days{0};
    Partition partition{Partition::RECENT};
    Timestamp created_at;

    /// Copy of the record content so later stages need no store access
    RecordContent content;
};

/// Ordered ranking output plus the recent/old split
struct RankingResult {
    /// Highest final score first, at most result_limit entries
    std::vector<RankedCandidate> candidates;

    /// Candidates younger than the recent window, in ranked order
    std::vector<RankedCandidate> recent;

    /// Candidates at or beyond the recent window, in ranked order
    std::vector<RankedCandidate> old;

    /// Owner records examined
    size_t records_scanned{0};

    /// Owner records skipped because their embedding dimension differs
    size_t records_skipped{0};
};

/// Ranks an owner's records against a query embedding
class IRankingEngine {
public:
    virtual ~IRankingEngine() = default;

    /// Rank the owner's records as of `as_of`
    /// An owner with no records yields an empty result.
    /// @throws ConcurrencyConflictError if the owner's lock cannot be taken
    virtual RankingResult Rank(const RankingQuery& query, Timestamp as_of) = 0;
};

/// Exact time-weighted cosine ranking
///
/// Every record of the owner is scored:
///   final = ((1 - w) * cosine + w / (1 + age_days)) * memory_weight
/// Candidates below the similarity floor are dropped. Ties on the final
/// score go to the more recently created record, then to the lower id.
///
/// The owner's records are read under the owner's shared lock, so a single
/// call never mixes weights from before and after a concurrent reinforcement.
/// Ranking itself does not mutate records.
class TimeWeightedRanker : public IRankingEngine {
public:
    struct Config {
        /// Records younger than this many days are tagged RECENT
        int64_t recent_window_days{180};
    };

    TimeWeightedRanker(std::shared_ptr<RecordStore> store,
                       std::shared_ptr<OwnerLockTable> locks);
    TimeWeightedRanker(std::shared_ptr<RecordStore> store,
                       std::shared_ptr<OwnerLockTable> locks,
                       const Config& config);

    RankingResult Rank(const RankingQuery& query, Timestamp as_of) override;

    /// Score a single record; exposed for tests and tooling
    static RankedCandidate Score(const Record& record,
                                 const Embedding& query_embedding,
                                 double time_weight,
                                 Timestamp as_of,
                                 int64_t recent_window_days);

    /// Strict ordering used to sort candidates
    static bool RanksBefore(const RankedCandidate& a, const RankedCandidate& b);

    const Config& GetConfig() const { return config_; }

private:
    std::shared_ptr<RecordStore> store_;
    std::shared_ptr<OwnerLockTable> locks_;
    Config config_;
};

} // namespace careledger
