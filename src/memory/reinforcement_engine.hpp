// File: src/memory/reinforcement_engine.hpp
#pragma once

#include "core/record.hpp"
#include "storage/record_store.hpp"
#include "storage/owner_lock_table.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace careledger {

/// Result of reinforcing a batch of ranked records
struct ReinforcementReport {
    size_t applied{0};
    size_t failed{0};
    size_t level_ups{0};

    /// Records whose update was logged and skipped
    std::vector<RecordID> failed_ids;
};

/// Result of one maintenance pass over an owner's records
struct DecayReport {
    std::string owner_id;
    Timestamp as_of;

    /// Records of the owner looked at
    size_t examined{0};

    /// Records whose weight was reduced (protected ones included)
    size_t decayed_count{0};

    /// Decayed records whose factor was clamped to the protected floor
    size_t protected_count{0};

    /// Records not older than the decay threshold
    size_t skipped_young{0};

    /// Records already decayed less than a day before this pass
    size_t skipped_current{0};

    /// Records whose update failed (logged and skipped)
    size_t failed{0};
};

/// Evolves record weights: reinforcement on access, decay on maintenance
class IReinforcementEngine {
public:
    virtual ~IReinforcementEngine() = default;

    /// Reinforce one record of `owner_id` as accessed at `now`
    /// @return The record after the update
    /// @throws NotFoundError if the record does not exist or belongs to another owner
    /// @throws ConcurrencyConflictError if the owner's lock cannot be taken
    virtual Record Reinforce(const std::string& owner_id, RecordID id, Timestamp now) = 0;

    /// Reinforce every listed record once; failures are logged and counted,
    /// never thrown
    virtual ReinforcementReport ReinforceBatch(const std::string& owner_id,
                                               const std::vector<RecordID>& ids,
                                               Timestamp now) = 0;

    /// Apply age-based decay to every record of `owner_id`
    /// @throws ConcurrencyConflictError if the owner's lock cannot be taken
    virtual DecayReport ApplyDecay(const std::string& owner_id, Timestamp as_of) = 0;
};

/// ReinforcementEngine: access-driven reinforcement and age-driven decay
///
/// Reinforce adds `base_increment` to the weight on every access, plus
/// `level_bonus` and one reinforcement level whenever the new access count
/// is a multiple of `level_interval`. No upper bound is applied.
///
/// ApplyDecay multiplies the weight of every record older than
/// `decay_threshold_days` by
///   max(min_decay, 1 - (age_days - decay_threshold_days) / decay_scale)
/// and clamps that factor to at least `protected_floor` for records accessed
/// `protection_access_threshold` times or more. A record whose last decay
/// was applied less than one whole day before `as_of` (or later) is
/// skipped, so repeated passes within a day change nothing. Access counts and levels are
/// never reduced.
///
/// Thread-safety: every mutation runs under the owner's exclusive lock,
/// so concurrent reinforcements of one record are never lost and decay
/// never interleaves with reinforcement of the same owner.
class ReinforcementEngine : public IReinforcementEngine {
public:
    struct Config {
        Config() = default;

        /// Weight added on every access
        double base_increment{0.05};

        /// Extra weight added when the access count reaches a new level
        double level_bonus{0.15};

        /// Accesses per reinforcement level
        uint32_t level_interval{3};

        /// Records at most this old are not decayed
        int64_t decay_threshold_days{365};

        /// Days over the threshold for the factor to drop by 1.0
        double decay_scale{1000.0};

        /// Lowest decay factor for unprotected records
        double min_decay{0.3};

        /// Access count from which a record is protected
        uint32_t protection_access_threshold{5};

        /// Lowest decay factor for protected records
        double protected_floor{0.7};

        /// Weights never drop below this
        double min_weight{0.01};
    };

    /// How ApplyDecayTo treated one record
    enum class DecayOutcome {
        SKIPPED_YOUNG,
        SKIPPED_CURRENT,
        DECAYED,
        PROTECTED,
    };

    ReinforcementEngine(std::shared_ptr<RecordStore> store,
                        std::shared_ptr<OwnerLockTable> locks);
    ReinforcementEngine(std::shared_ptr<RecordStore> store,
                        std::shared_ptr<OwnerLockTable> locks,
                        const Config& config);

    // ========================================================================
    // IReinforcementEngine
    // ========================================================================

    Record Reinforce(const std::string& owner_id, RecordID id, Timestamp now) override;

    ReinforcementReport ReinforceBatch(const std::string& owner_id,
                                       const std::vector<RecordID>& ids,
                                       Timestamp now) override;

    DecayReport ApplyDecay(const std::string& owner_id, Timestamp as_of) override;

    // ========================================================================
    // Record-level rules (no storage, no locking)
    // ========================================================================

    /// Apply one access to `record`
    /// @return true if the access reached a new reinforcement level
    bool ApplyReinforcementTo(Record& record, Timestamp now) const;

    /// Apply the decay rule to `record` as of `as_of`
    DecayOutcome ApplyDecayTo(Record& record, Timestamp as_of) const;

    /// Unprotected decay factor for a given age; 1.0 at or below the threshold
    double ComputeDecayFactor(int64_t age_days) const;

    /// Factor actually applied, taking access-count protection into account
    double EffectiveDecayFactor(int64_t age_days, uint32_t access_count) const;

    // ========================================================================
    // Statistics
    // ========================================================================

    struct Stats {
        uint64_t reinforcements{0};
        uint64_t level_ups{0};
        uint64_t decays{0};
        uint64_t protected_decays{0};
        uint64_t failures{0};
        uint64_t maintenance_passes{0};
    };

    Stats GetStats() const;
    void ResetStats();

    const Config& GetConfig() const { return config_; }

private:
    std::shared_ptr<RecordStore> store_;
    std::shared_ptr<OwnerLockTable> locks_;
    Config config_;

    mutable std::mutex stats_mutex_;
    Stats stats_;

    /// Reinforce under an already held exclusive owner lock
    Record ReinforceLocked(const std::string& owner_id, RecordID id, Timestamp now, bool& leveled_up);

    void ValidateConfig() const;
};

} // namespace careledger
