// File: src/memory/reinforcement_engine.cpp
#include "memory/reinforcement_engine.hpp"
#include "core/errors.hpp"
#include "core/logging.hpp"
#include <algorithm>

namespace careledger {

// ============================================================================
// Construction
// ============================================================================

ReinforcementEngine::ReinforcementEngine(std::shared_ptr<RecordStore> store,
                                         std::shared_ptr<OwnerLockTable> locks)
    : ReinforcementEngine(std::move(store), std::move(locks), Config{}) {
}

ReinforcementEngine::ReinforcementEngine(std::shared_ptr<RecordStore> store,
                                         std::shared_ptr<OwnerLockTable> locks,
                                         const Config& config)
    : store_(std::move(store)),
      locks_(std::move(locks)),
      config_(config) {
    if (!store_ || !locks_) {
        throw std::invalid_argument("ReinforcementEngine requires a store and a lock table");
    }
    ValidateConfig();
}

void ReinforcementEngine::ValidateConfig() const {
    if (config_.base_increment < 0.0 || config_.level_bonus < 0.0) {
        throw std::invalid_argument("Reinforcement increments must be non-negative");
    }
    if (config_.level_interval == 0) {
        throw std::invalid_argument("level_interval must be positive");
    }
    if (config_.decay_threshold_days < 0) {
        throw std::invalid_argument("decay_threshold_days must be non-negative");
    }
    if (config_.decay_scale <= 0.0) {
        throw std::invalid_argument("decay_scale must be positive");
    }
    if (config_.min_decay <= 0.0 || config_.min_decay > 1.0) {
        throw std::invalid_argument("min_decay must be in (0, 1]");
    }
    if (config_.protected_floor <= 0.0 || config_.protected_floor > 1.0) {
        throw std::invalid_argument("protected_floor must be in (0, 1]");
    }
    if (config_.min_weight <= 0.0) {
        throw std::invalid_argument("min_weight must be positive");
    }
}

// ============================================================================
// Record-level rules
// ============================================================================

bool ReinforcementEngine::ApplyReinforcementTo(Record& record, Timestamp now) const {
    uint32_t access_count = record.GetAccessCount() + 1;
    double increment = config_.base_increment;
    bool leveled_up = false;

    if (access_count % config_.level_interval == 0) {
        increment += config_.level_bonus;
        record.SetReinforcementLevel(record.GetReinforcementLevel() + 1);
        leveled_up = true;
    }

    record.SetAccessCount(access_count);
    record.SetMemoryWeight(std::max(record.GetMemoryWeight() + increment, config_.min_weight));
    record.SetLastAccessed(now);
    return leveled_up;
}

double ReinforcementEngine::ComputeDecayFactor(int64_t age_days) const {
    if (age_days <= config_.decay_threshold_days) {
        return 1.0;
    }
    double excess = static_cast<double>(age_days - config_.decay_threshold_days);
    return std::max(config_.min_decay, 1.0 - excess / config_.decay_scale);
}

double ReinforcementEngine::EffectiveDecayFactor(int64_t age_days, uint32_t access_count) const {
    double factor = ComputeDecayFactor(age_days);
    if (access_count >= config_.protection_access_threshold) {
        factor = std::max(factor, config_.protected_floor);
    }
    return factor;
}

ReinforcementEngine::DecayOutcome ReinforcementEngine::ApplyDecayTo(Record& record,
                                                                    Timestamp as_of) const {
    int64_t age_days = record.AgeInDaysAt(as_of);
    if (age_days <= config_.decay_threshold_days) {
        return DecayOutcome::SKIPPED_YOUNG;
    }

    // Age is counted in whole days, so at most one pass applies per day
    auto last_decay = record.GetLastDecayAt();
    if (last_decay && AgeInDays(*last_decay, as_of) < 1) {
        return DecayOutcome::SKIPPED_CURRENT;
    }

    double raw_factor = ComputeDecayFactor(age_days);
    double factor = EffectiveDecayFactor(age_days, record.GetAccessCount());
    double before = record.GetMemoryWeight();

    record.SetMemoryWeight(std::max(before * factor, config_.min_weight));
    record.SetLastDecayAt(as_of);

    GetLogger()->debug("Decay {}: age {}d, factor {:.3f}{}, weight {:.3f} -> {:.3f}",
                       record.GetID().ToString(), age_days, factor,
                       factor > raw_factor ? " (protected)" : "",
                       before, record.GetMemoryWeight());

    return factor > raw_factor ? DecayOutcome::PROTECTED : DecayOutcome::DECAYED;
}

// ============================================================================
// Store-backed operations
// ============================================================================

Record ReinforcementEngine::ReinforceLocked(const std::string& owner_id,
                                            RecordID id,
                                            Timestamp now,
                                            bool& leveled_up) {
    auto record = store_->Retrieve(id);
    if (!record || record->GetOwnerID() != owner_id) {
        throw NotFoundError("Record " + id.ToString() + " not found for owner " + owner_id);
    }

    uint32_t count_before = record->GetAccessCount();
    double weight_before = record->GetMemoryWeight();

    leveled_up = ApplyReinforcementTo(*record, now);

    if (!store_->Update(*record)) {
        throw std::runtime_error("Store rejected update of " + id.ToString());
    }

    GetLogger()->debug("Reinforce {}: access {} -> {}, weight {:.3f} -> {:.3f}{}",
                       id.ToString(), count_before, record->GetAccessCount(),
                       weight_before, record->GetMemoryWeight(),
                       leveled_up ? ", level up to " + std::to_string(record->GetReinforcementLevel())
                                  : std::string());
    return *record;
}

Record ReinforcementEngine::Reinforce(const std::string& owner_id, RecordID id, Timestamp now) {
    auto guard = locks_->LockExclusive(owner_id);

    bool leveled_up = false;
    Record updated = ReinforceLocked(owner_id, id, now, leveled_up);

    std::lock_guard<std::mutex> lock(stats_mutex_);
    ++stats_.reinforcements;
    if (leveled_up) {
        ++stats_.level_ups;
    }
    return updated;
}

ReinforcementReport ReinforcementEngine::ReinforceBatch(const std::string& owner_id,
                                                        const std::vector<RecordID>& ids,
                                                        Timestamp now) {
    ReinforcementReport report;
    if (ids.empty()) {
        return report;
    }

    OwnerLockTable::ExclusiveGuard guard;
    try {
        guard = locks_->LockExclusive(owner_id);
    } catch (const ConcurrencyConflictError& e) {
        GetLogger()->warn("Skipping reinforcement of {} records for {}: {}",
                          ids.size(), owner_id, e.what());
        report.failed = ids.size();
        report.failed_ids = ids;
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.failures += ids.size();
        return report;
    }

    for (const auto& id : ids) {
        try {
            bool leveled_up = false;
            ReinforceLocked(owner_id, id, now, leveled_up);
            ++report.applied;
            if (leveled_up) {
                ++report.level_ups;
            }
        } catch (const std::exception& e) {
            GetLogger()->warn("Reinforcement of {} skipped: {}", id.ToString(), e.what());
            ++report.failed;
            report.failed_ids.push_back(id);
        }
    }

    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats_.reinforcements += report.applied;
    stats_.level_ups += report.level_ups;
    stats_.failures += report.failed;
    return report;
}

DecayReport ReinforcementEngine::ApplyDecay(const std::string& owner_id, Timestamp as_of) {
    DecayReport report;
    report.owner_id = owner_id;
    report.as_of = as_of;

    auto guard = locks_->LockExclusive(owner_id);

    std::vector<Record> records = store_->FindByOwner(owner_id);
    report.examined = records.size();

    for (auto& record : records) {
        DecayOutcome outcome = ApplyDecayTo(record, as_of);
        if (outcome == DecayOutcome::SKIPPED_YOUNG) {
            ++report.skipped_young;
            continue;
        }
        if (outcome == DecayOutcome::SKIPPED_CURRENT) {
            ++report.skipped_current;
            continue;
        }

        if (!store_->Update(record)) {
            GetLogger()->warn("Decay of {} skipped: store rejected update",
                              record.GetID().ToString());
            ++report.failed;
            continue;
        }

        ++report.decayed_count;
        if (outcome == DecayOutcome::PROTECTED) {
            ++report.protected_count;
        }
    }

    GetLogger()->info("Maintenance for {} as of {}: {} examined, {} decayed ({} protected), "
                      "{} too young, {} already current, {} failed",
                      owner_id, as_of.ToDateString(), report.examined, report.decayed_count,
                      report.protected_count, report.skipped_young, report.skipped_current,
                      report.failed);

    std::lock_guard<std::mutex> lock(stats_mutex_);
    ++stats_.maintenance_passes;
    stats_.decays += report.decayed_count;
    stats_.protected_decays += report.protected_count;
    stats_.failures += report.failed;
    return report;
}

// ============================================================================
// Statistics
// ============================================================================

ReinforcementEngine::Stats ReinforcementEngine::GetStats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return stats_;
}

void ReinforcementEngine::ResetStats() {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats_ = Stats{};
}

} // namespace careledger
