// File: src/storage/owner_lock_table.cpp
#include "storage/owner_lock_table.hpp"
#include "core/errors.hpp"
#include "core/logging.hpp"

namespace careledger {

OwnerLockTable::OwnerLockTable()
    : OwnerLockTable(Config{}) {
}

OwnerLockTable::OwnerLockTable(const Config& config)
    : config_(config) {
    if (config_.timeout.count() <= 0) {
        throw std::invalid_argument("Lock timeout must be positive");
    }
    if (config_.retries < 0) {
        throw std::invalid_argument("Lock retries must be non-negative");
    }
}

std::shared_ptr<std::shared_timed_mutex> OwnerLockTable::GetOrCreate(const std::string& owner_id) {
    std::lock_guard<std::mutex> lock(table_mutex_);

    // Entries are never removed, so a guard never outlives its mutex
    auto& entry = locks_[owner_id];
    if (!entry) {
        entry = std::make_shared<std::shared_timed_mutex>();
    }
    return entry;
}

void OwnerLockTable::RecordContention() {
    std::lock_guard<std::mutex> lock(table_mutex_);
    ++contended_;
}

OwnerLockTable::SharedGuard OwnerLockTable::LockShared(const std::string& owner_id) {
    auto mutex = GetOrCreate(owner_id);

    for (int attempt = 0; attempt <= config_.retries; ++attempt) {
        SharedGuard guard(*mutex, std::defer_lock);
        if (guard.try_lock_for(config_.timeout)) {
            if (attempt > 0) {
                RecordContention();
            }
            return guard;
        }
        GetLogger()->debug("Shared lock on owner {} timed out (attempt {}/{})",
                           owner_id, attempt + 1, config_.retries + 1);
    }

    throw ConcurrencyConflictError("Could not lock owner '" + owner_id + "' for reading after " +
                                   std::to_string(config_.retries + 1) + " attempts");
}

OwnerLockTable::ExclusiveGuard OwnerLockTable::LockExclusive(const std::string& owner_id) {
    auto mutex = GetOrCreate(owner_id);

    for (int attempt = 0; attempt <= config_.retries; ++attempt) {
        ExclusiveGuard guard(*mutex, std::defer_lock);
        if (guard.try_lock_for(config_.timeout)) {
            if (attempt > 0) {
                RecordContention();
            }
            return guard;
        }
        GetLogger()->debug("Exclusive lock on owner {} timed out (attempt {}/{})",
                           owner_id, attempt + 1, config_.retries + 1);
    }

    throw ConcurrencyConflictError("Could not lock owner '" + owner_id + "' for writing after " +
                                   std::to_string(config_.retries + 1) + " attempts");
}

size_t OwnerLockTable::Size() const {
    std::lock_guard<std::mutex> lock(table_mutex_);
    return locks_.size();
}

uint64_t OwnerLockTable::GetContendedCount() const {
    std::lock_guard<std::mutex> lock(table_mutex_);
    return contended_;
}

} // namespace careledger
