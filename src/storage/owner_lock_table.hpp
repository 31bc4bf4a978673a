// File: src/storage/owner_lock_table.hpp
#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace careledger {

/// Per-owner reader/writer locks
///
/// Ranking takes an owner's lock shared so that one call sees a consistent
/// snapshot of that owner's weights. Reinforce and ApplyDecay take it
/// exclusively, which serializes every read-modify-write of one owner's
/// records. Owners never contend with each other.
///
/// Acquisition waits at most `timeout` per attempt and retries `retries`
/// times before throwing ConcurrencyConflictError, so no caller blocks
/// indefinitely.
class OwnerLockTable {
public:
    struct Config {
        /// Wait per acquisition attempt
        std::chrono::milliseconds timeout{1000};

        /// Additional attempts after the first one times out
        int retries{3};
    };

    using SharedGuard = std::shared_lock<std::shared_timed_mutex>;
    using ExclusiveGuard = std::unique_lock<std::shared_timed_mutex>;

    OwnerLockTable();
    explicit OwnerLockTable(const Config& config);

    OwnerLockTable(const OwnerLockTable&) = delete;
    OwnerLockTable& operator=(const OwnerLockTable&) = delete;

    /// @throws ConcurrencyConflictError when every attempt times out
    SharedGuard LockShared(const std::string& owner_id);

    /// @throws ConcurrencyConflictError when every attempt times out
    ExclusiveGuard LockExclusive(const std::string& owner_id);

    /// Number of owners that have a lock entry
    size_t Size() const;

    /// Number of acquisitions that needed more than one attempt
    uint64_t GetContendedCount() const;

    const Config& GetConfig() const { return config_; }

private:
    Config config_;

    mutable std::mutex table_mutex_;
    std::unordered_map<std::string, std::shared_ptr<std::shared_timed_mutex>> locks_;
    uint64_t contended_{0};

    std::shared_ptr<std::shared_timed_mutex> GetOrCreate(const std::string& owner_id);
    void RecordContention();
};

} // namespace careledger
