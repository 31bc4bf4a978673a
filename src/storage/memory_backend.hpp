// File: src/storage/memory_backend.hpp
#pragma once

#include "storage/record_store.hpp"
#include <unordered_map>
#include <unordered_set>
#include <shared_mutex>
#include <atomic>

namespace careledger {

/// In-memory record storage backend using hash maps
///
/// Records are kept in a hash map keyed by id, with a secondary index from
/// owner id to that owner's record ids. Thread-safe with shared_mutex for
/// concurrent read access. Contents are lost when the backend is destroyed
/// unless a snapshot is taken.
///
/// Features:
/// - O(1) lookup, insert, update
/// - Owner index so FindByOwner() and PurgeOwner() never scan other owners
/// - Snapshot/restore for data backup
class MemoryBackend : public RecordStore {
public:
    /// Configuration for MemoryBackend
    struct Config {
        /// Initial capacity for the hash map (pre-allocation)
        size_t initial_capacity{10000};
    };

    explicit MemoryBackend(const Config& config);
    ~MemoryBackend() override = default;

    // ========================================================================
    // RecordStore Interface Implementation
    // ========================================================================

    bool Store(const Record& record) override;
    std::optional<Record> Retrieve(RecordID id) override;
    bool Update(const Record& record) override;
    bool Exists(RecordID id) const override;

    std::vector<Record> FindByOwner(
        const std::string& owner_id,
        const RecordQueryOptions& options = {}) override;
    size_t CountByOwner(const std::string& owner_id) const override;
    size_t PurgeOwner(const std::string& owner_id) override;
    std::vector<std::string> ListOwners() const override;

    size_t Count() const override;
    StorageStats GetStats() const override;

    void Flush() override;
    void Compact() override;
    void Clear() override;

    bool CreateSnapshot(const std::string& path) override;
    bool RestoreSnapshot(const std::string& path) override;

private:
    Config config_;

    // Thread synchronization (shared_mutex allows multiple readers, single writer)
    mutable std::shared_mutex mutex_;

    // Main storage: hash map from RecordID to Record
    std::unordered_map<RecordID, Record> records_;

    // Owner index: owner id -> ids of that owner's records
    std::unordered_map<std::string, std::unordered_set<RecordID>> by_owner_;

    // Statistics tracking (atomics for lock-free updates)
    mutable std::atomic<uint64_t> total_reads_{0};
    mutable std::atomic<uint64_t> total_writes_{0};

    /// Insert without locking; caller holds the exclusive lock
    bool InsertLocked(const Record& record);
};

} // namespace careledger
