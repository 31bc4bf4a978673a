// File: src/storage/record_store.hpp
#pragma once

#include "core/record.hpp"
#include <memory>
#include <vector>
#include <optional>
#include <string>

namespace careledger {

/// Storage statistics for monitoring store health
struct StorageStats {
    /// Total number of records stored
    size_t total_records{0};

    /// Number of distinct owners with at least one record
    size_t total_owners{0};

    /// Total memory usage in bytes (for in-memory storage)
    size_t memory_usage_bytes{0};

    /// Total disk usage in bytes (for persistent storage)
    size_t disk_usage_bytes{0};

    /// Total number of reads served
    uint64_t total_reads{0};

    /// Total number of writes applied
    uint64_t total_writes{0};
};

/// Filters for owner-scoped record listings
struct RecordQueryOptions {
    /// Maximum number of results to return (0 = unlimited)
    size_t max_results{0};

    /// Only records created at or after this time
    std::optional<Timestamp> created_after;

    /// Only records created at or before this time
    std::optional<Timestamp> created_before;

    /// Only records with this category
    std::optional<std::string> category;
};

/// Abstract interface for record storage backends
///
/// A store is a durable keyed collection of records, queryable by owner id,
/// creation time and category. Similarity ranking is done on top of
/// FindByOwner() by the ranking engine; stores never mix owners.
///
/// Update() only persists the mutable retrieval statistics. A record whose
/// owner, content, embedding or creation time differs from the stored copy
/// is rejected.
///
/// Thread Safety: All methods must be thread-safe. Read-modify-write
/// sequences spanning several calls need the owner lock from OwnerLockTable.
class RecordStore {
public:
    virtual ~RecordStore() = default;

    // ========================================================================
    // Core CRUD Operations
    // ========================================================================

    /// Store a new record
    /// @return true if stored, false if a record with this id already exists
    virtual bool Store(const Record& record) = 0;

    /// Retrieve a record by id
    virtual std::optional<Record> Retrieve(RecordID id) = 0;

    /// Persist the mutable statistics of an existing record
    /// @return false if the record doesn't exist or an immutable field differs
    virtual bool Update(const Record& record) = 0;

    /// Check if a record exists
    virtual bool Exists(RecordID id) const = 0;

    // ========================================================================
    // Owner-scoped Operations
    // ========================================================================

    /// All records of one owner, oldest first
    /// @throws StorageError if the records cannot be read in full
    virtual std::vector<Record> FindByOwner(
        const std::string& owner_id,
        const RecordQueryOptions& options = {}) = 0;

    /// Number of records belonging to an owner
    virtual size_t CountByOwner(const std::string& owner_id) const = 0;

    /// Hard-delete every record of an owner
    /// @return Number of records deleted (0 when the owner has none)
    /// @throws StorageError if the delete fails; no records are removed then
    virtual size_t PurgeOwner(const std::string& owner_id) = 0;

    /// All owner ids with at least one record, sorted
    virtual std::vector<std::string> ListOwners() const = 0;

    // ========================================================================
    // Statistics and Maintenance
    // ========================================================================

    virtual size_t Count() const = 0;
    virtual StorageStats GetStats() const = 0;

    /// Flush pending writes (no-op for in-memory stores)
    virtual void Flush() = 0;

    /// Reclaim space
    virtual void Compact() = 0;

    /// Remove every record of every owner
    /// WARNING: This operation cannot be undone
    /// @throws StorageError if a durable store fails to delete
    virtual void Clear() = 0;

    /// Create a snapshot at the specified path
    virtual bool CreateSnapshot(const std::string& path) = 0;

    /// Replace the contents with a snapshot
    virtual bool RestoreSnapshot(const std::string& path) = 0;
};

/// Backend selection for CreateRecordStore()
struct StoreConfig {
    /// "memory" or "sqlite"
    std::string backend{"sqlite"};

    /// SQLite database file (sqlite backend only)
    std::string db_path{"careledger.db"};

    /// Enable Write-Ahead Logging (sqlite backend only)
    bool enable_wal{true};

    /// Initial hash map capacity (memory backend only)
    size_t initial_capacity{10000};
};

/// Factory for record stores
/// @throws ValidationError for an unknown backend name
/// @throws StorageError if the backend cannot be opened
std::unique_ptr<RecordStore> CreateRecordStore(const StoreConfig& config);

} // namespace careledger
