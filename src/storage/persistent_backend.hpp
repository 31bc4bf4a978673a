// File: src/storage/persistent_backend.hpp
#pragma once

#include "storage/record_store.hpp"
#include <string>
#include <mutex>
#include <atomic>
#include <sqlite3.h>

namespace careledger {

/// Persistent record storage backend using SQLite
///
/// Records live in a single `records` table keyed by id, with the owner id,
/// category and creation time broken out into indexed columns and the full
/// record serialized into a blob. Features include:
/// - Durable writes with WAL (Write-Ahead Logging)
/// - Indices on owner_id and created_at for owner-scoped listings
/// - Compaction via VACUUM
/// - Id allocation resumes above the largest stored id after reopening
class PersistentBackend : public RecordStore {
public:
    /// Configuration for PersistentBackend
    struct Config {
        /// Path to the SQLite database file
        std::string db_path;

        /// Enable Write-Ahead Logging for better concurrency
        bool enable_wal{true};

        /// Cache size in KB (default: 10MB)
        size_t cache_size_kb{10240};

        /// Synchronous mode: FULL, NORMAL, or OFF
        std::string synchronous{"NORMAL"};

        /// How long a statement waits on a locked database file
        int busy_timeout_ms{5000};
    };

    /// @throws StorageError if the database cannot be opened or initialized
    explicit PersistentBackend(const Config& config);

    /// Destructor - closes database connection
    ~PersistentBackend() override;

    // Prevent copying (SQLite connection is not copyable)
    PersistentBackend(const PersistentBackend&) = delete;
    PersistentBackend& operator=(const PersistentBackend&) = delete;

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

    // SQLite database handle
    sqlite3* db_{nullptr};

    // One connection shared by all callers
    mutable std::mutex mutex_;

    // Statistics
    mutable std::atomic<uint64_t> total_reads_{0};
    mutable std::atomic<uint64_t> total_writes_{0};

    // ========================================================================
    // Helper Methods
    // ========================================================================

    /// Pragmas, schema and indices
    void InitializeDatabase();

    /// Execute a SQL statement, logging any error
    bool ExecuteSQL(const std::string& sql) const;

    /// Load one record by id; caller holds mutex_
    std::optional<Record> RetrieveUnlocked(RecordID id) const;

    /// Largest stored id, or 0; caller holds mutex_
    RecordID::ValueType MaxIdUnlocked() const;

    /// Internal helpers - assume mutex is already locked
    size_t CountUnlocked() const;
    size_t CountOwnersUnlocked() const;

    static std::string SerializeRecord(const Record& record);
    static Record DeserializeRecord(const void* data, int size);

    /// Get database file size in bytes
    size_t GetDatabaseSize() const;
};

} // namespace careledger
