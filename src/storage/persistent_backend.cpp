// File: src/storage/persistent_backend.cpp
#include "storage/persistent_backend.hpp"
#include "core/errors.hpp"
#include "core/logging.hpp"
#include <sstream>
#include <sys/stat.h>

namespace careledger {

namespace {

// Finalizes a prepared statement when it goes out of scope
class Statement {
public:
    Statement(sqlite3* db, const std::string& sql) {
        if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt_, nullptr) != SQLITE_OK) {
            GetLogger()->error("Failed to prepare '{}': {}", sql, sqlite3_errmsg(db));
            stmt_ = nullptr;
        }
    }
    ~Statement() { sqlite3_finalize(stmt_); }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    bool ok() const { return stmt_ != nullptr; }
    sqlite3_stmt* get() const { return stmt_; }

private:
    sqlite3_stmt* stmt_{nullptr};
};

} // namespace

// ============================================================================
// Constructor and Destructor
// ============================================================================

PersistentBackend::PersistentBackend(const Config& config)
    : config_(config) {

    int rc = sqlite3_open(config_.db_path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::string error = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw StorageError("Failed to open database '" + config_.db_path + "': " + error);
    }

    InitializeDatabase();
}

PersistentBackend::~PersistentBackend() {
    if (db_) {
        // close_v2 defers the close until outstanding statements are finalized
        if (sqlite3_close_v2(db_) != SQLITE_OK) {
            GetLogger()->warn("Closing {} failed: {}", config_.db_path, sqlite3_errmsg(db_));
        }
        db_ = nullptr;
    }
}

// ============================================================================
// Database Initialization
// ============================================================================

void PersistentBackend::InitializeDatabase() {
    std::lock_guard<std::mutex> lock(mutex_);

    sqlite3_busy_timeout(db_, config_.busy_timeout_ms);

    // Tuning pragmas are best effort; ExecuteSQL logs any failure
    if (config_.enable_wal && !ExecuteSQL("PRAGMA journal_mode=WAL;")) {
        GetLogger()->warn("WAL unavailable for {}, using the default journal", config_.db_path);
    }
    if (!ExecuteSQL("PRAGMA synchronous=" + config_.synchronous + ";") ||
        !ExecuteSQL("PRAGMA cache_size=-" + std::to_string(config_.cache_size_kb) + ";")) {
        GetLogger()->warn("Keeping default SQLite settings for {}", config_.db_path);
    }

    const char* create_table = R"(
        CREATE TABLE IF NOT EXISTS records (
            id INTEGER PRIMARY KEY,
            owner_id TEXT NOT NULL,
            category TEXT NOT NULL,
            created_at INTEGER NOT NULL,
            data BLOB NOT NULL
        );
    )";
    if (!ExecuteSQL(create_table) ||
        !ExecuteSQL("CREATE INDEX IF NOT EXISTS idx_records_owner ON records(owner_id, created_at);") ||
        !ExecuteSQL("CREATE INDEX IF NOT EXISTS idx_records_created ON records(created_at);")) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw StorageError("Failed to create records schema in " + config_.db_path);
    }

    RecordID::ValueType max_id = MaxIdUnlocked();
    RecordID::ReserveAbove(max_id);
    GetLogger()->debug("Opened {} ({} records)", config_.db_path, CountUnlocked());
}

bool PersistentBackend::ExecuteSQL(const std::string& sql) const {
    char* error_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_msg);

    if (rc != SQLITE_OK) {
        GetLogger()->error("SQL error in '{}': {}", sql, error_msg ? error_msg : "unknown");
        sqlite3_free(error_msg);
        return false;
    }
    return true;
}

// ============================================================================
// Core CRUD Operations
// ============================================================================

bool PersistentBackend::Store(const Record& record) {
    if (!record.GetID().IsValid()) {
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    Statement stmt(db_, "INSERT INTO records (id, owner_id, category, created_at, data) "
                        "VALUES (?, ?, ?, ?, ?);");
    if (!stmt.ok()) {
        return false;
    }

    std::string blob = SerializeRecord(record);
    sqlite3_bind_int64(stmt.get(), 1, static_cast<sqlite3_int64>(record.GetID().value()));
    sqlite3_bind_text(stmt.get(), 2, record.GetOwnerID().c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt.get(), 3, record.GetContent().category.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt.get(), 4, record.GetCreatedAt().ToMicros());
    sqlite3_bind_blob(stmt.get(), 5, blob.data(), static_cast<int>(blob.size()), SQLITE_TRANSIENT);

    // A duplicate id fails the PRIMARY KEY constraint
    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        return false;
    }
    total_writes_.fetch_add(1, std::memory_order_relaxed);
    return true;
}

std::optional<Record> PersistentBackend::Retrieve(RecordID id) {
    std::lock_guard<std::mutex> lock(mutex_);
    total_reads_.fetch_add(1, std::memory_order_relaxed);
    return RetrieveUnlocked(id);
}

std::optional<Record> PersistentBackend::RetrieveUnlocked(RecordID id) const {
    Statement stmt(db_, "SELECT data FROM records WHERE id = ?;");
    if (!stmt.ok()) {
        return std::nullopt;
    }

    sqlite3_bind_int64(stmt.get(), 1, static_cast<sqlite3_int64>(id.value()));
    if (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        return DeserializeRecord(sqlite3_column_blob(stmt.get(), 0),
                                 sqlite3_column_bytes(stmt.get(), 0));
    }
    return std::nullopt;
}

bool PersistentBackend::Update(const Record& record) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto existing = RetrieveUnlocked(record.GetID());
    if (!existing) {
        return false;
    }
    if (!existing->SameImmutableFields(record)) {
        GetLogger()->warn("Rejected update of {}: immutable fields differ",
                          record.GetID().ToString());
        return false;
    }

    Statement stmt(db_, "UPDATE records SET data = ? WHERE id = ?;");
    if (!stmt.ok()) {
        return false;
    }

    std::string blob = SerializeRecord(record);
    sqlite3_bind_blob(stmt.get(), 1, blob.data(), static_cast<int>(blob.size()), SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt.get(), 2, static_cast<sqlite3_int64>(record.GetID().value()));

    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        GetLogger()->error("Update of {} failed: {}", record.GetID().ToString(), sqlite3_errmsg(db_));
        return false;
    }
    total_writes_.fetch_add(1, std::memory_order_relaxed);
    return sqlite3_changes(db_) > 0;
}

bool PersistentBackend::Exists(RecordID id) const {
    std::lock_guard<std::mutex> lock(mutex_);

    Statement stmt(db_, "SELECT 1 FROM records WHERE id = ? LIMIT 1;");
    if (!stmt.ok()) {
        return false;
    }
    sqlite3_bind_int64(stmt.get(), 1, static_cast<sqlite3_int64>(id.value()));
    return sqlite3_step(stmt.get()) == SQLITE_ROW;
}

// ============================================================================
// Owner-scoped Operations
// ============================================================================

std::vector<Record> PersistentBackend::FindByOwner(
        const std::string& owner_id,
        const RecordQueryOptions& options) {
    std::lock_guard<std::mutex> lock(mutex_);
    total_reads_.fetch_add(1, std::memory_order_relaxed);

    std::string sql = "SELECT data FROM records WHERE owner_id = ?";
    if (options.created_after) sql += " AND created_at >= ?";
    if (options.created_before) sql += " AND created_at <= ?";
    if (options.category) sql += " AND category = ?";
    sql += " ORDER BY created_at ASC, id ASC";
    if (options.max_results > 0) sql += " LIMIT ?";
    sql += ";";

    std::vector<Record> results;
    Statement stmt(db_, sql);
    if (!stmt.ok()) {
        throw StorageError("Cannot read records of " + owner_id + ": " + sqlite3_errmsg(db_));
    }

    int index = 1;
    sqlite3_bind_text(stmt.get(), index++, owner_id.c_str(), -1, SQLITE_TRANSIENT);
    if (options.created_after) {
        sqlite3_bind_int64(stmt.get(), index++, options.created_after->ToMicros());
    }
    if (options.created_before) {
        sqlite3_bind_int64(stmt.get(), index++, options.created_before->ToMicros());
    }
    if (options.category) {
        sqlite3_bind_text(stmt.get(), index++, options.category->c_str(), -1, SQLITE_TRANSIENT);
    }
    if (options.max_results > 0) {
        sqlite3_bind_int64(stmt.get(), index++, static_cast<sqlite3_int64>(options.max_results));
    }

    int rc;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        results.push_back(DeserializeRecord(sqlite3_column_blob(stmt.get(), 0),
                                            sqlite3_column_bytes(stmt.get(), 0)));
    }
    // A partial scan must not pass for the owner's full history
    if (rc != SQLITE_DONE) {
        throw StorageError("Reading records of " + owner_id + " stopped after " +
                           std::to_string(results.size()) + ": " + sqlite3_errstr(rc));
    }
    return results;
}

size_t PersistentBackend::CountByOwner(const std::string& owner_id) const {
    std::lock_guard<std::mutex> lock(mutex_);

    Statement stmt(db_, "SELECT COUNT(*) FROM records WHERE owner_id = ?;");
    if (!stmt.ok()) {
        throw StorageError("Cannot count records of " + owner_id + ": " + sqlite3_errmsg(db_));
    }
    sqlite3_bind_text(stmt.get(), 1, owner_id.c_str(), -1, SQLITE_TRANSIENT);
    int rc = sqlite3_step(stmt.get());
    if (rc != SQLITE_ROW) {
        throw StorageError("Counting records of " + owner_id + " failed: " + sqlite3_errstr(rc));
    }
    return static_cast<size_t>(sqlite3_column_int64(stmt.get(), 0));
}

size_t PersistentBackend::PurgeOwner(const std::string& owner_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    Statement stmt(db_, "DELETE FROM records WHERE owner_id = ?;");
    if (!stmt.ok()) {
        throw StorageError("Cannot purge " + owner_id + ": " + sqlite3_errmsg(db_));
    }
    sqlite3_bind_text(stmt.get(), 1, owner_id.c_str(), -1, SQLITE_TRANSIENT);
    int rc = sqlite3_step(stmt.get());
    if (rc != SQLITE_DONE) {
        throw StorageError("Purge of " + owner_id + " failed, records kept: " + sqlite3_errstr(rc));
    }
    total_writes_.fetch_add(1, std::memory_order_relaxed);
    return static_cast<size_t>(sqlite3_changes(db_));
}

std::vector<std::string> PersistentBackend::ListOwners() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<std::string> owners;
    Statement stmt(db_, "SELECT DISTINCT owner_id FROM records ORDER BY owner_id;");
    if (!stmt.ok()) {
        throw StorageError(std::string("Cannot list owners: ") + sqlite3_errmsg(db_));
    }
    int rc;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        owners.emplace_back(reinterpret_cast<const char*>(sqlite3_column_text(stmt.get(), 0)));
    }
    if (rc != SQLITE_DONE) {
        throw StorageError(std::string("Listing owners failed: ") + sqlite3_errstr(rc));
    }
    return owners;
}

// ============================================================================
// Statistics and Maintenance
// ============================================================================

size_t PersistentBackend::CountUnlocked() const {
    Statement stmt(db_, "SELECT COUNT(*) FROM records;");
    if (stmt.ok() && sqlite3_step(stmt.get()) == SQLITE_ROW) {
        return static_cast<size_t>(sqlite3_column_int64(stmt.get(), 0));
    }
    return 0;
}

size_t PersistentBackend::CountOwnersUnlocked() const {
    Statement stmt(db_, "SELECT COUNT(DISTINCT owner_id) FROM records;");
    if (stmt.ok() && sqlite3_step(stmt.get()) == SQLITE_ROW) {
        return static_cast<size_t>(sqlite3_column_int64(stmt.get(), 0));
    }
    return 0;
}

RecordID::ValueType PersistentBackend::MaxIdUnlocked() const {
    Statement stmt(db_, "SELECT COALESCE(MAX(id), 0) FROM records;");
    if (stmt.ok() && sqlite3_step(stmt.get()) == SQLITE_ROW) {
        return static_cast<RecordID::ValueType>(sqlite3_column_int64(stmt.get(), 0));
    }
    return 0;
}

size_t PersistentBackend::Count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return CountUnlocked();
}

StorageStats PersistentBackend::GetStats() const {
    std::lock_guard<std::mutex> lock(mutex_);

    StorageStats stats;
    stats.total_records = CountUnlocked();
    stats.total_owners = CountOwnersUnlocked();
    stats.disk_usage_bytes = GetDatabaseSize();
    stats.memory_usage_bytes = 0;  // SQLite manages its own cache
    stats.total_reads = total_reads_.load(std::memory_order_relaxed);
    stats.total_writes = total_writes_.load(std::memory_order_relaxed);
    return stats;
}

void PersistentBackend::Flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (config_.enable_wal && !ExecuteSQL("PRAGMA wal_checkpoint(FULL);")) {
        GetLogger()->warn("WAL checkpoint of {} did not complete", config_.db_path);
    }
}

void PersistentBackend::Compact() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!ExecuteSQL("VACUUM;")) {
        GetLogger()->warn("VACUUM of {} failed, space not reclaimed", config_.db_path);
    }
}

void PersistentBackend::Clear() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!ExecuteSQL("DELETE FROM records;")) {
        throw StorageError("Failed to clear records in " + config_.db_path);
    }
    total_reads_.store(0, std::memory_order_relaxed);
    total_writes_.store(0, std::memory_order_relaxed);
}

// ============================================================================
// Snapshot and Restore
// ============================================================================

bool PersistentBackend::CreateSnapshot(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (config_.enable_wal && !ExecuteSQL("PRAGMA wal_checkpoint(FULL);")) {
        GetLogger()->warn("Snapshot of {} taken without a WAL checkpoint", config_.db_path);
    }

    sqlite3* backup_db = nullptr;
    if (sqlite3_open(path.c_str(), &backup_db) != SQLITE_OK) {
        GetLogger()->error("Cannot open snapshot {}", path);
        sqlite3_close(backup_db);
        return false;
    }

    sqlite3_backup* backup = sqlite3_backup_init(backup_db, "main", db_, "main");
    if (!backup) {
        sqlite3_close(backup_db);
        return false;
    }

    int step_rc = sqlite3_backup_step(backup, -1);  // Copy all pages
    int finish_rc = sqlite3_backup_finish(backup);
    sqlite3_close(backup_db);

    if (step_rc != SQLITE_DONE || finish_rc != SQLITE_OK) {
        GetLogger()->error("Snapshot to {} failed: {}", path, sqlite3_errstr(finish_rc));
        return false;
    }
    return true;
}

bool PersistentBackend::RestoreSnapshot(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);

    sqlite3* backup_db = nullptr;
    if (sqlite3_open_v2(path.c_str(), &backup_db, SQLITE_OPEN_READONLY, nullptr) != SQLITE_OK) {
        GetLogger()->error("Cannot open snapshot {}", path);
        sqlite3_close(backup_db);
        return false;
    }

    sqlite3_backup* backup = sqlite3_backup_init(db_, "main", backup_db, "main");
    if (!backup) {
        sqlite3_close(backup_db);
        return false;
    }

    int step_rc = sqlite3_backup_step(backup, -1);
    int finish_rc = sqlite3_backup_finish(backup);
    sqlite3_close(backup_db);

    if (step_rc != SQLITE_DONE || finish_rc != SQLITE_OK) {
        GetLogger()->error("Restore from {} failed: {}", path, sqlite3_errstr(finish_rc));
        return false;
    }

    RecordID::ReserveAbove(MaxIdUnlocked());
    return true;
}

// ============================================================================
// Helper Methods
// ============================================================================

std::string PersistentBackend::SerializeRecord(const Record& record) {
    std::ostringstream oss(std::ios::binary);
    record.Serialize(oss);
    return oss.str();
}

Record PersistentBackend::DeserializeRecord(const void* data, int size) {
    std::string str(static_cast<const char*>(data), static_cast<size_t>(size));
    std::istringstream iss(str, std::ios::binary);
    try {
        return Record::Deserialize(iss);
    } catch (const std::runtime_error& e) {
        throw StorageError(std::string("Corrupt record blob: ") + e.what());
    }
}

size_t PersistentBackend::GetDatabaseSize() const {
    struct stat st;
    if (stat(config_.db_path.c_str(), &st) == 0) {
        return static_cast<size_t>(st.st_size);
    }
    return 0;
}

} // namespace careledger
