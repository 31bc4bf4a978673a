// File: src/storage/memory_backend.cpp
#include "storage/memory_backend.hpp"
#include "storage/record_ordering.hpp"
#include "core/logging.hpp"
#include <fstream>
#include <algorithm>

namespace careledger {

namespace {

constexpr uint32_t kSnapshotVersion = 1;

} // namespace

MemoryBackend::MemoryBackend(const Config& config)
    : config_(config) {
    records_.reserve(config_.initial_capacity);
}

// ============================================================================
// Core CRUD Operations
// ============================================================================

bool MemoryBackend::Store(const Record& record) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    return InsertLocked(record);
}

bool MemoryBackend::InsertLocked(const Record& record) {
    RecordID id = record.GetID();
    if (!id.IsValid() || records_.find(id) != records_.end()) {
        return false;
    }

    records_.emplace(id, record);
    by_owner_[record.GetOwnerID()].insert(id);
    total_writes_.fetch_add(1, std::memory_order_relaxed);
    return true;
}

std::optional<Record> MemoryBackend::Retrieve(RecordID id) {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    total_reads_.fetch_add(1, std::memory_order_relaxed);

    auto it = records_.find(id);
    if (it != records_.end()) {
        return it->second;
    }
    return std::nullopt;
}

bool MemoryBackend::Update(const Record& record) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto it = records_.find(record.GetID());
    if (it == records_.end()) {
        return false;
    }

    if (!it->second.SameImmutableFields(record)) {
        GetLogger()->warn("Rejected update of {}: immutable fields differ",
                          record.GetID().ToString());
        return false;
    }

    it->second = record;
    total_writes_.fetch_add(1, std::memory_order_relaxed);
    return true;
}

bool MemoryBackend::Exists(RecordID id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return records_.find(id) != records_.end();
}

// ============================================================================
// Owner-scoped Operations
// ============================================================================

std::vector<Record> MemoryBackend::FindByOwner(
        const std::string& owner_id,
        const RecordQueryOptions& options) {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    total_reads_.fetch_add(1, std::memory_order_relaxed);

    std::vector<Record> results;
    auto owner_it = by_owner_.find(owner_id);
    if (owner_it == by_owner_.end()) {
        return results;
    }

    results.reserve(owner_it->second.size());
    for (const auto& id : owner_it->second) {
        const Record& record = records_.at(id);
        if (MatchesQuery(record, options)) {
            results.push_back(record);
        }
    }
    lock.unlock();

    std::sort(results.begin(), results.end(), OldestFirst);
    if (options.max_results > 0 && results.size() > options.max_results) {
        results.resize(options.max_results);
    }
    return results;
}

size_t MemoryBackend::CountByOwner(const std::string& owner_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = by_owner_.find(owner_id);
    return it == by_owner_.end() ? 0 : it->second.size();
}

size_t MemoryBackend::PurgeOwner(const std::string& owner_id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto owner_it = by_owner_.find(owner_id);
    if (owner_it == by_owner_.end()) {
        return 0;
    }

    size_t deleted = 0;
    for (const auto& id : owner_it->second) {
        deleted += records_.erase(id);
    }
    by_owner_.erase(owner_it);
    total_writes_.fetch_add(1, std::memory_order_relaxed);
    return deleted;
}

std::vector<std::string> MemoryBackend::ListOwners() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    std::vector<std::string> owners;
    owners.reserve(by_owner_.size());
    for (const auto& [owner, ids] : by_owner_) {
        if (!ids.empty()) {
            owners.push_back(owner);
        }
    }
    std::sort(owners.begin(), owners.end());
    return owners;
}

// ============================================================================
// Statistics and Maintenance
// ============================================================================

size_t MemoryBackend::Count() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return records_.size();
}

StorageStats MemoryBackend::GetStats() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    StorageStats stats;
    stats.total_records = records_.size();
    stats.total_owners = by_owner_.size();

    size_t estimated_memory = 0;
    for (const auto& [id, record] : records_) {
        estimated_memory += record.EstimateMemoryUsage();
    }
    stats.memory_usage_bytes = estimated_memory;
    stats.disk_usage_bytes = 0;
    stats.total_reads = total_reads_.load(std::memory_order_relaxed);
    stats.total_writes = total_writes_.load(std::memory_order_relaxed);
    return stats;
}

void MemoryBackend::Flush() {
    // Nothing buffered
}

void MemoryBackend::Compact() {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    // Rehash down when the table is mostly empty buckets
    if (records_.load_factor() < 0.5f) {
        records_.rehash(0);
    }
    for (auto it = by_owner_.begin(); it != by_owner_.end();) {
        if (it->second.empty()) {
            it = by_owner_.erase(it);
        } else {
            ++it;
        }
    }
}

void MemoryBackend::Clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    records_.clear();
    by_owner_.clear();
    total_reads_.store(0, std::memory_order_relaxed);
    total_writes_.store(0, std::memory_order_relaxed);
}

// ============================================================================
// Snapshot and Restore
// ============================================================================

bool MemoryBackend::CreateSnapshot(const std::string& path) {
    std::ofstream file(path, std::ios::binary);
    if (!file.is_open()) {
        GetLogger()->error("Cannot open snapshot file for writing: {}", path);
        return false;
    }

    std::shared_lock<std::shared_mutex> lock(mutex_);

    uint32_t version = kSnapshotVersion;
    uint64_t count = records_.size();
    file.write(reinterpret_cast<const char*>(&version), sizeof(version));
    file.write(reinterpret_cast<const char*>(&count), sizeof(count));

    for (const auto& [id, record] : records_) {
        record.Serialize(file);
    }

    file.close();
    return !file.fail();
}

bool MemoryBackend::RestoreSnapshot(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        GetLogger()->error("Cannot open snapshot file: {}", path);
        return false;
    }

    uint32_t version = 0;
    uint64_t count = 0;
    file.read(reinterpret_cast<char*>(&version), sizeof(version));
    file.read(reinterpret_cast<char*>(&count), sizeof(count));
    if (!file || version != kSnapshotVersion) {
        GetLogger()->error("Unsupported snapshot format in {}", path);
        return false;
    }

    // Decode everything first so a corrupt file leaves the store untouched
    std::vector<Record> loaded;
    loaded.reserve(count);
    try {
        for (uint64_t i = 0; i < count; ++i) {
            loaded.push_back(Record::Deserialize(file));
        }
    } catch (const std::runtime_error& e) {
        GetLogger()->error("Corrupt snapshot {}: {}", path, e.what());
        return false;
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    records_.clear();
    by_owner_.clear();
    records_.reserve(loaded.size());

    RecordID::ValueType max_id = 0;
    for (const auto& record : loaded) {
        InsertLocked(record);
        max_id = std::max(max_id, record.GetID().value());
    }
    RecordID::ReserveAbove(max_id);
    return true;
}

} // namespace careledger
