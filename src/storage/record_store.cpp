// File: src/storage/record_store.cpp
#include "storage/record_store.hpp"
#include "storage/memory_backend.hpp"
#include "storage/persistent_backend.hpp"
#include "core/errors.hpp"

namespace careledger {

std::unique_ptr<RecordStore> CreateRecordStore(const StoreConfig& config) {
    if (config.backend == "memory") {
        MemoryBackend::Config memory_config;
        memory_config.initial_capacity = config.initial_capacity;
        return std::make_unique<MemoryBackend>(memory_config);
    }

    if (config.backend == "sqlite") {
        PersistentBackend::Config sqlite_config;
        sqlite_config.db_path = config.db_path;
        sqlite_config.enable_wal = config.enable_wal;
        return std::make_unique<PersistentBackend>(sqlite_config);
    }

    throw ValidationError("Unknown storage backend: '" + config.backend +
                          "' (expected 'memory' or 'sqlite')");
}

} // namespace careledger
