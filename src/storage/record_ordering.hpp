// File: src/storage/record_ordering.hpp
#pragma once

#include "storage/record_store.hpp"

namespace careledger {

/// Chronological order: creation time, then id
inline bool OldestFirst(const Record& a, const Record& b) {
    if (a.GetCreatedAt() != b.GetCreatedAt()) {
        return a.GetCreatedAt() < b.GetCreatedAt();
    }
    return a.GetID() < b.GetID();
}

/// True if the record passes the time range and category filters
inline bool MatchesQuery(const Record& record, const RecordQueryOptions& options) {
    if (options.created_after && record.GetCreatedAt() < *options.created_after) {
        return false;
    }
    if (options.created_before && record.GetCreatedAt() > *options.created_before) {
        return false;
    }
    if (options.category && record.GetContent().category != *options.category) {
        return false;
    }
    return true;
}

} // namespace careledger
