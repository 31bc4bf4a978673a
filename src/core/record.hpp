// File: src/core/record.hpp
#pragma once

#include "core/types.hpp"
#include <optional>
#include <string>
#include <vector>
#include <iosfwd>

namespace careledger {

// RecordContent: text payload plus optional structured fields
struct RecordContent {
    // Free text of the observation (note, report, transcript, ...)
    std::string text;

    // Record type, e.g. "symptom", "doctor_note", "prescription", "report"
    std::string category;

    // Free-form tags
    std::vector<std::string> tags;

    bool operator==(const RecordContent& other) const {
        return text == other.text && category == other.category && tags == other.tags;
    }
    bool operator!=(const RecordContent& other) const { return !(*this == other); }
};

// Record: one stored observation belonging to exactly one owner
//
// Identity, owner, content, embedding and creation time are fixed at
// construction. Only the retrieval statistics (access count, memory weight,
// reinforcement level and the two bookkeeping timestamps) change afterwards,
// and only through the reinforcement and decay engine.
class Record {
public:
    static constexpr double kInitialMemoryWeight = 1.0;

    // Constructors
    Record() = default;
    Record(RecordID id,
           std::string owner_id,
           RecordContent content,
           Embedding embedding,
           Timestamp created_at);

    // Immutable identity
    RecordID GetID() const { return id_; }
    const std::string& GetOwnerID() const { return owner_id_; }
    const RecordContent& GetContent() const { return content_; }
    const Embedding& GetEmbedding() const { return embedding_; }
    Timestamp GetCreatedAt() const { return created_at_; }

    // Retrieval statistics
    uint32_t GetAccessCount() const { return access_count_; }
    double GetMemoryWeight() const { return memory_weight_; }
    uint32_t GetReinforcementLevel() const { return reinforcement_level_; }
    std::optional<Timestamp> GetLastAccessed() const { return last_accessed_; }
    std::optional<Timestamp> GetLastDecayAt() const { return last_decay_at_; }

    void SetAccessCount(uint32_t count) { access_count_ = count; }
    void SetMemoryWeight(double weight) { memory_weight_ = weight; }
    void SetReinforcementLevel(uint32_t level) { reinforcement_level_ = level; }
    void SetLastAccessed(Timestamp when) { last_accessed_ = when; }
    void SetLastDecayAt(Timestamp when) { last_decay_at_ = when; }

    // Age relative to a reference time
    int64_t AgeInDaysAt(Timestamp as_of) const { return AgeInDays(created_at_, as_of); }

    // True if `other` has the same identity, owner, content, embedding and
    // creation time (the fields no update may change)
    bool SameImmutableFields(const Record& other) const;

    // Serialization
    void Serialize(std::ostream& out) const;
    static Record Deserialize(std::istream& in);

    // String representation
    std::string ToString() const;

    // Memory footprint estimation
    size_t EstimateMemoryUsage() const;

private:
    // Core identity and data
    RecordID id_;
    std::string owner_id_;
    RecordContent content_;
    Embedding embedding_;
    Timestamp created_at_;

    // Retrieval statistics
    uint32_t access_count_{0};
    double memory_weight_{kInitialMemoryWeight};
    uint32_t reinforcement_level_{0};
    std::optional<Timestamp> last_accessed_;
    std::optional<Timestamp> last_decay_at_;
};

} // namespace careledger
