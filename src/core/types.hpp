// File: src/core/types.hpp
#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <atomic>
#include <chrono>
#include <vector>
#include <iosfwd>

namespace careledger {

// RecordID: Unique identifier for stored records
// Uses 64-bit integer for efficiency and range
class RecordID {
public:
    // Type alias for underlying storage
    using ValueType = uint64_t;

    // Default constructor creates invalid ID
    RecordID() : value_(kInvalidID) {}

    // Explicit constructor from value
    explicit RecordID(ValueType value) : value_(value) {}

    // Generate new unique ID (thread-safe)
    static RecordID Generate();

    // Make sure future Generate() calls return values above `value`.
    // Used when a durable store is reopened with ids already assigned.
    static void ReserveAbove(ValueType value);

    // Check if ID is valid
    bool IsValid() const { return value_ != kInvalidID; }

    // Get underlying value
    ValueType value() const { return value_; }

    // Comparison operators
    bool operator==(const RecordID& other) const { return value_ == other.value_; }
    bool operator!=(const RecordID& other) const { return value_ != other.value_; }
    bool operator<(const RecordID& other) const { return value_ < other.value_; }
    bool operator>(const RecordID& other) const { return value_ > other.value_; }
    bool operator<=(const RecordID& other) const { return value_ <= other.value_; }
    bool operator>=(const RecordID& other) const { return value_ >= other.value_; }

    // String conversion for debugging
    std::string ToString() const;

    // Serialization
    void Serialize(std::ostream& out) const;
    static RecordID Deserialize(std::istream& in);

    // Hash support for std::unordered_map
    struct Hash {
        size_t operator()(const RecordID& id) const {
            return std::hash<ValueType>()(id.value_);
        }
    };

private:
    static constexpr ValueType kInvalidID = 0;
    static std::atomic<ValueType> next_id_;

    ValueType value_;
};

// Timestamp: Microsecond-precision wall-clock time point.
// Record ages are calendar ages, so this is backed by the system clock.
class Timestamp {
public:
    using ClockType = std::chrono::system_clock;
    using Duration = std::chrono::microseconds;
    using TimePoint = std::chrono::time_point<ClockType, Duration>;

    static constexpr int64_t kMicrosPerDay = 86400LL * 1000000LL;

    // Create timestamp for current time
    static Timestamp Now();

    // Create timestamp from microseconds since the Unix epoch
    static Timestamp FromMicros(int64_t micros);

    // Create timestamp from whole days since the Unix epoch
    static Timestamp FromDays(int64_t days);

    // Parse a calendar date "YYYY-MM-DD" (midnight UTC)
    // @throws std::invalid_argument on malformed input
    static Timestamp ParseDate(const std::string& date);

    // Default constructor creates zero timestamp (the epoch)
    Timestamp() : time_point_(TimePoint{}) {}

    // Get microseconds since epoch
    int64_t ToMicros() const;

    // Shift by a number of days (may be negative)
    Timestamp PlusDays(int64_t days) const;

    // Get duration since another timestamp
    Duration operator-(const Timestamp& other) const {
        return std::chrono::duration_cast<Duration>(time_point_ - other.time_point_);
    }

    // Comparison operators
    bool operator<(const Timestamp& other) const { return time_point_ < other.time_point_; }
    bool operator>(const Timestamp& other) const { return time_point_ > other.time_point_; }
    bool operator<=(const Timestamp& other) const { return time_point_ <= other.time_point_; }
    bool operator>=(const Timestamp& other) const { return time_point_ >= other.time_point_; }
    bool operator==(const Timestamp& other) const { return time_point_ == other.time_point_; }
    bool operator!=(const Timestamp& other) const { return time_point_ != other.time_point_; }

    // Calendar date "YYYY-MM-DD" (UTC)
    std::string ToDateString() const;

    // String conversion
    std::string ToString() const;

    // Serialization
    void Serialize(std::ostream& out) const;
    static Timestamp Deserialize(std::istream& in);

private:
    explicit Timestamp(TimePoint tp) : time_point_(tp) {}
    TimePoint time_point_;
};

// Whole days elapsed from `created` to `as_of`; 0 if `as_of` is earlier
int64_t AgeInDays(const Timestamp& created, const Timestamp& as_of);

// Fractional days elapsed from `created` to `as_of`; 0 if `as_of` is earlier
double FractionalAgeInDays(const Timestamp& created, const Timestamp& as_of);

// Embedding: fixed-length numeric vector produced by an embedding provider
using Embedding = std::vector<float>;

// Partition: recency bucket a ranked candidate falls into
enum class Partition : uint8_t {
    RECENT = 0,   // younger than the recent window (180 days by default)
    OLD = 1,      // at or beyond the recent window
};

// Convert Partition to string
const char* ToString(Partition partition);

// Parse Partition from string
Partition ParsePartition(const std::string& str);

} // namespace careledger

// Hash specialization for std::unordered_map
namespace std {
    template<>
    struct hash<careledger::RecordID> {
        size_t operator()(const careledger::RecordID& id) const {
            return careledger::RecordID::Hash()(id);
        }
    };
}
