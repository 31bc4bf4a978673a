// File: src/core/types.cpp
#include "core/types.hpp"
#include <sstream>
#include <iomanip>
#include <stdexcept>
#include <istream>
#include <ostream>

namespace careledger {

// Static member initialization
std::atomic<RecordID::ValueType> RecordID::next_id_{1};

RecordID RecordID::Generate() {
    // Thread-safe atomic increment
    ValueType new_id = next_id_.fetch_add(1, std::memory_order_relaxed);
    return RecordID(new_id);
}

void RecordID::ReserveAbove(ValueType value) {
    ValueType current = next_id_.load(std::memory_order_relaxed);
    while (current <= value &&
           !next_id_.compare_exchange_weak(current, value + 1, std::memory_order_relaxed)) {
    }
}

std::string RecordID::ToString() const {
    if (!IsValid()) {
        return "RecordID(INVALID)";
    }
    std::ostringstream oss;
    oss << "RecordID(" << std::hex << std::setw(16) << std::setfill('0') << value_ << ")";
    return oss.str();
}

void RecordID::Serialize(std::ostream& out) const {
    out.write(reinterpret_cast<const char*>(&value_), sizeof(value_));
}

RecordID RecordID::Deserialize(std::istream& in) {
    ValueType value;
    in.read(reinterpret_cast<char*>(&value), sizeof(value));
    return RecordID(value);
}

// ============================================================================
// Calendar helpers (proleptic Gregorian, UTC)
// ============================================================================

namespace {

int64_t DaysFromCivil(int64_t y, unsigned m, unsigned d) {
    y -= m <= 2;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

void CivilFromDays(int64_t z, int64_t& y, unsigned& m, unsigned& d) {
    z += 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    d = doy - (153 * mp + 2) / 5 + 1;
    m = mp < 10 ? mp + 3 : mp - 9;
    y = static_cast<int64_t>(yoe) + era * 400 + (m <= 2);
}

int64_t FloorDiv(int64_t a, int64_t b) {
    int64_t q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) {
        --q;
    }
    return q;
}

} // namespace

// ============================================================================
// Timestamp implementations
// ============================================================================

Timestamp Timestamp::Now() {
    return Timestamp(std::chrono::time_point_cast<Duration>(ClockType::now()));
}

Timestamp Timestamp::FromMicros(int64_t micros) {
    TimePoint tp{Duration(micros)};
    return Timestamp(tp);
}

Timestamp Timestamp::FromDays(int64_t days) {
    return FromMicros(days * kMicrosPerDay);
}

Timestamp Timestamp::ParseDate(const std::string& date) {
    int year = 0;
    unsigned month = 0;
    unsigned day = 0;
    char dash1 = 0;
    char dash2 = 0;

    std::istringstream iss(date);
    iss >> year >> dash1 >> month >> dash2 >> day;
    if (iss.fail() || dash1 != '-' || dash2 != '-' || !iss.eof()) {
        throw std::invalid_argument("Malformed date (expected YYYY-MM-DD): " + date);
    }
    if (month < 1 || month > 12 || day < 1 || day > 31) {
        throw std::invalid_argument("Date out of range: " + date);
    }

    return FromDays(DaysFromCivil(year, month, day));
}

int64_t Timestamp::ToMicros() const {
    return time_point_.time_since_epoch().count();
}

Timestamp Timestamp::PlusDays(int64_t days) const {
    return FromMicros(ToMicros() + days * kMicrosPerDay);
}

std::string Timestamp::ToDateString() const {
    int64_t year = 0;
    unsigned month = 0;
    unsigned day = 0;
    CivilFromDays(FloorDiv(ToMicros(), kMicrosPerDay), year, month, day);

    std::ostringstream oss;
    oss << std::setw(4) << std::setfill('0') << year << "-"
        << std::setw(2) << std::setfill('0') << month << "-"
        << std::setw(2) << std::setfill('0') << day;
    return oss.str();
}

std::string Timestamp::ToString() const {
    auto micros = ToMicros();
    auto seconds = micros / 1000000;
    auto remaining_micros = micros % 1000000;

    std::ostringstream oss;
    oss << "Timestamp(" << ToDateString() << ", " << seconds << "."
        << std::setw(6) << std::setfill('0') << remaining_micros << "s)";
    return oss.str();
}

void Timestamp::Serialize(std::ostream& out) const {
    int64_t micros = ToMicros();
    out.write(reinterpret_cast<const char*>(&micros), sizeof(micros));
}

Timestamp Timestamp::Deserialize(std::istream& in) {
    int64_t micros;
    in.read(reinterpret_cast<char*>(&micros), sizeof(micros));
    return FromMicros(micros);
}

int64_t AgeInDays(const Timestamp& created, const Timestamp& as_of) {
    int64_t micros = as_of.ToMicros() - created.ToMicros();
    if (micros <= 0) {
        return 0;
    }
    return micros / Timestamp::kMicrosPerDay;
}

double FractionalAgeInDays(const Timestamp& created, const Timestamp& as_of) {
    int64_t micros = as_of.ToMicros() - created.ToMicros();
    if (micros <= 0) {
        return 0.0;
    }
    return static_cast<double>(micros) / static_cast<double>(Timestamp::kMicrosPerDay);
}

// Enum implementations

const char* ToString(Partition partition) {
    switch (partition) {
        case Partition::RECENT: return "RECENT";
        case Partition::OLD: return "OLD";
        default: return "UNKNOWN";
    }
}

Partition ParsePartition(const std::string& str) {
    if (str == "RECENT") return Partition::RECENT;
    if (str == "OLD") return Partition::OLD;
    throw std::invalid_argument("Unknown Partition: " + str);
}

} // namespace careledger
