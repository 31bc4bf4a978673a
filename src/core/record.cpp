// File: src/core/record.cpp
#include "core/record.hpp"
#include <sstream>
#include <iomanip>
#include <stdexcept>
#include <istream>
#include <ostream>

namespace careledger {

namespace {

void WriteString(std::ostream& out, const std::string& value) {
    uint32_t length = static_cast<uint32_t>(value.size());
    out.write(reinterpret_cast<const char*>(&length), sizeof(length));
    out.write(value.data(), length);
}

/// Throw unless `in` still holds at least `needed` bytes. A corrupt length
/// prefix must fail here, before it sizes an allocation.
void RequireBytes(std::istream& in, uint64_t needed, const char* field) {
    std::streampos here = in.tellg();
    if (here < 0) {
        throw std::runtime_error(std::string("Unreadable record stream at ") + field);
    }
    in.seekg(0, std::ios::end);
    std::streampos end = in.tellg();
    in.seekg(here);
    if (end < here || needed > static_cast<uint64_t>(end - here)) {
        throw std::runtime_error(std::string("Corrupt record: ") + field + " length " +
                                 std::to_string(needed) + " exceeds remaining data");
    }
}

std::string ReadString(std::istream& in) {
    uint32_t length = 0;
    in.read(reinterpret_cast<char*>(&length), sizeof(length));
    if (!in) {
        throw std::runtime_error("Truncated record: string length");
    }
    RequireBytes(in, length, "string");
    std::string value(length, '\0');
    in.read(&value[0], length);
    if (!in) {
        throw std::runtime_error("Truncated record: string body");
    }
    return value;
}

void WriteOptionalTimestamp(std::ostream& out, const std::optional<Timestamp>& value) {
    uint8_t present = value.has_value() ? 1 : 0;
    out.write(reinterpret_cast<const char*>(&present), sizeof(present));
    if (present) {
        value->Serialize(out);
    }
}

std::optional<Timestamp> ReadOptionalTimestamp(std::istream& in) {
    uint8_t present = 0;
    in.read(reinterpret_cast<char*>(&present), sizeof(present));
    if (!present) {
        return std::nullopt;
    }
    return Timestamp::Deserialize(in);
}

} // namespace

Record::Record(RecordID id,
               std::string owner_id,
               RecordContent content,
               Embedding embedding,
               Timestamp created_at)
    : id_(id),
      owner_id_(std::move(owner_id)),
      content_(std::move(content)),
      embedding_(std::move(embedding)),
      created_at_(created_at) {
}

bool Record::SameImmutableFields(const Record& other) const {
    return id_ == other.id_ &&
           owner_id_ == other.owner_id_ &&
           content_ == other.content_ &&
           embedding_ == other.embedding_ &&
           created_at_ == other.created_at_;
}

void Record::Serialize(std::ostream& out) const {
    id_.Serialize(out);
    WriteString(out, owner_id_);

    // Content
    WriteString(out, content_.text);
    WriteString(out, content_.category);
    uint32_t tag_count = static_cast<uint32_t>(content_.tags.size());
    out.write(reinterpret_cast<const char*>(&tag_count), sizeof(tag_count));
    for (const auto& tag : content_.tags) {
        WriteString(out, tag);
    }

    // Embedding
    uint32_t dimension = static_cast<uint32_t>(embedding_.size());
    out.write(reinterpret_cast<const char*>(&dimension), sizeof(dimension));
    out.write(reinterpret_cast<const char*>(embedding_.data()), dimension * sizeof(float));

    created_at_.Serialize(out);

    // Statistics
    out.write(reinterpret_cast<const char*>(&access_count_), sizeof(access_count_));
    out.write(reinterpret_cast<const char*>(&memory_weight_), sizeof(memory_weight_));
    out.write(reinterpret_cast<const char*>(&reinforcement_level_), sizeof(reinforcement_level_));
    WriteOptionalTimestamp(out, last_accessed_);
    WriteOptionalTimestamp(out, last_decay_at_);
}

Record Record::Deserialize(std::istream& in) {
    RecordID id = RecordID::Deserialize(in);
    std::string owner_id = ReadString(in);

    RecordContent content;
    content.text = ReadString(in);
    content.category = ReadString(in);
    uint32_t tag_count = 0;
    in.read(reinterpret_cast<char*>(&tag_count), sizeof(tag_count));
    if (!in) {
        throw std::runtime_error("Truncated record: tag count");
    }
    // Every tag carries at least its own length prefix
    RequireBytes(in, static_cast<uint64_t>(tag_count) * sizeof(uint32_t), "tag list");
    content.tags.reserve(tag_count);
    for (uint32_t i = 0; i < tag_count; ++i) {
        content.tags.push_back(ReadString(in));
    }

    uint32_t dimension = 0;
    in.read(reinterpret_cast<char*>(&dimension), sizeof(dimension));
    if (!in) {
        throw std::runtime_error("Truncated record: embedding dimension");
    }
    RequireBytes(in, static_cast<uint64_t>(dimension) * sizeof(float), "embedding");
    Embedding embedding(dimension);
    in.read(reinterpret_cast<char*>(embedding.data()), dimension * sizeof(float));

    Timestamp created_at = Timestamp::Deserialize(in);

    Record record(id, std::move(owner_id), std::move(content), std::move(embedding), created_at);

    in.read(reinterpret_cast<char*>(&record.access_count_), sizeof(record.access_count_));
    in.read(reinterpret_cast<char*>(&record.memory_weight_), sizeof(record.memory_weight_));
    in.read(reinterpret_cast<char*>(&record.reinforcement_level_), sizeof(record.reinforcement_level_));
    record.last_accessed_ = ReadOptionalTimestamp(in);
    record.last_decay_at_ = ReadOptionalTimestamp(in);

    if (!in) {
        throw std::runtime_error("Truncated record: " + id.ToString());
    }

    return record;
}

std::string Record::ToString() const {
    std::ostringstream oss;
    oss << "Record{id=" << id_.ToString()
        << ", owner=" << owner_id_
        << ", category=" << (content_.category.empty() ? "-" : content_.category)
        << ", created=" << created_at_.ToDateString()
        << ", access_count=" << access_count_
        << ", memory_weight=" << std::fixed << std::setprecision(3) << memory_weight_
        << ", level=" << reinforcement_level_
        << ", dim=" << embedding_.size() << "}";
    return oss.str();
}

size_t Record::EstimateMemoryUsage() const {
    size_t usage = sizeof(Record);
    usage += owner_id_.capacity();
    usage += content_.text.capacity() + content_.category.capacity();
    for (const auto& tag : content_.tags) {
        usage += sizeof(std::string) + tag.capacity();
    }
    usage += embedding_.capacity() * sizeof(float);
    return usage;
}

} // namespace careledger
