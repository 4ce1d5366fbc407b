#include "../include/record_io.hpp"
#include "../include/errors.hpp"

#include <cmath>
#include <cstring>
#include <istream>
#include <limits>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <vector>

// writes a single record: payload length, then the MessagePack bytes
bool write_record_to_stream(std::ostream& out, const Record& record) {
    std::vector<uint8_t> bytes;
    try {
        bytes = nlohmann::json::to_msgpack(record);
    } catch (const nlohmann::json::exception& e) {
        throw EncodeError(std::string("cannot encode record: ") + e.what());
    }
    if (bytes.size() > RECORD_BYTES_MAX) {
        throw EncodeError("encoded record too large: " + std::to_string(bytes.size()) + " bytes");
    }

    uint32_t len = static_cast<uint32_t>(bytes.size());
    if (!out.write(reinterpret_cast<const char*>(&len), sizeof(len))) return false;
    return out.write(reinterpret_cast<const char*>(bytes.data()), len).good();
}

// reads one record back; returns false when the stream ends before a full record
bool read_record_from_stream(std::istream& in, Record& record) {
    uint32_t len = 0;
    if (!in.read(reinterpret_cast<char*>(&len), sizeof(len))) return false;

    // Sanity check
    if (len == 0 || len > RECORD_BYTES_MAX) {
        in.setstate(std::ios::failbit);
        return false;
    }

    std::vector<uint8_t> bytes(len);
    if (!in.read(reinterpret_cast<char*>(bytes.data()), len)) return false;

    try {
        record = nlohmann::json::from_msgpack(bytes);
    } catch (const nlohmann::json::exception& e) {
        throw DecodeError(std::string("invalid record bytes: ") + e.what());
    }
    return true;
}

std::string MsgpackChunkCodec::encode(const RecordGroup& records) const {
    if (records.size() > std::numeric_limits<uint32_t>::max()) {
        throw EncodeError("too many records for one chunk: " + std::to_string(records.size()));
    }

    std::ostringstream out(std::ios::binary);
    uint32_t version = CHUNK_FORMAT_VERSION;
    uint32_t count = static_cast<uint32_t>(records.size());
    out.write(CHUNK_MAGIC, sizeof(CHUNK_MAGIC));
    out.write(reinterpret_cast<const char*>(&version), sizeof(version));
    out.write(reinterpret_cast<const char*>(&count), sizeof(count));

    for (const auto& rec : records) {
        if (!write_record_to_stream(out, rec)) {
            throw EncodeError("failed to buffer encoded record");
        }
    }
    return out.str();
}

RecordGroup MsgpackChunkCodec::decode(const std::string& bytes) const {
    std::istringstream in(bytes, std::ios::binary);

    char magic[sizeof(CHUNK_MAGIC)];
    uint32_t version = 0;
    uint32_t count = 0;
    if (!in.read(magic, sizeof(magic)) || std::memcmp(magic, CHUNK_MAGIC, sizeof(magic)) != 0) {
        throw DecodeError("not a chunk file (bad magic)");
    }
    if (!in.read(reinterpret_cast<char*>(&version), sizeof(version)) || version != CHUNK_FORMAT_VERSION) {
        throw DecodeError("unsupported chunk format version " + std::to_string(version));
    }
    if (!in.read(reinterpret_cast<char*>(&count), sizeof(count))) {
        throw DecodeError("truncated chunk header");
    }

    RecordGroup records;
    records.reserve(count);
    for (uint32_t i = 0; i < count; ++i) {
        Record rec;
        if (!read_record_from_stream(in, rec)) {
            throw DecodeError("truncated chunk: record " + std::to_string(i) + " of " + std::to_string(count));
        }
        records.push_back(std::move(rec));
    }

    if (in.peek() != std::char_traits<char>::eof()) {
        throw DecodeError("trailing bytes after " + std::to_string(count) + " records");
    }
    return records;
}

namespace {

// dump() writes NaN and infinities as null, which would not decode back to the same record
void check_finite_numbers(const Record& value) {
    if (value.is_number_float()) {
        double number = value.get<double>();
        if (!std::isfinite(number)) {
            throw EncodeError("cannot encode non-finite number " + std::to_string(number) + " as JSON");
        }
        return;
    }
    if (value.is_structured()) {
        for (const auto& child : value) check_finite_numbers(child);
    }
}

} // namespace

std::string JsonChunkCodec::encode(const RecordGroup& records) const {
    for (const auto& rec : records) check_finite_numbers(rec);
    try {
        return nlohmann::json(records).dump();
    } catch (const nlohmann::json::exception& e) {
        throw EncodeError(std::string("cannot encode chunk as JSON: ") + e.what());
    }
}

RecordGroup JsonChunkCodec::decode(const std::string& bytes) const {
    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(bytes);
    } catch (const nlohmann::json::exception& e) {
        throw DecodeError(std::string("invalid JSON chunk: ") + e.what());
    }
    if (!doc.is_array()) {
        throw DecodeError("JSON chunk is not an array");
    }
    return RecordGroup(doc.begin(), doc.end());
}

std::shared_ptr<const ChunkCodec> make_codec(const std::string& name) {
    if (name == "msgpack") return std::make_shared<MsgpackChunkCodec>();
    if (name == "json") return std::make_shared<JsonChunkCodec>();
    throw std::invalid_argument("Unknown chunk codec: " + name);
}
