#pragma once
#include "record.hpp"
#include <cstdint>
#include <iosfwd>
#include <memory>
#include <string>

constexpr char CHUNK_MAGIC[4] = {'P', 'S', 'Q', 'C'};
constexpr uint32_t CHUNK_FORMAT_VERSION = 1;

// Upper bound for a single encoded record, used to reject corrupt length fields
constexpr uint32_t RECORD_BYTES_MAX = 256u * 1024 * 1024;

/**
 * Turns a group of records into the bytes of one chunk file and back.
 *
 * Implementations must round-trip exactly: decode(encode(g)) == g.
 * encode() throws EncodeError, decode() throws DecodeError.
 */
class ChunkCodec {
public:
    virtual ~ChunkCodec() = default;

    virtual std::string encode(const RecordGroup& records) const = 0;
    virtual RecordGroup decode(const std::string& bytes) const = 0;
    virtual std::string name() const = 0;
};

// Binary codec: header (magic, version, count) then one length-prefixed MessagePack blob per record
class MsgpackChunkCodec : public ChunkCodec {
public:
    std::string encode(const RecordGroup& records) const override;
    RecordGroup decode(const std::string& bytes) const override;
    std::string name() const override { return "msgpack"; }
};

// Human readable codec: the chunk is a single JSON array
class JsonChunkCodec : public ChunkCodec {
public:
    std::string encode(const RecordGroup& records) const override;
    RecordGroup decode(const std::string& bytes) const override;
    std::string name() const override { return "json"; }
};

// "msgpack" or "json"; throws std::invalid_argument otherwise
std::shared_ptr<const ChunkCodec> make_codec(const std::string& name);

// Write a single record as [uint32 length][msgpack bytes]
bool write_record_to_stream(std::ostream& out, const Record& record);

// Read a single record written by write_record_to_stream; false on EOF or truncated input
bool read_record_from_stream(std::istream& in, Record& record);
