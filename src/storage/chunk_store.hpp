#ifndef CHUNK_STORE_HPP
#define CHUNK_STORE_HPP

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "../../include/record.hpp"
#include "../../include/record_io.hpp"

/**
 * Owns the chunk files of one storage root.
 *
 * Chunk k lives in <root>/chunk_<k>.bin. The store is the only component
 * that touches those files; every load/save opens and closes its file inside
 * the call. Nothing is cached: each load() reads the file again.
 *
 * Two stores must never share a root.
 */
class ChunkStore {
public:
    ChunkStore(const std::filesystem::path& root, std::shared_ptr<const ChunkCodec> codec);

    ChunkStore(const ChunkStore&) = delete;
    ChunkStore& operator=(const ChunkStore&) = delete;

    // Read and decode chunk `ordinal`. Throws StorageError (DecodeError on corrupt bytes).
    RecordGroup load(size_t ordinal) const;

    // Encode and atomically replace chunk `ordinal`. ordinal == chunk_count() appends a new chunk.
    void save(size_t ordinal, const RecordGroup& records);

    // Remove every chunk file (and leftover temp file) under the root, reset chunk_count() to 0.
    // Returns the number of files removed.
    size_t delete_all();

    // Best-effort recovery: adopt the number of consecutive chunk files chunk_0.bin, chunk_1.bin, ...
    size_t scan_chunk_count();

    // Chunk files currently on disk, ordered by ordinal
    std::vector<std::filesystem::path> existing_chunk_files() const;

    std::filesystem::path chunk_path(size_t ordinal) const;

    size_t chunk_count() const { return chunk_count_; }
    const std::filesystem::path& root() const { return root_; }
    const ChunkCodec& codec() const { return *codec_; }

private:
    std::filesystem::path root_;
    std::shared_ptr<const ChunkCodec> codec_;
    size_t chunk_count_ = 0;
};

/**
 * Parse a file name of the form chunk_<k>.bin (or chunk_<k>.bin.tmp).
 *
 * @param filename Bare file name, no directory.
 * @param ordinal Receives k on success.
 * @param is_temp Receives whether the name carries the .tmp suffix.
 * @return true if the name follows the chunk naming convention.
 */
bool parse_chunk_filename(const std::string& filename, size_t& ordinal, bool& is_temp);

#endif // CHUNK_STORE_HPP
