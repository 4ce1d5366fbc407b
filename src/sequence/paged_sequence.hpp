#ifndef PAGED_SEQUENCE_HPP
#define PAGED_SEQUENCE_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <iterator>
#include <memory>

#include "../../include/record.hpp"
#include "../executor/executor.hpp"
#include "../storage/chunk_store.hpp"
#include "config.hpp"

/**
 * List of records that keeps only its newest, not yet full group in memory.
 *
 * Every time the in-memory tail reaches chunk_capacity records it is written
 * to disk as chunk number chunk_count() and dropped from memory, so at rest:
 *
 *   size() == chunk_count() * chunk_capacity() + tail_size()
 *   0 <= tail_size() < chunk_capacity()
 *
 * Reads and writes that land in a chunk load the whole chunk from disk (and
 * save it back for writes); no chunk stays resident between calls.
 *
 * One thread owns an instance. Only transform_all() uses worker threads.
 */
class PagedSequence {
public:
    class const_iterator;

    explicit PagedSequence(const SequenceConfig& config);
    PagedSequence(size_t chunk_capacity, const std::filesystem::path& storage_root);
    ~PagedSequence();

    PagedSequence(const PagedSequence&) = delete;
    PagedSequence& operator=(const PagedSequence&) = delete;

    size_t size() const { return store_->chunk_count() * config_.chunk_capacity + tail_.size(); }
    bool empty() const { return size() == 0; }

    // Negative indices count from the end. Throws OutOfRangeError.
    Record get(int64_t index) const;
    void set(int64_t index, Record value);

    // Python-style slice [start, stop): bounds are normalized and clamped, start > stop is empty
    RecordGroup get_slice(int64_t start, int64_t stop) const;

    // Replace [start, stop) element-wise, one load/save per covered chunk.
    // Throws LengthMismatchError when values.size() differs from the clamped range.
    void set_slice(int64_t start, int64_t stop, const RecordGroup& values);

    // Same, with the replacement given as a JSON array. Throws TypeMismatchError for any other value.
    void set_slice(int64_t start, int64_t stop, const Record& values);

    void append(Record value);
    void extend(const RecordGroup& values);

    /**
     * Apply f to every record, chunk by chunk on the configured executor, then
     * to the tail on the calling thread.
     *
     * Not atomic across chunks: if some chunks fail, the others keep their new
     * content and a single TransformError lists the failed ordinals.
     */
    void transform_all(const RecordTransform& f);

    // Load everything into memory
    RecordGroup combine() const;

    // Delete every chunk file. The in-memory tail is kept. Returns the number of files removed.
    size_t purge();

    // purge() and drop the tail
    void clear();

    const_iterator begin() const;
    const_iterator end() const;

    size_t chunk_count() const { return store_->chunk_count(); }
    size_t chunk_capacity() const { return config_.chunk_capacity; }
    size_t tail_size() const { return tail_.size(); }
    const std::filesystem::path& storage_root() const { return store_->root(); }
    std::filesystem::path chunk_path(size_t ordinal) const { return store_->chunk_path(ordinal); }
    const SequenceConfig& config() const { return config_; }
    const ChunkExecutor& executor() const { return *executor_; }

private:
    void open_storage();
    void flush_tail();

    // load + check the chunk holds exactly chunk_capacity records
    RecordGroup load_chunk(size_t ordinal) const;

    SequenceConfig config_;
    std::unique_ptr<ChunkStore> store_;
    std::unique_ptr<ChunkExecutor> executor_;
    RecordGroup tail_;
};

/**
 * Single pass over the records in index order, one chunk in memory at a time.
 * Restarting from begin() reads the chunks from disk again. Invalidated by any
 * mutation of the sequence.
 */
class PagedSequence::const_iterator {
public:
    using iterator_category = std::input_iterator_tag;
    using value_type = Record;
    using difference_type = std::ptrdiff_t;
    using pointer = const Record*;
    using reference = const Record&;

    const_iterator() = default;

    reference operator*() const;
    pointer operator->() const { return &**this; }

    const_iterator& operator++();
    const_iterator operator++(int);

    bool operator==(const const_iterator& other) const { return seq_ == other.seq_ && pos_ == other.pos_; }
    bool operator!=(const const_iterator& other) const { return !(*this == other); }

    size_t index() const { return pos_; }

private:
    friend class PagedSequence;
    const_iterator(const PagedSequence* seq, size_t pos);

    void sync();

    const PagedSequence* seq_ = nullptr;
    size_t pos_ = 0;
    std::shared_ptr<const RecordGroup> chunk_;
    size_t chunk_ordinal_ = 0;
};

// e.g. PagedSequence(15 items, 1 chunks, capacity 10, root "/tmp/x")
std::ostream& operator<<(std::ostream& os, const PagedSequence& seq);

#endif // PAGED_SEQUENCE_HPP
