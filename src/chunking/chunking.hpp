#ifndef CHUNKING_HPP
#define CHUNKING_HPP

#include <vector>
#include <cstddef> // for size_t
#include <cstdint>

// Physical position of one global index: either (chunk ordinal, offset) or (tail, offset)
struct ChunkLocation {
    bool in_tail;
    size_t ordinal; // meaningless when in_tail
    size_t offset;

    static ChunkLocation tail(size_t offset) { return {true, 0, offset}; }
    static ChunkLocation chunk(size_t ordinal, size_t offset) { return {false, ordinal, offset}; }

    bool operator==(const ChunkLocation& other) const {
        return in_tail == other.in_tail && ordinal == other.ordinal && offset == other.offset;
    }
};

// Half-open range [start, stop) of global indices, already clamped to the sequence
struct SliceBounds {
    size_t start;
    size_t stop;

    size_t size() const { return stop - start; }
    bool empty() const { return start == stop; }
};

// The part of one chunk covered by a slice: records [first, last) of chunk `ordinal`
struct ChunkSpan {
    size_t ordinal;
    size_t first;
    size_t last;

    ChunkSpan(size_t ord, size_t f, size_t l)
        : ordinal(ord), first(f), last(l) {}
};

/**
 * Normalize a possibly negative index (counting from the end) against a length.
 *
 * @param index Requested index, -1 is the last element.
 * @param length Current number of records.
 * @return The equivalent index in [0, length).
 * @throws OutOfRangeError if the index is out of range after normalization.
 */
size_t normalize_index(int64_t index, size_t length);

/**
 * Resolve a global index to its chunk or tail position.
 *
 * Pure function of its arguments: chunk_count * chunk_capacity records live on
 * disk, everything after them lives in the tail.
 *
 * @param index Requested index, negative values count from the end.
 * @param total_length chunk_count * chunk_capacity + tail length.
 * @param chunk_capacity Records per chunk, > 0.
 * @param chunk_count Number of flushed chunks.
 * @throws OutOfRangeError if the index does not resolve.
 */
ChunkLocation locate(int64_t index, size_t total_length, size_t chunk_capacity, size_t chunk_count);

// Python-style slice clamping: negative bounds count from the end, then clamp to [0, length]
SliceBounds clamp_slice(int64_t start, int64_t stop, size_t length);

/**
 * List the chunks overlapping a slice, in ascending ordinal order.
 * The part of the slice that falls into the tail is not included.
 */
std::vector<ChunkSpan> chunks_covering(const SliceBounds& bounds, size_t chunk_capacity, size_t chunk_count);

#endif // CHUNKING_HPP
