#include <cstddef>
#include <algorithm>
#include <string>
#include <vector>

#include "chunking.hpp"
#include "../../include/errors.hpp"

size_t normalize_index(int64_t index, size_t length) {
    int64_t resolved = index < 0 ? index + static_cast<int64_t>(length) : index;
    if (resolved < 0 || static_cast<size_t>(resolved) >= length) {
        throw OutOfRangeError("index " + std::to_string(index) + " out of range for length " + std::to_string(length));
    }
    return static_cast<size_t>(resolved);
}

ChunkLocation locate(int64_t index, size_t total_length, size_t chunk_capacity, size_t chunk_count) {
    size_t resolved = normalize_index(index, total_length);
    size_t flushed = chunk_count * chunk_capacity;

    if (resolved >= flushed)
        return ChunkLocation::tail(resolved - flushed);

    return ChunkLocation::chunk(resolved / chunk_capacity, resolved % chunk_capacity);
}

SliceBounds clamp_slice(int64_t start, int64_t stop, size_t length) {
    const int64_t len = static_cast<int64_t>(length);

    auto clamp_bound = [len](int64_t bound) {
        if (bound < 0) bound += len;
        return static_cast<size_t>(std::clamp<int64_t>(bound, 0, len));
    };

    size_t lo = clamp_bound(start);
    size_t hi = clamp_bound(stop);
    if (hi < lo) hi = lo; // empty slice
    return {lo, hi};
}

std::vector<ChunkSpan> chunks_covering(const SliceBounds& bounds, size_t chunk_capacity, size_t chunk_count) {
    std::vector<ChunkSpan> spans;
    size_t flushed = chunk_count * chunk_capacity;
    size_t stop = std::min(bounds.stop, flushed);
    if (bounds.start >= stop) return spans;

    size_t first_chunk = bounds.start / chunk_capacity;
    size_t last_chunk = (stop - 1) / chunk_capacity;
    spans.reserve(last_chunk - first_chunk + 1);

    for (size_t k = first_chunk; k <= last_chunk; ++k) {
        size_t chunk_begin = k * chunk_capacity;
        size_t first = std::max(bounds.start, chunk_begin) - chunk_begin;
        size_t last = std::min(stop, chunk_begin + chunk_capacity) - chunk_begin;
        spans.emplace_back(k, first, last);
    }
    return spans;
}
