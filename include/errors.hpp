#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

// Index or slice bound outside [0, size()) after negative-index normalization
class OutOfRangeError : public std::out_of_range {
public:
    using std::out_of_range::out_of_range;
};

// Slice assignment whose replacement length differs from the target range
class LengthMismatchError : public std::invalid_argument {
public:
    LengthMismatchError(size_t expected, size_t actual)
        : std::invalid_argument("slice assignment expects " + std::to_string(expected) +
                                " records, got " + std::to_string(actual)),
          expected_(expected), actual_(actual) {}

    size_t expected() const { return expected_; }
    size_t actual() const { return actual_; }

private:
    size_t expected_;
    size_t actual_;
};

// Slice assignment whose replacement is not an ordered sequence of records
class TypeMismatchError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// Chunk file missing, unreadable or not writable
class StorageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Chunk bytes that the codec cannot turn back into records
class DecodeError : public StorageError {
public:
    using StorageError::StorageError;
};

// Record the codec cannot turn into bytes
class EncodeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct ChunkFailure {
    size_t ordinal;
    std::string message;
};

/**
 * Aggregate failure of PagedSequence::transform_all.
 *
 * Chunks listed in failures() were left untouched; every other chunk already
 * holds its transformed content. tail_failed() reports whether the in-memory
 * tail was left untouched as well.
 */
class TransformError : public std::runtime_error {
public:
    TransformError(std::vector<ChunkFailure> failures, bool tail_failed, const std::string& tail_message = "");

    const std::vector<ChunkFailure>& failures() const { return failures_; }
    std::vector<size_t> failed_ordinals() const;
    bool tail_failed() const { return tail_failed_; }

private:
    std::vector<ChunkFailure> failures_;
    bool tail_failed_;
};
