#ifndef CHUNK_EXECUTOR_HPP
#define CHUNK_EXECUTOR_HPP

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "../../include/errors.hpp"

enum class TransformBackend {
    Sequential,
    OpenMP,
    FastFlow
};

// Work for a single chunk ordinal. Throws to report failure.
using ChunkTask = std::function<void(size_t)>;

/**
 * Fan-out / fan-in over chunk ordinals.
 *
 * run() calls task(k) exactly once for every k in [0, num_chunks), never twice
 * concurrently for the same k, and returns only after every call finished.
 * Failures are collected, not rethrown, and returned sorted by ordinal.
 */
class ChunkExecutor {
public:
    virtual ~ChunkExecutor() = default;

    virtual std::vector<ChunkFailure> run(size_t num_chunks, const ChunkTask& task) = 0;
    virtual std::string name() const = 0;
    virtual size_t num_workers() const = 0;
};

// num_workers == 0 picks the backend's default
std::unique_ptr<ChunkExecutor> make_executor(TransformBackend backend, size_t num_workers = 0);

// false when the backend was not compiled in (FastFlow headers missing at build time)
bool backend_available(TransformBackend backend);

std::string backend_name(TransformBackend backend);

// "sequential", "openmp" or "fastflow"; throws std::invalid_argument otherwise
TransformBackend parse_backend(const std::string& name);

// Shared by the backends: run one task and turn an exception into a failure entry
bool run_chunk_task(const ChunkTask& task, size_t ordinal, ChunkFailure& failure);

#endif // CHUNK_EXECUTOR_HPP
