#ifndef OPENMP_CHUNK_EXECUTOR_H
#define OPENMP_CHUNK_EXECUTOR_H

#include "../executor/executor.hpp"

/**
 * Processes chunks with an OpenMP parallel for.
 *
 * Each iteration owns one ordinal. Exceptions never leave the parallel region:
 * they are caught per iteration and collected under a named critical section.
 */
class OpenMPChunkExecutor : public ChunkExecutor {
public:
    // num_threads == 0 uses omp_get_max_threads()
    explicit OpenMPChunkExecutor(size_t num_threads = 0);

    std::vector<ChunkFailure> run(size_t num_chunks, const ChunkTask& task) override;
    std::string name() const override { return "openmp"; }
    size_t num_workers() const override { return num_threads_; }

private:
    size_t num_threads_; // Number of OpenMP threads
};

#endif
