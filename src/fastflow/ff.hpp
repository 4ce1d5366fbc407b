#ifndef FASTFLOW_CHUNK_EXECUTOR_HPP
#define FASTFLOW_CHUNK_EXECUTOR_HPP

#include "../executor/executor.hpp"

/**
 * Processes chunks with a FastFlow farm:
 *   emitter   - sends one job per chunk ordinal
 *   workers   - run the chunk task, record any exception in the job
 *   collector - gathers failed jobs
 *
 * Only compiled when the FastFlow headers are available.
 */
class FastFlowChunkExecutor : public ChunkExecutor {
public:
    // num_workers == 0 uses std::thread::hardware_concurrency()
    explicit FastFlowChunkExecutor(size_t num_workers = 0);

    std::vector<ChunkFailure> run(size_t num_chunks, const ChunkTask& task) override;
    std::string name() const override { return "fastflow"; }
    size_t num_workers() const override { return num_workers_; }

private:
    size_t num_workers_;
};

#endif
