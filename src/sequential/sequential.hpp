#ifndef SEQUENTIAL_CHUNK_EXECUTOR_H
#define SEQUENTIAL_CHUNK_EXECUTOR_H

#include "../executor/executor.hpp"

// Visits chunks one after the other on the calling thread
class SequentialChunkExecutor : public ChunkExecutor {
public:
    std::vector<ChunkFailure> run(size_t num_chunks, const ChunkTask& task) override;
    std::string name() const override { return "sequential"; }
    size_t num_workers() const override { return 1; }
};

#endif
