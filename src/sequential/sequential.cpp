#include "sequential.hpp"

#include <utility>

std::vector<ChunkFailure> SequentialChunkExecutor::run(size_t num_chunks, const ChunkTask& task) {
    std::vector<ChunkFailure> failures;
    for (size_t i = 0; i < num_chunks; ++i) {
        ChunkFailure failure{};
        if (!run_chunk_task(task, i, failure)) {
            failures.push_back(std::move(failure));
        }
    }
    return failures;
}
