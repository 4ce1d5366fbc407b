#include "omp.hpp"

#include <algorithm>
#include <utility>
#include <omp.h>

OpenMPChunkExecutor::OpenMPChunkExecutor(size_t num_threads) {
    // set number of threads
    num_threads_ = (num_threads == 0) ? static_cast<size_t>(omp_get_max_threads()) : num_threads;
}

std::vector<ChunkFailure> OpenMPChunkExecutor::run(size_t num_chunks, const ChunkTask& task) {
    std::vector<ChunkFailure> failures;
    const int threads = static_cast<int>(num_threads_);

    // Process each chunk in parallel
    #pragma omp parallel for schedule(dynamic) num_threads(threads)
    for (long long i = 0; i < static_cast<long long>(num_chunks); ++i) {
        ChunkFailure failure{};
        if (!run_chunk_task(task, static_cast<size_t>(i), failure)) {
            #pragma omp critical(paged_seq_chunk_failures)
            failures.push_back(std::move(failure));
        }
    }

    std::sort(failures.begin(), failures.end(),
              [](const ChunkFailure& a, const ChunkFailure& b) { return a.ordinal < b.ordinal; });
    return failures;
}
