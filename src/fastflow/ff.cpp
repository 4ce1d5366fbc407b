#include "ff.hpp"

#include <ff/ff.hpp>
#include <ff/farm.hpp>

#include <algorithm>
#include <memory>
#include <stdexcept>
#include <thread>
#include <utility>

using namespace ff;

namespace {

struct ChunkJob {
    size_t ordinal;
    bool failed;
    ChunkFailure failure;
};

// ------------------------
// FastFlow Node: Ordinal Emitter
// ------------------------
// Send one job per chunk ordinal to the available workers
class OrdinalEmitter : public ff_node {
private:
    size_t num_chunks_;

public:
    explicit OrdinalEmitter(size_t num_chunks)
        : num_chunks_(num_chunks) {}

    void* svc(void*) override {
        for (size_t k = 0; k < num_chunks_; ++k) {
            ff_send_out(new ChunkJob{k, false, {}});
        }
        return EOS; // End of stream
    }
};

// ------------------------
// FastFlow Node: Chunk Job Worker
// ------------------------
// Run the chunk task, keep the exception message in the job instead of letting it escape the node
class ChunkJobWorker : public ff_node {
private:
    const ChunkTask& task_;

public:
    explicit ChunkJobWorker(const ChunkTask& task)
        : task_(task) {}

    void* svc(void* job_ptr) override {
        auto* job = static_cast<ChunkJob*>(job_ptr);
        job->failed = !run_chunk_task(task_, job->ordinal, job->failure);
        return job; // Return to collector
    }
};

// ------------------------
// FastFlow Node: Failure Collector
// ------------------------
class FailureCollector : public ff_node {
private:
    std::vector<ChunkFailure>& failures_;

public:
    explicit FailureCollector(std::vector<ChunkFailure>& failures)
        : failures_(failures) {}

    void* svc(void* job_ptr) override {
        std::unique_ptr<ChunkJob> job(static_cast<ChunkJob*>(job_ptr));
        if (job->failed) {
            failures_.push_back(std::move(job->failure));
        }
        return GO_ON;
    }
};

} // namespace

FastFlowChunkExecutor::FastFlowChunkExecutor(size_t num_workers) {
    num_workers_ = num_workers;
    if (num_workers_ == 0) {
        num_workers_ = std::max<size_t>(1, std::thread::hardware_concurrency());
    }
}

std::vector<ChunkFailure> FastFlowChunkExecutor::run(size_t num_chunks, const ChunkTask& task) {
    std::vector<ChunkFailure> failures;
    if (num_chunks == 0) return failures;

    OrdinalEmitter emitter(num_chunks);
    FailureCollector collector(failures);

    // Create Workers
    std::vector<std::unique_ptr<ChunkJobWorker>> workers;
    std::vector<ff_node*> workers_v;
    size_t worker_count = std::min(num_workers_, num_chunks);
    for (size_t i = 0; i < worker_count; ++i) {
        workers.push_back(std::make_unique<ChunkJobWorker>(task));
        workers_v.push_back(workers.back().get());
    }

    // Set up FastFlow farm
    ff_farm farm;
    farm.add_emitter(&emitter);
    farm.add_workers(workers_v);
    farm.add_collector(&collector);

    // Run farm
    if (farm.run_and_wait_end() < 0) {
        throw std::runtime_error("FastFlow farm execution failed");
    }

    std::sort(failures.begin(), failures.end(),
              [](const ChunkFailure& a, const ChunkFailure& b) { return a.ordinal < b.ordinal; });
    return failures;
}
