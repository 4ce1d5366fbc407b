#include "executor.hpp"
#include "../sequential/sequential.hpp"
#include "../openmp/omp.hpp"
#ifdef PAGED_SEQ_WITH_FASTFLOW
#include "../fastflow/ff.hpp"
#endif

#include <algorithm>
#include <cctype>
#include <exception>
#include <stdexcept>

bool run_chunk_task(const ChunkTask& task, size_t ordinal, ChunkFailure& failure) {
    try {
        task(ordinal);
        return true;
    } catch (const std::exception& e) {
        failure = {ordinal, e.what()};
    } catch (...) {
        failure = {ordinal, "unknown exception"};
    }
    return false;
}

std::unique_ptr<ChunkExecutor> make_executor(TransformBackend backend, size_t num_workers) {
    switch (backend) {
        case TransformBackend::Sequential:
            return std::make_unique<SequentialChunkExecutor>();
        case TransformBackend::OpenMP:
            return std::make_unique<OpenMPChunkExecutor>(num_workers);
        case TransformBackend::FastFlow:
#ifdef PAGED_SEQ_WITH_FASTFLOW
            return std::make_unique<FastFlowChunkExecutor>(num_workers);
#else
            throw std::invalid_argument("FastFlow backend not available: built without FastFlow headers");
#endif
    }
    throw std::invalid_argument("Unknown transform backend");
}

bool backend_available(TransformBackend backend) {
#ifdef PAGED_SEQ_WITH_FASTFLOW
    (void)backend;
    return true;
#else
    return backend != TransformBackend::FastFlow;
#endif
}

std::string backend_name(TransformBackend backend) {
    switch (backend) {
        case TransformBackend::Sequential: return "sequential";
        case TransformBackend::OpenMP: return "openmp";
        case TransformBackend::FastFlow: return "fastflow";
    }
    return "unknown";
}

TransformBackend parse_backend(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "sequential" || lower == "seq") return TransformBackend::Sequential;
    if (lower == "openmp" || lower == "omp") return TransformBackend::OpenMP;
    if (lower == "fastflow" || lower == "ff") return TransformBackend::FastFlow;
    throw std::invalid_argument("Unknown transform backend: " + name);
}
