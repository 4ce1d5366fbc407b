#ifndef SEQUENCE_CONFIG_HPP
#define SEQUENCE_CONFIG_HPP

#include <cstddef>
#include <filesystem>
#include <string>

#include "../executor/executor.hpp"

// What to do when the storage root already holds chunk files
enum class OpenMode {
    Create,   // refuse: throw StorageError
    Truncate, // delete the existing chunk files
    Recover   // adopt them (chunk_0.bin .. up to the first gap), tail starts empty
};

struct SequenceConfig {
    size_t chunk_capacity;              // records per chunk file, > 0
    std::filesystem::path storage_root; // directory holding chunk_<k>.bin
    std::string codec;                  // "msgpack" or "json"
    TransformBackend backend;           // worker pool used by transform_all
    size_t num_workers;                 // 0 = backend default
    OpenMode open_mode;
    bool purge_on_destroy;              // delete chunk files in the destructor
    bool verbose;                       // progress and [TIMING] lines on stdout

    SequenceConfig()
        : chunk_capacity(10000)
        , storage_root("./paged_seq_data")
        , codec("msgpack")
        , backend(TransformBackend::OpenMP)
        , num_workers(0)
        , open_mode(OpenMode::Create)
        , purge_on_destroy(false)
        , verbose(false) {}
};

std::string open_mode_name(OpenMode mode);

// "create", "truncate" or "recover"; throws std::invalid_argument otherwise
OpenMode parse_open_mode(const std::string& name);

// Non-negative decimal count from a command line argument; throws std::invalid_argument otherwise
size_t parse_count(const std::string& text, const std::string& what);

#endif // SEQUENCE_CONFIG_HPP
