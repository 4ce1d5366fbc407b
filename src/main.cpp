#include <chrono>
#include <exception>
#include <filesystem>
#include <iostream>
#include <string>

#include "sequence/paged_sequence.hpp"
#include "fields/field_serializer.hpp"
#include "filegen/filegen.hpp"
#include "../include/errors.hpp"

void print_usage(const std::string& prog_name) {
    std::cout << "\n========================================\n";
    std::cout << " paged_seq - disk-paged record list\n";
    std::cout << "========================================\n\n";
    std::cout << "Usage:\n";
    std::cout << "  " << prog_name << " demo [storage_root]\n";
    std::cout << "  " << prog_name << " example [num_records] [chunk_capacity] [storage_root]\n";
    std::cout << "  " << prog_name << " benchmark <num_records> <chunk_capacity> <backend> [num_workers]\n\n";

    std::cout << "Commands:\n";
    std::cout << "  demo             Store 10 items in chunks of 5, print a few reads, clean up\n";
    std::cout << "  example          Store num_records contacts (default 1000000, chunks of 10000),\n";
    std::cout << "                   serialize nested fields, add a derived field, clean up\n";
    std::cout << "  benchmark        Time transform_all with one backend\n";
    std::cout << "                   - backend: sequential | openmp | fastflow\n";
    std::cout << "                   - num_workers: worker threads (optional, 0 = default)\n\n";

    std::cout << "Examples:\n";
    std::cout << "  " << prog_name << " demo\n";
    std::cout << "  " << prog_name << " example 200000 5000 ./example_data\n";
    std::cout << "  " << prog_name << " benchmark 500000 10000 openmp 8\n\n";
}

int run_demo(const std::filesystem::path& root) {
    std::cout << "PagedSequence Demo:\n";
    std::cout << "===================\n";

    SequenceConfig config;
    config.chunk_capacity = 5;
    config.storage_root = root;
    config.open_mode = OpenMode::Truncate;
    PagedSequence seq(config);

    for (size_t i = 0; i < 10; ++i) {
        seq.append(make_record(i, RecordKind::ITEM));
    }

    std::cout << "Created " << seq << "\n";
    std::cout << "First item: " << seq.get(0).dump() << "\n";
    std::cout << "Last item: " << seq.get(-1).dump() << "\n";
    std::cout << "Slice [3:7]: " << Record(seq.get_slice(3, 7)).dump() << "\n";

    seq.purge();
    std::cout << "Demo completed and cleaned up!" << std::endl;
    return 0;
}

int run_example(size_t num_records, size_t chunk_capacity, const std::filesystem::path& root) {
    using Clock = std::chrono::high_resolution_clock;

    SequenceConfig config;
    config.chunk_capacity = chunk_capacity;
    config.storage_root = root;
    config.open_mode = OpenMode::Truncate;
    config.purge_on_destroy = true;
    config.verbose = true;
    PagedSequence seq(config);

    auto t1 = Clock::now();
    fill_sequence(seq, num_records, RecordKind::CONTACT, chunk_capacity);
    auto t2 = Clock::now();
    std::chrono::duration<double> fill_time = t2 - t1;
    std::cout << "Stored " << seq << "\n";
    std::cout << "[TIMING] Fill time: " << fill_time.count() << " s" << std::endl;

    seq.transform_all(stringify_nested_fields);
    seq.transform_all([](Record rec) {
        rec["fullName"] = rec.value("firstName", "") + " " + rec.value("lastName", "");
        return rec;
    });

    if (!seq.empty()) {
        std::cout << "Middle record: " << seq.get(static_cast<int64_t>(seq.size() / 2)).dump() << "\n";
    }
    return verify_sequence_ids(seq) ? 0 : 1;
}

int run_benchmark(size_t num_records, size_t chunk_capacity, TransformBackend backend, size_t num_workers) {
    SequenceConfig config;
    config.chunk_capacity = chunk_capacity;
    config.storage_root = "benchmark_data";
    config.backend = backend;
    config.num_workers = num_workers;
    config.open_mode = OpenMode::Truncate;
    config.purge_on_destroy = true;
    PagedSequence seq(config);

    fill_sequence(seq, num_records, RecordKind::LARGE, chunk_capacity);

    auto start = std::chrono::high_resolution_clock::now();
    seq.transform_all(stringify_nested_fields);
    auto end = std::chrono::high_resolution_clock::now();
    double duration = std::chrono::duration<double>(end - start).count();

    // Output only performance data (compatible with bash parsing)
    std::cout << "[BENCH] Backend=" << seq.executor().name()
              << " Workers=" << seq.executor().num_workers()
              << " Records=" << num_records
              << " Time=" << duration << std::endl;
    return 0;
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];

    try {
        if (command == "demo") {
            std::filesystem::path root = (argc >= 3) ? argv[2] : "demo_data";
            return run_demo(root);
        }
        else if (command == "example") {
            size_t num_records = (argc >= 3) ? parse_count(argv[2], "num_records") : 1000000;
            size_t chunk_capacity = (argc >= 4) ? parse_count(argv[3], "chunk_capacity") : 10000;
            std::filesystem::path root = (argc >= 5) ? argv[4] : "example_data";
            return run_example(num_records, chunk_capacity, root);
        }
        else if (command == "benchmark") {
            if (argc < 5) {
                std::cerr << "Usage: " << argv[0] << " benchmark <num_records> <chunk_capacity> <backend> [num_workers]" << std::endl;
                return 1;
            }
            size_t num_records = parse_count(argv[2], "num_records");
            size_t chunk_capacity = parse_count(argv[3], "chunk_capacity");
            TransformBackend backend = parse_backend(argv[4]);
            size_t num_workers = (argc >= 6) ? parse_count(argv[5], "num_workers") : 0;
            return run_benchmark(num_records, chunk_capacity, backend, num_workers);
        }
        else {
            std::cerr << "Unknown command: " << command << "\n";
            print_usage(argv[0]);
            return 1;
        }
    } catch (const TransformError& e) {
        std::cerr << "Transform failed: " << e.what() << std::endl;
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
