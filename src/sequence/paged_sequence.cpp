#include "paged_sequence.hpp"
#include "../chunking/chunking.hpp"
#include "../../include/errors.hpp"
#include "../../include/record_io.hpp"

#include <algorithm>
#include <chrono>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <utility>

using Clock = std::chrono::high_resolution_clock;

PagedSequence::PagedSequence(const SequenceConfig& config)
    : config_(config) {
    if (config_.chunk_capacity == 0) {
        throw std::invalid_argument("chunk_capacity must be positive");
    }

    store_ = std::make_unique<ChunkStore>(config_.storage_root, make_codec(config_.codec));
    executor_ = make_executor(config_.backend, config_.num_workers);
    open_storage();
}

PagedSequence::PagedSequence(size_t chunk_capacity, const std::filesystem::path& storage_root)
    : PagedSequence([&] {
          SequenceConfig config;
          config.chunk_capacity = chunk_capacity;
          config.storage_root = storage_root;
          return config;
      }()) {}

PagedSequence::~PagedSequence() {
    if (!config_.purge_on_destroy) return;
    try {
        store_->delete_all();
    } catch (const std::exception& e) {
        std::cerr << "Warning: Failed to purge chunk files in " << store_->root() << ": " << e.what() << std::endl;
    }
}

void PagedSequence::open_storage() {
    auto existing = store_->existing_chunk_files();
    if (existing.empty()) return;

    switch (config_.open_mode) {
        case OpenMode::Create:
            throw StorageError("Storage root " + store_->root().string() + " already holds " +
                               std::to_string(existing.size()) +
                               " chunk files (open with OpenMode::Truncate or OpenMode::Recover)");

        case OpenMode::Truncate: {
            size_t removed = store_->delete_all();
            if (config_.verbose) {
                std::cout << "[paged_seq] Removed " << removed << " stale chunk files from " << store_->root() << std::endl;
            }
            return;
        }

        case OpenMode::Recover: {
            size_t recovered = store_->scan_chunk_count();
            if (recovered < existing.size()) {
                std::cerr << "Warning: " << existing.size() - recovered << " chunk files after chunk_"
                          << recovered << ".bin are not contiguous and were ignored" << std::endl;
            }
            if (recovered > 0) {
                // every chunk holds exactly chunk_capacity records; a mismatch means another capacity wrote them
                load_chunk(recovered - 1);
            }
            if (config_.verbose) {
                std::cout << "[paged_seq] Recovered " << recovered << " chunks (" << size() << " records) from "
                          << store_->root() << std::endl;
            }
            return;
        }
    }
}

RecordGroup PagedSequence::load_chunk(size_t ordinal) const {
    RecordGroup chunk = store_->load(ordinal);
    if (chunk.size() != config_.chunk_capacity) {
        throw StorageError("Chunk " + std::to_string(ordinal) + " holds " + std::to_string(chunk.size()) +
                           " records, expected " + std::to_string(config_.chunk_capacity));
    }
    return chunk;
}

void PagedSequence::flush_tail() {
    size_t ordinal = store_->chunk_count();
    store_->save(ordinal, tail_);
    tail_.clear();

    if (config_.verbose) {
        std::cout << "[paged_seq] Flushed chunk " << ordinal << " -> " << store_->chunk_path(ordinal) << std::endl;
    }
}

Record PagedSequence::get(int64_t index) const {
    ChunkLocation loc = locate(index, size(), config_.chunk_capacity, store_->chunk_count());
    if (loc.in_tail) return tail_[loc.offset];

    RecordGroup chunk = load_chunk(loc.ordinal);
    return std::move(chunk[loc.offset]);
}

void PagedSequence::set(int64_t index, Record value) {
    ChunkLocation loc = locate(index, size(), config_.chunk_capacity, store_->chunk_count());
    if (loc.in_tail) {
        tail_[loc.offset] = std::move(value);
        return;
    }

    RecordGroup chunk = load_chunk(loc.ordinal);
    chunk[loc.offset] = std::move(value);
    store_->save(loc.ordinal, chunk);
}

RecordGroup PagedSequence::get_slice(int64_t start, int64_t stop) const {
    SliceBounds bounds = clamp_slice(start, stop, size());
    RecordGroup result;
    result.reserve(bounds.size());

    for (const auto& span : chunks_covering(bounds, config_.chunk_capacity, store_->chunk_count())) {
        RecordGroup chunk = load_chunk(span.ordinal);
        std::move(chunk.begin() + span.first, chunk.begin() + span.last, std::back_inserter(result));
    }

    size_t flushed = store_->chunk_count() * config_.chunk_capacity;
    if (bounds.stop > flushed) {
        size_t from = std::max(bounds.start, flushed) - flushed;
        size_t to = bounds.stop - flushed;
        result.insert(result.end(), tail_.begin() + from, tail_.begin() + to);
    }
    return result;
}

void PagedSequence::set_slice(int64_t start, int64_t stop, const RecordGroup& values) {
    SliceBounds bounds = clamp_slice(start, stop, size());
    if (values.size() != bounds.size()) {
        throw LengthMismatchError(bounds.size(), values.size());
    }

    size_t consumed = 0;
    for (const auto& span : chunks_covering(bounds, config_.chunk_capacity, store_->chunk_count())) {
        RecordGroup chunk = load_chunk(span.ordinal);
        for (size_t j = span.first; j < span.last; ++j) {
            chunk[j] = values[consumed++];
        }
        store_->save(span.ordinal, chunk);
    }

    size_t flushed = store_->chunk_count() * config_.chunk_capacity;
    for (size_t i = std::max(bounds.start, flushed); i < bounds.stop; ++i) {
        tail_[i - flushed] = values[consumed++];
    }
}

void PagedSequence::set_slice(int64_t start, int64_t stop, const Record& values) {
    if (!values.is_array()) {
        throw TypeMismatchError(std::string("slice assignment needs a sequence of records, got ") + values.type_name());
    }
    set_slice(start, stop, RecordGroup(values.begin(), values.end()));
}

void PagedSequence::append(Record value) {
    tail_.push_back(std::move(value));
    if (tail_.size() < config_.chunk_capacity) return;

    try {
        flush_tail();
    } catch (...) {
        // keep the tail below capacity: the failed append leaves no trace
        tail_.pop_back();
        throw;
    }
}

void PagedSequence::extend(const RecordGroup& values) {
    const size_t capacity = config_.chunk_capacity;
    size_t i = 0;

    // Top up a partially filled tail first
    while (i < values.size() && !tail_.empty()) {
        append(values[i++]);
    }

    // Write whole chunks straight from values
    while (values.size() - i >= capacity) {
        RecordGroup chunk(values.begin() + i, values.begin() + i + capacity);
        size_t ordinal = store_->chunk_count();
        store_->save(ordinal, chunk);
        i += capacity;

        if (config_.verbose) {
            std::cout << "[paged_seq] Flushed chunk " << ordinal << " -> " << store_->chunk_path(ordinal) << std::endl;
        }
    }

    for (; i < values.size(); ++i) {
        append(values[i]);
    }
}

void PagedSequence::transform_all(const RecordTransform& f) {
    auto t1 = Clock::now();
    const size_t chunks = store_->chunk_count();

    // Each task touches only its own chunk file; save() on an existing ordinal leaves chunk_count() alone
    std::vector<ChunkFailure> failures = executor_->run(chunks, [this, &f](size_t ordinal) {
        RecordGroup chunk = load_chunk(ordinal);
        for (auto& rec : chunk) {
            rec = f(std::move(rec));
        }
        store_->save(ordinal, chunk);
    });
    auto t2 = Clock::now();

    // Tail on the calling thread, committed only if every record maps
    bool tail_failed = false;
    std::string tail_message;
    RecordGroup mapped;
    mapped.reserve(tail_.size());
    try {
        for (const auto& rec : tail_) {
            mapped.push_back(f(rec));
        }
        tail_ = std::move(mapped);
    } catch (const std::exception& e) {
        tail_failed = true;
        tail_message = e.what();
    } catch (...) {
        tail_failed = true;
        tail_message = "unknown exception";
    }

    if (config_.verbose) {
        std::chrono::duration<double> chunk_time = t2 - t1;
        std::cout << "[paged_seq] Transformed " << chunks - failures.size() << "/" << chunks << " chunks with "
                  << executor_->name() << " (" << executor_->num_workers() << " workers)" << std::endl;
        std::cout << "[TIMING] Transform time: " << chunk_time.count() << " s" << std::endl;
    }

    if (!failures.empty() || tail_failed) {
        if (config_.verbose) {
            for (const auto& fail : failures) {
                std::cerr << "Failed to transform chunk " << fail.ordinal << ": " << fail.message << std::endl;
            }
        }
        throw TransformError(std::move(failures), tail_failed, tail_message);
    }
}

RecordGroup PagedSequence::combine() const {
    RecordGroup all;
    all.reserve(size());
    for (size_t k = 0; k < store_->chunk_count(); ++k) {
        RecordGroup chunk = load_chunk(k);
        std::move(chunk.begin(), chunk.end(), std::back_inserter(all));
    }
    all.insert(all.end(), tail_.begin(), tail_.end());
    return all;
}

size_t PagedSequence::purge() {
    size_t removed = store_->delete_all();
    if (config_.verbose) {
        std::cout << "[paged_seq] Purged " << removed << " chunk files from " << store_->root() << std::endl;
    }
    return removed;
}

void PagedSequence::clear() {
    purge();
    tail_.clear();
}

PagedSequence::const_iterator PagedSequence::begin() const {
    return const_iterator(this, 0);
}

PagedSequence::const_iterator PagedSequence::end() const {
    return const_iterator(this, size());
}

// === const_iterator ===

PagedSequence::const_iterator::const_iterator(const PagedSequence* seq, size_t pos)
    : seq_(seq), pos_(pos) {
    sync();
}

void PagedSequence::const_iterator::sync() {
    const size_t capacity = seq_->config_.chunk_capacity;
    const size_t flushed = seq_->store_->chunk_count() * capacity;

    if (pos_ >= flushed) {
        chunk_.reset();
        return;
    }

    size_t ordinal = pos_ / capacity;
    if (!chunk_ || chunk_ordinal_ != ordinal) {
        chunk_ = std::make_shared<const RecordGroup>(seq_->load_chunk(ordinal));
        chunk_ordinal_ = ordinal;
    }
}

PagedSequence::const_iterator::reference PagedSequence::const_iterator::operator*() const {
    if (chunk_) return (*chunk_)[pos_ % seq_->config_.chunk_capacity];
    return seq_->tail_[pos_ - seq_->store_->chunk_count() * seq_->config_.chunk_capacity];
}

PagedSequence::const_iterator& PagedSequence::const_iterator::operator++() {
    ++pos_;
    if (pos_ < seq_->size()) {
        sync();
    } else {
        chunk_.reset();
    }
    return *this;
}

PagedSequence::const_iterator PagedSequence::const_iterator::operator++(int) {
    const_iterator previous = *this;
    ++*this;
    return previous;
}

std::ostream& operator<<(std::ostream& os, const PagedSequence& seq) {
    return os << "PagedSequence(" << seq.size() << " items, " << seq.chunk_count() << " chunks, capacity "
              << seq.chunk_capacity() << ", root " << seq.storage_root() << ")";
}
