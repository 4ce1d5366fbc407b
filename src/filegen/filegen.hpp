#ifndef FILE_UTILS_HPP
#define FILE_UTILS_HPP

#include <cstddef>
#include <cstdint>
#include <string>

#include "../../include/record.hpp"

class PagedSequence;

enum class RecordKind {
    ITEM,     // {id, name, value}
    CONTACT,  // contact-like record with nested lists and objects
    LARGE     // contact plus a random text payload
};

// Random alphanumeric text of the given length
std::string random_payload(uint32_t len);

Record make_record(size_t id, RecordKind kind = RecordKind::ITEM, uint32_t payload_len = 256);

// Append num_records generated records (ids first_id, first_id + 1, ...) in batches of batch_size
void fill_sequence(PagedSequence& seq, size_t num_records, RecordKind kind = RecordKind::ITEM,
                   size_t batch_size = 10000, size_t first_id = 0);

// Walk the sequence and check record i carries "seq" == i
bool verify_sequence_ids(const PagedSequence& seq);

#endif // FILE_UTILS_HPP
