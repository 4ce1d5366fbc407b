#include "filegen.hpp"
#include "../sequence/paged_sequence.hpp"

#include <algorithm>
#include <cstdio>
#include <iostream>
#include <random>

std::string random_payload(uint32_t len) {
    std::string result;
    result.reserve(len);
    static const char charset[] =
        "0123456789"
        "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
        "abcdefghijklmnopqrstuvwxyz";

    static thread_local std::mt19937 rg(std::random_device{}());
    static thread_local std::uniform_int_distribution<> pick(0, sizeof(charset) - 2);

    for (uint32_t i = 0; i < len; ++i) {
        result += charset[pick(rg)];
    }

    return result;
}

namespace {

Record make_contact(size_t i) {
    char phone[16];
    char cdate[32];
    char udate[32];
    std::snprintf(phone, sizeof(phone), "555-%04zu", i % 10000);
    std::snprintf(cdate, sizeof(cdate), "2023-01-%02zuT10:00:00-06:00", (i % 28) + 1);
    std::snprintf(udate, sizeof(udate), "2023-02-%02zuT10:00:00-06:00", (i % 28) + 1);

    return Record{
        {"id", std::to_string(i)},
        {"email", "contact_" + std::to_string(i) + "@example.com"},
        {"firstName", "First" + std::to_string(i)},
        {"lastName", "Last" + std::to_string(i)},
        {"phone", phone},
        {"fieldValues", Record::array({
            {{"field", "1"}, {"value", "custom_value_" + std::to_string(i)}},
            {{"field", "2"}, {"value", "another_value_" + std::to_string(i)}},
        })},
        {"tags", Record::array({"tag_" + std::to_string(i % 5), "tag_" + std::to_string((i + 1) % 5)})},
        {"active", i % 2 == 0},
        {"cdate", cdate},
        {"udate", udate},
    };
}

} // namespace

/**
 * Build one synthetic record.
 *
 * Every kind carries a numeric "seq" field equal to @p id so that
 * verify_sequence_ids() can check ordering whatever the record layout.
 *
 * @param id Position of the record in the generated sequence
 * @param kind Layout of the record
 * @param payload_len Length of the random "data" text for RecordKind::LARGE
 */
Record make_record(size_t id, RecordKind kind, uint32_t payload_len) {
    Record rec;
    switch (kind) {
        case RecordKind::ITEM:
            rec = Record{
                {"id", id},
                {"name", "item_" + std::to_string(id)},
                {"value", id * 10},
            };
            break;
        case RecordKind::CONTACT:
            rec = make_contact(id);
            break;
        case RecordKind::LARGE:
            rec = make_contact(id);
            rec["data"] = random_payload(payload_len);
            break;
    }
    rec["seq"] = id;
    return rec;
}

void fill_sequence(PagedSequence& seq, size_t num_records, RecordKind kind, size_t batch_size, size_t first_id) {
    batch_size = std::max<size_t>(1, batch_size);

    RecordGroup batch;
    batch.reserve(std::min(batch_size, num_records));
    for (size_t i = 0; i < num_records; ++i) {
        batch.push_back(make_record(first_id + i, kind));
        if (batch.size() == batch_size) {
            seq.extend(batch);
            batch.clear();
        }
    }
    if (!batch.empty()) seq.extend(batch);
}

/**
 * Validate that the sequence holds its records in generation order
 *
 * Iterates from start to finish and checks that record i carries "seq" == i.
 * On the first mismatch, output an error message and return false.
 */
bool verify_sequence_ids(const PagedSequence& seq) {
    size_t count = 0; // Counter for the number of records

    for (const auto& rec : seq) {
        auto it = rec.find("seq");
        if (it == rec.end() || !it->is_number_integer() || it->get<size_t>() != count) {
            std::cerr << "Sequence verification failed at record " << count << ": " << rec.dump() << std::endl;
            return false;
        }
        ++count;
    }

    if (count != seq.size()) {
        std::cerr << "Sequence verification failed: iterated " << count << " records, size() is " << seq.size() << std::endl;
        return false;
    }

    std::cout << "Verification PASSED! Total records: " << count << std::endl;
    return true;
}
