/**
 * @file paged_sequence_test.cpp
 * @brief PagedSequence: chunk flushing, indexing, slices, bulk ops, open modes and cleanup.
 */

#include <fstream>
#include <iterator>
#include <sstream>
#include <string>

#include "test_helpers.hpp"
#include "errors.hpp"
#include "chunking/chunking.hpp"
#include "filegen/filegen.hpp"
#include "sequence/paged_sequence.hpp"

class PagedSequenceTest : public TempDirTest {
protected:
    SequenceConfig configFor(size_t capacity, OpenMode mode = OpenMode::Create) const {
        SequenceConfig config;
        config.chunk_capacity = capacity;
        config.storage_root = test_dir_;
        config.backend = TransformBackend::Sequential;
        config.open_mode = mode;
        return config;
    }

    static void expectLayout(const PagedSequence& seq) {
        EXPECT_EQ(seq.size(), seq.chunk_count() * seq.chunk_capacity() + seq.tail_size());
        EXPECT_LT(seq.tail_size(), seq.chunk_capacity());
    }
};

// ============================================================================
// Construction
// ============================================================================

TEST_F(PagedSequenceTest, StartsEmpty) {
    PagedSequence seq(10, test_dir_);
    EXPECT_EQ(seq.size(), 0u);
    EXPECT_TRUE(seq.empty());
    EXPECT_EQ(seq.chunk_count(), 0u);
    EXPECT_EQ(seq.storage_root(), test_dir_);
    EXPECT_TRUE(chunkFiles().empty());
}

TEST_F(PagedSequenceTest, ZeroCapacityRejected) {
    EXPECT_THROW(PagedSequence(0, test_dir_), std::invalid_argument);
}

TEST_F(PagedSequenceTest, UnknownCodecRejected) {
    SequenceConfig config = configFor(10);
    config.codec = "xml";
    EXPECT_THROW(PagedSequence seq(config), std::invalid_argument);
}

// ============================================================================
// Append and flushing
// ============================================================================

TEST_F(PagedSequenceTest, FlushesExactlyAtCapacity) {
    PagedSequence seq(configFor(4));
    for (size_t i = 0; i < 3; ++i) seq.append(idRecord(i));
    EXPECT_EQ(seq.chunk_count(), 0u);
    EXPECT_EQ(seq.tail_size(), 3u);

    seq.append(idRecord(3));
    EXPECT_EQ(seq.chunk_count(), 1u);
    EXPECT_EQ(seq.tail_size(), 0u);
    EXPECT_TRUE(fs::exists(seq.chunk_path(0)));
    EXPECT_EQ(seq.chunk_path(0), test_dir_ / "chunk_0.bin");
}

TEST_F(PagedSequenceTest, LayoutHoldsAfterEveryAppend) {
    PagedSequence seq(configFor(3));
    for (size_t i = 0; i < 20; ++i) {
        seq.append(idRecord(i));
        EXPECT_EQ(seq.size(), i + 1);
        expectLayout(seq);
    }
    EXPECT_EQ(seq.chunk_count(), 6u);
    EXPECT_EQ(chunkFiles().size(), 6u);
}

TEST_F(PagedSequenceTest, CapacityOneFlushesEveryRecord) {
    PagedSequence seq(configFor(1));
    for (size_t i = 0; i < 5; ++i) seq.append(idRecord(i));
    EXPECT_EQ(seq.chunk_count(), 5u);
    EXPECT_EQ(seq.tail_size(), 0u);
    EXPECT_EQ(seq.get(4), idRecord(4));
}

// ============================================================================
// Indexed access
// ============================================================================

TEST_F(PagedSequenceTest, GetAcrossChunkBoundary) {
    PagedSequence seq(configFor(10));
    for (size_t i = 0; i < 15; ++i) seq.append(idRecord(i));

    EXPECT_EQ(seq.chunk_count(), 1u);
    EXPECT_EQ(seq.tail_size(), 5u);
    for (size_t i = 8; i < 12; ++i) {
        EXPECT_EQ(seq.get(static_cast<int64_t>(i)), idRecord(i));
    }
    EXPECT_EQ(seq.get(-1), idRecord(14));
    EXPECT_EQ(seq.get(-15), idRecord(0));
}

TEST_F(PagedSequenceTest, GetOutOfRange) {
    PagedSequence seq(configFor(10));
    for (size_t i = 0; i < 15; ++i) seq.append(idRecord(i));

    EXPECT_THROW(seq.get(100), OutOfRangeError);
    EXPECT_THROW(seq.get(15), OutOfRangeError);
    EXPECT_THROW(seq.get(-16), OutOfRangeError);
    EXPECT_THROW(seq.set(15, idRecord(0)), OutOfRangeError);
}

TEST_F(PagedSequenceTest, SetInChunkAndTail) {
    PagedSequence seq(configFor(5));
    for (size_t i = 0; i < 12; ++i) seq.append(idRecord(i));

    Record replacement{{"id", 999}};
    seq.set(3, replacement);
    seq.set(-1, replacement);

    EXPECT_EQ(seq.get(3), replacement);
    EXPECT_EQ(seq.get(11), replacement);
    EXPECT_EQ(seq.get(2), idRecord(2));
    EXPECT_EQ(seq.get(4), idRecord(4));
    EXPECT_EQ(seq.size(), 12u);
    expectLayout(seq);
}

TEST_F(PagedSequenceTest, SetIsPersistedInChunkFile) {
    PagedSequence seq(configFor(5));
    for (size_t i = 0; i < 5; ++i) seq.append(idRecord(i));
    seq.set(2, Record{{"id", "changed"}});

    ChunkStore reader(test_dir_, make_codec("msgpack"));
    reader.scan_chunk_count();
    EXPECT_EQ(reader.load(0)[2], (Record{{"id", "changed"}}));
}

// ============================================================================
// Slices
// ============================================================================

TEST_F(PagedSequenceTest, SliceMatchesIndexedReads) {
    PagedSequence seq(configFor(4));
    for (size_t i = 0; i < 18; ++i) seq.append(idRecord(i));

    for (int64_t start = -20; start <= 20; start += 3) {
        for (int64_t stop = -20; stop <= 20; stop += 5) {
            SliceBounds b = clamp_slice(start, stop, seq.size());
            RecordGroup expected;
            for (size_t i = b.start; i < b.stop; ++i) expected.push_back(seq.get(static_cast<int64_t>(i)));
            EXPECT_EQ(seq.get_slice(start, stop), expected) << "[" << start << ":" << stop << "]";
        }
    }
}

TEST_F(PagedSequenceTest, SliceAcrossChunksAndTail) {
    PagedSequence seq(configFor(5));
    for (size_t i = 0; i < 13; ++i) seq.append(idRecord(i));

    EXPECT_EQ(seq.get_slice(3, 12), idRecords(3, 12));
    EXPECT_EQ(seq.get_slice(0, 100), idRecords(0, 13));
    EXPECT_EQ(seq.get_slice(-3, 13), idRecords(10, 13));
    EXPECT_TRUE(seq.get_slice(7, 3).empty());
    EXPECT_TRUE(seq.get_slice(50, 60).empty());
}

TEST_F(PagedSequenceTest, SetSliceAcrossChunksAndTail) {
    PagedSequence seq(configFor(5));
    for (size_t i = 0; i < 13; ++i) seq.append(idRecord(i));

    RecordGroup replacement = idRecords(100, 109);
    seq.set_slice(3, 12, replacement);

    EXPECT_EQ(seq.get_slice(3, 12), replacement);
    EXPECT_EQ(seq.get(2), idRecord(2));
    EXPECT_EQ(seq.get(12), idRecord(12));
    EXPECT_EQ(seq.size(), 13u);
    expectLayout(seq);
}

TEST_F(PagedSequenceTest, SetSliceFromJsonArray) {
    PagedSequence seq(configFor(5));
    for (size_t i = 0; i < 8; ++i) seq.append(idRecord(i));

    Record values = Record::array();
    values.push_back(Record{{"id", "a"}});
    values.push_back(Record{{"id", "b"}});
    seq.set_slice(4, 6, values);

    EXPECT_EQ(seq.get(4), (Record{{"id", "a"}}));
    EXPECT_EQ(seq.get(5), (Record{{"id", "b"}}));
}

TEST_F(PagedSequenceTest, SetSliceLengthMismatch) {
    PagedSequence seq(configFor(5));
    for (size_t i = 0; i < 8; ++i) seq.append(idRecord(i));

    try {
        seq.set_slice(2, 6, idRecords(0, 3));
        FAIL() << "expected LengthMismatchError";
    } catch (const LengthMismatchError& e) {
        EXPECT_EQ(e.expected(), 4u);
        EXPECT_EQ(e.actual(), 3u);
    }
    // nothing written
    EXPECT_EQ(seq.get_slice(0, 8), idRecords(0, 8));
}

TEST_F(PagedSequenceTest, SetSliceTypeMismatch) {
    PagedSequence seq(configFor(5));
    for (size_t i = 0; i < 8; ++i) seq.append(idRecord(i));

    Record object{{"id", 1}};
    EXPECT_THROW(seq.set_slice(0, 1, object), TypeMismatchError);
    EXPECT_THROW(seq.set_slice(0, 1, Record("text")), TypeMismatchError);
    EXPECT_EQ(seq.get(0), idRecord(0));
}

TEST_F(PagedSequenceTest, EmptySliceAssignment) {
    PagedSequence seq(configFor(5));
    for (size_t i = 0; i < 8; ++i) seq.append(idRecord(i));
    seq.set_slice(6, 2, RecordGroup{});
    EXPECT_EQ(seq.combine(), idRecords(0, 8));
}

// ============================================================================
// Bulk operations
// ============================================================================

TEST_F(PagedSequenceTest, ExtendMatchesRepeatedAppend) {
    PagedSequence appended(configFor(4));
    SequenceConfig other = configFor(4);
    other.storage_root = test_dir_ / "extended";
    PagedSequence extended(other);

    appended.append(idRecord(0));
    extended.append(idRecord(0));

    RecordGroup batch = idRecords(1, 15);
    for (const auto& rec : batch) appended.append(rec);
    extended.extend(batch);

    EXPECT_EQ(extended.size(), appended.size());
    EXPECT_EQ(extended.chunk_count(), appended.chunk_count());
    EXPECT_EQ(extended.tail_size(), appended.tail_size());
    EXPECT_EQ(extended.combine(), appended.combine());
    expectLayout(extended);
}

TEST_F(PagedSequenceTest, ExtendEmptyBatch) {
    PagedSequence seq(configFor(4));
    seq.extend({});
    EXPECT_TRUE(seq.empty());
}

TEST_F(PagedSequenceTest, CombineReturnsEverythingInOrder) {
    PagedSequence seq(configFor(3));
    seq.extend(idRecords(0, 11));
    EXPECT_EQ(seq.combine(), idRecords(0, 11));
}

TEST_F(PagedSequenceTest, IteratorVisitsInOrder) {
    PagedSequence seq(configFor(3));
    seq.extend(idRecords(0, 10));

    size_t i = 0;
    for (const auto& rec : seq) {
        EXPECT_EQ(rec, idRecord(i));
        ++i;
    }
    EXPECT_EQ(i, 10u);

    // a second pass reads the chunks again
    auto it = seq.begin();
    EXPECT_EQ((*it)["id"], 0);
    it++;
    EXPECT_EQ(it->at("id"), 1);
    EXPECT_EQ(it.index(), 1u);
}

TEST_F(PagedSequenceTest, IteratorOnEmptySequence) {
    PagedSequence seq(configFor(3));
    EXPECT_TRUE(seq.begin() == seq.end());
}

TEST_F(PagedSequenceTest, FillAndVerifyGeneratedRecords) {
    PagedSequence seq(configFor(7));
    fill_sequence(seq, 50, RecordKind::CONTACT, 8);
    EXPECT_EQ(seq.size(), 50u);
    EXPECT_TRUE(verify_sequence_ids(seq));

    seq.set(10, Record{{"seq", 3}});
    EXPECT_FALSE(verify_sequence_ids(seq));
}

// ============================================================================
// Purge, clear and destruction
// ============================================================================

TEST_F(PagedSequenceTest, PurgeRemovesFilesKeepsTail) {
    PagedSequence seq(configFor(5));
    seq.extend(idRecords(0, 13));
    ASSERT_EQ(chunkFiles().size(), 2u);

    EXPECT_EQ(seq.purge(), 2u);
    EXPECT_TRUE(chunkFiles().empty());
    EXPECT_EQ(seq.chunk_count(), 0u);
    EXPECT_EQ(seq.tail_size(), 3u);
    EXPECT_EQ(seq.size(), 3u);
    EXPECT_EQ(seq.get(0), idRecord(10));

    EXPECT_EQ(seq.purge(), 0u);
}

TEST_F(PagedSequenceTest, ClearDropsEverything) {
    PagedSequence seq(configFor(5));
    seq.extend(idRecords(0, 13));
    seq.clear();
    EXPECT_TRUE(seq.empty());
    EXPECT_TRUE(chunkFiles().empty());

    seq.append(idRecord(1));
    EXPECT_EQ(seq.get(0), idRecord(1));
}

TEST_F(PagedSequenceTest, FilesOutliveTheSequenceByDefault) {
    {
        PagedSequence seq(configFor(5));
        seq.extend(idRecords(0, 10));
    }
    EXPECT_EQ(chunkFiles().size(), 2u);
}

TEST_F(PagedSequenceTest, PurgeOnDestroy) {
    {
        SequenceConfig config = configFor(5);
        config.purge_on_destroy = true;
        PagedSequence seq(config);
        seq.extend(idRecords(0, 10));
        EXPECT_EQ(chunkFiles().size(), 2u);
    }
    EXPECT_TRUE(chunkFiles().empty());
}

TEST_F(PagedSequenceTest, DescribesItself) {
    PagedSequence seq(configFor(10));
    seq.extend(idRecords(0, 3));

    std::ostringstream out;
    out << seq;
    EXPECT_NE(out.str().find("PagedSequence"), std::string::npos);
    EXPECT_NE(out.str().find("3 items"), std::string::npos);
    EXPECT_NE(out.str().find("capacity 10"), std::string::npos);
}

// ============================================================================
// Open modes
// ============================================================================

TEST_F(PagedSequenceTest, CreateRefusesExistingChunks) {
    {
        PagedSequence seq(configFor(5));
        seq.extend(idRecords(0, 10));
    }
    EXPECT_THROW(PagedSequence seq(configFor(5, OpenMode::Create)), StorageError);
    EXPECT_EQ(chunkFiles().size(), 2u);
}

TEST_F(PagedSequenceTest, TruncateDeletesExistingChunks) {
    {
        PagedSequence seq(configFor(5));
        seq.extend(idRecords(0, 10));
    }
    PagedSequence seq(configFor(5, OpenMode::Truncate));
    EXPECT_TRUE(seq.empty());
    EXPECT_TRUE(chunkFiles().empty());
}

TEST_F(PagedSequenceTest, RecoverAdoptsExistingChunks) {
    {
        PagedSequence seq(configFor(5));
        seq.extend(idRecords(0, 13));
    }
    PagedSequence seq(configFor(5, OpenMode::Recover));
    EXPECT_EQ(seq.chunk_count(), 2u);
    EXPECT_EQ(seq.tail_size(), 0u);
    EXPECT_EQ(seq.size(), 10u);
    EXPECT_EQ(seq.combine(), idRecords(0, 10));

    seq.append(idRecord(10));
    EXPECT_EQ(seq.get(10), idRecord(10));
}

TEST_F(PagedSequenceTest, RecoverStopsAtFirstGap) {
    {
        PagedSequence seq(configFor(2));
        seq.extend(idRecords(0, 8));
    }
    fs::remove(test_dir_ / "chunk_2.bin");

    PagedSequence seq(configFor(2, OpenMode::Recover));
    EXPECT_EQ(seq.chunk_count(), 2u);
    EXPECT_EQ(seq.combine(), idRecords(0, 4));
}

TEST_F(PagedSequenceTest, RecoverRejectsDifferentCapacity) {
    {
        PagedSequence seq(configFor(5));
        seq.extend(idRecords(0, 10));
    }
    EXPECT_THROW(PagedSequence seq(configFor(4, OpenMode::Recover)), StorageError);
}

TEST_F(PagedSequenceTest, OpenModeNames) {
    for (auto mode : {OpenMode::Create, OpenMode::Truncate, OpenMode::Recover}) {
        EXPECT_EQ(parse_open_mode(open_mode_name(mode)), mode);
    }
    EXPECT_THROW(parse_open_mode("append"), std::invalid_argument);
}

TEST(ParseCountTest, AcceptsDecimalCounts) {
    EXPECT_EQ(parse_count("0", "n"), 0u);
    EXPECT_EQ(parse_count("10000", "n"), 10000u);
}

TEST(ParseCountTest, RejectsNegativeAndMalformed) {
    EXPECT_THROW(parse_count("-5", "num_records"), std::invalid_argument);
    EXPECT_THROW(parse_count("-0", "num_records"), std::invalid_argument);
    EXPECT_THROW(parse_count("+5", "num_records"), std::invalid_argument);
    EXPECT_THROW(parse_count(" 5", "num_records"), std::invalid_argument);
    EXPECT_THROW(parse_count("", "num_records"), std::invalid_argument);
    EXPECT_THROW(parse_count("12abc", "num_records"), std::invalid_argument);
    EXPECT_THROW(parse_count("99999999999999999999999", "num_records"), std::invalid_argument);
}

// ============================================================================
// Storage faults
// ============================================================================

TEST_F(PagedSequenceTest, CorruptChunkSurfacesAsStorageError) {
    PagedSequence seq(configFor(5));
    seq.extend(idRecords(0, 7));
    {
        std::ofstream out(seq.chunk_path(0), std::ios::binary | std::ios::trunc);
        out << "garbage";
    }
    EXPECT_THROW(seq.get(1), DecodeError);
    EXPECT_EQ(seq.get(6), idRecord(6));
}

TEST_F(PagedSequenceTest, MissingChunkSurfacesAsStorageError) {
    PagedSequence seq(configFor(5));
    seq.extend(idRecords(0, 7));
    fs::remove(seq.chunk_path(0));
    EXPECT_THROW(seq.get(0), StorageError);
    EXPECT_THROW(seq.get_slice(0, 7), StorageError);
}

TEST_F(PagedSequenceTest, JsonCodecSequence) {
    SequenceConfig config = configFor(4);
    config.codec = "json";
    PagedSequence seq(config);
    seq.extend(idRecords(0, 9));
    EXPECT_EQ(seq.combine(), idRecords(0, 9));

    std::ifstream in(seq.chunk_path(0));
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_EQ(text.front(), '[');
}

// ============================================================================
// Reference scenarios
// ============================================================================

TEST_F(PagedSequenceTest, ChunkBoundaryCounts) {
    const size_t capacity = 6;
    for (size_t k = 0; k < capacity; ++k) {
        SequenceConfig config = configFor(capacity);
        config.storage_root = test_dir_ / ("k" + std::to_string(k));
        PagedSequence seq(config);
        seq.extend(idRecords(0, capacity + k));
        EXPECT_EQ(seq.chunk_count(), 1u) << "k=" << k;
        EXPECT_EQ(seq.tail_size(), k) << "k=" << k;
    }
}

TEST_F(PagedSequenceTest, CombineAgreesWithGet) {
    PagedSequence seq(configFor(4));
    seq.extend(idRecords(0, 14));
    RecordGroup all = seq.combine();
    ASSERT_EQ(all.size(), seq.size());
    for (size_t i = 0; i < all.size(); ++i) {
        EXPECT_EQ(all[i], seq.get(static_cast<int64_t>(i)));
    }
}

TEST_F(PagedSequenceTest, SliceAssignmentScenarios) {
    PagedSequence seq(configFor(10));
    seq.extend(idRecords(0, 15));
    Record a{{"id", "a"}};

    EXPECT_THROW(seq.set_slice(0, 2, RecordGroup{a}), LengthMismatchError);
    EXPECT_THROW(seq.set_slice(0, 2, a), TypeMismatchError);
    EXPECT_EQ(seq.get_slice(0, 2), idRecords(0, 2));
}
