#include <gtest/gtest.h>
#include "intern/arena.hpp"

#include <cstring>
#include <string>
#include <vector>

using namespace ic;

TEST(ArenaTest, RecordLayout) {
    Arena arena;
    const char* p = arena.allocate(0x1234abcdULL, "path/to/file");

    const RecordHeader* header = header_of(p);
    EXPECT_EQ(header->hash, 0x1234abcdULL);
    EXPECT_EQ(header->length, 12u);
    EXPECT_EQ(header->reserved, 0u);
    EXPECT_EQ(std::string_view(p, 12), "path/to/file");
    EXPECT_EQ(p[12], '\0');
    EXPECT_EQ(reinterpret_cast<uintptr_t>(header) % alignof(RecordHeader), 0u);
}

TEST(ArenaTest, EmbeddedZerosPreserved) {
    Arena arena;
    std::string_view content("a\0b\0", 4);
    const char* p = arena.allocate(7, content);

    EXPECT_EQ(header_of(p)->length, 4u);
    EXPECT_EQ(std::memcmp(p, content.data(), 4), 0);
    EXPECT_EQ(p[4], '\0');
}

TEST(ArenaTest, AddressesStableAcrossBlocks) {
    Arena arena(256);
    std::vector<const char*> records;
    std::vector<std::string> contents;

    for (int i = 0; i < 5000; ++i) {
        contents.push_back("entry-" + std::to_string(i));
        records.push_back(arena.allocate(static_cast<uint64_t>(i), contents.back()));
    }

    // Earlier records are untouched by later block growth
    for (size_t i = 0; i < records.size(); ++i) {
        ASSERT_EQ(std::string_view(records[i]), contents[i]);
        ASSERT_EQ(header_of(records[i])->hash, i);
    }
    EXPECT_EQ(arena.record_count(), 5000u);
    EXPECT_GE(arena.capacity_bytes(), arena.allocated_bytes());
}

TEST(ArenaTest, AllocatedBytesRoundedToAlignment) {
    Arena arena;
    arena.allocate(1, "");
    arena.allocate(2, "abc");
    arena.allocate(3, std::string(100, 'x'));

    EXPECT_EQ(record_size(0), 24u);
    EXPECT_EQ(record_size(7), 24u);
    EXPECT_EQ(record_size(8), 32u);
    EXPECT_EQ(arena.allocated_bytes(), record_size(0) + record_size(3) + record_size(100));
}

TEST(ArenaTest, LargeRecordBiggerThanBlock) {
    Arena arena(64);
    std::string big(10000, 'z');
    const char* p = arena.allocate(9, big);

    EXPECT_EQ(std::string_view(p, big.size()), big);
    EXPECT_EQ(p[big.size()], '\0');
}

TEST(ArenaTest, ReleaseResetsCounters) {
    Arena arena;
    arena.allocate(1, "one");
    arena.allocate(2, "two");
    ASSERT_GT(arena.capacity_bytes(), 0u);

    arena.release();
    EXPECT_EQ(arena.allocated_bytes(), 0u);
    EXPECT_EQ(arena.record_count(), 0u);

    const char* p = arena.allocate(3, "three");
    EXPECT_EQ(std::string_view(p), "three");
}
