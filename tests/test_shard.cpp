#include <gtest/gtest.h>
#include "intern/shard.hpp"
#include "common/hash.hpp"

#include <stdexcept>
#include <string>
#include <unordered_set>
#include <vector>

using namespace ic;

namespace {
Atom insert(Shard& shard, std::string_view s) {
    return shard.get_or_insert(hash_bytes(s), s);
}
}

TEST(ShardTest, SameContentSameAtom) {
    Shard shard;
    Atom a = insert(shard, "alpha");
    std::string copy = "alpha";
    Atom b = insert(shard, copy);

    EXPECT_EQ(a, b);
    EXPECT_EQ(a.c_str(), b.c_str());
    EXPECT_EQ(shard.size(), 1u);
}

TEST(ShardTest, DistinctContentDistinctAtoms) {
    Shard shard;
    Atom a = insert(shard, "alpha");
    Atom b = insert(shard, "beta");

    EXPECT_NE(a, b);
    EXPECT_EQ(a.view(), "alpha");
    EXPECT_EQ(b.view(), "beta");
    EXPECT_EQ(shard.size(), 2u);
}

TEST(ShardTest, ForcedHashCollisionKeepsStringsApart) {
    Shard shard;
    const uint64_t forced = 0xdeadbeefULL;

    Atom a = shard.get_or_insert(forced, "first");
    Atom b = shard.get_or_insert(forced, "second");
    Atom c = shard.get_or_insert(forced, "first");

    EXPECT_NE(a, b);
    EXPECT_EQ(a, c);
    EXPECT_EQ(a.hash(), forced);
    EXPECT_EQ(b.hash(), forced);
    EXPECT_EQ(b.view(), "second");
    EXPECT_EQ(shard.size(), 2u);
}

TEST(ShardTest, SameHashDifferentLength) {
    Shard shard;
    Atom a = shard.get_or_insert(1, std::string_view("ab\0", 3));
    Atom b = shard.get_or_insert(1, "ab");

    EXPECT_NE(a, b);
    EXPECT_EQ(a.size(), 3u);
    EXPECT_EQ(b.size(), 2u);
}

TEST(ShardTest, FindDoesNotInsert) {
    Shard shard;
    EXPECT_FALSE(shard.find(hash_bytes("ghost"), "ghost").has_value());
    EXPECT_EQ(shard.size(), 0u);

    Atom a = insert(shard, "ghost");
    auto found = shard.find(hash_bytes("ghost"), "ghost");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(*found, a);
}

TEST(ShardTest, GrowthKeepsEveryEntry) {
    Shard shard(0, 2);
    std::vector<Atom> atoms;
    for (int i = 0; i < 10000; ++i) {
        atoms.push_back(insert(shard, "grow/" + std::to_string(i)));
    }

    EXPECT_EQ(shard.size(), 10000u);
    const size_t capacity = shard.capacity();
    EXPECT_EQ(capacity & (capacity - 1), 0u);
    EXPECT_LE(shard.size() * 4, capacity * 3);

    // Lookups after several rehashes return the same addresses
    for (int i = 0; i < 10000; ++i) {
        ASSERT_EQ(insert(shard, "grow/" + std::to_string(i)), atoms[i]);
    }
    EXPECT_EQ(shard.size(), 10000u);
}

TEST(ShardTest, ForEachVisitsAll) {
    Shard shard;
    insert(shard, "x");
    insert(shard, "y");
    insert(shard, "z");

    std::unordered_set<std::string> seen;
    shard.for_each([&seen](Atom atom) { seen.insert(atom.str()); });
    EXPECT_EQ(seen, (std::unordered_set<std::string>{"x", "y", "z"}));
}

TEST(ShardTest, MemoryAccounting) {
    Shard shard;
    insert(shard, "abc");
    insert(shard, "abc");
    EXPECT_EQ(shard.allocated_bytes(), record_size(3));
    EXPECT_GE(shard.capacity_bytes(), shard.allocated_bytes());
}

// Single-threaded: clearing is only defined without concurrent users
TEST(ShardTest, UnsafeClearEmptiesShard) {
    Shard shard(3, 4);
    for (int i = 0; i < 100; ++i) {
        insert(shard, "clear/" + std::to_string(i));
    }
    shard.unsafe_clear();

    EXPECT_EQ(shard.size(), 0u);
    EXPECT_EQ(shard.capacity(), 4u);
    EXPECT_EQ(shard.allocated_bytes(), 0u);

    Atom again = insert(shard, "clear/1");
    EXPECT_EQ(again.view(), "clear/1");
    EXPECT_EQ(shard.size(), 1u);
}

TEST(ShardTest, CapacityRoundsUpAndIsBounded) {
    EXPECT_EQ(Shard(0, 0).capacity(), 2u);
    EXPECT_EQ(Shard(0, 100).capacity(), 128u);
    EXPECT_EQ(Shard(0, Shard::DEFAULT_TABLE_CAPACITY).capacity(), Shard::DEFAULT_TABLE_CAPACITY);

    EXPECT_THROW(Shard(0, (size_t(1) << 63) + 1), std::invalid_argument);
    EXPECT_THROW(Shard(0, Shard::MAX_TABLE_CAPACITY + 1), std::invalid_argument);
}
