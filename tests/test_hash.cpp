#include <gtest/gtest.h>
#include "common/hash.hpp"

#include <string>
#include <unordered_set>

using namespace ic;

// Usable at compile time, which the static empty record relies on
static_assert(hash_bytes(std::string_view{}) == 0x6bcb9d63eb8eab8bULL);

TEST(HashTest, KnownValues) {
    EXPECT_EQ(hash_bytes(""), 0x6bcb9d63eb8eab8bULL);
    EXPECT_EQ(hash_bytes("hello"), 0x5d8f6a78dc6189b7ULL);
    EXPECT_EQ(hash_bytes(std::string_view("a\0b", 3)), 0xc0d10f091397b7c4ULL);
}

TEST(HashTest, Deterministic) {
    std::string a = "config.server.port";
    std::string b = "config.server.port";
    EXPECT_EQ(hash_bytes(a), hash_bytes(b));
}

TEST(HashTest, EmbeddedZeroChangesHash) {
    EXPECT_NE(hash_bytes(std::string_view("a\0b", 3)), hash_bytes("ab"));
    EXPECT_NE(hash_bytes(std::string_view("\0", 1)), hash_bytes(""));
}

TEST(HashTest, HighBitsSpread) {
    // Shard routing uses the top bits; sequential keys must not pile up
    std::unordered_set<uint64_t> top_bytes;
    for (int i = 0; i < 4096; ++i) {
        top_bytes.insert(hash_bytes("key_" + std::to_string(i)) >> 56);
    }
    EXPECT_GT(top_bytes.size(), 240u);
}
