#pragma once

#include "atom.hpp"
#include "shard.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

namespace ic {

struct CacheOptions {
    uint32_t shard_count = 64;                           // power of two, 1..MAX_SHARDS
    size_t arena_block_bytes = Arena::DEFAULT_BLOCK_BYTES;  // first arena block per shard
    size_t initial_table_capacity = Shard::DEFAULT_TABLE_CAPACITY;  // at most Shard::MAX_TABLE_CAPACITY
    size_t max_length = kMaxAtomLength;                  // clamped to kMaxAtomLength
};

struct CacheStats {
    size_t entries = 0;
    size_t shard_count = 0;
    size_t table_slots = 0;
    size_t allocated_bytes = 0;
    size_t capacity_bytes = 0;
    size_t largest_shard = 0;
};

// Sharded interning table. Each string is routed by the high bits of its hash
// to exactly one shard, whose mutex is the only lock taken by intern().
class StringCache {
public:
    static constexpr uint32_t MAX_SHARDS = 4096;

    explicit StringCache(const CacheOptions& options = CacheOptions{});

    StringCache(const StringCache&) = delete;
    StringCache& operator=(const StringCache&) = delete;

    Atom intern(std::string_view bytes);
    std::optional<Atom> find(std::string_view bytes) const;

    // Distinct non-empty strings stored
    size_t size() const;
    CacheStats stats() const;

    // Every stored atom, in no particular order
    std::vector<Atom> snapshot() const;

    size_t shard_count() const { return shards_.size(); }
    size_t max_length() const { return max_length_; }
    size_t shard_index(uint64_t hash) const { return shard_bits_ == 0 ? 0 : static_cast<size_t>(hash >> (64 - shard_bits_)); }

    // UNSAFE: drops every entry and frees all string memory. Undefined behaviour
    // if another thread is interning, or if any Atom obtained from this cache
    // is used afterwards. Not checked at runtime.
    void unsafe_clear();

private:
    std::vector<std::unique_ptr<Shard>> shards_;
    uint32_t shard_bits_;
    size_t max_length_;
};

// Process-wide cache. Created on first use with default options unless
// init_global_cache() ran first. Never destroyed.
StringCache& global_cache();

// Configures the global cache. Returns false, leaving the existing cache
// untouched, if it was already created.
bool init_global_cache(const CacheOptions& options);

Atom intern(std::string_view bytes);
std::optional<Atom> find_existing(std::string_view bytes);
size_t cache_size();
CacheStats cache_stats();

// UNSAFE: see StringCache::unsafe_clear(). Single-threaded test code only.
void unsafe_clear_global_cache();

} // namespace ic
