#include "string_cache.hpp"
#include "errors.hpp"
#include "../common/hash.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <mutex>
#include <stdexcept>
#include <string>

namespace ic {

namespace {
    constexpr EmptyRecord EMPTY_RECORD{{hash_bytes(std::string_view{}), 0, 0}, {}};

    std::once_flag global_once;
    StringCache* global_instance = nullptr;

    void create_global(const CacheOptions& options) {
        // Never deleted; atoms stay valid through static destruction
        global_instance = new StringCache(options);
        spdlog::info("Global string cache created: {} shards, max length {}",
                     global_instance->shard_count(), global_instance->max_length());
    }

    uint32_t log2_exact(uint32_t n) {
        uint32_t bits = 0;
        while ((1u << bits) < n) {
            ++bits;
        }
        return bits;
    }
}

const char* empty_record() noexcept {
    return reinterpret_cast<const char*>(&EMPTY_RECORD) + sizeof(RecordHeader);
}

StringCache::StringCache(const CacheOptions& options)
    : shard_bits_(0), max_length_(std::min(options.max_length, kMaxAtomLength)) {
    const uint32_t count = options.shard_count;
    if (count == 0 || count > MAX_SHARDS || (count & (count - 1)) != 0) {
        throw std::invalid_argument("shard_count must be a power of two in [1, " +
                                    std::to_string(MAX_SHARDS) + "], got " + std::to_string(count));
    }
    if (options.initial_table_capacity > Shard::MAX_TABLE_CAPACITY) {
        throw std::invalid_argument("initial_table_capacity must be at most " +
                                    std::to_string(Shard::MAX_TABLE_CAPACITY) + ", got " +
                                    std::to_string(options.initial_table_capacity));
    }
    shard_bits_ = log2_exact(count);

    shards_.reserve(count);
    for (uint32_t i = 0; i < count; ++i) {
        shards_.push_back(std::make_unique<Shard>(i, options.initial_table_capacity, options.arena_block_bytes));
    }
}

Atom StringCache::intern(std::string_view bytes) {
    if (bytes.empty()) {
        return Atom();
    }
    if (bytes.size() > max_length_) {
        throw LengthError(bytes.size(), max_length_);
    }

    const uint64_t hash = hash_bytes(bytes);
    return shards_[shard_index(hash)]->get_or_insert(hash, bytes);
}

std::optional<Atom> StringCache::find(std::string_view bytes) const {
    if (bytes.empty()) {
        return Atom();
    }
    if (bytes.size() > max_length_) {
        return std::nullopt;
    }

    const uint64_t hash = hash_bytes(bytes);
    return shards_[shard_index(hash)]->find(hash, bytes);
}

size_t StringCache::size() const {
    size_t total = 0;
    for (const auto& shard : shards_) {
        total += shard->size();
    }
    return total;
}

CacheStats StringCache::stats() const {
    CacheStats stats;
    stats.shard_count = shards_.size();
    for (const auto& shard : shards_) {
        size_t entries = shard->size();
        stats.entries += entries;
        stats.largest_shard = std::max(stats.largest_shard, entries);
        stats.table_slots += shard->capacity();
        stats.allocated_bytes += shard->allocated_bytes();
        stats.capacity_bytes += shard->capacity_bytes();
    }
    return stats;
}

std::vector<Atom> StringCache::snapshot() const {
    std::vector<Atom> atoms;
    atoms.reserve(size());
    for (const auto& shard : shards_) {
        shard->for_each([&atoms](Atom atom) { atoms.push_back(atom); });
    }
    return atoms;
}

void StringCache::unsafe_clear() {
    for (auto& shard : shards_) {
        shard->unsafe_clear();
    }
}

StringCache& global_cache() {
    std::call_once(global_once, [] { create_global(CacheOptions{}); });
    return *global_instance;
}

bool init_global_cache(const CacheOptions& options) {
    bool created = false;
    std::call_once(global_once, [&] {
        create_global(options);
        created = true;
    });
    return created;
}

Atom intern(std::string_view bytes) {
    return global_cache().intern(bytes);
}

std::optional<Atom> find_existing(std::string_view bytes) {
    return global_cache().find(bytes);
}

size_t cache_size() {
    return global_cache().size();
}

CacheStats cache_stats() {
    return global_cache().stats();
}

void unsafe_clear_global_cache() {
    spdlog::warn("Clearing the global string cache; every outstanding atom is now dangling");
    global_cache().unsafe_clear();
}

} // namespace ic
