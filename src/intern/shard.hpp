#pragma once

#include "arena.hpp"
#include "atom.hpp"
#include <functional>
#include <mutex>
#include <optional>
#include <string_view>
#include <vector>

namespace ic {

// One lock-guarded partition of a StringCache: an open-addressing table of
// record pointers plus the arena the records live in.
class Shard {
public:
    static constexpr size_t DEFAULT_TABLE_CAPACITY = 256;
    static constexpr size_t MAX_TABLE_CAPACITY = size_t(1) << 30;

    // Throws std::invalid_argument if initial_capacity exceeds MAX_TABLE_CAPACITY
    explicit Shard(size_t index = 0,
                   size_t initial_capacity = DEFAULT_TABLE_CAPACITY,
                   size_t arena_block_bytes = Arena::DEFAULT_BLOCK_BYTES);

    Shard(const Shard&) = delete;
    Shard& operator=(const Shard&) = delete;

    // `hash` must be hash_bytes(bytes) for every caller except tests that
    // force collisions; the table only trusts it for rejection.
    Atom get_or_insert(uint64_t hash, std::string_view bytes);
    std::optional<Atom> find(uint64_t hash, std::string_view bytes) const;

    size_t size() const;
    size_t capacity() const;
    size_t allocated_bytes() const;
    size_t capacity_bytes() const;

    // Visits every stored atom while holding the lock. `fn` must not intern.
    void for_each(const std::function<void(Atom)>& fn) const;

    // Drops all entries and frees the arena. Callers guarantee exclusive use.
    void unsafe_clear();

private:
    // Slot holding a record with these bytes, or the empty slot where it would go
    size_t probe(uint64_t hash, std::string_view bytes) const;
    void grow();
    static bool matches(const char* record, uint64_t hash, std::string_view bytes);

    size_t index_;
    size_t initial_capacity_;
    mutable std::mutex mutex_;
    std::vector<const char*> slots_;  // nullptr marks an empty slot
    size_t size_ = 0;
    Arena arena_;
};

} // namespace ic
