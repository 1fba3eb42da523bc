#pragma once

#include <cstdint>
#include <string_view>

namespace ic {

// Fixed seed, never randomized: the same bytes hash identically across runs.
inline constexpr uint64_t HASH_SEED = 0xcbf29ce484222325ULL ^ 0x9e3779b97f4a7c15ULL;

namespace detail {
inline constexpr uint64_t FNV_PRIME = 0x100000001b3ULL;

// MurmurHash3 finalizer, spreads FNV output into the high bits used for shard routing
constexpr uint64_t fmix64(uint64_t h) noexcept {
    h ^= h >> 33;
    h *= 0xff51afd7ed558ccdULL;
    h ^= h >> 33;
    h *= 0xc4ceb9fe1a85ec53ULL;
    h ^= h >> 33;
    return h;
}
}

// FNV-1a 64 over the bytes, finished with fmix64. Usable in constant expressions.
constexpr uint64_t hash_bytes(std::string_view bytes) noexcept {
    uint64_t hash = HASH_SEED;
    for (char c : bytes) {
        hash ^= static_cast<uint8_t>(c);
        hash *= detail::FNV_PRIME;
    }
    return detail::fmix64(hash ^ static_cast<uint64_t>(bytes.size()));
}

} // namespace ic
