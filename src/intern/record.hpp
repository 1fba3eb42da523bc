#pragma once

#include <cstdint>
#include <cstddef>
#include <limits>

namespace ic {

// Hard cap on the size of one interned string, set by the width of RecordHeader::length.
inline constexpr size_t kMaxAtomLength = std::numeric_limits<uint32_t>::max();

// Layout of one stored string in an arena:
//
//   [ hash : 8 ][ length : 4 ][ reserved : 4 ][ bytes : length ][ 0x00 ]
//                                             ^
//                                             address held by an Atom
//
// The header is read through a fixed negative offset from the bytes address.
struct alignas(8) RecordHeader {
    uint64_t hash;
    uint32_t length;
    uint32_t reserved;  // always 0
};

static_assert(sizeof(RecordHeader) == 16, "RecordHeader layout is part of the handle ABI");
static_assert(alignof(RecordHeader) == 8, "hash must be readable without misaligned access");

inline constexpr size_t RECORD_ALIGN = alignof(RecordHeader);

// Bytes a record of `length` content bytes occupies, rounded up to RECORD_ALIGN
constexpr size_t record_size(size_t length) noexcept {
    size_t raw = sizeof(RecordHeader) + length + 1;
    return (raw + RECORD_ALIGN - 1) & ~(RECORD_ALIGN - 1);
}

inline const RecordHeader* header_of(const char* bytes) noexcept {
    return reinterpret_cast<const RecordHeader*>(bytes - sizeof(RecordHeader));
}

// Statically allocated record for the zero-length string, shared by every cache.
// Atoms point sizeof(RecordHeader) bytes into the object, so header_of() lands
// back on its first byte.
struct EmptyRecord {
    RecordHeader header;
    char terminator[RECORD_ALIGN];
};

static_assert(offsetof(EmptyRecord, terminator) == sizeof(RecordHeader), "empty record must match the arena layout");
static_assert(sizeof(EmptyRecord) == record_size(0), "empty record must match the arena layout");

const char* empty_record() noexcept;

} // namespace ic
