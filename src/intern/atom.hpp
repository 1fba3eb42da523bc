#pragma once

#include "record.hpp"
#include <compare>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

namespace ic {

class Shard;

// Handle to one interned byte string.
//
// An Atom is a single pointer to the bytes of a record owned by a StringCache.
// Equal content always yields the same pointer, so equality is a pointer
// compare and hash() reads the value computed at intern time. Atoms are never
// invalidated except by StringCache::unsafe_clear().
class Atom {
public:
    // The empty string. Takes no lock and never touches a cache.
    Atom() noexcept : ptr_(empty_record()) {}

    // Interns through the global cache. Throws LengthError above the length cap.
    explicit Atom(std::string_view s);
    explicit Atom(const std::string& s) : Atom(std::string_view(s)) {}
    // A null pointer gives the empty atom
    explicit Atom(const char* cstr) : Atom(cstr ? std::string_view(cstr) : std::string_view()) {}

    // Looks the string up in the global cache without inserting it
    static std::optional<Atom> from_existing(std::string_view s);

    uint64_t hash() const noexcept { return header_of(ptr_)->hash; }
    size_t size() const noexcept { return header_of(ptr_)->length; }
    bool empty() const noexcept { return size() == 0; }

    std::string_view view() const noexcept { return std::string_view(ptr_, size()); }
    std::string str() const { return std::string(view()); }

    // Raw pointer for C interfaces. The buffer is immutable, always followed by
    // a zero byte and outlives every Atom. Content may contain embedded zeros,
    // which end a C-style scan early.
    const char* c_str() const noexcept { return ptr_; }

    operator std::string_view() const noexcept { return view(); }

    bool operator==(const Atom& other) const noexcept { return ptr_ == other.ptr_; }

    // Orders by content; slower than equality.
    std::strong_ordering operator<=>(const Atom& other) const noexcept {
        if (ptr_ == other.ptr_) {
            return std::strong_ordering::equal;
        }
        return view() <=> other.view();
    }

private:
    friend class Shard;

    struct FromRecord {};
    Atom(FromRecord, const char* bytes) noexcept : ptr_(bytes) {}

    const char* ptr_;
};

static_assert(sizeof(Atom) == sizeof(void*), "Atom must stay pointer sized");
static_assert(std::is_trivially_copyable_v<Atom>, "Atom must be trivially copyable");

} // namespace ic

template <> struct std::hash<ic::Atom> {
    size_t operator()(const ic::Atom& atom) const noexcept { return static_cast<size_t>(atom.hash()); }
};
