#pragma once

#include "atom.hpp"
#include <unordered_map>
#include <unordered_set>

namespace ic {

// Returns the hash computed at intern time; nothing is rehashed.
struct AtomHash {
    size_t operator()(const Atom& atom) const noexcept { return static_cast<size_t>(atom.hash()); }
};

struct AtomEqual {
    bool operator()(const Atom& a, const Atom& b) const noexcept { return a == b; }
};

template <typename V>
using AtomMap = std::unordered_map<Atom, V, AtomHash, AtomEqual>;

using AtomSet = std::unordered_set<Atom, AtomHash, AtomEqual>;

} // namespace ic
