#include "atom.hpp"
#include "string_cache.hpp"

namespace ic {

Atom::Atom(std::string_view s) : Atom(intern(s)) {
}

std::optional<Atom> Atom::from_existing(std::string_view s) {
    return find_existing(s);
}

} // namespace ic
