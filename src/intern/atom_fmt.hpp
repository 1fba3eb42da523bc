#pragma once

#include "atom.hpp"
#include <spdlog/fmt/fmt.h>
#include <string_view>

// Formats an Atom as its content; accepts the same specs as std::string_view.
template <> struct fmt::formatter<ic::Atom> : fmt::formatter<std::string_view> {
    template <typename FormatContext>
    auto format(const ic::Atom& atom, FormatContext& ctx) const -> decltype(ctx.out()) {
        return fmt::formatter<std::string_view>::format(atom.view(), ctx);
    }
};
