#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace ic {

// Thrown when a string is longer than the cache accepts. Nothing is stored.
class LengthError : public std::length_error {
public:
    LengthError(size_t length, size_t limit)
        : std::length_error("cannot intern " + std::to_string(length) +
                            " bytes, limit is " + std::to_string(limit)),
          length_(length), limit_(limit) {}

    size_t length() const noexcept { return length_; }
    size_t limit() const noexcept { return limit_; }

private:
    size_t length_;
    size_t limit_;
};

} // namespace ic
