#ifndef SIGIL_LEVENSHTEIN_HPP
#define SIGIL_LEVENSHTEIN_HPP

#include <cstddef>
#include <memory_resource>
#include <string_view>

namespace sigil {

/// @brief Computes the Levenshtein distance between two strings,
/// treating every code unit as a separate character.
/// This is exact for ASCII strings, such as identifiers.
/// @param memory Used for a temporary buffer of `y.size() + 1` elements.
// https://en.wikipedia.org/wiki/Levenshtein_distance
[[nodiscard]]
std::size_t code_unit_levenshtein_distance(
    std::u8string_view x,
    std::u8string_view y,
    std::pmr::memory_resource* memory
);

} // namespace sigil

#endif
