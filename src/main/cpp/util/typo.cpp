#include <cstddef>
#include <memory_resource>
#include <span>
#include <string_view>

#include "sigil/util/levenshtein.hpp"
#include "sigil/util/typo.hpp"

namespace sigil {

Distant<std::size_t> closest_match(
    std::span<const std::u8string_view> haystack,
    std::u8string_view needle,
    std::pmr::memory_resource* memory
)
{
    Distant<std::size_t> best_match;

    for (std::size_t i = 0; i < haystack.size(); ++i) {
        const std::size_t distance = code_unit_levenshtein_distance(haystack[i], needle, memory);
        if (distance < best_match.distance) {
            best_match.value = i;
            best_match.distance = distance;
        }
    }

    return best_match;
}

} // namespace sigil
