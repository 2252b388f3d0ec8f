#include <algorithm>
#include <cstddef>
#include <memory_resource>
#include <string_view>
#include <vector>

#include "sigil/util/levenshtein.hpp"

namespace sigil {

std::size_t code_unit_levenshtein_distance(
    std::u8string_view x,
    std::u8string_view y,
    std::pmr::memory_resource* memory
)
{
    if (x.empty()) {
        return y.size();
    }
    if (y.empty()) {
        return x.size();
    }

    // Only the previous row of the distance matrix is needed to compute the next one.
    // row[j] holds the distance between the first i code units of x and the first j of y.
    std::pmr::vector<std::size_t> row(y.size() + 1, memory);
    for (std::size_t j = 0; j <= y.size(); ++j) {
        row[j] = j;
    }

    for (std::size_t i = 1; i <= x.size(); ++i) {
        std::size_t diagonal = row[0];
        row[0] = i;
        for (std::size_t j = 1; j <= y.size(); ++j) {
            const std::size_t above = row[j];
            const std::size_t substitution = diagonal + (x[i - 1] != y[j - 1] ? 1 : 0);
            row[j] = std::min({ above + 1, row[j - 1] + 1, substitution });
            diagonal = above;
        }
    }

    return row.back();
}

} // namespace sigil
