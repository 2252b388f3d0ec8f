#ifndef SIGIL_TO_CHARS_HPP
#define SIGIL_TO_CHARS_HPP

#include <array>
#include <charconv>
#include <concepts>
#include <cstddef>
#include <limits>
#include <string>
#include <system_error>

#include "sigil/util/assert.hpp"

namespace sigil {

/// @brief Appends the decimal representation of `x` to `out`.
template <std::unsigned_integral T, typename String>
constexpr void append_decimal(String& out, const T x)
{
    std::array<char, std::numeric_limits<T>::digits10 + 1> chars {};
    const std::to_chars_result result = std::to_chars(chars.data(), chars.data() + chars.size(), x);
    SIGIL_ASSERT(result.ec == std::errc {});
    for (const char* p = chars.data(); p != result.ptr; ++p) {
        out.push_back(char8_t(*p));
    }
}

} // namespace sigil

#endif
