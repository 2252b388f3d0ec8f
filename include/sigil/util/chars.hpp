#ifndef SIGIL_CHARS_HPP
#define SIGIL_CHARS_HPP

#include "ulight/impl/ascii_chars.hpp"
#include "ulight/impl/lang/html_chars.hpp"
#include "ulight/impl/unicode_chars.hpp"

namespace sigil {

using ulight::is_ascii_alpha;
using ulight::is_ascii_digit;
using ulight::is_ascii_hex_digit;
using ulight::is_html_whitespace;
using ulight::is_scalar_value;

/// @brief Returns true if `c` is a blank character.
/// This matches the C locale definition,
/// and includes vertical tabs.
[[nodiscard]]
constexpr bool is_ascii_blank(char8_t c)
{
    return is_html_whitespace(c) || c == u8'\v';
}

/// @brief Returns true if `c` may appear in an identifier,
/// i.e. a symbol, module, or modifier name.
/// Only alphabetic ASCII characters are permitted.
[[nodiscard]]
constexpr bool is_identifier_character(char8_t c)
{
    return is_ascii_alpha(c);
}

} // namespace sigil

#endif
