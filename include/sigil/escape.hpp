#ifndef SIGIL_ESCAPE_HPP
#define SIGIL_ESCAPE_HPP

#include <memory_resource>
#include <optional>
#include <string>
#include <string_view>

#include "sigil/util/result.hpp"

#include "sigil/fwd.hpp"

namespace sigil {

enum struct Escape_Error_Code : Default_Underlying {
    /// @brief A backslash is not followed by a known escape sequence,
    /// or the escape contains an unknown tag, like `\vs{17}`.
    invalid_escape,
    /// @brief The closing `}` of an escape sequence is missing.
    unterminated_escape,
    /// @brief The digits of a `\u{...}` escape are not hexadecimal,
    /// or do not denote a Unicode scalar value.
    invalid_codepoint,
};

struct Escape_Error {
    Escape_Error_Code code;
    /// @brief The offending part of the value, starting with the backslash.
    /// For unterminated escapes, this is the rest of the value.
    std::u8string_view escape;
};

/// @brief Returns the variation selector named by `tag` within a `\vs{tag}` escape.
/// Valid tags are `1` through `16`, with `text` and `emoji`
/// being synonyms for `15` and `16`, respectively.
[[nodiscard]]
std::optional<char32_t> variation_selector_by_tag(std::u8string_view tag) noexcept;

/// @brief Returns the combining character named by `tag` within a `\c{tag}` escape.
[[nodiscard]]
std::optional<char32_t> combining_character_by_tag(std::u8string_view tag) noexcept;

/// @brief Decodes the value of a symbol or variant declaration, appending the result to `out`.
/// Literal text is copied as is,
/// and the following escape sequences are replaced with the character they denote:
/// - `\u{HEX}`, a Unicode scalar value in hexadecimal,
/// - `\vs{TAG}`, a variation selector (see `variation_selector_by_tag`),
/// - `\c{TAG}`, a combining character (see `combining_character_by_tag`).
///
/// If decoding fails, the contents of `out` are unspecified.
[[nodiscard]]
Result<void, Escape_Error> decode_value(std::pmr::u8string& out, std::u8string_view text);

} // namespace sigil

#endif
