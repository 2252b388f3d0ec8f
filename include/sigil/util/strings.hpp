#ifndef SIGIL_STRINGS_HPP
#define SIGIL_STRINGS_HPP

#include <cstddef>
#include <optional>
#include <span>
#include <string_view>
#include <utility>

#include "sigil/util/chars.hpp"

namespace sigil {

[[nodiscard]]
inline std::string_view as_string_view(std::u8string_view str)
{
    return { reinterpret_cast<const char*>(str.data()), str.size() };
}

[[nodiscard]]
constexpr std::u8string_view as_u8string_view(std::span<const char8_t> text)
{
    return { text.data(), text.size() };
}

[[nodiscard]]
inline std::u8string_view as_u8string_view(std::string_view text)
{
    return { reinterpret_cast<const char8_t*>(text.data()), text.size() };
}

[[nodiscard]]
constexpr std::size_t length_blank_left(std::u8string_view str)
{
    for (std::size_t i = 0; i < str.size(); ++i) {
        if (!is_ascii_blank(str[i])) {
            return i;
        }
    }
    return str.length();
}

[[nodiscard]]
constexpr std::size_t length_blank_right(std::u8string_view str)
{
    for (std::size_t i = 0; i < str.size(); ++i) {
        if (!is_ascii_blank(str[str.length() - i - 1])) {
            return i;
        }
    }
    return str.length();
}

[[nodiscard]]
constexpr std::u8string_view trim_ascii_blank_left(std::u8string_view str)
{
    return str.substr(length_blank_left(str));
}

[[nodiscard]]
constexpr std::u8string_view trim_ascii_blank_right(std::u8string_view str)
{
    return str.substr(0, str.length() - length_blank_right(str));
}

[[nodiscard]]
constexpr std::u8string_view trim_ascii_blank(std::u8string_view str)
{
    return trim_ascii_blank_right(trim_ascii_blank_left(str));
}

/// @brief Splits `str` at the first occurrence of `delimiter`.
/// Returns the text before and after the delimiter, not including the delimiter itself,
/// or `std::nullopt` if `delimiter` is not contained in `str`.
[[nodiscard]]
constexpr std::optional<std::pair<std::u8string_view, std::u8string_view>>
split_once(std::u8string_view str, std::u8string_view delimiter)
{
    const std::size_t pos = str.find(delimiter);
    if (pos == std::u8string_view::npos) {
        return {};
    }
    return std::pair { str.substr(0, pos), str.substr(pos + delimiter.length()) };
}

[[nodiscard]]
constexpr std::optional<std::pair<std::u8string_view, std::u8string_view>>
split_once(std::u8string_view str, char8_t delimiter)
{
    return split_once(str, std::u8string_view { &delimiter, 1 });
}

/// @brief Returns `true` if `str` is a non-empty sequence of identifier characters.
/// @see is_identifier_character
[[nodiscard]]
constexpr bool is_identifier(std::u8string_view str)
{
    if (str.empty()) {
        return false;
    }
    for (const char8_t c : str) {
        if (!is_identifier_character(c)) {
            return false;
        }
    }
    return true;
}

/// @brief Invokes `f` for each part of `str` separated by `delimiter`.
/// Empty parts are not skipped, so `"a..b"` yields `"a"`, `""`, and `"b"`.
/// An empty `str` yields a single empty part.
template <typename F>
constexpr void for_each_part(std::u8string_view str, char8_t delimiter, F f)
{
    while (true) {
        const std::size_t pos = str.find(delimiter);
        if (pos == std::u8string_view::npos) {
            f(str);
            return;
        }
        f(str.substr(0, pos));
        str.remove_prefix(pos + 1);
    }
}

} // namespace sigil

#endif
