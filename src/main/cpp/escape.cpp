#include <cstddef>
#include <memory_resource>
#include <optional>
#include <string>
#include <string_view>

#include "sigil/util/chars.hpp"
#include "sigil/util/result.hpp"
#include "sigil/util/strings.hpp"
#include "sigil/util/unicode.hpp"

#include "sigil/escape.hpp"

namespace sigil {
namespace {

[[nodiscard]]
constexpr int hex_digit_value(char8_t c)
{
    return is_ascii_digit(c) ? c - u8'0'
        : c >= u8'a'         ? c - u8'a' + 10
                             : c - u8'A' + 10;
}

[[nodiscard]]
std::optional<char32_t> parse_code_point(std::u8string_view hex)
{
    if (hex.empty()) {
        return {};
    }
    // Leading zeros are permitted, so the digit count alone does not bound the value.
    char32_t result = 0;
    for (const char8_t c : hex) {
        if (!is_ascii_hex_digit(c)) {
            return {};
        }
        result = (result << 4) | char32_t(hex_digit_value(c));
        if (result > U'\U0010FFFF') {
            return {};
        }
    }
    if (!is_scalar_value(result)) {
        return {};
    }
    return result;
}

void append_code_point(std::pmr::u8string& out, char32_t c)
{
    out.append(utf8::encode8_unchecked(c).as_string());
}

} // namespace

std::optional<char32_t> variation_selector_by_tag(std::u8string_view tag) noexcept
{
    if (tag == u8"text") {
        return U'\uFE0E';
    }
    if (tag == u8"emoji") {
        return U'\uFE0F';
    }
    if (tag.empty() || tag.length() > 2 || tag.front() == u8'0') {
        return {};
    }
    int number = 0;
    for (const char8_t c : tag) {
        if (!is_ascii_digit(c)) {
            return {};
        }
        number = (number * 10) + (c - u8'0');
    }
    if (number < 1 || number > 16) {
        return {};
    }
    return char32_t(U'\uFE00' + char32_t(number - 1));
}

std::optional<char32_t> combining_character_by_tag(std::u8string_view tag) noexcept
{
    if (tag == u8"not") {
        return U'\u0338'; // COMBINING LONG SOLIDUS OVERLAY
    }
    return {};
}

Result<void, Escape_Error> decode_value(std::pmr::u8string& out, std::u8string_view text)
{
    static constexpr std::u8string_view unicode_prefix = u8"\\u{";
    static constexpr std::u8string_view vs_prefix = u8"\\vs{";
    static constexpr std::u8string_view combining_prefix = u8"\\c{";

    while (!text.empty()) {
        const std::size_t backslash = text.find(u8'\\');
        if (backslash != 0) {
            const std::u8string_view literal = text.substr(0, backslash);
            out.append(literal);
            text.remove_prefix(literal.length());
            continue;
        }

        const std::u8string_view prefix = text.starts_with(unicode_prefix) ? unicode_prefix
            : text.starts_with(vs_prefix)                                  ? vs_prefix
            : text.starts_with(combining_prefix)                           ? combining_prefix
                                                                           : std::u8string_view {};
        if (prefix.empty()) {
            return Escape_Error { Escape_Error_Code::invalid_escape, text };
        }
        const std::size_t closing = text.find(u8'}', prefix.length());
        if (closing == std::u8string_view::npos) {
            return Escape_Error { Escape_Error_Code::unterminated_escape, text };
        }
        const std::u8string_view escape = text.substr(0, closing + 1);
        const std::u8string_view tag = text.substr(prefix.length(), closing - prefix.length());

        if (prefix == unicode_prefix) {
            const std::optional<char32_t> code_point = parse_code_point(tag);
            if (!code_point) {
                return Escape_Error { Escape_Error_Code::invalid_codepoint, escape };
            }
            append_code_point(out, *code_point);
        }
        else {
            const std::optional<char32_t> c = prefix == vs_prefix
                ? variation_selector_by_tag(tag)
                : combining_character_by_tag(tag);
            if (!c) {
                return Escape_Error { Escape_Error_Code::invalid_escape, escape };
            }
            append_code_point(out, *c);
        }
        text.remove_prefix(escape.length());
    }

    return {};
}

} // namespace sigil
