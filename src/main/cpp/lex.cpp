#include <cstddef>
#include <memory_resource>
#include <optional>
#include <string>
#include <string_view>

#include "sigil/util/assert.hpp"
#include "sigil/util/result.hpp"
#include "sigil/util/strings.hpp"

#include "sigil/compile_error.hpp"
#include "sigil/escape.hpp"
#include "sigil/fwd.hpp"
#include "sigil/lex.hpp"
#include "sigil/modifier_set.hpp"

namespace sigil {
namespace {

[[nodiscard]]
Compile_Error_Code to_compile_error_code(Escape_Error_Code code)
{
    switch (code) {
    case Escape_Error_Code::invalid_escape: return Compile_Error_Code::invalid_escape;
    case Escape_Error_Code::unterminated_escape: return Compile_Error_Code::unterminated_escape;
    case Escape_Error_Code::invalid_codepoint: return Compile_Error_Code::invalid_codepoint;
    }
    SIGIL_ASSERT_UNREACHABLE(u8"Invalid escape error code.");
}

[[nodiscard]]
std::u8string_view escape_error_description(Escape_Error_Code code)
{
    switch (code) {
    case Escape_Error_Code::invalid_escape: return u8"invalid escape sequence: ";
    case Escape_Error_Code::unterminated_escape: return u8"unterminated escape sequence: ";
    case Escape_Error_Code::invalid_codepoint: return u8"invalid code point in escape: ";
    }
    SIGIL_ASSERT_UNREACHABLE(u8"Invalid escape error code.");
}

struct [[nodiscard]] Line_Lexer {
private:
    const std::size_t m_line_number;
    std::pmr::memory_resource* const m_memory;

public:
    [[nodiscard]]
    Line_Lexer(std::size_t line_number, std::pmr::memory_resource* memory)
        : m_line_number { line_number }
        , m_memory { memory }
    {
    }

    Result<Line, Compile_Error> operator()(std::u8string_view text)
    {
        const std::u8string_view stripped = strip_line(text);
        if (stripped.empty()) {
            return Line { .kind = Line_Kind::blank };
        }

        std::u8string_view head = stripped;
        std::optional<std::u8string_view> tail;
        for (std::size_t i = 0; i < stripped.length(); ++i) {
            if (is_ascii_blank(stripped[i])) {
                head = stripped.substr(0, i);
                tail = trim_ascii_blank_left(stripped.substr(i));
                break;
            }
        }

        if (head.starts_with(deprecation_marker)) {
            return lex_deprecated(head.substr(deprecation_marker.length()), tail);
        }
        if (tail && *tail == u8"{") {
            if (auto r = validate_identifier(head); !r) {
                return r.error();
            }
            return Line { .kind = Line_Kind::module_start, .name = head };
        }
        if (head == u8"}" && !tail) {
            return Line { .kind = Line_Kind::module_end };
        }
        if (head.starts_with(modifier_separator)) {
            return lex_variant(head.substr(1), tail);
        }
        if (const auto alias_parts = split_once(stripped, alias_marker)) {
            return lex_alias(
                trim_ascii_blank(alias_parts->first), trim_ascii_blank(alias_parts->second)
            );
        }

        if (auto r = validate_identifier(head); !r) {
            return r.error();
        }
        Line result { .kind = Line_Kind::symbol, .name = head };
        if (tail) {
            Result<std::pmr::u8string, Compile_Error> value = decode(*tail);
            if (!value) {
                return std::move(value).error();
            }
            result.value = std::move(*value);
        }
        return result;
    }

private:
    template <typename... Parts>
    [[nodiscard]]
    Compile_Error error(Compile_Error_Code code, const Parts&... parts) const
    {
        return make_compile_error(code, m_line_number, m_memory, parts...);
    }

    [[nodiscard]]
    Result<void, Compile_Error> validate_identifier(std::u8string_view name) const
    {
        if (is_identifier(name)) {
            return {};
        }
        return error(
            Compile_Error_Code::invalid_identifier, u8"invalid identifier: \"", name, u8"\""
        );
    }

    /// @brief Validates a dotted sequence of modifiers.
    /// @param allow_optional If `true`, modifiers may be suffixed with `?`.
    [[nodiscard]]
    Result<void, Compile_Error>
    validate_modifiers(std::u8string_view dotted, bool allow_optional) const
    {
        std::optional<Compile_Error> result;
        std::size_t seen_length = 0;
        for_each_part(dotted, modifier_separator, [&](std::u8string_view part) {
            if (result) {
                return;
            }
            const Modifier modifier = allow_optional ? Modifier::from_raw(part) : Modifier { part };
            if (auto r = validate_identifier(modifier.name); !r) {
                result = std::move(r).error();
                return;
            }
            const auto seen = Modifier_Set_View::from_raw_dotted(dotted.substr(0, seen_length));
            if (seen.contains(modifier.name)) {
                result = error(
                    Compile_Error_Code::duplicate_modifier, u8"duplicate modifier \"",
                    modifier.name, u8"\" in \"", dotted, u8"\""
                );
                return;
            }
            seen_length = std::size_t(part.data() - dotted.data()) + part.length();
        });
        if (result) {
            return std::move(*result);
        }
        return {};
    }

    [[nodiscard]]
    Result<std::pmr::u8string, Compile_Error> decode(std::u8string_view text) const
    {
        std::pmr::u8string out { m_memory };
        if (const Result<void, Escape_Error> r = decode_value(out, text); !r) {
            return error(
                to_compile_error_code(r.error().code), escape_error_description(r.error().code),
                r.error().escape
            );
        }
        return out;
    }

    [[nodiscard]]
    Result<Line, Compile_Error>
    lex_deprecated(std::u8string_view inner, std::optional<std::u8string_view> tail) const
    {
        if (!inner.ends_with(u8':')) {
            return error(
                Compile_Error_Code::malformed_modifier_annotation,
                u8"expected \":\" at the end of the deprecation annotation"
            );
        }
        inner.remove_suffix(1);

        Line result { .kind = Line_Kind::deprecated };
        if (!inner.empty()) {
            if (!inner.starts_with(u8'(') || !inner.ends_with(u8')') || inner.length() < 2) {
                return error(
                    Compile_Error_Code::malformed_modifier_annotation,
                    u8"malformed modifier in deprecation: \"", inner, u8"\""
                );
            }
            result.modifiers = inner.substr(1, inner.length() - 2);
            result.has_modifiers = true;
            if (auto r = validate_modifiers(result.modifiers, true); !r) {
                return std::move(r).error();
            }
        }

        if (!tail || tail->empty()) {
            return error(
                Compile_Error_Code::missing_deprecation_message, u8"missing deprecation message"
            );
        }
        result.message = trim_ascii_blank(*tail);
        return result;
    }

    [[nodiscard]]
    Result<Line, Compile_Error>
    lex_variant(std::u8string_view modifiers, std::optional<std::u8string_view> tail) const
    {
        if (auto r = validate_modifiers(modifiers, true); !r) {
            return std::move(r).error();
        }
        if (!tail) {
            return error(
                Compile_Error_Code::missing_value, u8"missing value for variant \".", modifiers,
                u8"\""
            );
        }
        Result<std::pmr::u8string, Compile_Error> value = decode(*tail);
        if (!value) {
            return std::move(value).error();
        }
        return Line { .kind = Line_Kind::variant,
                      .modifiers = modifiers,
                      .value = std::move(*value) };
    }

    [[nodiscard]]
    Result<Line, Compile_Error> lex_alias(std::u8string_view name, std::u8string_view target) const
    {
        if (auto r = validate_identifier(name); !r) {
            return r.error();
        }
        Line result { .kind = Line_Kind::alias, .name = name };
        if (target.ends_with(deep_alias_suffix)) {
            result.deep = true;
            target.remove_suffix(deep_alias_suffix.length());
        }

        const std::size_t separator = target.find(modifier_separator);
        result.target = target.substr(0, separator);
        if (auto r = validate_identifier(result.target); !r) {
            return r.error();
        }
        if (separator != std::u8string_view::npos) {
            result.modifiers = target.substr(separator + 1);
            if (auto r = validate_modifiers(result.modifiers, false); !r) {
                return std::move(r).error();
            }
        }
        return result;
    }
};

} // namespace

std::u8string_view line_kind_name(Line_Kind kind) noexcept
{
    using enum Line_Kind;
    switch (kind) {
        SIGIL_ENUM_STRING_CASE8(blank);
        SIGIL_ENUM_STRING_CASE8(deprecated);
        SIGIL_ENUM_STRING_CASE8(module_start);
        SIGIL_ENUM_STRING_CASE8(module_end);
        SIGIL_ENUM_STRING_CASE8(symbol);
        SIGIL_ENUM_STRING_CASE8(variant);
        SIGIL_ENUM_STRING_CASE8(alias);
    }
    SIGIL_ASSERT_UNREACHABLE(u8"Invalid line kind.");
}

std::u8string_view strip_line(std::u8string_view line) noexcept
{
    if (const std::size_t comment = line.find(u8"//"); comment != std::u8string_view::npos) {
        line = line.substr(0, comment);
    }
    return trim_ascii_blank(line);
}

Result<Line, Compile_Error>
lex_line(std::u8string_view line, std::size_t line_number, std::pmr::memory_resource* memory)
{
    return Line_Lexer { line_number, memory }(line);
}

} // namespace sigil
