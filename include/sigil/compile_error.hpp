#ifndef SIGIL_COMPILE_ERROR_HPP
#define SIGIL_COMPILE_ERROR_HPP

#include <cstddef>
#include <memory_resource>
#include <string>
#include <string_view>

#include "sigil/diagnostic.hpp"
#include "sigil/fwd.hpp"

namespace sigil {

#define SIGIL_COMPILE_ERROR_CODE_ENUM_DATA(F)                                                      \
    F(invalid_identifier, identifier_invalid)                                                      \
    F(invalid_escape, escape_invalid)                                                              \
    F(unterminated_escape, escape_unterminated)                                                    \
    F(invalid_codepoint, escape_codepoint)                                                         \
    F(missing_value, value_missing)                                                                \
    F(missing_deprecation_message, deprecation_message_missing)                                    \
    F(dangling_deprecation, deprecation_dangling)                                                  \
    F(duplicate_deprecation, deprecation_duplicate)                                                \
    F(malformed_modifier_annotation, deprecation_modifier)                                         \
    F(unexpected_declaration, declaration_unexpected)                                              \
    F(duplicate_definition, definition_duplicate)                                                  \
    F(duplicate_modifier, modifier_duplicate)                                                      \
    F(unclosed_module, module_unclosed)                                                            \
    F(unexpected_module_end, module_end_unexpected)                                                \
    F(alias_to_nonexistent_symbol, alias_no_symbol)                                                \
    F(alias_to_nonexistent_variant, alias_no_variant)                                              \
    F(alias_to_alias, alias_to_alias)

#define SIGIL_COMPILE_ERROR_CODE_ENUMERATOR(id, diagnostic_id) id,

/// @brief The kind of error which made compilation of a source file fail.
/// Every error is fatal; no module is produced.
enum struct Compile_Error_Code : Default_Underlying {
    SIGIL_COMPILE_ERROR_CODE_ENUM_DATA(SIGIL_COMPILE_ERROR_CODE_ENUMERATOR)
};

/// @brief Returns the name of the enumerator, such as `u8"alias_to_alias"`.
[[nodiscard]]
std::u8string_view compile_error_code_name(Compile_Error_Code code) noexcept;

/// @brief Returns the diagnostic id under which an error with this code is logged,
/// such as `diagnostic::alias_to_alias`.
[[nodiscard]]
std::u8string_view compile_error_diagnostic_id(Compile_Error_Code code) noexcept;

struct Compile_Error {
    Compile_Error_Code code;
    /// @brief The one-based number of the line on which the error was detected.
    std::size_t line;
    /// @brief A human-readable description of the error.
    std::pmr::u8string message;
};

namespace detail {

inline void append_message_parts(std::pmr::u8string&) { }

template <typename... Parts>
void append_message_parts(std::pmr::u8string& out, std::u8string_view first, const Parts&... rest)
{
    out.append(first);
    append_message_parts(out, rest...);
}

} // namespace detail

/// @brief Creates a `Compile_Error` whose message is the concatenation of `parts`.
template <typename... Parts>
[[nodiscard]]
Compile_Error make_compile_error(
    Compile_Error_Code code,
    std::size_t line,
    std::pmr::memory_resource* memory,
    const Parts&... parts
)
{
    Compile_Error result { code, line, std::pmr::u8string { memory } };
    detail::append_message_parts(result.message, std::u8string_view { parts }...);
    return result;
}

} // namespace sigil

#endif
