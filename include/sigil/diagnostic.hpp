#ifndef SIGIL_DIAGNOSTIC_HPP
#define SIGIL_DIAGNOSTIC_HPP

#include <cstddef>
#include <string_view>

#include "sigil/util/severity.hpp"

#include "sigil/fwd.hpp"

namespace sigil {

struct Diagnostic {
    /// @brief The severity of the diagnostic.
    /// `severity_is_emittable(severity)` shall be `true`.
    Severity severity;
    /// @brief The id of the diagnostic,
    /// which is a non-empty string containing a
    /// dot-separated sequence of identifier for this diagnostic.
    std::u8string_view id;
    /// @brief The name of the file that is responsible for this diagnostic.
    std::u8string_view file;
    /// @brief The one-based line number within `file`,
    /// or zero if the diagnostic is not tied to a specific line.
    std::size_t line;
    /// @brief The diagnostic message.
    std::u8string_view message;
};

namespace diagnostic {

// COMPILATION =====================================================================================

/// @brief A corpus has been compiled successfully.
inline constexpr std::u8string_view compile_done = u8"compile.done";

/// @brief A name is not a valid identifier,
/// i.e. not a non-empty sequence of ASCII letters.
inline constexpr std::u8string_view identifier_invalid = u8"identifier.invalid";

/// @brief A backslash in a value is not followed by a known escape sequence.
inline constexpr std::u8string_view escape_invalid = u8"escape.invalid";
/// @brief An escape sequence like `\u{...}` is missing its closing brace.
inline constexpr std::u8string_view escape_unterminated = u8"escape.unterminated";
/// @brief A `\u{...}` escape does not denote a Unicode scalar value.
inline constexpr std::u8string_view escape_codepoint = u8"escape.codepoint";

/// @brief A variant declaration or symbol without variants has no value.
inline constexpr std::u8string_view value_missing = u8"value.missing";

/// @brief A `@deprecated:` annotation has no message.
inline constexpr std::u8string_view deprecation_message_missing = u8"deprecation.message.missing";
/// @brief A `@deprecated:` annotation is not followed by a declaration it could apply to.
inline constexpr std::u8string_view deprecation_dangling = u8"deprecation.dangling";
/// @brief A declaration or variant has been deprecated more than once.
inline constexpr std::u8string_view deprecation_duplicate = u8"deprecation.duplicate";
/// @brief The modifier in `@deprecated(...)` is malformed or does not apply.
inline constexpr std::u8string_view deprecation_modifier = u8"deprecation.modifier";

/// @brief A declaration appears where the grammar does not allow it.
inline constexpr std::u8string_view declaration_unexpected = u8"declaration.unexpected";
/// @brief A name has been defined more than once in the same module.
inline constexpr std::u8string_view definition_duplicate = u8"definition.duplicate";
/// @brief A modifier appears more than once in a variant.
inline constexpr std::u8string_view modifier_duplicate = u8"modifier.duplicate";
/// @brief A module is not closed by the end of the file.
inline constexpr std::u8string_view module_unclosed = u8"module.unclosed";
/// @brief A `}` appears outside of any module.
inline constexpr std::u8string_view module_end_unexpected = u8"module.end.unexpected";

/// @brief The target of an alias is not a symbol in the same module.
inline constexpr std::u8string_view alias_no_symbol = u8"alias.no-symbol";
/// @brief The modifiers of an alias match no variant of its target.
inline constexpr std::u8string_view alias_no_variant = u8"alias.no-variant";
/// @brief The target of an alias is itself an alias.
inline constexpr std::u8string_view alias_to_alias = u8"alias.to-alias";

// QUERIES =========================================================================================

/// @brief A dotted name could not be resolved.
inline constexpr std::u8string_view lookup_unresolved = u8"lookup.unresolved";
/// @brief A deprecated binding or variant was used.
inline constexpr std::u8string_view deprecated = u8"deprecated";

/// @brief A file could not be loaded.
inline constexpr std::u8string_view file_io = u8"file.io";

} // namespace diagnostic

} // namespace sigil

#endif
