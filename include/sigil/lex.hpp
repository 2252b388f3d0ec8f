#ifndef SIGIL_LEX_HPP
#define SIGIL_LEX_HPP

#include <cstddef>
#include <memory_resource>
#include <optional>
#include <string>
#include <string_view>

#include "sigil/util/result.hpp"

#include "sigil/compile_error.hpp"
#include "sigil/fwd.hpp"

namespace sigil {

/// @brief The marker which introduces deprecation annotations.
inline constexpr std::u8string_view deprecation_marker = u8"@deprecated";
/// @brief The marker which separates the name of an alias from its target.
inline constexpr std::u8string_view alias_marker = u8"@=";
/// @brief The suffix of an alias target which makes the alias deep.
inline constexpr std::u8string_view deep_alias_suffix = u8".*";

enum struct Line_Kind : Default_Underlying {
    /// @brief A line containing nothing but whitespace and comments.
    blank,
    /// @brief `@deprecated: message` or `@deprecated(modifiers): message`.
    deprecated,
    /// @brief `name {`
    module_start,
    /// @brief `}`
    module_end,
    /// @brief `name` or `name value`
    symbol,
    /// @brief `.modifiers value`
    variant,
    /// @brief `name @= target.modifiers` or `name @= target.modifiers.*`
    alias,
};

[[nodiscard]]
std::u8string_view line_kind_name(Line_Kind kind) noexcept;

/// @brief A single classified line of source code.
/// All views refer to the source text that was lexed.
struct Line {
    Line_Kind kind;
    /// @brief The name of a module, symbol, or alias.
    std::u8string_view name;
    /// @brief The dotted modifiers of a variant, the modifiers within `@deprecated(...)`,
    /// or the modifiers of an alias target.
    std::u8string_view modifiers;
    /// @brief The symbol name targeted by an alias.
    std::u8string_view target;
    /// @brief The deprecation message of a `deprecated` line.
    std::u8string_view message;
    /// @brief The decoded value of a variant, or the default value of a symbol.
    std::optional<std::pmr::u8string> value;
    /// @brief For `deprecated` lines, `true` if the annotation has a `(modifiers)` part.
    bool has_modifiers = false;
    /// @brief For `alias` lines, `true` if the target ends in `.*`.
    bool deep = false;
};

/// @brief Returns `line` with any `//` comment and surrounding blanks removed.
[[nodiscard]]
std::u8string_view strip_line(std::u8string_view line) noexcept;

/// @brief Classifies a single line of source code.
/// @param line The line, without its line terminator.
/// @param line_number The one-based line number, used for errors.
/// @param memory Memory for decoded values and error messages.
[[nodiscard]]
Result<Line, Compile_Error>
lex_line(std::u8string_view line, std::size_t line_number, std::pmr::memory_resource* memory);

} // namespace sigil

#endif
