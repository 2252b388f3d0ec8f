#ifndef SIGIL_PARSE_HPP
#define SIGIL_PARSE_HPP

#include <cstddef>
#include <memory_resource>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "sigil/util/result.hpp"

#include "sigil/compile_error.hpp"
#include "sigil/fwd.hpp"
#include "sigil/module.hpp"

namespace sigil {

/// @brief A `@deprecated` annotation which has been attached to the following declaration.
struct Deprecation_Annotation {
    /// @brief The modifiers within `@deprecated(...)`, only meaningful if `has_modifiers`.
    std::u8string_view modifiers;
    std::u8string_view message;
    bool has_modifiers = false;
    std::size_t line = 0;
};

enum struct Declaration_Kind : Default_Underlying {
    module_start,
    module_end,
    symbol,
    variant,
    alias,
};

[[nodiscard]]
std::u8string_view declaration_kind_name(Declaration_Kind kind) noexcept;

/// @brief A non-blank line of source code,
/// with the deprecation annotations preceding it folded into it.
struct Declaration {
    Declaration_Kind kind;
    std::size_t line;
    std::u8string_view name;
    std::u8string_view modifiers;
    std::u8string_view target;
    std::optional<std::pmr::u8string> value;
    bool deep = false;
    std::pmr::vector<Deprecation_Annotation> deprecations;
};

/// @brief Lexes every line in `source` and folds the result into a sequence of declarations.
/// Lines may be terminated by `\n` or `\r\n`.
/// All views in the result refer to `source`.
[[nodiscard]]
Result<std::pmr::vector<Declaration>, Compile_Error>
lex_declarations(std::u8string_view source, std::pmr::memory_resource* memory);

/// @brief Builds the top-level module from a sequence of declarations.
/// Nested modules are built recursively,
/// and aliases are resolved once all other bindings of their scope are known.
[[nodiscard]]
Result<Module, Compile_Error>
build_module(std::span<const Declaration> declarations, std::pmr::memory_resource* memory);

} // namespace sigil

#endif
