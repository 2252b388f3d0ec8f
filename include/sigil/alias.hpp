#ifndef SIGIL_ALIAS_HPP
#define SIGIL_ALIAS_HPP

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

/// @brief A pending `name @= target.modifiers` declaration.
/// Aliases only exist during compilation;
/// they are replaced with ordinary symbols before a module is frozen.
struct Alias_Declaration {
    std::u8string_view name;
    std::u8string_view target;
    /// @brief The dotted modifiers following the target name, possibly empty.
    std::u8string_view modifiers;
    /// @brief If `true`, variants with modifiers beyond `modifiers` are included too.
    bool deep = false;
    std::optional<std::u8string_view> deprecation;
    std::size_t line = 0;
};

/// @brief Matches the modifiers of a target variant against the modifiers of an alias.
/// If the alias modifiers are a prefix of the variant modifiers,
/// the rest of the variant modifiers is returned.
/// Otherwise, if every alias modifier is contained in the variant,
/// the variant modifiers which are not alias modifiers are returned,
/// in the order in which they appear in the variant.
/// @return The remaining variant modifiers in dotted form,
/// or `std::nullopt` if the variant does not contain every alias modifier.
[[nodiscard]]
std::optional<std::pmr::u8string> alias_remainder(
    Modifier_Set_View variant,
    std::u8string_view alias_modifiers,
    std::pmr::memory_resource* memory
);

/// @brief Derives the binding of an alias from the symbol it targets.
[[nodiscard]]
Result<Binding, Compile_Error> resolve_alias(
    const Symbol& target,
    const Alias_Declaration& alias,
    std::pmr::memory_resource* memory
);

/// @brief Resolves all aliases within one module scope.
/// Aliases may only target symbols in `direct`, which are the other bindings in the same scope,
/// and may not target other aliases.
/// @return The resolved aliases, in the order of `aliases`.
[[nodiscard]]
Result<std::pmr::vector<Module_Entry>, Compile_Error> resolve_aliases(
    std::span<const Module_Entry> direct,
    std::span<const Alias_Declaration> aliases,
    std::pmr::memory_resource* memory
);

} // namespace sigil

#endif
