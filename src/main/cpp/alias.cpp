#include <algorithm>
#include <cstddef>
#include <memory_resource>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "sigil/util/result.hpp"
#include "sigil/util/strings.hpp"

#include "sigil/alias.hpp"
#include "sigil/compile_error.hpp"
#include "sigil/modifier_set.hpp"
#include "sigil/module.hpp"

namespace sigil {
namespace {

[[nodiscard]]
std::optional<std::pmr::u8string>
copy_optional(const std::optional<std::pmr::u8string>& str, std::pmr::memory_resource* memory)
{
    if (!str) {
        return {};
    }
    return std::pmr::u8string { *str, memory };
}

[[nodiscard]]
std::optional<std::pmr::u8string>
copy_optional(std::optional<std::u8string_view> str, std::pmr::memory_resource* memory)
{
    if (!str) {
        return {};
    }
    return std::pmr::u8string { *str, memory };
}

[[nodiscard]]
const Module_Entry* find_entry(std::span<const Module_Entry> entries, std::u8string_view name)
{
    const auto it = std::ranges::find(entries, name, &Module_Entry::name);
    return it == entries.end() ? nullptr : &*it;
}

} // namespace

std::optional<std::pmr::u8string> alias_remainder(
    Modifier_Set_View variant,
    std::u8string_view alias_modifiers,
    std::pmr::memory_resource* memory
)
{
    const std::u8string_view dotted = variant.as_string();
    if (alias_modifiers.empty()) {
        return std::pmr::u8string { dotted, memory };
    }
    if (dotted == alias_modifiers) {
        return std::pmr::u8string { memory };
    }
    if (dotted.starts_with(alias_modifiers)
        && dotted[alias_modifiers.length()] == modifier_separator) {
        return std::pmr::u8string { dotted.substr(alias_modifiers.length() + 1), memory };
    }

    // The variant may declare the alias modifiers in a different order,
    // or interleaved with other modifiers.
    std::pmr::vector<std::u8string_view> pending { memory };
    for_each_part(alias_modifiers, modifier_separator, [&](std::u8string_view part) {
        pending.push_back(part);
    });

    Modifier_Set leftover { memory };
    for (const Modifier m : variant) {
        const auto match = std::ranges::find(pending, m.name);
        if (match != pending.end()) {
            pending.erase(match);
        }
        else {
            leftover.insert_raw(m.optional ? std::pmr::u8string { m.name, memory } + u8'?'
                                           : std::pmr::u8string { m.name, memory });
        }
    }
    if (!pending.empty()) {
        return {};
    }
    return std::pmr::u8string { leftover.as_string(), memory };
}

Result<Binding, Compile_Error> resolve_alias(
    const Symbol& target,
    const Alias_Declaration& alias,
    std::pmr::memory_resource* memory
)
{
    const auto no_variant_error = [&] {
        return make_compile_error(
            Compile_Error_Code::alias_to_nonexistent_variant, alias.line, memory,
            u8"alias \"", alias.name, u8"\" refers to nonexistent variant \"", alias.target,
            u8".", alias.modifiers, u8"\""
        );
    };

    if (target.is_single()) {
        if (!alias.modifiers.empty()) {
            return no_variant_error();
        }
        return Binding {
            .def = Symbol::single(std::pmr::u8string { target.default_value(), memory }),
            .deprecation = copy_optional(alias.deprecation, memory),
        };
    }

    std::pmr::vector<Variant> variants { memory };
    for (const Variant& variant : target.variants()) {
        std::optional<std::pmr::u8string> remainder
            = alias_remainder(variant.modifiers, alias.modifiers, memory);
        if (!remainder || (!remainder->empty() && !alias.deep)) {
            continue;
        }
        variants.push_back(Variant {
            .modifiers = Modifier_Set::from_raw_dotted(*remainder, memory),
            .value = std::pmr::u8string { variant.value, memory },
            .deprecation = copy_optional(variant.deprecation, memory),
        });
    }

    if (variants.empty()) {
        return no_variant_error();
    }
    if (variants.size() == 1 && variants.front().modifiers.is_empty()) {
        Variant& only = variants.front();
        return Binding {
            .def = Symbol::single(std::move(only.value)),
            .deprecation = alias.deprecation ? copy_optional(alias.deprecation, memory)
                                             : std::move(only.deprecation),
        };
    }
    return Binding {
        .def = Symbol::multi(std::move(variants)),
        .deprecation = copy_optional(alias.deprecation, memory),
    };
}

Result<std::pmr::vector<Module_Entry>, Compile_Error> resolve_aliases(
    std::span<const Module_Entry> direct,
    std::span<const Alias_Declaration> aliases,
    std::pmr::memory_resource* memory
)
{
    std::pmr::vector<Module_Entry> result { memory };
    result.reserve(aliases.size());

    for (const Alias_Declaration& alias : aliases) {
        const Module_Entry* const entry = find_entry(direct, alias.target);
        const Symbol* const target = entry ? entry->binding.as_symbol() : nullptr;
        if (!target) {
            const bool targets_alias = !entry
                && std::ranges::find(aliases, alias.target, &Alias_Declaration::name)
                    != aliases.end();
            if (targets_alias) {
                return make_compile_error(
                    Compile_Error_Code::alias_to_alias, alias.line, memory, u8"alias \"",
                    alias.name, u8"\" refers to another alias \"", alias.target, u8"\""
                );
            }
            return make_compile_error(
                Compile_Error_Code::alias_to_nonexistent_symbol, alias.line, memory, u8"alias \"",
                alias.name, u8"\" refers to nonexistent symbol \"", alias.target, u8"\""
            );
        }

        Result<Binding, Compile_Error> binding = resolve_alias(*target, alias, memory);
        if (!binding) {
            return std::move(binding).error();
        }
        result.push_back(Module_Entry {
            .name = std::pmr::u8string { alias.name, memory },
            .binding = std::move(*binding),
        });
    }

    return result;
}

} // namespace sigil
