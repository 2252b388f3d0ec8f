#include <algorithm>
#include <cstddef>
#include <memory_resource>
#include <optional>
#include <ranges>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "sigil/util/assert.hpp"

#include "sigil/modifier_set.hpp"
#include "sigil/module.hpp"

namespace sigil {

Symbol Symbol::single(std::pmr::u8string&& value)
{
    std::pmr::memory_resource* const memory = value.get_allocator().resource();
    return Symbol { Single { Variant { Modifier_Set { memory }, std::move(value), {} } } };
}

Symbol Symbol::multi(std::pmr::vector<Variant>&& variants)
{
    SIGIL_ASSERT(!variants.empty());
    return Symbol { Multi { std::move(variants) } };
}

std::span<const Variant> Symbol::variants() const noexcept
{
    if (const auto* const single = std::get_if<Single>(&m_data)) {
        return { &single->variant, 1 };
    }
    return std::get<Multi>(m_data).variants;
}

std::optional<Symbol_Match> Symbol::get(Modifier_Set_View request) const
{
    const auto candidates
        = variants() | std::views::transform([](const Variant& v) {
              return std::pair<Modifier_Set_View, const Variant*> { v.modifiers, &v };
          });
    const std::optional<const Variant*> best = request.best_match_in(candidates);
    if (!best) {
        return {};
    }
    const Variant& variant = **best;
    Symbol_Match result { variant.value, {} };
    if (variant.deprecation) {
        result.deprecation = *variant.deprecation;
    }
    return result;
}

Module::Module(std::pmr::memory_resource* memory)
    : m_entries { memory }
{
}

Module::Module(std::pmr::vector<Module_Entry>&& entries)
    : m_entries { std::move(entries) }
{
    std::ranges::stable_sort(m_entries, {}, &Module_Entry::name);
    SIGIL_DEBUG_ASSERT(
        std::ranges::adjacent_find(m_entries, {}, &Module_Entry::name) == m_entries.end()
    );
}

const Binding* Module::get(std::u8string_view name) const
{
    const auto it = std::ranges::lower_bound(m_entries, name, {}, &Module_Entry::name);
    if (it == m_entries.end() || it->name != name) {
        return nullptr;
    }
    return &it->binding;
}

std::optional<Path_Match> Module::get_path(std::u8string_view dotted) const
{
    std::optional<std::u8string_view> deprecation;
    const auto note_deprecation = [&](const std::optional<std::pmr::u8string>& message) {
        if (!deprecation && message) {
            deprecation = *message;
        }
    };

    const Module* module = this;
    while (true) {
        const std::size_t separator = dotted.find(modifier_separator);
        const std::u8string_view name = dotted.substr(0, separator);
        const std::u8string_view rest
            = separator == std::u8string_view::npos ? u8"" : dotted.substr(separator + 1);

        const Binding* const binding = module->get(name);
        if (!binding) {
            return {};
        }
        note_deprecation(binding->deprecation);

        if (const Module* const nested = binding->as_module()) {
            if (separator == std::u8string_view::npos) {
                return {};
            }
            module = nested;
            dotted = rest;
            continue;
        }

        const Symbol& symbol = *binding->as_symbol();
        const bool has_modifiers = separator != std::u8string_view::npos;
        if (has_modifiers && (rest.empty() || !is_valid_modifier_set(rest))) {
            return {};
        }
        const std::optional<Symbol_Match> match
            = symbol.get(Modifier_Set_View::from_raw_dotted(rest));
        if (!match) {
            return {};
        }
        if (!deprecation) {
            deprecation = match->deprecation;
        }
        return Path_Match { match->value, deprecation };
    }
}

std::span<const Module_Entry> Module::entries() const noexcept
{
    return m_entries;
}

const Module_Entry* Module::begin() const noexcept
{
    return m_entries.data();
}

const Module_Entry* Module::end() const noexcept
{
    return m_entries.data() + m_entries.size();
}

std::size_t Module::size() const noexcept
{
    return m_entries.size();
}

bool Module::empty() const noexcept
{
    return m_entries.empty();
}

bool Module::all_sorted() const
{
    for (std::size_t i = 1; i < m_entries.size(); ++i) {
        if (!(m_entries[i - 1].name < m_entries[i].name)) {
            return false;
        }
    }
    return std::ranges::all_of(m_entries, [](const Module_Entry& entry) {
        const Module* const nested = entry.binding.as_module();
        return !nested || nested->all_sorted();
    });
}

} // namespace sigil
