#ifndef SIGIL_MODULE_HPP
#define SIGIL_MODULE_HPP

#include <cstddef>
#include <memory_resource>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "sigil/fwd.hpp"
#include "sigil/modifier_set.hpp"

namespace sigil {

/// @brief One value of a symbol, selected by a set of modifiers.
struct Variant {
    Modifier_Set modifiers;
    std::pmr::u8string value;
    std::optional<std::pmr::u8string> deprecation;
};

/// @brief The result of resolving a symbol for a set of requested modifiers.
struct Symbol_Match {
    std::u8string_view value;
    /// @brief The deprecation message of the matched variant, if any.
    std::optional<std::u8string_view> deprecation;

    [[nodiscard]]
    friend bool operator==(const Symbol_Match&, const Symbol_Match&)
        = default;
};

/// @brief A symbol, which is either a single value,
/// or a sequence of variants distinguished by their modifiers.
struct Symbol {
private:
    struct Single {
        Variant variant;
    };
    struct Multi {
        std::pmr::vector<Variant> variants;
    };

    std::variant<Single, Multi> m_data;

    [[nodiscard]]
    explicit Symbol(Single&& single)
        : m_data { std::move(single) }
    {
    }

    [[nodiscard]]
    explicit Symbol(Multi&& multi)
        : m_data { std::move(multi) }
    {
    }

public:
    /// @brief Creates a symbol with a single value, which has no modifiers.
    [[nodiscard]]
    static Symbol single(std::pmr::u8string&& value);

    /// @brief Creates a symbol with multiple variants.
    /// `variants` shall not be empty.
    [[nodiscard]]
    static Symbol multi(std::pmr::vector<Variant>&& variants);

    [[nodiscard]]
    bool is_single() const noexcept
    {
        return std::holds_alternative<Single>(m_data);
    }

    [[nodiscard]]
    bool is_multi() const noexcept
    {
        return std::holds_alternative<Multi>(m_data);
    }

    /// @brief Returns all variants of the symbol.
    /// A single-valued symbol has exactly one variant with no modifiers.
    [[nodiscard]]
    std::span<const Variant> variants() const noexcept;

    /// @brief Returns the value of a single-valued symbol,
    /// or the value of the first variant otherwise.
    [[nodiscard]]
    std::u8string_view default_value() const noexcept
    {
        return variants().front().value;
    }

    /// @brief Resolves the value for the given requested modifiers.
    /// @see Modifier_Set_View::best_match_in
    [[nodiscard]]
    std::optional<Symbol_Match> get(Modifier_Set_View request) const;
};

struct Module_Entry;
struct Binding;

/// @brief The result of resolving a dotted path like `arrow.r.double` within a module.
struct Path_Match {
    std::u8string_view value;
    /// @brief The first deprecation message encountered along the path,
    /// which may stem from a module, the symbol, or the matched variant.
    std::optional<std::u8string_view> deprecation;

    [[nodiscard]]
    friend bool operator==(const Path_Match&, const Path_Match&)
        = default;
};

/// @brief A namespace of bindings, sorted by name.
struct Module {
private:
    std::pmr::vector<Module_Entry> m_entries;

public:
    [[nodiscard]]
    explicit Module(std::pmr::memory_resource* memory = std::pmr::get_default_resource());

    /// @brief Creates a module from the given entries, which are sorted by name.
    /// The names of the `entries` shall be unique.
    [[nodiscard]]
    explicit Module(std::pmr::vector<Module_Entry>&& entries);

    /// @brief Returns the binding with the given `name`, or `nullptr` if there is none.
    /// This takes logarithmic time.
    [[nodiscard]]
    const Binding* get(std::u8string_view name) const;

    /// @brief Resolves a dotted path.
    /// Leading parts of the path name nested modules;
    /// the first part naming a symbol ends the walk,
    /// and the remaining parts are the requested modifiers of that symbol.
    /// @return The match, or `std::nullopt` if the path does not resolve to a value.
    [[nodiscard]]
    std::optional<Path_Match> get_path(std::u8string_view dotted) const;

    /// @brief Returns the entries of this module in ascending order of their names.
    [[nodiscard]]
    std::span<const Module_Entry> entries() const noexcept;

    [[nodiscard]]
    const Module_Entry* begin() const noexcept;
    [[nodiscard]]
    const Module_Entry* end() const noexcept;

    [[nodiscard]]
    std::size_t size() const noexcept;
    [[nodiscard]]
    bool empty() const noexcept;

    /// @brief Returns `true` if the names of this module and all nested modules
    /// are in strictly ascending order.
    [[nodiscard]]
    bool all_sorted() const;
};

using Def = std::variant<Symbol, Module>;

/// @brief A definition bound to a name in a module, plus metadata.
struct Binding {
    Def def;
    std::optional<std::pmr::u8string> deprecation;

    [[nodiscard]]
    const Symbol* as_symbol() const noexcept
    {
        return std::get_if<Symbol>(&def);
    }

    [[nodiscard]]
    const Module* as_module() const noexcept
    {
        return std::get_if<Module>(&def);
    }
};

struct Module_Entry {
    std::pmr::u8string name;
    Binding binding;
};

} // namespace sigil

#endif
