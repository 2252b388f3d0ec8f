#ifndef SIGIL_MODIFIER_SET_HPP
#define SIGIL_MODIFIER_SET_HPP

#include <cstddef>
#include <iterator>
#include <memory_resource>
#include <optional>
#include <ranges>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>

#include "sigil/util/assert.hpp"

#include "sigil/fwd.hpp"

namespace sigil {

/// @brief The character which separates modifiers in the dotted form of a modifier set.
inline constexpr char8_t modifier_separator = u8'.';
/// @brief The character which, appended to a modifier, marks it as optional.
inline constexpr char8_t optional_marker = u8'?';

/// @brief A single modifier within a `Modifier_Set`.
struct Modifier {
    /// @brief The bare name of the modifier, without any optional marker.
    std::u8string_view name;
    /// @brief `true` if the modifier is optional, i.e. written as `name?`.
    bool optional = false;

    /// @brief Interprets a single segment of a dotted modifier set,
    /// such as `"double"` or `"double?"`.
    [[nodiscard]]
    static constexpr Modifier from_raw(std::u8string_view raw) noexcept
    {
        if (raw.ends_with(optional_marker)) {
            return { raw.substr(0, raw.length() - 1), true };
        }
        return { raw, false };
    }

    [[nodiscard]]
    friend constexpr bool operator==(const Modifier&, const Modifier&)
        = default;
};

struct Modifier_Iterator_Sentinel { };

/// @brief Iterates over the modifiers of a dotted modifier string.
struct Modifier_Iterator {
    using value_type = Modifier;
    using difference_type = std::ptrdiff_t;

private:
    std::u8string_view m_remainder;

public:
    [[nodiscard]]
    constexpr Modifier_Iterator() noexcept
        = default;

    [[nodiscard]]
    constexpr explicit Modifier_Iterator(std::u8string_view dotted) noexcept
        : m_remainder { dotted }
    {
    }

    [[nodiscard]]
    constexpr Modifier operator*() const noexcept
    {
        SIGIL_DEBUG_ASSERT(!m_remainder.empty());
        return Modifier::from_raw(m_remainder.substr(0, m_remainder.find(modifier_separator)));
    }

    constexpr Modifier_Iterator& operator++() noexcept
    {
        SIGIL_DEBUG_ASSERT(!m_remainder.empty());
        const std::size_t pos = m_remainder.find(modifier_separator);
        m_remainder = pos == std::u8string_view::npos ? std::u8string_view {}
                                                      : m_remainder.substr(pos + 1);
        return *this;
    }

    constexpr Modifier_Iterator operator++(int) noexcept
    {
        Modifier_Iterator copy = *this;
        ++*this;
        return copy;
    }

    [[nodiscard]]
    friend constexpr bool
    operator==(const Modifier_Iterator& i, Modifier_Iterator_Sentinel) noexcept
    {
        return i.m_remainder.empty();
    }
};

static_assert(std::input_iterator<Modifier_Iterator>);
static_assert(std::sentinel_for<Modifier_Iterator_Sentinel, Modifier_Iterator>);

/// @brief Returns `true` if `dotted` is a valid dotted modifier set,
/// i.e. either empty or a `.`-separated sequence of identifiers,
/// each optionally followed by `?`, with no name occurring twice.
[[nodiscard]]
bool is_valid_modifier_set(std::u8string_view dotted) noexcept;

/// @brief A non-owning, order-independent set of modifiers,
/// represented by its dotted form, such as `"r.double?"`.
///
/// The order in which modifiers are iterated over is the order in which they appear in the
/// dotted form, but no operation of the set depends on that order.
struct Modifier_Set_View {
private:
    friend Modifier_Set;

    std::u8string_view m_dotted;

    [[nodiscard]]
    constexpr explicit Modifier_Set_View(std::u8string_view dotted) noexcept
        : m_dotted { dotted }
    {
    }

public:
    [[nodiscard]]
    constexpr Modifier_Set_View() noexcept
        = default;

    /// @brief Creates a view from the dotted form of a modifier set.
    /// `is_valid_modifier_set(dotted)` shall be `true`.
    [[nodiscard]]
    static Modifier_Set_View from_raw_dotted(std::u8string_view dotted) noexcept
    {
        SIGIL_DEBUG_ASSERT(is_valid_modifier_set(dotted));
        return Modifier_Set_View { dotted };
    }

    /// @brief Returns the dotted form, such as `"r.double?"`.
    [[nodiscard]]
    constexpr std::u8string_view as_string() const noexcept
    {
        return m_dotted;
    }

    [[nodiscard]]
    constexpr bool is_empty() const noexcept
    {
        return m_dotted.empty();
    }

    [[nodiscard]]
    constexpr Modifier_Iterator begin() const noexcept
    {
        return Modifier_Iterator { m_dotted };
    }

    [[nodiscard]]
    constexpr Modifier_Iterator_Sentinel end() const noexcept
    {
        return {};
    }

    /// @brief Returns the number of modifiers.
    [[nodiscard]]
    std::size_t size() const noexcept;

    /// @brief Returns `true` if a modifier named `name` is contained in this set,
    /// regardless of whether it is optional.
    [[nodiscard]]
    bool contains(std::u8string_view name) const noexcept;

    /// @brief Returns the modifier named `name`, or `std::nullopt` if there is none.
    [[nodiscard]]
    std::optional<Modifier> find(std::u8string_view name) const noexcept;

    /// @brief Returns `true` if every modifier in this set is contained (by name) in `other`.
    /// Optional markers are ignored on both sides.
    [[nodiscard]]
    bool is_subset(Modifier_Set_View other) const noexcept;

    /// @brief Returns `true` if every modifier in this set which is not optional
    /// is contained (by name) in `other`.
    [[nodiscard]]
    bool required_is_subset(Modifier_Set_View other) const noexcept;

    /// @brief Returns `true` if both sets contain the same modifiers
    /// with the same optionality, regardless of order.
    [[nodiscard]]
    bool same_modifiers(Modifier_Set_View other) const noexcept;

    /// @brief Like `same_modifiers`, but ignores optionality,
    /// so `a.b?` and `a.b` have the same names.
    [[nodiscard]]
    bool same_names(Modifier_Set_View other) const noexcept
    {
        return size() == other.size() && is_subset(other);
    }

    /// @brief Returns `true` if the given candidate set can be selected
    /// when this set is used as a request.
    /// That is the case if every required modifier of the `candidate` is requested,
    /// and every requested modifier is present in the `candidate`.
    [[nodiscard]]
    bool is_matched_by(Modifier_Set_View candidate) const noexcept
    {
        return candidate.required_is_subset(*this) && is_subset(candidate);
    }

    /// @brief Finds the best match for this set, used as a request,
    /// among a sequence of `(set, value)` candidates.
    ///
    /// Only candidates for which `is_matched_by(set)` is `true` are eligible.
    /// Among those, a candidate has precedence if it has more modifiers in common
    /// with this set, and otherwise if it has fewer modifiers in total.
    /// Equally ranked candidates are resolved in favor of the one that appears first.
    /// @param candidates A range of tuple-like objects where the first element
    /// is convertible to `Modifier_Set_View` and the second element is the value.
    /// @return The value of the best candidate, or `std::nullopt` if none is eligible.
    template <std::ranges::input_range R>
    [[nodiscard]]
    auto best_match_in(R&& candidates) const // NOLINT(cppcoreguidelines-missing-std-forward)
        -> std::optional<
            std::remove_cvref_t<std::tuple_element_t<1, std::ranges::range_value_t<R>>>>
    {
        std::optional<std::remove_cvref_t<std::tuple_element_t<1, std::ranges::range_value_t<R>>>>
            best;
        std::size_t best_matching = 0;
        std::size_t best_total = 0;

        for (auto&& candidate : candidates) {
            const auto& [set, value] = candidate;
            const Modifier_Set_View candidate_set = set;
            if (!is_matched_by(candidate_set)) {
                continue;
            }
            std::size_t matching = 0;
            std::size_t total = 0;
            for (const Modifier m : candidate_set) {
                matching += contains(m.name) ? 1 : 0;
                total += 1;
            }
            const bool is_better = !best || matching > best_matching
                || (matching == best_matching && total < best_total);
            if (is_better) {
                best.emplace(value);
                best_matching = matching;
                best_total = total;
            }
        }

        return best;
    }
};

/// @brief An owning, order-independent set of modifiers.
/// @see Modifier_Set_View
struct Modifier_Set {
private:
    std::pmr::u8string m_dotted;

public:
    [[nodiscard]]
    explicit Modifier_Set(std::pmr::memory_resource* memory = std::pmr::get_default_resource())
        : m_dotted { memory }
    {
    }

    [[nodiscard]]
    Modifier_Set(Modifier_Set_View view, std::pmr::memory_resource* memory)
        : m_dotted { view.as_string(), memory }
    {
    }

    /// @brief Creates a set from its dotted form.
    /// `is_valid_modifier_set(dotted)` shall be `true`.
    [[nodiscard]]
    static Modifier_Set from_raw_dotted(
        std::u8string_view dotted,
        std::pmr::memory_resource* memory = std::pmr::get_default_resource()
    )
    {
        return { Modifier_Set_View::from_raw_dotted(dotted), memory };
    }

    /// @brief Adds a modifier, such as `"double"` or `"double?"`, to the set.
    /// The set shall not already contain a modifier with the same name.
    void insert_raw(std::u8string_view raw);

    [[nodiscard]]
    Modifier_Set_View view() const noexcept
    {
        return Modifier_Set_View { m_dotted };
    }

    [[nodiscard]]
    operator Modifier_Set_View() const noexcept
    {
        return view();
    }

    [[nodiscard]]
    std::u8string_view as_string() const noexcept
    {
        return m_dotted;
    }

    [[nodiscard]]
    bool is_empty() const noexcept
    {
        return m_dotted.empty();
    }

    [[nodiscard]]
    Modifier_Iterator begin() const noexcept
    {
        return Modifier_Iterator { m_dotted };
    }

    [[nodiscard]]
    Modifier_Iterator_Sentinel end() const noexcept
    {
        return {};
    }

    [[nodiscard]]
    std::size_t size() const noexcept
    {
        return view().size();
    }

    [[nodiscard]]
    bool contains(std::u8string_view name) const noexcept
    {
        return view().contains(name);
    }

    [[nodiscard]]
    bool is_subset(Modifier_Set_View other) const noexcept
    {
        return view().is_subset(other);
    }

    [[nodiscard]]
    bool required_is_subset(Modifier_Set_View other) const noexcept
    {
        return view().required_is_subset(other);
    }

    [[nodiscard]]
    bool same_modifiers(Modifier_Set_View other) const noexcept
    {
        return view().same_modifiers(other);
    }

    template <std::ranges::input_range R>
    [[nodiscard]]
    auto best_match_in(R&& candidates) const
    {
        return view().best_match_in(std::forward<R>(candidates));
    }
};

} // namespace sigil

#endif
