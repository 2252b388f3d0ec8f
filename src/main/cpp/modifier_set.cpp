#include <cstddef>
#include <optional>
#include <string_view>

#include "sigil/util/assert.hpp"
#include "sigil/util/strings.hpp"

#include "sigil/modifier_set.hpp"

namespace sigil {

bool is_valid_modifier_set(std::u8string_view dotted) noexcept
{
    if (dotted.empty()) {
        return true;
    }
    bool valid = true;
    std::size_t seen_length = 0;
    for_each_part(dotted, modifier_separator, [&](std::u8string_view part) {
        const Modifier modifier = Modifier::from_raw(part);
        if (!valid || !is_identifier(modifier.name)) {
            valid = false;
            return;
        }
        // All parts in the first seen_length code units precede this one.
        for (Modifier_Iterator it { dotted.substr(0, seen_length) };
             it != Modifier_Iterator_Sentinel {}; ++it) {
            if ((*it).name == modifier.name) {
                valid = false;
                return;
            }
        }
        seen_length = std::size_t(part.data() - dotted.data()) + part.length();
    });
    return valid;
}

std::size_t Modifier_Set_View::size() const noexcept
{
    std::size_t result = 0;
    for ([[maybe_unused]] const Modifier _ : *this) {
        ++result;
    }
    return result;
}

bool Modifier_Set_View::contains(std::u8string_view name) const noexcept
{
    return find(name).has_value();
}

std::optional<Modifier> Modifier_Set_View::find(std::u8string_view name) const noexcept
{
    for (const Modifier m : *this) {
        if (m.name == name) {
            return m;
        }
    }
    return {};
}

bool Modifier_Set_View::is_subset(Modifier_Set_View other) const noexcept
{
    for (const Modifier m : *this) {
        if (!other.contains(m.name)) {
            return false;
        }
    }
    return true;
}

bool Modifier_Set_View::required_is_subset(Modifier_Set_View other) const noexcept
{
    for (const Modifier m : *this) {
        if (!m.optional && !other.contains(m.name)) {
            return false;
        }
    }
    return true;
}

bool Modifier_Set_View::same_modifiers(Modifier_Set_View other) const noexcept
{
    if (size() != other.size()) {
        return false;
    }
    for (const Modifier m : *this) {
        if (other.find(m.name) != m) {
            return false;
        }
    }
    return true;
}

void Modifier_Set::insert_raw(std::u8string_view raw)
{
    SIGIL_DEBUG_ASSERT(is_identifier(Modifier::from_raw(raw).name));
    SIGIL_DEBUG_ASSERT(!contains(Modifier::from_raw(raw).name));
    if (!m_dotted.empty()) {
        m_dotted.push_back(modifier_separator);
    }
    m_dotted.append(raw);
}

} // namespace sigil
