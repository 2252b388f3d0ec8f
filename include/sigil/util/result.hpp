#ifndef SIGIL_RESULT_HPP
#define SIGIL_RESULT_HPP

#include <expected>
#include <type_traits>
#include <utility>

#include "sigil/util/assert.hpp"

namespace sigil {

/// @brief Holds either a value of type `T` (success) or an error of type `E` (failure).
/// Both alternatives are implicitly convertible into a `Result`,
/// so a function returning `Result<T, E>` can simply `return value;` or `return error;`.
/// `T` and `E` shall not be the same type.
template <typename T, typename E>
struct [[nodiscard]] Result {
    static_assert(!std::is_same_v<T, E>);

    using value_type = T;
    using error_type = E;

private:
    std::expected<T, E> m_data;

public:
    [[nodiscard]]
    constexpr Result(const T& value)
        : m_data { value }
    {
    }

    [[nodiscard]]
    constexpr Result(T&& value)
        : m_data { std::move(value) }
    {
    }

    [[nodiscard]]
    constexpr Result(const E& error)
        : m_data { std::unexpect, error }
    {
    }

    [[nodiscard]]
    constexpr Result(E&& error)
        : m_data { std::unexpect, std::move(error) }
    {
    }

    [[nodiscard]]
    constexpr bool has_value() const noexcept
    {
        return m_data.has_value();
    }

    [[nodiscard]]
    constexpr explicit operator bool() const noexcept
    {
        return m_data.has_value();
    }

    [[nodiscard]]
    constexpr T& operator*() & noexcept
    {
        SIGIL_DEBUG_ASSERT(has_value());
        return *m_data;
    }

    [[nodiscard]]
    constexpr const T& operator*() const& noexcept
    {
        SIGIL_DEBUG_ASSERT(has_value());
        return *m_data;
    }

    [[nodiscard]]
    constexpr T&& operator*() && noexcept
    {
        SIGIL_DEBUG_ASSERT(has_value());
        return std::move(*m_data);
    }

    [[nodiscard]]
    constexpr T* operator->() noexcept
    {
        SIGIL_DEBUG_ASSERT(has_value());
        return &*m_data;
    }

    [[nodiscard]]
    constexpr const T* operator->() const noexcept
    {
        SIGIL_DEBUG_ASSERT(has_value());
        return &*m_data;
    }

    [[nodiscard]]
    constexpr E& error() & noexcept
    {
        SIGIL_DEBUG_ASSERT(!has_value());
        return m_data.error();
    }

    [[nodiscard]]
    constexpr const E& error() const& noexcept
    {
        SIGIL_DEBUG_ASSERT(!has_value());
        return m_data.error();
    }

    [[nodiscard]]
    constexpr E&& error() && noexcept
    {
        SIGIL_DEBUG_ASSERT(!has_value());
        return std::move(m_data.error());
    }
};

template <typename E>
struct [[nodiscard]] Result<void, E> {
    using value_type = void;
    using error_type = E;

private:
    std::expected<void, E> m_data;

public:
    [[nodiscard]]
    constexpr Result() noexcept
        = default;

    [[nodiscard]]
    constexpr Result(const E& error)
        : m_data { std::unexpect, error }
    {
    }

    [[nodiscard]]
    constexpr Result(E&& error)
        : m_data { std::unexpect, std::move(error) }
    {
    }

    [[nodiscard]]
    constexpr bool has_value() const noexcept
    {
        return m_data.has_value();
    }

    [[nodiscard]]
    constexpr explicit operator bool() const noexcept
    {
        return m_data.has_value();
    }

    [[nodiscard]]
    constexpr E& error() & noexcept
    {
        SIGIL_DEBUG_ASSERT(!has_value());
        return m_data.error();
    }

    [[nodiscard]]
    constexpr const E& error() const& noexcept
    {
        SIGIL_DEBUG_ASSERT(!has_value());
        return m_data.error();
    }

    [[nodiscard]]
    constexpr E&& error() && noexcept
    {
        SIGIL_DEBUG_ASSERT(!has_value());
        return std::move(m_data.error());
    }
};

} // namespace sigil

#endif
