#ifndef SIGIL_JSON_HPP
#define SIGIL_JSON_HPP

#include <cstddef>
#include <memory_resource>
#include <optional>
#include <string>
#include <string_view>

#include "sigil/fwd.hpp"

namespace sigil {

/// @brief Appends `str` to `out` as a quoted JSON string,
/// escaping quotes, backslashes, and control characters as per RFC 8259.
void append_json_quoted(std::pmr::u8string& out, std::u8string_view str);

/// @brief Writes compact JSON, such as `{"a":[null,"b"]}`, to a string.
/// Commas between members and elements are inserted automatically.
///
/// To correctly use this class, every `open_object()` and `open_array()` must be matched by
/// a `close_object()` or `close_array()` respectively,
/// and every member value within an object must be preceded by `write_key(key)`.
struct JSON_Writer {
    using Self = JSON_Writer;

private:
    std::pmr::u8string& m_out;
    std::size_t m_depth = 0;
    bool m_needs_comma = false;

public:
    /// @brief Constructor.
    /// Writes nothing to `out`.
    [[nodiscard]]
    explicit JSON_Writer(std::pmr::u8string& out)
        : m_out { out }
    {
    }

    JSON_Writer(const JSON_Writer&) = delete;
    JSON_Writer& operator=(const JSON_Writer&) = delete;

    /// @brief Returns `true` if every opened object or array has been closed.
    [[nodiscard]]
    bool is_done() const
    {
        return m_depth == 0;
    }

    Self& open_object();
    Self& close_object();

    Self& open_array();
    Self& close_array();

    /// @brief Writes the key of an object member, like `"key":`.
    /// The next value that is written is the value of that member.
    Self& write_key(std::u8string_view key);

    Self& write_string(std::u8string_view str);

    Self& write_null();

    /// @brief Writes `str` if it has a value, or `null` otherwise.
    Self& write_string_or_null(std::optional<std::u8string_view> str);

private:
    void begin_value();
};

/// @brief Appends the JSON representation of `module` to `out`.
/// Every entry of the module becomes a member whose key is the entry name,
/// and whose value is an object with a `"deprecation"` member (a string or `null`),
/// and one of:
/// - `"module"`: the nested module, converted recursively
/// - `"symbol"`: the value of a single-valued symbol
/// - `"variants"`: an array of `[modifiers, value, deprecation]` arrays
void encode_json(std::pmr::u8string& out, const Module& module);

} // namespace sigil

#endif
