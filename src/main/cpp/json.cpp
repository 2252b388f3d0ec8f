#include <memory_resource>
#include <optional>
#include <string>
#include <string_view>

#include "sigil/util/assert.hpp"

#include "sigil/json.hpp"
#include "sigil/module.hpp"

namespace sigil {
namespace {

[[nodiscard]]
char8_t hex_digit(unsigned x)
{
    SIGIL_DEBUG_ASSERT(x < 16);
    return char8_t(x < 10 ? u8'0' + x : u8'a' + (x - 10));
}

[[nodiscard]]
std::optional<std::u8string_view> as_optional_view(const std::optional<std::pmr::u8string>& str)
{
    if (!str) {
        return {};
    }
    return *str;
}

void write_module(JSON_Writer& writer, const Module& module);

void write_binding(JSON_Writer& writer, const Binding& binding)
{
    writer.open_object();
    writer.write_key(u8"deprecation").write_string_or_null(as_optional_view(binding.deprecation));

    if (const Module* const module = binding.as_module()) {
        writer.write_key(u8"module");
        write_module(writer, *module);
        writer.close_object();
        return;
    }

    const Symbol* const symbol = binding.as_symbol();
    SIGIL_ASSERT(symbol);
    if (symbol->is_single()) {
        writer.write_key(u8"symbol").write_string(symbol->default_value());
        writer.close_object();
        return;
    }

    writer.write_key(u8"variants").open_array();
    for (const Variant& variant : symbol->variants()) {
        writer.open_array()
            .write_string(variant.modifiers.as_string())
            .write_string(variant.value)
            .write_string_or_null(as_optional_view(variant.deprecation))
            .close_array();
    }
    writer.close_array();
    writer.close_object();
}

void write_module(JSON_Writer& writer, const Module& module)
{
    writer.open_object();
    for (const Module_Entry& entry : module) {
        writer.write_key(entry.name);
        write_binding(writer, entry.binding);
    }
    writer.close_object();
}

} // namespace

void append_json_quoted(std::pmr::u8string& out, std::u8string_view str)
{
    out.push_back(u8'"');
    for (const char8_t c : str) {
        switch (c) {
        case u8'"': out += u8"\\\""; break;
        case u8'\\': out += u8"\\\\"; break;
        case u8'\b': out += u8"\\b"; break;
        case u8'\f': out += u8"\\f"; break;
        case u8'\n': out += u8"\\n"; break;
        case u8'\r': out += u8"\\r"; break;
        case u8'\t': out += u8"\\t"; break;
        default: {
            if (c < 0x20) {
                out += u8"\\u00";
                out.push_back(hex_digit(unsigned(c) >> 4));
                out.push_back(hex_digit(unsigned(c) & 0xf));
            }
            else {
                out.push_back(c);
            }
            break;
        }
        }
    }
    out.push_back(u8'"');
}

void JSON_Writer::begin_value()
{
    if (m_needs_comma) {
        m_out.push_back(u8',');
    }
    m_needs_comma = true;
}

auto JSON_Writer::open_object() -> Self&
{
    begin_value();
    m_out.push_back(u8'{');
    m_needs_comma = false;
    ++m_depth;
    return *this;
}

auto JSON_Writer::close_object() -> Self&
{
    SIGIL_ASSERT(m_depth != 0);
    m_out.push_back(u8'}');
    m_needs_comma = true;
    --m_depth;
    return *this;
}

auto JSON_Writer::open_array() -> Self&
{
    begin_value();
    m_out.push_back(u8'[');
    m_needs_comma = false;
    ++m_depth;
    return *this;
}

auto JSON_Writer::close_array() -> Self&
{
    SIGIL_ASSERT(m_depth != 0);
    m_out.push_back(u8']');
    m_needs_comma = true;
    --m_depth;
    return *this;
}

auto JSON_Writer::write_key(std::u8string_view key) -> Self&
{
    SIGIL_ASSERT(m_depth != 0);
    begin_value();
    append_json_quoted(m_out, key);
    m_out.push_back(u8':');
    m_needs_comma = false;
    return *this;
}

auto JSON_Writer::write_string(std::u8string_view str) -> Self&
{
    begin_value();
    append_json_quoted(m_out, str);
    return *this;
}

auto JSON_Writer::write_null() -> Self&
{
    begin_value();
    m_out += u8"null";
    return *this;
}

auto JSON_Writer::write_string_or_null(std::optional<std::u8string_view> str) -> Self&
{
    return str ? write_string(*str) : write_null();
}

void encode_json(std::pmr::u8string& out, const Module& module)
{
    JSON_Writer writer { out };
    write_module(writer, module);
    SIGIL_DEBUG_ASSERT(writer.is_done());
}

} // namespace sigil
