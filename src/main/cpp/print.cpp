#include <cstddef>
#include <iostream>
#include <string>
#include <string_view>

#include "sigil/util/ansi.hpp"
#include "sigil/util/io.hpp"
#include "sigil/util/severity.hpp"
#include "sigil/util/strings.hpp"
#include "sigil/util/to_chars.hpp"

#include "sigil/diagnostic.hpp"
#include "sigil/print.hpp"

namespace sigil {
namespace {

void append_highlighted(
    std::pmr::u8string& out,
    std::u8string_view text,
    std::u8string_view highlight,
    bool colors
)
{
    if (colors) {
        out += highlight;
    }
    out += text;
    if (colors) {
        out += ansi::reset;
    }
}

} // namespace

std::u8string_view severity_highlight(Severity severity) noexcept
{
    return severity <= Severity::trace       ? ansi::black
        : severity <= Severity::debug        ? ansi::h_black
        : severity <= Severity::info         ? ansi::blue
        : severity <= Severity::soft_warning ? ansi::green
        : severity <= Severity::warning      ? ansi::h_yellow
        : severity <= Severity::error        ? ansi::h_red
        : severity <= Severity::fatal        ? ansi::red
                                             : ansi::magenta;
}

std::u8string_view find_line(std::u8string_view source, std::size_t line_number) noexcept
{
    if (line_number == 0) {
        return {};
    }
    for (std::size_t i = 1; i < line_number; ++i) {
        const std::size_t terminator = source.find(u8'\n');
        if (terminator == std::u8string_view::npos) {
            return {};
        }
        source.remove_prefix(terminator + 1);
    }
    std::u8string_view result = source.substr(0, source.find(u8'\n'));
    if (result.ends_with(u8'\r')) {
        result.remove_suffix(1);
    }
    return result;
}

void print_diagnostic(std::pmr::u8string& out, const Diagnostic& diagnostic, bool colors)
{
    append_highlighted(
        out, severity_tag(diagnostic.severity), severity_highlight(diagnostic.severity), colors
    );
    out += u8": ";
    {
        std::pmr::u8string position { out.get_allocator() };
        position += diagnostic.file;
        position += u8':';
        if (diagnostic.line != 0) {
            append_decimal(position, diagnostic.line);
            position += u8':';
        }
        append_highlighted(out, position, ansi::h_black, colors);
    }
    out += u8' ';
    out += diagnostic.message;
    {
        std::pmr::u8string id { out.get_allocator() };
        id += u8" [";
        id += diagnostic.id;
        id += u8']';
        append_highlighted(out, id, ansi::h_black, colors);
    }
    out += u8'\n';
}

void print_affected_line(
    std::pmr::u8string& out,
    std::u8string_view source,
    std::size_t line_number,
    bool colors
)
{
    std::pmr::u8string number { out.get_allocator() };
    append_decimal(number, line_number);

    constexpr std::size_t pad_max = 6;
    if (number.length() < pad_max) {
        out.append(pad_max - number.length(), u8' ');
    }
    append_highlighted(out, number, ansi::h_yellow, colors);
    out += u8" | ";
    out += find_line(source, line_number);
    out += u8'\n';
}

void print_io_error(
    std::pmr::u8string& out,
    std::u8string_view file,
    IO_Error_Code error,
    bool colors
)
{
    append_highlighted(
        out, severity_tag(Severity::error), severity_highlight(Severity::error), colors
    );
    out += u8": ";
    std::pmr::u8string position { file, out.get_allocator() };
    position += u8':';
    append_highlighted(out, position, ansi::h_black, colors);
    out += u8' ';
    out += io_error_code_message(error);
    out += u8'\n';
}

std::ostream& operator<<(std::ostream& out, std::u8string_view str)
{
    return out << as_string_view(str);
}

void print_stdout(std::u8string_view str)
{
    std::cout << str;
    std::cout.flush();
}

void print_stderr(std::u8string_view str)
{
    std::cerr << str;
}

} // namespace sigil
