#ifndef SIGIL_PRINT_HPP
#define SIGIL_PRINT_HPP

#include <cstddef>
#include <iosfwd>
#include <string>
#include <string_view>

#include "sigil/util/severity.hpp"

#include "sigil/fwd.hpp"

namespace sigil {

/// @brief Returns the ANSI escape sequence in which the tag of a diagnostic
/// with the given `severity` is printed.
[[nodiscard]]
std::u8string_view severity_highlight(Severity severity) noexcept;

/// @brief Returns the line with the given one-based `line_number` within `source`,
/// without its line terminator.
/// If there is no such line, returns an empty string.
[[nodiscard]]
std::u8string_view find_line(std::u8string_view source, std::size_t line_number) noexcept;

/// @brief Prints a diagnostic in the form `SEVERITY: file:line: message [id]`,
/// followed by a newline.
/// If the diagnostic is not tied to a line, the line number is omitted.
/// @param colors If `true`, ANSI escape sequences are used for highlighting.
void print_diagnostic(std::pmr::u8string& out, const Diagnostic& diagnostic, bool colors);

/// @brief Prints the line with the given one-based `line_number` within `source`,
/// prefixed by its line number.
void print_affected_line(
    std::pmr::u8string& out,
    std::u8string_view source,
    std::size_t line_number,
    bool colors
);

void print_io_error(
    std::pmr::u8string& out,
    std::u8string_view file,
    IO_Error_Code error,
    bool colors
);

std::ostream& operator<<(std::ostream& out, std::u8string_view str);

void print_stdout(std::u8string_view str);
void print_stderr(std::u8string_view str);

} // namespace sigil

#endif
