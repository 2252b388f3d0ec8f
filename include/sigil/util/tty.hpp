#ifndef SIGIL_TTY_HPP
#define SIGIL_TTY_HPP

#include <cstdio>

namespace sigil {

/// @brief Returns `true` if `file` refers to a terminal.
/// Diagnostics are only colored when written to a terminal.
[[nodiscard]]
bool is_tty(std::FILE* file) noexcept;

/// @brief True if `is_tty(stderr)` is `true`.
extern const bool is_stderr_tty;

} // namespace sigil

#endif
