#ifndef SIGIL_ROOT_HPP
#define SIGIL_ROOT_HPP

#include <memory_resource>
#include <optional>
#include <string_view>

#include "sigil/fwd.hpp"

namespace sigil {

/// @brief Returns the root module,
/// which contains the modules `emoji` and `sym` compiled from the embedded corpora.
/// The module is compiled on first use, in a thread-safe manner,
/// and is never modified or destroyed afterwards.
[[nodiscard]]
const Module& root();

/// @brief Equivalent to the `sym` module within `root()`.
[[nodiscard]]
const Module& sym();

/// @brief Equivalent to the `emoji` module within `root()`.
[[nodiscard]]
const Module& emoji();

/// @brief Returns the name bound in `module` that is the closest match for `name`,
/// or `std::nullopt` if `module` is empty.
[[nodiscard]]
std::optional<std::u8string_view>
suggest_name(const Module& module, std::u8string_view name, std::pmr::memory_resource* memory);

} // namespace sigil

#endif
