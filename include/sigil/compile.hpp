#ifndef SIGIL_COMPILE_HPP
#define SIGIL_COMPILE_HPP

#include <cstddef>
#include <memory_resource>
#include <string_view>

#include "sigil/util/result.hpp"

#include "sigil/compile_error.hpp"
#include "sigil/fwd.hpp"
#include "sigil/module.hpp"
#include "sigil/services.hpp"

namespace sigil {

struct Compile_Options {
    /// @brief The name of the compiled file, as it appears in diagnostics.
    std::u8string_view file_name = u8"<input>";
    /// @brief The logger which receives the compile error, if any,
    /// and informational diagnostics.
    Logger& logger = ignorant_logger;
    /// @brief The memory resource from which the resulting module is allocated.
    /// The module shall not outlive it.
    std::pmr::memory_resource* memory = std::pmr::get_default_resource();
};

/// @brief Compiles the source code of a corpus into a module.
/// Compilation stops at the first error, which is also logged to `options.logger`.
/// The resulting module does not refer to `source`.
[[nodiscard]]
Result<Module, Compile_Error> compile(std::u8string_view source, const Compile_Options& options);

/// @brief Returns the total number of symbols and modules in `module`,
/// including those in nested modules.
[[nodiscard]]
std::size_t count_definitions(const Module& module) noexcept;

} // namespace sigil

#endif
