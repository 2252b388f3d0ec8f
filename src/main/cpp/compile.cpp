#include <cstddef>
#include <memory_resource>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "sigil/util/result.hpp"
#include "sigil/util/severity.hpp"
#include "sigil/util/to_chars.hpp"

#include "sigil/compile.hpp"
#include "sigil/compile_error.hpp"
#include "sigil/diagnostic.hpp"
#include "sigil/module.hpp"
#include "sigil/parse.hpp"

namespace sigil {
namespace {

void log_compile_error(const Compile_Error& error, const Compile_Options& options)
{
    options.logger.log(Diagnostic {
        .severity = Severity::error,
        .id = compile_error_diagnostic_id(error.code),
        .file = options.file_name,
        .line = error.line,
        .message = error.message,
    });
}

[[nodiscard]]
Result<Module, Compile_Error>
do_compile(std::u8string_view source, std::pmr::memory_resource* memory)
{
    // Declarations refer to the source and are only needed until the module is built.
    std::pmr::unsynchronized_pool_resource transient_memory { memory };

    Result<std::pmr::vector<Declaration>, Compile_Error> declarations
        = lex_declarations(source, &transient_memory);
    if (!declarations) {
        const Compile_Error& error = declarations.error();
        return Compile_Error { error.code, error.line,
                               std::pmr::u8string { error.message, memory } };
    }
    return build_module(*declarations, memory);
}

} // namespace

std::size_t count_definitions(const Module& module) noexcept
{
    std::size_t result = 0;
    for (const Module_Entry& entry : module) {
        ++result;
        if (const Module* const nested = entry.binding.as_module()) {
            result += count_definitions(*nested);
        }
    }
    return result;
}

Result<Module, Compile_Error> compile(std::u8string_view source, const Compile_Options& options)
{
    Result<Module, Compile_Error> result = do_compile(source, options.memory);
    if (!result) {
        log_compile_error(result.error(), options);
        return result;
    }

    if (options.logger.can_log(Severity::debug)) {
        std::pmr::u8string message { options.memory };
        message += u8"compiled ";
        append_decimal(message, count_definitions(*result));
        message += u8" definitions";
        options.logger.log(Diagnostic {
            .severity = Severity::debug,
            .id = diagnostic::compile_done,
            .file = options.file_name,
            .line = 0,
            .message = message,
        });
    }
    return result;
}

} // namespace sigil
