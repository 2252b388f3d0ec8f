#include <algorithm>
#include <cstddef>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory_resource>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#define ARGS_NOEXCEPT
#include "args.hxx"

#include "sigil/util/io.hpp"
#include "sigil/util/result.hpp"
#include "sigil/util/strings.hpp"
#include "sigil/util/tty.hpp"

#include "sigil/compile.hpp"
#include "sigil/diagnostic.hpp"
#include "sigil/fwd.hpp"
#include "sigil/json.hpp"
#include "sigil/module.hpp"
#include "sigil/print.hpp"
#include "sigil/root.hpp"
#include "sigil/services.hpp"

namespace sigil {
namespace {

struct Stderr_Logger final : Logger {
    /// @brief The source of the corpus that is currently being compiled, if any.
    /// Used to cite the affected line of compile errors.
    std::u8string_view current_source;
    std::pmr::u8string out;
    bool any_errors = false;

    [[nodiscard]]
    Stderr_Logger(Severity min_severity, std::pmr::memory_resource* memory)
        : Logger { min_severity }
        , out { memory }
    {
    }

    void operator()(const Diagnostic diagnostic) final
    {
        any_errors |= diagnostic.severity >= Severity::error;

        print_diagnostic(out, diagnostic, is_stderr_tty);
        if (!current_source.empty() && diagnostic.line != 0) {
            print_affected_line(out, current_source, diagnostic.line, is_stderr_tty);
        }
        print_stderr(out);
        out.clear();
    }
};

/// @brief Compiles the corpus files given on the command line into a module
/// where each corpus is bound to the stem of its file name.
[[nodiscard]]
std::optional<Module> compile_corpora(
    const std::vector<std::string>& paths,
    Stderr_Logger& logger,
    std::pmr::memory_resource* memory
)
{
    std::pmr::vector<Module_Entry> entries { memory };
    for (const std::string& path : paths) {
        const std::u8string_view path_u8 = as_u8string_view(path);
        const Result<std::pmr::vector<char8_t>, IO_Error_Code> text
            = load_utf8_file(path_u8, memory);
        if (!text) {
            std::pmr::u8string error { memory };
            print_io_error(error, path_u8, text.error(), is_stderr_tty);
            print_stderr(error);
            return {};
        }

        const std::u8string stem = std::filesystem::path { path }.stem().u8string();
        logger.current_source = as_u8string_view(*text);
        const Compile_Options options {
            .file_name = path_u8,
            .logger = logger,
            .memory = memory,
        };
        Result<Module, Compile_Error> module = compile(logger.current_source, options);
        logger.current_source = {};
        if (!module) {
            return {};
        }

        const bool is_duplicate
            = std::ranges::find(entries, std::u8string_view { stem }, &Module_Entry::name)
            != entries.end();
        if (is_duplicate) {
            std::pmr::u8string message { memory };
            message += u8"corpus \"";
            message += stem;
            message += u8"\" is given more than once";
            logger.log(Diagnostic {
                .severity = Severity::error,
                .id = diagnostic::definition_duplicate,
                .file = path_u8,
                .line = 0,
                .message = message,
            });
            return {};
        }

        entries.push_back(Module_Entry {
            .name = std::pmr::u8string { stem, memory },
            .binding = Binding { .def = std::move(*module), .deprecation = {} },
        });
    }
    return Module { std::move(entries) };
}

/// @brief Finds the closest match for the first part of `path`
/// which does not name an entry of the module it is looked up in.
[[nodiscard]]
std::optional<std::u8string_view>
suggest_correction(const Module& module, std::u8string_view path, std::pmr::memory_resource* memory)
{
    const Module* current = &module;
    while (true) {
        const auto [head, tail]
            = split_once(path, u8'.').value_or(std::pair { path, std::u8string_view {} });
        const Binding* const binding = current->get(head);
        if (!binding) {
            return suggest_name(*current, head, memory);
        }
        current = binding->as_module();
        if (!current || tail.empty()) {
            return {};
        }
        path = tail;
    }
}

void resolve_name(
    const Module& module,
    std::u8string_view name,
    Stderr_Logger& logger,
    std::pmr::memory_resource* memory
)
{
    std::pmr::u8string message { memory };

    const std::optional<Path_Match> match = module.get_path(name);
    if (!match) {
        message += u8"\"";
        message += name;
        message += u8"\" does not name a symbol.";
        if (const std::optional<std::u8string_view> correction
            = suggest_correction(module, name, memory)) {
            message += u8" Did you mean \"";
            message += *correction;
            message += u8"\"?";
        }
        logger.log(Diagnostic {
            .severity = Severity::error,
            .id = diagnostic::lookup_unresolved,
            .file = u8"<command line>",
            .line = 0,
            .message = message,
        });
        return;
    }

    if (match->deprecation) {
        message += u8"\"";
        message += name;
        message += u8"\" is deprecated: ";
        message += *match->deprecation;
        logger.log(Diagnostic {
            .severity = Severity::warning,
            .id = diagnostic::deprecated,
            .file = u8"<command line>",
            .line = 0,
            .message = message,
        });
    }

    std::pmr::u8string line { match->value, memory };
    line += u8'\n';
    print_stdout(line);
}

int main(int argc, const char* const* const argv)
{
    static const std::unordered_map<std::string, Severity> severity_arg_map {
        { "min", Severity::min },
        { "trace", Severity::trace },
        { "debug", Severity::debug },
        { "info", Severity::info },
        { "soft_warning", Severity::soft_warning },
        { "warning", Severity::warning },
        { "error", Severity::error },
        { "fatal", Severity::fatal },
        { "none", Severity::none },
    };

    args::ArgumentParser parser { "Resolves names of symbols and emoji to their text." };
    parser.helpParams.width = 100;
    parser.helpParams.addChoices = true;
    args::PositionalList<std::string> names_arg {
        parser,
        "names",
        "Dotted names to resolve, like sym.arrow.r.double or emoji.face",
    };
    args::ValueFlagList<std::string> corpus_arg {
        parser,
        "file",
        "Compile a corpus from FILE and resolve names in it instead of the built-in corpora; "
        "may be given multiple times",
        { "corpus" },
    };
    args::Flag dump_arg {
        parser,
        "dump",
        "Print the JSON representation of all corpora",
        { "dump" },
    };
    args::MapFlag<std::string, Severity> severity_arg {
        parser,
        "severity",
        "Minimum (>=) severity for log messages",
        { 'l', "severity" },
        severity_arg_map,
        Severity::warning,
    };
    args::HelpFlag help_arg {
        parser, "help", "Display this help menu", { 'h', "help" }, args::Options::Global
    };

    if (argc <= 1) {
        parser.Help(std::cout);
        return EXIT_FAILURE;
    }
    if (!parser.ParseCLI(argc, argv) || parser.GetError() != args::Error::None) {
        std::cerr << parser.GetErrorMsg() << '\n';
        return EXIT_FAILURE;
    }
    if (help_arg.Matched()) {
        parser.Help(std::cout);
        return EXIT_SUCCESS;
    }

    std::pmr::unsynchronized_pool_resource memory;
    Stderr_Logger logger { severity_arg.Get(), &memory };

    std::optional<Module> corpora;
    if (corpus_arg.Matched()) {
        corpora = compile_corpora(corpus_arg.Get(), logger, &memory);
        if (!corpora) {
            return EXIT_FAILURE;
        }
    }
    const Module& module = corpora ? *corpora : root();

    if (dump_arg.Matched()) {
        std::pmr::u8string json { &memory };
        encode_json(json, module);
        json += u8'\n';
        print_stdout(json);
    }

    for (const std::string& name : names_arg.Get()) {
        resolve_name(module, as_u8string_view(name), logger, &memory);
    }

    return logger.any_errors ? EXIT_FAILURE : EXIT_SUCCESS;
}

} // namespace
} // namespace sigil

// NOLINTNEXTLINE(bugprone-exception-escape)
int main(int argc, const char* const* argv)
{
    return sigil::main(argc, argv);
}
