#include <algorithm>
#include <cstddef>
#include <memory_resource>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "sigil/util/assert.hpp"
#include "sigil/util/result.hpp"

#include "sigil/alias.hpp"
#include "sigil/compile_error.hpp"
#include "sigil/lex.hpp"
#include "sigil/modifier_set.hpp"
#include "sigil/module.hpp"
#include "sigil/parse.hpp"

namespace sigil {

std::u8string_view declaration_kind_name(Declaration_Kind kind) noexcept
{
    using enum Declaration_Kind;
    switch (kind) {
        SIGIL_ENUM_STRING_CASE8(module_start);
        SIGIL_ENUM_STRING_CASE8(module_end);
        SIGIL_ENUM_STRING_CASE8(symbol);
        SIGIL_ENUM_STRING_CASE8(variant);
        SIGIL_ENUM_STRING_CASE8(alias);
    }
    SIGIL_ASSERT_UNREACHABLE(u8"Invalid declaration kind.");
}

namespace {

[[nodiscard]]
Compile_Error
make_dangling_error(const Deprecation_Annotation& annotation, std::pmr::memory_resource* memory)
{
    return make_compile_error(
        Compile_Error_Code::dangling_deprecation, annotation.line, memory,
        u8"deprecation is not followed by a symbol or module: \"", annotation.message, u8"\""
    );
}

/// @brief Checks the deprecations preceding a module or alias,
/// which may carry at most one deprecation without modifiers.
[[nodiscard]]
Result<void, Compile_Error> check_binding_deprecations(
    std::span<const Deprecation_Annotation> deprecations,
    std::u8string_view name,
    std::pmr::memory_resource* memory
)
{
    for (const Deprecation_Annotation& d : deprecations) {
        if (d.has_modifiers) {
            return make_compile_error(
                Compile_Error_Code::malformed_modifier_annotation, d.line, memory,
                u8"deprecation of \"", name, u8"\" cannot be restricted to modifiers \"",
                d.modifiers, u8"\""
            );
        }
    }
    if (deprecations.size() > 1) {
        return make_compile_error(
            Compile_Error_Code::duplicate_deprecation, deprecations[1].line, memory,
            u8"\"", name, u8"\" is deprecated more than once"
        );
    }
    return {};
}

/// @brief Checks the deprecations preceding a symbol,
/// which may carry one deprecation without modifiers and one per variant.
[[nodiscard]]
Result<void, Compile_Error> check_symbol_deprecations(
    std::span<const Deprecation_Annotation> deprecations,
    std::u8string_view name,
    std::pmr::memory_resource* memory
)
{
    for (std::size_t i = 1; i < deprecations.size(); ++i) {
        const Deprecation_Annotation& d = deprecations[i];
        const auto is_same_target = [&](const Deprecation_Annotation& other) {
            if (d.has_modifiers != other.has_modifiers) {
                return false;
            }
            return !d.has_modifiers
                || Modifier_Set_View::from_raw_dotted(d.modifiers)
                       .same_modifiers(Modifier_Set_View::from_raw_dotted(other.modifiers));
        };
        if (std::ranges::any_of(deprecations.subspan(0, i), is_same_target)) {
            return make_compile_error(
                Compile_Error_Code::duplicate_deprecation, d.line, memory, u8"\"", name,
                d.has_modifiers ? u8"." : u8"", d.has_modifiers ? d.modifiers : u8"",
                u8"\" is deprecated more than once"
            );
        }
    }
    return {};
}

struct Declaration_Folder {
    std::pmr::vector<Declaration>& out;
    std::pmr::memory_resource* memory;
    std::pmr::vector<Deprecation_Annotation> pending { memory };

    [[nodiscard]]
    Result<void, Compile_Error> operator()(Line&& line, std::size_t line_number)
    {
        switch (line.kind) {
        case Line_Kind::blank: return {};

        case Line_Kind::deprecated: {
            pending.push_back({
                .modifiers = line.modifiers,
                .message = line.message,
                .has_modifiers = line.has_modifiers,
                .line = line_number,
            });
            return {};
        }

        case Line_Kind::module_end:
        case Line_Kind::variant: {
            if (!pending.empty()) {
                return make_dangling_error(pending.front(), memory);
            }
            break;
        }

        case Line_Kind::module_start:
        case Line_Kind::alias: {
            Result<void, Compile_Error> r = check_binding_deprecations(pending, line.name, memory);
            if (!r) {
                return std::move(r).error();
            }
            break;
        }

        case Line_Kind::symbol: {
            Result<void, Compile_Error> r = check_symbol_deprecations(pending, line.name, memory);
            if (!r) {
                return std::move(r).error();
            }
            break;
        }
        }

        out.push_back(Declaration {
            .kind = to_declaration_kind(line.kind),
            .line = line_number,
            .name = line.name,
            .modifiers = line.modifiers,
            .target = line.target,
            .value = std::move(line.value),
            .deep = line.deep,
            .deprecations = std::move(pending),
        });
        pending = std::pmr::vector<Deprecation_Annotation> { memory };
        return {};
    }

    /// @brief To be called once all lines have been folded.
    [[nodiscard]]
    Result<void, Compile_Error> finish() const
    {
        if (!pending.empty()) {
            return make_dangling_error(pending.front(), memory);
        }
        return {};
    }

private:
    [[nodiscard]]
    static Declaration_Kind to_declaration_kind(Line_Kind kind)
    {
        switch (kind) {
        case Line_Kind::module_start: return Declaration_Kind::module_start;
        case Line_Kind::module_end: return Declaration_Kind::module_end;
        case Line_Kind::symbol: return Declaration_Kind::symbol;
        case Line_Kind::variant: return Declaration_Kind::variant;
        case Line_Kind::alias: return Declaration_Kind::alias;
        default: break;
        }
        SIGIL_ASSERT_UNREACHABLE(u8"Blank and deprecation lines are not declarations.");
    }
};

[[nodiscard]]
std::optional<std::pmr::u8string> find_unqualified_deprecation(
    std::span<const Deprecation_Annotation> deprecations,
    std::pmr::memory_resource* memory
)
{
    for (const Deprecation_Annotation& d : deprecations) {
        if (!d.has_modifiers) {
            return std::pmr::u8string { d.message, memory };
        }
    }
    return {};
}

struct Module_Builder {
private:
    std::span<const Declaration> m_declarations;
    std::size_t m_pos = 0;
    std::pmr::memory_resource* m_memory;

public:
    [[nodiscard]]
    Module_Builder(std::span<const Declaration> declarations, std::pmr::memory_resource* memory)
        : m_declarations { declarations }
        , m_memory { memory }
    {
    }

    /// @brief Builds the entries of one scope.
    /// @param open The `module_start` declaration which opened the scope,
    /// or `nullptr` for the top-level scope.
    [[nodiscard]]
    Result<Module, Compile_Error> build_scope(const Declaration* open)
    {
        std::pmr::vector<Module_Entry> entries { m_memory };
        std::pmr::vector<Alias_Declaration> aliases { m_memory };
        // Names with the line on which they are bound, for detecting duplicates.
        std::pmr::vector<std::pair<std::u8string_view, std::size_t>> names { m_memory };

        bool closed = false;
        while (!closed && m_pos < m_declarations.size()) {
            const Declaration& d = m_declarations[m_pos++];
            switch (d.kind) {
            case Declaration_Kind::module_end: {
                if (!open) {
                    return make_compile_error(
                        Compile_Error_Code::unexpected_module_end, d.line, m_memory,
                        u8"\"}\" does not close any module"
                    );
                }
                closed = true;
                break;
            }

            case Declaration_Kind::module_start: {
                Result<Module, Compile_Error> nested = build_scope(&d);
                if (!nested) {
                    return std::move(nested).error();
                }
                names.emplace_back(d.name, d.line);
                entries.push_back(Module_Entry {
                    .name = std::pmr::u8string { d.name, m_memory },
                    .binding = Binding {
                        .def = std::move(*nested),
                        .deprecation = find_unqualified_deprecation(d.deprecations, m_memory),
                    },
                });
                break;
            }

            case Declaration_Kind::symbol: {
                Result<Binding, Compile_Error> binding = build_symbol(d);
                if (!binding) {
                    return std::move(binding).error();
                }
                names.emplace_back(d.name, d.line);
                entries.push_back(Module_Entry {
                    .name = std::pmr::u8string { d.name, m_memory },
                    .binding = std::move(*binding),
                });
                break;
            }

            case Declaration_Kind::variant: {
                return make_compile_error(
                    Compile_Error_Code::unexpected_declaration, d.line, m_memory, u8"variant \".",
                    d.modifiers, u8"\" does not belong to any symbol"
                );
            }

            case Declaration_Kind::alias: {
                names.emplace_back(d.name, d.line);
                aliases.push_back(Alias_Declaration {
                    .name = d.name,
                    .target = d.target,
                    .modifiers = d.modifiers,
                    .deep = d.deep,
                    .deprecation = d.deprecations.empty()
                        ? std::optional<std::u8string_view> {}
                        : std::optional<std::u8string_view> { d.deprecations.front().message },
                    .line = d.line,
                });
                break;
            }
            }
        }

        if (open && !closed) {
            return make_compile_error(
                Compile_Error_Code::unclosed_module, open->line, m_memory, u8"module \"",
                open->name, u8"\" is never closed"
            );
        }

        std::ranges::sort(names);
        for (std::size_t i = 1; i < names.size(); ++i) {
            if (names[i - 1].first == names[i].first) {
                return make_compile_error(
                    Compile_Error_Code::duplicate_definition, names[i].second, m_memory, u8"\"",
                    names[i].first, u8"\" is already defined in this scope"
                );
            }
        }

        Result<std::pmr::vector<Module_Entry>, Compile_Error> resolved
            = resolve_aliases(entries, aliases, m_memory);
        if (!resolved) {
            return std::move(resolved).error();
        }
        for (Module_Entry& entry : *resolved) {
            entries.push_back(std::move(entry));
        }
        return Module { std::move(entries) };
    }

private:
    /// @brief Builds a symbol from its declaration,
    /// absorbing all variant declarations that immediately follow.
    [[nodiscard]]
    Result<Binding, Compile_Error> build_symbol(const Declaration& d)
    {
        std::pmr::vector<Variant> variants { m_memory };
        if (d.value) {
            variants.push_back(Variant {
                .modifiers = Modifier_Set { m_memory },
                .value = std::pmr::u8string { *d.value, m_memory },
                .deprecation = {},
            });
        }
        for (; m_pos < m_declarations.size()
             && m_declarations[m_pos].kind == Declaration_Kind::variant;
             ++m_pos) {
            const Declaration& v = m_declarations[m_pos];
            const auto v_set = Modifier_Set_View::from_raw_dotted(v.modifiers);
            const bool is_duplicate = std::ranges::any_of(variants, [&](const Variant& other) {
                return other.modifiers.view().same_names(v_set);
            });
            if (is_duplicate) {
                return make_compile_error(
                    Compile_Error_Code::duplicate_definition, v.line, m_memory, u8"variant \"",
                    d.name, u8".", v.modifiers, u8"\" is already defined"
                );
            }
            SIGIL_DEBUG_ASSERT(v.value);
            variants.push_back(Variant {
                .modifiers = Modifier_Set { v_set, m_memory },
                .value = std::pmr::u8string { *v.value, m_memory },
                .deprecation = {},
            });
        }

        if (variants.empty()) {
            return make_compile_error(
                Compile_Error_Code::missing_value, d.line, m_memory, u8"symbol \"", d.name,
                u8"\" has neither a value nor variants"
            );
        }

        for (const Deprecation_Annotation& annotation : d.deprecations) {
            if (!annotation.has_modifiers) {
                continue;
            }
            const auto annotation_set = Modifier_Set_View::from_raw_dotted(annotation.modifiers);
            const auto match = std::ranges::find_if(variants, [&](const Variant& v) {
                return v.modifiers.view().same_modifiers(annotation_set);
            });
            if (match == variants.end()) {
                return make_compile_error(
                    Compile_Error_Code::malformed_modifier_annotation, annotation.line, m_memory,
                    u8"symbol \"", d.name, u8"\" has no variant \"", annotation.modifiers,
                    u8"\" to deprecate"
                );
            }
            match->deprecation.emplace(annotation.message, m_memory);
        }

        auto deprecation = find_unqualified_deprecation(d.deprecations, m_memory);
        if (!d.value || variants.size() > 1) {
            return Binding { .def = Symbol::multi(std::move(variants)),
                             .deprecation = std::move(deprecation) };
        }
        return Binding { .def = Symbol::single(std::move(variants.front().value)),
                         .deprecation = std::move(deprecation) };
    }
};

} // namespace

Result<std::pmr::vector<Declaration>, Compile_Error>
lex_declarations(std::u8string_view source, std::pmr::memory_resource* memory)
{
    std::pmr::vector<Declaration> result { memory };
    Declaration_Folder folder { result, memory };

    std::size_t line_number = 0;
    while (!source.empty()) {
        ++line_number;
        const std::size_t terminator = source.find(u8'\n');
        std::u8string_view line = source.substr(0, terminator);
        source = terminator == std::u8string_view::npos ? std::u8string_view {}
                                                        : source.substr(terminator + 1);
        if (line.ends_with(u8'\r')) {
            line.remove_suffix(1);
        }

        Result<Line, Compile_Error> lexed = lex_line(line, line_number, memory);
        if (!lexed) {
            return std::move(lexed).error();
        }
        Result<void, Compile_Error> folded = folder(std::move(*lexed), line_number);
        if (!folded) {
            return std::move(folded).error();
        }
    }

    Result<void, Compile_Error> finished = folder.finish();
    if (!finished) {
        return std::move(finished).error();
    }
    return result;
}

Result<Module, Compile_Error>
build_module(std::span<const Declaration> declarations, std::pmr::memory_resource* memory)
{
    Module_Builder builder { declarations, memory };
    return builder.build_scope(nullptr);
}

} // namespace sigil
