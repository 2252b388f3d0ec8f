#include <cstddef>
#include <memory_resource>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "sigil/util/assert.hpp"
#include "sigil/util/result.hpp"
#include "sigil/util/typo.hpp"

#include "sigil/assets.hpp"
#include "sigil/compile.hpp"
#include "sigil/module.hpp"
#include "sigil/root.hpp"
#include "sigil/settings.hpp"

namespace sigil {
namespace {

struct Root {
    std::pmr::monotonic_buffer_resource memory;
    Module module { &memory };

    Root()
    {
        std::pmr::vector<Module_Entry> entries { &memory };
        entries.push_back(compile_corpus(emoji_corpus_name, assets::emoji_txt));
        entries.push_back(compile_corpus(sym_corpus_name, assets::sym_txt));
        module = Module { std::move(entries) };
    }

    Root(const Root&) = delete;
    Root& operator=(const Root&) = delete;

private:
    [[nodiscard]]
    Module_Entry compile_corpus(std::u8string_view name, std::u8string_view source)
    {
        const Compile_Options options { .file_name = name, .memory = &memory };
        Result<Module, Compile_Error> result = compile(source, options);
        if (!result) {
            SIGIL_ASSERT_UNREACHABLE(u8"Embedded corpus failed to compile.");
        }
        return Module_Entry {
            .name = std::pmr::u8string { name, &memory },
            .binding = Binding { .def = std::move(*result), .deprecation = {} },
        };
    }
};

[[nodiscard]]
const Root& get_root()
{
    static const Root instance;
    return instance;
}

[[nodiscard]]
const Module& get_corpus(std::u8string_view name)
{
    const Binding* const binding = get_root().module.get(name);
    SIGIL_ASSERT(binding);
    const Module* const result = binding->as_module();
    SIGIL_ASSERT(result);
    return *result;
}

} // namespace

const Module& root()
{
    return get_root().module;
}

const Module& sym()
{
    return get_corpus(sym_corpus_name);
}

const Module& emoji()
{
    return get_corpus(emoji_corpus_name);
}

std::optional<std::u8string_view>
suggest_name(const Module& module, std::u8string_view name, std::pmr::memory_resource* memory)
{
    std::pmr::vector<std::u8string_view> names { memory };
    names.reserve(module.size());
    for (const Module_Entry& entry : module) {
        names.push_back(entry.name);
    }
    const Distant<std::size_t> match = closest_match(names, name, memory);
    if (!match) {
        return {};
    }
    return names[match.value];
}

} // namespace sigil
