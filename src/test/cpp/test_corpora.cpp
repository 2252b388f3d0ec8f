#include <algorithm>
#include <cstddef>
#include <memory_resource>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <gtest/gtest.h>

#include "sigil/util/strings.hpp"

#include "sigil/modifier_set.hpp"
#include "sigil/module.hpp"
#include "sigil/root.hpp"

namespace sigil {
namespace {

[[nodiscard]]
std::optional<std::u8string_view> value_of(const Module& module, std::u8string_view path)
{
    const std::optional<Path_Match> match = module.get_path(path);
    if (!match) {
        return {};
    }
    return match->value;
}

[[nodiscard]]
std::optional<std::u8string_view> deprecation_of(const Module& module, std::u8string_view path)
{
    const std::optional<Path_Match> match = module.get_path(path);
    if (!match) {
        ADD_FAILURE() << "path does not resolve";
        return {};
    }
    return match->deprecation;
}

/// @brief Calls `f` with every request of at most `max_size` modifiers drawn from `names`,
/// in dotted form.
template <typename F>
void for_each_request(
    std::span<const std::u8string_view> names,
    std::size_t max_size,
    std::pmr::u8string& request,
    std::size_t first,
    F& f
)
{
    f(Modifier_Set_View::from_raw_dotted(request));
    if (max_size == 0) {
        return;
    }
    for (std::size_t i = first; i < names.size(); ++i) {
        const std::size_t restore = request.size();
        if (!request.empty()) {
            request += modifier_separator;
        }
        request += names[i];
        for_each_request(names, max_size - 1, request, i + 1, f);
        request.resize(restore);
    }
}

/// @brief Checks that no request selects more than one eligible variant of `symbol`.
/// Requests consist of up to as many modifiers as the largest variant has.
void expect_no_overlap(const Symbol& symbol, std::u8string_view symbol_name)
{
    std::pmr::vector<std::u8string_view> names;
    std::size_t max_size = 0;
    for (const Variant& variant : symbol.variants()) {
        max_size = std::max(max_size, variant.modifiers.size());
        for (const Modifier m : variant.modifiers) {
            if (std::ranges::find(names, m.name) == names.end()) {
                names.push_back(m.name);
            }
        }
    }

    const auto check = [&](Modifier_Set_View request) {
        const auto eligible = std::ranges::count_if(symbol.variants(), [&](const Variant& v) {
            return request.is_matched_by(v.modifiers);
        });
        EXPECT_LE(eligible, 1) << "ambiguous request \"" << as_string_view(request.as_string())
                               << "\" for " << as_string_view(symbol_name);
    };
    std::pmr::u8string request;
    for_each_request(names, max_size, request, 0, check);
}

void expect_no_overlap(const Module& module)
{
    for (const Module_Entry& entry : module) {
        if (const Module* const nested = entry.binding.as_module()) {
            expect_no_overlap(*nested);
        }
        else {
            expect_no_overlap(*entry.binding.as_symbol(), entry.name);
        }
    }
}

void expect_well_formed(const Module& module)
{
    for (const Module_Entry& entry : module) {
        EXPECT_TRUE(is_identifier(entry.name));
        if (const Module* const nested = entry.binding.as_module()) {
            expect_well_formed(*nested);
            continue;
        }
        for (const Variant& variant : entry.binding.as_symbol()->variants()) {
            EXPECT_FALSE(variant.value.empty());
            EXPECT_TRUE(is_valid_modifier_set(variant.modifiers.as_string()));
        }
    }
}

TEST(Corpora, root)
{
    const Module& module = root();
    ASSERT_EQ(module.size(), 2);
    EXPECT_EQ(module.entries()[0].name, u8"emoji");
    EXPECT_EQ(module.entries()[1].name, u8"sym");
    EXPECT_EQ(&sym(), module.get(u8"sym")->as_module());
    EXPECT_EQ(&emoji(), module.get(u8"emoji")->as_module());
    EXPECT_TRUE(module.all_sorted());
}

TEST(Corpora, well_formed)
{
    expect_well_formed(sym());
    expect_well_formed(emoji());
    EXPECT_GT(sym().size(), 100);
    EXPECT_GT(emoji().size(), 50);
}

TEST(Corpora, no_overlap)
{
    expect_no_overlap(sym());
    expect_no_overlap(emoji());
}

TEST(Corpora, sym_lookup)
{
    const Module& module = sym();
    EXPECT_EQ(value_of(module, u8"wj"), u8"\u2060");
    EXPECT_EQ(value_of(module, u8"arrow.r"), u8"→");
    EXPECT_EQ(value_of(module, u8"arrow.r.double"), u8"⇒");
    EXPECT_EQ(value_of(module, u8"arrow.double.r"), u8"⇒");
    EXPECT_EQ(value_of(module, u8"arrow.r.double.long"), u8"⟹");
    EXPECT_EQ(value_of(module, u8"eq.not"), u8"≠");
    EXPECT_EQ(value_of(module, u8"ceil.l"), u8"⌈");
    EXPECT_EQ(value_of(module, u8"planck"), u8"ħ");
    EXPECT_EQ(value_of(module, u8"arrow"), std::nullopt);
    EXPECT_EQ(value_of(module, u8"arrow.r.nonsense"), std::nullopt);
}

TEST(Corpora, sym_aliases)
{
    const Module& module = sym();
    EXPECT_EQ(value_of(module, u8"implies"), u8"⟹");
    EXPECT_EQ(value_of(module, u8"iff"), u8"⟺");
    EXPECT_EQ(value_of(module, u8"rarrow"), u8"→");
    EXPECT_EQ(value_of(module, u8"rarrow.double"), u8"⇒");
    EXPECT_EQ(value_of(module, u8"rarrow.long.double"), u8"⟹");
    EXPECT_TRUE(module.get(u8"implies")->as_symbol()->is_single());
    EXPECT_TRUE(module.get(u8"rarrow")->as_symbol()->is_multi());
}

TEST(Corpora, sym_deprecations)
{
    const Module& module = sym();
    EXPECT_EQ(deprecation_of(module, u8"arrow.r"), std::nullopt);
    EXPECT_EQ(deprecation_of(module, u8"planck"), std::nullopt);
    EXPECT_TRUE(deprecation_of(module, u8"planck.reduce"));
    EXPECT_TRUE(deprecation_of(module, u8"ceil.l"));
    EXPECT_TRUE(deprecation_of(module, u8"implies"));
    EXPECT_EQ(deprecation_of(module, u8"iff"), std::nullopt);
}

TEST(Corpora, emoji_lookup)
{
    const Module& module = emoji();
    EXPECT_EQ(value_of(module, u8"flag.de"), u8"🇩🇪");
    EXPECT_EQ(value_of(module, u8"face.grin"), u8"😀");
    EXPECT_EQ(value_of(module, u8"thumbsup"), u8"👍");
    EXPECT_EQ(value_of(module, u8"smile"), u8"😀");
    EXPECT_TRUE(deprecation_of(module, u8"smile"));
    EXPECT_EQ(deprecation_of(module, u8"thumbsup"), std::nullopt);
    EXPECT_EQ(value_of(module, u8"flag"), std::nullopt);
}

TEST(Corpora, suggest_name)
{
    std::pmr::monotonic_buffer_resource memory;
    EXPECT_EQ(suggest_name(sym(), u8"arow", &memory), u8"arrow");
    EXPECT_EQ(suggest_name(emoji(), u8"thumbsupp", &memory), u8"thumbsup");
    EXPECT_EQ(suggest_name(Module {}, u8"x", &memory), std::nullopt);
}

} // namespace
} // namespace sigil
