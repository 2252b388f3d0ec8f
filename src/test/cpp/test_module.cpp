#include <memory_resource>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

#include <gtest/gtest.h>

#include "sigil/compile.hpp"
#include "sigil/module.hpp"

#include "compile_testing.hpp"

namespace sigil {
namespace {

constexpr std::u8string_view module_source = u8"arrow →\n"
                                             u8"  .r →\n"
                                             u8"  .l ←\n"
                                             u8"  .r.double ⇒\n"
                                             u8"  .l.double ⇐\n"
                                             u8"  .r.long? ⟶\n"
                                             u8"@deprecated: use the flag module\n"
                                             u8"old {\n"
                                             u8"  @deprecated: use de\n"
                                             u8"  germany 🇩🇪\n"
                                             u8"  fr 🇫🇷\n"
                                             u8"}\n"
                                             u8"flag {\n"
                                             u8"  de 🇩🇪\n"
                                             u8"  @deprecated(fancy): too fancy\n"
                                             u8"  star ⋆\n"
                                             u8"    .fancy ✯\n"
                                             u8"}\n";

struct Module_Lookup : Compile_Test {
    std::optional<Module> module;

    void SetUp() override
    {
        module = compile_ok(module_source);
        ASSERT_TRUE(module);
    }

    [[nodiscard]]
    std::optional<std::u8string_view> value_of(std::u8string_view path) const
    {
        const std::optional<Path_Match> match = module->get_path(path);
        if (!match) {
            return {};
        }
        return match->value;
    }
};

TEST_F(Module_Lookup, get)
{
    EXPECT_TRUE(module->get(u8"arrow"));
    EXPECT_TRUE(module->get(u8"flag"));
    EXPECT_FALSE(module->get(u8"de"));
    EXPECT_FALSE(module->get(u8"Arrow"));
    EXPECT_FALSE(module->get(u8""));
    EXPECT_FALSE(module->get(u8"arrow.r"));
}

TEST_F(Module_Lookup, entries_are_sorted)
{
    ASSERT_EQ(module->size(), 3);
    EXPECT_EQ(module->entries()[0].name, u8"arrow");
    EXPECT_EQ(module->entries()[1].name, u8"flag");
    EXPECT_EQ(module->entries()[2].name, u8"old");
    EXPECT_TRUE(module->all_sorted());
}

TEST_F(Module_Lookup, get_path_symbol)
{
    EXPECT_EQ(value_of(u8"arrow"), u8"→");
    EXPECT_EQ(value_of(u8"arrow.r"), u8"→");
    EXPECT_EQ(value_of(u8"arrow.l"), u8"←");
    EXPECT_EQ(value_of(u8"arrow.r.double"), u8"⇒");
    EXPECT_EQ(value_of(u8"arrow.double.r"), u8"⇒");
    EXPECT_EQ(value_of(u8"arrow.double.l"), u8"⇐");
}

TEST_F(Module_Lookup, get_path_optional_modifier)
{
    EXPECT_EQ(value_of(u8"arrow.r.long"), u8"⟶");
    EXPECT_EQ(value_of(u8"arrow.long.r"), u8"⟶");
}

TEST_F(Module_Lookup, get_path_no_match)
{
    EXPECT_EQ(value_of(u8"arrow.double"), std::nullopt);
    EXPECT_EQ(value_of(u8"arrow.r.double.long"), std::nullopt);
    EXPECT_EQ(value_of(u8"arrow.up"), std::nullopt);
    EXPECT_EQ(value_of(u8"arrow."), std::nullopt);
    EXPECT_EQ(value_of(u8"arrow.r..double"), std::nullopt);
    EXPECT_EQ(value_of(u8"nothing"), std::nullopt);
    EXPECT_EQ(value_of(u8""), std::nullopt);
}

TEST_F(Module_Lookup, get_path_nested)
{
    EXPECT_EQ(value_of(u8"flag.de"), u8"🇩🇪");
    EXPECT_EQ(value_of(u8"flag.star.fancy"), u8"✯");
    EXPECT_EQ(value_of(u8"flag"), std::nullopt);
    EXPECT_EQ(value_of(u8"flag.us"), std::nullopt);
    EXPECT_EQ(value_of(u8"flag.de.big"), std::nullopt);
}

TEST_F(Module_Lookup, get_path_deprecation)
{
    EXPECT_EQ(module->get_path(u8"arrow.r")->deprecation, std::nullopt);
    EXPECT_EQ(module->get_path(u8"flag.star")->deprecation, std::nullopt);
    EXPECT_EQ(module->get_path(u8"flag.star.fancy")->deprecation, u8"too fancy");
    EXPECT_EQ(module->get_path(u8"old.fr")->deprecation, u8"use the flag module");
    // The outermost deprecation is reported.
    EXPECT_EQ(module->get_path(u8"old.germany")->deprecation, u8"use the flag module");
}

TEST(Symbol_Get, single)
{
    const Symbol symbol = Symbol::single(std::pmr::u8string { u8"x" });
    EXPECT_TRUE(symbol.is_single());
    EXPECT_FALSE(symbol.is_multi());
    EXPECT_EQ(symbol.default_value(), u8"x");
    EXPECT_EQ(symbol.get(mods(u8"")), (Symbol_Match { u8"x", {} }));
    EXPECT_EQ(symbol.get(mods(u8"r")), std::nullopt);
}

TEST(Symbol_Get, multi_ranking)
{
    const auto variant = [](std::u8string_view modifiers, std::u8string_view value,
                            std::optional<std::u8string_view> deprecation = {}) {
        Variant result { Modifier_Set::from_raw_dotted(modifiers), std::pmr::u8string { value },
                         {} };
        if (deprecation) {
            result.deprecation.emplace(*deprecation);
        }
        return result;
    };

    std::pmr::vector<Variant> variants;
    variants.push_back(variant(u8"", u8"a"));
    variants.push_back(variant(u8"r.tail?", u8"b"));
    variants.push_back(variant(u8"r", u8"c", u8"old"));
    const Symbol symbol = Symbol::multi(std::move(variants));

    EXPECT_EQ(symbol.get(mods(u8"")), (Symbol_Match { u8"a", {} }));
    // Both "r.tail?" and "r" are eligible for "r"; the one with fewer modifiers wins.
    EXPECT_EQ(symbol.get(mods(u8"r")), (Symbol_Match { u8"c", u8"old" }));
    EXPECT_EQ(symbol.get(mods(u8"r.tail")), (Symbol_Match { u8"b", {} }));
    EXPECT_EQ(symbol.get(mods(u8"tail")), std::nullopt);
}

TEST(Module_Basics, empty)
{
    const Module module;
    EXPECT_TRUE(module.empty());
    EXPECT_EQ(module.size(), 0);
    EXPECT_TRUE(module.all_sorted());
    EXPECT_FALSE(module.get(u8"x"));
    EXPECT_FALSE(module.get_path(u8"x.y"));
}

TEST(Module_Basics, count_definitions)
{
    std::pmr::monotonic_buffer_resource memory;
    const Result<Module, Compile_Error> module = compile(module_source, { .memory = &memory });
    ASSERT_TRUE(module);
    // arrow, old, old.germany, old.fr, flag, flag.de, flag.star
    EXPECT_EQ(count_definitions(*module), 7);
}

} // namespace
} // namespace sigil
