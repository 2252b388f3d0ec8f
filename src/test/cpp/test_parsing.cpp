#include <memory_resource>
#include <optional>
#include <span>
#include <string_view>

#include <gtest/gtest.h>

#include "sigil/compile_error.hpp"
#include "sigil/module.hpp"

#include "compile_testing.hpp"

namespace sigil {
namespace {

using Parsing = Compile_Test;

TEST_F(Parsing, empty)
{
    const std::optional<Module> module = compile_ok(u8"");
    ASSERT_TRUE(module);
    EXPECT_TRUE(module->empty());

    const std::optional<Module> only_comments = compile_ok(u8"// nothing\n\n   \n");
    ASSERT_TRUE(only_comments);
    EXPECT_TRUE(only_comments->empty());
}

TEST_F(Parsing, single_symbol)
{
    const std::optional<Module> module = compile_ok(u8"wj \\u{2060}\n");
    ASSERT_TRUE(module);
    ASSERT_EQ(module->size(), 1);

    const Binding* const binding = module->get(u8"wj");
    ASSERT_TRUE(binding);
    EXPECT_FALSE(binding->deprecation);
    const Symbol* const symbol = binding->as_symbol();
    ASSERT_TRUE(symbol);
    EXPECT_TRUE(symbol->is_single());
    EXPECT_EQ(symbol->default_value(), u8"\u2060");
    ASSERT_EQ(symbol->variants().size(), 1);
    EXPECT_TRUE(symbol->variants()[0].modifiers.is_empty());
}

TEST_F(Parsing, default_plus_variants)
{
    const std::optional<Module> module = compile_ok(u8"arrow →\n"
                                                    u8"  .r →\n"
                                                    u8"  .l ←\n"
                                                    u8"  .r.double ⇒\n");
    ASSERT_TRUE(module);
    const Symbol* const symbol = module->get(u8"arrow")->as_symbol();
    ASSERT_TRUE(symbol);
    EXPECT_TRUE(symbol->is_multi());

    const std::span<const Variant> variants = symbol->variants();
    ASSERT_EQ(variants.size(), 4);
    EXPECT_EQ(variants[0].modifiers.as_string(), u8"");
    EXPECT_EQ(variants[0].value, u8"→");
    EXPECT_EQ(variants[1].modifiers.as_string(), u8"r");
    EXPECT_EQ(variants[2].modifiers.as_string(), u8"l");
    EXPECT_EQ(variants[2].value, u8"←");
    EXPECT_EQ(variants[3].modifiers.as_string(), u8"r.double");
    EXPECT_EQ(variants[3].value, u8"⇒");

    EXPECT_EQ(symbol->default_value(), u8"→");
    EXPECT_EQ(symbol->get(mods(u8"double.r"))->value, u8"⇒");
    EXPECT_EQ(symbol->get(mods(u8""))->value, u8"→");
    EXPECT_FALSE(symbol->get(mods(u8"double")));
}

TEST_F(Parsing, variants_without_default)
{
    const std::optional<Module> module = compile_ok(u8"paren\n"
                                                    u8" .l (\n"
                                                    u8" .r )\n");
    ASSERT_TRUE(module);
    const Symbol* const symbol = module->get(u8"paren")->as_symbol();
    ASSERT_TRUE(symbol);
    EXPECT_TRUE(symbol->is_multi());
    ASSERT_EQ(symbol->variants().size(), 2);
    EXPECT_EQ(symbol->default_value(), u8"(");
    EXPECT_FALSE(symbol->get(mods(u8"")));
}

TEST_F(Parsing, sorted_by_name)
{
    const std::optional<Module> module = compile_ok(u8"beta β\n"
                                                    u8"alpha α\n"
                                                    u8"Alpha Α\n"
                                                    u8"gamma γ\n");
    ASSERT_TRUE(module);
    ASSERT_EQ(module->size(), 4);
    EXPECT_EQ(module->entries()[0].name, u8"Alpha");
    EXPECT_EQ(module->entries()[1].name, u8"alpha");
    EXPECT_EQ(module->entries()[2].name, u8"beta");
    EXPECT_EQ(module->entries()[3].name, u8"gamma");
    EXPECT_TRUE(module->all_sorted());
}

TEST_F(Parsing, nested_modules)
{
    const std::optional<Module> module = compile_ok(u8"flag {\n"
                                                    u8"  de 🇩🇪\n"
                                                    u8"  inner {\n"
                                                    u8"    b y\n"
                                                    u8"    a x\n"
                                                    u8"  }\n"
                                                    u8"}\n"
                                                    u8"after z\n"
                                                    u8"empty {\n"
                                                    u8"}\n");
    ASSERT_TRUE(module);
    ASSERT_EQ(module->size(), 3);
    EXPECT_TRUE(module->all_sorted());

    const Module* const flag = module->get(u8"flag")->as_module();
    ASSERT_TRUE(flag);
    EXPECT_EQ(flag->size(), 2);
    EXPECT_EQ(flag->get(u8"de")->as_symbol()->default_value(), u8"🇩🇪");

    const Module* const inner = flag->get(u8"inner")->as_module();
    ASSERT_TRUE(inner);
    EXPECT_EQ(inner->entries()[0].name, u8"a");
    EXPECT_EQ(inner->entries()[1].name, u8"b");

    const Module* const empty = module->get(u8"empty")->as_module();
    ASSERT_TRUE(empty);
    EXPECT_TRUE(empty->empty());

    EXPECT_TRUE(module->get(u8"after")->as_symbol());
    EXPECT_FALSE(module->get(u8"de"));
}

TEST_F(Parsing, same_name_in_different_scopes)
{
    const std::optional<Module> module = compile_ok(u8"x a\n"
                                                    u8"m {\n"
                                                    u8"  x b\n"
                                                    u8"}\n");
    ASSERT_TRUE(module);
    EXPECT_EQ(module->get(u8"x")->as_symbol()->default_value(), u8"a");
    EXPECT_EQ(module->get(u8"m")->as_module()->get(u8"x")->as_symbol()->default_value(), u8"b");
}

TEST_F(Parsing, crlf_line_endings)
{
    const std::optional<Module> module = compile_ok(u8"a x\r\n"
                                                    u8"b\r\n"
                                                    u8" .r y\r\n");
    ASSERT_TRUE(module);
    EXPECT_EQ(module->get(u8"a")->as_symbol()->default_value(), u8"x");
    EXPECT_EQ(module->get(u8"b")->as_symbol()->get(mods(u8"r"))->value, u8"y");
}

TEST_F(Parsing, deprecations)
{
    const std::optional<Module> module = compile_ok(u8"@deprecated: no longer needed\n"
                                                    u8"old {\n"
                                                    u8"  x y\n"
                                                    u8"}\n"
                                                    u8"@deprecated(double.r): use implies\n"
                                                    u8"@deprecated: use arrow instead\n"
                                                    u8"arr →\n"
                                                    u8"  .r →\n"
                                                    u8"  .r.double ⇒\n");
    ASSERT_TRUE(module);

    const Binding* const old = module->get(u8"old");
    ASSERT_TRUE(old);
    EXPECT_EQ(old->deprecation, u8"no longer needed");
    EXPECT_FALSE(old->as_module()->get(u8"x")->deprecation);

    const Binding* const arr = module->get(u8"arr");
    ASSERT_TRUE(arr);
    EXPECT_EQ(arr->deprecation, u8"use arrow instead");

    const std::span<const Variant> variants = arr->as_symbol()->variants();
    ASSERT_EQ(variants.size(), 3);
    EXPECT_FALSE(variants[0].deprecation);
    EXPECT_FALSE(variants[1].deprecation);
    EXPECT_EQ(variants[2].deprecation, u8"use implies");

    const std::optional<Symbol_Match> match = arr->as_symbol()->get(mods(u8"r.double"));
    ASSERT_TRUE(match);
    EXPECT_EQ(match->value, u8"⇒");
    EXPECT_EQ(match->deprecation, u8"use implies");
}

TEST_F(Parsing, deprecation_of_default_variant)
{
    const std::optional<Module> module = compile_ok(u8"@deprecated(r): use the default\n"
                                                    u8"x a\n"
                                                    u8"  .r b\n");
    ASSERT_TRUE(module);
    const std::span<const Variant> variants = module->get(u8"x")->as_symbol()->variants();
    ASSERT_EQ(variants.size(), 2);
    EXPECT_FALSE(variants[0].deprecation);
    EXPECT_EQ(variants[1].deprecation, u8"use the default");
}

TEST_F(Parsing, error_dangling_deprecation)
{
    EXPECT_EQ(
        compile_error_code(u8"a x\n@deprecated: msg\n", 2),
        Compile_Error_Code::dangling_deprecation
    );
    EXPECT_EQ(
        compile_error_code(u8"m {\n  a x\n  @deprecated: msg\n}\n", 3),
        Compile_Error_Code::dangling_deprecation
    );
    EXPECT_EQ(
        compile_error_code(u8"a\n  .r x\n@deprecated: msg\n  .l y\n", 3),
        Compile_Error_Code::dangling_deprecation
    );
}

TEST_F(Parsing, error_duplicate_deprecation)
{
    EXPECT_EQ(
        compile_error_code(u8"@deprecated: a\n@deprecated: b\nx y\n", 2),
        Compile_Error_Code::duplicate_deprecation
    );
    EXPECT_EQ(
        compile_error_code(u8"@deprecated(r.l): a\n@deprecated(l.r): b\nx\n .r.l y\n", 2),
        Compile_Error_Code::duplicate_deprecation
    );
    EXPECT_EQ(
        compile_error_code(u8"@deprecated: a\n@deprecated: b\nm {\n}\n", 2),
        Compile_Error_Code::duplicate_deprecation
    );
}

TEST_F(Parsing, error_malformed_modifier_annotation)
{
    EXPECT_EQ(
        compile_error_code(u8"@deprecated(r): a\nm {\n}\n", 1),
        Compile_Error_Code::malformed_modifier_annotation
    );
    EXPECT_EQ(
        compile_error_code(u8"@deprecated(l): a\nx\n .r y\n", 1),
        Compile_Error_Code::malformed_modifier_annotation
    );
    EXPECT_EQ(
        compile_error_code(u8"x\n .r y\n@deprecated(r): a\ny @= x.r\n", 3),
        Compile_Error_Code::malformed_modifier_annotation
    );
}

TEST_F(Parsing, error_missing_value)
{
    EXPECT_EQ(compile_error_code(u8"x\n", 1), Compile_Error_Code::missing_value);
    EXPECT_EQ(compile_error_code(u8"a b\nx\ny z\n", 2), Compile_Error_Code::missing_value);
}

TEST_F(Parsing, error_unexpected_declaration)
{
    EXPECT_EQ(compile_error_code(u8".r x\n", 1), Compile_Error_Code::unexpected_declaration);
    EXPECT_EQ(
        compile_error_code(u8"m {\n  .r x\n}\n", 2), Compile_Error_Code::unexpected_declaration
    );
    EXPECT_EQ(
        compile_error_code(u8"m {\n  a x\n}\n  .r y\n", 4),
        Compile_Error_Code::unexpected_declaration
    );
    EXPECT_EQ(
        compile_error_code(u8"a x\nb @= a\n  .r y\n", 3),
        Compile_Error_Code::unexpected_declaration
    );
}

TEST_F(Parsing, error_duplicate_definition)
{
    EXPECT_EQ(compile_error_code(u8"a x\na y\n", 2), Compile_Error_Code::duplicate_definition);
    EXPECT_EQ(
        compile_error_code(u8"a x\nb y\na {\n}\n", 3), Compile_Error_Code::duplicate_definition
    );
    EXPECT_EQ(
        compile_error_code(u8"b @= a\na x\nb y\n", 3), Compile_Error_Code::duplicate_definition
    );
    EXPECT_EQ(
        compile_error_code(u8"a\n .r x\n .l y\n .r z\n", 4),
        Compile_Error_Code::duplicate_definition
    );
    EXPECT_EQ(
        compile_error_code(u8"a\n .r.l x\n .l.r y\n", 3), Compile_Error_Code::duplicate_definition
    );
}

TEST_F(Parsing, error_variants_differing_only_in_optionality)
{
    EXPECT_EQ(
        compile_error_code(u8"foo\n .r x\n .r? y\nbar @= foo.r\n", 3),
        Compile_Error_Code::duplicate_definition
    );
    EXPECT_EQ(
        compile_error_code(u8"a\n .l?.r x\n .r.l y\n", 3), Compile_Error_Code::duplicate_definition
    );
}

TEST_F(Parsing, error_unclosed_module)
{
    EXPECT_EQ(compile_error_code(u8"m {\n  a x\n", 1), Compile_Error_Code::unclosed_module);
    EXPECT_EQ(
        compile_error_code(u8"m {\n  n {\n  }\n  o {\n", 4), Compile_Error_Code::unclosed_module
    );
}

TEST_F(Parsing, error_unexpected_module_end)
{
    EXPECT_EQ(compile_error_code(u8"a x\n}\n", 2), Compile_Error_Code::unexpected_module_end);
    EXPECT_EQ(
        compile_error_code(u8"m {\n}\n}\n", 3), Compile_Error_Code::unexpected_module_end
    );
}

TEST_F(Parsing, error_from_lexer_has_line)
{
    EXPECT_EQ(compile_error_code(u8"a x\n\nb \\u{zz}\n", 3), Compile_Error_Code::invalid_codepoint);
}

} // namespace
} // namespace sigil
