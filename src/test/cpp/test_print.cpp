#include <memory_resource>
#include <string>
#include <string_view>

#include <gtest/gtest.h>

#include "sigil/util/ansi.hpp"
#include "sigil/util/io.hpp"
#include "sigil/util/severity.hpp"

#include "sigil/diagnostic.hpp"
#include "sigil/print.hpp"

namespace sigil {
namespace {

constexpr std::u8string_view source = u8"a x\r\n"
                                      u8"b\n"
                                      u8"  .r y\n"
                                      u8"\n"
                                      u8"last";

TEST(Print, find_line)
{
    EXPECT_EQ(find_line(source, 0), u8"");
    EXPECT_EQ(find_line(source, 1), u8"a x");
    EXPECT_EQ(find_line(source, 2), u8"b");
    EXPECT_EQ(find_line(source, 3), u8"  .r y");
    EXPECT_EQ(find_line(source, 4), u8"");
    EXPECT_EQ(find_line(source, 5), u8"last");
    EXPECT_EQ(find_line(source, 6), u8"");
    EXPECT_EQ(find_line(u8"", 1), u8"");
}

TEST(Print, diagnostic_without_colors)
{
    const Diagnostic diagnostic {
        .severity = Severity::error,
        .id = diagnostic::alias_no_symbol,
        .file = u8"sym.txt",
        .line = 12,
        .message = u8"alias \"b\" refers to nonexistent symbol \"a\"",
    };
    std::pmr::u8string out;
    print_diagnostic(out, diagnostic, false);
    EXPECT_EQ(
        out,
        u8"ERROR: sym.txt:12: alias \"b\" refers to nonexistent symbol \"a\" "
        u8"[alias.no-symbol]\n"
    );
}

TEST(Print, diagnostic_without_line)
{
    const Diagnostic diagnostic {
        .severity = Severity::debug,
        .id = diagnostic::compile_done,
        .file = u8"emoji",
        .line = 0,
        .message = u8"compiled 3 definitions",
    };
    std::pmr::u8string out;
    print_diagnostic(out, diagnostic, false);
    EXPECT_EQ(out, u8"DEBUG: emoji: compiled 3 definitions [compile.done]\n");
}

TEST(Print, diagnostic_with_colors)
{
    const Diagnostic diagnostic {
        .severity = Severity::warning,
        .id = diagnostic::deprecated,
        .file = u8"<input>",
        .line = 0,
        .message = u8"x",
    };
    std::pmr::u8string out;
    print_diagnostic(out, diagnostic, true);
    EXPECT_TRUE(out.starts_with(ansi::h_yellow));
    EXPECT_NE(out.find(u8"WARNING"), std::u8string::npos);
    EXPECT_TRUE(out.ends_with(u8"\n"));
}

TEST(Print, affected_line)
{
    std::pmr::u8string out;
    print_affected_line(out, source, 3, false);
    EXPECT_EQ(out, u8"     3 |   .r y\n");
}

TEST(Print, io_error)
{
    std::pmr::u8string out;
    print_io_error(out, u8"missing.txt", IO_Error_Code::cannot_open, false);
    EXPECT_EQ(out, u8"ERROR: missing.txt: The file could not be opened.\n");
}

TEST(Print, severity_highlight)
{
    EXPECT_EQ(severity_highlight(Severity::error), ansi::h_red);
    EXPECT_EQ(severity_highlight(Severity::warning), ansi::h_yellow);
    EXPECT_EQ(severity_highlight(Severity::debug), ansi::h_black);
}

} // namespace
} // namespace sigil
