/*
 * test_terminalrenderer.cpp — ANSI output of styled text
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include <gtest/gtest.h>

#include "terminalrenderer.h"
#include "testhelpers.h"

using StyledText::CompositeStyle;
using StyledText::normalLine;

namespace {

QString render(QList<StyledText::Line> lines, const RenderOptions &options)
{
    StyledText::Text text;
    text.lines = std::move(lines);
    TerminalRenderer renderer;
    return QString::fromUtf8(renderer.render(text, options));
}

QString plain(QList<StyledText::Line> lines)
{
    return render(std::move(lines), RenderOptions::plain());
}

QString colored(QList<StyledText::Line> lines)
{
    return render(std::move(lines), RenderOptions());
}

} // namespace

TEST(TerminalRendererTest, EmptyTextWritesNothing)
{
    EXPECT_TRUE(plain({}).isEmpty());
}

TEST(TerminalRendererTest, PlainParagraphs)
{
    const QString out = plain({
        normalLine(CompositeStyle::paragraph(), {Expect::plain(u"a"), Expect::plain(u"b")}),
        normalLine(CompositeStyle::paragraph()),
        normalLine(CompositeStyle::header(1), {Expect::styled(u"c", true, false, false, false)}),
    });
    EXPECT_EQ(out, QStringLiteral("ab\n\nc\n"));
}

TEST(TerminalRendererTest, HeaderAttributes)
{
    EXPECT_EQ(colored({normalLine(CompositeStyle::header(1), {Expect::plain(u"Top")})}),
              QStringLiteral("\x1b[1;4mTop\x1b[0m\n"));
    EXPECT_EQ(colored({normalLine(CompositeStyle::header(2), {Expect::plain(u"Sub")})}),
              QStringLiteral("\x1b[1mSub\x1b[0m\n"));
}

TEST(TerminalRendererTest, CompoundAttributes)
{
    const QString out = colored({normalLine(CompositeStyle::paragraph(), {
        Expect::plain(u"p"),
        Expect::styled(u"b", true, false, false, false),
        Expect::styled(u"i", false, true, false, false),
        Expect::styled(u"s", false, false, false, true),
        Expect::styled(u"c", false, false, true, false),
        Expect::styled(u"all", true, true, true, true),
    })});
    EXPECT_EQ(out, QStringLiteral("p"
                                  "\x1b[1mb\x1b[0m"
                                  "\x1b[3mi\x1b[0m"
                                  "\x1b[9ms\x1b[0m"
                                  "\x1b[7mc\x1b[0m"
                                  "\x1b[1;3;9;7mall\x1b[0m"
                                  "\n"));
}

TEST(TerminalRendererTest, ListItemsAreIndentedBullets)
{
    const QString out = plain({
        normalLine(CompositeStyle::listItem(0), {Expect::plain(u"x")}),
        normalLine(CompositeStyle::listItem(2), {Expect::plain(u"y")}),
    });
    EXPECT_EQ(out, QStringLiteral("• x\n    • y\n"));
}

TEST(TerminalRendererTest, QuoteAndCode)
{
    EXPECT_EQ(plain({normalLine(CompositeStyle::quote(), {Expect::plain(u"q")})}),
              QStringLiteral("▐ q\n"));
    EXPECT_EQ(colored({normalLine(CompositeStyle::code(), {Expect::plain(u"int a;")})}),
              QStringLiteral("\x1b[2mint a;\x1b[0m\n"));
    EXPECT_EQ(plain({StyledText::CodeFence{{CompositeStyle::code(), {Expect::plain(u"```")}}}}),
              QStringLiteral("```\n"));
}

TEST(TerminalRendererTest, HorizontalRuleSpansTheWidth)
{
    RenderOptions options = RenderOptions::plain();
    options.width = 4;
    EXPECT_EQ(render({StyledText::HorizontalRule{}}, options), QStringLiteral("────\n"));
}

TEST(TerminalRendererTest, TableLines)
{
    StyledText::TableRow row;
    row.cells = {
        StyledText::Composite{CompositeStyle::paragraph(), {Expect::plain(u"a")}},
        StyledText::Composite{CompositeStyle::paragraph(), {Expect::plain(u"b")}},
    };
    StyledText::TableRule rule;
    rule.cells = {StyledText::Alignment::Left, StyledText::Alignment::Right,
                  StyledText::Alignment::Unspecified};

    EXPECT_EQ(plain({row, rule}),
              QStringLiteral("a │ b\n:────┼────:┼─────\n"));
}
