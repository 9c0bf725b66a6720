/*
 * test_textsegmentation.cpp — Splitting raw text values into lines
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include <gtest/gtest.h>

#include "converter.h"
#include "emitter.h"
#include "testhelpers.h"

using StyledText::CompositeStyle;
using StyledText::normalLine;

namespace {

StyledText::Text segmented(const QString &raw, bool bold = false)
{
    Emitter emitter{ConversionOptions()};
    emitter.segment(raw, bold, false, false, false);
    return emitter.finish();
}

} // namespace

TEST(TextSegmentationTest, SingleLine)
{
    const QString raw = QStringLiteral("one line");
    const auto text = segmented(raw);
    ASSERT_EQ(text.lines.size(), 1);
    EXPECT_EQ(text.lines[0], normalLine(CompositeStyle::paragraph(), {Expect::plain(u"one line")}));
}

TEST(TextSegmentationTest, LineFeedSplitsLines)
{
    const QString raw = QStringLiteral("a\nb");
    const auto text = segmented(raw, true);

    ASSERT_EQ(text.lines.size(), 2);
    EXPECT_EQ(text.lines[0], normalLine(CompositeStyle::paragraph(),
                                        {Expect::styled(u"a", true, false, false, false)}));
    EXPECT_EQ(text.lines[1], normalLine(CompositeStyle::paragraph(),
                                        {Expect::styled(u"b", true, false, false, false)}));
}

TEST(TextSegmentationTest, CarriageReturnLineFeed)
{
    const QString raw = QStringLiteral("a\r\nb");
    const auto text = segmented(raw);

    ASSERT_EQ(text.lines.size(), 2);
    EXPECT_EQ(text.lines[0], normalLine(CompositeStyle::paragraph(), {Expect::plain(u"a")}));
    EXPECT_EQ(text.lines[1], normalLine(CompositeStyle::paragraph(), {Expect::plain(u"b")}));
}

TEST(TextSegmentationTest, ConsecutiveBreaksKeepAnEmptyLine)
{
    const QString raw = QStringLiteral("a\n\nb");
    const auto text = segmented(raw);

    ASSERT_EQ(text.lines.size(), 3);
    EXPECT_EQ(text.lines[1], normalLine(CompositeStyle::paragraph()));
    EXPECT_EQ(text.lines[2], normalLine(CompositeStyle::paragraph(), {Expect::plain(u"b")}));
}

TEST(TextSegmentationTest, CompoundsBorrowTheSource)
{
    const QString raw = QStringLiteral("first\nsecond");
    const auto text = segmented(raw);

    ASSERT_EQ(text.lines.size(), 2);
    const auto &second = std::get<StyledText::NormalLine>(text.lines[1]);
    ASSERT_EQ(second.composite.compounds.size(), 1);
    EXPECT_EQ(second.composite.compounds[0].src.data(), raw.constData() + 6);
}

TEST(TextSegmentationTest, BreakKeepsTheBlockStyle)
{
    const MdTree::Node tree = Build::root({Build::heading(3, {Build::text("a\nb")})});
    const Converter::Result result = Converter::toStyledText(tree);
    ASSERT_TRUE(result.valid);

    ASSERT_EQ(result.text.lines.size(), 2);
    EXPECT_EQ(result.text.lines[0], normalLine(CompositeStyle::header(3), {Expect::plain(u"a")}));
    EXPECT_EQ(result.text.lines[1], normalLine(CompositeStyle::header(3), {Expect::plain(u"b")}));
}

TEST(TextSegmentationTest, TextAfterABreakJoinsTheNewLine)
{
    const MdTree::Node tree = Build::root({Build::paragraph({
        Build::text("a\nb"),
        Build::strong({Build::text("c")}),
    })});
    const Converter::Result result = Converter::toStyledText(tree);
    ASSERT_TRUE(result.valid);

    ASSERT_EQ(result.text.lines.size(), 2);
    EXPECT_EQ(result.text.lines[1], normalLine(CompositeStyle::paragraph(), {
        Expect::plain(u"b"),
        Expect::styled(u"c", true, false, false, false),
    }));
}
