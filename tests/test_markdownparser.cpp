/*
 * test_markdownparser.cpp — Shape of the trees built from md4c events
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include <gtest/gtest.h>

#include "markdownparser.h"
#include "nodeclassifier.h"
#include "testhelpers.h"

namespace {

MdTree::Node parse(const char *markdown, ParseOptions options = ParseOptions())
{
    MarkdownParser parser;
    parser.setOptions(options);
    MdTree::Node root = parser.parse(QString::fromUtf8(markdown));
    EXPECT_FALSE(parser.aborted());
    return root;
}

QStringList kinds(const QList<MdTree::Node> &nodes)
{
    QStringList names;
    for (const auto &node : nodes)
        names.append(NodeClassifier::kindName(node));
    return names;
}

const QList<MdTree::Node> &childrenOf(const MdTree::Node &node)
{
    static const QList<MdTree::Node> none;
    const QList<MdTree::Node> *children = MdTree::children(node);
    return children ? *children : none;
}

} // namespace

TEST(MarkdownParserTest, HeadingAndParagraph)
{
    const MdTree::Node root = parse("# Hi\n\nbody\n");
    ASSERT_TRUE(root.is<MdTree::Root>());

    const auto &blocks = childrenOf(root);
    ASSERT_EQ(kinds(blocks), QStringList({QStringLiteral("Heading"), QStringLiteral("Paragraph")}));

    const auto *heading = blocks[0].as<MdTree::Heading>();
    ASSERT_NE(heading, nullptr);
    EXPECT_EQ(heading->depth, 1);
    ASSERT_EQ(heading->children.size(), 1);
    EXPECT_EQ(heading->children[0].as<MdTree::Text>()->value, QStringLiteral("Hi"));

    const auto &body = childrenOf(blocks[1]);
    ASSERT_EQ(body.size(), 1);
    EXPECT_EQ(body[0].as<MdTree::Text>()->value, QStringLiteral("body"));
}

TEST(MarkdownParserTest, BlockPositions)
{
    const MdTree::Node root = parse("# Hi\n\nbody\n");
    const auto &blocks = childrenOf(root);
    ASSERT_EQ(blocks.size(), 2);

    ASSERT_TRUE(blocks[0].position.has_value());
    EXPECT_EQ(blocks[0].position->start.line, 1);
    ASSERT_TRUE(blocks[1].position.has_value());
    EXPECT_EQ(blocks[1].position->start.line, 3);
    EXPECT_EQ(blocks[1].position->start.column, 1);
    EXPECT_EQ(blocks[1].position->start.offset, 6);
}

TEST(MarkdownParserTest, SoftBreakParagraphSpansBothLines)
{
    const MdTree::Node root = parse("first\nsecond\n");
    const auto &blocks = childrenOf(root);
    ASSERT_EQ(blocks.size(), 1);

    ASSERT_TRUE(blocks[0].position.has_value());
    const MdTree::Position &position = *blocks[0].position;
    EXPECT_EQ(position.start.line, 1);
    EXPECT_EQ(position.end.line, 2);
    EXPECT_EQ(position.end.column, 7);
    EXPECT_EQ(position.end.offset, 12);
}

TEST(MarkdownParserTest, FencedCodeEndsOnItsClosingFence)
{
    const MdTree::Node root = parse("intro\n\n```\na\nb\n```\n\nafter\n");
    const auto &blocks = childrenOf(root);
    ASSERT_EQ(kinds(blocks), QStringList({QStringLiteral("Paragraph"), QStringLiteral("Code"),
                                          QStringLiteral("Paragraph")}));

    ASSERT_TRUE(blocks[1].position.has_value());
    EXPECT_EQ(blocks[1].position->start.line, 4);
    EXPECT_EQ(blocks[1].position->end.line, 6);
    EXPECT_EQ(blocks[1].position->end.column, 4);

    ASSERT_TRUE(blocks[2].position.has_value());
    EXPECT_EQ(blocks[2].position->start.line, 8);
}

TEST(MarkdownParserTest, HardBreakKeepsPositionsInTheSource)
{
    const MdTree::Node root = parse("first  \nsecond\n");
    const auto &blocks = childrenOf(root);
    ASSERT_EQ(blocks.size(), 1);
    ASSERT_TRUE(blocks[0].position.has_value());
    EXPECT_EQ(blocks[0].position->start.line, 1);
    EXPECT_EQ(blocks[0].position->end.line, 2);
}

TEST(MarkdownParserTest, InlineSpans)
{
    const MdTree::Node root = parse("*a* **b** `c` ~~d~~\n");
    const auto &blocks = childrenOf(root);
    ASSERT_EQ(blocks.size(), 1);

    const QStringList expected = {
        QStringLiteral("Emphasis"), QStringLiteral("Text"),
        QStringLiteral("Strong"), QStringLiteral("Text"),
        QStringLiteral("InlineCode"), QStringLiteral("Text"),
        QStringLiteral("Delete"),
    };
    const auto &inlines = childrenOf(blocks[0]);
    EXPECT_EQ(kinds(inlines), expected);
    ASSERT_EQ(inlines.size(), expected.size());
    EXPECT_EQ(inlines[4].as<MdTree::InlineCode>()->value, QStringLiteral("c"));
}

TEST(MarkdownParserTest, SoftBreakStaysInTheText)
{
    const MdTree::Node root = parse("first\nsecond\n");
    const auto &inlines = childrenOf(childrenOf(root).at(0));
    ASSERT_EQ(inlines.size(), 1);
    EXPECT_EQ(inlines[0].as<MdTree::Text>()->value, QStringLiteral("first\nsecond"));
}

TEST(MarkdownParserTest, HardBreak)
{
    const MdTree::Node root = parse("first  \nsecond\n");
    const auto &inlines = childrenOf(childrenOf(root).at(0));
    EXPECT_EQ(kinds(inlines), QStringList({QStringLiteral("Text"), QStringLiteral("Break"),
                                           QStringLiteral("Text")}));
}

TEST(MarkdownParserTest, EntitiesAreDecoded)
{
    const MdTree::Node root = parse("fish &amp; chips &#65;\n");
    const auto &inlines = childrenOf(childrenOf(root).at(0));
    ASSERT_EQ(inlines.size(), 1);
    EXPECT_EQ(inlines[0].as<MdTree::Text>()->value, QStringLiteral("fish & chips A"));
}

TEST(MarkdownParserTest, InvalidCodePointsBecomeReplacementCharacters)
{
    const MdTree::Node root = parse("a&#0;b&#xD800;c&#x110000;d\n");
    const auto &inlines = childrenOf(childrenOf(root).at(0));
    ASSERT_EQ(inlines.size(), 1);

    const QChar replacement(QChar::ReplacementCharacter);
    const QString expected = QStringLiteral("a") + replacement + QStringLiteral("b")
        + replacement + QStringLiteral("c") + replacement + QStringLiteral("d");
    EXPECT_EQ(inlines[0].as<MdTree::Text>()->value, expected);
}

TEST(MarkdownParserTest, Link)
{
    const MdTree::Node root = parse("[site](https://example.org \"Title\")\n");
    const auto &inlines = childrenOf(childrenOf(root).at(0));
    ASSERT_EQ(inlines.size(), 1);

    const auto *link = inlines[0].as<MdTree::Link>();
    ASSERT_NE(link, nullptr);
    EXPECT_EQ(link->url, QStringLiteral("https://example.org"));
    EXPECT_EQ(link->title, QStringLiteral("Title"));
    EXPECT_EQ(kinds(link->children), QStringList({QStringLiteral("Text")}));
}

TEST(MarkdownParserTest, ImageAltText)
{
    const MdTree::Node root = parse("![a *cat*](cat.png)\n");
    const auto &inlines = childrenOf(childrenOf(root).at(0));
    ASSERT_EQ(inlines.size(), 1);

    const auto *image = inlines[0].as<MdTree::Image>();
    ASSERT_NE(image, nullptr);
    EXPECT_EQ(image->url, QStringLiteral("cat.png"));
    EXPECT_EQ(image->alt, QStringLiteral("a cat"));
}

TEST(MarkdownParserTest, FencedCode)
{
    const MdTree::Node root = parse("```cpp title=x\nint a;\nint b;\n```\n");
    const auto &blocks = childrenOf(root);
    ASSERT_EQ(blocks.size(), 1);

    const auto *code = blocks[0].as<MdTree::Code>();
    ASSERT_NE(code, nullptr);
    EXPECT_EQ(code->lang, QStringLiteral("cpp"));
    EXPECT_EQ(code->meta, QStringLiteral("title=x"));
    EXPECT_EQ(code->value, QStringLiteral("int a;\nint b;"));
}

TEST(MarkdownParserTest, TightListGetsParagraphs)
{
    const MdTree::Node root = parse("- a\n- b\n");
    const auto &blocks = childrenOf(root);
    ASSERT_EQ(blocks.size(), 1);

    const auto *list = blocks[0].as<MdTree::List>();
    ASSERT_NE(list, nullptr);
    EXPECT_FALSE(list->ordered);
    EXPECT_FALSE(list->spread);
    ASSERT_EQ(kinds(list->children),
              QStringList({QStringLiteral("ListItem"), QStringLiteral("ListItem")}));

    for (const auto &item : list->children)
        EXPECT_EQ(kinds(childrenOf(item)), QStringList({QStringLiteral("Paragraph")}));
}

TEST(MarkdownParserTest, NestedList)
{
    const MdTree::Node root = parse("- a\n  - b\n");
    const auto &item = childrenOf(childrenOf(root).at(0)).at(0);
    EXPECT_EQ(kinds(childrenOf(item)),
              QStringList({QStringLiteral("Paragraph"), QStringLiteral("List")}));
}

TEST(MarkdownParserTest, OrderedListAndTasks)
{
    const MdTree::Node root = parse("3. [x] done\n4. [ ] open\n");
    const auto *list = childrenOf(root).at(0).as<MdTree::List>();
    ASSERT_NE(list, nullptr);
    EXPECT_TRUE(list->ordered);
    EXPECT_EQ(list->start, 3);

    ASSERT_EQ(list->children.size(), 2);
    EXPECT_EQ(list->children[0].as<MdTree::ListItem>()->checked, true);
    EXPECT_EQ(list->children[1].as<MdTree::ListItem>()->checked, false);
}

TEST(MarkdownParserTest, Table)
{
    const char *markdown = "| a | b |\n|:--|--:|\n| 1 | 2 |\n";

    const MdTree::Node root = parse(markdown);
    const auto *table = childrenOf(root).at(0).as<MdTree::Table>();
    ASSERT_NE(table, nullptr);
    EXPECT_EQ(table->align, QList<MdTree::AlignKind>({MdTree::AlignKind::Left,
                                                      MdTree::AlignKind::Right}));
    ASSERT_EQ(kinds(table->children),
              QStringList({QStringLiteral("TableRow"), QStringLiteral("TableRow")}));
    EXPECT_EQ(kinds(childrenOf(table->children[0])),
              QStringList({QStringLiteral("TableCell"), QStringLiteral("TableCell")}));

    ParseOptions commonmark;
    commonmark.github = false;
    const MdTree::Node plain = parse(markdown, commonmark);
    EXPECT_EQ(kinds(childrenOf(plain)), QStringList({QStringLiteral("Paragraph")}));
}

TEST(MarkdownParserTest, OtherBlocks)
{
    const MdTree::Node root = parse("> quoted\n\n---\n\n<div>\nraw\n</div>\n");
    EXPECT_EQ(kinds(childrenOf(root)),
              QStringList({QStringLiteral("Blockquote"), QStringLiteral("ThematicBreak"),
                           QStringLiteral("Html")}));
}

TEST(MarkdownParserTest, Math)
{
    const MdTree::Node root = parse("$x^2$\n");
    const auto &inlines = childrenOf(childrenOf(root).at(0));
    ASSERT_EQ(inlines.size(), 1);
    ASSERT_TRUE(inlines[0].is<MdTree::InlineMath>());
    EXPECT_EQ(inlines[0].as<MdTree::InlineMath>()->value, QStringLiteral("x^2"));
}
