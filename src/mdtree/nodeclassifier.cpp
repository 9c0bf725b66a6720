/*
 * nodeclassifier.cpp — Stable symbolic names for MdTree node kinds
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "nodeclassifier.h"

#include <type_traits>

namespace NodeClassifier {

namespace {
template<typename>
inline constexpr bool kAlwaysFalse = false;
}

QString kindName(const MdTree::Node &node)
{
    return std::visit([](const auto &n) -> QString {
        using T = std::decay_t<decltype(n)>;
        if constexpr (std::is_same_v<T, MdTree::Root>)
            return QStringLiteral("Root");
        else if constexpr (std::is_same_v<T, MdTree::Blockquote>)
            return QStringLiteral("Blockquote");
        else if constexpr (std::is_same_v<T, MdTree::FootnoteDefinition>)
            return QStringLiteral("FootnoteDefinition");
        else if constexpr (std::is_same_v<T, MdTree::MdxJsxFlowElement>)
            return QStringLiteral("MdxJsxFlowElement");
        else if constexpr (std::is_same_v<T, MdTree::List>)
            return QStringLiteral("List");
        else if constexpr (std::is_same_v<T, MdTree::MdxjsEsm>)
            return QStringLiteral("MdxjsEsm");
        else if constexpr (std::is_same_v<T, MdTree::Toml>)
            return QStringLiteral("Toml");
        else if constexpr (std::is_same_v<T, MdTree::Yaml>)
            return QStringLiteral("Yaml");
        else if constexpr (std::is_same_v<T, MdTree::Break>)
            return QStringLiteral("Break");
        else if constexpr (std::is_same_v<T, MdTree::InlineCode>)
            return QStringLiteral("InlineCode");
        else if constexpr (std::is_same_v<T, MdTree::InlineMath>)
            return QStringLiteral("InlineMath");
        else if constexpr (std::is_same_v<T, MdTree::Delete>)
            return QStringLiteral("Delete");
        else if constexpr (std::is_same_v<T, MdTree::Emphasis>)
            return QStringLiteral("Emphasis");
        else if constexpr (std::is_same_v<T, MdTree::MdxTextExpression>)
            return QStringLiteral("MdxTextExpression");
        else if constexpr (std::is_same_v<T, MdTree::FootnoteReference>)
            return QStringLiteral("FootnoteReference");
        else if constexpr (std::is_same_v<T, MdTree::Html>)
            return QStringLiteral("Html");
        else if constexpr (std::is_same_v<T, MdTree::Image>)
            return QStringLiteral("Image");
        else if constexpr (std::is_same_v<T, MdTree::ImageReference>)
            return QStringLiteral("ImageReference");
        else if constexpr (std::is_same_v<T, MdTree::MdxJsxTextElement>)
            return QStringLiteral("MdxJsxTextElement");
        else if constexpr (std::is_same_v<T, MdTree::Link>)
            return QStringLiteral("Link");
        else if constexpr (std::is_same_v<T, MdTree::LinkReference>)
            return QStringLiteral("LinkReference");
        else if constexpr (std::is_same_v<T, MdTree::Strong>)
            return QStringLiteral("Strong");
        else if constexpr (std::is_same_v<T, MdTree::Text>)
            return QStringLiteral("Text");
        else if constexpr (std::is_same_v<T, MdTree::Code>)
            return QStringLiteral("Code");
        else if constexpr (std::is_same_v<T, MdTree::Math>)
            return QStringLiteral("Math");
        else if constexpr (std::is_same_v<T, MdTree::MdxFlowExpression>)
            return QStringLiteral("MdxFlowExpression");
        else if constexpr (std::is_same_v<T, MdTree::Heading>)
            return QStringLiteral("Heading");
        else if constexpr (std::is_same_v<T, MdTree::Table>)
            return QStringLiteral("Table");
        else if constexpr (std::is_same_v<T, MdTree::ThematicBreak>)
            return QStringLiteral("ThematicBreak");
        else if constexpr (std::is_same_v<T, MdTree::TableRow>)
            return QStringLiteral("TableRow");
        else if constexpr (std::is_same_v<T, MdTree::TableCell>)
            return QStringLiteral("TableCell");
        else if constexpr (std::is_same_v<T, MdTree::ListItem>)
            return QStringLiteral("ListItem");
        else if constexpr (std::is_same_v<T, MdTree::Definition>)
            return QStringLiteral("Definition");
        else if constexpr (std::is_same_v<T, MdTree::Paragraph>)
            return QStringLiteral("Paragraph");
        else
            static_assert(kAlwaysFalse<T>, "node kind without a name");
    }, node.data);
}

} // namespace NodeClassifier
