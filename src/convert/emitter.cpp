/*
 * emitter.cpp — MdTree → StyledText::Text emitter
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "emitter.h"
#include "nodeclassifier.h"

#include <limits>
#include <utility>

using StyledText::CompositeStyle;

// Prefix simulating the indentation of blocks nested in a list item
static constexpr QStringView kNestedIndent = u"  ";

Emitter::Emitter(const ConversionOptions &options)
    : m_options(options)
{
}

// --- Dispatch ---

bool Emitter::node(const MdTree::Node &node, InlineStyle style)
{
    bool ok = true;

    if (const auto *root = node.as<MdTree::Root>()) {
        ok = emitChildren(root->children, style);
    } else if (const auto *h = node.as<MdTree::Heading>()) {
        ok = heading(*h, style);
    } else if (const auto *p = node.as<MdTree::Paragraph>()) {
        ok = paragraph(*p, style);
    } else if (const auto *c = node.as<MdTree::Code>()) {
        ok = code(*c);
    } else if (const auto *text = node.as<MdTree::Text>()) {
        segment(text->value, style.bold, style.italic, false, style.strikeout);
    } else if (const auto *inlineCode = node.as<MdTree::InlineCode>()) {
        segment(inlineCode->value, style.bold, style.italic, true, style.strikeout);
    } else if (const auto *strong = node.as<MdTree::Strong>()) {
        ok = emitChildren(strong->children, style.withBold());
    } else if (const auto *emphasis = node.as<MdTree::Emphasis>()) {
        ok = emitChildren(emphasis->children, style.withItalic());
    } else if (const auto *del = node.as<MdTree::Delete>()) {
        ok = emitChildren(del->children, style.withStrikeout());
    } else if (const auto *l = node.as<MdTree::Link>()) {
        ok = link(*l, style);
    } else if (const auto *ls = node.as<MdTree::List>()) {
        ok = list(*ls);
    } else if (node.is<MdTree::ListItem>()) {
        // Items are only reachable through their List
        return fail(ConversionError::unsupportedChildNode(NodeClassifier::kindName(node)));
    } else {
        return fail(ConversionError::unsupportedNode(NodeClassifier::kindName(node)));
    }

    if (!ok)
        m_error = ConversionError::whileEmitting(NodeClassifier::kindName(node), m_error);
    return ok;
}

bool Emitter::emitChildren(const QList<MdTree::Node> &children, InlineStyle style)
{
    for (const auto &child : children) {
        if (!node(child, style))
            return false;
    }
    return true;
}

bool Emitter::fail(const ConversionError &error)
{
    m_error = error;
    return false;
}

// --- Content model ---

template<typename Body>
bool Emitter::inPhrasing(CompositeStyle style, bool spacing, Body body)
{
    ContentModel old = std::exchange(m_model, ContentModel(Flow{}));

    // Only reachable on malformed trees: a block opened while a line is
    // still being accumulated. Keep what was accumulated.
    if (auto *pending = std::get_if<Phrasing>(&old)) {
        if (!pending->compounds.isEmpty())
            flush(std::move(*pending));
        old = Flow{};
    }

    if (std::get<Flow>(old).spacing)
        m_lines.append(StyledText::normalLine(CompositeStyle::paragraph()));

    m_model = Phrasing{style, {}};
    const bool ok = body();

    ContentModel inner = std::exchange(m_model, ContentModel(Flow{spacing}));
    if (auto *phrasing = std::get_if<Phrasing>(&inner)) {
        if (!phrasing->compounds.isEmpty())
            flush(std::move(*phrasing));
    }
    return ok;
}

Emitter::Phrasing &Emitter::currentPhrasing()
{
    // Text outside of any block opens an implicit paragraph
    if (!std::holds_alternative<Phrasing>(m_model))
        m_model = Phrasing{CompositeStyle::paragraph(), {}};
    return std::get<Phrasing>(m_model);
}

void Emitter::flush(Phrasing &&phrasing)
{
    m_lines.append(StyledText::NormalLine{
        StyledText::Composite{phrasing.style, std::move(phrasing.compounds)}});
}

void Emitter::breakLine()
{
    Phrasing &phrasing = currentPhrasing();
    const CompositeStyle style = phrasing.style;
    flush(std::move(phrasing));
    m_model = Phrasing{style, {}};
}

// --- Text segmentation ---

void Emitter::segment(QStringView raw, bool bold, bool italic, bool code, bool strikeout)
{
    qsizetype start = 0;
    for (;;) {
        const qsizetype newline = raw.indexOf(u'\n', start);
        qsizetype end = newline < 0 ? raw.size() : newline;
        if (newline >= 0 && end > start && raw.at(end - 1) == u'\r')
            --end;

        // Empty fragments add no compound, but their line is still emitted
        const QStringView fragment = raw.sliced(start, end - start);
        Phrasing &phrasing = currentPhrasing();
        if (!fragment.isEmpty())
            phrasing.compounds.append(StyledText::Compound{fragment, bold, italic, code, strikeout});

        if (newline < 0)
            break;
        breakLine();
        start = newline + 1;
    }
}

// --- Block handlers ---

bool Emitter::heading(const MdTree::Heading &heading, InlineStyle style)
{
    const int depth = qBound(1, heading.depth, 6);
    return inPhrasing(CompositeStyle::header(depth), m_options.spacingAfterHeader(depth),
                      [&] { return emitChildren(heading.children, style); });
}

bool Emitter::paragraph(const MdTree::Paragraph &paragraph, InlineStyle style)
{
    return inPhrasing(CompositeStyle::paragraph(), true,
                      [&] { return emitChildren(paragraph.children, style); });
}

bool Emitter::code(const MdTree::Code &code)
{
    // Code is verbatim: surrounding emphasis does not apply
    return inPhrasing(CompositeStyle::code(), true, [&] {
        segment(code.value, false, false, false, false);
        return true;
    });
}

// --- Inline handlers ---

bool Emitter::link(const MdTree::Link &link, InlineStyle style)
{
    const ConversionOptions::LinksStyle &forced = m_options.linksStyle;
    InlineStyle linkStyle;
    linkStyle.bold = forced.bold.value_or(style.bold);
    linkStyle.italic = forced.italic.value_or(style.italic);
    linkStyle.strikeout = forced.strikeout.value_or(style.strikeout);
    return emitChildren(link.children, linkStyle);
}

// --- Lists ---

bool Emitter::list(const MdTree::List &list)
{
    if (list.ordered)
        return fail(ConversionError::unsupportedNumberedLists());

    return inPhrasing(CompositeStyle::paragraph(), true, [&] {
        for (const auto &child : list.children) {
            const auto *item = child.as<MdTree::ListItem>();
            if (!item) {
                return fail(ConversionError::unsupportedChildNode(
                    NodeClassifier::kindName(child), QStringLiteral("List")));
            }
            QList<StyledText::Line> itemLines;
            if (!listItem(*item, &itemLines)) {
                m_error = ConversionError::whileEmitting(QStringLiteral("ListItem"), m_error);
                return false;
            }
            m_lines.append(std::move(itemLines));
        }
        return true;
    });
}

bool Emitter::listItem(const MdTree::ListItem &item, QList<StyledText::Line> *lines)
{
    // Convert the item on its own, then indent the result as a whole
    Emitter sub(m_options);
    if (!sub.emitChildren(item.children, InlineStyle()))
        return fail(sub.error());
    *lines = sub.finish().lines;

    // The first paragraph becomes the bullet line; any other start gets an
    // empty bullet so every item has one.
    auto *first = lines->isEmpty() ? nullptr : std::get_if<StyledText::NormalLine>(&lines->first());
    if (first && first->composite.style.kind == CompositeStyle::Paragraph)
        first->composite.style = CompositeStyle::listItem(0);
    else
        lines->prepend(StyledText::normalLine(CompositeStyle::listItem(0)));

    for (qsizetype i = 1; i < lines->size(); ++i) {
        StyledText::Line &line = (*lines)[i];
        if (auto *normal = std::get_if<StyledText::NormalLine>(&line)) {
            StyledText::Composite &composite = normal->composite;
            if (composite.style.kind == CompositeStyle::ListItem) {
                const quint8 indent = composite.style.indent();
                if (indent == std::numeric_limits<quint8>::max())
                    return fail(ConversionError::listTooMuchNested());
                composite.style = CompositeStyle::listItem(static_cast<quint8>(indent + 1));
            } else {
                composite.compounds.prepend(StyledText::Compound{kNestedIndent});
            }
        } else if (!std::holds_alternative<StyledText::HorizontalRule>(line)) {
            return fail(ConversionError::unsupportedNestedLine(StyledText::lineKindName(line)));
        }
    }
    return true;
}

// --- Completion ---

StyledText::Text Emitter::finish()
{
    ContentModel last = std::exchange(m_model, ContentModel(Flow{}));
    if (auto *phrasing = std::get_if<Phrasing>(&last)) {
        if (!phrasing->compounds.isEmpty())
            flush(std::move(*phrasing));
    }

    StyledText::Text text;
    text.lines = std::exchange(m_lines, {});
    return text;
}
