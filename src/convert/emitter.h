/*
 * emitter.h — MdTree → StyledText::Text emitter
 *
 * Walks the markdown tree depth-first. Two pieces of state drive the
 * output: the content model (between blocks, or accumulating the
 * compounds of one line) and the inline style handed down the recursion.
 * An Emitter converts one tree and is then consumed by finish().
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef TERMMARK_EMITTER_H
#define TERMMARK_EMITTER_H

#include <QList>
#include <QStringView>

#include <variant>

#include "conversionerror.h"
#include "conversionoptions.h"
#include "mdtree.h"
#include "styledtext.h"

// Emphasis active for the text being emitted
struct InlineStyle {
    bool bold = false;
    bool italic = false;
    bool strikeout = false;

    InlineStyle withBold() const { InlineStyle s = *this; s.bold = true; return s; }
    InlineStyle withItalic() const { InlineStyle s = *this; s.italic = true; return s; }
    InlineStyle withStrikeout() const { InlineStyle s = *this; s.strikeout = true; return s; }
};

class Emitter
{
public:
    explicit Emitter(const ConversionOptions &options);

    // Emit a node and its subtree. Returns false on failure; error() then
    // holds the cause, wrapped once per node handler it went through.
    bool node(const MdTree::Node &node, InlineStyle style);
    bool emitChildren(const QList<MdTree::Node> &children, InlineStyle style);

    // Append the compounds of a raw string, one line per line break.
    void segment(QStringView raw, bool bold, bool italic, bool code, bool strikeout);

    const ConversionError &error() const { return m_error; }

    // Flush pending compounds and hand over the lines. The emitter is
    // empty afterwards.
    StyledText::Text finish();

private:
    // Content models
    struct Flow {
        bool spacing = false;  // blank line before the next block
    };
    struct Phrasing {
        StyledText::CompositeStyle style;
        QList<StyledText::Compound> compounds;
    };
    using ContentModel = std::variant<Flow, Phrasing>;

    // Node handlers
    bool heading(const MdTree::Heading &heading, InlineStyle style);
    bool paragraph(const MdTree::Paragraph &paragraph, InlineStyle style);
    bool code(const MdTree::Code &code);
    bool link(const MdTree::Link &link, InlineStyle style);
    bool list(const MdTree::List &list);
    bool listItem(const MdTree::ListItem &item, QList<StyledText::Line> *lines);

    // Run body with a fresh Phrasing model of the given style. The previous
    // model is restored with its spacing set to `spacing`, and leftover
    // compounds are flushed, whatever body returns.
    template<typename Body>
    bool inPhrasing(StyledText::CompositeStyle style, bool spacing, Body body);

    Phrasing &currentPhrasing();
    void flush(Phrasing &&phrasing);
    void breakLine();

    bool fail(const ConversionError &error);

    QList<StyledText::Line> m_lines;
    ContentModel m_model = Flow{};
    ConversionOptions m_options;
    ConversionError m_error;
};

#endif // TERMMARK_EMITTER_H
