/*
 * styledtext.h — Line-oriented styled text model
 *
 * The target side of the conversion: a flat list of lines, each one a
 * styled block of inline compounds or a structural marker. Compounds
 * borrow their text, so a StyledText::Text must not outlive the strings
 * it was built from.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef TERMMARK_STYLEDTEXT_H
#define TERMMARK_STYLEDTEXT_H

#include <QList>
#include <QString>
#include <QStringView>
#include <QtGlobal>

#include <variant>

class QDebug;

namespace StyledText {

// --- Inline runs ---

struct Compound {
    QStringView src;
    bool bold = false;
    bool italic = false;
    bool code = false;
    bool strikeout = false;
};

inline bool operator==(const Compound &a, const Compound &b)
{
    return a.src == b.src && a.bold == b.bold && a.italic == b.italic
        && a.code == b.code && a.strikeout == b.strikeout;
}
inline bool operator!=(const Compound &a, const Compound &b) { return !(a == b); }

// --- Block styles ---

struct CompositeStyle {
    enum Kind { Paragraph, Header, ListItem, Code, Quote };

    Kind kind = Paragraph;
    // Header: depth 1-6. ListItem: indent level 0-255. Unused otherwise.
    int level = 0;

    static CompositeStyle paragraph() { return {Paragraph, 0}; }
    static CompositeStyle header(int depth) { return {Header, depth}; }
    static CompositeStyle listItem(quint8 indent) { return {ListItem, indent}; }
    static CompositeStyle code() { return {Code, 0}; }
    static CompositeStyle quote() { return {Quote, 0}; }

    bool isListItem() const { return kind == ListItem; }
    quint8 indent() const { return kind == ListItem ? static_cast<quint8>(level) : 0; }
};

inline bool operator==(const CompositeStyle &a, const CompositeStyle &b)
{
    return a.kind == b.kind && a.level == b.level;
}
inline bool operator!=(const CompositeStyle &a, const CompositeStyle &b) { return !(a == b); }

struct Composite {
    CompositeStyle style;
    QList<Compound> compounds;
};

inline bool operator==(const Composite &a, const Composite &b)
{
    return a.style == b.style && a.compounds == b.compounds;
}
inline bool operator!=(const Composite &a, const Composite &b) { return !(a == b); }

// --- Lines ---

struct NormalLine {
    Composite composite;
};

struct CodeFence {
    Composite composite;
};

struct HorizontalRule {};

struct TableRow {
    QList<Composite> cells;
};

enum class Alignment { Unspecified, Left, Center, Right };

struct TableRule {
    QList<Alignment> cells;
};

inline bool operator==(const NormalLine &a, const NormalLine &b) { return a.composite == b.composite; }
inline bool operator==(const CodeFence &a, const CodeFence &b) { return a.composite == b.composite; }
inline bool operator==(const HorizontalRule &, const HorizontalRule &) { return true; }
inline bool operator==(const TableRow &a, const TableRow &b) { return a.cells == b.cells; }
inline bool operator==(const TableRule &a, const TableRule &b) { return a.cells == b.cells; }

using Line = std::variant<
    NormalLine,
    CodeFence,
    HorizontalRule,
    TableRow,
    TableRule
>;

// --- Document ---

struct Text {
    QList<Line> lines;
};

inline bool operator==(const Text &a, const Text &b) { return a.lines == b.lines; }
inline bool operator!=(const Text &a, const Text &b) { return !(a == b); }

// Convenience for the common Normal(composite) line.
inline Line normalLine(CompositeStyle style, QList<Compound> compounds = {})
{
    return NormalLine{Composite{style, std::move(compounds)}};
}

// Kind of a line, as used in diagnostics ("Normal", "TableRow"...).
QString lineKindName(const Line &line);

#ifndef QT_NO_DEBUG_STREAM
QDebug operator<<(QDebug dbg, const Compound &compound);
QDebug operator<<(QDebug dbg, const CompositeStyle &style);
QDebug operator<<(QDebug dbg, const Composite &composite);
QDebug operator<<(QDebug dbg, const Line &line);
QDebug operator<<(QDebug dbg, const Text &text);
#endif

} // namespace StyledText

#endif // TERMMARK_STYLEDTEXT_H
