/*
 * styledtext.cpp — Diagnostics for the styled text model
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "styledtext.h"

#include <QDebug>

namespace StyledText {

QString lineKindName(const Line &line)
{
    return std::visit([](const auto &l) -> QString {
        using T = std::decay_t<decltype(l)>;
        if constexpr (std::is_same_v<T, NormalLine>)
            return QStringLiteral("Normal");
        else if constexpr (std::is_same_v<T, CodeFence>)
            return QStringLiteral("CodeFence");
        else if constexpr (std::is_same_v<T, HorizontalRule>)
            return QStringLiteral("HorizontalRule");
        else if constexpr (std::is_same_v<T, TableRow>)
            return QStringLiteral("TableRow");
        else
            return QStringLiteral("TableRule");
    }, line);
}

#ifndef QT_NO_DEBUG_STREAM

QDebug operator<<(QDebug dbg, const Compound &compound)
{
    QDebugStateSaver saver(dbg);
    dbg.nospace() << compound.src;
    if (compound.bold) dbg << " bold";
    if (compound.italic) dbg << " italic";
    if (compound.code) dbg << " code";
    if (compound.strikeout) dbg << " strikeout";
    return dbg;
}

QDebug operator<<(QDebug dbg, const CompositeStyle &style)
{
    QDebugStateSaver saver(dbg);
    dbg.nospace();
    switch (style.kind) {
    case CompositeStyle::Paragraph:
        dbg << "Paragraph";
        break;
    case CompositeStyle::Header:
        dbg << "Header(" << style.level << ')';
        break;
    case CompositeStyle::ListItem:
        dbg << "ListItem(" << style.level << ')';
        break;
    case CompositeStyle::Code:
        dbg << "Code";
        break;
    case CompositeStyle::Quote:
        dbg << "Quote";
        break;
    }
    return dbg;
}

QDebug operator<<(QDebug dbg, const Composite &composite)
{
    QDebugStateSaver saver(dbg);
    dbg.nospace() << composite.style << " [";
    for (int i = 0; i < composite.compounds.size(); ++i) {
        if (i > 0)
            dbg << ", ";
        dbg << composite.compounds[i];
    }
    dbg << ']';
    return dbg;
}

QDebug operator<<(QDebug dbg, const Line &line)
{
    QDebugStateSaver saver(dbg);
    dbg.nospace();
    std::visit([&dbg](const auto &l) {
        using T = std::decay_t<decltype(l)>;
        if constexpr (std::is_same_v<T, NormalLine>) {
            dbg << "Normal " << l.composite;
        } else if constexpr (std::is_same_v<T, CodeFence>) {
            dbg << "CodeFence " << l.composite;
        } else if constexpr (std::is_same_v<T, HorizontalRule>) {
            dbg << "HorizontalRule";
        } else if constexpr (std::is_same_v<T, TableRow>) {
            dbg << "TableRow {";
            for (const auto &cell : l.cells)
                dbg << ' ' << cell;
            dbg << " }";
        } else {
            dbg << "TableRule " << l.cells.size() << " cells";
        }
    }, line);
    return dbg;
}

QDebug operator<<(QDebug dbg, const Text &text)
{
    QDebugStateSaver saver(dbg);
    dbg.nospace() << "Text [\n";
    for (const auto &line : text.lines)
        dbg << "    " << line << '\n';
    dbg << ']';
    return dbg;
}

#endif // QT_NO_DEBUG_STREAM

} // namespace StyledText
