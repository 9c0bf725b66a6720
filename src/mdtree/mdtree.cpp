/*
 * mdtree.cpp — Debug dump of the markdown syntax tree
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "mdtree.h"
#include "nodeclassifier.h"

#include <QDebug>

namespace MdTree {

#ifndef QT_NO_DEBUG_STREAM

static const char *alignName(AlignKind align)
{
    switch (align) {
    case AlignKind::Left: return "left";
    case AlignKind::Center: return "center";
    case AlignKind::Right: return "right";
    case AlignKind::None: break;
    }
    return "none";
}

static void dumpNode(QDebug &dbg, const Node &node, int depth)
{
    dbg << QByteArray(depth * 2, ' ').constData() << NodeClassifier::kindName(node);

    // Salient kind-specific fields
    std::visit([&dbg](const auto &n) {
        using T = std::decay_t<decltype(n)>;
        if constexpr (std::is_same_v<T, Heading>) {
            dbg << " depth=" << n.depth;
        } else if constexpr (std::is_same_v<T, List>) {
            dbg << " ordered=" << n.ordered << " spread=" << n.spread;
            if (n.start)
                dbg << " start=" << *n.start;
        } else if constexpr (std::is_same_v<T, ListItem>) {
            dbg << " spread=" << n.spread;
            if (n.checked)
                dbg << " checked=" << *n.checked;
        } else if constexpr (std::is_same_v<T, Code>) {
            if (!n.lang.isEmpty())
                dbg << " lang=" << n.lang;
            if (!n.meta.isEmpty())
                dbg << " meta=" << n.meta;
            dbg << ' ' << n.value;
        } else if constexpr (std::is_same_v<T, Link>) {
            dbg << " url=" << n.url;
            if (!n.title.isEmpty())
                dbg << " title=" << n.title;
        } else if constexpr (std::is_same_v<T, Image>) {
            dbg << " url=" << n.url << " alt=" << n.alt;
        } else if constexpr (std::is_same_v<T, Table>) {
            dbg << " align=[";
            for (int i = 0; i < n.align.size(); ++i)
                dbg << (i ? "," : "") << alignName(n.align[i]);
            dbg << ']';
        } else if constexpr (std::is_same_v<T, Text> || std::is_same_v<T, InlineCode>
                             || std::is_same_v<T, InlineMath> || std::is_same_v<T, Math>
                             || std::is_same_v<T, Html> || std::is_same_v<T, Yaml>
                             || std::is_same_v<T, Toml>) {
            dbg << ' ' << n.value;
        } else if constexpr (std::is_same_v<T, FootnoteReference>
                             || std::is_same_v<T, Definition>) {
            dbg << " identifier=" << n.identifier;
        }
    }, node.data);

    if (node.position) {
        const Position &p = *node.position;
        dbg << " (" << p.start.line << ':' << p.start.column << '-'
            << p.end.line << ':' << p.end.column << ')';
    }
    dbg << '\n';

    if (const auto *kids = children(node)) {
        for (const auto &child : *kids)
            dumpNode(dbg, child, depth + 1);
    }
}

QDebug operator<<(QDebug dbg, const Node &node)
{
    QDebugStateSaver saver(dbg);
    dbg.nospace();
    dumpNode(dbg, node, 0);
    return dbg;
}

#endif // QT_NO_DEBUG_STREAM

} // namespace MdTree
