/*
 * conversionerror.cpp — Chained error reported by the styled text conversion
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "conversionerror.h"

#include <algorithm>

ConversionError ConversionError::unsupportedNode(const QString &nodeKind)
{
    ConversionError e;
    e.m_kind = UnsupportedNode;
    e.m_nodeKind = nodeKind;
    return e;
}

ConversionError ConversionError::unsupportedChildNode(const QString &nodeKind,
                                                      const QString &parentKind)
{
    ConversionError e;
    e.m_kind = UnsupportedChildNode;
    e.m_nodeKind = nodeKind;
    e.m_parentKind = parentKind;
    return e;
}

ConversionError ConversionError::unsupportedNumberedLists()
{
    ConversionError e;
    e.m_kind = UnsupportedNumberedLists;
    e.m_nodeKind = QStringLiteral("List");
    return e;
}

ConversionError ConversionError::listTooMuchNested()
{
    ConversionError e;
    e.m_kind = ListTooMuchNested;
    e.m_nodeKind = QStringLiteral("List");
    return e;
}

ConversionError ConversionError::unsupportedNestedLine(const QString &lineKind)
{
    ConversionError e;
    e.m_kind = UnsupportedNestedLine;
    e.m_nodeKind = lineKind;
    return e;
}

ConversionError ConversionError::whileEmitting(const QString &nodeKind,
                                               const ConversionError &cause)
{
    ConversionError e;
    e.m_kind = WhileEmitting;
    e.m_nodeKind = nodeKind;
    e.m_cause = QSharedPointer<const ConversionError>::create(cause);
    return e;
}

const ConversionError &ConversionError::rootCause() const
{
    const ConversionError *e = this;
    while (e->m_cause)
        e = e->m_cause.data();
    return *e;
}

int ConversionError::contextDepth() const
{
    int depth = 0;
    for (const ConversionError *e = this; e->m_cause; e = e->m_cause.data())
        ++depth;
    return depth;
}

QString ConversionError::message() const
{
    switch (m_kind) {
    case NoError:
        return QStringLiteral("No error");
    case UnsupportedNode:
        return QStringLiteral("`%1` node is not supported").arg(m_nodeKind);
    case UnsupportedChildNode:
        if (m_parentKind.isEmpty())
            return QStringLiteral("`%1` node is not supported in this position").arg(m_nodeKind);
        return QStringLiteral("`%1` node is not supported as a child of `%2`")
            .arg(m_nodeKind, m_parentKind);
    case UnsupportedNumberedLists:
        return QStringLiteral("Numbered lists are not supported");
    case ListTooMuchNested:
        return QStringLiteral("Lists are nested too deeply (the maximum is 255 levels)");
    case UnsupportedNestedLine:
        return QStringLiteral("`%1` lines cannot be indented inside a list item").arg(m_nodeKind);
    case WhileEmitting:
        return QStringLiteral("While emitting `%1`").arg(m_nodeKind);
    }
    return QString();
}

QStringList ConversionError::chain() const
{
    QStringList messages;
    for (const ConversionError *e = this; e; e = e->m_cause.data())
        messages.append(e->message());
    return messages;
}

QStringList ConversionError::causeChain() const
{
    QStringList messages = chain();
    std::reverse(messages.begin(), messages.end());
    return messages;
}

QString ConversionError::toString() const
{
    return chain().join(QLatin1Char('\n'));
}
