/*
 * conversionerror.h — Chained error reported by the styled text conversion
 *
 * A leaf error (unsupported node, numbered list...) is wrapped in one
 * WhileEmitting frame per node handler it propagates through, so the
 * outermost error names the root and the innermost one the offending node.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef TERMMARK_CONVERSIONERROR_H
#define TERMMARK_CONVERSIONERROR_H

#include <QSharedPointer>
#include <QString>
#include <QStringList>

class ConversionError
{
public:
    enum Kind {
        NoError,
        UnsupportedNode,          // node kind has no styled text counterpart
        UnsupportedChildNode,     // node kind is valid, but not where it was found
        UnsupportedNumberedLists,
        ListTooMuchNested,        // list item indent would exceed 255
        UnsupportedNestedLine,    // a list item produced a line that cannot be indented
        WhileEmitting             // context frame, see cause()
    };

    ConversionError() = default;

    static ConversionError unsupportedNode(const QString &nodeKind);
    static ConversionError unsupportedChildNode(const QString &nodeKind,
                                                const QString &parentKind = QString());
    static ConversionError unsupportedNumberedLists();
    static ConversionError listTooMuchNested();
    static ConversionError unsupportedNestedLine(const QString &lineKind);
    static ConversionError whileEmitting(const QString &nodeKind, const ConversionError &cause);

    bool isError() const { return m_kind != NoError; }
    Kind kind() const { return m_kind; }

    // Node kind this error is about. For WhileEmitting, the ancestor being
    // emitted; for UnsupportedNestedLine, the line kind.
    QString nodeKind() const { return m_nodeKind; }
    // Parent named by UnsupportedChildNode, empty when unknown.
    QString parentKind() const { return m_parentKind; }

    // Wrapped error of a WhileEmitting frame, nullptr otherwise.
    const ConversionError *cause() const { return m_cause.data(); }
    // The leaf error, found by following cause() to the end.
    const ConversionError &rootCause() const;
    // Number of WhileEmitting frames above the leaf.
    int contextDepth() const;

    // Message of this level only.
    QString message() const;
    // One message per level, outermost context first.
    QStringList chain() const;
    // One message per level, leaf cause first.
    QStringList causeChain() const;
    // chain() joined with newlines.
    QString toString() const;

private:
    Kind m_kind = NoError;
    QString m_nodeKind;
    QString m_parentKind;
    QSharedPointer<const ConversionError> m_cause;
};

#endif // TERMMARK_CONVERSIONERROR_H
