/*
 * markdownparser.h — MD4C → MdTree builder
 *
 * Same callback structure as a streaming MD4C renderer, but instead of
 * rendering, it assembles an mdast-shaped tree: every enter callback opens
 * a node, every leave callback closes it into its parent.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef TERMMARK_MARKDOWNPARSER_H
#define TERMMARK_MARKDOWNPARSER_H

#include <QList>
#include <QObject>
#include <QStack>
#include <QString>

#include <md4c.h>

#include <optional>

#include "mdtree.h"

struct ParseOptions {
    bool github = true;     // tables, strikethrough, task lists, permissive autolinks
    bool latexMath = true;  // $inline$ and $$display$$ math spans
};

class MarkdownParser : public QObject {
    Q_OBJECT
public:
    explicit MarkdownParser(QObject *parent = nullptr);

    // Parse markdown into a Root node. Well-formed input never fails; if MD4C
    // aborts, the tree built so far is returned and aborted() is true.
    MdTree::Node parse(const QString &markdownText);
    bool aborted() const { return m_aborted; }

    void setOptions(const ParseOptions &options);
    ParseOptions options() const { return m_options; }

private:
    // MD4C static callbacks
    static int sEnterBlock(MD_BLOCKTYPE type, void *detail, void *userdata);
    static int sLeaveBlock(MD_BLOCKTYPE type, void *detail, void *userdata);
    static int sEnterSpan(MD_SPANTYPE type, void *detail, void *userdata);
    static int sLeaveSpan(MD_SPANTYPE type, void *detail, void *userdata);
    static int sText(MD_TEXTTYPE type, const MD_CHAR *text, MD_SIZE size,
                     void *userdata);

    // Instance handlers
    int enterBlock(MD_BLOCKTYPE type, void *detail);
    int leaveBlock(MD_BLOCKTYPE type, void *detail);
    int enterSpan(MD_SPANTYPE type, void *detail);
    int leaveSpan(MD_SPANTYPE type, void *detail);
    int onText(MD_TEXTTYPE type, const MD_CHAR *text, MD_SIZE size);

    // Tree assembly
    void openNode(MdTree::Node node, bool implicit = false);
    void closeNode();
    void closeImplicitParagraph();
    void appendLeaf(MdTree::Node node);
    void appendText(const QString &text);
    void ensureInlineContainer();

    // Helpers
    static QString extractAttribute(const MD_ATTRIBUTE &attr);
    static QString resolveEntity(const QString &entity);

    // Source position tracking
    MdTree::Point offsetToPoint(int offset) const;
    struct BlockTracker {
        int firstByteOffset = -1;
        int lastByteEnd = -1;  // exclusive: offset + size
    };
    std::optional<MdTree::Position> trackedPosition(const BlockTracker &tracker) const;
    // Offset of text inside the source buffer, or -1 if md4c passed its own string
    int sourceOffset(const MD_CHAR *text, MD_SIZE size) const;
    void extendToNextLine(BlockTracker &tracker) const;
    QList<int> m_lineStartOffsets; // byte offset where each line starts
    const char *m_bufferStart = nullptr;
    int m_bufferSize = 0;

    // Open nodes, innermost last. The bottom entry is the Root.
    struct OpenNode {
        MdTree::Node node;
        BlockTracker tracker;
        bool implicit = false;  // paragraph MD4C omitted in a tight list item
    };
    QStack<OpenNode> m_open;

    // Spans that opened a node, so leaveSpan knows whether to close one
    QStack<bool> m_spanOpened;

    ParseOptions m_options;
    bool m_aborted = false;
};

#endif // TERMMARK_MARKDOWNPARSER_H
