/*
 * markdownparser.cpp — MD4C → MdTree builder
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "markdownparser.h"

#include <algorithm>

#include <QByteArray>
#include <QDebug>
#include <QHash>

MarkdownParser::MarkdownParser(QObject *parent)
    : QObject(parent)
{
}

void MarkdownParser::setOptions(const ParseOptions &options) { m_options = options; }

// --- Build entry point ---

MdTree::Node MarkdownParser::parse(const QString &markdownText)
{
    m_open.clear();
    m_spanOpened.clear();
    m_aborted = false;

    // Build line offset table for source tracking
    const QByteArray utf8 = markdownText.toUtf8();
    m_lineStartOffsets.clear();
    m_lineStartOffsets.append(0); // line 1 starts at byte 0
    for (int i = 0; i < utf8.size(); ++i) {
        if (utf8[i] == '\n')
            m_lineStartOffsets.append(i + 1);
    }
    m_bufferStart = utf8.constData();
    m_bufferSize = utf8.size();

    openNode(MdTree::Root{});

    // Parse
    MD_PARSER parser = {};
    parser.abi_version = 0;
    parser.flags = 0;
    if (m_options.github)
        parser.flags |= MD_DIALECT_GITHUB;
    if (m_options.latexMath)
        parser.flags |= MD_FLAG_LATEXMATHSPANS;
    parser.enter_block = &MarkdownParser::sEnterBlock;
    parser.leave_block = &MarkdownParser::sLeaveBlock;
    parser.enter_span = &MarkdownParser::sEnterSpan;
    parser.leave_span = &MarkdownParser::sLeaveSpan;
    parser.text = &MarkdownParser::sText;

    const int rc = md_parse(utf8.constData(), static_cast<MD_SIZE>(utf8.size()), &parser, this);
    if (rc != 0) {
        qWarning() << "MarkdownParser: md_parse aborted with code" << rc;
        m_aborted = true;
    }

    // Anything still open after an abort is closed into its parent
    while (m_open.size() > 1)
        closeNode();

    OpenNode root = m_open.pop();
    MdTree::Position whole;
    whole.end = offsetToPoint(utf8.size());
    root.node.position = whole;

    m_bufferStart = nullptr;
    m_bufferSize = 0;
    return std::move(root.node);
}

// --- Static callbacks ---

int MarkdownParser::sEnterBlock(MD_BLOCKTYPE type, void *detail, void *userdata)
{ return static_cast<MarkdownParser *>(userdata)->enterBlock(type, detail); }
int MarkdownParser::sLeaveBlock(MD_BLOCKTYPE type, void *detail, void *userdata)
{ return static_cast<MarkdownParser *>(userdata)->leaveBlock(type, detail); }
int MarkdownParser::sEnterSpan(MD_SPANTYPE type, void *detail, void *userdata)
{ return static_cast<MarkdownParser *>(userdata)->enterSpan(type, detail); }
int MarkdownParser::sLeaveSpan(MD_SPANTYPE type, void *detail, void *userdata)
{ return static_cast<MarkdownParser *>(userdata)->leaveSpan(type, detail); }
int MarkdownParser::sText(MD_TEXTTYPE type, const MD_CHAR *text, MD_SIZE size, void *userdata)
{ return static_cast<MarkdownParser *>(userdata)->onText(type, text, size); }

// --- Tree assembly ---

void MarkdownParser::openNode(MdTree::Node node, bool implicit)
{
    OpenNode open;
    open.node = std::move(node);
    open.implicit = implicit;
    m_open.push(std::move(open));
}

void MarkdownParser::closeNode()
{
    OpenNode closed = m_open.pop();
    closed.node.position = trackedPosition(closed.tracker);

    // MD4C keeps the final line ending of literal blocks, mdast does not
    if (auto *code = closed.node.as<MdTree::Code>()) {
        if (code->value.endsWith(QLatin1Char('\n')))
            code->value.chop(1);
    } else if (auto *html = closed.node.as<MdTree::Html>()) {
        if (html->value.endsWith(QLatin1Char('\n')))
            html->value.chop(1);
    }

    if (m_open.isEmpty())
        return;
    if (auto *siblings = MdTree::children(m_open.top().node)) {
        siblings->append(std::move(closed.node));
    } else {
        qWarning() << "MarkdownParser: dropping node closed into a literal parent";
    }
}

void MarkdownParser::closeImplicitParagraph()
{
    if (!m_open.isEmpty() && m_open.top().implicit)
        closeNode();
}

void MarkdownParser::ensureInlineContainer()
{
    // Tight list item: MD4C didn't emit MD_BLOCK_P, create implicit paragraph
    if (!m_open.isEmpty() && m_open.top().node.is<MdTree::ListItem>())
        openNode(MdTree::Paragraph{}, true);
}

void MarkdownParser::appendLeaf(MdTree::Node node)
{
    ensureInlineContainer();
    if (auto *siblings = MdTree::children(m_open.top().node))
        siblings->append(std::move(node));
}

void MarkdownParser::appendText(const QString &text)
{
    if (text.isEmpty())
        return;

    // Literal nodes collect their text into their value
    MdTree::Node &top = m_open.top().node;
    if (auto *code = top.as<MdTree::Code>()) {
        code->value.append(text);
        return;
    }
    if (auto *inlineCode = top.as<MdTree::InlineCode>()) {
        inlineCode->value.append(text);
        return;
    }
    if (auto *math = top.as<MdTree::InlineMath>()) {
        math->value.append(text);
        return;
    }
    if (auto *math = top.as<MdTree::Math>()) {
        math->value.append(text);
        return;
    }
    if (auto *html = top.as<MdTree::Html>()) {
        html->value.append(text);
        return;
    }
    if (auto *image = top.as<MdTree::Image>()) {
        image->alt.append(text);
        return;
    }

    ensureInlineContainer();
    auto *siblings = MdTree::children(m_open.top().node);
    if (!siblings)
        return;
    // Adjacent text runs (entities, soft breaks) merge into one Text node
    if (!siblings->isEmpty()) {
        if (auto *previous = siblings->last().as<MdTree::Text>()) {
            previous->value.append(text);
            return;
        }
    }
    siblings->append(MdTree::Text{text});
}

// --- Block handlers ---

int MarkdownParser::enterBlock(MD_BLOCKTYPE type, void *detail)
{
    // A nested block ends the implicit paragraph of a tight list item
    if (type != MD_BLOCK_DOC)
        closeImplicitParagraph();

    switch (type) {
    case MD_BLOCK_DOC:
        break;

    case MD_BLOCK_QUOTE:
        openNode(MdTree::Blockquote{});
        break;

    case MD_BLOCK_UL: {
        auto *d = static_cast<MD_BLOCK_UL_DETAIL *>(detail);
        MdTree::List list;
        list.ordered = false;
        list.spread = !d->is_tight;
        openNode(std::move(list));
        break;
    }

    case MD_BLOCK_OL: {
        auto *d = static_cast<MD_BLOCK_OL_DETAIL *>(detail);
        MdTree::List list;
        list.ordered = true;
        list.start = static_cast<int>(d->start);
        list.spread = !d->is_tight;
        openNode(std::move(list));
        break;
    }

    case MD_BLOCK_LI: {
        auto *d = static_cast<MD_BLOCK_LI_DETAIL *>(detail);
        MdTree::ListItem item;
        if (const auto *list = m_open.top().node.as<MdTree::List>())
            item.spread = list->spread;
        if (d->is_task)
            item.checked = (d->task_mark != ' ');
        openNode(std::move(item));
        break;
    }

    case MD_BLOCK_HR:
        openNode(MdTree::ThematicBreak{});
        break;

    case MD_BLOCK_H: {
        auto *d = static_cast<MD_BLOCK_H_DETAIL *>(detail);
        MdTree::Heading heading;
        heading.depth = static_cast<int>(d->level);
        openNode(std::move(heading));
        break;
    }

    case MD_BLOCK_CODE: {
        auto *d = static_cast<MD_BLOCK_CODE_DETAIL *>(detail);
        MdTree::Code code;
        code.lang = extractAttribute(d->lang);
        const QString info = extractAttribute(d->info);
        code.meta = info.mid(code.lang.size()).trimmed();
        openNode(std::move(code));
        break;
    }

    case MD_BLOCK_HTML:
        openNode(MdTree::Html{});
        break;

    case MD_BLOCK_P:
        openNode(MdTree::Paragraph{});
        break;

    case MD_BLOCK_TABLE:
        openNode(MdTree::Table{});
        break;

    case MD_BLOCK_THEAD:
    case MD_BLOCK_TBODY:
        // Rows attach directly to the table
        break;

    case MD_BLOCK_TR:
        openNode(MdTree::TableRow{});
        break;

    case MD_BLOCK_TH:
    case MD_BLOCK_TD: {
        auto *d = static_cast<MD_BLOCK_TD_DETAIL *>(detail);
        // Column alignment is taken from the cells of the first row
        if (m_open.size() >= 2) {
            if (auto *table = m_open[m_open.size() - 2].node.as<MdTree::Table>()) {
                if (table->children.isEmpty()) {
                    switch (d->align) {
                    case MD_ALIGN_LEFT: table->align.append(MdTree::AlignKind::Left); break;
                    case MD_ALIGN_CENTER: table->align.append(MdTree::AlignKind::Center); break;
                    case MD_ALIGN_RIGHT: table->align.append(MdTree::AlignKind::Right); break;
                    default: table->align.append(MdTree::AlignKind::None); break;
                    }
                }
            }
        }
        openNode(MdTree::TableCell{});
        break;
    }
    }

    return 0;
}

int MarkdownParser::leaveBlock(MD_BLOCKTYPE type, void *detail)
{
    switch (type) {
    case MD_BLOCK_DOC:
    case MD_BLOCK_THEAD:
    case MD_BLOCK_TBODY:
        break;

    case MD_BLOCK_CODE: {
        // The closing fence carries no text: extend the block over it
        auto *d = static_cast<MD_BLOCK_CODE_DETAIL *>(detail);
        if (d->fence_char != 0)
            extendToNextLine(m_open.top().tracker);
        closeNode();
        break;
    }

    default:
        // Close implicit paragraph if open
        closeImplicitParagraph();
        closeNode();
        break;
    }
    return 0;
}

// --- Span handlers ---

int MarkdownParser::enterSpan(MD_SPANTYPE type, void *detail)
{
    // Inside image alt text only the text matters
    if (m_open.top().node.is<MdTree::Image>()) {
        m_spanOpened.push(false);
        return 0;
    }

    ensureInlineContainer();

    switch (type) {
    case MD_SPAN_EM:
        openNode(MdTree::Emphasis{});
        break;

    case MD_SPAN_STRONG:
        openNode(MdTree::Strong{});
        break;

    case MD_SPAN_CODE:
        openNode(MdTree::InlineCode{});
        break;

    case MD_SPAN_A: {
        auto *d = static_cast<MD_SPAN_A_DETAIL *>(detail);
        MdTree::Link link;
        link.url = extractAttribute(d->href);
        link.title = extractAttribute(d->title);
        openNode(std::move(link));
        break;
    }

    case MD_SPAN_IMG: {
        auto *d = static_cast<MD_SPAN_IMG_DETAIL *>(detail);
        MdTree::Image image;
        image.url = extractAttribute(d->src);
        image.title = extractAttribute(d->title);
        openNode(std::move(image));
        break;
    }

    case MD_SPAN_DEL:
        openNode(MdTree::Delete{});
        break;

    case MD_SPAN_LATEXMATH:
        openNode(MdTree::InlineMath{});
        break;

    case MD_SPAN_LATEXMATH_DISPLAY:
        openNode(MdTree::Math{});
        break;

    default:
        // Wiki links and underline are not enabled in the parser flags
        m_spanOpened.push(false);
        return 0;
    }

    m_spanOpened.push(true);
    return 0;
}

int MarkdownParser::leaveSpan(MD_SPANTYPE /*type*/, void * /*detail*/)
{
    if (!m_spanOpened.isEmpty() && m_spanOpened.pop())
        closeNode();
    return 0;
}

// --- Text handler ---

int MarkdownParser::onText(MD_TEXTTYPE type, const MD_CHAR *text, MD_SIZE size)
{
    // Update all active block trackers with source position
    // md4c hands out its own constant strings for line breaks and NUL
    // replacements; those have no place in the source.
    const int offset = sourceOffset(text, size);
    if (offset >= 0) {
        const int end = offset + static_cast<int>(size);
        for (auto &open : m_open) {
            if (open.tracker.firstByteOffset < 0)
                open.tracker.firstByteOffset = offset;
            open.tracker.lastByteEnd = end;
        }
    }

    QString str = QString::fromUtf8(text, static_cast<int>(size));

    switch (type) {
    case MD_TEXT_NORMAL:
    case MD_TEXT_CODE:
    case MD_TEXT_LATEXMATH:
        appendText(str);
        break;

    case MD_TEXT_ENTITY:
        appendText(resolveEntity(str));
        break;

    case MD_TEXT_NULLCHAR:
        appendText(QString(QChar(0xFFFD)));
        break;

    case MD_TEXT_SOFTBR: {
        // Line endings inside code spans and alt text read as spaces
        const MdTree::Node &top = m_open.top().node;
        if (top.is<MdTree::InlineCode>() || top.is<MdTree::Image>())
            appendText(QStringLiteral(" "));
        else
            appendText(QStringLiteral("\n"));
        break;
    }

    case MD_TEXT_BR:
        if (!m_open.top().node.is<MdTree::Image>())
            appendLeaf(MdTree::Break{});
        break;

    case MD_TEXT_HTML:
        if (m_open.top().node.is<MdTree::Html>())
            appendText(str);
        else
            appendLeaf(MdTree::Html{str});
        break;
    }
    return 0;
}

// --- Source tracking ---

int MarkdownParser::sourceOffset(const MD_CHAR *text, MD_SIZE size) const
{
    if (!m_bufferStart)
        return -1;
    const auto address = reinterpret_cast<quintptr>(text);
    const auto start = reinterpret_cast<quintptr>(m_bufferStart);
    if (address < start || address - start > static_cast<quintptr>(m_bufferSize)
        || static_cast<quintptr>(m_bufferSize) - (address - start) < size)
        return -1;
    return static_cast<int>(address - start);
}

void MarkdownParser::extendToNextLine(BlockTracker &tracker) const
{
    if (tracker.lastByteEnd < 0)
        return;
    // Index of the line after the one holding the last tracked byte
    const auto next = std::upper_bound(m_lineStartOffsets.begin(), m_lineStartOffsets.end(),
                                       qMax(0, tracker.lastByteEnd - 1));
    if (next == m_lineStartOffsets.end() || *next >= m_bufferSize)
        return;
    const auto after = std::next(next);
    tracker.lastByteEnd = after == m_lineStartOffsets.end() ? m_bufferSize : *after - 1;
}

MdTree::Point MarkdownParser::offsetToPoint(int offset) const
{
    // Binary search: find 1-based line number containing this byte offset
    auto it = std::upper_bound(m_lineStartOffsets.begin(), m_lineStartOffsets.end(), offset);
    MdTree::Point point;
    point.line = qMax(1, static_cast<int>(it - m_lineStartOffsets.begin())); // 1-based
    point.column = offset - m_lineStartOffsets[point.line - 1] + 1;
    point.offset = offset;
    return point;
}

std::optional<MdTree::Position> MarkdownParser::trackedPosition(const BlockTracker &tracker) const
{
    if (tracker.firstByteOffset < 0)
        return std::nullopt;
    MdTree::Position position;
    position.start = offsetToPoint(tracker.firstByteOffset);
    position.end = offsetToPoint(tracker.lastByteEnd);
    return position;
}

// --- Helpers ---

QString MarkdownParser::extractAttribute(const MD_ATTRIBUTE &attr)
{
    if (!attr.text || attr.size == 0)
        return {};
    return QString::fromUtf8(attr.text, static_cast<int>(attr.size));
}

QString MarkdownParser::resolveEntity(const QString &entity)
{
    static const QHash<QString, QString> entities = {
        {QStringLiteral("&amp;"),    QStringLiteral("&")},
        {QStringLiteral("&lt;"),     QStringLiteral("<")},
        {QStringLiteral("&gt;"),     QStringLiteral(">")},
        {QStringLiteral("&quot;"),   QStringLiteral("\"")},
        {QStringLiteral("&apos;"),   QStringLiteral("'")},
        {QStringLiteral("&nbsp;"),   QString(QChar(0x00A0))},
        {QStringLiteral("&mdash;"),  QString(QChar(0x2014))},
        {QStringLiteral("&ndash;"),  QString(QChar(0x2013))},
        {QStringLiteral("&lsquo;"),  QString(QChar(0x2018))},
        {QStringLiteral("&rsquo;"),  QString(QChar(0x2019))},
        {QStringLiteral("&ldquo;"),  QString(QChar(0x201C))},
        {QStringLiteral("&rdquo;"),  QString(QChar(0x201D))},
        {QStringLiteral("&hellip;"), QString(QChar(0x2026))},
        {QStringLiteral("&copy;"),   QString(QChar(0x00A9))},
        {QStringLiteral("&reg;"),    QString(QChar(0x00AE))},
        {QStringLiteral("&trade;"),  QString(QChar(0x2122))},
        {QStringLiteral("&deg;"),    QString(QChar(0x00B0))},
        {QStringLiteral("&times;"),  QString(QChar(0x00D7))},
        {QStringLiteral("&divide;"), QString(QChar(0x00F7))},
    };
    auto it = entities.constFind(entity);
    if (it != entities.constEnd())
        return it.value();
    if (entity.startsWith(QLatin1String("&#"))) {
        QString num = entity.mid(2, entity.size() - 3);
        bool ok;
        uint code;
        if (num.startsWith(QLatin1Char('x'), Qt::CaseInsensitive))
            code = num.mid(1).toUInt(&ok, 16);
        else
            code = num.toUInt(&ok, 10);
        if (ok) {
            // NUL, surrogates and values past Unicode become the replacement character
            if (code == 0 || code > 0x10FFFF || (code >= 0xD800 && code <= 0xDFFF))
                return QString(QChar(QChar::ReplacementCharacter));
            const char32_t ch = code;
            return QString::fromUcs4(&ch, 1);
        }
    }
    return entity;
}
