/*
 * terminalrenderer.cpp — ANSI terminal output from StyledText lines
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "terminalrenderer.h"

#include <QString>

// SGR attribute codes
static constexpr int kBold = 1;
static constexpr int kDim = 2;
static constexpr int kItalic = 3;
static constexpr int kUnderline = 4;
static constexpr int kReverse = 7;
static constexpr int kStrikeout = 9;

QByteArray TerminalRenderer::render(const StyledText::Text &text, const RenderOptions &options)
{
    m_options = options;

    QByteArray out;
    out.reserve(4096);
    for (const auto &line : text.lines)
        writeLine(out, line);
    return out;
}

void TerminalRenderer::writeLine(QByteArray &out, const StyledText::Line &line)
{
    std::visit([this, &out](const auto &l) {
        using T = std::decay_t<decltype(l)>;
        if constexpr (std::is_same_v<T, StyledText::NormalLine>) {
            writeComposite(out, l.composite);
        } else if constexpr (std::is_same_v<T, StyledText::CodeFence>) {
            writeCompounds(out, l.composite.compounds, {kDim});
        } else if constexpr (std::is_same_v<T, StyledText::HorizontalRule>) {
            writeHorizontalRule(out);
        } else if constexpr (std::is_same_v<T, StyledText::TableRow>) {
            writeTableRow(out, l);
        } else if constexpr (std::is_same_v<T, StyledText::TableRule>) {
            writeTableRule(out, l);
        }
    }, line);
    out.append('\n');
}

void TerminalRenderer::writeComposite(QByteArray &out, const StyledText::Composite &composite)
{
    const StyledText::CompositeStyle &style = composite.style;
    switch (style.kind) {
    case StyledText::CompositeStyle::Paragraph:
        writeCompounds(out, composite.compounds, {});
        break;

    case StyledText::CompositeStyle::Header:
        if (style.level == 1)
            writeCompounds(out, composite.compounds, {kBold, kUnderline});
        else
            writeCompounds(out, composite.compounds, {kBold});
        break;

    case StyledText::CompositeStyle::ListItem:
        // Two columns per nesting level, then the bullet
        out.append(QByteArray(2 * style.indent(), ' '));
        out.append(QStringLiteral("• ").toUtf8());
        writeCompounds(out, composite.compounds, {});
        break;

    case StyledText::CompositeStyle::Code:
        writeCompounds(out, composite.compounds, {kDim});
        break;

    case StyledText::CompositeStyle::Quote:
        writeStyled(out, QStringLiteral("▐ ").toUtf8(), {kDim});
        writeCompounds(out, composite.compounds, {kItalic});
        break;
    }
}

void TerminalRenderer::writeCompounds(QByteArray &out,
                                      const QList<StyledText::Compound> &compounds,
                                      const QList<int> &baseAttributes)
{
    for (const auto &compound : compounds) {
        QList<int> attributes = baseAttributes;
        if (compound.bold && !attributes.contains(kBold))
            attributes.append(kBold);
        if (compound.italic && !attributes.contains(kItalic))
            attributes.append(kItalic);
        if (compound.strikeout)
            attributes.append(kStrikeout);
        if (compound.code)
            attributes.append(kReverse);
        writeStyled(out, compound.src.toUtf8(), attributes);
    }
}

void TerminalRenderer::writeTableRow(QByteArray &out, const StyledText::TableRow &row)
{
    const QByteArray separator = QStringLiteral(" │ ").toUtf8();
    for (int i = 0; i < row.cells.size(); ++i) {
        if (i > 0)
            writeStyled(out, separator, {kDim});
        writeCompounds(out, row.cells[i].compounds, {});
    }
}

void TerminalRenderer::writeTableRule(QByteArray &out, const StyledText::TableRule &rule)
{
    const QString dash(QChar(0x2500));
    QString text;
    for (int i = 0; i < rule.cells.size(); ++i) {
        if (i > 0)
            text.append(QChar(0x253C)); // ┼
        const StyledText::Alignment align = rule.cells[i];
        const bool left = align == StyledText::Alignment::Left || align == StyledText::Alignment::Center;
        const bool right = align == StyledText::Alignment::Right || align == StyledText::Alignment::Center;
        text.append(left ? QStringLiteral(":") : dash);
        text.append(dash.repeated(3));
        text.append(right ? QStringLiteral(":") : dash);
    }
    writeStyled(out, text.toUtf8(), {kDim});
}

void TerminalRenderer::writeHorizontalRule(QByteArray &out)
{
    const int width = m_options.width > 0 ? m_options.width : 80;
    writeStyled(out, QString(QChar(0x2500)).repeated(width).toUtf8(), {kDim});
}

void TerminalRenderer::writeStyled(QByteArray &out, const QByteArray &text,
                                   const QList<int> &attributes)
{
    if (!m_options.colors || attributes.isEmpty() || text.isEmpty()) {
        out.append(text);
        return;
    }

    out.append("\x1b[");
    for (int i = 0; i < attributes.size(); ++i) {
        if (i > 0)
            out.append(';');
        out.append(QByteArray::number(attributes[i]));
    }
    out.append('m');
    out.append(text);
    out.append("\x1b[0m");
}
