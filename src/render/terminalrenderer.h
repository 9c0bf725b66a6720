/*
 * terminalrenderer.h — ANSI terminal output from StyledText lines
 *
 * Writes one terminal line per styled text line. Emphasis maps onto SGR
 * attributes; block styles onto prefixes (bullets, quote bars) and a base
 * attribute for the whole line. No wrapping is done.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef TERMMARK_TERMINALRENDERER_H
#define TERMMARK_TERMINALRENDERER_H

#include <QByteArray>
#include <QList>

#include "renderoptions.h"
#include "styledtext.h"

class TerminalRenderer
{
public:
    QByteArray render(const StyledText::Text &text,
                      const RenderOptions &options = RenderOptions());

private:
    void writeLine(QByteArray &out, const StyledText::Line &line);
    void writeComposite(QByteArray &out, const StyledText::Composite &composite);
    void writeCompounds(QByteArray &out, const QList<StyledText::Compound> &compounds,
                        const QList<int> &baseAttributes);
    void writeTableRow(QByteArray &out, const StyledText::TableRow &row);
    void writeTableRule(QByteArray &out, const StyledText::TableRule &rule);
    void writeHorizontalRule(QByteArray &out);

    // SGR helpers
    void writeStyled(QByteArray &out, const QByteArray &text, const QList<int> &attributes);

    RenderOptions m_options;
};

#endif // TERMMARK_TERMINALRENDERER_H
