/*
 * main.cpp — termmark: render a markdown file as styled terminal text
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDebug>
#include <QFile>
#include <QTextStream>

#include <KAboutData>
#include <KLocalizedString>

#include <cstdio>

#include "conversionsettings.h"
#include "converter.h"
#include "markdownparser.h"
#include "terminalrenderer.h"

static QString dumpTree(const MdTree::Node &root)
{
    QString out;
    QDebug(&out) << root;
    return out;
}

static QString dumpText(const StyledText::Text &text)
{
    QString out;
    QDebug(&out) << text;
    return out;
}

static bool writeDump(const QString &path, const QString &dump)
{
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate | QIODevice::Text)) {
        qCritical().noquote() << i18n("Cannot write %1: %2", path, file.errorString());
        return false;
    }
    if (file.write(dump.toUtf8() + '\n') < 0) {
        qCritical().noquote() << i18n("Cannot write %1: %2", path, file.errorString());
        return false;
    }
    return true;
}

static bool applyOverride(const QCommandLineParser &parser, const QCommandLineOption &option,
                          std::optional<bool> *target)
{
    if (!parser.isSet(option))
        return true;
    const QString value = parser.value(option);
    const auto result = ConversionSettings::parseOverride(value);
    if (!result.valid) {
        qCritical().noquote() << i18n("Invalid value for --%1: %2 (expected on, off or inherit)",
                                      option.names().constLast(), value);
        return false;
    }
    *target = result.value;
    return true;
}

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    KLocalizedString::setApplicationDomain("termmark");

    KAboutData aboutData(
        QStringLiteral("termmark"),
        i18n("TermMark"),
        QStringLiteral("0.1.0"),
        i18n("Render markdown as styled terminal text"),
        KAboutLicense::GPL_V2,
        i18n("(c) 2025-2026"));
    KAboutData::setApplicationData(aboutData);

    QCommandLineParser parser;
    aboutData.setupCommandLine(&parser);

    const QCommandLineOption astOption(
        {QStringLiteral("a"), QStringLiteral("ast")},
        i18n("Print the parsed syntax tree and the converted styled text."));
    const QCommandLineOption dumpParsedOption(
        QStringLiteral("dump-parsed"),
        i18n("Write the parsed syntax tree to <file>."), QStringLiteral("file"));
    const QCommandLineOption dumpConvertedOption(
        QStringLiteral("dump-converted"),
        i18n("Write the converted styled text to <file>."), QStringLiteral("file"));
    const QCommandLineOption headerSpacingOption(
        QStringLiteral("header-spacing"),
        i18n("Blank line after headings, six 0/1 flags starting with H1."),
        QStringLiteral("flags"));
    const QCommandLineOption linkBoldOption(
        QStringLiteral("link-bold"), i18n("Bold link text: on, off or inherit."),
        QStringLiteral("mode"));
    const QCommandLineOption linkItalicOption(
        QStringLiteral("link-italic"), i18n("Italic link text: on, off or inherit."),
        QStringLiteral("mode"));
    const QCommandLineOption linkStrikeoutOption(
        QStringLiteral("link-strikeout"), i18n("Struck-out link text: on, off or inherit."),
        QStringLiteral("mode"));
    const QCommandLineOption commonmarkOption(
        QStringLiteral("commonmark"),
        i18n("Parse plain CommonMark, without the GitHub extensions."));
    const QCommandLineOption widthOption(
        {QStringLiteral("w"), QStringLiteral("width")},
        i18n("Terminal width used for rules."), QStringLiteral("columns"));
    const QCommandLineOption noColorOption(
        QStringLiteral("no-color"), i18n("Write plain text without escape sequences."));
    const QCommandLineOption saveDefaultsOption(
        QStringLiteral("save-defaults"),
        i18n("Store the effective conversion and display options as defaults."));

    parser.addOptions({astOption, dumpParsedOption, dumpConvertedOption,
                       headerSpacingOption, linkBoldOption, linkItalicOption,
                       linkStrikeoutOption, commonmarkOption, widthOption,
                       noColorOption, saveDefaultsOption});
    parser.addPositionalArgument(
        QStringLiteral("file"),
        i18n("Markdown file to render"),
        QStringLiteral("<file>"));
    parser.process(app);
    aboutData.processCommandLine(&parser);

    // Configured defaults, then command-line overrides
    ConversionSettings::Settings settings = ConversionSettings::load();

    if (parser.isSet(headerSpacingOption)) {
        const QString flags = parser.value(headerSpacingOption);
        if (!ConversionSettings::parseHeaderSpacing(flags, &settings.conversion.headerSpacing)) {
            qCritical().noquote() << i18n("Invalid value for --header-spacing: %1 "
                                          "(expected six 0/1 characters)", flags);
            return 1;
        }
    }
    ConversionOptions::LinksStyle &links = settings.conversion.linksStyle;
    if (!applyOverride(parser, linkBoldOption, &links.bold)
        || !applyOverride(parser, linkItalicOption, &links.italic)
        || !applyOverride(parser, linkStrikeoutOption, &links.strikeout))
        return 1;

    if (parser.isSet(widthOption)) {
        bool ok = false;
        const int width = parser.value(widthOption).toInt(&ok);
        if (!ok || width <= 0) {
            qCritical().noquote() << i18n("Invalid width: %1", parser.value(widthOption));
            return 1;
        }
        settings.display.width = width;
    }
    if (parser.isSet(noColorOption))
        settings.display.colors = false;

    if (parser.isSet(saveDefaultsOption))
        ConversionSettings::save(settings);

    const QStringList args = parser.positionalArguments();
    if (args.size() != 1) {
        if (parser.isSet(saveDefaultsOption) && args.isEmpty())
            return 0;
        parser.showHelp(1);
    }

    QFile file(args.first());
    if (!file.open(QIODevice::ReadOnly)) {
        qCritical().noquote() << i18n("Cannot read %1: %2", args.first(), file.errorString());
        return 1;
    }
    const QString markdown = QString::fromUtf8(file.readAll());

    MarkdownParser markdownParser;
    ParseOptions parseOptions;
    parseOptions.github = !parser.isSet(commonmarkOption);
    markdownParser.setOptions(parseOptions);
    const MdTree::Node tree = markdownParser.parse(markdown);

    QTextStream out(stdout);
    const bool showAst = parser.isSet(astOption);
    if (showAst)
        out << dumpTree(tree) << Qt::endl;
    if (parser.isSet(dumpParsedOption)
        && !writeDump(parser.value(dumpParsedOption), dumpTree(tree)))
        return 1;

    // The styled text borrows from tree, which stays alive until exit
    const Converter::Result result = Converter::toStyledText(tree, settings.conversion);
    if (!result.valid) {
        qCritical().noquote() << i18n("Cannot convert %1:", args.first());
        const QStringList chain = result.error.chain();
        for (const QString &frame : chain)
            qCritical().noquote() << QStringLiteral("  ") + frame;
        return 1;
    }

    if (showAst)
        out << dumpText(result.text) << Qt::endl;
    if (parser.isSet(dumpConvertedOption)
        && !writeDump(parser.value(dumpConvertedOption), dumpText(result.text)))
        return 1;
    out.flush();
    TerminalRenderer renderer;
    const QByteArray rendered = renderer.render(result.text, settings.display);
    if (std::fwrite(rendered.constData(), 1, rendered.size(), stdout)
        != static_cast<size_t>(rendered.size())) {
        qCritical().noquote() << i18n("Cannot write to standard output");
        return 1;
    }
    return 0;
}
