/*
 * conversionsettings.cpp — Persisted defaults for conversion and display
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "conversionsettings.h"

#include <QDebug>

#include <KConfigGroup>

namespace ConversionSettings {

OverrideResult parseOverride(const QString &text)
{
    OverrideResult result;
    const QString t = text.trimmed().toLower();
    if (t.isEmpty() || t == QLatin1String("inherit"))
        result.value = std::nullopt;
    else if (t == QLatin1String("on") || t == QLatin1String("true"))
        result.value = true;
    else if (t == QLatin1String("off") || t == QLatin1String("false"))
        result.value = false;
    else
        result.valid = false;
    return result;
}

QString overrideToString(const std::optional<bool> &value)
{
    if (!value)
        return QStringLiteral("inherit");
    return *value ? QStringLiteral("on") : QStringLiteral("off");
}

bool parseHeaderSpacing(const QString &text, std::array<bool, 6> *spacing)
{
    const QString t = text.trimmed();
    if (t.size() != 6)
        return false;

    std::array<bool, 6> parsed{};
    for (int i = 0; i < 6; ++i) {
        if (t[i] == QLatin1Char('1'))
            parsed[i] = true;
        else if (t[i] == QLatin1Char('0'))
            parsed[i] = false;
        else
            return false;
    }
    *spacing = parsed;
    return true;
}

QString headerSpacingToString(const std::array<bool, 6> &spacing)
{
    QString text;
    for (bool on : spacing)
        text.append(on ? QLatin1Char('1') : QLatin1Char('0'));
    return text;
}

static std::optional<bool> readOverride(const KConfigGroup &group, const char *key)
{
    const QString text = group.readEntry(key, QStringLiteral("inherit"));
    const OverrideResult result = parseOverride(text);
    if (!result.valid) {
        qWarning() << "ConversionSettings: invalid value" << text << "for" << key
                   << "- using inherit";
        return std::nullopt;
    }
    return result.value;
}

Settings load(const KSharedConfigPtr &config)
{
    Settings settings;

    KConfigGroup conversion(config, QStringLiteral("Conversion"));
    const QString spacing = conversion.readEntry(
        "HeaderSpacing", headerSpacingToString(settings.conversion.headerSpacing));
    if (!parseHeaderSpacing(spacing, &settings.conversion.headerSpacing))
        qWarning() << "ConversionSettings: invalid HeaderSpacing" << spacing;

    settings.conversion.linksStyle.bold = readOverride(conversion, "LinkBold");
    settings.conversion.linksStyle.italic = readOverride(conversion, "LinkItalic");
    settings.conversion.linksStyle.strikeout = readOverride(conversion, "LinkStrikeout");

    KConfigGroup display(config, QStringLiteral("Display"));
    const int width = display.readEntry("Width", settings.display.width);
    if (width > 0)
        settings.display.width = width;
    else
        qWarning() << "ConversionSettings: invalid Width" << width;
    settings.display.colors = display.readEntry("Colors", settings.display.colors);

    return settings;
}

void save(const Settings &settings, const KSharedConfigPtr &config)
{
    KConfigGroup conversion(config, QStringLiteral("Conversion"));
    conversion.writeEntry("HeaderSpacing",
                          headerSpacingToString(settings.conversion.headerSpacing));
    conversion.writeEntry("LinkBold", overrideToString(settings.conversion.linksStyle.bold));
    conversion.writeEntry("LinkItalic", overrideToString(settings.conversion.linksStyle.italic));
    conversion.writeEntry("LinkStrikeout",
                          overrideToString(settings.conversion.linksStyle.strikeout));

    KConfigGroup display(config, QStringLiteral("Display"));
    display.writeEntry("Width", settings.display.width);
    display.writeEntry("Colors", settings.display.colors);

    if (!config->sync())
        qWarning() << "ConversionSettings: could not write" << config->name();
}

} // namespace ConversionSettings
