/*
 * conversionsettings.h — Persisted defaults for conversion and display
 *
 * Reads and writes the "Conversion" and "Display" groups of termmarkrc.
 * Command-line flags are applied on top of what load() returns.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef TERMMARK_CONVERSIONSETTINGS_H
#define TERMMARK_CONVERSIONSETTINGS_H

#include <QString>

#include <KSharedConfig>

#include <optional>

#include "conversionoptions.h"
#include "renderoptions.h"

namespace ConversionSettings {

struct Settings {
    ConversionOptions conversion;
    RenderOptions display;
};

Settings load(const KSharedConfigPtr &config = KSharedConfig::openConfig());
void save(const Settings &settings,
          const KSharedConfigPtr &config = KSharedConfig::openConfig());

// "inherit", "on" or "off". Anything else is invalid.
struct OverrideResult {
    std::optional<bool> value;
    bool valid = true;
};
OverrideResult parseOverride(const QString &text);
QString overrideToString(const std::optional<bool> &value);

// Six '0'/'1' characters, H1 first. Returns false and leaves spacing
// untouched if the text is malformed.
bool parseHeaderSpacing(const QString &text, std::array<bool, 6> *spacing);
QString headerSpacingToString(const std::array<bool, 6> &spacing);

} // namespace ConversionSettings

#endif // TERMMARK_CONVERSIONSETTINGS_H
