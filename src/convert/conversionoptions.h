/*
 * conversionoptions.h — Options consulted while converting to styled text
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef TERMMARK_CONVERSIONOPTIONS_H
#define TERMMARK_CONVERSIONOPTIONS_H

#include <array>
#include <optional>

struct ConversionOptions {
    // Blank line after a heading, per depth (index 0 = H1)
    std::array<bool, 6> headerSpacing = {true, false, false, false, false, false};

    // Emphasis forced on link contents. Unset = inherit the surrounding style.
    struct LinksStyle {
        std::optional<bool> bold;
        std::optional<bool> italic;
        std::optional<bool> strikeout;
    };
    LinksStyle linksStyle;

    bool spacingAfterHeader(int depth) const
    {
        if (depth < 1)
            depth = 1;
        else if (depth > 6)
            depth = 6;
        return headerSpacing[static_cast<size_t>(depth - 1)];
    }
};

#endif // TERMMARK_CONVERSIONOPTIONS_H
