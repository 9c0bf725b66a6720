/*
 * renderoptions.h — Options for writing styled text to a terminal
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef TERMMARK_RENDEROPTIONS_H
#define TERMMARK_RENDEROPTIONS_H

struct RenderOptions {
    int width = 80;      // columns used by horizontal rules
    bool colors = true;  // emit SGR escape sequences

    // Preset factories
    static RenderOptions plain()
    {
        RenderOptions opts;
        opts.colors = false;
        return opts;
    }
};

#endif // TERMMARK_RENDEROPTIONS_H
