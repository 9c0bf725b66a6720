/*
 * converter.cpp — Convert a markdown syntax tree to styled text
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "converter.h"
#include "emitter.h"

namespace Converter {

Result toStyledText(const MdTree::Node &root, const ConversionOptions &options)
{
    Result result;

    Emitter emitter(options);
    if (!emitter.node(root, InlineStyle())) {
        result.valid = false;
        result.error = emitter.error();
        return result;
    }

    result.text = emitter.finish();
    return result;
}

} // namespace Converter
