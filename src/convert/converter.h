/*
 * converter.h — Convert a markdown syntax tree to styled text
 *
 * Entry point of the conversion. The returned text borrows string data
 * from the tree: keep the tree alive for as long as the text is used.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef TERMMARK_CONVERTER_H
#define TERMMARK_CONVERTER_H

#include "conversionerror.h"
#include "conversionoptions.h"
#include "mdtree.h"
#include "styledtext.h"

namespace Converter {

struct Result {
    StyledText::Text text;     // empty if invalid
    bool valid = true;
    ConversionError error;     // set if invalid
};

Result toStyledText(const MdTree::Node &root,
                    const ConversionOptions &options = ConversionOptions());

} // namespace Converter

#endif // TERMMARK_CONVERTER_H
