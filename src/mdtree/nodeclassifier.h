/*
 * nodeclassifier.h — Stable symbolic names for MdTree node kinds
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef TERMMARK_NODECLASSIFIER_H
#define TERMMARK_NODECLASSIFIER_H

#include <QString>

#include "mdtree.h"

namespace NodeClassifier {

// Name of the node's kind, as used in diagnostics ("Paragraph", "Table"...).
QString kindName(const MdTree::Node &node);

} // namespace NodeClassifier

#endif // TERMMARK_NODECLASSIFIER_H
