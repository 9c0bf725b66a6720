/*
 * mdtree.h — Markdown syntax tree (mdast-shaped, std::variant)
 *
 * The source side of the conversion. Every node kind of the mdast
 * vocabulary is represented, including the ones the converter rejects,
 * so diagnostics can always name what was found.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef TERMMARK_MDTREE_H
#define TERMMARK_MDTREE_H

#include <QList>
#include <QString>

#include <optional>
#include <type_traits>
#include <variant>

class QDebug;

namespace MdTree {

// --- Source position tracking ---

struct Point {
    int line = 1;    // 1-based
    int column = 1;  // 1-based
    int offset = 0;  // 0-based byte offset into the UTF-8 source
};

struct Position {
    Point start;
    Point end;
};

struct Node;

// --- Container nodes ---

struct Root {
    QList<Node> children;
};

struct Blockquote {
    QList<Node> children;
};

struct FootnoteDefinition {
    QList<Node> children;
    QString identifier;
    QString label;
};

struct MdxJsxFlowElement {
    QList<Node> children;
    QString name;
};

struct List {
    QList<Node> children;
    bool ordered = false;
    std::optional<int> start;  // only meaningful when ordered
    bool spread = false;
};

struct ListItem {
    QList<Node> children;
    bool spread = false;
    std::optional<bool> checked;  // set for task list items
};

struct Heading {
    QList<Node> children;
    int depth = 1;  // 1-6
};

struct Paragraph {
    QList<Node> children;
};

enum class AlignKind { None, Left, Center, Right };

struct Table {
    QList<Node> children;
    QList<AlignKind> align;
};

struct TableRow {
    QList<Node> children;
};

struct TableCell {
    QList<Node> children;
};

// --- Inline containers ---

struct Emphasis {
    QList<Node> children;
};

struct Strong {
    QList<Node> children;
};

struct Delete {
    QList<Node> children;
};

struct Link {
    QList<Node> children;
    QString url;
    QString title;
};

enum class ReferenceKind { Shortcut, Collapsed, Full };

struct LinkReference {
    QList<Node> children;
    QString identifier;
    QString label;
    ReferenceKind referenceKind = ReferenceKind::Full;
};

struct MdxJsxTextElement {
    QList<Node> children;
    QString name;
};

// --- Literal nodes ---

struct Text {
    QString value;
};

struct InlineCode {
    QString value;
};

struct InlineMath {
    QString value;
};

struct Code {
    QString value;
    QString lang;  // empty = no info string
    QString meta;
};

struct Math {
    QString value;
    QString meta;
};

struct Html {
    QString value;
};

struct Yaml {
    QString value;
};

struct Toml {
    QString value;
};

struct MdxjsEsm {
    QString value;
};

struct MdxTextExpression {
    QString value;
};

struct MdxFlowExpression {
    QString value;
};

// --- Leaf nodes ---

struct Break {};
struct ThematicBreak {};

struct Image {
    QString url;
    QString title;
    QString alt;
};

struct ImageReference {
    QString identifier;
    QString label;
    QString alt;
    ReferenceKind referenceKind = ReferenceKind::Full;
};

struct FootnoteReference {
    QString identifier;
    QString label;
};

struct Definition {
    QString url;
    QString title;
    QString identifier;
    QString label;
};

// NodeData variant. Adding an alternative here requires a matching name
// in NodeClassifier::kindName(), which fails to compile otherwise.
using NodeData = std::variant<
    Root,
    Blockquote,
    FootnoteDefinition,
    MdxJsxFlowElement,
    List,
    MdxjsEsm,
    Toml,
    Yaml,
    Break,
    InlineCode,
    InlineMath,
    Delete,
    Emphasis,
    MdxTextExpression,
    FootnoteReference,
    Html,
    Image,
    ImageReference,
    MdxJsxTextElement,
    Link,
    LinkReference,
    Strong,
    Text,
    Code,
    Math,
    MdxFlowExpression,
    Heading,
    Table,
    ThematicBreak,
    TableRow,
    TableCell,
    ListItem,
    Definition,
    Paragraph
>;

struct Node {
    NodeData data;
    std::optional<Position> position;

    Node() = default;
    template<typename T,
             typename = std::enable_if_t<!std::is_same_v<std::decay_t<T>, Node>>>
    Node(T value)
        : data(std::move(value))
    {
    }

    template<typename T>
    bool is() const { return std::holds_alternative<T>(data); }

    template<typename T>
    const T *as() const { return std::get_if<T>(&data); }

    template<typename T>
    T *as() { return std::get_if<T>(&data); }
};

// --- Child access ---

namespace detail {
template<typename T, typename = void>
struct HasChildren : std::false_type {};
template<typename T>
struct HasChildren<T, std::void_t<decltype(std::declval<T &>().children)>> : std::true_type {};
} // namespace detail

// Children of a parent node, or nullptr for literal and leaf kinds.
inline const QList<Node> *children(const Node &node)
{
    return std::visit([](const auto &n) -> const QList<Node> * {
        using T = std::decay_t<decltype(n)>;
        if constexpr (detail::HasChildren<T>::value)
            return &n.children;
        else
            return nullptr;
    }, node.data);
}

inline QList<Node> *children(Node &node)
{
    return std::visit([](auto &n) -> QList<Node> * {
        using T = std::decay_t<decltype(n)>;
        if constexpr (detail::HasChildren<T>::value)
            return &n.children;
        else
            return nullptr;
    }, node.data);
}

#ifndef QT_NO_DEBUG_STREAM
// Indented dump of the whole subtree, one node per line.
QDebug operator<<(QDebug dbg, const Node &node);
#endif

} // namespace MdTree

#endif // TERMMARK_MDTREE_H
