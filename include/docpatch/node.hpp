/// @file node.hpp
/// @brief The rich-text document tree: Node, NodeType, NodePath.

#pragma once

#include <docpatch/error.hpp>
#include <docpatch/mark.hpp>
#include <docpatch/value.hpp>

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace docpatch {

/// The kinds of nodes a document tree may contain.
enum class NodeType : std::uint8_t {
    doc,           ///< The root container.
    paragraph,     ///< Text block.
    heading,       ///< Text block with a `level` attribute in 1..6.
    code_block,    ///< Text block whose newlines are literal text.
    blockquote,    ///< Container of blocks.
    bullet_list,   ///< Container of list items.
    ordered_list,  ///< Container of list items.
    list_item,     ///< Container of blocks.
    text,          ///< Inline text run carrying marks.
    hard_break,    ///< Inline line break, projected as "\n".
};

/// Convert a NodeType to its schema name (ProseMirror camelCase).
constexpr auto to_string_view(NodeType type) noexcept -> std::string_view {
    switch (type) {
        case NodeType::doc:          return "doc";
        case NodeType::paragraph:    return "paragraph";
        case NodeType::heading:      return "heading";
        case NodeType::code_block:   return "codeBlock";
        case NodeType::blockquote:   return "blockquote";
        case NodeType::bullet_list:  return "bulletList";
        case NodeType::ordered_list: return "orderedList";
        case NodeType::list_item:    return "listItem";
        case NodeType::text:         return "text";
        case NodeType::hard_break:   return "hardBreak";
    }
    return "unknown";
}

/// Parse a schema node name. Accepts camelCase and snake_case spellings.
auto parse_node_type(std::string_view name) -> std::optional<NodeType>;

/// True for inline leaves (text runs and hard breaks).
constexpr auto is_inline(NodeType type) noexcept -> bool {
    return type == NodeType::text || type == NodeType::hard_break;
}

/// True for blocks whose children are inline leaves.
constexpr auto is_textblock(NodeType type) noexcept -> bool {
    return type == NodeType::paragraph || type == NodeType::heading ||
           type == NodeType::code_block;
}

/// A node of the document tree.
///
/// Blocks use `attrs` and `children`; text runs use `text` and `marks`;
/// hard breaks use nothing. Documents are plain values: copying a Node
/// deep-copies the subtree.
///
/// @code
/// auto doc = make_doc({
///     make_heading(1, {make_text("Claim")}),
///     make_paragraph({make_text("The "), make_text("Plaintiff", {MarkType::bold})}),
/// });
/// @endcode
struct Node {
    NodeType type{NodeType::paragraph};  ///< What kind of node this is.
    Attrs attrs;                         ///< Block attributes.
    std::string text;                    ///< Text run content.
    MarkSet marks;                       ///< Text run marks.
    std::vector<Node> children;          ///< Block children.

    auto is_text() const -> bool { return type == NodeType::text; }
    auto is_inline() const -> bool { return docpatch::is_inline(type); }
    auto is_textblock() const -> bool { return docpatch::is_textblock(type); }

    /// The number of flat-projection bytes an inline leaf occupies.
    auto inline_size() const -> std::size_t {
        if (type == NodeType::text) return text.size();
        if (type == NodeType::hard_break) return 1;
        return 0;
    }

    /// The heading level, or nullopt for non-headings.
    auto heading_level() const -> std::optional<int>;

    auto operator==(const Node&) const -> bool = default;
};

/// Child indices leading from the root to a node.
using NodePath = std::vector<std::size_t>;

// -- Construction helpers -----------------------------------------------------

auto make_text(std::string text, MarkSet marks = {}) -> Node;
auto make_hard_break() -> Node;
auto make_paragraph(std::vector<Node> inlines = {}) -> Node;
auto make_heading(int level, std::vector<Node> inlines = {}) -> Node;
auto make_code_block(std::vector<Node> inlines = {}) -> Node;
auto make_block(NodeType type, std::vector<Node> children = {}) -> Node;
auto make_doc(std::vector<Node> blocks = {}) -> Node;

// -- Tree queries ---------------------------------------------------------------

/// Resolve a path from `root`. The path must be valid.
auto node_at(Node& root, const NodePath& path) -> Node&;
auto node_at(const Node& root, const NodePath& path) -> const Node&;

/// The concatenated inline content of a subtree (hard breaks as "\n").
auto text_content(const Node& node) -> std::string;

/// Check the structural invariants of a document tree.
///
/// The root must be a `doc`; containers hold blocks, text blocks hold
/// inline leaves, text runs are non-empty leaves, and headings carry a
/// level in 1..6.
/// @return nullopt if the tree is valid, otherwise an invalid_document Error.
auto validate_document(const Node& root) -> std::optional<Error>;

}  // namespace docpatch
