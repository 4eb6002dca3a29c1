#pragma once

// Inline-content and block surgery shared by the edit executors and the
// section rewrite. Offsets are byte offsets local to one text block.
//
// Internal header, not installed.

#include <docpatch/mark.hpp>
#include <docpatch/node.hpp>
#include <docpatch/projection.hpp>

#include <cstddef>
#include <functional>
#include <string_view>
#include <vector>

namespace docpatch::detail {

using Inlines = std::vector<Node>;

// Total projected length of a text block's children.
auto inline_length(const Inlines& inlines) -> std::size_t;

// Copy of the content in [from, to), splitting runs at the edges.
auto slice_inline(const Inlines& inlines, std::size_t from, std::size_t to) -> Inlines;

// Replace [from, to) with `replacement` and normalize.
void splice_inline(Inlines& inlines, std::size_t from, std::size_t to, Inlines replacement);

// Drop empty text runs and merge neighbours with equal marks.
void normalize_inline(Inlines& inlines);

// Split runs at `from` and `to`, apply `update` to the marks of every
// text run in between, then normalize.
void update_marks(Inlines& inlines, std::size_t from, std::size_t to,
                  const std::function<void(MarkSet&)>& update);

// Marks of the character at `offset` (none for a hard break or past the end).
auto marks_at(const Inlines& inlines, std::size_t offset) -> MarkSet;

// Marks of the run `offset` falls strictly inside; none at a run boundary.
auto marks_inside(const Inlines& inlines, std::size_t offset) -> MarkSet;

// Build inline leaves for `text`. Newlines become hard breaks unless
// `literal_newlines` (code blocks keep them as text).
auto make_inline_text(std::string_view text, MarkSet marks, bool literal_newlines) -> Inlines;

// The text block node a projection entry refers to.
auto block_node(Node& root, const BlockEntry& block) -> Node&;

// Insert `block` as a sibling immediately before or after the node at `path`.
void insert_sibling(Node& root, const NodePath& path, Node block, bool after);

// Remove the node at `path`, then remove ancestors left without children
// (the root is never removed).
void remove_node(Node& root, NodePath path);

}  // namespace docpatch::detail
