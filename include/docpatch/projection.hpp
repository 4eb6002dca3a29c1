/// @file projection.hpp
/// @brief Flat text projection of a document tree with reverse lookup.

#pragma once

#include <docpatch/node.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace docpatch {

/// A resolved, non-empty byte range [start, end) of the flat projection.
struct Span {
    std::size_t start{0};  ///< First byte (inclusive).
    std::size_t end{0};    ///< One past the last byte (exclusive).

    auto size() const -> std::size_t { return end - start; }

    auto operator==(const Span&) const -> bool = default;
    auto operator<=>(const Span&) const = default;
};

/// One inline leaf in the projection's offset table.
struct RunEntry {
    std::size_t flat_start{0};  ///< Flat offset of the leaf's first byte.
    std::size_t flat_end{0};    ///< Flat offset one past its last byte.
    NodePath path;              ///< Path from the root to the leaf.
    std::size_t block{0};       ///< Index into Projection::blocks.

    auto operator==(const RunEntry&) const -> bool = default;
};

/// One text block (paragraph, heading, code block) in document order.
struct BlockEntry {
    std::size_t flat_start{0};  ///< Flat offset where the block's text starts.
    std::size_t flat_end{0};    ///< Flat offset where the block's text ends.
    NodePath path;              ///< Path from the root to the block.
    NodeType type{NodeType::paragraph};

    auto size() const -> std::size_t { return flat_end - flat_start; }

    auto operator==(const BlockEntry&) const -> bool = default;
};

/// A position inside the tree: the leaf holding a flat offset.
struct TreePosition {
    NodePath path;            ///< Path to the inline leaf.
    std::size_t run_offset;   ///< Byte offset inside that leaf.

    auto operator==(const TreePosition&) const -> bool = default;
};

/// The flat text of a document plus the tables that map it back.
///
/// Block boundaries contribute no characters, so text can be matched
/// without regard to run boundaries. A projection is a disposable value:
/// it describes one tree state and must be rebuilt after every mutation.
struct Projection {
    std::string text;               ///< All inline content in document order.
    std::vector<RunEntry> runs;     ///< Non-empty leaves, sorted by flat_start.
    std::vector<BlockEntry> blocks; ///< Text blocks in document order.

    /// The run containing the byte at `offset`, or nullptr past the end.
    auto run_at(std::size_t offset) const -> const RunEntry*;

    /// The leaf and intra-leaf offset of the byte at `offset`.
    auto position_at(std::size_t offset) const -> std::optional<TreePosition>;

    /// Index of the text block holding the byte at `offset`.
    auto block_at(std::size_t offset) const -> std::optional<std::size_t>;

    /// Index of the text block holding all of `span`, or nullopt when the
    /// span crosses a block boundary.
    auto block_of(const Span& span) const -> std::optional<std::size_t>;

    auto operator==(const Projection&) const -> bool = default;
};

/// Project a document tree into flat text (depth-first, left to right).
auto project(const Node& root) -> Projection;

}  // namespace docpatch
