/// @file diff.hpp
/// @brief Word-level text diff used by section rewrites.

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace docpatch {

/// What a diff run does to the old text.
enum class DiffOp : std::uint8_t {
    equal,   ///< Present in both texts.
    insert,  ///< Only in the new text.
    del,     ///< Only in the old text.
};

/// Convert a DiffOp to its string representation.
constexpr auto to_string_view(DiffOp op) noexcept -> std::string_view {
    switch (op) {
        case DiffOp::equal:  return "equal";
        case DiffOp::insert: return "insert";
        case DiffOp::del:    return "delete";
    }
    return "unknown";
}

/// A maximal contiguous block of equal, inserted or deleted text.
struct DiffRun {
    DiffOp op;         ///< What happened to this text.
    std::string text;  ///< The concatenated tokens of the run.

    auto operator==(const DiffRun&) const -> bool = default;
};

/// The paragraph separator token. Two or more newlines tokenize to it.
inline constexpr std::string_view paragraph_separator = "\n\n";

/// Split text into diff tokens: words, runs of spaces/tabs, single
/// newlines and paragraph separators.
///
/// Tokens are views into `text`, except that paragraph separators are
/// always the canonical `paragraph_separator` view. With `paragraphs`
/// false every newline is its own token and no separator is produced.
auto tokenize(std::string_view text, bool paragraphs = true)
    -> std::vector<std::string_view>;

/// One run of a token diff, as index ranges into the token sequences.
///
/// `equal` runs carry both ranges; `del` runs only the old range and
/// `insert` runs only the new range (the other range is empty).
struct DiffHunk {
    DiffOp op;
    std::size_t old_begin{0};
    std::size_t old_end{0};
    std::size_t new_begin{0};
    std::size_t new_end{0};

    auto operator==(const DiffHunk&) const -> bool = default;
};

/// Diff two token sequences into hunks.
///
/// Myers' O(ND) algorithm after trimming the common prefix and suffix.
/// If more than `max_cost` edits would be needed, the untrimmed middle is
/// reported as one delete followed by one insert. Hunks come out in
/// document order; inside a change, the delete precedes the insert.
auto diff_hunks(const std::vector<std::string_view>& old_tokens,
                const std::vector<std::string_view>& new_tokens,
                std::size_t max_cost = 2048) -> std::vector<DiffHunk>;

/// Diff two token sequences into text runs (see diff_hunks()).
auto diff_tokens(const std::vector<std::string_view>& old_tokens,
                 const std::vector<std::string_view>& new_tokens,
                 std::size_t max_cost = 2048) -> std::vector<DiffRun>;

/// Tokenize both texts and diff them.
auto diff_text(std::string_view old_text, std::string_view new_text,
               std::size_t max_cost = 2048) -> std::vector<DiffRun>;

}  // namespace docpatch
