#pragma once

// Anchor-bounded section rewrite via a word-level diff merge.
//
// Internal header, not installed.

#include <docpatch/edit.hpp>
#include <docpatch/engine.hpp>
#include <docpatch/error.hpp>
#include <docpatch/mark.hpp>
#include <docpatch/node.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace docpatch::detail {

// Target text with [b] [i] [u] [code] tags removed. `marks` holds the
// active marks of every byte of `text`.
struct StyledText {
    std::string text;
    std::vector<MarkSet> marks;
    bool tagged{false};  // at least one tag was seen
};

auto parse_style_tags(std::string_view input) -> StyledText;

// Rewrite the region between `anchors` so its text reads `target`.
// On failure `document` is left as it was.
auto rewrite(Node& document, const AnchorPair& anchors, std::string_view target,
             const Options& options) -> std::optional<Error>;

}  // namespace docpatch::detail
