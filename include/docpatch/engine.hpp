/// @file engine.hpp
/// @brief PatchEngine -- the primary API for docpatch.

#pragma once

#include <docpatch/edit.hpp>
#include <docpatch/locator.hpp>
#include <docpatch/node.hpp>
#include <docpatch/patch.hpp>

#include <cstddef>
#include <span>
#include <string_view>
#include <vector>

namespace docpatch {

/// Engine configuration.
struct Options {
    LocatorOptions locator;           ///< How literals and contexts match.
    std::size_t max_diff_cost{2048};  ///< Edit-cost cap for the rewrite diff.
    std::size_t max_rewrite_bytes{0}; ///< Largest rewrite region; 0 = unlimited.
    bool parse_style_tags{true};      ///< Honor [b]/[i]/[u]/[code] in rewrite text.

    auto operator==(const Options&) const -> bool = default;
};

/// One document and the edits to apply to it, for apply_edits_many().
struct DocumentBatch {
    Node document;
    std::vector<EditRequest> edits;
};

/// Applies edit batches and section rewrites to document trees.
///
/// The engine holds configuration only; every call takes a tree by value
/// and returns the resulting tree in its PatchResult, so one engine can
/// serve any number of documents and threads.
///
/// @code
/// auto engine = PatchEngine{};
/// auto edits = std::vector<EditRequest>{
///     ReplaceEdit{.find = {.literal = "contract"}, .replace_text = "agreement"},
/// };
/// auto result = engine.apply_edits(std::move(doc), edits);
/// for (const auto& s : result.skipped) { ... }
/// @endcode
class PatchEngine {
public:
    /// Construct with default options.
    PatchEngine() = default;

    /// Construct with explicit options.
    explicit PatchEngine(Options options);

    /// The options this engine was built with.
    auto options() const -> const Options& { return options_; }

    /// Apply a batch of edits in request order.
    ///
    /// Each edit is validated, then located against a fresh projection of
    /// the tree as mutated by the edits before it. Edits that fail are
    /// reported in `skipped` and do not stop the batch.
    /// @param document The current tree.
    /// @param edits The batch.
    auto apply_edits(Node document, std::span<const EditRequest> edits) const
        -> PatchResult;

    /// Rewrite the region between two anchors with `target_text`.
    ///
    /// Only the words that differ are touched, so formatting of unchanged
    /// words survives. Any failure to resolve the region fails the whole
    /// call and returns the input tree.
    auto rewrite_section(Node document, const AnchorPair& anchors,
                         std::string_view target_text) const -> PatchResult;

    /// Apply independent batches concurrently.
    ///
    /// Results are returned in input order.
    auto apply_edits_many(std::vector<DocumentBatch> batches) const
        -> std::vector<PatchResult>;

private:
    Options options_;
};

/// Apply a batch with default options.
auto apply_edits(Node document, std::span<const EditRequest> edits) -> PatchResult;

/// Rewrite a section with default options.
auto rewrite_section(Node document, const AnchorPair& anchors,
                     std::string_view target_text) -> PatchResult;

}  // namespace docpatch
