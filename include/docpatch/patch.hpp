/// @file patch.hpp
/// @brief The outcome of a batch or rewrite call.

#pragma once

#include <docpatch/error.hpp>
#include <docpatch/node.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace docpatch {

/// An edit of a batch that was not applied, and why.
struct SkippedEdit {
    std::size_t index;    ///< 0-based position in the request batch.
    ErrorKind reason;     ///< The failure category.
    std::string message;  ///< Details for whoever retries the edit.

    auto operator==(const SkippedEdit&) const -> bool = default;
};

/// The result of PatchEngine::apply_edits() or rewrite_section().
///
/// `document` always holds the tree the caller should keep: the edited
/// tree on success, the untouched input when a structural precondition
/// failed (`ok == false`, `error` set).
struct PatchResult {
    bool ok{true};                          ///< False only for structural failures.
    std::size_t applied_count{0};           ///< Edits that changed the tree.
    std::vector<SkippedEdit> skipped;       ///< Edits left out, in batch order.
    std::vector<std::string> warnings;      ///< Non-fatal notes about requests.
    Node document;                          ///< The resulting tree.
    std::optional<Error> error;             ///< Set when ok is false.

    auto operator==(const PatchResult&) const -> bool = default;
};

}  // namespace docpatch
