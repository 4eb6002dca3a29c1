#pragma once

// Edit executors: one per EditRequest alternative.
//
// Every executor validates its request and locates its target against a
// fresh projection of `document` before touching it, so a failed edit
// leaves the tree exactly as it was.
//
// Internal header, not installed.

#include <docpatch/edit.hpp>
#include <docpatch/engine.hpp>
#include <docpatch/error.hpp>
#include <docpatch/node.hpp>
#include <docpatch/projection.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace docpatch::detail {

// Apply `edit` to `document`. Returns the error that made it a skip, or
// nullopt when it was applied. Non-fatal notes go to `warnings`.
auto execute(Node& document, const EditRequest& edit, const Options& options,
             std::vector<std::string>& warnings) -> std::optional<Error>;

// Resolve one anchor text to the flat offset it denotes: the end of the
// match for an after-anchor, its start for a before-anchor.
auto resolve_anchor(const Projection& projection, const std::string& text,
                    std::optional<std::size_t> occurrence_index, bool after,
                    const LocatorOptions& options) -> std::variant<std::size_t, Error>;

}  // namespace docpatch::detail
