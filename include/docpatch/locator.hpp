/// @file locator.hpp
/// @brief Span Locator: find literal text in a projection and resolve
/// which occurrence an edit targets.

#pragma once

#include <docpatch/error.hpp>
#include <docpatch/projection.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace docpatch {

/// What to look for and how to pick among repeated matches.
struct LocatorQuery {
    std::string literal;                         ///< Exact text to find.
    std::optional<std::string> context_before;   ///< Must occur just before the match.
    std::optional<std::string> context_after;    ///< Must occur just after the match.
    std::optional<std::size_t> occurrence_index; ///< 1-based candidate to pick.
    std::optional<std::size_t> max_occurrences;  ///< Pick the first K candidates.

    auto operator==(const LocatorQuery&) const -> bool = default;
};

/// Matching behavior shared by every query of an engine.
struct LocatorOptions {
    /// Bytes on each side of a match searched for the context strings.
    std::size_t context_window{80};
    /// Reject matches flanked by letters or digits.
    bool whole_word{false};
    /// Fold NBSP, soft hyphens, zero-width characters, curly quotes and
    /// en/em dashes before comparing.
    bool normalize_typography{false};
    /// Compare runs of spaces, tabs and newlines as a single space.
    bool collapse_whitespace{false};

    auto operator==(const LocatorOptions&) const -> bool = default;
};

/// Either the selected spans (document order) or the reason for failure.
using LocateResult = std::variant<std::vector<Span>, Error>;

/// Find every occurrence of `literal`, ignoring block boundaries.
///
/// Occurrences may overlap. Spans that cross a text-block boundary are
/// included; use Projection::block_of() to tell them apart.
auto find_occurrences(const Projection& projection, std::string_view literal,
                      const LocatorOptions& options = {}) -> std::vector<Span>;

/// Resolve a query to the span(s) an edit should touch.
///
/// Returns a single span unless `max_occurrences` selects several. Never
/// guesses: multiple candidates without a disambiguator yield an
/// ambiguous Error.
auto locate(const Projection& projection, const LocatorQuery& query,
            const LocatorOptions& options = {}) -> LocateResult;

/// Every candidate that passes the block and context filters.
///
/// Occurrence selection is skipped; used for replace-all.
auto locate_all(const Projection& projection, const LocatorQuery& query,
                const LocatorOptions& options = {}) -> LocateResult;

}  // namespace docpatch
