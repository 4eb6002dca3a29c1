/// @file error.hpp
/// @brief Error types for the docpatch library.

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace docpatch {

/// Categories of errors that can occur while locating or applying edits.
enum class ErrorKind : std::uint8_t {
    not_found,               ///< The literal or anchor text does not occur.
    ambiguous,               ///< Several candidates and no disambiguator.
    invalid_mark_type,       ///< The request names an unsupported mark.
    invalid_paragraph_type,  ///< The request names an unsupported block type.
    invalid_heading_level,   ///< A heading level outside 1..6.
    cross_block_literal,     ///< The search text spans a block boundary.
    empty_region,            ///< Both rewrite anchors resolve to the same offset.
    invalid_anchors,         ///< The before anchor precedes the after anchor.
    region_too_large,        ///< The rewrite region exceeds the configured cap.
    invalid_edit,            ///< A required field is missing or out of range.
    invalid_document,        ///< The document tree is malformed.
};

/// Convert an ErrorKind to its string representation.
constexpr auto to_string_view(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::not_found:              return "not_found";
        case ErrorKind::ambiguous:              return "ambiguous";
        case ErrorKind::invalid_mark_type:      return "invalid_mark_type";
        case ErrorKind::invalid_paragraph_type: return "invalid_paragraph_type";
        case ErrorKind::invalid_heading_level:  return "invalid_heading_level";
        case ErrorKind::cross_block_literal:    return "cross_block_literal";
        case ErrorKind::empty_region:           return "empty_region";
        case ErrorKind::invalid_anchors:        return "invalid_anchors";
        case ErrorKind::region_too_large:       return "region_too_large";
        case ErrorKind::invalid_edit:           return "invalid_edit";
        case ErrorKind::invalid_document:       return "invalid_document";
    }
    return "unknown";
}

/// A structured error with a category and a human-readable message.
struct Error {
    ErrorKind kind;      ///< The category of this error.
    std::string message; ///< A human-readable description.

    /// Construct an Error with the given kind and message.
    Error(ErrorKind k, std::string msg)
        : kind{k}, message{std::move(msg)} {}

    auto operator==(const Error& other) const -> bool = default;
};

}  // namespace docpatch
