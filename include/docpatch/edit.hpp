/// @file edit.hpp
/// @brief Edit requests: the operations a batch may contain.

#pragma once

#include <docpatch/locator.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace docpatch {

/// A boundary given by nearby text rather than by offset.
///
/// `after_text` selects the end of the matched text, `before_text` its
/// start. Repeated anchors are disambiguated with `occurrence_index`.
struct Anchor {
    std::optional<std::string> after_text;        ///< Position after this text.
    std::optional<std::string> before_text;       ///< Position before this text.
    std::optional<std::size_t> occurrence_index;  ///< 1-based, for repeated anchors.

    auto operator==(const Anchor&) const -> bool = default;
};

/// The two boundaries of a section rewrite.
///
/// `occurrence_index` applies to both anchors unless a side carries its
/// own override.
struct AnchorPair {
    std::optional<std::string> after_text;         ///< Region starts after this text.
    std::optional<std::string> before_text;        ///< Region ends before this text.
    std::optional<std::size_t> occurrence_index;   ///< Shared 1-based occurrence.
    std::optional<std::size_t> after_occurrence;   ///< Override for after_text.
    std::optional<std::size_t> before_occurrence;  ///< Override for before_text.

    auto operator==(const AnchorPair&) const -> bool = default;
};

// -- Operation kinds ----------------------------------------------------------

/// Replace located text with new text.
struct ReplaceEdit {
    LocatorQuery find;         ///< The text to replace.
    std::string replace_text;  ///< Replacement; empty deletes.
    bool replace_all{false};   ///< Rewrite every candidate.

    auto operator==(const ReplaceEdit&) const -> bool = default;
};

/// Insert text next to an anchor.
struct InsertEdit {
    std::string text;  ///< Text to insert.
    Anchor anchor;     ///< Exactly one of after_text / before_text.

    auto operator==(const InsertEdit&) const -> bool = default;
};

/// Remove located text.
struct DeleteEdit {
    LocatorQuery target;  ///< The text to delete.

    auto operator==(const DeleteEdit&) const -> bool = default;
};

/// Add a mark to located text.
struct AddMarkEdit {
    LocatorQuery target;    ///< The text to format.
    std::string mark_type;  ///< Schema mark name, validated at execution.

    auto operator==(const AddMarkEdit&) const -> bool = default;
};

/// Remove a mark from located text.
struct RemoveMarkEdit {
    LocatorQuery target;    ///< The text to unformat.
    std::string mark_type;  ///< Schema mark name, validated at execution.

    auto operator==(const RemoveMarkEdit&) const -> bool = default;
};

/// Swap one mark for another on located text, atomically.
struct ReplaceMarkEdit {
    LocatorQuery target;        ///< The text to reformat.
    std::string old_mark_type;  ///< Mark to remove.
    std::string new_mark_type;  ///< Mark to add.

    auto operator==(const ReplaceMarkEdit&) const -> bool = default;
};

/// Add a new block next to the block holding an anchor.
struct AddParagraphEdit {
    std::string content;                     ///< Text of the new block.
    std::string paragraph_type{"paragraph"}; ///< Block type name.
    std::optional<int> heading_level;        ///< Required for headings.
    Anchor anchor;                           ///< No anchor appends at the end.

    auto operator==(const AddParagraphEdit&) const -> bool = default;
};

/// A single edit of a batch.
using EditRequest = std::variant<
    ReplaceEdit,
    InsertEdit,
    DeleteEdit,
    AddMarkEdit,
    RemoveMarkEdit,
    ReplaceMarkEdit,
    AddParagraphEdit
>;

/// The snake_case name of an edit's operation kind.
auto edit_type_name(const EditRequest& edit) -> std::string_view;

/// Normalize an edit type spelling ("addMark", "add-mark", "AddMark")
/// to its snake_case form ("add_mark").
auto normalize_edit_type(std::string_view type) -> std::string;

}  // namespace docpatch
