/// @file json.hpp
/// @brief nlohmann/json interoperability for docpatch.
///
/// Provides ADL serialization (to_json/from_json) for document trees in
/// ProseMirror JSON form, for edit requests in the editing tool's field
/// names, and for results and options.

#pragma once

#include <docpatch/edit.hpp>
#include <docpatch/engine.hpp>
#include <docpatch/error.hpp>
#include <docpatch/mark.hpp>
#include <docpatch/node.hpp>
#include <docpatch/patch.hpp>
#include <docpatch/value.hpp>

#include <nlohmann/json.hpp>

#include <vector>

namespace docpatch {

// =============================================================================
// Document tree
// =============================================================================

void to_json(nlohmann::json& j, const AttrValue& v);
void from_json(const nlohmann::json& j, AttrValue& v);

void to_json(nlohmann::json& j, MarkType m);
void from_json(const nlohmann::json& j, MarkType& m);

void to_json(nlohmann::json& j, const MarkSet& marks);
void from_json(const nlohmann::json& j, MarkSet& marks);

/// Serialize a tree as ProseMirror JSON.
///
/// `{"type":"paragraph","content":[{"type":"text","text":"Hi",
/// "marks":[{"type":"bold"}]}]}`. Empty `content`, `attrs` and `marks`
/// are omitted.
void to_json(nlohmann::json& j, const Node& node);

/// Parse ProseMirror JSON.
/// @throws std::runtime_error on unknown node or mark types, or on a
/// value of the wrong JSON type.
void from_json(const nlohmann::json& j, Node& node);

// =============================================================================
// Requests
// =============================================================================

void to_json(nlohmann::json& j, const Anchor& a);
void from_json(const nlohmann::json& j, Anchor& a);

void to_json(nlohmann::json& j, const AnchorPair& a);
void from_json(const nlohmann::json& j, AnchorPair& a);

/// Serialize an edit as a flat tool-contract object with a "type" field.
void to_json(nlohmann::json& j, const EditRequest& edit);

/// Parse a tool-contract edit object.
///
/// The "type" field is normalized first, so "addMark" and "add_mark" are
/// the same. A replace edit may carry its replacement in "content".
/// @throws std::runtime_error on a missing or unknown type.
void from_json(const nlohmann::json& j, EditRequest& edit);

// =============================================================================
// Results and configuration
// =============================================================================

void to_json(nlohmann::json& j, const Error& e);
void to_json(nlohmann::json& j, const SkippedEdit& s);
void to_json(nlohmann::json& j, const PatchResult& r);

void to_json(nlohmann::json& j, const LocatorOptions& o);
void from_json(const nlohmann::json& j, LocatorOptions& o);

void to_json(nlohmann::json& j, const Options& o);

/// Parse engine options. Missing keys keep their defaults.
void from_json(const nlohmann::json& j, Options& o);

// =============================================================================
// Convenience
// =============================================================================

/// Parse a JSON array of edits.
/// @throws std::runtime_error if `j` is not an array or an edit is invalid.
auto parse_edits(const nlohmann::json& j) -> std::vector<EditRequest>;

}  // namespace docpatch
