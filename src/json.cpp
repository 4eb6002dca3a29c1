#include <docpatch/json.hpp>

#include <cstddef>
#include <cstdint>
#include <exception>
#include <limits>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace docpatch {

// =============================================================================
// Shared helpers
// =============================================================================

namespace {

auto optional_string(const nlohmann::json& j, const char* key) -> std::optional<std::string> {
    if (!j.contains(key) || j[key].is_null()) return std::nullopt;
    if (!j[key].is_string()) {
        throw std::runtime_error{std::string{"field '"} + key + "' must be a string"};
    }
    return j[key].get<std::string>();
}

auto string_or_empty(const nlohmann::json& j, const char* key) -> std::string {
    return optional_string(j, key).value_or(std::string{});
}

auto optional_int(const nlohmann::json& j, const char* key) -> std::optional<std::int64_t> {
    if (!j.contains(key) || j[key].is_null()) return std::nullopt;
    if (!j[key].is_number_integer()) {
        throw std::runtime_error{std::string{"field '"} + key + "' must be an integer"};
    }
    return j[key].get<std::int64_t>();
}

auto optional_count(const nlohmann::json& j, const char* key) -> std::optional<std::size_t> {
    auto value = optional_int(j, key);
    if (!value) return std::nullopt;
    if (*value < 0) {
        throw std::runtime_error{std::string{"field '"} + key + "' must not be negative"};
    }
    return static_cast<std::size_t>(*value);
}

auto optional_bool(const nlohmann::json& j, const char* key) -> std::optional<bool> {
    if (!j.contains(key) || j[key].is_null()) return std::nullopt;
    if (!j[key].is_boolean()) {
        throw std::runtime_error{std::string{"field '"} + key + "' must be a boolean"};
    }
    return j[key].get<bool>();
}

template <typename T>
void put_optional(nlohmann::json& j, const char* key, const std::optional<T>& value) {
    if (value) j[key] = *value;
}

// Locator fields share names across every edit kind; only the literal's
// key differs.
auto query_from(const nlohmann::json& j, const char* literal_key) -> LocatorQuery {
    return LocatorQuery{
        .literal = string_or_empty(j, literal_key),
        .context_before = optional_string(j, "contextBefore"),
        .context_after = optional_string(j, "contextAfter"),
        .occurrence_index = optional_count(j, "occurrenceIndex"),
        .max_occurrences = optional_count(j, "maxOccurrences"),
    };
}

void query_to(nlohmann::json& j, const char* literal_key, const LocatorQuery& q) {
    j[literal_key] = q.literal;
    put_optional(j, "contextBefore", q.context_before);
    put_optional(j, "contextAfter", q.context_after);
    put_optional(j, "occurrenceIndex", q.occurrence_index);
    put_optional(j, "maxOccurrences", q.max_occurrences);
}

auto anchor_from(const nlohmann::json& j) -> Anchor {
    return Anchor{
        .after_text = optional_string(j, "afterText"),
        .before_text = optional_string(j, "beforeText"),
        .occurrence_index = optional_count(j, "occurrenceIndex"),
    };
}

}  // anonymous namespace

// =============================================================================
// Document tree
// =============================================================================

void to_json(nlohmann::json& j, const AttrValue& v) {
    std::visit(overload{
        [&](Null) { j = nullptr; },
        [&](bool b) { j = b; },
        [&](std::int64_t i) { j = i; },
        [&](double d) { j = d; },
        [&](const std::string& s) { j = s; },
    }, v);
}

void from_json(const nlohmann::json& j, AttrValue& v) {
    if (j.is_null()) {
        v = Null{};
    } else if (j.is_boolean()) {
        v = j.get<bool>();
    } else if (j.is_number_unsigned()) {
        auto val = j.get<std::uint64_t>();
        if (val > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            throw std::runtime_error{"attribute value out of range"};
        }
        v = static_cast<std::int64_t>(val);
    } else if (j.is_number_integer()) {
        v = j.get<std::int64_t>();
    } else if (j.is_number_float()) {
        v = j.get<double>();
    } else if (j.is_string()) {
        v = j.get<std::string>();
    } else {
        throw std::runtime_error{"cannot convert JSON to an attribute value"};
    }
}

void to_json(nlohmann::json& j, MarkType m) {
    j = std::string{to_string_view(m)};
}

void from_json(const nlohmann::json& j, MarkType& m) {
    // ProseMirror writes marks as {"type": "bold"}; a bare name is accepted too.
    auto name = std::string{};
    if (j.is_string()) {
        name = j.get<std::string>();
    } else if (auto named = j.is_object() ? optional_string(j, "type") : std::nullopt) {
        name = *named;
    } else {
        throw std::runtime_error{"mark type must be a string"};
    }
    auto parsed = parse_mark_type(name);
    if (!parsed) throw std::runtime_error{"unknown mark type: " + name};
    m = *parsed;
}

void to_json(nlohmann::json& j, const MarkSet& marks) {
    j = nlohmann::json::array();
    for (auto m : marks.to_vector()) {
        j.push_back(nlohmann::json{{"type", std::string{to_string_view(m)}}});
    }
}

void from_json(const nlohmann::json& j, MarkSet& marks) {
    if (!j.is_array()) throw std::runtime_error{"marks must be an array"};
    marks = MarkSet{};
    for (const auto& item : j) {
        auto m = MarkType{};
        from_json(item, m);
        marks.add(m);
    }
}

void to_json(nlohmann::json& j, const Node& node) {
    j = nlohmann::json{{"type", std::string{to_string_view(node.type)}}};
    if (!node.attrs.empty()) {
        auto attrs = nlohmann::json::object();
        for (const auto& [key, value] : node.attrs) {
            to_json(attrs[key], value);
        }
        j["attrs"] = std::move(attrs);
    }
    if (node.type == NodeType::text) {
        j["text"] = node.text;
        if (!node.marks.empty()) to_json(j["marks"], node.marks);
        return;
    }
    if (!node.children.empty()) {
        auto content = nlohmann::json::array();
        for (const auto& child : node.children) {
            auto c = nlohmann::json{};
            to_json(c, child);
            content.push_back(std::move(c));
        }
        j["content"] = std::move(content);
    }
}

void from_json(const nlohmann::json& j, Node& node) {
    if (!j.is_object()) throw std::runtime_error{"node must be an object"};
    const auto name = optional_string(j, "type");
    if (!name) throw std::runtime_error{"node is missing its type"};
    auto type = parse_node_type(*name);
    if (!type) throw std::runtime_error{"unknown node type: " + *name};

    node = Node{};
    node.type = *type;
    if (j.contains("attrs") && !j["attrs"].is_null()) {
        if (!j["attrs"].is_object()) throw std::runtime_error{"attrs must be an object"};
        for (const auto& [key, value] : j["attrs"].items()) {
            from_json(value, node.attrs[key]);
        }
    }
    if (*type == NodeType::text) {
        auto text = optional_string(j, "text");
        if (!text) throw std::runtime_error{"text node is missing its text"};
        node.text = std::move(*text);
        if (j.contains("marks")) from_json(j["marks"], node.marks);
        return;
    }
    if (j.contains("content")) {
        if (!j["content"].is_array()) throw std::runtime_error{"content must be an array"};
        node.children.reserve(j["content"].size());
        for (const auto& child : j["content"]) {
            auto& c = node.children.emplace_back();
            from_json(child, c);
        }
    }
}

// =============================================================================
// Requests
// =============================================================================

void to_json(nlohmann::json& j, const Anchor& a) {
    j = nlohmann::json::object();
    put_optional(j, "afterText", a.after_text);
    put_optional(j, "beforeText", a.before_text);
    put_optional(j, "occurrenceIndex", a.occurrence_index);
}

void from_json(const nlohmann::json& j, Anchor& a) {
    if (!j.is_object()) throw std::runtime_error{"anchor must be an object"};
    a = anchor_from(j);
}

void to_json(nlohmann::json& j, const AnchorPair& a) {
    j = nlohmann::json::object();
    put_optional(j, "afterText", a.after_text);
    put_optional(j, "beforeText", a.before_text);
    put_optional(j, "occurrenceIndex", a.occurrence_index);
    put_optional(j, "afterOccurrenceIndex", a.after_occurrence);
    put_optional(j, "beforeOccurrenceIndex", a.before_occurrence);
}

void from_json(const nlohmann::json& j, AnchorPair& a) {
    if (!j.is_object()) throw std::runtime_error{"anchors must be an object"};
    a = AnchorPair{
        .after_text = optional_string(j, "afterText"),
        .before_text = optional_string(j, "beforeText"),
        .occurrence_index = optional_count(j, "occurrenceIndex"),
        .after_occurrence = optional_count(j, "afterOccurrenceIndex"),
        .before_occurrence = optional_count(j, "beforeOccurrenceIndex"),
    };
}

void to_json(nlohmann::json& j, const EditRequest& edit) {
    j = nlohmann::json{{"type", std::string{edit_type_name(edit)}}};
    std::visit(overload{
        [&](const ReplaceEdit& e) {
            query_to(j, "findText", e.find);
            j["replaceText"] = e.replace_text;
            if (e.replace_all) j["replaceAll"] = true;
        },
        [&](const InsertEdit& e) {
            j["insertText"] = e.text;
            put_optional(j, "afterText", e.anchor.after_text);
            put_optional(j, "beforeText", e.anchor.before_text);
            put_optional(j, "occurrenceIndex", e.anchor.occurrence_index);
        },
        [&](const DeleteEdit& e) {
            query_to(j, "deleteText", e.target);
        },
        [&](const AddMarkEdit& e) {
            query_to(j, "text", e.target);
            j["markType"] = e.mark_type;
        },
        [&](const RemoveMarkEdit& e) {
            query_to(j, "text", e.target);
            j["markType"] = e.mark_type;
        },
        [&](const ReplaceMarkEdit& e) {
            query_to(j, "text", e.target);
            j["oldMarkType"] = e.old_mark_type;
            j["newMarkType"] = e.new_mark_type;
        },
        [&](const AddParagraphEdit& e) {
            j["content"] = e.content;
            j["paragraphType"] = e.paragraph_type;
            put_optional(j, "headingLevel", e.heading_level);
            put_optional(j, "afterText", e.anchor.after_text);
            put_optional(j, "beforeText", e.anchor.before_text);
            put_optional(j, "occurrenceIndex", e.anchor.occurrence_index);
        },
    }, edit);
}

void from_json(const nlohmann::json& j, EditRequest& edit) {
    if (!j.is_object()) throw std::runtime_error{"edit must be an object"};
    const auto raw = optional_string(j, "type");
    if (!raw) throw std::runtime_error{"edit is missing its type"};
    const auto type = normalize_edit_type(*raw);

    if (type == "replace") {
        auto replacement = optional_string(j, "replaceText");
        if (!replacement) replacement = optional_string(j, "content");
        edit = ReplaceEdit{
            .find = query_from(j, "findText"),
            .replace_text = replacement.value_or(std::string{}),
            .replace_all = optional_bool(j, "replaceAll").value_or(false),
        };
    } else if (type == "insert") {
        edit = InsertEdit{.text = string_or_empty(j, "insertText"), .anchor = anchor_from(j)};
    } else if (type == "delete") {
        edit = DeleteEdit{.target = query_from(j, "deleteText")};
    } else if (type == "add_mark") {
        edit = AddMarkEdit{.target = query_from(j, "text"), .mark_type = string_or_empty(j, "markType")};
    } else if (type == "remove_mark") {
        edit = RemoveMarkEdit{.target = query_from(j, "text"), .mark_type = string_or_empty(j, "markType")};
    } else if (type == "replace_mark") {
        edit = ReplaceMarkEdit{
            .target = query_from(j, "text"),
            .old_mark_type = string_or_empty(j, "oldMarkType"),
            .new_mark_type = string_or_empty(j, "newMarkType"),
        };
    } else if (type == "add_paragraph") {
        auto level = optional_int(j, "headingLevel");
        if (level && (*level < std::numeric_limits<int>::min() || *level > std::numeric_limits<int>::max())) {
            throw std::runtime_error{"field 'headingLevel' out of range"};
        }
        edit = AddParagraphEdit{
            .content = string_or_empty(j, "content"),
            .paragraph_type = optional_string(j, "paragraphType").value_or("paragraph"),
            .heading_level = level ? std::optional<int>{static_cast<int>(*level)} : std::nullopt,
            .anchor = anchor_from(j),
        };
    } else {
        throw std::runtime_error{"unsupported edit type: " + *raw};
    }
}

// =============================================================================
// Results and configuration
// =============================================================================

void to_json(nlohmann::json& j, const Error& e) {
    j = nlohmann::json{
        {"kind", std::string{to_string_view(e.kind)}},
        {"message", e.message},
    };
}

void to_json(nlohmann::json& j, const SkippedEdit& s) {
    j = nlohmann::json{
        {"index", s.index},
        {"reason", std::string{to_string_view(s.reason)}},
        {"message", s.message},
    };
}

void to_json(nlohmann::json& j, const PatchResult& r) {
    auto skipped = nlohmann::json::array();
    for (const auto& s : r.skipped) {
        auto item = nlohmann::json{};
        to_json(item, s);
        skipped.push_back(std::move(item));
    }
    auto document = nlohmann::json{};
    to_json(document, r.document);

    j = nlohmann::json{
        {"ok", r.ok},
        {"appliedCount", r.applied_count},
        {"skipped", std::move(skipped)},
        {"warnings", r.warnings},
        {"document", std::move(document)},
    };
    if (r.error) to_json(j["error"], *r.error);
}

void to_json(nlohmann::json& j, const LocatorOptions& o) {
    j = nlohmann::json{
        {"contextWindow", o.context_window},
        {"wholeWord", o.whole_word},
        {"normalizeTypography", o.normalize_typography},
        {"collapseWhitespace", o.collapse_whitespace},
    };
}

void from_json(const nlohmann::json& j, LocatorOptions& o) {
    if (!j.is_object()) throw std::runtime_error{"locator options must be an object"};
    o.context_window = optional_count(j, "contextWindow").value_or(o.context_window);
    o.whole_word = optional_bool(j, "wholeWord").value_or(o.whole_word);
    o.normalize_typography = optional_bool(j, "normalizeTypography").value_or(o.normalize_typography);
    o.collapse_whitespace = optional_bool(j, "collapseWhitespace").value_or(o.collapse_whitespace);
}

void to_json(nlohmann::json& j, const Options& o) {
    auto locator = nlohmann::json{};
    to_json(locator, o.locator);
    j = nlohmann::json{
        {"locator", std::move(locator)},
        {"maxDiffCost", o.max_diff_cost},
        {"maxRewriteBytes", o.max_rewrite_bytes},
        {"parseStyleTags", o.parse_style_tags},
    };
}

void from_json(const nlohmann::json& j, Options& o) {
    if (!j.is_object()) throw std::runtime_error{"options must be an object"};
    if (j.contains("locator")) from_json(j["locator"], o.locator);
    o.max_diff_cost = optional_count(j, "maxDiffCost").value_or(o.max_diff_cost);
    o.max_rewrite_bytes = optional_count(j, "maxRewriteBytes").value_or(o.max_rewrite_bytes);
    o.parse_style_tags = optional_bool(j, "parseStyleTags").value_or(o.parse_style_tags);
}

// =============================================================================
// Convenience
// =============================================================================

auto parse_edits(const nlohmann::json& j) -> std::vector<EditRequest> {
    if (!j.is_array()) throw std::runtime_error{"edits must be an array"};
    auto edits = std::vector<EditRequest>{};
    edits.reserve(j.size());
    for (std::size_t i = 0; i < j.size(); ++i) {
        try {
            from_json(j[i], edits.emplace_back());
        } catch (const std::exception& e) {
            throw std::runtime_error{"edit " + std::to_string(i) + ": " + e.what()};
        }
    }
    return edits;
}

}  // namespace docpatch
