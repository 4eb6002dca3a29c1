#include "apply_edit.hpp"
#include "tree_ops.hpp"

#include <docpatch/locator.hpp>
#include <docpatch/projection.hpp>
#include <docpatch/value.hpp>

#include <algorithm>
#include <string>
#include <utility>
#include <variant>

namespace docpatch::detail {

namespace {

// -- Helpers --------------------------------------------------------------------

void note_query(const LocatorQuery& query, std::vector<std::string>& warnings) {
    if (query.occurrence_index && query.max_occurrences) {
        warnings.emplace_back("occurrenceIndex and maxOccurrences both given; using occurrenceIndex");
    }
}

// Keep the first of any overlapping spans (possible with repeated
// patterns such as "aa" in "aaa") so reverse-order splicing stays valid.
auto drop_overlaps(std::vector<Span> spans) -> std::vector<Span> {
    auto result = std::vector<Span>{};
    for (const auto& span : spans) {
        if (!result.empty() && span.start < result.back().end) continue;
        result.push_back(span);
    }
    return result;
}

// Locate, or report why not.
auto resolve(const Projection& projection, const LocatorQuery& query,
             const LocatorOptions& options, bool all) -> std::variant<std::vector<Span>, Error> {
    auto located = all ? locate_all(projection, query, options)
                       : locate(projection, query, options);
    if (auto* err = std::get_if<Error>(&located)) return *err;
    auto spans = drop_overlaps(std::get<std::vector<Span>>(std::move(located)));

    // Dropped overlaps do not count toward maxOccurrences.
    const auto limited = !all && query.max_occurrences && !query.occurrence_index;
    if (limited && spans.size() < *query.max_occurrences) {
        auto every = locate_all(projection, query, options);
        if (auto* err = std::get_if<Error>(&every)) return *err;
        spans = drop_overlaps(std::get<std::vector<Span>>(std::move(every)));
        spans.resize(std::min(*query.max_occurrences, spans.size()));
    }
    return spans;
}

auto require_mark(const std::string& name) -> std::variant<MarkType, Error> {
    if (auto mark = parse_mark_type(name)) return *mark;
    return Error{ErrorKind::invalid_mark_type,
                 "unsupported mark type \"" + name + "\"; expected bold, italic, underline, code or strike"};
}

// Apply `fn(block_inlines, local_from, local_to, block_type)` to each span,
// last span first, so earlier offsets stay valid.
template <typename Fn>
void for_each_span_reversed(Node& document, const Projection& projection,
                            const std::vector<Span>& spans, Fn&& fn) {
    for (auto it = spans.rbegin(); it != spans.rend(); ++it) {
        const auto& entry = projection.blocks[*projection.block_of(*it)];
        auto& block = block_node(document, entry);
        fn(block.children, it->start - entry.flat_start, it->end - entry.flat_start, block.type);
    }
}

// -- Replace / delete -----------------------------------------------------------

auto run_replace(Node& document, const ReplaceEdit& edit, const Options& options,
                 std::vector<std::string>& warnings) -> std::optional<Error> {
    if (edit.find.literal.empty()) {
        return Error{ErrorKind::invalid_edit, "replace requires findText"};
    }
    if (edit.replace_all && (edit.find.occurrence_index || edit.find.max_occurrences)) {
        warnings.emplace_back("replaceAll ignores occurrenceIndex and maxOccurrences");
    } else {
        note_query(edit.find, warnings);
    }

    const auto projection = project(document);
    auto spans = resolve(projection, edit.find, options.locator, edit.replace_all);
    if (auto* err = std::get_if<Error>(&spans)) return *err;

    for_each_span_reversed(document, projection, std::get<std::vector<Span>>(spans),
        [&](Inlines& inlines, std::size_t from, std::size_t to, NodeType type) {
            const auto marks = marks_at(inlines, from);
            splice_inline(inlines, from, to,
                          make_inline_text(edit.replace_text, marks, type == NodeType::code_block));
        });
    return std::nullopt;
}

auto run_delete(Node& document, const DeleteEdit& edit, const Options& options,
                std::vector<std::string>& warnings) -> std::optional<Error> {
    if (edit.target.literal.empty()) {
        return Error{ErrorKind::invalid_edit, "delete requires deleteText"};
    }
    note_query(edit.target, warnings);

    const auto projection = project(document);
    auto spans = resolve(projection, edit.target, options.locator, false);
    if (auto* err = std::get_if<Error>(&spans)) return *err;

    for_each_span_reversed(document, projection, std::get<std::vector<Span>>(spans),
        [](Inlines& inlines, std::size_t from, std::size_t to, NodeType) {
            splice_inline(inlines, from, to, {});
        });
    return std::nullopt;
}

// -- Insert ---------------------------------------------------------------------

auto run_insert(Node& document, const InsertEdit& edit, const Options& options)
    -> std::optional<Error> {
    if (edit.text.empty()) {
        return Error{ErrorKind::invalid_edit, "insert requires insertText"};
    }
    const auto& anchor = edit.anchor;
    if (anchor.after_text.has_value() == anchor.before_text.has_value()) {
        return Error{ErrorKind::invalid_edit, "insert requires exactly one of afterText or beforeText"};
    }
    const auto after = anchor.after_text.has_value();
    const auto& text = after ? *anchor.after_text : *anchor.before_text;

    const auto projection = project(document);
    auto offset = resolve_anchor(projection, text, anchor.occurrence_index, after, options.locator);
    if (auto* err = std::get_if<Error>(&offset)) return *err;

    // An after-anchor ends inside its block; a before-anchor starts inside it.
    const auto at = std::get<std::size_t>(offset);
    const auto probe = after ? at - 1 : at;
    const auto& entry = projection.blocks[*projection.block_at(probe)];
    auto& block = block_node(document, entry);
    const auto local = at - entry.flat_start;
    const auto marks = marks_inside(block.children, local);
    splice_inline(block.children, local, local,
                  make_inline_text(edit.text, marks, block.type == NodeType::code_block));
    return std::nullopt;
}

// -- Marks ----------------------------------------------------------------------

auto run_marks(Node& document, const LocatorQuery& target, const Options& options,
               std::vector<std::string>& warnings,
               const std::function<void(MarkSet&)>& update) -> std::optional<Error> {
    if (target.literal.empty()) {
        return Error{ErrorKind::invalid_edit, "mark edits require text"};
    }
    note_query(target, warnings);

    const auto projection = project(document);
    auto spans = resolve(projection, target, options.locator, false);
    if (auto* err = std::get_if<Error>(&spans)) return *err;

    for_each_span_reversed(document, projection, std::get<std::vector<Span>>(spans),
        [&](Inlines& inlines, std::size_t from, std::size_t to, NodeType) {
            update_marks(inlines, from, to, update);
        });
    return std::nullopt;
}

// -- Add paragraph --------------------------------------------------------------

auto parse_paragraph_type(const std::string& name) -> std::optional<NodeType> {
    auto type = parse_node_type(name);
    if (!type) return std::nullopt;
    switch (*type) {
        case NodeType::paragraph:
        case NodeType::heading:
        case NodeType::code_block:
        case NodeType::blockquote:
        case NodeType::bullet_list:
        case NodeType::ordered_list:
            return type;
        default:
            return std::nullopt;
    }
}

auto build_block(NodeType type, const std::string& content, std::optional<int> level) -> Node {
    const auto inlines = make_inline_text(content, {}, type == NodeType::code_block);
    switch (type) {
        case NodeType::heading:
            return make_heading(*level, inlines);
        case NodeType::code_block:
            return make_code_block(inlines);
        case NodeType::blockquote:
            return make_block(NodeType::blockquote, {make_paragraph(inlines)});
        case NodeType::bullet_list:
        case NodeType::ordered_list:
            return make_block(type, {make_block(NodeType::list_item, {make_paragraph(inlines)})});
        default:
            return make_paragraph(inlines);
    }
}

auto run_add_paragraph(Node& document, const AddParagraphEdit& edit, const Options& options,
                       std::vector<std::string>& warnings) -> std::optional<Error> {
    const auto type = parse_paragraph_type(edit.paragraph_type);
    if (!type) {
        return Error{ErrorKind::invalid_paragraph_type,
                     "unsupported paragraph type \"" + edit.paragraph_type + "\""};
    }
    if (*type == NodeType::heading &&
        (!edit.heading_level || *edit.heading_level < 1 || *edit.heading_level > 6)) {
        return Error{ErrorKind::invalid_heading_level,
                     edit.heading_level
                         ? "heading level " + std::to_string(*edit.heading_level) + " is outside 1..6"
                         : std::string{"heading requires headingLevel"}};
    }

    auto block = build_block(*type, edit.content, edit.heading_level);
    const auto& anchor = edit.anchor;
    if (!anchor.after_text && !anchor.before_text) {
        document.children.push_back(std::move(block));
        return std::nullopt;
    }
    if (anchor.after_text && anchor.before_text) {
        warnings.emplace_back("afterText and beforeText both given; using afterText");
    }
    const auto after = anchor.after_text.has_value();
    const auto& text = after ? *anchor.after_text : *anchor.before_text;

    const auto projection = project(document);
    auto offset = resolve_anchor(projection, text, anchor.occurrence_index, after, options.locator);
    if (auto* err = std::get_if<Error>(&offset)) return *err;

    const auto at = std::get<std::size_t>(offset);
    const auto& entry = projection.blocks[*projection.block_at(after ? at - 1 : at)];
    insert_sibling(document, entry.path, std::move(block), after);
    return std::nullopt;
}

}  // anonymous namespace

auto resolve_anchor(const Projection& projection, const std::string& text,
                    std::optional<std::size_t> occurrence_index, bool after,
                    const LocatorOptions& options) -> std::variant<std::size_t, Error> {
    const auto query = LocatorQuery{.literal = text, .occurrence_index = occurrence_index};
    auto located = locate(projection, query, options);
    if (auto* err = std::get_if<Error>(&located)) return *err;
    const auto& span = std::get<std::vector<Span>>(located).front();
    return after ? span.end : span.start;
}

auto execute(Node& document, const EditRequest& edit, const Options& options,
             std::vector<std::string>& warnings) -> std::optional<Error> {
    return std::visit(overload{
        [&](const ReplaceEdit& e) { return run_replace(document, e, options, warnings); },
        [&](const InsertEdit& e) { return run_insert(document, e, options); },
        [&](const DeleteEdit& e) { return run_delete(document, e, options, warnings); },
        [&](const AddMarkEdit& e) -> std::optional<Error> {
            auto mark = require_mark(e.mark_type);
            if (auto* err = std::get_if<Error>(&mark)) return *err;
            const auto m = std::get<MarkType>(mark);
            return run_marks(document, e.target, options, warnings,
                             [m](MarkSet& marks) { marks.add(m); });
        },
        [&](const RemoveMarkEdit& e) -> std::optional<Error> {
            auto mark = require_mark(e.mark_type);
            if (auto* err = std::get_if<Error>(&mark)) return *err;
            const auto m = std::get<MarkType>(mark);
            return run_marks(document, e.target, options, warnings,
                             [m](MarkSet& marks) { marks.remove(m); });
        },
        [&](const ReplaceMarkEdit& e) -> std::optional<Error> {
            auto old_mark = require_mark(e.old_mark_type);
            if (auto* err = std::get_if<Error>(&old_mark)) return *err;
            auto new_mark = require_mark(e.new_mark_type);
            if (auto* err = std::get_if<Error>(&new_mark)) return *err;
            const auto from = std::get<MarkType>(old_mark);
            const auto to = std::get<MarkType>(new_mark);
            return run_marks(document, e.target, options, warnings,
                             [from, to](MarkSet& marks) {
                                 marks.remove(from);
                                 marks.add(to);
                             });
        },
        [&](const AddParagraphEdit& e) { return run_add_paragraph(document, e, options, warnings); },
    }, edit);
}

}  // namespace docpatch::detail
