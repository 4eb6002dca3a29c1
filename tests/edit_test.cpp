#include <docpatch/docpatch.hpp>

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace docpatch;

namespace {

auto para(std::string text) -> Node {
    return make_paragraph({make_text(std::move(text))});
}

// Apply a single edit and require that it was applied.
auto apply_one(Node doc, EditRequest edit, const Options& options = {}) -> PatchResult {
    const auto edits = std::vector<EditRequest>{std::move(edit)};
    auto result = PatchEngine{options}.apply_edits(std::move(doc), edits);
    EXPECT_TRUE(result.ok);
    return result;
}

auto reason_of(const PatchResult& result) -> ErrorKind {
    if (result.skipped.size() != 1) {
        ADD_FAILURE() << "expected exactly one skipped edit";
        return ErrorKind::invalid_edit;
    }
    return result.skipped[0].reason;
}

}  // anonymous namespace

// -- Edit names ---------------------------------------------------------------

TEST(EditRequest, type_names_are_snake_case) {
    EXPECT_EQ(edit_type_name(ReplaceEdit{}), "replace");
    EXPECT_EQ(edit_type_name(InsertEdit{}), "insert");
    EXPECT_EQ(edit_type_name(DeleteEdit{}), "delete");
    EXPECT_EQ(edit_type_name(AddMarkEdit{}), "add_mark");
    EXPECT_EQ(edit_type_name(RemoveMarkEdit{}), "remove_mark");
    EXPECT_EQ(edit_type_name(ReplaceMarkEdit{}), "replace_mark");
    EXPECT_EQ(edit_type_name(AddParagraphEdit{}), "add_paragraph");
}

TEST(EditRequest, normalize_edit_type_accepts_common_spellings) {
    EXPECT_EQ(normalize_edit_type("addMark"), "add_mark");
    EXPECT_EQ(normalize_edit_type("AddMark"), "add_mark");
    EXPECT_EQ(normalize_edit_type("add-mark"), "add_mark");
    EXPECT_EQ(normalize_edit_type("add_paragraph"), "add_paragraph");
    EXPECT_EQ(normalize_edit_type("replaceMark"), "replace_mark");
    EXPECT_EQ(normalize_edit_type("replace"), "replace");
}

// -- replace ------------------------------------------------------------------

TEST(ReplaceEdit, replaces_text_inside_one_run) {
    const auto r = apply_one(make_doc({para("The contract is void.")}),
                             ReplaceEdit{.find = {.literal = "contract"}, .replace_text = "agreement"});
    EXPECT_EQ(r.applied_count, 1u);
    EXPECT_EQ(text_content(r.document), "The agreement is void.");
}

TEST(ReplaceEdit, inherits_marks_of_first_character) {
    const auto doc = make_doc({make_paragraph({
        make_text("The "), make_text("Plain", {MarkType::bold}), make_text("tiff filed."),
    })});
    const auto r = apply_one(doc, ReplaceEdit{.find = {.literal = "Plaintiff"}, .replace_text = "Claimant"});
    const auto& p = r.document.children[0];
    ASSERT_EQ(p.children.size(), 3u);
    EXPECT_EQ(p.children[1], make_text("Claimant", {MarkType::bold}));
    EXPECT_EQ(p.children[2], make_text(" filed."));
}

TEST(ReplaceEdit, merges_adjacent_runs_with_equal_marks) {
    const auto doc = make_doc({make_paragraph({make_text("a "), make_text("X", {MarkType::italic}), make_text(" b")})});
    const auto r = apply_one(doc, ReplaceEdit{.find = {.literal = "X"}, .replace_text = ""});
    ASSERT_EQ(r.document.children[0].children.size(), 1u);
    EXPECT_EQ(r.document.children[0].children[0], make_text("a  b"));
}

TEST(ReplaceEdit, empty_replacement_deletes) {
    const auto r = apply_one(make_doc({para("keep this drop")}),
                             ReplaceEdit{.find = {.literal = " drop"}, .replace_text = ""});
    EXPECT_EQ(text_content(r.document), "keep this");
}

TEST(ReplaceEdit, replace_all_rewrites_every_candidate) {
    const auto r = apply_one(make_doc({para("x and x"), para("x")}),
                             ReplaceEdit{.find = {.literal = "x"}, .replace_text = "yy", .replace_all = true});
    EXPECT_EQ(project(r.document).text, "yy and yyyy");
}

TEST(ReplaceEdit, max_occurrences_rewrites_first_k) {
    const auto r = apply_one(make_doc({para("x x x")}),
                             ReplaceEdit{.find = {.literal = "x", .max_occurrences = 2}, .replace_text = "y"});
    EXPECT_EQ(text_content(r.document), "y y x");
}

TEST(ReplaceEdit, overlapping_candidates_are_replaced_once) {
    const auto r = apply_one(make_doc({para("aaa")}),
                             ReplaceEdit{.find = {.literal = "aa"}, .replace_text = "b", .replace_all = true});
    EXPECT_EQ(text_content(r.document), "ba");
}

TEST(ReplaceEdit, max_occurrences_counts_non_overlapping_candidates) {
    const auto r = apply_one(make_doc({para("aaaa")}),
                             ReplaceEdit{.find = {.literal = "aa", .max_occurrences = 2}, .replace_text = "b"});
    EXPECT_EQ(r.applied_count, 1u);
    EXPECT_EQ(text_content(r.document), "bb");
}

TEST(ReplaceEdit, newline_in_replacement_becomes_hard_break) {
    const auto r = apply_one(make_doc({para("one two")}),
                             ReplaceEdit{.find = {.literal = " "}, .replace_text = "\n"});
    const auto& p = r.document.children[0];
    ASSERT_EQ(p.children.size(), 3u);
    EXPECT_EQ(p.children[1].type, NodeType::hard_break);
}

TEST(ReplaceEdit, newline_in_code_block_stays_text) {
    const auto doc = make_doc({make_code_block({make_text("a;b;")})});
    const auto r = apply_one(doc, ReplaceEdit{.find = {.literal = "a;"}, .replace_text = "a;\n"});
    const auto& code = r.document.children[0];
    ASSERT_EQ(code.children.size(), 1u);
    EXPECT_EQ(code.children[0].text, "a;\nb;");
}

TEST(ReplaceEdit, missing_find_text_is_invalid) {
    const auto r = apply_one(make_doc({para("x")}), ReplaceEdit{.find = {}, .replace_text = "y"});
    EXPECT_EQ(reason_of(r), ErrorKind::invalid_edit);
}

TEST(ReplaceEdit, both_occurrence_fields_warn) {
    const auto r = apply_one(make_doc({para("x x")}),
                             ReplaceEdit{.find = {.literal = "x", .occurrence_index = 2, .max_occurrences = 2},
                                         .replace_text = "y"});
    EXPECT_EQ(text_content(r.document), "x y");
    ASSERT_EQ(r.warnings.size(), 1u);
    EXPECT_NE(r.warnings[0].find("occurrenceIndex"), std::string::npos);
}

// -- insert -------------------------------------------------------------------

TEST(InsertEdit, after_anchor_inserts_at_its_end) {
    const auto r = apply_one(make_doc({para("The claim was filed.")}),
                             InsertEdit{.text = " promptly", .anchor = {.after_text = "was filed"}});
    EXPECT_EQ(text_content(r.document), "The claim was filed promptly.");
}

TEST(InsertEdit, before_anchor_inserts_at_its_start) {
    const auto r = apply_one(make_doc({para("The claim was filed.")}),
                             InsertEdit{.text = "amended ", .anchor = {.before_text = "claim"}});
    EXPECT_EQ(text_content(r.document), "The amended claim was filed.");
}

TEST(InsertEdit, inside_a_run_inherits_its_marks) {
    const auto doc = make_doc({make_paragraph({make_text("boldword", {MarkType::bold})})});
    const auto r = apply_one(doc, InsertEdit{.text = "-", .anchor = {.after_text = "bold"}});
    const auto& p = r.document.children[0];
    ASSERT_EQ(p.children.size(), 1u);
    EXPECT_EQ(p.children[0], make_text("bold-word", {MarkType::bold}));
}

TEST(InsertEdit, at_run_boundary_takes_no_marks) {
    const auto doc = make_doc({make_paragraph({make_text("Bold", {MarkType::bold}), make_text(" plain")})});
    const auto r = apply_one(doc, InsertEdit{.text = "!", .anchor = {.after_text = "Bold"}});
    const auto& p = r.document.children[0];
    ASSERT_EQ(p.children.size(), 2u);
    EXPECT_EQ(p.children[1], make_text("! plain"));
}

TEST(InsertEdit, requires_exactly_one_anchor) {
    auto r = apply_one(make_doc({para("a b")}), InsertEdit{.text = "x", .anchor = {}});
    EXPECT_EQ(reason_of(r), ErrorKind::invalid_edit);

    r = apply_one(make_doc({para("a b")}),
                  InsertEdit{.text = "x", .anchor = {.after_text = "a", .before_text = "b"}});
    EXPECT_EQ(reason_of(r), ErrorKind::invalid_edit);
}

TEST(InsertEdit, ambiguous_anchor_is_skipped) {
    const auto r = apply_one(make_doc({para("a a")}), InsertEdit{.text = "x", .anchor = {.after_text = "a"}});
    EXPECT_EQ(reason_of(r), ErrorKind::ambiguous);
    EXPECT_EQ(text_content(r.document), "a a");
}

TEST(InsertEdit, anchor_occurrence_index_disambiguates) {
    const auto r = apply_one(make_doc({para("a a")}),
                             InsertEdit{.text = "!", .anchor = {.after_text = "a", .occurrence_index = 2}});
    EXPECT_EQ(text_content(r.document), "a a!");
}

// -- delete -------------------------------------------------------------------

TEST(DeleteEdit, removes_span_across_runs_and_prunes_empty_runs) {
    const auto doc = make_doc({make_paragraph({
        make_text("keep "), make_text("gone", {MarkType::bold}), make_text(" too", {MarkType::italic}), make_text(" end"),
    })});
    const auto r = apply_one(doc, DeleteEdit{.target = {.literal = "gone too"}});
    const auto& p = r.document.children[0];
    ASSERT_EQ(p.children.size(), 1u);
    EXPECT_EQ(p.children[0], make_text("keep  end"));
}

TEST(DeleteEdit, keeps_the_emptied_block) {
    const auto r = apply_one(make_doc({para("only")}), DeleteEdit{.target = {.literal = "only"}});
    ASSERT_EQ(r.document.children.size(), 1u);
    EXPECT_TRUE(r.document.children[0].children.empty());
    EXPECT_FALSE(validate_document(r.document).has_value());
}

TEST(DeleteEdit, not_found_leaves_tree_unchanged) {
    const auto doc = make_doc({para("text")});
    const auto r = apply_one(doc, DeleteEdit{.target = {.literal = "absent"}});
    EXPECT_EQ(reason_of(r), ErrorKind::not_found);
    EXPECT_EQ(r.document, doc);
}

// -- marks --------------------------------------------------------------------

TEST(AddMarkEdit, splits_runs_at_span_edges) {
    const auto r = apply_one(make_doc({para("The Plaintiff filed.")}),
                             AddMarkEdit{.target = {.literal = "Plaintiff"}, .mark_type = "bold"});
    const auto& p = r.document.children[0];
    ASSERT_EQ(p.children.size(), 3u);
    EXPECT_EQ(p.children[0], make_text("The "));
    EXPECT_EQ(p.children[1], make_text("Plaintiff", {MarkType::bold}));
    EXPECT_EQ(p.children[2], make_text(" filed."));
}

TEST(AddMarkEdit, keeps_existing_marks) {
    const auto doc = make_doc({make_paragraph({make_text("word", {MarkType::italic})})});
    const auto r = apply_one(doc, AddMarkEdit{.target = {.literal = "word"}, .mark_type = "bold"});
    EXPECT_EQ(r.document.children[0].children[0], make_text("word", {MarkType::italic, MarkType::bold}));
}

TEST(AddMarkEdit, unknown_mark_is_rejected_before_locating) {
    const auto doc = make_doc({para("word")});
    const auto r = apply_one(doc, AddMarkEdit{.target = {.literal = "absent"}, .mark_type = "highlight"});
    EXPECT_EQ(reason_of(r), ErrorKind::invalid_mark_type);
    EXPECT_EQ(r.document, doc);
}

TEST(RemoveMarkEdit, removes_mark_from_part_of_a_run) {
    const auto doc = make_doc({make_paragraph({make_text("all bold here", {MarkType::bold})})});
    const auto r = apply_one(doc, RemoveMarkEdit{.target = {.literal = "bold"}, .mark_type = "bold"});
    const auto& p = r.document.children[0];
    ASSERT_EQ(p.children.size(), 3u);
    EXPECT_EQ(p.children[1], make_text("bold"));
    EXPECT_EQ(p.children[2], make_text(" here", {MarkType::bold}));
}

TEST(ReplaceMarkEdit, swaps_marks_on_the_span) {
    const auto doc = make_doc({make_paragraph({make_text("cite", {MarkType::bold})})});
    const auto r = apply_one(doc, ReplaceMarkEdit{.target = {.literal = "cite"},
                                                  .old_mark_type = "bold", .new_mark_type = "italic"});
    EXPECT_EQ(r.document.children[0].children[0], make_text("cite", {MarkType::italic}));
}

TEST(ReplaceMarkEdit, invalid_new_mark_applies_nothing) {
    const auto doc = make_doc({make_paragraph({make_text("cite", {MarkType::bold})})});
    const auto r = apply_one(doc, ReplaceMarkEdit{.target = {.literal = "cite"},
                                                  .old_mark_type = "bold", .new_mark_type = "sparkle"});
    EXPECT_EQ(reason_of(r), ErrorKind::invalid_mark_type);
    EXPECT_EQ(r.document, doc);
}

// -- add_paragraph ------------------------------------------------------------

TEST(AddParagraphEdit, inserts_after_anchor_block) {
    const auto r = apply_one(make_doc({para("first"), para("second")}),
                             AddParagraphEdit{.content = "middle", .anchor = {.after_text = "first"}});
    ASSERT_EQ(r.document.children.size(), 3u);
    EXPECT_EQ(text_content(r.document.children[1]), "middle");
}

TEST(AddParagraphEdit, inserts_before_anchor_block) {
    const auto r = apply_one(make_doc({para("first"), para("second")}),
                             AddParagraphEdit{.content = "zeroth", .anchor = {.before_text = "first"}});
    ASSERT_EQ(r.document.children.size(), 3u);
    EXPECT_EQ(text_content(r.document.children[0]), "zeroth");
}

TEST(AddParagraphEdit, without_anchor_appends) {
    const auto r = apply_one(make_doc({para("first")}), AddParagraphEdit{.content = "last"});
    ASSERT_EQ(r.document.children.size(), 2u);
    EXPECT_EQ(text_content(r.document.children.back()), "last");
}

TEST(AddParagraphEdit, after_text_takes_precedence) {
    const auto r = apply_one(make_doc({para("one"), para("two")}),
                             AddParagraphEdit{.content = "new",
                                              .anchor = {.after_text = "two", .before_text = "one"}});
    ASSERT_EQ(r.document.children.size(), 3u);
    EXPECT_EQ(text_content(r.document.children[2]), "new");
    EXPECT_EQ(r.warnings.size(), 1u);
}

TEST(AddParagraphEdit, sibling_stays_inside_the_anchor_container) {
    const auto doc = make_doc({make_block(NodeType::blockquote, {para("quoted")})});
    const auto r = apply_one(doc, AddParagraphEdit{.content = "more", .anchor = {.after_text = "quoted"}});
    ASSERT_EQ(r.document.children.size(), 1u);
    EXPECT_EQ(r.document.children[0].children.size(), 2u);
}

TEST(AddParagraphEdit, heading_gets_level) {
    const auto r = apply_one(make_doc({para("body")}),
                             AddParagraphEdit{.content = "Facts", .paragraph_type = "heading",
                                              .heading_level = 2, .anchor = {.before_text = "body"}});
    EXPECT_EQ(r.document.children[0], make_heading(2, {make_text("Facts")}));
}

TEST(AddParagraphEdit, heading_level_out_of_range_is_rejected) {
    const auto doc = make_doc({para("body")});
    const auto r = apply_one(doc, AddParagraphEdit{.content = "x", .paragraph_type = "heading", .heading_level = 7});
    EXPECT_EQ(reason_of(r), ErrorKind::invalid_heading_level);
    EXPECT_EQ(r.document, doc);
}

TEST(AddParagraphEdit, heading_without_level_is_rejected) {
    const auto r = apply_one(make_doc({para("body")}),
                             AddParagraphEdit{.content = "x", .paragraph_type = "heading"});
    EXPECT_EQ(reason_of(r), ErrorKind::invalid_heading_level);
}

TEST(AddParagraphEdit, unknown_type_is_rejected) {
    const auto r = apply_one(make_doc({para("body")}),
                             AddParagraphEdit{.content = "x", .paragraph_type = "table"});
    EXPECT_EQ(reason_of(r), ErrorKind::invalid_paragraph_type);
}

TEST(AddParagraphEdit, empty_content_gives_empty_block) {
    const auto r = apply_one(make_doc({para("body")}), AddParagraphEdit{});
    EXPECT_EQ(r.document.children.back(), make_paragraph());
}

TEST(AddParagraphEdit, list_and_quote_types_wrap_a_paragraph) {
    auto r = apply_one(make_doc({para("body")}),
                       AddParagraphEdit{.content = "item", .paragraph_type = "bullet_list"});
    const auto& list = r.document.children.back();
    EXPECT_EQ(list.type, NodeType::bullet_list);
    EXPECT_EQ(list.children[0].type, NodeType::list_item);
    EXPECT_EQ(text_content(list), "item");

    r = apply_one(make_doc({para("body")}),
                  AddParagraphEdit{.content = "q", .paragraph_type = "blockquote"});
    EXPECT_EQ(r.document.children.back().children[0], para("q"));
    EXPECT_FALSE(validate_document(r.document).has_value());
}
