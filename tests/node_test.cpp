#include <docpatch/node.hpp>

#include <gtest/gtest.h>

using namespace docpatch;

// -- NodeType -----------------------------------------------------------------

TEST(NodeType, to_string_view_uses_schema_names) {
    EXPECT_EQ(to_string_view(NodeType::doc),          "doc");
    EXPECT_EQ(to_string_view(NodeType::paragraph),    "paragraph");
    EXPECT_EQ(to_string_view(NodeType::heading),      "heading");
    EXPECT_EQ(to_string_view(NodeType::code_block),   "codeBlock");
    EXPECT_EQ(to_string_view(NodeType::blockquote),   "blockquote");
    EXPECT_EQ(to_string_view(NodeType::bullet_list),  "bulletList");
    EXPECT_EQ(to_string_view(NodeType::ordered_list), "orderedList");
    EXPECT_EQ(to_string_view(NodeType::list_item),    "listItem");
    EXPECT_EQ(to_string_view(NodeType::text),         "text");
    EXPECT_EQ(to_string_view(NodeType::hard_break),   "hardBreak");
}

TEST(NodeType, parse_accepts_camel_and_snake_case) {
    EXPECT_EQ(parse_node_type("codeBlock"), NodeType::code_block);
    EXPECT_EQ(parse_node_type("code_block"), NodeType::code_block);
    EXPECT_EQ(parse_node_type("bullet_list"), NodeType::bullet_list);
    EXPECT_FALSE(parse_node_type("table").has_value());
}

TEST(NodeType, classification) {
    EXPECT_TRUE(is_inline(NodeType::text));
    EXPECT_TRUE(is_inline(NodeType::hard_break));
    EXPECT_FALSE(is_inline(NodeType::paragraph));
    EXPECT_TRUE(is_textblock(NodeType::heading));
    EXPECT_TRUE(is_textblock(NodeType::code_block));
    EXPECT_FALSE(is_textblock(NodeType::blockquote));
}

// -- Construction -------------------------------------------------------------

TEST(Node, make_heading_sets_level) {
    const auto h = make_heading(3, {make_text("Facts")});
    EXPECT_EQ(h.type, NodeType::heading);
    EXPECT_EQ(h.heading_level(), 3);
}

TEST(Node, heading_level_is_nullopt_for_paragraphs) {
    EXPECT_FALSE(make_paragraph().heading_level().has_value());
}

TEST(Node, inline_size_counts_bytes_and_breaks) {
    EXPECT_EQ(make_text("abc").inline_size(), 3u);
    EXPECT_EQ(make_hard_break().inline_size(), 1u);
    EXPECT_EQ(make_paragraph().inline_size(), 0u);
}

TEST(Node, copies_are_deep_and_equal) {
    const auto a = make_doc({make_paragraph({make_text("x", {MarkType::bold})})});
    auto b = a;
    EXPECT_EQ(a, b);
    b.children[0].children[0].text = "y";
    EXPECT_NE(a, b);
}

// -- Queries ------------------------------------------------------------------

TEST(Node, node_at_follows_path) {
    auto doc = make_doc({
        make_paragraph({make_text("one")}),
        make_block(NodeType::blockquote, {make_paragraph({make_text("two")})}),
    });
    EXPECT_EQ(node_at(doc, {1, 0, 0}).text, "two");
    node_at(doc, {0, 0}).text = "uno";
    EXPECT_EQ(doc.children[0].children[0].text, "uno");
}

TEST(Node, text_content_joins_runs_and_breaks) {
    const auto p = make_paragraph({make_text("a"), make_hard_break(), make_text("b", {MarkType::italic})});
    EXPECT_EQ(text_content(p), "a\nb");
}

// -- Validation ---------------------------------------------------------------

TEST(ValidateDocument, accepts_well_formed_tree) {
    const auto doc = make_doc({
        make_heading(1, {make_text("Claim")}),
        make_paragraph({make_text("The "), make_text("Plaintiff", {MarkType::bold})}),
        make_block(NodeType::bullet_list, {
            make_block(NodeType::list_item, {make_paragraph({make_text("item")})}),
        }),
        make_code_block({make_text("int x;\nint y;")}),
        make_paragraph(),
    });
    EXPECT_FALSE(validate_document(doc).has_value());
}

TEST(ValidateDocument, root_must_be_doc) {
    auto err = validate_document(make_paragraph());
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->kind, ErrorKind::invalid_document);
}

TEST(ValidateDocument, rejects_empty_text_run) {
    auto err = validate_document(make_doc({make_paragraph({make_text("")})}));
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->kind, ErrorKind::invalid_document);
}

TEST(ValidateDocument, rejects_heading_without_valid_level) {
    EXPECT_TRUE(validate_document(make_doc({make_heading(7)})).has_value());
    EXPECT_TRUE(validate_document(make_doc({make_block(NodeType::heading)})).has_value());
}

TEST(ValidateDocument, rejects_text_outside_text_block) {
    EXPECT_TRUE(validate_document(make_doc({make_text("loose")})).has_value());
}

TEST(ValidateDocument, rejects_block_inside_text_block) {
    auto p = make_paragraph();
    p.children.push_back(make_paragraph());
    EXPECT_TRUE(validate_document(make_doc({p})).has_value());
}

TEST(ValidateDocument, lists_hold_only_list_items) {
    const auto bad = make_doc({make_block(NodeType::ordered_list, {make_paragraph()})});
    EXPECT_TRUE(validate_document(bad).has_value());

    const auto stray = make_doc({make_block(NodeType::list_item, {make_paragraph()})});
    EXPECT_TRUE(validate_document(stray).has_value());
}

TEST(ValidateDocument, inline_nodes_have_no_children) {
    auto t = make_text("x");
    t.children.push_back(make_text("y"));
    EXPECT_TRUE(validate_document(make_doc({make_paragraph({t})})).has_value());
}
