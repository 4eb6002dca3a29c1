#include <docpatch/docpatch.hpp>

#include <gtest/gtest.h>

#include <string>

using namespace docpatch;

namespace {

auto para(std::string text) -> Node {
    return make_paragraph({make_text(std::move(text))});
}

// "The **Plaintiff** filed a claim."
auto claim_paragraph() -> Node {
    return make_paragraph({
        make_text("The "), make_text("Plaintiff", {MarkType::bold}), make_text(" filed a claim."),
    });
}

auto texts(const Node& doc) -> std::vector<std::string> {
    auto out = std::vector<std::string>{};
    for (const auto& block : project(doc).blocks) {
        out.push_back(text_content(node_at(doc, block.path)));
    }
    return out;
}

}  // anonymous namespace

// -- Region resolution --------------------------------------------------------

TEST(RewriteSection, rewrites_between_anchors_only) {
    const auto doc = make_doc({para("Intro."), para("Old body text."), para("Closing.")});
    const auto r = rewrite_section(doc, {.after_text = "Intro.", .before_text = "Closing."},
                                   "New body text.");
    ASSERT_TRUE(r.ok) << r.error->message;
    EXPECT_EQ(texts(r.document), (std::vector<std::string>{"Intro.", "New body text.", "Closing."}));
}

TEST(RewriteSection, anchors_inside_one_paragraph) {
    const auto doc = make_doc({para("Pay 100 dollars by Friday.")});
    const auto r = rewrite_section(doc, {.after_text = "Pay ", .before_text = " by"}, "200 euros");
    ASSERT_TRUE(r.ok);
    EXPECT_EQ(text_content(r.document), "Pay 200 euros by Friday.");
}

TEST(RewriteSection, after_anchor_only_extends_to_document_end) {
    const auto doc = make_doc({para("Keep."), para("Replace me.")});
    const auto r = rewrite_section(doc, {.after_text = "Keep."}, "Replaced.");
    ASSERT_TRUE(r.ok);
    EXPECT_EQ(texts(r.document), (std::vector<std::string>{"Keep.", "Replaced."}));
}

TEST(RewriteSection, before_anchor_only_extends_from_document_start) {
    const auto doc = make_doc({para("Replace me."), para("Keep.")});
    const auto r = rewrite_section(doc, {.before_text = "Keep."}, "Replaced.");
    ASSERT_TRUE(r.ok);
    EXPECT_EQ(texts(r.document), (std::vector<std::string>{"Replaced.", "Keep."}));
}

TEST(RewriteSection, no_anchors_rewrites_whole_document) {
    const auto doc = make_doc({para("one"), para("two")});
    const auto r = rewrite_section(doc, {}, "three");
    ASSERT_TRUE(r.ok);
    EXPECT_EQ(texts(r.document), (std::vector<std::string>{"three"}));
}

TEST(RewriteSection, empty_document_gets_a_paragraph) {
    const auto r = rewrite_section(make_doc(), {}, "Hello");
    ASSERT_TRUE(r.ok);
    EXPECT_EQ(r.document, make_doc({para("Hello")}));
}

TEST(RewriteSection, per_side_occurrence_overrides) {
    const auto doc = make_doc({para("A x B x C x D")});
    const auto r = rewrite_section(doc,
                                   {.after_text = "x", .before_text = "x",
                                    .after_occurrence = 1, .before_occurrence = 3},
                                   " - ");
    ASSERT_TRUE(r.ok);
    EXPECT_EQ(text_content(r.document), "A x - x D");
}

TEST(RewriteSection, shared_occurrence_index_applies_to_both_sides) {
    const auto doc = make_doc({para("[s] one [e] [s] two [e]")});
    const auto r = rewrite_section(doc, {.after_text = "[s]", .before_text = "[e]", .occurrence_index = 2},
                                   " 2 ");
    ASSERT_TRUE(r.ok);
    EXPECT_EQ(text_content(r.document), "[s] one [e] [s] 2 [e]");
}

// -- Failures -----------------------------------------------------------------

TEST(RewriteSection, unresolved_anchor_fails_whole_call) {
    const auto doc = make_doc({para("text")});
    const auto r = rewrite_section(doc, {.after_text = "missing"}, "x");
    EXPECT_FALSE(r.ok);
    ASSERT_TRUE(r.error.has_value());
    EXPECT_EQ(r.error->kind, ErrorKind::not_found);
    EXPECT_EQ(r.document, doc);
    EXPECT_EQ(r.applied_count, 0u);
}

TEST(RewriteSection, ambiguous_anchor_fails_whole_call) {
    const auto doc = make_doc({para("x and x")});
    const auto r = rewrite_section(doc, {.after_text = "x"}, "y");
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.error->kind, ErrorKind::ambiguous);
}

TEST(RewriteSection, anchors_meeting_is_empty_region) {
    const auto doc = make_doc({para("leftright")});
    const auto r = rewrite_section(doc, {.after_text = "left", .before_text = "right"}, "x");
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.error->kind, ErrorKind::empty_region);
    EXPECT_EQ(r.document, doc);
}

TEST(RewriteSection, reversed_anchors_are_invalid) {
    const auto doc = make_doc({para("first second")});
    const auto r = rewrite_section(doc, {.after_text = "second", .before_text = "first"}, "x");
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.error->kind, ErrorKind::invalid_anchors);
}

TEST(RewriteSection, region_size_cap) {
    auto options = Options{};
    options.max_rewrite_bytes = 4;
    const auto doc = make_doc({para("a long paragraph")});
    const auto r = PatchEngine{options}.rewrite_section(doc, {}, "short");
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.error->kind, ErrorKind::region_too_large);
}

TEST(RewriteSection, malformed_tree_is_rejected) {
    const auto r = rewrite_section(make_paragraph(), {}, "x");
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.error->kind, ErrorKind::invalid_document);
}

// -- Formatting preservation --------------------------------------------------

TEST(RewriteSection, identical_words_preserve_marks) {
    const auto doc = make_doc({claim_paragraph()});
    const auto r = rewrite_section(doc, {}, "The Plaintiff filed a claim.");
    ASSERT_TRUE(r.ok);
    EXPECT_EQ(r.document, doc);
}

TEST(RewriteSection, unchanged_bold_word_survives_nearby_edits) {
    const auto doc = make_doc({claim_paragraph()});
    const auto r = rewrite_section(doc, {}, "Yesterday the Plaintiff filed an amended claim.");
    ASSERT_TRUE(r.ok);
    const auto& p = r.document.children[0];
    EXPECT_EQ(text_content(p), "Yesterday the Plaintiff filed an amended claim.");
    auto bold = std::string{};
    for (const auto& leaf : p.children) {
        if (leaf.marks.contains(MarkType::bold)) bold += leaf.text;
    }
    EXPECT_EQ(bold, "Plaintiff");
}

TEST(RewriteSection, replacement_word_inherits_deleted_marks) {
    const auto doc = make_doc({claim_paragraph()});
    const auto r = rewrite_section(doc, {}, "The Defendant filed a claim.");
    ASSERT_TRUE(r.ok);
    const auto& p = r.document.children[0];
    ASSERT_EQ(p.children.size(), 3u);
    EXPECT_EQ(p.children[1], make_text("Defendant", {MarkType::bold}));
}

TEST(RewriteSection, appended_word_inherits_preceding_equal_marks) {
    const auto doc = make_doc({make_paragraph({make_text("Sec. 1", {MarkType::italic})})});
    const auto r = rewrite_section(doc, {}, "Sec. 1a");
    ASSERT_TRUE(r.ok);
    // "1" is replaced by "1a": the inserted word takes the deleted word's marks.
    EXPECT_EQ(r.document.children[0].children[0], make_text("Sec. 1a", {MarkType::italic}));
}

TEST(RewriteSection, style_tags_mark_inserted_text) {
    const auto doc = make_doc({para("See the statute.")});
    const auto r = rewrite_section(doc, {}, "See the [b]new[/b] statute.");
    ASSERT_TRUE(r.ok);
    const auto& p = r.document.children[0];
    EXPECT_EQ(text_content(p), "See the new statute.");
    ASSERT_EQ(p.children.size(), 3u);
    EXPECT_EQ(p.children[1], make_text("new", {MarkType::bold}));
}

TEST(RewriteSection, style_tags_can_be_disabled) {
    auto options = Options{};
    options.parse_style_tags = false;
    const auto r = PatchEngine{options}.rewrite_section(make_doc({para("x")}), {}, "[b]x[/b]");
    ASSERT_TRUE(r.ok);
    EXPECT_EQ(text_content(r.document), "[b]x[/b]");
}

// -- Block structure ----------------------------------------------------------

TEST(RewriteSection, inserted_paragraph_break_splits_block) {
    const auto doc = make_doc({para("First sentence. Second sentence.")});
    const auto r = rewrite_section(doc, {}, "First sentence.\n\nSecond sentence.");
    ASSERT_TRUE(r.ok);
    EXPECT_EQ(texts(r.document), (std::vector<std::string>{"First sentence.", "Second sentence."}));
}

TEST(RewriteSection, deleted_paragraph_break_joins_blocks_keeping_first_type) {
    const auto doc = make_doc({make_heading(2, {make_text("Title")}), para("continues")});
    const auto r = rewrite_section(doc, {}, "Title continues");
    ASSERT_TRUE(r.ok);
    ASSERT_EQ(r.document.children.size(), 1u);
    EXPECT_EQ(r.document.children[0], make_heading(2, {make_text("Title continues")}));
}

TEST(RewriteSection, unchanged_blocks_keep_type_and_attributes) {
    const auto doc = make_doc({make_heading(1, {make_text("Facts")}), para("Old text.")});
    const auto r = rewrite_section(doc, {}, "Facts\n\nNew text.");
    ASSERT_TRUE(r.ok);
    EXPECT_EQ(r.document.children[0], make_heading(1, {make_text("Facts")}));
    EXPECT_EQ(r.document.children[1], para("New text."));
}

TEST(RewriteSection, removed_paragraphs_prune_empty_containers) {
    const auto doc = make_doc({
        para("keep"),
        make_block(NodeType::blockquote, {para("quoted")}),
    });
    const auto r = rewrite_section(doc, {}, "keep");
    ASSERT_TRUE(r.ok);
    EXPECT_EQ(r.document, make_doc({para("keep")}));
}

TEST(RewriteSection, single_newline_becomes_hard_break) {
    const auto r = rewrite_section(make_doc({para("a b")}), {}, "a\nb");
    ASSERT_TRUE(r.ok);
    const auto& p = r.document.children[0];
    ASSERT_EQ(p.children.size(), 3u);
    EXPECT_EQ(p.children[1].type, NodeType::hard_break);
}

TEST(RewriteSection, anchor_at_paragraph_end_keeps_neighbours_intact) {
    const auto doc = make_doc({para("Intro."), para("Body."), para("End.")});
    const auto r = rewrite_section(doc, {.after_text = "Intro.", .before_text = "End."},
                                   "Body one.\n\nBody two.");
    ASSERT_TRUE(r.ok);
    EXPECT_EQ(texts(r.document),
              (std::vector<std::string>{"Intro.", "Body one.", "Body two.", "End."}));
}

TEST(RewriteSection, after_anchor_at_document_end_appends_paragraph) {
    const auto doc = make_doc({para("Last words.")});
    const auto r = rewrite_section(doc, {.after_text = "Last words."}, "Postscript.");
    ASSERT_TRUE(r.ok);
    EXPECT_EQ(texts(r.document), (std::vector<std::string>{"Last words.", "Postscript."}));
}

TEST(RewriteSection, result_is_always_a_valid_tree) {
    const auto doc = make_doc({
        make_heading(1, {make_text("T")}),
        make_block(NodeType::bullet_list, {
            make_block(NodeType::list_item, {para("one")}),
            make_block(NodeType::list_item, {para("two")}),
        }),
        para("tail"),
    });
    const auto r = rewrite_section(doc, {.after_text = "T"}, "uno\n\ndos\n\ntres\n\ncuatro");
    ASSERT_TRUE(r.ok);
    EXPECT_FALSE(validate_document(r.document).has_value());
    EXPECT_EQ(texts(r.document), (std::vector<std::string>{"T", "uno", "dos", "tres", "cuatro"}));
}

TEST(RewriteSection, paragraph_inserted_before_heading_keeps_heading) {
    const auto doc = make_doc({
        para("Intro."),
        make_heading(2, {make_text("Section "), make_text("Two", {MarkType::italic})}),
    });
    const auto r = rewrite_section(doc, {}, "Intro.\n\nAdded.\n\nSection Two");
    ASSERT_TRUE(r.ok);
    EXPECT_EQ(r.document, make_doc({
        para("Intro."),
        para("Added."),
        make_heading(2, {make_text("Section "), make_text("Two", {MarkType::italic})}),
    }));
}

TEST(RewriteSection, before_anchor_inside_heading_keeps_heading) {
    const auto doc = make_doc({para("Alpha"), make_heading(1, {make_text("Gamma Title")})});
    const auto r = rewrite_section(doc, {.before_text = "Title"}, "Alpha\n\nNew para\n\nGamma ");
    ASSERT_TRUE(r.ok);
    EXPECT_EQ(r.document, make_doc({
        para("Alpha"),
        para("New para"),
        make_heading(1, {make_text("Gamma Title")}),
    }));
}

TEST(RewriteSection, newline_in_code_block_stays_literal) {
    const auto doc = make_doc({make_block(NodeType::code_block, {make_text("a;")})});
    const auto r = rewrite_section(doc, {}, "a;\nb;");
    ASSERT_TRUE(r.ok);
    EXPECT_EQ(r.document, make_doc({make_block(NodeType::code_block, {make_text("a;\nb;")})}));
}

// -- Style tag parsing --------------------------------------------------------

TEST(RewriteSection, nested_style_tags_combine_marks) {
    const auto r = rewrite_section(make_doc({para("x")}), {}, "[b]bold [i]both[/i][/b]");
    ASSERT_TRUE(r.ok);
    const auto& p = r.document.children[0];
    ASSERT_EQ(p.children.size(), 2u);
    EXPECT_EQ(p.children[0], make_text("bold ", {MarkType::bold}));
    EXPECT_EQ(p.children[1], make_text("both", {MarkType::bold, MarkType::italic}));
}
