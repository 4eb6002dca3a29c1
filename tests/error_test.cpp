#include <docpatch/error.hpp>

#include <gtest/gtest.h>

using namespace docpatch;

TEST(ErrorKind, to_string_view_covers_all_variants) {
    EXPECT_EQ(to_string_view(ErrorKind::not_found),              "not_found");
    EXPECT_EQ(to_string_view(ErrorKind::ambiguous),              "ambiguous");
    EXPECT_EQ(to_string_view(ErrorKind::invalid_mark_type),      "invalid_mark_type");
    EXPECT_EQ(to_string_view(ErrorKind::invalid_paragraph_type), "invalid_paragraph_type");
    EXPECT_EQ(to_string_view(ErrorKind::invalid_heading_level),  "invalid_heading_level");
    EXPECT_EQ(to_string_view(ErrorKind::cross_block_literal),    "cross_block_literal");
    EXPECT_EQ(to_string_view(ErrorKind::empty_region),           "empty_region");
    EXPECT_EQ(to_string_view(ErrorKind::invalid_anchors),        "invalid_anchors");
    EXPECT_EQ(to_string_view(ErrorKind::region_too_large),       "region_too_large");
    EXPECT_EQ(to_string_view(ErrorKind::invalid_edit),           "invalid_edit");
    EXPECT_EQ(to_string_view(ErrorKind::invalid_document),       "invalid_document");
}

TEST(Error, construction_and_equality) {
    const auto e1 = Error{ErrorKind::not_found, "\"x\" does not occur"};
    const auto e2 = Error{ErrorKind::not_found, "\"x\" does not occur"};
    const auto e3 = Error{ErrorKind::ambiguous, "\"x\" does not occur"};

    EXPECT_EQ(e1, e2);
    EXPECT_NE(e1, e3);
}

TEST(Error, different_messages_are_not_equal) {
    const auto e1 = Error{ErrorKind::ambiguous, "foo"};
    const auto e2 = Error{ErrorKind::ambiguous, "bar"};

    EXPECT_NE(e1, e2);
}

TEST(Error, kind_and_message_are_accessible) {
    const auto e = Error{ErrorKind::empty_region, "anchors meet"};

    EXPECT_EQ(e.kind, ErrorKind::empty_region);
    EXPECT_EQ(e.message, "anchors meet");
}
