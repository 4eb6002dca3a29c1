// basic_usage -- demonstrates the core docpatch API
//
// Builds a small contract, applies a batch of edits of every kind, and
// prints what was applied, skipped and warned about.
//
// Build: cmake --build build
// Run:   ./build/examples/basic_usage

#include <docpatch/docpatch.hpp>

#include <cstdio>
#include <string>
#include <vector>

using namespace docpatch;

static void print_blocks(const Node& doc) {
    const auto projection = project(doc);
    for (const auto& block : projection.blocks) {
        std::printf("  [%s] %s\n", std::string{to_string_view(block.type)}.c_str(),
                    text_content(node_at(doc, block.path)).c_str());
    }
}

int main() {
    auto doc = make_doc({
        make_heading(1, {make_text("Lease Agreement")}),
        make_paragraph({
            make_text("The "), make_text("Lessee", {MarkType::bold}),
            make_text(" shall pay rent monthly. The Lessee shall keep the premises clean."),
        }),
        make_paragraph({make_text("Either party may terminate with notice.")}),
    });

    std::printf("Before:\n");
    print_blocks(doc);

    // -- A batch mixing every edit kind ---------------------------------------
    const auto edits = std::vector<EditRequest>{
        ReplaceEdit{.find = {.literal = "Lessee"}, .replace_text = "Tenant", .replace_all = true},
        InsertEdit{.text = " in advance", .anchor = {.after_text = "rent monthly"}},
        DeleteEdit{.target = {.literal = " with notice"}},
        AddMarkEdit{.target = {.literal = "terminate"}, .mark_type = "italic"},
        ReplaceMarkEdit{.target = {.literal = "Tenant", .occurrence_index = 1},
                        .old_mark_type = "bold", .new_mark_type = "underline"},
        AddParagraphEdit{.content = "Termination", .paragraph_type = "heading", .heading_level = 2,
                         .anchor = {.before_text = "Either party"}},
        // Ambiguous: "shall" occurs twice and nothing disambiguates it.
        ReplaceEdit{.find = {.literal = "shall"}, .replace_text = "must"},
    };

    const auto result = apply_edits(std::move(doc), edits);

    std::printf("\nApplied %zu of %zu edits\n", result.applied_count, edits.size());
    for (const auto& s : result.skipped) {
        std::printf("  skipped edit %zu (%s): %s\n", s.index,
                    std::string{to_string_view(s.reason)}.c_str(), s.message.c_str());
    }
    for (const auto& w : result.warnings) {
        std::printf("  warning: %s\n", w.c_str());
    }

    std::printf("\nAfter:\n");
    print_blocks(result.document);

    // -- Retry the skipped edit with a disambiguator --------------------------
    const auto retry = std::vector<EditRequest>{
        ReplaceEdit{.find = {.literal = "shall", .context_after = "keep"}, .replace_text = "must"},
    };
    const auto second = apply_edits(result.document, retry);
    std::printf("\nRetry applied %zu edit(s):\n", second.applied_count);
    print_blocks(second.document);
    return 0;
}
