// section_rewrite -- rewriting an anchored region while keeping formatting
//
// Demonstrates:
//   - diff_text() on word tokens
//   - rewrite_section() between two anchors
//   - marks surviving on unchanged words, [b]/[i] tags on new ones
//   - paragraph splits from blank lines in the target text
//
// Build: cmake -B build -DDOCPATCH_BUILD_EXAMPLES=ON && cmake --build build
// Run:   ./build/examples/section_rewrite

#include <docpatch/docpatch.hpp>
#include <docpatch/json.hpp>

#include <nlohmann/json.hpp>

#include <cstdio>
#include <string>

using namespace docpatch;

int main() {
    // -- Word diff ------------------------------------------------------------
    for (const auto& run : diff_text("The Buyer shall pay within 30 days.",
                                     "The Buyer must pay within 14 days.")) {
        std::printf("%-6s \"%s\"\n", std::string{to_string_view(run.op)}.c_str(), run.text.c_str());
    }

    // -- Section rewrite ------------------------------------------------------
    const auto doc = make_doc({
        make_heading(2, {make_text("Payment")}),
        make_paragraph({
            make_text("The "), make_text("Buyer", {MarkType::bold}),
            make_text(" shall pay within 30 days of delivery."),
        }),
        make_heading(2, {make_text("Delivery")}),
    });

    const auto anchors = AnchorPair{.after_text = "Payment", .before_text = "Delivery"};
    const auto target = std::string{
        "The Buyer must pay within [b]14 days[/b] of delivery.\n\n"
        "Late payments accrue [i]interest[/i]."};

    const auto result = rewrite_section(doc, anchors, target);
    if (!result.ok) {
        std::fprintf(stderr, "[rewrite] %s: %s\n",
                     std::string{to_string_view(result.error->kind)}.c_str(),
                     result.error->message.c_str());
        return 1;
    }

    std::printf("\n%s\n", nlohmann::json(result.document).dump(2).c_str());

    // -- A failing rewrite leaves the input untouched -------------------------
    const auto reversed = rewrite_section(doc, {.after_text = "Delivery", .before_text = "Payment"}, "x");
    std::printf("\nreversed anchors: ok=%s kind=%s unchanged=%s\n",
                reversed.ok ? "true" : "false",
                std::string{to_string_view(reversed.error->kind)}.c_str(),
                reversed.document == doc ? "yes" : "no");
    return 0;
}
