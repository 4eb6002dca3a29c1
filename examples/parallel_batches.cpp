// parallel_batches -- applying independent edit batches across threads
//
// PatchEngine::apply_edits_many() runs each document's batch as a task on
// the shared Taskflow executor and returns results in input order.
//
// Build: cmake -B build -DDOCPATCH_BUILD_EXAMPLES=ON && cmake --build build
// Run:   ./build/examples/parallel_batches [documents]

#include <docpatch/docpatch.hpp>

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <vector>

using namespace docpatch;

static auto make_contract(std::size_t id) -> Node {
    auto blocks = std::vector<Node>{};
    for (std::size_t i = 0; i < 200; ++i) {
        blocks.push_back(make_paragraph({
            make_text("Contract " + std::to_string(id) + ", clause " + std::to_string(i) +
                      ": the Supplier delivers goods."),
        }));
    }
    return make_doc(std::move(blocks));
}

int main(int argc, char** argv) {
    const auto count = argc > 1 ? static_cast<std::size_t>(std::strtoul(argv[1], nullptr, 10)) : 64;
    const auto edits = std::vector<EditRequest>{
        ReplaceEdit{.find = {.literal = "Supplier"}, .replace_text = "Vendor", .replace_all = true},
        AddMarkEdit{.target = {.literal = "clause 0:"}, .mark_type = "bold"},
        AddParagraphEdit{.content = "Signed.", .paragraph_type = "paragraph"},
    };

    auto make_batches = [&] {
        auto batches = std::vector<DocumentBatch>{};
        batches.reserve(count);
        for (std::size_t i = 0; i < count; ++i) {
            batches.push_back(DocumentBatch{.document = make_contract(i), .edits = edits});
        }
        return batches;
    };

    const auto engine = PatchEngine{};

    // -- Sequential -----------------------------------------------------------
    auto batches = make_batches();
    auto t0 = std::chrono::steady_clock::now();
    auto applied = std::size_t{0};
    for (auto& batch : batches) {
        applied += engine.apply_edits(std::move(batch.document), batch.edits).applied_count;
    }
    auto t1 = std::chrono::steady_clock::now();
    std::printf("sequential: %zu edits applied in %.2f ms\n", applied,
                std::chrono::duration<double, std::milli>(t1 - t0).count());

    // -- Parallel -------------------------------------------------------------
    batches = make_batches();
    t0 = std::chrono::steady_clock::now();
    const auto results = engine.apply_edits_many(std::move(batches));
    t1 = std::chrono::steady_clock::now();
    applied = 0;
    for (const auto& r : results) applied += r.applied_count;
    std::printf("parallel:   %zu edits applied in %.2f ms\n", applied,
                std::chrono::duration<double, std::milli>(t1 - t0).count());
    return 0;
}
