// docpatch benchmarks: throughput of projection, location, edits and rewrites.

#include <docpatch/docpatch.hpp>

#include <benchmark/benchmark.h>

#include <cstdint>
#include <string>
#include <vector>

using namespace docpatch;

// A document of `n` paragraphs, each with one bold word.
static auto make_document(std::size_t n) -> Node {
    auto blocks = std::vector<Node>{};
    blocks.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        blocks.push_back(make_paragraph({
            make_text("Clause " + std::to_string(i) + " binds the "),
            make_text("Party", {MarkType::bold}),
            make_text(" to the terms stated herein."),
        }));
    }
    return make_doc(std::move(blocks));
}

// =============================================================================
// Projection and location
// =============================================================================

static void bm_project(benchmark::State& state) {
    const auto doc = make_document(static_cast<std::size_t>(state.range(0)));
    for (auto _ : state) {
        benchmark::DoNotOptimize(project(doc));
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(bm_project)->Range(10, 1000);

static void bm_locate_unique(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    const auto projection = project(make_document(n));
    const auto query = LocatorQuery{.literal = "Clause " + std::to_string(n / 2) + " binds"};
    for (auto _ : state) {
        benchmark::DoNotOptimize(locate(projection, query));
    }
}
BENCHMARK(bm_locate_unique)->Range(10, 1000);

static void bm_locate_with_context(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    const auto projection = project(make_document(n));
    const auto query = LocatorQuery{.literal = "Party", .context_before = "Clause " + std::to_string(n - 1)};
    for (auto _ : state) {
        benchmark::DoNotOptimize(locate(projection, query));
    }
}
BENCHMARK(bm_locate_with_context)->Range(10, 1000);

// =============================================================================
// Edits
// =============================================================================

static void bm_apply_replace(benchmark::State& state) {
    const auto doc = make_document(static_cast<std::size_t>(state.range(0)));
    const auto edits = std::vector<EditRequest>{
        ReplaceEdit{.find = {.literal = "Clause 3 binds"}, .replace_text = "Clause 3 obliges"},
    };
    const auto engine = PatchEngine{};
    for (auto _ : state) {
        benchmark::DoNotOptimize(engine.apply_edits(doc, edits));
    }
}
BENCHMARK(bm_apply_replace)->Range(10, 1000);

static void bm_apply_replace_all(benchmark::State& state) {
    const auto doc = make_document(static_cast<std::size_t>(state.range(0)));
    const auto edits = std::vector<EditRequest>{
        ReplaceEdit{.find = {.literal = "terms"}, .replace_text = "conditions", .replace_all = true},
    };
    const auto engine = PatchEngine{};
    for (auto _ : state) {
        benchmark::DoNotOptimize(engine.apply_edits(doc, edits));
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(bm_apply_replace_all)->Range(10, 1000);

static void bm_apply_edits_many(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    const auto doc = make_document(50);
    const auto edits = std::vector<EditRequest>{
        AddMarkEdit{.target = {.literal = "Clause 7"}, .mark_type = "italic"},
        DeleteEdit{.target = {.literal = " stated herein", .occurrence_index = 1}},
    };
    const auto engine = PatchEngine{};
    for (auto _ : state) {
        auto batches = std::vector<DocumentBatch>(n, DocumentBatch{.document = doc, .edits = edits});
        benchmark::DoNotOptimize(engine.apply_edits_many(std::move(batches)));
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations() * n));
}
BENCHMARK(bm_apply_edits_many)->Range(2, 64);

// =============================================================================
// Diff and rewrite
// =============================================================================

static void bm_diff_text(benchmark::State& state) {
    auto a = std::string{};
    auto b = std::string{};
    for (std::int64_t i = 0; i < state.range(0); ++i) {
        a += "word" + std::to_string(i) + " ";
        b += (i % 7 == 0 ? "changed" : "word") + std::to_string(i) + " ";
    }
    for (auto _ : state) {
        benchmark::DoNotOptimize(diff_text(a, b));
    }
}
BENCHMARK(bm_diff_text)->Range(16, 4096);

static void bm_rewrite_section(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    const auto doc = make_document(n);
    auto target = std::string{};
    for (std::size_t i = 0; i < n; ++i) {
        if (i > 0) target += "\n\n";
        target += "Clause " + std::to_string(i) + (i % 5 == 0 ? " obliges the " : " binds the ") +
                  "Party to the terms stated herein.";
    }
    const auto engine = PatchEngine{};
    for (auto _ : state) {
        benchmark::DoNotOptimize(engine.rewrite_section(doc, {}, target));
    }
}
BENCHMARK(bm_rewrite_section)->Range(10, 200);

BENCHMARK_MAIN();
