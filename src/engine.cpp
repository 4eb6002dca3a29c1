#include <docpatch/engine.hpp>

#include "apply_edit.hpp"
#include "executor.hpp"
#include "rewrite.hpp"

#include <utility>

namespace docpatch {

namespace {

auto failed(Node document, Error error) -> PatchResult {
    auto result = PatchResult{};
    result.ok = false;
    result.document = std::move(document);
    result.error = std::move(error);
    return result;
}

}  // anonymous namespace

PatchEngine::PatchEngine(Options options)
    : options_{std::move(options)} {}

auto PatchEngine::apply_edits(Node document, std::span<const EditRequest> edits) const
    -> PatchResult {
    if (auto err = validate_document(document)) {
        return failed(std::move(document), std::move(*err));
    }

    auto result = PatchResult{};
    for (std::size_t i = 0; i < edits.size(); ++i) {
        auto notes = std::vector<std::string>{};
        auto err = detail::execute(document, edits[i], options_, notes);
        for (auto& note : notes) {
            result.warnings.push_back("edit " + std::to_string(i) + " (" +
                                      std::string{edit_type_name(edits[i])} + "): " + note);
        }
        if (err) {
            result.skipped.push_back(SkippedEdit{
                .index = i,
                .reason = err->kind,
                .message = std::move(err->message),
            });
            continue;
        }
        ++result.applied_count;
    }
    result.document = std::move(document);
    return result;
}

auto PatchEngine::rewrite_section(Node document, const AnchorPair& anchors,
                                  std::string_view target_text) const -> PatchResult {
    if (auto err = validate_document(document)) {
        return failed(std::move(document), std::move(*err));
    }
    if (auto err = detail::rewrite(document, anchors, target_text, options_)) {
        return failed(std::move(document), std::move(*err));
    }
    auto result = PatchResult{};
    result.applied_count = 1;
    result.document = std::move(document);
    return result;
}

auto PatchEngine::apply_edits_many(std::vector<DocumentBatch> batches) const
    -> std::vector<PatchResult> {
    auto results = std::vector<PatchResult>(batches.size());
    if (batches.size() <= 1) {
        for (std::size_t i = 0; i < batches.size(); ++i) {
            results[i] = apply_edits(std::move(batches[i].document), batches[i].edits);
        }
        return results;
    }

    auto flow = tf::Taskflow{};
    flow.for_each_index(std::size_t{0}, batches.size(), std::size_t{1}, [&](std::size_t i) {
        results[i] = apply_edits(std::move(batches[i].document), batches[i].edits);
    });
    detail::global_executor().run(flow).wait();
    return results;
}

auto apply_edits(Node document, std::span<const EditRequest> edits) -> PatchResult {
    return PatchEngine{}.apply_edits(std::move(document), edits);
}

auto rewrite_section(Node document, const AnchorPair& anchors,
                     std::string_view target_text) -> PatchResult {
    return PatchEngine{}.rewrite_section(std::move(document), anchors, target_text);
}

}  // namespace docpatch
