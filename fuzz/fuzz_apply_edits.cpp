// Fuzz target for PatchEngine::apply_edits() fed from JSON.
// Input: {"document": <ProseMirror doc>, "edits": [...], "options": {...}}.
// Any successful result must still be a valid tree.

#include <docpatch/docpatch.hpp>
#include <docpatch/json.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <vector>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto input = nlohmann::json::parse(data, data + size, nullptr, false);
    if (input.is_discarded() || !input.is_object()) return 0;

    auto document = docpatch::Node{};
    auto edits = std::vector<docpatch::EditRequest>{};
    auto options = docpatch::Options{};
    try {
        if (!input.contains("document") || !input.contains("edits")) return 0;
        input["document"].get_to(document);
        edits = docpatch::parse_edits(input["edits"]);
        if (input.contains("options")) input["options"].get_to(options);
    } catch (const std::exception&) {
        return 0;  // malformed requests are rejected at the JSON layer
    }

    const auto result = docpatch::PatchEngine{options}.apply_edits(document, edits);
    if (result.ok && docpatch::validate_document(result.document)) std::abort();
    if (result.applied_count + result.skipped.size() > edits.size()) std::abort();
    return 0;
}
