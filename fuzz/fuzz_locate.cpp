// Fuzz target for locate() over arbitrary paragraph text.
// Input: paragraph text, NUL, literal. Every returned span must lie inside
// one block and spell the literal.

#include <docpatch/locator.hpp>

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto input = std::string_view{reinterpret_cast<const char*>(data), size};
    const auto split = input.find('\0');
    if (split == std::string_view::npos) return 0;

    auto blocks = std::vector<docpatch::Node>{};
    auto rest = input.substr(0, split);
    while (!rest.empty()) {
        const auto cut = rest.find('\n');
        const auto line = rest.substr(0, cut);
        blocks.push_back(docpatch::make_paragraph({docpatch::make_text(std::string{line})}));
        if (cut == std::string_view::npos) break;
        rest.remove_prefix(cut + 1);
    }
    const auto projection = docpatch::project(docpatch::make_doc(std::move(blocks)));
    const auto literal = std::string{input.substr(split + 1)};

    const auto result = docpatch::locate_all(projection, {.literal = literal});
    if (const auto* spans = std::get_if<std::vector<docpatch::Span>>(&result)) {
        for (const auto& span : *spans) {
            if (!projection.block_of(span)) std::abort();
            if (projection.text.substr(span.start, span.size()) != literal) std::abort();
        }
    }
    return 0;
}
