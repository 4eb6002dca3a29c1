// Fuzz target for diff_text(): both sides must reassemble from the runs.

#include <docpatch/diff.hpp>

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <string_view>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto input = std::string_view{reinterpret_cast<const char*>(data), size};
    const auto split = input.find('\0');
    if (split == std::string_view::npos) return 0;
    const auto a = input.substr(0, split);
    const auto b = input.substr(split + 1);

    auto old_side = std::string{};
    auto new_side = std::string{};
    for (const auto& run : docpatch::diff_text(a, b, 64)) {
        if (run.op != docpatch::DiffOp::insert) old_side += run.text;
        if (run.op != docpatch::DiffOp::del) new_side += run.text;
    }
    if (old_side != a || new_side != b) std::abort();
    return 0;
}
