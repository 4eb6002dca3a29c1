// patch_cli -- apply edits or a section rewrite to a ProseMirror JSON file
//
// Usage:
//   patch_cli apply   <document.json> <edits.json>   [options.json]
//   patch_cli rewrite <document.json> <anchors.json> <target.txt> [options.json]
//
// The PatchResult is written to stdout as JSON. Skipped edits and warnings
// are also logged to stderr. Exit status is 0 when the call succeeded, 1 on
// a structural failure, 2 on bad input.
//
// Build: cmake -B build -DDOCPATCH_BUILD_EXAMPLES=ON && cmake --build build

#include <docpatch/docpatch.hpp>
#include <docpatch/json.hpp>

#include <nlohmann/json.hpp>

#include <cstdio>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>

using json = nlohmann::json;

static auto read_file(const char* path) -> std::string {
    auto in = std::ifstream{path, std::ios::binary};
    if (!in) throw std::runtime_error{std::string{"cannot open "} + path};
    auto ss = std::ostringstream{};
    ss << in.rdbuf();
    return ss.str();
}

static auto read_json(const char* path) -> json {
    try {
        return json::parse(read_file(path));
    } catch (const json::parse_error& e) {
        throw std::runtime_error{std::string{path} + ": " + e.what()};
    }
}

static void usage() {
    std::fprintf(stderr,
                 "usage: patch_cli apply   <document.json> <edits.json> [options.json]\n"
                 "       patch_cli rewrite <document.json> <anchors.json> <target.txt> [options.json]\n");
}

static void log_result(const docpatch::PatchResult& result) {
    for (const auto& s : result.skipped) {
        std::fprintf(stderr, "[docpatch] skipped edit %zu (%s): %s\n", s.index,
                     std::string{docpatch::to_string_view(s.reason)}.c_str(), s.message.c_str());
    }
    for (const auto& w : result.warnings) {
        std::fprintf(stderr, "[docpatch] warning: %s\n", w.c_str());
    }
    if (result.error) {
        std::fprintf(stderr, "[docpatch] error (%s): %s\n",
                     std::string{docpatch::to_string_view(result.error->kind)}.c_str(),
                     result.error->message.c_str());
    }
    std::fprintf(stderr, "[docpatch] %zu applied, %zu skipped\n", result.applied_count,
                 result.skipped.size());
}

int main(int argc, char** argv) {
    if (argc < 2) {
        usage();
        return 2;
    }
    const auto command = std::string_view{argv[1]};
    const auto is_apply = command == "apply" && (argc == 4 || argc == 5);
    const auto is_rewrite = command == "rewrite" && (argc == 5 || argc == 6);
    if (!is_apply && !is_rewrite) {
        usage();
        return 2;
    }

    auto result = docpatch::PatchResult{};
    try {
        auto options = docpatch::Options{};
        const auto options_at = is_apply ? 4 : 5;
        if (argc > options_at) read_json(argv[options_at]).get_to(options);
        const auto engine = docpatch::PatchEngine{options};
        auto document = read_json(argv[2]).get<docpatch::Node>();

        if (is_apply) {
            const auto edits = docpatch::parse_edits(read_json(argv[3]));
            result = engine.apply_edits(std::move(document), edits);
        } else {
            const auto anchors = read_json(argv[3]).get<docpatch::AnchorPair>();
            result = engine.rewrite_section(std::move(document), anchors, read_file(argv[4]));
        }
    } catch (const std::exception& e) {
        std::fprintf(stderr, "[docpatch] invalid input: %s\n", e.what());
        return 2;
    }

    log_result(result);
    std::printf("%s\n", json(result).dump(2).c_str());
    return result.ok ? 0 : 1;
}
