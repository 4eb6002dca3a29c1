// Helper to generate seed corpus files for fuzz testing.
// Build and run once: ./generate_seeds
// Not a fuzz target itself, just a corpus generator.

#include <docpatch/docpatch.hpp>
#include <docpatch/json.hpp>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

static void write_seed(const std::string& path, const std::string& data) {
    auto ofs = std::ofstream{path, std::ios::binary};
    ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
}

static auto request(const docpatch::Node& doc, const std::vector<docpatch::EditRequest>& edits)
    -> std::string {
    auto edits_json = nlohmann::json::array();
    for (const auto& edit : edits) edits_json.push_back(edit);
    return nlohmann::json{{"document", doc}, {"edits", std::move(edits_json)}}.dump();
}

int main() {
    namespace fs = std::filesystem;
    using namespace docpatch;
    const auto dir = std::string{"fuzz/corpus"};
    fs::create_directories(dir);

    const auto doc = make_doc({
        make_heading(1, {make_text("Terms")}),
        make_paragraph({make_text("The "), make_text("Buyer", {MarkType::bold}), make_text(" pays.")}),
        make_block(NodeType::bullet_list, {
            make_block(NodeType::list_item, {make_paragraph({make_text("first")})}),
        }),
    });

    // Seed 1: empty batch
    write_seed(dir + "/seed_empty.json", request(doc, {}));

    // Seed 2: one edit of every kind
    write_seed(dir + "/seed_all_kinds.json", request(doc, {
        ReplaceEdit{.find = {.literal = "Buyer"}, .replace_text = "Purchaser"},
        InsertEdit{.text = " promptly", .anchor = {.before_text = "."}},
        DeleteEdit{.target = {.literal = "first"}},
        AddMarkEdit{.target = {.literal = "Terms"}, .mark_type = "italic"},
        RemoveMarkEdit{.target = {.literal = "Purchaser"}, .mark_type = "bold"},
        ReplaceMarkEdit{.target = {.literal = "Terms"}, .old_mark_type = "italic", .new_mark_type = "underline"},
        AddParagraphEdit{.content = "Notes", .paragraph_type = "heading", .heading_level = 2},
    }));

    // Seed 3: locator disambiguation
    write_seed(dir + "/seed_occurrences.json", request(make_doc({
        make_paragraph({make_text("a a a")}),
    }), {
        ReplaceEdit{.find = {.literal = "a", .occurrence_index = 2}, .replace_text = "b"},
        ReplaceEdit{.find = {.literal = "a", .max_occurrences = 2}, .replace_text = "c"},
    }));

    // Seeds for the diff and locate targets: two NUL-separated strings
    write_seed(dir + "/seed_diff.bin", std::string{"the old text\0the new text", 25});
    write_seed(dir + "/seed_locate.bin", std::string{"one two\nthree two\0two", 21});

    return 0;
}
