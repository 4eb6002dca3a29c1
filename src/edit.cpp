#include <docpatch/edit.hpp>
#include <docpatch/value.hpp>

#include <cctype>

namespace docpatch {

auto edit_type_name(const EditRequest& edit) -> std::string_view {
    return std::visit(overload{
        [](const ReplaceEdit&) -> std::string_view { return "replace"; },
        [](const InsertEdit&) -> std::string_view { return "insert"; },
        [](const DeleteEdit&) -> std::string_view { return "delete"; },
        [](const AddMarkEdit&) -> std::string_view { return "add_mark"; },
        [](const RemoveMarkEdit&) -> std::string_view { return "remove_mark"; },
        [](const ReplaceMarkEdit&) -> std::string_view { return "replace_mark"; },
        [](const AddParagraphEdit&) -> std::string_view { return "add_paragraph"; },
    }, edit);
}

auto normalize_edit_type(std::string_view type) -> std::string {
    auto result = std::string{};
    auto prev_lower = false;
    for (auto ch : type) {
        const auto c = static_cast<unsigned char>(ch);
        if (ch == '-' || ch == ' ' || ch == '_') {
            if (!result.empty() && result.back() != '_') result.push_back('_');
            prev_lower = false;
            continue;
        }
        if (std::isupper(c) != 0) {
            if (prev_lower) result.push_back('_');
            result.push_back(static_cast<char>(std::tolower(c)));
            prev_lower = false;
            continue;
        }
        result.push_back(ch);
        prev_lower = std::islower(c) != 0 || std::isdigit(c) != 0;
    }
    while (!result.empty() && result.back() == '_') result.pop_back();
    return result;
}

}  // namespace docpatch
