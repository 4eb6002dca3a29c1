#include <docpatch/mark.hpp>
#include <docpatch/node.hpp>

#include <array>
#include <string>
#include <utility>

namespace docpatch {

// -- Marks ----------------------------------------------------------------------

auto parse_mark_type(std::string_view name) -> std::optional<MarkType> {
    static constexpr auto all = std::array{
        MarkType::bold, MarkType::italic, MarkType::underline,
        MarkType::code, MarkType::strike,
    };
    for (auto m : all) {
        if (to_string_view(m) == name) return m;
    }
    return std::nullopt;
}

auto MarkSet::to_vector() const -> std::vector<MarkType> {
    auto result = std::vector<MarkType>{};
    for (auto i = 0u; i <= static_cast<unsigned>(MarkType::strike); ++i) {
        const auto m = static_cast<MarkType>(i);
        if (contains(m)) result.push_back(m);
    }
    return result;
}

// -- Node types -----------------------------------------------------------------

auto parse_node_type(std::string_view name) -> std::optional<NodeType> {
    static constexpr auto all = std::array{
        NodeType::doc, NodeType::paragraph, NodeType::heading,
        NodeType::code_block, NodeType::blockquote, NodeType::bullet_list,
        NodeType::ordered_list, NodeType::list_item, NodeType::text,
        NodeType::hard_break,
    };
    for (auto t : all) {
        if (to_string_view(t) == name) return t;
    }
    // snake_case spellings used by the edit requests
    if (name == "code_block") return NodeType::code_block;
    if (name == "bullet_list") return NodeType::bullet_list;
    if (name == "ordered_list") return NodeType::ordered_list;
    if (name == "list_item") return NodeType::list_item;
    if (name == "hard_break") return NodeType::hard_break;
    return std::nullopt;
}

auto Node::heading_level() const -> std::optional<int> {
    if (type != NodeType::heading) return std::nullopt;
    auto level = get_attr<std::int64_t>(attrs, "level");
    if (!level) return std::nullopt;
    return static_cast<int>(*level);
}

// -- Construction helpers -------------------------------------------------------

auto make_text(std::string text, MarkSet marks) -> Node {
    auto node = Node{};
    node.type = NodeType::text;
    node.text = std::move(text);
    node.marks = marks;
    return node;
}

auto make_hard_break() -> Node {
    auto node = Node{};
    node.type = NodeType::hard_break;
    return node;
}

auto make_block(NodeType type, std::vector<Node> children) -> Node {
    auto node = Node{};
    node.type = type;
    node.children = std::move(children);
    return node;
}

auto make_paragraph(std::vector<Node> inlines) -> Node {
    return make_block(NodeType::paragraph, std::move(inlines));
}

auto make_heading(int level, std::vector<Node> inlines) -> Node {
    auto node = make_block(NodeType::heading, std::move(inlines));
    node.attrs["level"] = std::int64_t{level};
    return node;
}

auto make_code_block(std::vector<Node> inlines) -> Node {
    return make_block(NodeType::code_block, std::move(inlines));
}

auto make_doc(std::vector<Node> blocks) -> Node {
    return make_block(NodeType::doc, std::move(blocks));
}

// -- Tree queries ---------------------------------------------------------------

auto node_at(Node& root, const NodePath& path) -> Node& {
    auto* current = &root;
    for (auto idx : path) {
        current = &current->children[idx];
    }
    return *current;
}

auto node_at(const Node& root, const NodePath& path) -> const Node& {
    const auto* current = &root;
    for (auto idx : path) {
        current = &current->children[idx];
    }
    return *current;
}

namespace {

void append_text(const Node& node, std::string& out) {
    if (node.type == NodeType::text) {
        out += node.text;
    } else if (node.type == NodeType::hard_break) {
        out += '\n';
    } else {
        for (const auto& child : node.children) append_text(child, out);
    }
}

auto describe(const NodePath& path) -> std::string {
    auto result = std::string{"/"};
    for (std::size_t i = 0; i < path.size(); ++i) {
        if (i > 0) result += '/';
        result += std::to_string(path[i]);
    }
    return result;
}

auto check_node(const Node& node, NodePath& path, bool is_root) -> std::optional<Error> {
    auto fail = [&](std::string what) {
        return Error{ErrorKind::invalid_document,
                     std::string{to_string_view(node.type)} + " at " + describe(path) + ": " + what};
    };

    if (node.type == NodeType::doc && !is_root) return fail("doc is only valid as the root");
    if (is_root && node.type != NodeType::doc) return fail("root must be a doc");

    if (node.is_inline()) {
        if (!node.children.empty()) return fail("inline nodes cannot have children");
        if (node.type == NodeType::text && node.text.empty()) return fail("empty text run");
        return std::nullopt;
    }

    if (node.type == NodeType::heading) {
        auto level = node.heading_level();
        if (!level || *level < 1 || *level > 6) return fail("heading level must be 1..6");
    }

    for (std::size_t i = 0; i < node.children.size(); ++i) {
        const auto& child = node.children[i];
        if (node.is_textblock() && !child.is_inline()) {
            path.push_back(i);
            auto err = Error{ErrorKind::invalid_document,
                             "block inside text block at " + describe(path)};
            path.pop_back();
            return err;
        }
        if (!node.is_textblock() && child.is_inline()) {
            path.push_back(i);
            auto err = Error{ErrorKind::invalid_document,
                             "inline node outside a text block at " + describe(path)};
            path.pop_back();
            return err;
        }
        const auto is_list = node.type == NodeType::bullet_list || node.type == NodeType::ordered_list;
        if (is_list && child.type != NodeType::list_item) {
            return fail("lists may only contain list items");
        }
        if (!is_list && child.type == NodeType::list_item) {
            return fail("list item outside a list");
        }
        path.push_back(i);
        auto err = check_node(child, path, false);
        path.pop_back();
        if (err) return err;
    }
    return std::nullopt;
}

}  // anonymous namespace

auto text_content(const Node& node) -> std::string {
    auto out = std::string{};
    append_text(node, out);
    return out;
}

auto validate_document(const Node& root) -> std::optional<Error> {
    auto path = NodePath{};
    return check_node(root, path, true);
}

}  // namespace docpatch
