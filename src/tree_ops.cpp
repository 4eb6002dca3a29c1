#include "tree_ops.hpp"

#include <algorithm>
#include <iterator>
#include <string>
#include <utility>

namespace docpatch::detail {

auto inline_length(const Inlines& inlines) -> std::size_t {
    auto total = std::size_t{0};
    for (const auto& leaf : inlines) total += leaf.inline_size();
    return total;
}

auto slice_inline(const Inlines& inlines, std::size_t from, std::size_t to) -> Inlines {
    auto result = Inlines{};
    auto pos = std::size_t{0};
    for (const auto& leaf : inlines) {
        const auto size = leaf.inline_size();
        const auto lo = std::max(from, pos);
        const auto hi = std::min(to, pos + size);
        if (lo < hi) {
            if (leaf.is_text()) {
                result.push_back(make_text(leaf.text.substr(lo - pos, hi - lo), leaf.marks));
            } else {
                result.push_back(leaf);
            }
        }
        pos += size;
        if (pos >= to) break;
    }
    return result;
}

void normalize_inline(Inlines& inlines) {
    auto result = Inlines{};
    result.reserve(inlines.size());
    for (auto& leaf : inlines) {
        if (leaf.is_text() && leaf.text.empty()) continue;
        if (leaf.is_text() && !result.empty() && result.back().is_text() &&
            result.back().marks == leaf.marks) {
            result.back().text += leaf.text;
            continue;
        }
        result.push_back(std::move(leaf));
    }
    inlines = std::move(result);
}

void splice_inline(Inlines& inlines, std::size_t from, std::size_t to, Inlines replacement) {
    auto result = slice_inline(inlines, 0, from);
    std::ranges::move(replacement, std::back_inserter(result));
    auto tail = slice_inline(inlines, to, inline_length(inlines));
    std::ranges::move(tail, std::back_inserter(result));
    normalize_inline(result);
    inlines = std::move(result);
}

void update_marks(Inlines& inlines, std::size_t from, std::size_t to,
                  const std::function<void(MarkSet&)>& update) {
    auto middle = slice_inline(inlines, from, to);
    for (auto& leaf : middle) {
        if (leaf.is_text()) update(leaf.marks);
    }
    splice_inline(inlines, from, to, std::move(middle));
}

auto marks_at(const Inlines& inlines, std::size_t offset) -> MarkSet {
    auto pos = std::size_t{0};
    for (const auto& leaf : inlines) {
        const auto size = leaf.inline_size();
        if (offset < pos + size) return leaf.is_text() ? leaf.marks : MarkSet{};
        pos += size;
    }
    return {};
}

auto marks_inside(const Inlines& inlines, std::size_t offset) -> MarkSet {
    auto pos = std::size_t{0};
    for (const auto& leaf : inlines) {
        const auto size = leaf.inline_size();
        if (offset > pos && offset < pos + size) {
            return leaf.is_text() ? leaf.marks : MarkSet{};
        }
        if (offset <= pos) break;
        pos += size;
    }
    return {};
}

auto make_inline_text(std::string_view text, MarkSet marks, bool literal_newlines) -> Inlines {
    auto result = Inlines{};
    if (literal_newlines) {
        if (!text.empty()) result.push_back(make_text(std::string{text}, marks));
        return result;
    }
    auto start = std::size_t{0};
    while (start <= text.size()) {
        const auto nl = text.find('\n', start);
        const auto piece = text.substr(start, nl == std::string_view::npos ? std::string_view::npos : nl - start);
        if (!piece.empty()) result.push_back(make_text(std::string{piece}, marks));
        if (nl == std::string_view::npos) break;
        result.push_back(make_hard_break());
        start = nl + 1;
    }
    return result;
}

auto block_node(Node& root, const BlockEntry& block) -> Node& {
    return node_at(root, block.path);
}

void insert_sibling(Node& root, const NodePath& path, Node block, bool after) {
    auto parent_path = path;
    parent_path.pop_back();
    auto& parent = node_at(root, parent_path);
    const auto index = path.back() + (after ? 1 : 0);
    parent.children.insert(parent.children.begin() + static_cast<std::ptrdiff_t>(index),
                           std::move(block));
}

void remove_node(Node& root, NodePath path) {
    while (!path.empty()) {
        const auto index = path.back();
        path.pop_back();
        auto& parent = node_at(root, path);
        parent.children.erase(parent.children.begin() + static_cast<std::ptrdiff_t>(index));
        if (path.empty() || !parent.children.empty()) return;
    }
}

}  // namespace docpatch::detail
