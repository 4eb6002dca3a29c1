#include <docpatch/projection.hpp>

#include <algorithm>

namespace docpatch {

namespace {

struct Projector {
    Projection& out;
    NodePath path;

    void visit(const Node& node) {
        if (node.is_textblock()) {
            visit_textblock(node);
            return;
        }
        for (std::size_t i = 0; i < node.children.size(); ++i) {
            path.push_back(i);
            visit(node.children[i]);
            path.pop_back();
        }
    }

    void visit_textblock(const Node& block) {
        const auto block_index = out.blocks.size();
        out.blocks.push_back(BlockEntry{
            .flat_start = out.text.size(),
            .flat_end = out.text.size(),
            .path = path,
            .type = block.type,
        });
        for (std::size_t i = 0; i < block.children.size(); ++i) {
            const auto& leaf = block.children[i];
            const auto size = leaf.inline_size();
            if (size == 0) continue;
            const auto start = out.text.size();
            if (leaf.type == NodeType::hard_break) {
                out.text += '\n';
            } else {
                out.text += leaf.text;
            }
            auto leaf_path = path;
            leaf_path.push_back(i);
            out.runs.push_back(RunEntry{
                .flat_start = start,
                .flat_end = out.text.size(),
                .path = std::move(leaf_path),
                .block = block_index,
            });
        }
        out.blocks[block_index].flat_end = out.text.size();
    }
};

}  // anonymous namespace

auto project(const Node& root) -> Projection {
    auto result = Projection{};
    auto projector = Projector{.out = result, .path = {}};
    projector.visit(root);
    return result;
}

auto Projection::run_at(std::size_t offset) const -> const RunEntry* {
    // First run whose end lies beyond offset; runs are contiguous and sorted.
    auto it = std::ranges::upper_bound(runs, offset, {}, &RunEntry::flat_end);
    if (it == runs.end() || offset < it->flat_start) return nullptr;
    return &*it;
}

auto Projection::position_at(std::size_t offset) const -> std::optional<TreePosition> {
    const auto* run = run_at(offset);
    if (!run) return std::nullopt;
    return TreePosition{.path = run->path, .run_offset = offset - run->flat_start};
}

auto Projection::block_at(std::size_t offset) const -> std::optional<std::size_t> {
    const auto* run = run_at(offset);
    if (!run) return std::nullopt;
    return run->block;
}

auto Projection::block_of(const Span& span) const -> std::optional<std::size_t> {
    if (span.end <= span.start) return std::nullopt;
    auto first = block_at(span.start);
    auto last = block_at(span.end - 1);
    if (!first || !last || *first != *last) return std::nullopt;
    return first;
}

}  // namespace docpatch
