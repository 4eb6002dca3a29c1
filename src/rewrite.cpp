#include "rewrite.hpp"
#include "apply_edit.hpp"
#include "tree_ops.hpp"

#include <docpatch/diff.hpp>
#include <docpatch/projection.hpp>

#include <algorithm>
#include <array>
#include <iterator>
#include <utility>

namespace docpatch::detail {

namespace {

constexpr auto style_tags = std::array{
    std::pair{std::string_view{"b"}, MarkType::bold},
    std::pair{std::string_view{"i"}, MarkType::italic},
    std::pair{std::string_view{"u"}, MarkType::underline},
    std::pair{std::string_view{"code"}, MarkType::code},
};

// A text block that overlaps the region, with a copy of its original
// inline content and the part of it [lo, hi) inside the region.
struct RegionBlock {
    NodePath path;
    NodeType type;
    Inlines inlines;
    std::size_t flat_start;
    std::size_t lo;
    std::size_t hi;
};

// An old-text token mapped back to the region block it came from.
struct OldToken {
    std::size_t block;
    std::size_t from;
    std::size_t to;
    bool separator;
};

// A block of the merged output. Which region block's identity (type,
// attributes, position) it keeps is decided after the merge; blocks that
// keep none become new paragraphs.
struct OutBlock {
    Inlines inlines;
};

// Inside a code block a line break is a literal newline.
void literal_breaks(Inlines& inlines) {
    for (auto& leaf : inlines) {
        if (leaf.type == NodeType::hard_break) leaf = make_text("\n");
    }
}

auto trim_newlines(std::string_view text) -> std::string_view {
    while (!text.empty() && (text.front() == '\n' || text.front() == '\r')) text.remove_prefix(1);
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) text.remove_suffix(1);
    return text;
}

auto with_anchor(std::string_view which, const Error& err) -> Error {
    return Error{err.kind, std::string{which} + ": " + err.message};
}

// Text blocks between `start` and `end`. A block that ends exactly at
// `start` or begins exactly at `end` lies outside, so an anchor that
// touches a paragraph boundary selects whole paragraphs.
auto collect_region(const Node& root, const Projection& projection, std::size_t start,
                    std::size_t end) -> std::vector<RegionBlock> {
    auto region = std::vector<RegionBlock>{};
    for (const auto& block : projection.blocks) {
        const auto begins = block.flat_end > start || block.flat_start >= start;
        const auto ends = block.flat_start < end || block.flat_end <= end;
        if (!begins || !ends) continue;
        region.push_back(RegionBlock{
            .path = block.path,
            .type = block.type,
            .inlines = node_at(root, block.path).children,
            .flat_start = block.flat_start,
            .lo = std::max(start, block.flat_start) - block.flat_start,
            .hi = std::min(end, block.flat_end) - block.flat_start,
        });
    }
    return region;
}

// Walks diff hunks and assembles the merged blocks.
//
// A region block's identity goes to the output block that receives its
// first kept content (`home`). A block whose content is all gone falls
// back to the output block its kept separator opened (`opened`).
struct Merger {
    const std::vector<RegionBlock>& region;
    const StyledText& target;
    std::vector<OutBlock> out;
    std::vector<std::optional<std::size_t>> home;
    std::vector<std::optional<std::size_t>> opened;
    MarkSet inherit;                  // marks of the adjacent preceding equal text
    std::optional<MarkSet> deleted;   // marks of the first char of the current deletion

    void claim(std::size_t block) {
        if (!home[block]) home[block] = out.size() - 1;
    }

    void append(Inlines inlines) {
        std::ranges::move(inlines, std::back_inserter(out.back().inlines));
    }

    void keep(const OldToken& token) {
        deleted.reset();
        if (token.separator) {
            out.push_back(OutBlock{});
            opened[token.block + 1] = out.size() - 1;
            inherit = {};
            return;
        }
        const auto& source = region[token.block].inlines;
        append(slice_inline(source, token.from, token.to));
        claim(token.block);
        inherit = marks_at(source, token.to - 1);
    }

    // A dropped separator needs no action: the following block's content
    // keeps flowing into the current output block.
    void drop(const OldToken& token) {
        if (token.separator || deleted) return;
        deleted = marks_at(region[token.block].inlines, token.from);
    }

    void add(std::string_view token) {
        if (token == paragraph_separator) {
            out.push_back(OutBlock{});
            inherit = {};
            return;
        }
        const auto fallback = deleted ? *deleted : inherit;
        if (token == "\n") {
            out.back().inlines.push_back(make_hard_break());
            return;
        }
        if (!target.tagged) {
            out.back().inlines.push_back(make_text(std::string{token}, fallback));
            return;
        }
        const auto base = static_cast<std::size_t>(token.data() - target.text.data());
        auto i = std::size_t{0};
        while (i < token.size()) {
            const auto marks = target.marks[base + i];
            auto j = i;
            while (j < token.size() && target.marks[base + j] == marks) ++j;
            out.back().inlines.push_back(make_text(std::string{token.substr(i, j - i)}, marks));
            i = j;
        }
    }
};

}  // anonymous namespace

auto parse_style_tags(std::string_view input) -> StyledText {
    auto result = StyledText{};
    result.text.reserve(input.size());
    auto depth = std::array<int, style_tags.size()>{};

    auto active = [&] {
        auto marks = MarkSet{};
        for (std::size_t t = 0; t < style_tags.size(); ++t) {
            if (depth[t] > 0) marks.add(style_tags[t].second);
        }
        return marks;
    };

    auto i = std::size_t{0};
    while (i < input.size()) {
        auto matched = false;
        if (input[i] == '[') {
            const auto closing = i + 1 < input.size() && input[i + 1] == '/';
            const auto name_at = i + (closing ? 2 : 1);
            for (std::size_t t = 0; t < style_tags.size() && !matched; ++t) {
                const auto name = style_tags[t].first;
                if (input.substr(name_at, name.size()) == name &&
                    name_at + name.size() < input.size() && input[name_at + name.size()] == ']') {
                    if (closing) {
                        if (depth[t] > 0) --depth[t];
                    } else {
                        ++depth[t];
                    }
                    result.tagged = true;
                    matched = true;
                    i = name_at + name.size() + 1;
                }
            }
        }
        if (matched) continue;
        result.text.push_back(input[i]);
        result.marks.push_back(active());
        ++i;
    }
    return result;
}

auto rewrite(Node& document, const AnchorPair& anchors, std::string_view target,
             const Options& options) -> std::optional<Error> {
    auto working = document;
    if (project(working).blocks.empty()) working.children.push_back(make_paragraph());
    const auto projection = project(working);

    // -- Resolve the region -----------------------------------------------------

    auto start = std::size_t{0};
    auto end = projection.text.size();
    if (anchors.after_text) {
        const auto occurrence = anchors.after_occurrence ? anchors.after_occurrence : anchors.occurrence_index;
        auto resolved = resolve_anchor(projection, *anchors.after_text, occurrence, true, options.locator);
        if (auto* err = std::get_if<Error>(&resolved)) return with_anchor("afterText", *err);
        start = std::get<std::size_t>(resolved);
    }
    if (anchors.before_text) {
        const auto occurrence = anchors.before_occurrence ? anchors.before_occurrence : anchors.occurrence_index;
        auto resolved = resolve_anchor(projection, *anchors.before_text, occurrence, false, options.locator);
        if (auto* err = std::get_if<Error>(&resolved)) return with_anchor("beforeText", *err);
        end = std::get<std::size_t>(resolved);
    }
    if (anchors.after_text && anchors.before_text && start == end) {
        return Error{ErrorKind::empty_region, "afterText and beforeText meet at offset " +
                                                  std::to_string(start) + "; nothing lies between them"};
    }
    if (end < start) {
        return Error{ErrorKind::invalid_anchors, "beforeText occurs before afterText"};
    }
    if (options.max_rewrite_bytes > 0 && end - start > options.max_rewrite_bytes) {
        return Error{ErrorKind::region_too_large,
                     "region of " + std::to_string(end - start) + " bytes exceeds the limit of " +
                         std::to_string(options.max_rewrite_bytes)};
    }

    const auto region = collect_region(working, projection, start, end);

    // -- Diff old against target ------------------------------------------------

    auto old_tokens = std::vector<std::string_view>{};
    auto old_map = std::vector<OldToken>{};
    for (std::size_t k = 0; k < region.size(); ++k) {
        if (k > 0) {
            old_tokens.push_back(paragraph_separator);
            old_map.push_back(OldToken{.block = k - 1, .from = 0, .to = 0, .separator = true});
        }
        const auto& block = region[k];
        const auto text = std::string_view{projection.text}.substr(block.flat_start + block.lo,
                                                                  block.hi - block.lo);
        for (auto token : tokenize(text, false)) {
            const auto from = block.lo + static_cast<std::size_t>(token.data() - text.data());
            old_tokens.push_back(token);
            old_map.push_back(OldToken{.block = k, .from = from, .to = from + token.size(), .separator = false});
        }
    }

    const auto trimmed = trim_newlines(target);
    const auto styled = options.parse_style_tags
        ? parse_style_tags(trimmed)
        : StyledText{.text = std::string{trimmed}, .marks = {}, .tagged = false};
    const auto new_tokens = tokenize(styled.text, true);

    if (region.empty() && new_tokens.empty()) {
        document = std::move(working);
        return std::nullopt;
    }

    // -- Merge ------------------------------------------------------------------

    auto merger = Merger{
        .region = region,
        .target = styled,
        .out = {OutBlock{}},
        .home = std::vector<std::optional<std::size_t>>(region.size()),
        .opened = std::vector<std::optional<std::size_t>>(region.size()),
        .inherit = {},
        .deleted = {},
    };
    if (!region.empty()) {
        // Text ahead of the region stays with the first block.
        merger.opened[0] = 0;
        auto head = slice_inline(region[0].inlines, 0, region[0].lo);
        if (!head.empty()) {
            merger.append(std::move(head));
            merger.claim(0);
        }
    }

    for (const auto& hunk : diff_hunks(old_tokens, new_tokens, options.max_diff_cost)) {
        switch (hunk.op) {
            case DiffOp::equal:
                for (auto i = hunk.old_begin; i < hunk.old_end; ++i) merger.keep(old_map[i]);
                break;
            case DiffOp::del:
                for (auto i = hunk.old_begin; i < hunk.old_end; ++i) merger.drop(old_map[i]);
                break;
            case DiffOp::insert:
                for (auto i = hunk.new_begin; i < hunk.new_end; ++i) merger.add(new_tokens[i]);
                break;
        }
    }
    if (!region.empty()) {
        const auto& last = region.back();
        auto tail = slice_inline(last.inlines, last.hi, inline_length(last.inlines));
        if (!tail.empty()) {
            merger.append(std::move(tail));
            merger.claim(region.size() - 1);
        }
    }

    // -- Apply ------------------------------------------------------------------

    if (region.empty()) {
        // The region sits between blocks: add the text as new paragraphs.
        const auto after = anchors.after_text.has_value();
        const auto& anchor_block = projection.blocks[*projection.block_at(after ? start - 1 : end)];
        for (auto it = merger.out.rbegin(); it != merger.out.rend(); ++it) {
            normalize_inline(it->inlines);
            insert_sibling(working, anchor_block.path, make_paragraph(std::move(it->inlines)), after);
        }
        document = std::move(working);
        return std::nullopt;
    }

    // Each output block keeps the identity of at most one region block; on
    // a join the earlier block wins. Homes never decrease with the block
    // index, so owned output blocks stay in document order, and block 0
    // always owns one.
    auto owner = std::vector<std::optional<std::size_t>>(merger.out.size());
    for (std::size_t k = 0; k < region.size(); ++k) {
        const auto at = merger.home[k] ? merger.home[k] : merger.opened[k];
        if (at && !owner[*at]) owner[*at] = k;
    }

    auto content = std::vector<std::optional<Inlines>>(region.size());
    auto tails = std::vector<std::vector<Node>>(region.size());
    auto leading = std::vector<Node>{};
    auto current = std::optional<std::size_t>{};
    for (std::size_t i = 0; i < merger.out.size(); ++i) {
        auto& inlines = merger.out[i].inlines;
        if (owner[i]) {
            current = owner[i];
            if (region[*current].type == NodeType::code_block) literal_breaks(inlines);
            normalize_inline(inlines);
            content[*current] = std::move(inlines);
            continue;
        }
        normalize_inline(inlines);
        auto paragraph = make_paragraph(std::move(inlines));
        if (current) {
            tails[*current].push_back(std::move(paragraph));
        } else {
            leading.push_back(std::move(paragraph));
        }
    }

    // Last block first so the paths of earlier blocks stay valid.
    for (auto k = region.size(); k-- > 0;) {
        const auto& path = region[k].path;
        if (!content[k]) {
            remove_node(working, path);
            continue;
        }
        node_at(working, path).children = std::move(*content[k]);
        for (auto it = tails[k].rbegin(); it != tails[k].rend(); ++it) {
            insert_sibling(working, path, std::move(*it), true);
        }
    }
    for (auto it = leading.rbegin(); it != leading.rend(); ++it) {
        insert_sibling(working, region[0].path, std::move(*it), false);
    }

    document = std::move(working);
    return std::nullopt;
}

}  // namespace docpatch::detail
