#include <docpatch/diff.hpp>

#include <algorithm>
#include <span>
#include <utility>

namespace docpatch {

namespace {

auto is_blank(char c) -> bool {
    return c == ' ' || c == '\t' || c == '\r';
}

using Match = std::pair<std::size_t, std::size_t>;  // (old index, new index)

// Myers' greedy forward search with a saved V array per edit step,
// then a backtrack through the trace. Appends the matched token pairs
// (offset by `base_old`/`base_new`) in document order. Returns false
// if the edit script would cost more than `max_cost`.
auto myers(std::span<const std::string_view> a, std::span<const std::string_view> b,
           std::size_t base_old, std::size_t base_new, std::size_t max_cost,
           std::vector<Match>& out) -> bool {
    const auto n = static_cast<long>(a.size());
    const auto m = static_cast<long>(b.size());
    const auto limit = std::min(n + m, static_cast<long>(max_cost));
    const auto offset = limit + 1;

    auto v = std::vector<long>(static_cast<std::size_t>(2 * limit + 3), 0);
    auto trace = std::vector<std::vector<long>>{};
    auto at = [&](std::vector<long>& arr, long k) -> long& {
        return arr[static_cast<std::size_t>(k + offset)];
    };

    auto found = false;
    for (long d = 0; d <= limit && !found; ++d) {
        // Only diagonals [-d-1, d+1] are read back for this step.
        trace.emplace_back(v.begin() + (offset - d - 1), v.begin() + (offset + d + 2));
        for (long k = -d; k <= d; k += 2) {
            long x = 0;
            if (k == -d || (k != d && at(v, k - 1) < at(v, k + 1))) {
                x = at(v, k + 1);
            } else {
                x = at(v, k - 1) + 1;
            }
            long y = x - k;
            while (x < n && y < m && a[static_cast<std::size_t>(x)] == b[static_cast<std::size_t>(y)]) {
                ++x;
                ++y;
            }
            at(v, k) = x;
            if (x >= n && y >= m) {
                found = true;
                break;
            }
        }
    }
    if (!found) return false;

    auto reversed = std::vector<Match>{};
    long x = n;
    long y = m;
    for (long d = static_cast<long>(trace.size()) - 1; d >= 0; --d) {
        const auto& step = trace[static_cast<std::size_t>(d)];
        auto window = [&](long k) { return step[static_cast<std::size_t>(k + d + 1)]; };
        const long k = x - y;
        long prev_k = 0;
        if (k == -d || (k != d && window(k - 1) < window(k + 1))) {
            prev_k = k + 1;
        } else {
            prev_k = k - 1;
        }
        const long prev_x = window(prev_k);
        const long prev_y = prev_x - prev_k;
        while (x > prev_x && y > prev_y) {
            --x;
            --y;
            reversed.emplace_back(base_old + static_cast<std::size_t>(x),
                                  base_new + static_cast<std::size_t>(y));
        }
        x = prev_x;
        y = prev_y;
    }
    out.insert(out.end(), reversed.rbegin(), reversed.rend());
    return true;
}

// Turn the ordered list of matched token pairs into hunks.
auto to_hunks(const std::vector<Match>& matches, std::size_t old_size, std::size_t new_size)
    -> std::vector<DiffHunk> {
    auto hunks = std::vector<DiffHunk>{};
    auto oi = std::size_t{0};
    auto ni = std::size_t{0};

    auto flush_change = [&](std::size_t old_to, std::size_t new_to) {
        if (old_to > oi) {
            hunks.push_back(DiffHunk{.op = DiffOp::del, .old_begin = oi, .old_end = old_to,
                                     .new_begin = ni, .new_end = ni});
        }
        if (new_to > ni) {
            hunks.push_back(DiffHunk{.op = DiffOp::insert, .old_begin = old_to, .old_end = old_to,
                                     .new_begin = ni, .new_end = new_to});
        }
        oi = old_to;
        ni = new_to;
    };

    for (const auto& [o, n] : matches) {
        flush_change(o, n);
        if (!hunks.empty() && hunks.back().op == DiffOp::equal &&
            hunks.back().old_end == o && hunks.back().new_end == n) {
            ++hunks.back().old_end;
            ++hunks.back().new_end;
        } else {
            hunks.push_back(DiffHunk{.op = DiffOp::equal, .old_begin = o, .old_end = o + 1,
                                     .new_begin = n, .new_end = n + 1});
        }
        oi = o + 1;
        ni = n + 1;
    }
    flush_change(old_size, new_size);
    return hunks;
}

}  // anonymous namespace

auto tokenize(std::string_view text, bool paragraphs) -> std::vector<std::string_view> {
    auto tokens = std::vector<std::string_view>{};
    auto i = std::size_t{0};
    while (i < text.size()) {
        auto j = i;
        if (text[i] == '\n') {
            while (j < text.size() && text[j] == '\n') ++j;
            if (paragraphs && j - i >= 2) {
                tokens.push_back(paragraph_separator);
                i = j;
            } else {
                tokens.push_back(text.substr(i, 1));
                ++i;
            }
            continue;
        }
        if (is_blank(text[i])) {
            while (j < text.size() && is_blank(text[j])) ++j;
        } else {
            while (j < text.size() && text[j] != '\n' && !is_blank(text[j])) ++j;
        }
        tokens.push_back(text.substr(i, j - i));
        i = j;
    }
    return tokens;
}

auto diff_hunks(const std::vector<std::string_view>& old_tokens,
                const std::vector<std::string_view>& new_tokens,
                std::size_t max_cost) -> std::vector<DiffHunk> {
    const auto old_size = old_tokens.size();
    const auto new_size = new_tokens.size();

    auto prefix = std::size_t{0};
    while (prefix < old_size && prefix < new_size && old_tokens[prefix] == new_tokens[prefix]) {
        ++prefix;
    }
    auto suffix = std::size_t{0};
    while (suffix < old_size - prefix && suffix < new_size - prefix &&
           old_tokens[old_size - 1 - suffix] == new_tokens[new_size - 1 - suffix]) {
        ++suffix;
    }

    auto matches = std::vector<Match>{};
    matches.reserve(prefix + suffix);
    for (std::size_t i = 0; i < prefix; ++i) matches.emplace_back(i, i);

    const auto a = std::span{old_tokens}.subspan(prefix, old_size - prefix - suffix);
    const auto b = std::span{new_tokens}.subspan(prefix, new_size - prefix - suffix);
    if (!a.empty() && !b.empty()) {
        auto middle = std::vector<Match>{};
        // Over the cost cap the middle stays unmatched: one delete, one insert.
        if (myers(a, b, prefix, prefix, max_cost, middle)) {
            matches.insert(matches.end(), middle.begin(), middle.end());
        }
    }

    for (std::size_t i = suffix; i > 0; --i) {
        matches.emplace_back(old_size - i, new_size - i);
    }
    return to_hunks(matches, old_size, new_size);
}

auto diff_tokens(const std::vector<std::string_view>& old_tokens,
                 const std::vector<std::string_view>& new_tokens,
                 std::size_t max_cost) -> std::vector<DiffRun> {
    auto runs = std::vector<DiffRun>{};
    for (const auto& hunk : diff_hunks(old_tokens, new_tokens, max_cost)) {
        auto text = std::string{};
        if (hunk.op == DiffOp::insert) {
            for (auto i = hunk.new_begin; i < hunk.new_end; ++i) text += new_tokens[i];
        } else {
            for (auto i = hunk.old_begin; i < hunk.old_end; ++i) text += old_tokens[i];
        }
        runs.push_back(DiffRun{.op = hunk.op, .text = std::move(text)});
    }
    return runs;
}

auto diff_text(std::string_view old_text, std::string_view new_text,
               std::size_t max_cost) -> std::vector<DiffRun> {
    return diff_tokens(tokenize(old_text), tokenize(new_text), max_cost);
}

}  // namespace docpatch
