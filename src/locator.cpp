#include <docpatch/locator.hpp>

#include <algorithm>
#include <cctype>
#include <string>

namespace docpatch {

namespace {

// -- Folding --------------------------------------------------------------------

// Text after the optional typography and whitespace folding, with a map
// from every folded byte back to the source character it came from.
struct FoldedText {
    std::string text;
    std::vector<std::size_t> begin;  // source offset of the originating char
    std::vector<std::size_t> end;    // source offset one past it
};

auto utf8_length(unsigned char lead) -> std::size_t {
    if (lead < 0x80) return 1;
    if ((lead & 0xE0) == 0xC0) return 2;
    if ((lead & 0xF0) == 0xE0) return 3;
    if ((lead & 0xF8) == 0xF0) return 4;
    return 1;
}

// Typography replacement for one UTF-8 character. Returns the folded
// text: the input itself, a replacement, or empty to drop the character.
auto fold_char(std::string_view ch) -> std::string_view {
    if (ch == "\xC2\xA0") return " ";   // no-break space
    if (ch == "\xC2\xAD") return "";    // soft hyphen
    if (ch.size() == 3 && static_cast<unsigned char>(ch[0]) == 0xE2 &&
        static_cast<unsigned char>(ch[1]) == 0x80) {
        const auto c = static_cast<unsigned char>(ch[2]);
        if (c >= 0x8B && c <= 0x8F) return "";  // zero-width and direction marks
        if (c >= 0xAA && c <= 0xAE) return "";  // embedding controls
        if (c == 0x98 || c == 0x99 || c == 0xB2) return "'";
        if (c == 0x9C || c == 0x9D || c == 0xB3) return "\"";
        if (c == 0x93 || c == 0x94) return "-";
    }
    if (ch == "\xE2\x81\xA0") return "";      // word joiner
    if (ch == "\xEF\xBB\xBF") return "";      // byte order mark
    return ch;
}

auto is_folded_space(char c) -> bool {
    return c == ' ' || c == '\t' || c == '\n';
}

auto fold(std::string_view src, const LocatorOptions& options) -> FoldedText {
    auto out = FoldedText{};
    out.text.reserve(src.size());
    out.begin.reserve(src.size());
    out.end.reserve(src.size());

    auto push = [&](std::string_view piece, std::size_t from, std::size_t to) {
        for (auto c : piece) {
            if (options.collapse_whitespace && is_folded_space(c)) {
                if (!out.text.empty() && out.text.back() == ' ' &&
                    !out.end.empty() && out.end.back() == from) {
                    out.end.back() = to;  // extend the collapsed space
                    continue;
                }
                c = ' ';
            }
            out.text.push_back(c);
            out.begin.push_back(from);
            out.end.push_back(to);
        }
    };

    auto i = std::size_t{0};
    while (i < src.size()) {
        const auto len = std::min(utf8_length(static_cast<unsigned char>(src[i])), src.size() - i);
        const auto ch = src.substr(i, len);
        push(options.normalize_typography ? fold_char(ch) : ch, i, i + len);
        i += len;
    }
    return out;
}

auto folding_enabled(const LocatorOptions& options) -> bool {
    return options.normalize_typography || options.collapse_whitespace;
}

auto fold_query(std::string_view text, const LocatorOptions& options) -> std::string {
    if (!folding_enabled(options)) return std::string{text};
    return fold(text, options).text;
}

auto is_word_byte(char c) -> bool {
    const auto u = static_cast<unsigned char>(c);
    return u >= 0x80 || std::isalnum(u) != 0;
}

auto quoted(std::string_view text) -> std::string {
    constexpr auto limit = std::size_t{60};
    if (text.size() <= limit) return "\"" + std::string{text} + "\"";
    return "\"" + std::string{text.substr(0, limit)} + "...\"";
}

// -- Candidate collection ---------------------------------------------------------

struct Candidates {
    std::vector<Span> spans;          // passed every filter
    std::size_t cross_block{0};       // dropped for spanning blocks
    std::size_t in_block{0};          // occurrences inside one block
    std::size_t before_matches{0};    // satisfied context_before
    std::size_t after_matches{0};     // satisfied context_after
};

auto collect(const Projection& projection, const LocatorQuery& query,
             const LocatorOptions& options) -> std::variant<Candidates, Error> {
    if (query.literal.empty()) {
        return Error{ErrorKind::invalid_edit, "search text is empty"};
    }
    const auto literal = fold_query(query.literal, options);
    if (literal.empty()) {
        return Error{ErrorKind::invalid_edit, "search text is empty after normalization"};
    }

    const auto folding = folding_enabled(options);
    const auto folded = folding ? fold(projection.text, options) : FoldedText{};
    const auto& haystack = folding ? folded.text : projection.text;

    const auto before = query.context_before ? fold_query(*query.context_before, options) : std::string{};
    const auto after = query.context_after ? fold_query(*query.context_after, options) : std::string{};
    const auto has_before = query.context_before.has_value() && !before.empty();
    const auto has_after = query.context_after.has_value() && !after.empty();

    auto result = Candidates{};
    auto pos = haystack.find(literal);
    while (pos != std::string::npos) {
        const auto fend = pos + literal.size();
        const auto next = haystack.find(literal, pos + 1);

        if (options.whole_word &&
            ((pos > 0 && is_word_byte(haystack[pos - 1])) ||
             (fend < haystack.size() && is_word_byte(haystack[fend])))) {
            pos = next;
            continue;
        }

        const auto span = folding
            ? Span{folded.begin[pos], folded.end[fend - 1]}
            : Span{pos, fend};
        if (!projection.block_of(span)) {
            ++result.cross_block;
            pos = next;
            continue;
        }
        ++result.in_block;

        auto before_ok = true;
        if (has_before) {
            const auto from = pos > options.context_window ? pos - options.context_window : 0;
            before_ok = std::string_view{haystack}.substr(from, pos - from).find(before) != std::string_view::npos;
            if (before_ok) ++result.before_matches;
        }
        auto after_ok = true;
        if (has_after) {
            after_ok = std::string_view{haystack}.substr(fend, options.context_window).find(after) != std::string_view::npos;
            if (after_ok) ++result.after_matches;
        }
        if (before_ok && after_ok) result.spans.push_back(span);
        pos = next;
    }

    if (!result.spans.empty()) return result;

    if (has_before && has_after && result.before_matches > 0 && result.after_matches > 0) {
        return Error{ErrorKind::ambiguous,
                     "contextBefore and contextAfter point at different occurrences of " +
                         quoted(query.literal)};
    }
    if (result.in_block == 0 &&
        (result.cross_block > 0 || query.literal.find("\n\n") != std::string::npos)) {
        return Error{ErrorKind::cross_block_literal,
                     quoted(query.literal) + " spans a paragraph boundary; edit each paragraph separately"};
    }
    if (result.in_block == 0) {
        return Error{ErrorKind::not_found, quoted(query.literal) + " does not occur in the document"};
    }
    return Error{ErrorKind::not_found,
                 "no occurrence of " + quoted(query.literal) + " matches the given context"};
}

}  // anonymous namespace

auto find_occurrences(const Projection& projection, std::string_view literal,
                      const LocatorOptions& options) -> std::vector<Span> {
    auto result = std::vector<Span>{};
    const auto needle = fold_query(literal, options);
    if (needle.empty()) return result;

    const auto folding = folding_enabled(options);
    const auto folded = folding ? fold(projection.text, options) : FoldedText{};
    const auto& haystack = folding ? folded.text : projection.text;

    for (auto pos = haystack.find(needle); pos != std::string::npos;
         pos = haystack.find(needle, pos + 1)) {
        const auto fend = pos + needle.size();
        if (options.whole_word &&
            ((pos > 0 && is_word_byte(haystack[pos - 1])) ||
             (fend < haystack.size() && is_word_byte(haystack[fend])))) {
            continue;
        }
        result.push_back(folding ? Span{folded.begin[pos], folded.end[fend - 1]} : Span{pos, fend});
    }
    return result;
}

auto locate(const Projection& projection, const LocatorQuery& query,
            const LocatorOptions& options) -> LocateResult {
    auto collected = collect(projection, query, options);
    if (auto* err = std::get_if<Error>(&collected)) return *err;
    auto& spans = std::get<Candidates>(collected).spans;

    if (query.occurrence_index) {
        const auto n = *query.occurrence_index;
        if (n == 0) {
            return Error{ErrorKind::invalid_edit, "occurrenceIndex is 1-based"};
        }
        if (n > spans.size()) {
            return Error{ErrorKind::not_found,
                         "occurrence " + std::to_string(n) + " of " + quoted(query.literal) +
                             " requested but only " + std::to_string(spans.size()) + " found"};
        }
        return std::vector<Span>{spans[n - 1]};
    }
    if (spans.size() == 1) return std::move(spans);
    if (query.max_occurrences) {
        const auto k = *query.max_occurrences;
        if (k == 0) {
            return Error{ErrorKind::invalid_edit, "maxOccurrences must be at least 1"};
        }
        spans.resize(std::min(k, spans.size()));
        return std::move(spans);
    }
    return Error{ErrorKind::ambiguous,
                 std::to_string(spans.size()) + " occurrences of " + quoted(query.literal) +
                     "; add contextBefore/contextAfter, occurrenceIndex or maxOccurrences"};
}

auto locate_all(const Projection& projection, const LocatorQuery& query,
                const LocatorOptions& options) -> LocateResult {
    auto collected = collect(projection, query, options);
    if (auto* err = std::get_if<Error>(&collected)) return *err;
    return std::move(std::get<Candidates>(collected).spans);
}

}  // namespace docpatch
