#include "engine/pattern_matcher.h"

#include "common/macros.h"
#include "common/string_utils.h"

namespace Shield {

using Common::copyBounded;
using Common::copyUtf8Bounded;
using Common::findToken;
using Common::isSpace;
using Common::toLowerAscii;
using Common::trimView;

namespace {

SHIELD_ALWAYS_INLINE auto sameChar(char a, char b, bool case_sensitive) noexcept -> bool {
    return case_sensitive ? a == b : toLowerAscii(a) == toLowerAscii(b);
}

/// Earliest occurrence of any token; false when none occurs
auto findAny(std::string_view line, const TokenList& tokens, bool case_sensitive, size_t* column) noexcept -> bool {
    size_t best = std::string_view::npos;
    for (uint32_t t = 0; t < tokens.count; ++t) {
        const size_t pos = findToken(line, tokens.at(t), case_sensitive);
        if (pos < best) {
            best = pos;
        }
    }
    if (best == std::string_view::npos) {
        return false;
    }
    *column = best;
    return true;
}

/// Like find, but whitespace on either side is ignored: "verify = False"
/// matches "verify=False"
auto findIgnoringSpace(std::string_view line, std::string_view token, bool case_sensitive) noexcept -> size_t {
    for (size_t start = 0; start < line.size(); ++start) {
        if (isSpace(line[start])) {
            continue;
        }
        size_t i = start;
        size_t j = 0;
        while (j < token.size()) {
            if (isSpace(token[j])) {
                ++j;
                continue;
            }
            while (i < line.size() && isSpace(line[i])) ++i;
            if (i >= line.size() || !sameChar(line[i], token[j], case_sensitive)) {
                break;
            }
            ++i;
            ++j;
        }
        if (j == token.size()) {
            return start;
        }
    }
    return std::string_view::npos;
}

auto findAnyIgnoringSpace(std::string_view line, const TokenList& tokens, bool case_sensitive,
                          size_t* column) noexcept -> bool {
    size_t best = std::string_view::npos;
    for (uint32_t t = 0; t < tokens.count; ++t) {
        const size_t pos = findIgnoringSpace(line, tokens.at(t), case_sensitive);
        if (pos < best) {
            best = pos;
        }
    }
    if (best == std::string_view::npos) {
        return false;
    }
    *column = best;
    return true;
}

/// Any token on any line of the range, case-insensitive
auto anyTokenInRange(const SourceUnit& unit, LineRange range, const TokenList& tokens) noexcept -> bool {
    size_t ignored;
    for (uint32_t l = range.first; l <= range.last; ++l) {
        if (findAny(unit.line(l), tokens, false, &ignored)) {
            return true;
        }
    }
    return false;
}

auto isTargetDelimiter(char c) noexcept -> bool {
    return c == ',' || c == '(' || c == '{' || c == '[' || c == ';';
}

auto isComparisonPrefix(char c) noexcept -> bool {
    switch (c) {
        case '!': case '<': case '>': case '=': case '+': case '-': case '*':
        case '/': case '%': case '&': case '|': case '^': case '~':
            return true;
        default:
            return false;
    }
}

struct AssignmentHit {
    size_t column;
    std::string_view literal;
    bool has_literal;
};

/// Finds "target OP rhs" where OP is one of =, :=, :, => outside string
/// literals and the target names one of the indicator tokens
auto findAssignment(const SourceUnit& unit, uint32_t line_no, const Indicator& ind,
                    AssignmentHit* hit) noexcept -> bool {
    const std::string_view line = unit.line(line_no);
    char quote = 0;

    for (size_t i = 0; i < line.size(); ++i) {
        const char c = line[i];
        if (quote) {
            if (c == '\\') {
                ++i;
            } else if (c == quote) {
                quote = 0;
            }
            continue;
        }
        if (c == '"' || c == '\'') {
            quote = c;
            continue;
        }

        size_t op_len = 0;
        bool may_wrap = true;
        const char next = i + 1 < line.size() ? line[i + 1] : '\0';
        const char prev = i > 0 ? line[i - 1] : '\0';
        if (c == ':') {
            if (next == ':' || prev == ':') {
                continue;  // scope operator
            }
            op_len = next == '=' ? 2 : 1;
            may_wrap = next == '=';
        } else if (c == '=') {
            if (next == '=') {
                ++i;  // equality
                continue;
            }
            if (isComparisonPrefix(prev)) {
                continue;
            }
            op_len = next == '>' ? 2 : 1;
        } else {
            continue;
        }

        size_t begin = i;
        while (begin > 0 && !isTargetDelimiter(line[begin - 1])) {
            --begin;
        }
        const std::string_view target = line.substr(begin, i - begin);
        size_t token_pos;
        if (!findAny(target, ind.tokens, ind.case_sensitive, &token_pos)) {
            i += op_len - 1;
            continue;
        }

        hit->column = begin + token_pos;
        hit->has_literal = false;
        if (!ind.literal_rhs) {
            return true;
        }

        const std::string_view rhs = trimView(line.substr(i + op_len));
        if (leadingStringLiteral(rhs, &hit->literal)) {
            hit->has_literal = true;
            return true;
        }

        // Wrapped expression: the literal opens the next non-blank line
        if (may_wrap && (rhs.empty() || rhs == "(" || rhs == "\\")) {
            const LineRange wrap = clampRange(unit, int64_t{line_no} + 1, int64_t{line_no} + ind.window);
            for (uint32_t l = wrap.first; l <= wrap.last; ++l) {
                const std::string_view continued = trimView(unit.line(l));
                if (continued.empty()) {
                    continue;
                }
                if (leadingStringLiteral(continued, &hit->literal)) {
                    hit->has_literal = true;
                    return true;
                }
                break;
            }
        }
        i += op_len - 1;
    }
    return false;
}

} // namespace

auto leadingStringLiteral(std::string_view rhs, std::string_view* content) noexcept -> bool {
    size_t i = 0;
    while (i < rhs.size() && i < 2) {
        const char p = toLowerAscii(rhs[i]);
        if (p != 'b' && p != 'r' && p != 'u') {
            break;
        }
        ++i;
    }
    if (i >= rhs.size() || (rhs[i] != '"' && rhs[i] != '\'')) {
        return false;
    }
    const char quote = rhs[i];
    const size_t start = i + 1;
    size_t end = start;
    while (end < rhs.size() && rhs[end] != quote) {
        if (rhs[end] == '\\') {
            ++end;
        }
        ++end;
    }
    if (end > rhs.size()) {
        end = rhs.size();
    }
    *content = rhs.substr(start, end - start);
    return true;
}

auto PatternMatcher::matchLine(const SourceUnit& unit, const Rule& rule, uint16_t indicator_index,
                               uint32_t line_no, Match* out) noexcept -> bool {
    const Indicator& ind = rule.indicator(indicator_index);
    const std::string_view line = unit.line(line_no);

    size_t column = 0;
    AssignmentHit assignment{};

    switch (ind.kind) {
        case IndicatorKind::KEYWORD:
            if (!findAny(line, ind.tokens, ind.case_sensitive, &column)) return false;
            break;
        case IndicatorKind::LITERAL:
            if (!findAnyIgnoringSpace(line, ind.tokens, ind.case_sensitive, &column)) return false;
            break;
        case IndicatorKind::ASSIGNMENT:
            if (!findAssignment(unit, line_no, ind, &assignment)) return false;
            column = assignment.column;
            break;
        case IndicatorKind::COOCCURRENCE: {
            if (!findAny(line, ind.tokens, ind.case_sensitive, &column)) return false;
            const LineRange around = clampRange(unit, int64_t{line_no} - ind.window, int64_t{line_no} + ind.window);
            if (!anyTokenInRange(unit, around, ind.with)) return false;
            break;
        }
    }

    if (!ind.without.empty()) {
        const LineRange guard = clampRange(unit, int64_t{line_no} - ind.window, int64_t{line_no} + ind.lookahead);
        if (anyTokenInRange(unit, guard, ind.without)) {
            return false;
        }
    }

    out->rule = &rule;
    out->indicator_index = indicator_index;
    out->unit = &unit;
    out->line = line_no;
    out->column = static_cast<uint32_t>(column);
    copyUtf8Bounded(out->excerpt, sizeof(out->excerpt), trimView(line));
    out->has_literal = assignment.has_literal;
    if (assignment.has_literal) {
        copyBounded(out->literal_value, sizeof(out->literal_value), assignment.literal);
    } else {
        out->literal_value[0] = '\0';
    }
    out->confidence = ind.confidence;
    out->low_confidence = false;
    return true;
}

auto PatternMatcher::scanRule(const SourceUnit& unit, const Rule& rule, std::vector<Match>* out) -> void {
    const uint32_t lines = unit.lineCount();
    Match match;
    for (uint16_t idx = 0; idx < rule.indicator_count; ++idx) {
        for (uint32_t l = 1; l <= lines; ++l) {
            if (matchLine(unit, rule, idx, l, &match)) {
                out->push_back(match);
            }
        }
    }
}

auto PatternMatcher::scan(const SourceUnit& unit, const RuleCatalog& catalog, std::vector<Match>* out) -> void {
    for (const Rule& rule : catalog.allRules()) {
        scanRule(unit, rule, out);
    }
}

} // namespace Shield
