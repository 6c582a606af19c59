#include "engine/scorer.h"

#include <cmath>
#include <cstdio>
#include <initializer_list>

#include "common/digest.h"
#include "common/logging.h"
#include "common/string_utils.h"

namespace Shield {

using Common::copyBounded;
using Common::endsWith;
using Common::equalsNoCase;
using Common::isIdentChar;
using Common::isSpace;
using Common::startsWith;
using Common::trimView;

namespace {

constexpr const char* CONTROL_KEYWORDS[] = {
    "if", "for", "while", "switch", "catch", "else", "do", "try", "return", "elif", "with", "except"
};

auto leadingWord(std::string_view s) noexcept -> std::string_view {
    size_t n = 0;
    while (n < s.size() && isIdentChar(s[n])) ++n;
    return s.substr(0, n);
}

/// Name of the function defined on this line, empty if the line is not a
/// definition. Recognizes def/async def, function/func/fn and C-like
/// "type name(args) {" signatures.
auto definedFunctionName(std::string_view raw) noexcept -> std::string_view {
    std::string_view t = trimView(raw);

    for (const char* kw : {"async def ", "def ", "async function ", "function ", "func ", "fn "}) {
        if (startsWith(t, kw)) {
            return leadingWord(trimView(t.substr(std::string_view(kw).size())));
        }
    }

    const std::string_view first = leadingWord(t);
    for (const char* kw : CONTROL_KEYWORDS) {
        if (first == kw) return {};
    }
    const size_t paren = t.find('(');
    if (paren == std::string_view::npos || paren == 0 || !endsWith(t, "{")) {
        return {};
    }
    size_t end = paren;
    while (end > 0 && isSpace(t[end - 1])) --end;
    size_t begin = end;
    while (begin > 0 && isIdentChar(t[begin - 1])) --begin;
    // Needs a return type or qualifier before the name
    if (begin == 0 || begin == end) {
        return {};
    }
    return t.substr(begin, end - begin);
}

auto startsWithNoCase(std::string_view s, std::string_view prefix) noexcept -> bool {
    return s.size() >= prefix.size() && equalsNoCase(s.substr(0, prefix.size()), prefix);
}

auto endsWithNoCase(std::string_view s, std::string_view suffix) noexcept -> bool {
    return s.size() >= suffix.size() && equalsNoCase(s.substr(s.size() - suffix.size()), suffix);
}

void buildRationale(const Rule& rule, const Indicator& ind, bool low_confidence, char* out, size_t size) {
    const char* what = ind.description[0] ? ind.description : rule.title;
    const char* question = rule.guidance_count > 0 ? rule.guidance[0] : "";
    std::snprintf(out, size, "%s%s%s%s", what, question[0] ? " Review: " : "", question,
                  low_confidence ? " (no enclosing try block found nearby)" : "");
}

} // namespace

Scorer::Scorer(const ScannerConfig& config) noexcept : config_(config) {}

auto Scorer::bandFor(Category category, Factor factor, bool production_path, bool entry_point,
                     bool* anomaly) noexcept -> SeverityBand {
    *anomaly = false;
    switch (category) {
        case Category::HARDCODED_CREDENTIALS:
            if (factor == Factor::CREDENTIAL_LITERAL) {
                return production_path ? SeverityBand::CRITICAL : SeverityBand::HIGH;
            }
            *anomaly = true;
            return SeverityBand::HIGH;
        case Category::SSL_VERIFICATION_DISABLED:
            if (factor == Factor::EXPLICIT_VERIFY_DISABLED) return SeverityBand::CRITICAL;
            if (factor == Factor::PLAIN_HTTP_ENDPOINT) return SeverityBand::HIGH;
            *anomaly = true;
            return SeverityBand::HIGH;
        case Category::INPUT_VALIDATION_MISSING:
            if (factor == Factor::UNVALIDATED_INPUT) {
                return entry_point ? SeverityBand::CRITICAL : SeverityBand::MEDIUM;
            }
            *anomaly = true;
            return SeverityBand::MEDIUM;
        case Category::INFORMATION_DISCLOSURE_IN_LOGS:
            if (factor == Factor::CREDENTIAL_IN_LOG) return SeverityBand::HIGH;
            if (factor == Factor::VERBOSE_EXCEPTION_LOG) return SeverityBand::MEDIUM;
            *anomaly = true;
            return SeverityBand::MEDIUM;
        case Category::INSUFFICIENT_ERROR_HANDLING:
            if (factor == Factor::BARE_CATCH) return SeverityBand::MEDIUM;
            if (factor == Factor::MISSING_TIMEOUT) return SeverityBand::LOW;
            *anomaly = true;
            return SeverityBand::LOW;
    }
    *anomaly = true;
    return SeverityBand::LOW;
}

auto Scorer::scoreInBand(SeverityBand band, double confidence) noexcept -> uint8_t {
    const BandRange range = bandRange(band);
    const int width = range.high - range.low + 1;
    if (confidence < 0.0) confidence = 0.0;
    if (confidence > 1.0) confidence = 1.0;
    int value = range.low + static_cast<int>(std::floor(confidence * width));
    if (value > range.high) value = range.high;
    return static_cast<uint8_t>(value);
}

auto Scorer::isProductionPath(std::string_view unit_id) const noexcept -> bool {
    return !isTestPath(unit_id, config_.classification.test_segments);
}

auto Scorer::handlerName(std::string_view name) const noexcept -> bool {
    const auto& cls = config_.classification;
    for (uint32_t i = 0; i < cls.handler_prefixes.count; ++i) {
        if (startsWithNoCase(name, cls.handler_prefixes.at(i))) return true;
    }
    for (uint32_t i = 0; i < cls.handler_suffixes.count; ++i) {
        if (endsWithNoCase(name, cls.handler_suffixes.at(i))) return true;
    }
    return false;
}

auto Scorer::isEntryPoint(const SourceUnit& unit, uint32_t line_no) const noexcept -> bool {
    const LineRange range = clampRange(unit, int64_t{line_no} - config_.scan.entry_point_window, line_no);
    for (uint32_t l = range.last; l >= range.first && l > 0; --l) {
        const std::string_view name = definedFunctionName(unit.line(l));
        if (name.empty()) {
            continue;
        }
        if (handlerName(name)) {
            return true;
        }
        // Decorators stacked directly above the definition
        const auto& decorators = config_.classification.handler_decorators;
        for (uint32_t d = l - 1; d >= 1; --d) {
            const std::string_view above = trimView(unit.line(d));
            if (above.empty() || above[0] != '@') {
                break;
            }
            for (uint32_t i = 0; i < decorators.count; ++i) {
                if (startsWith(above, decorators.at(i))) return true;
            }
        }
        return false;  // nearest enclosing definition decides
    }
    return false;
}

auto Scorer::fingerprint(const Finding& finding, char* out, size_t out_size) noexcept -> bool {
    if (out_size < FINGERPRINT_LEN + 1) {
        return false;
    }

    // Collapse whitespace runs so re-indentation keeps the fingerprint
    char normalized[MAX_EXCERPT_LEN];
    size_t n = 0;
    bool in_space = false;
    for (const char* p = finding.excerpt; *p && n + 1 < sizeof(normalized); ++p) {
        if (isSpace(*p)) {
            in_space = true;
            continue;
        }
        if (in_space && n > 0) {
            normalized[n++] = ' ';
            if (n + 1 >= sizeof(normalized)) break;
        }
        in_space = false;
        normalized[n++] = *p;
    }

    Common::Sha256Builder sha;
    char hex[Common::SHA256_HEX_SIZE];
    if (!sha.addField(finding.rule_id) || !sha.addField(finding.indicator_id) ||
        !sha.addField(finding.unit_id) || !sha.addField(std::string_view(normalized, n)) ||
        !sha.finishHex(hex, sizeof(hex))) {
        return false;
    }
    copyBounded(out, out_size, std::string_view(hex, FINGERPRINT_LEN));
    return true;
}

auto Scorer::score(const std::vector<Match>& matches, const SourceUnit& unit,
                   std::vector<Finding>* findings, std::vector<Diagnostic>* diagnostics) const -> void {
    const bool production = isProductionPath(unit.id());

    for (const Match& m : matches) {
        if (!m.isSignal()) {
            continue;
        }
        const Rule& rule = *m.rule;
        const Indicator& ind = m.indicator();

        const bool entry_point = rule.category == Category::INPUT_VALIDATION_MISSING &&
                                 isEntryPoint(unit, m.line);
        bool anomaly = false;
        const SeverityBand band = bandFor(rule.category, ind.factor, production, entry_point, &anomaly);

        Finding f{};
        copyBounded(f.rule_id, sizeof(f.rule_id), rule.id);
        copyBounded(f.indicator_id, sizeof(f.indicator_id), ind.id);
        f.category = rule.category;
        f.tier = rule.tier;
        f.factor = ind.factor;
        f.band = band;
        f.score = scoreInBand(band, m.confidence);
        f.unit_id = unit.id();
        f.line = m.line;
        f.column = m.column;
        copyBounded(f.excerpt, sizeof(f.excerpt), m.excerpt);
        buildRationale(rule, ind, m.low_confidence, f.rationale, sizeof(f.rationale));
        f.anomaly = anomaly;
        f.low_confidence = m.low_confidence;
        if (!fingerprint(f, f.fingerprint, sizeof(f.fingerprint))) {
            LOG_WARN("Fingerprint unavailable for %s:%u", f.unit_id.c_str(), f.line);
        }

        if (anomaly) {
            Diagnostic d{};
            d.kind = DiagnosticKind::SCORER_ANOMALY;
            d.unit_id = unit.id();
            d.line = m.line;
            std::snprintf(d.message, sizeof(d.message), "rule %s indicator %s: factor %s not scored for %s",
                          rule.id, ind.id, factorName(ind.factor), categoryName(rule.category));
            LOG_WARN("Scorer anomaly at %s:%u: %s", d.unit_id.c_str(), d.line, d.message);
            diagnostics->push_back(d);
        }

        findings->push_back(f);
    }
}

} // namespace Shield
