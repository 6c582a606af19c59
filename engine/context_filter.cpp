#include "engine/context_filter.h"

#include <algorithm>
#include <cstdint>

#include "common/string_utils.h"

namespace Shield {

using Common::endsWith;
using Common::equalsNoCase;
using Common::findNoCase;
using Common::startsWith;
using Common::toLowerAscii;
using Common::trimView;

namespace {

auto sameRuleLineRole(const Match& a, const Match& b) noexcept -> bool {
    return a.unit == b.unit && a.rule == b.rule && a.line == b.line && a.isSignal() == b.isSignal();
}

auto lineDistance(uint32_t a, uint32_t b) noexcept -> uint32_t {
    return a > b ? a - b : b - a;
}

// "xxx" style entries: a run of one repeated character
auto isRepeatedRun(std::string_view s) noexcept -> bool {
    if (s.size() < 3) return false;
    const char c = toLowerAscii(s[0]);
    return std::all_of(s.begin(), s.end(), [c](char x) { return toLowerAscii(x) == c; });
}

auto startsWithNoCase(std::string_view s, std::string_view prefix) noexcept -> bool {
    return s.size() >= prefix.size() && equalsNoCase(s.substr(0, prefix.size()), prefix);
}

} // namespace

ContextFilter::ContextFilter(const ScannerConfig& config) noexcept
    : fixture_segments_(config.classification.fixture_segments),
      placeholder_values_(config.classification.placeholder_values),
      error_block_window_(config.scan.error_block_window),
      low_confidence_cap_(config.scan.low_confidence_cap) {}

auto ContextFilter::isFixturePath(std::string_view unit_id) const noexcept -> bool {
    return hasDirectorySegment(unit_id, fixture_segments_);
}

auto ContextFilter::isCommented(const Match& match) const noexcept -> bool {
    const LineInfo& info = match.unit->lineInfo(match.line);
    if (info.comment_line) {
        return true;
    }
    return info.comment_column != NO_COLUMN && match.column >= info.comment_column;
}

/// Entries: exact (case-insensitive), "prefix_" prefixes, "<...>" style
/// wrappers, and repeated-character runs such as "xxx"
auto ContextFilter::isPlaceholder(std::string_view literal) const noexcept -> bool {
    const std::string_view value = trimView(literal);
    for (uint32_t i = 0; i < placeholder_values_.count; ++i) {
        const std::string_view entry = placeholder_values_.at(i);
        if (entry.empty()) {
            if (value.empty()) return true;
            continue;
        }
        const size_t ellipsis = entry.find("...");
        if (ellipsis != std::string_view::npos) {
            const std::string_view open = entry.substr(0, ellipsis);
            const std::string_view close = entry.substr(ellipsis + 3);
            if (value.size() >= open.size() + close.size() && startsWith(value, open) && endsWith(value, close)) {
                return true;
            }
            continue;
        }
        if (entry.back() == '_') {
            if (startsWithNoCase(value, entry)) return true;
            continue;
        }
        if (equalsNoCase(value, entry)) {
            return true;
        }
        if (isRepeatedRun(entry) && isRepeatedRun(value) && toLowerAscii(value[0]) == toLowerAscii(entry[0])) {
            return true;
        }
        // "example" also covers values like "example-token"
        if (entry.size() >= 5 && findNoCase(value, entry) == 0 && value.size() > entry.size() &&
            !Common::isIdentChar(value[entry.size()])) {
            return true;
        }
    }
    return false;
}

void ContextFilter::dedupe(std::vector<Match>* matches) const {
    std::vector<bool> keep(matches->size(), true);
    for (size_t i = 0; i < matches->size(); ++i) {
        if (!keep[i]) continue;
        for (size_t j = i + 1; j < matches->size(); ++j) {
            if (!keep[j]) continue;
            const Match& a = (*matches)[i];
            const Match& b = (*matches)[j];
            if (!sameRuleLineRole(a, b)) continue;
            // Higher confidence wins; ties keep the earlier indicator
            const bool b_wins = b.confidence > a.confidence ||
                                (b.confidence == a.confidence && b.indicator_index < a.indicator_index);
            if (b_wins) {
                keep[i] = false;
                break;
            }
            keep[j] = false;
        }
    }

    size_t out = 0;
    for (size_t i = 0; i < matches->size(); ++i) {
        if (keep[i]) {
            (*matches)[out++] = (*matches)[i];
        }
    }
    matches->resize(out);
}

void ContextFilter::applyErrorBlockRule(std::vector<Match>* matches) const {
    std::vector<bool> keep(matches->size(), true);
    for (size_t i = 0; i < matches->size(); ++i) {
        Match& m = (*matches)[i];
        if (!m.isSignal() || m.indicator().factor != Factor::BARE_CATCH) {
            continue;
        }

        bool differentiated = false;
        bool opener = false;
        for (const Match& ctx : *matches) {
            if (ctx.isSignal() || ctx.unit != m.unit) {
                continue;
            }
            const Factor f = ctx.indicator().factor;
            if (f == Factor::DIFFERENTIATED_HANDLER && lineDistance(ctx.line, m.line) <= error_block_window_) {
                differentiated = true;
            } else if (f == Factor::BLOCK_OPENER && ctx.line < m.line &&
                       m.line - ctx.line <= error_block_window_) {
                opener = true;
            }
        }

        if (differentiated) {
            keep[i] = false;
        } else if (!opener) {
            m.low_confidence = true;
            m.confidence = std::min(m.confidence, low_confidence_cap_);
        }
    }

    size_t out = 0;
    for (size_t i = 0; i < matches->size(); ++i) {
        if (keep[i]) {
            (*matches)[out++] = (*matches)[i];
        }
    }
    matches->resize(out);
}

auto ContextFilter::filter(const std::vector<Match>& matches) const -> std::vector<Match> {
    std::vector<Match> kept;
    kept.reserve(matches.size());

    for (const Match& m : matches) {
        if (isFixturePath(m.unit->id())) continue;
        if (isCommented(m)) continue;
        if (m.has_literal && isPlaceholder(m.literal_value)) continue;
        kept.push_back(m);
    }

    dedupe(&kept);
    applyErrorBlockRule(&kept);
    return kept;
}

} // namespace Shield
