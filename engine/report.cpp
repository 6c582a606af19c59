#include "engine/report.h"

#include <algorithm>
#include <cstring>
#include <utility>

#include "common/logging.h"
#include "common/macros.h"
#include "common/string_utils.h"

namespace Shield {

namespace {

constexpr const char* DIAGNOSTIC_NAMES[] = {"unit_skipped", "scorer_anomaly", "findings_truncated"};

} // namespace

auto diagnosticKindName(DiagnosticKind kind) noexcept -> const char* {
    const auto idx = static_cast<size_t>(kind);
    return idx < Common::arraySize(DIAGNOSTIC_NAMES) ? DIAGNOSTIC_NAMES[idx] : "unknown";
}

auto findingBefore(const Finding& a, const Finding& b) noexcept -> bool {
    if (a.score != b.score) return a.score > b.score;
    int cmp = a.unit_id.compare(b.unit_id);
    if (cmp != 0) return cmp < 0;
    if (a.line != b.line) return a.line < b.line;
    if (a.category != b.category) return a.category < b.category;
    cmp = std::strcmp(a.rule_id, b.rule_id);
    if (cmp != 0) return cmp < 0;
    cmp = std::strcmp(a.indicator_id, b.indicator_id);
    if (cmp != 0) return cmp < 0;
    if (a.column != b.column) return a.column < b.column;
    return std::strcmp(a.excerpt, b.excerpt) < 0;
}

auto diagnosticBefore(const Diagnostic& a, const Diagnostic& b) noexcept -> bool {
    const int cmp = a.unit_id.compare(b.unit_id);
    if (cmp != 0) return cmp < 0;
    if (a.kind != b.kind) return a.kind < b.kind;
    if (a.line != b.line) return a.line < b.line;
    return std::strcmp(a.message, b.message) < 0;
}

void PartialReport::merge(const PartialReport& other) {
    findings.insert(findings.end(), other.findings.begin(), other.findings.end());
    diagnostics.insert(diagnostics.end(), other.diagnostics.begin(), other.diagnostics.end());
    units_scanned += other.units_scanned;
    units_skipped += other.units_skipped;
}

auto Report::worstBand() const noexcept -> SeverityBand {
    for (size_t b = 0; b < BAND_COUNT; ++b) {
        if (by_band_[b] > 0) {
            return static_cast<SeverityBand>(b);
        }
    }
    return SeverityBand::LOW;
}

auto Aggregator::aggregate(const std::vector<PartialReport>& partials, uint32_t units_total,
                           bool incomplete, const char* catalog_digest) -> Report {
    PartialReport merged;
    for (const auto& partial : partials) {
        merged.merge(partial);
    }

    Report report;
    report.findings_ = std::move(merged.findings);
    report.diagnostics_ = std::move(merged.diagnostics);
    std::sort(report.findings_.begin(), report.findings_.end(), findingBefore);
    std::sort(report.diagnostics_.begin(), report.diagnostics_.end(), diagnosticBefore);

    for (const Finding& f : report.findings_) {
        ++report.by_band_[bandIndex(f.band)];
        ++report.by_tier_[tierIndex(f.tier)];
        ++report.by_category_[categoryIndex(f.category)];
    }

    report.units_total_ = units_total;
    report.units_scanned_ = merged.units_scanned;
    report.units_skipped_ = merged.units_skipped;
    report.incomplete_ = incomplete;
    if (catalog_digest) {
        Common::copyBounded(report.catalog_digest_, sizeof(report.catalog_digest_), catalog_digest);
    }

    LOG_DEBUG("Aggregated %zu findings, %zu diagnostics from %zu partials",
              report.findings_.size(), report.diagnostics_.size(), partials.size());
    return report;
}

} // namespace Shield
