#include "engine/scan_engine.h"

#include <algorithm>
#include <cstdio>
#include <future>

#include "common/logging.h"
#include "common/macros.h"
#include "common/string_utils.h"
#include "common/thread_utils.h"
#include "common/time_utils.h"
#include "engine/pattern_matcher.h"

namespace Shield {

using Common::copyBounded;

namespace {

auto cancelled(const CancellationToken* cancel) noexcept -> bool {
    return SHIELD_UNLIKELY(cancel && cancel->isCancelled());
}

void addUnitDiagnostic(PartialReport* partial, DiagnosticKind kind, const SourceUnit& unit,
                       const char* message) {
    Diagnostic d{};
    d.kind = kind;
    d.unit_id = unit.id();
    d.line = 0;
    copyBounded(d.message, sizeof(d.message), message);
    partial->diagnostics.push_back(d);
}

} // namespace

ScanEngine::ScanEngine(const RuleCatalog& catalog, const ScannerConfig& config) noexcept
    : catalog_(catalog), config_(config), filter_(config), scorer_(config) {}

auto ScanEngine::scanUnit(const SourceUnit& unit, const CancellationToken* cancel,
                          PartialReport* partial) const -> UnitOutcome {
    if (cancelled(cancel)) {
        return UnitOutcome::CANCELLED;
    }

    char message[192];
    if (!unit.isReadable()) {
        std::snprintf(message, sizeof(message), "unit could not be read: %s", unit.readError().c_str());
        LOG_WARN("Skipping %s: %s", unit.id().c_str(), message);
        addUnitDiagnostic(partial, DiagnosticKind::UNIT_SKIPPED, unit, message);
        ++partial->units_skipped;
        return UnitOutcome::SKIPPED;
    }
    if (unit.isBinary()) {
        LOG_WARN("Skipping %s: contains NUL bytes", unit.id().c_str());
        addUnitDiagnostic(partial, DiagnosticKind::UNIT_SKIPPED, unit, "unit contains NUL bytes");
        ++partial->units_skipped;
        return UnitOutcome::SKIPPED;
    }
    if (unit.size() > config_.scan.max_unit_bytes) {
        std::snprintf(message, sizeof(message), "unit is %zu bytes, limit %llu", unit.size(),
                      static_cast<unsigned long long>(config_.scan.max_unit_bytes));
        LOG_WARN("Skipping %s: %s", unit.id().c_str(), message);
        addUnitDiagnostic(partial, DiagnosticKind::UNIT_SKIPPED, unit, message);
        ++partial->units_skipped;
        return UnitOutcome::SKIPPED;
    }

    std::vector<Match> raw;
    PatternMatcher::scan(unit, catalog_, &raw);
    if (cancelled(cancel)) {
        return UnitOutcome::CANCELLED;
    }

    const std::vector<Match> kept = filter_.filter(raw);
    if (cancelled(cancel)) {
        return UnitOutcome::CANCELLED;
    }

    std::vector<Finding> findings;
    std::vector<Diagnostic> diagnostics;
    scorer_.score(kept, unit, &findings, &diagnostics);
    if (cancelled(cancel)) {
        return UnitOutcome::CANCELLED;
    }

    const size_t limit = config_.scan.max_findings_per_unit;
    if (findings.size() > limit) {
        // Keep the most severe
        std::sort(findings.begin(), findings.end(), findingBefore);
        std::snprintf(message, sizeof(message), "kept %zu of %zu findings", limit, findings.size());
        LOG_WARN("Truncating findings for %s: %s", unit.id().c_str(), message);
        findings.resize(limit);
        Diagnostic d{};
        d.kind = DiagnosticKind::FINDINGS_TRUNCATED;
        d.unit_id = unit.id();
        copyBounded(d.message, sizeof(d.message), message);
        diagnostics.push_back(d);
    }

    LOG_DEBUG("Unit %s: %zu raw, %zu kept, %zu findings", unit.id().c_str(), raw.size(), kept.size(),
              findings.size());

    partial->findings.insert(partial->findings.end(), findings.begin(), findings.end());
    partial->diagnostics.insert(partial->diagnostics.end(), diagnostics.begin(), diagnostics.end());
    ++partial->units_scanned;
    return UnitOutcome::SCANNED;
}

auto ScanEngine::scan(const std::vector<SourceUnit>& units, const CancellationToken* cancel,
                      const UnitCallback& on_unit) const -> Report {
    const Common::ElapsedTimer timer;
    const uint32_t worker_count = Common::resolveWorkerCount(config_.performance.worker_count, units.size());

    LOG_INFO("Scan started: %zu units, %u workers, catalog %.16s", units.size(), worker_count,
             catalog_.digest());

    std::vector<PartialReport> partials(worker_count);
    std::atomic<size_t> cursor{0};

    Common::WorkerPlacement placement;
    placement.pin_workers = config_.performance.pin_workers;
    placement.first_core = config_.performance.first_core;
    placement.numa_node = config_.performance.numa_node;

    {
        Common::ThreadPool pool(worker_count, placement);
        std::vector<std::future<void>> done;
        done.reserve(worker_count);

        for (uint32_t w = 0; w < worker_count; ++w) {
            PartialReport* partial = &partials[w];
            done.push_back(pool.enqueue([this, &units, &cursor, cancel, &on_unit, partial] {
                while (!cancelled(cancel)) {
                    const size_t idx = cursor.fetch_add(1, std::memory_order_relaxed);
                    if (idx >= units.size()) {
                        break;
                    }
                    const UnitOutcome outcome = scanUnit(units[idx], cancel, partial);
                    if (on_unit) {
                        on_unit(units[idx], outcome);
                    }
                }
            }));
        }

        for (auto& f : done) {
            f.get();
        }
    }

    uint32_t processed = 0;
    for (const auto& partial : partials) {
        processed += partial.units_scanned + partial.units_skipped;
    }
    const bool incomplete = processed < units.size();
    if (incomplete) {
        LOG_WARN("Scan cancelled: %u of %zu units processed", processed, units.size());
    }

    Report report = Aggregator::aggregate(partials, static_cast<uint32_t>(units.size()), incomplete,
                                          catalog_.digest());

    LOG_INFO("Scan finished in %.2f ms: %zu findings (critical=%u high=%u medium=%u low=%u), %u skipped%s",
             timer.elapsedMillis(), report.findings().size(),
             report.count(SeverityBand::CRITICAL), report.count(SeverityBand::HIGH),
             report.count(SeverityBand::MEDIUM), report.count(SeverityBand::LOW),
             report.unitsSkipped(), incomplete ? ", incomplete" : "");
    return report;
}

} // namespace Shield
