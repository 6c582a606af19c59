#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <vector>

#include "config/config.h"
#include "engine/context_filter.h"
#include "engine/report.h"
#include "engine/rule_catalog.h"
#include "engine/scorer.h"
#include "engine/source_unit.h"

namespace Shield {

/// Cooperative cancellation shared between the caller and scan workers
class CancellationToken {
public:
    void cancel() noexcept { cancelled_.store(true, std::memory_order_release); }
    [[nodiscard]] auto isCancelled() const noexcept -> bool {
        return cancelled_.load(std::memory_order_acquire);
    }

private:
    std::atomic<bool> cancelled_{false};
};

enum class UnitOutcome : uint8_t {
    SCANNED,
    SKIPPED,    // unreadable, binary or oversized, diagnostic recorded
    CANCELLED   // interrupted, nothing recorded
};

/// Called from worker threads after each unit settles
using UnitCallback = std::function<void(const SourceUnit&, UnitOutcome)>;

/// Runs matcher -> filter -> scorer over units on a bounded worker pool and
/// aggregates the per-worker partial reports. The catalog and config must
/// outlive the engine.
class ScanEngine {
public:
    ScanEngine(const RuleCatalog& catalog, const ScannerConfig& config) noexcept;

    ScanEngine(const ScanEngine&) = delete;
    ScanEngine& operator=(const ScanEngine&) = delete;

    /// Always returns a report; isIncomplete() is set when cancellation left
    /// any unit unprocessed
    [[nodiscard]] auto scan(const std::vector<SourceUnit>& units, const CancellationToken* cancel = nullptr,
                            const UnitCallback& on_unit = UnitCallback()) const -> Report;

    /// Full pipeline for one unit. Results reach partial only when the unit
    /// completes.
    [[nodiscard]] auto scanUnit(const SourceUnit& unit, const CancellationToken* cancel,
                                PartialReport* partial) const -> UnitOutcome;

private:
    const RuleCatalog& catalog_;
    const ScannerConfig& config_;
    ContextFilter filter_;
    Scorer scorer_;
};

} // namespace Shield
