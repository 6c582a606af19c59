#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "common/digest.h"
#include "engine/pattern_matcher.h"
#include "engine/rule_catalog.h"
#include "engine/types.h"

namespace Shield {

constexpr size_t FINGERPRINT_LEN = 16;

/// A scored, located rule violation. Immutable once built.
struct Finding {
    char rule_id[MAX_ID_LEN];
    char indicator_id[MAX_ID_LEN];
    Category category;
    SeverityTier tier;
    Factor factor;
    uint8_t score;          // 1-10
    SeverityBand band;
    std::string unit_id;
    uint32_t line;
    uint32_t column;
    char excerpt[MAX_EXCERPT_LEN];
    char rationale[384];
    char fingerprint[FINGERPRINT_LEN + 1];
    bool anomaly;           // factor outside the category's decision rows
    bool low_confidence;
};

enum class DiagnosticKind : uint8_t {
    UNIT_SKIPPED = 0,       // unreadable, binary or oversized unit
    SCORER_ANOMALY = 1,
    FINDINGS_TRUNCATED = 2
};

[[nodiscard]] auto diagnosticKindName(DiagnosticKind kind) noexcept -> const char*;

struct Diagnostic {
    DiagnosticKind kind;
    std::string unit_id;
    uint32_t line;          // 0 when not line specific
    char message[192];
};

/// Canonical finding order: score descending, unit id, line, then category,
/// rule, indicator, column and excerpt so the order is total
[[nodiscard]] auto findingBefore(const Finding& a, const Finding& b) noexcept -> bool;

[[nodiscard]] auto diagnosticBefore(const Diagnostic& a, const Diagnostic& b) noexcept -> bool;

/// Per-worker accumulation. Merging partials is commutative and associative
/// up to the canonical sort applied by the Aggregator.
struct PartialReport {
    std::vector<Finding> findings;
    std::vector<Diagnostic> diagnostics;
    uint32_t units_scanned{0};
    uint32_t units_skipped{0};

    void merge(const PartialReport& other);
};

class Report {
public:
    Report() = default;

    [[nodiscard]] auto findings() const noexcept -> const std::vector<Finding>& { return findings_; }
    [[nodiscard]] auto diagnostics() const noexcept -> const std::vector<Diagnostic>& { return diagnostics_; }

    [[nodiscard]] auto countByBand() const noexcept -> const std::array<uint32_t, BAND_COUNT>& { return by_band_; }
    [[nodiscard]] auto countByTier() const noexcept -> const std::array<uint32_t, TIER_COUNT>& { return by_tier_; }
    [[nodiscard]] auto countByCategory() const noexcept -> const std::array<uint32_t, CATEGORY_COUNT>& {
        return by_category_;
    }
    [[nodiscard]] auto count(SeverityBand band) const noexcept -> uint32_t { return by_band_[bandIndex(band)]; }
    [[nodiscard]] auto count(Category category) const noexcept -> uint32_t {
        return by_category_[categoryIndex(category)];
    }

    [[nodiscard]] auto isIncomplete() const noexcept -> bool { return incomplete_; }
    [[nodiscard]] auto unitsTotal() const noexcept -> uint32_t { return units_total_; }
    [[nodiscard]] auto unitsScanned() const noexcept -> uint32_t { return units_scanned_; }
    [[nodiscard]] auto unitsSkipped() const noexcept -> uint32_t { return units_skipped_; }
    [[nodiscard]] auto catalogDigest() const noexcept -> const char* { return catalog_digest_; }

    /// Highest band present, LOW when empty
    [[nodiscard]] auto worstBand() const noexcept -> SeverityBand;

private:
    friend class Aggregator;

    std::vector<Finding> findings_;
    std::vector<Diagnostic> diagnostics_;
    std::array<uint32_t, BAND_COUNT> by_band_{};
    std::array<uint32_t, TIER_COUNT> by_tier_{};
    std::array<uint32_t, CATEGORY_COUNT> by_category_{};
    uint32_t units_total_{0};
    uint32_t units_scanned_{0};
    uint32_t units_skipped_{0};
    bool incomplete_{false};
    char catalog_digest_[Common::SHA256_HEX_SIZE]{};
};

/// Folds partial reports into one canonically ordered Report
class Aggregator {
public:
    [[nodiscard]] static auto aggregate(const std::vector<PartialReport>& partials, uint32_t units_total,
                                        bool incomplete, const char* catalog_digest) -> Report;
};

} // namespace Shield
