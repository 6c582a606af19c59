#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

#include "config/config.h"
#include "engine/pattern_matcher.h"
#include "engine/report.h"
#include "engine/source_unit.h"

namespace Shield {

/// Maps filtered matches to findings with the risk decision table:
///
///   HardcodedCredentials         production path          9-10
///                                test path                7-8
///   SSLVerificationDisabled      explicit_verify_disabled 9-10
///                                plain_http_endpoint      7-8
///   InputValidationMissing       public entry point       9-10
///                                otherwise                4-6
///   InformationDisclosureInLogs  credential_in_log        7-8
///                                verbose_exception_log    4-6
///   InsufficientErrorHandling    bare_catch               4-6
///                                missing_timeout          1-3
///
/// A factor outside its category's rows falls to the category's lowest band
/// and is reported as a scorer anomaly.
class Scorer {
public:
    explicit Scorer(const ScannerConfig& config) noexcept;

    /// Context-role matches are skipped. Never fails.
    auto score(const std::vector<Match>& matches, const SourceUnit& unit,
               std::vector<Finding>* findings, std::vector<Diagnostic>* diagnostics) const -> void;

    [[nodiscard]] static auto bandFor(Category category, Factor factor, bool production_path,
                                      bool entry_point, bool* anomaly) noexcept -> SeverityBand;

    /// low + floor(confidence * width), clamped to the band
    [[nodiscard]] static auto scoreInBand(SeverityBand band, double confidence) noexcept -> uint8_t;

    [[nodiscard]] auto isEntryPoint(const SourceUnit& unit, uint32_t line_no) const noexcept -> bool;
    [[nodiscard]] auto isProductionPath(std::string_view unit_id) const noexcept -> bool;

    /// First FINGERPRINT_LEN hex digits of SHA-256 over rule, indicator, unit
    /// and whitespace-normalized excerpt
    [[nodiscard]] static auto fingerprint(const Finding& finding, char* out, size_t out_size) noexcept -> bool;

private:
    [[nodiscard]] auto handlerName(std::string_view name) const noexcept -> bool;

    const ScannerConfig& config_;
};

} // namespace Shield
