#pragma once

#include <string>

#include "engine/report.h"
#include "engine/rule_catalog.h"

namespace Shield {

constexpr int EXIT_CLEAN = 0;
constexpr int EXIT_CRITICAL = 1;
constexpr int EXIT_HIGH = 2;          // only with fail_on_high
constexpr int EXIT_CONFIG_ERROR = 3;

/// Renders reports and catalogs for people and tools
class ReportWriter {
public:
    /// JSON document with findings, counts, diagnostics and catalog digest.
    /// The generated_at timestamp is omitted when include_timestamp is false.
    [[nodiscard]] static auto toJson(const Report& report, std::string* out,
                                     bool include_timestamp = true) -> bool;

    /// Human-readable report grouped by band
    static auto toText(const Report& report, std::string* out) -> void;

    /// One "path:line:col: severity: message [shield-scan]" line per finding
    static auto toIdeWarnings(const Report& report, std::string* out) -> void;

    /// Markdown listing of rules, indicators and guidance for review
    static auto catalogMarkdown(const RuleCatalog& catalog, std::string* out) -> void;

    [[nodiscard]] static auto writeFile(const char* path, const std::string& content) noexcept -> bool;

    [[nodiscard]] static auto exitCode(const Report& report, bool fail_on_high) noexcept -> int;
};

} // namespace Shield
