#include "engine/report_writer.h"

#include <cstdarg>
#include <cstdio>
#include <string_view>
#include <fcntl.h>
#include <unistd.h>

#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>

#include "common/logging.h"
#include "common/string_utils.h"
#include "common/time_utils.h"

namespace Shield {

namespace {

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wformat-nonliteral"
void appendf(std::string* out, const char* format, ...) {
    char buffer[2048];
    va_list args;
    va_start(args, format);
    const int len = std::vsnprintf(buffer, sizeof(buffer), format, args);
    va_end(args);
    if (len <= 0) {
        return;
    }
    const size_t n = static_cast<size_t>(len) < sizeof(buffer) ? static_cast<size_t>(len) : sizeof(buffer) - 1;
    out->append(buffer, n);
}
#pragma GCC diagnostic pop

// Rejects ill-formed UTF-8 instead of copying it into the document
using JsonWriter = rapidjson::PrettyWriter<rapidjson::StringBuffer, rapidjson::UTF8<>, rapidjson::UTF8<>,
                                           rapidjson::CrtAllocator, rapidjson::kWriteValidateEncodingFlag>;

/// Free text from source units: ill-formed bytes become '?'
template <typename Writer>
void writeText(Writer& w, std::string_view text) {
    std::string valid;
    valid.reserve(text.size());
    Common::appendValidUtf8(text, &valid);
    w.String(valid.data(), static_cast<rapidjson::SizeType>(valid.size()));
}

const char* const BAND_LABELS[BAND_COUNT] = {
    "Critical (9-10)", "High (7-8)", "Medium (4-6)", "Low (1-3)"
};

template <typename Writer>
void writeCounts(Writer& w, const Report& report) {
    w.Key("by_band");
    w.StartObject();
    for (size_t b = 0; b < BAND_COUNT; ++b) {
        w.Key(bandName(static_cast<SeverityBand>(b)));
        w.Uint(report.countByBand()[b]);
    }
    w.EndObject();

    w.Key("by_tier");
    w.StartObject();
    for (size_t t = 0; t < TIER_COUNT; ++t) {
        w.Key(tierName(static_cast<SeverityTier>(t)));
        w.Uint(report.countByTier()[t]);
    }
    w.EndObject();

    w.Key("by_category");
    w.StartObject();
    for (size_t c = 0; c < CATEGORY_COUNT; ++c) {
        w.Key(categoryName(static_cast<Category>(c)));
        w.Uint(report.countByCategory()[c]);
    }
    w.EndObject();
}

template <typename Writer>
void writeFinding(Writer& w, const Finding& f) {
    w.StartObject();
    w.Key("category");       w.String(categoryName(f.category));
    w.Key("score");          w.Uint(f.score);
    w.Key("band");           w.String(bandName(f.band));
    w.Key("tier");           w.String(tierName(f.tier));
    w.Key("source_unit");    writeText(w, f.unit_id);
    w.Key("line");           w.Uint(f.line);
    w.Key("column");         w.Uint(f.column + 1);
    w.Key("excerpt");        writeText(w, f.excerpt);
    w.Key("rationale");      writeText(w, f.rationale);
    w.Key("rule_id");        w.String(f.rule_id);
    w.Key("indicator_id");   w.String(f.indicator_id);
    w.Key("factor");         w.String(factorName(f.factor));
    w.Key("fingerprint");    w.String(f.fingerprint);
    w.Key("low_confidence"); w.Bool(f.low_confidence);
    w.Key("anomaly");        w.Bool(f.anomaly);
    w.EndObject();
}

} // namespace

auto ReportWriter::toJson(const Report& report, std::string* out, bool include_timestamp) -> bool {
    rapidjson::StringBuffer buffer;
    JsonWriter w(buffer);
    w.SetIndent(' ', 2);

    w.StartObject();
    w.Key("tool");
    w.String("shield_scan");
    if (include_timestamp) {
        char ts[32];
        if (Common::formatIsoTimestamp(ts, sizeof(ts))) {
            w.Key("generated_at");
            w.String(ts);
        }
    }
    w.Key("catalog_digest");
    w.String(report.catalogDigest());
    w.Key("incomplete");
    w.Bool(report.isIncomplete());

    w.Key("units");
    w.StartObject();
    w.Key("total");   w.Uint(report.unitsTotal());
    w.Key("scanned"); w.Uint(report.unitsScanned());
    w.Key("skipped"); w.Uint(report.unitsSkipped());
    w.EndObject();

    w.Key("summary");
    w.StartObject();
    w.Key("total");
    w.Uint(static_cast<unsigned>(report.findings().size()));
    writeCounts(w, report);
    w.EndObject();

    w.Key("findings");
    w.StartArray();
    for (const Finding& f : report.findings()) {
        writeFinding(w, f);
    }
    w.EndArray();

    w.Key("diagnostics");
    w.StartArray();
    for (const Diagnostic& d : report.diagnostics()) {
        w.StartObject();
        w.Key("kind");        w.String(diagnosticKindName(d.kind));
        w.Key("source_unit"); writeText(w, d.unit_id);
        w.Key("line");        w.Uint(d.line);
        w.Key("message");     writeText(w, d.message);
        w.EndObject();
    }
    w.EndArray();
    w.EndObject();

    if (!w.IsComplete()) {
        LOG_ERROR("JSON report serialization incomplete");
        return false;
    }
    out->assign(buffer.GetString(), buffer.GetSize());
    out->push_back('\n');
    return true;
}

auto ReportWriter::toText(const Report& report, std::string* out) -> void {
    char ts[32] = "unknown";
    if (!Common::formatIsoTimestamp(ts, sizeof(ts))) {
        LOG_WARN("Timestamp unavailable for text report");
    }

    appendf(out,
        "==============================================\n"
        "SHIELD SCAN REPORT\n"
        "==============================================\n"
        "Generated: %s\n"
        "Catalog:   %s\n"
        "Units:     %u total, %u scanned, %u skipped\n"
        "Status:    %s\n"
        "\n"
        "SEVERITY SUMMARY\n"
        "----------------\n",
        ts, report.catalogDigest(), report.unitsTotal(), report.unitsScanned(), report.unitsSkipped(),
        report.isIncomplete() ? "INCOMPLETE (scan cancelled)" : "complete");

    for (size_t b = 0; b < BAND_COUNT; ++b) {
        appendf(out, "%-16s %u\n", BAND_LABELS[b], report.countByBand()[b]);
    }
    appendf(out, "%-16s %zu\n\nCATEGORY SUMMARY\n----------------\n", "Total", report.findings().size());
    for (size_t c = 0; c < CATEGORY_COUNT; ++c) {
        appendf(out, "%-28s %u\n", categoryName(static_cast<Category>(c)), report.countByCategory()[c]);
    }
    appendf(out, "\nTIER SUMMARY\n------------\n");
    for (size_t t = 0; t < TIER_COUNT; ++t) {
        appendf(out, "%-8s %u\n", tierName(static_cast<SeverityTier>(t)), report.countByTier()[t]);
    }

    for (size_t b = 0; b < BAND_COUNT; ++b) {
        if (report.countByBand()[b] == 0) {
            continue;
        }
        appendf(out, "\n%s FINDINGS\n==============================================\n",
                bandName(static_cast<SeverityBand>(b)));
        for (const Finding& f : report.findings()) {
            if (bandIndex(f.band) != b) {
                continue;
            }
            appendf(out, "[%2u] %s:%u  %s (%s/%s)%s%s\n    %s\n    %s\n",
                    f.score, f.unit_id.c_str(), f.line, categoryName(f.category), f.rule_id, f.indicator_id,
                    f.low_confidence ? " [low-confidence]" : "", f.anomaly ? " [anomaly]" : "",
                    f.excerpt, f.rationale);
        }
    }

    if (!report.diagnostics().empty()) {
        appendf(out, "\nDIAGNOSTICS\n==============================================\n");
        for (const Diagnostic& d : report.diagnostics()) {
            appendf(out, "%s %s:%u %s\n", diagnosticKindName(d.kind), d.unit_id.c_str(), d.line, d.message);
        }
    }
}

auto ReportWriter::toIdeWarnings(const Report& report, std::string* out) -> void {
    for (const Finding& f : report.findings()) {
        appendf(out, "%s:%u:%u: %s: %s score %u: %s [shield-scan:%s]\n",
                f.unit_id.c_str(), f.line, f.column + 1,
                f.band == SeverityBand::CRITICAL ? "error" : "warning",
                categoryName(f.category), f.score, f.excerpt, f.indicator_id);
    }
}

auto ReportWriter::catalogMarkdown(const RuleCatalog& catalog, std::string* out) -> void {
    appendf(out, "# Security rule catalog\n\nDigest: `%s`\n", catalog.digest());

    for (const Rule& rule : catalog.allRules()) {
        appendf(out, "\n## %s: %s\n\n- Category: %s\n- Severity: %s\n",
                rule.id, rule.title[0] ? rule.title : categoryName(rule.category),
                categoryName(rule.category), tierName(rule.tier));

        appendf(out, "\n| Indicator | Kind | Role | Factor | Confidence | Description |\n"
                     "|---|---|---|---|---|---|\n");
        for (uint32_t i = 0; i < rule.indicator_count; ++i) {
            const Indicator& ind = rule.indicator(i);
            appendf(out, "| `%s` | %s | %s | %s | %.2f | %s |\n",
                    ind.id, kindName(ind.kind), roleName(ind.role), factorName(ind.factor),
                    ind.confidence, ind.description);
        }

        if (rule.guidance_count > 0) {
            appendf(out, "\nGuidance:\n\n");
            for (uint32_t g = 0; g < rule.guidance_count; ++g) {
                appendf(out, "- %s\n", rule.guidance[g]);
            }
        }
    }
}

auto ReportWriter::writeFile(const char* path, const std::string& content) noexcept -> bool {
    const int fd = open(path, O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (fd < 0) {
        LOG_ERROR("Failed to create report file: %s", path);
        return false;
    }

    size_t written = 0;
    while (written < content.size()) {
        const ssize_t n = write(fd, content.data() + written, content.size() - written);
        if (n <= 0) {
            LOG_ERROR("Write failed for %s", path);
            close(fd);
            return false;
        }
        written += static_cast<size_t>(n);
    }

    if (close(fd) != 0) {
        LOG_ERROR("Close failed for %s", path);
        return false;
    }
    LOG_INFO("Wrote %zu bytes to %s", content.size(), path);
    return true;
}

auto ReportWriter::exitCode(const Report& report, bool fail_on_high) noexcept -> int {
    if (report.count(SeverityBand::CRITICAL) > 0) return EXIT_CRITICAL;
    if (fail_on_high && report.count(SeverityBand::HIGH) > 0) return EXIT_HIGH;
    return EXIT_CLEAN;
}

} // namespace Shield
