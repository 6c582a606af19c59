#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <string>
#include <unistd.h>
#include <utility>
#include <vector>

#include "common/logging.h"
#include "common/time_utils.h"
#include "config/config.h"
#include "engine/catalog_loader.h"
#include "engine/report_writer.h"
#include "engine/scan_engine.h"

using namespace Shield;

namespace {

constexpr const char* DEFAULT_CONFIG_FILE = "config/shield.toml";

void printUsage(const char* program) {
    const char* usage = R"(
USAGE: %s [OPTIONS] FILE...

shield_scan - Security anti-pattern scanner for cloud API integrations

OPTIONS:
    --config <path>         Scanner configuration (default: config/shield.toml if present)
    --catalog <path>        Rule catalog JSON (default: paths.catalog_file)
    --json <path>           Export report as JSON
    --text <path>           Export report as plain text
    --workers <n>           Worker threads, 0 = hardware concurrency
    --fail-on-high          Exit with error on HIGH band findings
    --ide                   Output IDE-compatible warnings
    --print-rules           Print the rule catalog as Markdown and exit
    --help                  Show this help message

EXAMPLES:
    # Scan two modules with the default catalog
    %s server.py client.py

    # CI mode with JSON export
    %s --fail-on-high --json shield.json src/*.py

EXIT CODES:
    0 - No critical findings
    1 - Critical findings
    2 - High findings (with --fail-on-high)
    3 - Configuration or catalog error

SEVERITY BANDS:
    CRITICAL  9-10
    HIGH      7-8
    MEDIUM    4-6
    LOW       1-3

)";

    fprintf(stdout, usage, program, program, program);
}

auto readFile(const char* path, std::string* content, std::string* error) noexcept -> bool {
    FILE* file = std::fopen(path, "rb");
    if (!file) {
        *error = std::strerror(errno);
        fprintf(stderr, "Cannot open %s: %s\n", path, error->c_str());
        LOG_ERROR("Cannot open source file: %s", path);
        return false;
    }

    char chunk[8192];
    size_t n;
    while ((n = std::fread(chunk, 1, sizeof(chunk), file)) > 0) {
        content->append(chunk, n);
    }
    const bool read_error = std::ferror(file) != 0;
    std::fclose(file);

    if (read_error) {
        *error = "read error";
        fprintf(stderr, "Read error on %s\n", path);
        LOG_ERROR("Read error on source file: %s", path);
        return false;
    }
    return true;
}

auto parseCount(const char* text, uint32_t* value) noexcept -> bool {
    char* end = nullptr;
    errno = 0;
    const unsigned long parsed = std::strtoul(text, &end, 10);
    if (errno != 0 || end == text || *end != '\0' || parsed > MAX_WORKER_COUNT) {
        return false;
    }
    *value = static_cast<uint32_t>(parsed);
    return true;
}

void startLogging(const ScannerConfig& config) {
    if (!config.logging.enabled) {
        return;
    }
    Common::LogLevel level = Common::LogLevel::INFO;
    if (!Common::parseLogLevel(config.logging.level, &level)) {
        level = Common::LogLevel::INFO;
    }

    char ts[32] = "session";
    if (!Common::formatFileTimestamp(ts, sizeof(ts))) {
        std::strcpy(ts, "session");
    }
    char log_file[512];
    std::snprintf(log_file, sizeof(log_file), "%s/shield_scan_%s.log", config.paths.logs_dir, ts);
    Common::initLogging(log_file, level);
}

} // namespace

int main(int argc, char* argv[]) {
    const char* config_path = nullptr;
    const char* catalog_path = nullptr;
    const char* json_path = nullptr;
    const char* text_path = nullptr;
    bool workers_set = false;
    uint32_t workers = 0;
    bool fail_on_high = false;
    bool ide_mode = false;
    bool print_rules = false;
    std::vector<const char*> inputs;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            printUsage(argv[0]);
            return EXIT_CLEAN;
        }
        else if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        }
        else if (std::strcmp(argv[i], "--catalog") == 0 && i + 1 < argc) {
            catalog_path = argv[++i];
        }
        else if (std::strcmp(argv[i], "--json") == 0 && i + 1 < argc) {
            json_path = argv[++i];
        }
        else if (std::strcmp(argv[i], "--text") == 0 && i + 1 < argc) {
            text_path = argv[++i];
        }
        else if (std::strcmp(argv[i], "--workers") == 0 && i + 1 < argc) {
            if (!parseCount(argv[++i], &workers)) {
                fprintf(stderr, "Invalid worker count: %s\n", argv[i]);
                return EXIT_CONFIG_ERROR;
            }
            workers_set = true;
        }
        else if (std::strcmp(argv[i], "--fail-on-high") == 0) {
            fail_on_high = true;
        }
        else if (std::strcmp(argv[i], "--ide") == 0) {
            ide_mode = true;
        }
        else if (std::strcmp(argv[i], "--print-rules") == 0) {
            print_rules = true;
        }
        else if (argv[i][0] == '-' && argv[i][1] == '-') {
            fprintf(stderr, "Unknown option: %s\n", argv[i]);
            printUsage(argv[0]);
            return EXIT_CONFIG_ERROR;
        }
        else {
            inputs.push_back(argv[i]);
        }
    }

    // Configuration: explicit file must load, the default file is optional
    bool config_ok;
    if (config_path) {
        config_ok = ConfigManager::init(config_path);
    } else if (access(DEFAULT_CONFIG_FILE, R_OK) == 0) {
        config_ok = ConfigManager::init(DEFAULT_CONFIG_FILE);
    } else {
        ConfigManager::initDefaults();
        config_ok = true;
    }
    if (!config_ok) {
        fprintf(stderr, "Configuration error: %s\n", config_path ? config_path : DEFAULT_CONFIG_FILE);
        return EXIT_CONFIG_ERROR;
    }

    ScannerConfig config = getScannerConfig();
    if (workers_set) {
        config.performance.worker_count = workers;
    }
    fail_on_high = fail_on_high || config.report.fail_on_high;
    if (!json_path && config.report.json_path[0]) {
        json_path = config.report.json_path;
    }
    if (!text_path && config.report.text_path[0]) {
        text_path = config.report.text_path;
    }

    if (!ConfigManager::ensureDirectories(config)) {
        fprintf(stderr, "Cannot create log or report directories\n");
        return EXIT_CONFIG_ERROR;
    }
    startLogging(config);
    ConfigManager::printConfig(config);

    std::unique_ptr<const RuleCatalog> catalog;
    CatalogError error;
    const char* catalog_file = catalog_path ? catalog_path : config.paths.catalog_file;
    if (!CatalogLoader::loadFile(catalog_file, &catalog, &error)) {
        fprintf(stderr, "Catalog error in %s: %s: %s\n", catalog_file, catalogErrorName(error.code),
                error.message);
        Common::shutdownLogging();
        return EXIT_CONFIG_ERROR;
    }

    if (print_rules) {
        std::string markdown;
        ReportWriter::catalogMarkdown(*catalog, &markdown);
        fwrite(markdown.data(), 1, markdown.size(), stdout);
        Common::shutdownLogging();
        return EXIT_CLEAN;
    }

    if (inputs.empty()) {
        fprintf(stderr, "No input files\n");
        printUsage(argv[0]);
        Common::shutdownLogging();
        return EXIT_CONFIG_ERROR;
    }

    std::vector<SourceUnit> units;
    units.reserve(inputs.size());
    for (const char* path : inputs) {
        std::string text;
        std::string error;
        if (readFile(path, &text, &error)) {
            units.emplace_back(path, std::move(text));
        } else {
            units.push_back(SourceUnit::unreadable(path, std::move(error)));
        }
    }

    if (!ide_mode) {
        printf("==============================================\n");
        printf("SHIELD SCAN - Security Anti-Pattern Scanner\n");
        printf("==============================================\n");
        printf("Catalog: %s\n", catalog_file);
        printf("Digest:  %.16s\n", catalog->digest());
        printf("Units:   %zu\n", units.size());
        printf("\n");
    }

    const ScanEngine engine(*catalog, config);
    const Report report = engine.scan(units);

    if (ide_mode) {
        std::string warnings;
        ReportWriter::toIdeWarnings(report, &warnings);
        fwrite(warnings.data(), 1, warnings.size(), stdout);
    } else {
        printf("SEVERITY SUMMARY\n");
        printf("----------------\n");
        printf("Critical: %u\n", report.count(SeverityBand::CRITICAL));
        printf("High:     %u\n", report.count(SeverityBand::HIGH));
        printf("Medium:   %u\n", report.count(SeverityBand::MEDIUM));
        printf("Low:      %u\n", report.count(SeverityBand::LOW));
        printf("Total:    %zu\n", report.findings().size());
        printf("Skipped:  %u\n", report.unitsSkipped());
        printf("\n");
    }

    bool export_ok = true;
    if (json_path) {
        std::string json;
        export_ok = ReportWriter::toJson(report, &json) && ReportWriter::writeFile(json_path, json);
        if (export_ok && !ide_mode) {
            printf("JSON report exported to: %s\n", json_path);
        }
    }
    if (text_path && export_ok) {
        std::string text;
        ReportWriter::toText(report, &text);
        export_ok = ReportWriter::writeFile(text_path, text);
        if (export_ok && !ide_mode) {
            printf("Text report exported to: %s\n", text_path);
        }
    }
    if (!export_ok) {
        fprintf(stderr, "Failed to write report\n");
        Common::shutdownLogging();
        return EXIT_CONFIG_ERROR;
    }

    const int exit_code = ReportWriter::exitCode(report, fail_on_high);

    if (!ide_mode) {
        printf("\n");
        printf("==============================================\n");
        if (exit_code == EXIT_CLEAN) {
            printf("SCAN PASSED - No critical findings\n");
        } else {
            printf("SCAN FAILED - Exit code: %d\n", exit_code);
        }
        printf("==============================================\n");
    }

    Common::shutdownLogging();
    return exit_code;
}
