#include "config/config.h"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <initializer_list>
#include <limits>
#include <string>
#include <sys/stat.h>

#include "common/logging.h"
#include "common/string_utils.h"

namespace Shield {

using Common::copyBounded;
using Common::equalsNoCase;
using Common::isSpace;

auto NameList::add(std::string_view item) noexcept -> bool {
    if (count >= MAX_LIST_ENTRIES || item.size() >= MAX_LIST_ENTRY_LEN) {
        return false;
    }
    copyBounded(items[count], MAX_LIST_ENTRY_LEN, item);
    ++count;
    return true;
}

auto NameList::contains(std::string_view item) const noexcept -> bool {
    for (uint32_t i = 0; i < count; ++i) {
        if (item == items[i]) return true;
    }
    return false;
}

auto NameList::containsNoCase(std::string_view item) const noexcept -> bool {
    for (uint32_t i = 0; i < count; ++i) {
        if (equalsNoCase(item, items[i])) return true;
    }
    return false;
}

// Static member definitions
ScannerConfig ConfigManager::config_{};
bool ConfigManager::initialized_ = false;

struct ConfigManager::ParseState {
    uint32_t line_no = 0;
    uint32_t errors = 0;
};

namespace {

void setList(NameList* list, std::initializer_list<const char*> values) noexcept {
    list->clear();
    for (const char* v : values) {
        (void)list->add(v);
    }
}

auto mkdirParents(const char* path) noexcept -> bool {
    if (!path || path[0] == '\0') {
        return true;
    }
    char buf[256];
    copyBounded(buf, sizeof(buf), path);
    const size_t len = std::strlen(buf);
    for (size_t i = 1; i <= len; ++i) {
        if (buf[i] == '/' || buf[i] == '\0') {
            const char saved = buf[i];
            buf[i] = '\0';
            if (::mkdir(buf, 0755) != 0 && errno != EEXIST) {
                LOG_ERROR("Cannot create directory %s: %s", buf, std::strerror(errno));
                return false;
            }
            buf[i] = saved;
        }
    }
    return true;
}

} // namespace

auto ConfigManager::setDefaults(ScannerConfig* config) noexcept -> void {
    *config = ScannerConfig{};

    copyBounded(config->system.name, sizeof(config->system.name), "shield_scan");
    copyBounded(config->system.version, sizeof(config->system.version), "1.0.0");
    copyBounded(config->system.environment, sizeof(config->system.environment), "development");

    copyBounded(config->paths.logs_dir, sizeof(config->paths.logs_dir), "logs");
    copyBounded(config->paths.catalog_file, sizeof(config->paths.catalog_file),
                "config/catalog/security_rules.json");
    copyBounded(config->paths.report_dir, sizeof(config->paths.report_dir), "reports");

    copyBounded(config->logging.level, sizeof(config->logging.level), "INFO");
    config->logging.enabled = true;

    config->performance.worker_count = 0;
    config->performance.pin_workers = false;
    config->performance.first_core = 0;
    config->performance.numa_node = -1;

    config->scan.max_unit_bytes = 4ULL * 1024 * 1024;
    config->scan.max_findings_per_unit = 500;
    config->scan.error_block_window = 8;
    config->scan.entry_point_window = 40;
    config->scan.low_confidence_cap = 0.3;

    auto& cls = config->classification;
    setList(&cls.fixture_segments,
            {"docs", "doc", "examples", "example", "fixtures", "fixture", "testdata", "samples"});
    setList(&cls.test_segments, {"tests", "test", "testing", "__tests__", "spec"});
    setList(&cls.placeholder_values,
            {"", "changeme", "example", "placeholder", "dummy", "xxx", "***", "<...>", "${...}",
             "your_"});
    setList(&cls.handler_prefixes, {"handle_", "on_", "api_", "tool_", "route_"});
    setList(&cls.handler_suffixes, {"_handler", "_endpoint", "_view", "_tool", "_route"});
    setList(&cls.handler_decorators,
            {"@app.route", "@app.get", "@app.post", "@app.put", "@app.delete", "@router.",
             "@mcp.tool", "@server.tool", "@tool"});

    config->report.json_path[0] = '\0';
    config->report.text_path[0] = '\0';
    config->report.fail_on_high = false;
}

auto ConfigManager::init(const char* config_file) noexcept -> bool {
    if (initialized_) {
        LOG_WARN("ConfigManager already initialized");
        return true;
    }

    ScannerConfig loaded;
    setDefaults(&loaded);

    if (!parseFile(config_file, &loaded)) {
        LOG_ERROR("Failed to parse TOML config file: %s", config_file);
        return false;
    }

    if (!validateConfig(loaded)) {
        LOG_ERROR("Configuration validation failed");
        return false;
    }

    loaded.is_valid = true;
    config_ = loaded;
    initialized_ = true;

    LOG_INFO("ConfigManager initialized successfully from %s", config_file);
    return true;
}

auto ConfigManager::initDefaults() noexcept -> void {
    setDefaults(&config_);
    config_.is_valid = true;
    initialized_ = true;
}

auto ConfigManager::reset() noexcept -> void {
    config_ = ScannerConfig{};
    initialized_ = false;
}

auto ConfigManager::parseFile(const char* filepath, ScannerConfig* config) noexcept -> bool {
    FILE* file = std::fopen(filepath, "rb");
    if (!file) {
        LOG_ERROR("Cannot open config file: %s", filepath);
        return false;
    }

    std::string content;
    char chunk[4096];
    size_t n;
    while ((n = std::fread(chunk, 1, sizeof(chunk), file)) > 0) {
        content.append(chunk, n);
    }
    const bool read_error = std::ferror(file) != 0;
    std::fclose(file);

    if (read_error) {
        LOG_ERROR("Read error on config file: %s", filepath);
        return false;
    }
    return parseString(content.c_str(), config);
}

auto ConfigManager::parseString(const char* content, ScannerConfig* config) noexcept -> bool {
    if (!content || !config) {
        return false;
    }

    ParseState state;
    char current_section[64] = "";
    char line[1024];

    const char* cursor = content;
    while (*cursor) {
        const char* eol = std::strchr(cursor, '\n');
        const size_t raw_len = eol ? static_cast<size_t>(eol - cursor) : std::strlen(cursor);
        ++state.line_no;

        if (raw_len >= sizeof(line)) {
            LOG_ERROR("Config line %u too long", state.line_no);
            ++state.errors;
        } else {
            std::memcpy(line, cursor, raw_len);
            line[raw_len] = '\0';

            // Strip trailing CR/whitespace and leading indentation
            size_t len = raw_len;
            while (len > 0 && isSpace(line[len - 1])) {
                line[--len] = '\0';
            }
            const char* text = line;
            while (*text && isSpace(*text)) ++text;

            if (*text == '\0' || *text == '#') {
                // blank or comment
            } else if (*text == '[') {
                const char* end = std::strchr(text, ']');
                if (end) {
                    copyBounded(current_section, sizeof(current_section),
                                std::string_view(text + 1, static_cast<size_t>(end - text - 1)));
                } else {
                    LOG_ERROR("Config line %u: unterminated section header", state.line_no);
                    ++state.errors;
                }
            } else {
                parseLine(current_section, text, config, &state);
            }
        }

        if (!eol) break;
        cursor = eol + 1;
    }

    return state.errors == 0;
}

auto ConfigManager::parseLine(const char* section, const char* line, ScannerConfig* config,
                              ParseState* state) noexcept -> void {
    if (std::strcmp(section, "system") == 0) {
        extractStringValue(line, "name", config->system.name, sizeof(config->system.name), state);
        extractStringValue(line, "version", config->system.version, sizeof(config->system.version), state);
        extractStringValue(line, "environment", config->system.environment, sizeof(config->system.environment), state);
    }
    else if (std::strcmp(section, "paths") == 0) {
        extractStringValue(line, "logs_dir", config->paths.logs_dir, sizeof(config->paths.logs_dir), state);
        extractStringValue(line, "catalog_file", config->paths.catalog_file, sizeof(config->paths.catalog_file), state);
        extractStringValue(line, "report_dir", config->paths.report_dir, sizeof(config->paths.report_dir), state);
    }
    else if (std::strcmp(section, "logging") == 0) {
        extractStringValue(line, "level", config->logging.level, sizeof(config->logging.level), state);
        extractBoolValue(line, "enabled", &config->logging.enabled, state);
    }
    else if (std::strcmp(section, "performance") == 0) {
        extractUint32Value(line, "worker_count", &config->performance.worker_count, state);
        extractBoolValue(line, "pin_workers", &config->performance.pin_workers, state);
        extractInt32Value(line, "first_core", &config->performance.first_core, state);
        extractInt32Value(line, "numa_node", &config->performance.numa_node, state);
    }
    else if (std::strcmp(section, "scan") == 0) {
        extractUintValue(line, "max_unit_bytes", &config->scan.max_unit_bytes, state);
        extractUint32Value(line, "max_findings_per_unit", &config->scan.max_findings_per_unit, state);
        extractUint32Value(line, "error_block_window", &config->scan.error_block_window, state);
        extractUint32Value(line, "entry_point_window", &config->scan.entry_point_window, state);
        extractDoubleValue(line, "low_confidence_cap", &config->scan.low_confidence_cap, state);
    }
    else if (std::strcmp(section, "classification") == 0) {
        auto& cls = config->classification;
        extractListValue(line, "fixture_segments", &cls.fixture_segments, state);
        extractListValue(line, "test_segments", &cls.test_segments, state);
        extractListValue(line, "placeholder_values", &cls.placeholder_values, state);
        extractListValue(line, "handler_prefixes", &cls.handler_prefixes, state);
        extractListValue(line, "handler_suffixes", &cls.handler_suffixes, state);
        extractListValue(line, "handler_decorators", &cls.handler_decorators, state);
    }
    else if (std::strcmp(section, "report") == 0) {
        extractStringValue(line, "json_path", config->report.json_path, sizeof(config->report.json_path), state);
        extractStringValue(line, "text_path", config->report.text_path, sizeof(config->report.text_path), state);
        extractBoolValue(line, "fail_on_high", &config->report.fail_on_high, state);
    }
}

// Returns the start of the value when line is "key = value", else nullptr
auto ConfigManager::matchKey(const char* line, const char* key) noexcept -> const char* {
    const size_t key_len = std::strlen(key);
    if (std::strncmp(line, key, key_len) != 0) {
        return nullptr;
    }
    const char* p = line + key_len;
    while (*p == ' ' || *p == '\t') ++p;
    if (*p != '=') {
        return nullptr;
    }
    ++p;
    while (*p == ' ' || *p == '\t') ++p;
    return p;
}

auto ConfigManager::extractStringValue(const char* line, const char* key, char* value, size_t max_len,
                                       ParseState* state) noexcept -> bool {
    const char* start = matchKey(line, key);
    if (!start) {
        return false;
    }
    if (*start != '"') {
        LOG_ERROR("Config line %u: %s expects a quoted string", state->line_no, key);
        ++state->errors;
        return false;
    }
    ++start;
    const char* end = std::strchr(start, '"');
    if (!end) {
        LOG_ERROR("Config line %u: unterminated string for %s", state->line_no, key);
        ++state->errors;
        return false;
    }

    size_t len = static_cast<size_t>(end - start);
    if (len >= max_len) {
        LOG_WARN("Config line %u: %s truncated to %zu bytes", state->line_no, key, max_len - 1);
        len = max_len - 1;
    }
    std::memcpy(value, start, len);
    value[len] = '\0';
    return true;
}

auto ConfigManager::extractIntValue(const char* line, const char* key, int64_t* value,
                                    ParseState* state) noexcept -> bool {
    const char* start = matchKey(line, key);
    if (!start) {
        return false;
    }
    char* end = nullptr;
    errno = 0;
    const long long parsed = std::strtoll(start, &end, 10);
    if (end == start || errno == ERANGE) {
        LOG_ERROR("Config line %u: %s expects an integer", state->line_no, key);
        ++state->errors;
        return false;
    }
    *value = parsed;
    return true;
}

auto ConfigManager::extractUintValue(const char* line, const char* key, uint64_t* value,
                                     ParseState* state) noexcept -> bool {
    const char* start = matchKey(line, key);
    if (!start) {
        return false;
    }
    char* end = nullptr;
    errno = 0;
    const unsigned long long parsed = std::strtoull(start, &end, 10);
    if (end == start || *start == '-' || errno == ERANGE) {
        LOG_ERROR("Config line %u: %s expects an unsigned integer", state->line_no, key);
        ++state->errors;
        return false;
    }
    *value = parsed;
    return true;
}

auto ConfigManager::extractUint32Value(const char* line, const char* key, uint32_t* value,
                                       ParseState* state) noexcept -> bool {
    uint64_t wide = 0;
    if (!extractUintValue(line, key, &wide, state)) {
        return false;
    }
    if (wide > std::numeric_limits<uint32_t>::max()) {
        LOG_ERROR("Config line %u: %s is out of range", state->line_no, key);
        ++state->errors;
        return false;
    }
    *value = static_cast<uint32_t>(wide);
    return true;
}

auto ConfigManager::extractInt32Value(const char* line, const char* key, int* value,
                                      ParseState* state) noexcept -> bool {
    int64_t wide = 0;
    if (!extractIntValue(line, key, &wide, state)) {
        return false;
    }
    if (wide < std::numeric_limits<int>::min() || wide > std::numeric_limits<int>::max()) {
        LOG_ERROR("Config line %u: %s is out of range", state->line_no, key);
        ++state->errors;
        return false;
    }
    *value = static_cast<int>(wide);
    return true;
}

auto ConfigManager::extractDoubleValue(const char* line, const char* key, double* value,
                                       ParseState* state) noexcept -> bool {
    const char* start = matchKey(line, key);
    if (!start) {
        return false;
    }
    char* end = nullptr;
    const double parsed = std::strtod(start, &end);
    if (end == start) {
        LOG_ERROR("Config line %u: %s expects a number", state->line_no, key);
        ++state->errors;
        return false;
    }
    *value = parsed;
    return true;
}

auto ConfigManager::extractBoolValue(const char* line, const char* key, bool* value,
                                     ParseState* state) noexcept -> bool {
    const char* start = matchKey(line, key);
    if (!start) {
        return false;
    }
    if (std::strncmp(start, "true", 4) == 0) {
        *value = true;
    } else if (std::strncmp(start, "false", 5) == 0) {
        *value = false;
    } else {
        LOG_ERROR("Config line %u: %s expects true or false", state->line_no, key);
        ++state->errors;
        return false;
    }
    return true;
}

// Single-line array of quoted strings: key = ["a", "b"]
auto ConfigManager::extractListValue(const char* line, const char* key, NameList* list,
                                     ParseState* state) noexcept -> bool {
    const char* p = matchKey(line, key);
    if (!p) {
        return false;
    }
    if (*p != '[') {
        LOG_ERROR("Config line %u: %s expects an array", state->line_no, key);
        ++state->errors;
        return false;
    }
    ++p;

    NameList parsed;
    parsed.clear();
    while (true) {
        while (*p == ' ' || *p == '\t' || *p == ',') ++p;
        if (*p == ']') break;
        if (*p != '"') {
            LOG_ERROR("Config line %u: malformed array for %s", state->line_no, key);
            ++state->errors;
            return false;
        }
        const char* item = ++p;
        const char* end = std::strchr(item, '"');
        if (!end) {
            LOG_ERROR("Config line %u: unterminated string in %s", state->line_no, key);
            ++state->errors;
            return false;
        }
        if (!parsed.add(std::string_view(item, static_cast<size_t>(end - item)))) {
            LOG_ERROR("Config line %u: %s exceeds %zu entries of %zu bytes",
                      state->line_no, key, MAX_LIST_ENTRIES, MAX_LIST_ENTRY_LEN - 1);
            ++state->errors;
            return false;
        }
        p = end + 1;
    }

    *list = parsed;
    return true;
}

auto ConfigManager::validateConfig(const ScannerConfig& config) noexcept -> bool {
    bool ok = true;

    if (std::strlen(config.paths.catalog_file) == 0) {
        LOG_ERROR("catalog_file not configured");
        ok = false;
    }

    Common::LogLevel level;
    if (!Common::parseLogLevel(config.logging.level, &level)) {
        LOG_ERROR("Unknown logging level: %s", config.logging.level);
        ok = false;
    }

    if (config.performance.worker_count > MAX_WORKER_COUNT) {
        LOG_ERROR("worker_count must be <= %u", MAX_WORKER_COUNT);
        ok = false;
    }
    if (config.performance.pin_workers && config.performance.first_core < 0) {
        LOG_ERROR("first_core must be >= 0 when pin_workers is set");
        ok = false;
    }

    if (config.scan.max_unit_bytes == 0 || config.scan.max_unit_bytes > MAX_UNIT_BYTES_LIMIT) {
        LOG_ERROR("max_unit_bytes must be in [1, %llu]",
                  static_cast<unsigned long long>(MAX_UNIT_BYTES_LIMIT));
        ok = false;
    }
    if (config.scan.max_findings_per_unit == 0) {
        LOG_ERROR("max_findings_per_unit must be positive");
        ok = false;
    }
    if (config.scan.error_block_window == 0 || config.scan.error_block_window > MAX_BLOCK_WINDOW) {
        LOG_ERROR("error_block_window must be in [1, %u]", MAX_BLOCK_WINDOW);
        ok = false;
    }
    if (config.scan.entry_point_window == 0 || config.scan.entry_point_window > MAX_ENTRY_POINT_WINDOW) {
        LOG_ERROR("entry_point_window must be in [1, %u]", MAX_ENTRY_POINT_WINDOW);
        ok = false;
    }
    if (!(config.scan.low_confidence_cap > 0.0 && config.scan.low_confidence_cap <= 1.0)) {
        LOG_ERROR("low_confidence_cap must be in (0, 1]");
        ok = false;
    }

    return ok;
}

auto ConfigManager::ensureDirectories(const ScannerConfig& config) noexcept -> bool {
    struct stat st;
    bool ok = true;
    if (stat(config.paths.logs_dir, &st) != 0) {
        LOG_INFO("Creating logs directory: %s", config.paths.logs_dir);
        ok = mkdirParents(config.paths.logs_dir) && ok;
    }
    if (stat(config.paths.report_dir, &st) != 0) {
        LOG_INFO("Creating report directory: %s", config.paths.report_dir);
        ok = mkdirParents(config.paths.report_dir) && ok;
    }
    return ok;
}

auto ConfigManager::printConfig(const ScannerConfig& config) noexcept -> void {
    LOG_INFO("=== Scanner Configuration ===");
    LOG_INFO("System: %s v%s (%s)", config.system.name, config.system.version, config.system.environment);
    LOG_INFO("Paths:");
    LOG_INFO("  Logs: %s", config.paths.logs_dir);
    LOG_INFO("  Catalog: %s", config.paths.catalog_file);
    LOG_INFO("  Reports: %s", config.paths.report_dir);
    LOG_INFO("Performance:");
    LOG_INFO("  Workers: %u%s", config.performance.worker_count,
             config.performance.worker_count == 0 ? " (auto)" : "");
    LOG_INFO("  Pinning: %s (first core %d)", config.performance.pin_workers ? "Enabled" : "Disabled",
             config.performance.first_core);
    LOG_INFO("  NUMA node: %d", config.performance.numa_node);
    LOG_INFO("Scan:");
    LOG_INFO("  Max unit bytes: %llu", static_cast<unsigned long long>(config.scan.max_unit_bytes));
    LOG_INFO("  Max findings per unit: %u", config.scan.max_findings_per_unit);
    LOG_INFO("  Error block window: %u", config.scan.error_block_window);
    LOG_INFO("  Entry point window: %u", config.scan.entry_point_window);
    LOG_INFO("  Low confidence cap: %.2f", config.scan.low_confidence_cap);
    LOG_INFO("=============================");
}

} // namespace Shield
