#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace Shield {

constexpr size_t MAX_LIST_ENTRIES = 16;
constexpr size_t MAX_LIST_ENTRY_LEN = 32;

/// Fixed-capacity list of short names read from a TOML array
struct NameList {
    char items[MAX_LIST_ENTRIES][MAX_LIST_ENTRY_LEN];
    uint32_t count;

    auto add(std::string_view item) noexcept -> bool;
    void clear() noexcept { count = 0; }

    [[nodiscard]] auto at(size_t idx) const noexcept -> std::string_view {
        return idx < count ? std::string_view(items[idx]) : std::string_view();
    }
    [[nodiscard]] auto contains(std::string_view item) const noexcept -> bool;
    [[nodiscard]] auto containsNoCase(std::string_view item) const noexcept -> bool;
};

// Complete scanner configuration
struct ScannerConfig {
    struct System {
        char name[64];
        char version[32];
        char environment[32];  // development, ci, production
    } system;

    struct Paths {
        char logs_dir[256];
        char catalog_file[256];
        char report_dir[256];
    } paths;

    struct Logging {
        char level[16];
        bool enabled;
    } logging;

    struct Performance {
        uint32_t worker_count;  // 0 = hardware concurrency
        bool pin_workers;
        int first_core;
        int numa_node;          // -1 = kernel default
    } performance;

    struct Scan {
        uint64_t max_unit_bytes;
        uint32_t max_findings_per_unit;
        uint32_t error_block_window;
        uint32_t entry_point_window;
        double low_confidence_cap;
    } scan;

    // Path and identifier heuristics used by the filter and scorer
    struct Classification {
        NameList fixture_segments;
        NameList test_segments;
        NameList placeholder_values;
        NameList handler_prefixes;
        NameList handler_suffixes;
        NameList handler_decorators;
    } classification;

    struct Report {
        char json_path[256];
        char text_path[256];
        bool fail_on_high;
    } report;

    bool is_valid{false};
};

// Upper bounds accepted by validation
constexpr uint32_t MAX_WORKER_COUNT = 256;
constexpr uint32_t MAX_BLOCK_WINDOW = 64;
constexpr uint32_t MAX_ENTRY_POINT_WINDOW = 1000;
constexpr uint64_t MAX_UNIT_BYTES_LIMIT = 256ULL * 1024 * 1024;

// Configuration manager for the scanner
class ConfigManager {
private:
    static ScannerConfig config_;
    static bool initialized_;

    struct ParseState;

    static auto parseLine(const char* section, const char* line, ScannerConfig* config,
                          ParseState* state) noexcept -> void;

    // Helpers to extract value from a key = value line
    static auto matchKey(const char* line, const char* key) noexcept -> const char*;
    static auto extractStringValue(const char* line, const char* key, char* value, size_t max_len,
                                   ParseState* state) noexcept -> bool;
    static auto extractIntValue(const char* line, const char* key, int64_t* value,
                                ParseState* state) noexcept -> bool;
    static auto extractUintValue(const char* line, const char* key, uint64_t* value,
                                 ParseState* state) noexcept -> bool;
    // 32-bit variants reject values that do not fit instead of narrowing
    static auto extractUint32Value(const char* line, const char* key, uint32_t* value,
                                   ParseState* state) noexcept -> bool;
    static auto extractInt32Value(const char* line, const char* key, int* value,
                                  ParseState* state) noexcept -> bool;
    static auto extractDoubleValue(const char* line, const char* key, double* value,
                                   ParseState* state) noexcept -> bool;
    static auto extractBoolValue(const char* line, const char* key, bool* value,
                                 ParseState* state) noexcept -> bool;
    static auto extractListValue(const char* line, const char* key, NameList* list,
                                 ParseState* state) noexcept -> bool;

public:
    // Initialize the global configuration from a TOML file
    [[nodiscard]] static auto init(const char* config_file = "config/shield.toml") noexcept -> bool;

    // Initialize the global configuration with built-in defaults only
    static auto initDefaults() noexcept -> void;

    static auto reset() noexcept -> void;

    [[nodiscard]] static auto getConfig() noexcept -> const ScannerConfig& {
        return config_;
    }

    [[nodiscard]] static auto isInitialized() noexcept -> bool {
        return initialized_ && config_.is_valid;
    }

    static auto setDefaults(ScannerConfig* config) noexcept -> void;

    /// Parse TOML text over an already defaulted config. Keys that are absent
    /// keep their current value.
    [[nodiscard]] static auto parseString(const char* content, ScannerConfig* config) noexcept -> bool;
    [[nodiscard]] static auto parseFile(const char* filepath, ScannerConfig* config) noexcept -> bool;

    [[nodiscard]] static auto validateConfig(const ScannerConfig& config) noexcept -> bool;

    /// Create logs_dir and report_dir if missing
    [[nodiscard]] static auto ensureDirectories(const ScannerConfig& config) noexcept -> bool;

    static auto printConfig(const ScannerConfig& config) noexcept -> void;
};

[[nodiscard]] inline auto getScannerConfig() noexcept -> const ScannerConfig& {
    return ConfigManager::getConfig();
}

} // namespace Shield
