#pragma once

#include <cstddef>
#include <cstdint>

namespace Shield {

/// Rule categories in catalog document order
enum class Category : uint8_t {
    HARDCODED_CREDENTIALS = 0,
    SSL_VERIFICATION_DISABLED = 1,
    INPUT_VALIDATION_MISSING = 2,
    INFORMATION_DISCLOSURE_IN_LOGS = 3,
    INSUFFICIENT_ERROR_HANDLING = 4
};

constexpr size_t CATEGORY_COUNT = 5;

/// Baseline severity tier declared by a rule
enum class SeverityTier : uint8_t {
    HIGH = 0,
    MEDIUM = 1,
    LOW = 2
};

constexpr size_t TIER_COUNT = 3;

/// Score bands of the risk rubric, most severe first
enum class SeverityBand : uint8_t {
    CRITICAL = 0,  // 9-10
    HIGH = 1,      // 7-8
    MEDIUM = 2,    // 4-6
    LOW = 3        // 1-3
};

constexpr size_t BAND_COUNT = 4;

enum class IndicatorKind : uint8_t {
    KEYWORD = 0,
    LITERAL = 1,
    ASSIGNMENT = 2,
    COOCCURRENCE = 3
};

/// Whether an indicator can yield findings or only informs the filter
enum class IndicatorRole : uint8_t {
    SIGNAL = 0,
    CONTEXT = 1
};

/// Corroborating factor an indicator contributes to the scorer
enum class Factor : uint8_t {
    NONE = 0,
    CREDENTIAL_LITERAL,
    EXPLICIT_VERIFY_DISABLED,
    PLAIN_HTTP_ENDPOINT,
    UNVALIDATED_INPUT,
    CREDENTIAL_IN_LOG,
    VERBOSE_EXCEPTION_LOG,
    BARE_CATCH,
    MISSING_TIMEOUT,
    DIFFERENTIATED_HANDLER,  // context only
    BLOCK_OPENER             // context only
};

struct BandRange {
    uint8_t low;
    uint8_t high;
};

[[nodiscard]] constexpr auto categoryIndex(Category c) noexcept -> size_t {
    return static_cast<size_t>(c);
}

[[nodiscard]] constexpr auto bandIndex(SeverityBand b) noexcept -> size_t {
    return static_cast<size_t>(b);
}

[[nodiscard]] constexpr auto tierIndex(SeverityTier t) noexcept -> size_t {
    return static_cast<size_t>(t);
}

[[nodiscard]] constexpr auto bandRange(SeverityBand band) noexcept -> BandRange {
    switch (band) {
        case SeverityBand::CRITICAL: return {9, 10};
        case SeverityBand::HIGH:     return {7, 8};
        case SeverityBand::MEDIUM:   return {4, 6};
        case SeverityBand::LOW:      return {1, 3};
    }
    return {1, 3};
}

[[nodiscard]] constexpr auto bandForScore(uint8_t score) noexcept -> SeverityBand {
    if (score >= 9) return SeverityBand::CRITICAL;
    if (score >= 7) return SeverityBand::HIGH;
    if (score >= 4) return SeverityBand::MEDIUM;
    return SeverityBand::LOW;
}

// Canonical names, as used in catalog sources and reports
[[nodiscard]] auto categoryName(Category c) noexcept -> const char*;
[[nodiscard]] auto tierName(SeverityTier t) noexcept -> const char*;
[[nodiscard]] auto bandName(SeverityBand b) noexcept -> const char*;
[[nodiscard]] auto kindName(IndicatorKind k) noexcept -> const char*;
[[nodiscard]] auto roleName(IndicatorRole r) noexcept -> const char*;
[[nodiscard]] auto factorName(Factor f) noexcept -> const char*;

[[nodiscard]] auto parseCategory(const char* name, Category* out) noexcept -> bool;
[[nodiscard]] auto parseTier(const char* name, SeverityTier* out) noexcept -> bool;
[[nodiscard]] auto parseKind(const char* name, IndicatorKind* out) noexcept -> bool;
[[nodiscard]] auto parseRole(const char* name, IndicatorRole* out) noexcept -> bool;
[[nodiscard]] auto parseFactor(const char* name, Factor* out) noexcept -> bool;

} // namespace Shield
