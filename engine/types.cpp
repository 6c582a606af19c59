#include "engine/types.h"

#include <cstring>

namespace Shield {

namespace {

constexpr const char* CATEGORY_NAMES[CATEGORY_COUNT] = {
    "HardcodedCredentials",
    "SSLVerificationDisabled",
    "InputValidationMissing",
    "InformationDisclosureInLogs",
    "InsufficientErrorHandling"
};

constexpr const char* TIER_NAMES[TIER_COUNT] = {"HIGH", "MEDIUM", "LOW"};

constexpr const char* BAND_NAMES[BAND_COUNT] = {"CRITICAL", "HIGH", "MEDIUM", "LOW"};

constexpr const char* KIND_NAMES[] = {"keyword", "literal", "assignment", "cooccurrence"};

constexpr const char* ROLE_NAMES[] = {"signal", "context"};

constexpr const char* FACTOR_NAMES[] = {
    "none",
    "credential_literal",
    "explicit_verify_disabled",
    "plain_http_endpoint",
    "unvalidated_input",
    "credential_in_log",
    "verbose_exception_log",
    "bare_catch",
    "missing_timeout",
    "differentiated_handler",
    "block_opener"
};

template <typename Enum, size_t N>
bool lookup(const char* const (&names)[N], const char* name, Enum* out) noexcept {
    if (!name || !out) return false;
    for (size_t i = 0; i < N; ++i) {
        if (std::strcmp(names[i], name) == 0) {
            *out = static_cast<Enum>(i);
            return true;
        }
    }
    return false;
}

template <size_t N>
const char* nameAt(const char* const (&names)[N], size_t idx) noexcept {
    return idx < N ? names[idx] : "unknown";
}

} // namespace

auto categoryName(Category c) noexcept -> const char* {
    return nameAt(CATEGORY_NAMES, static_cast<size_t>(c));
}

auto tierName(SeverityTier t) noexcept -> const char* {
    return nameAt(TIER_NAMES, static_cast<size_t>(t));
}

auto bandName(SeverityBand b) noexcept -> const char* {
    return nameAt(BAND_NAMES, static_cast<size_t>(b));
}

auto kindName(IndicatorKind k) noexcept -> const char* {
    return nameAt(KIND_NAMES, static_cast<size_t>(k));
}

auto roleName(IndicatorRole r) noexcept -> const char* {
    return nameAt(ROLE_NAMES, static_cast<size_t>(r));
}

auto factorName(Factor f) noexcept -> const char* {
    return nameAt(FACTOR_NAMES, static_cast<size_t>(f));
}

auto parseCategory(const char* name, Category* out) noexcept -> bool {
    return lookup(CATEGORY_NAMES, name, out);
}

auto parseTier(const char* name, SeverityTier* out) noexcept -> bool {
    return lookup(TIER_NAMES, name, out);
}

auto parseKind(const char* name, IndicatorKind* out) noexcept -> bool {
    return lookup(KIND_NAMES, name, out);
}

auto parseRole(const char* name, IndicatorRole* out) noexcept -> bool {
    return lookup(ROLE_NAMES, name, out);
}

auto parseFactor(const char* name, Factor* out) noexcept -> bool {
    return lookup(FACTOR_NAMES, name, out);
}

} // namespace Shield
