#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>

#include "common/digest.h"
#include "engine/types.h"

namespace Shield {

constexpr size_t MAX_INDICATORS_PER_RULE = 16;
constexpr size_t MAX_TOKENS = 16;
constexpr size_t MAX_TOKEN_LEN = 48;
constexpr size_t MAX_GUIDANCE = 8;
constexpr size_t MAX_ID_LEN = 48;
constexpr uint32_t MAX_WINDOW = 8;
constexpr uint32_t MAX_LOOKAHEAD = 8;

struct TokenList {
    char items[MAX_TOKENS][MAX_TOKEN_LEN];
    uint32_t count;

    [[nodiscard]] auto at(size_t idx) const noexcept -> std::string_view {
        return idx < count ? std::string_view(items[idx]) : std::string_view();
    }
    [[nodiscard]] auto empty() const noexcept -> bool { return count == 0; }
};

/// A detectable textual pattern tied to a rule
struct Indicator {
    char id[MAX_ID_LEN];
    IndicatorKind kind;
    IndicatorRole role;
    Factor factor;
    TokenList tokens;    // primary tokens
    TokenList with;      // cooccurrence partners
    TokenList without;   // absence guards
    bool case_sensitive;
    bool literal_rhs;    // assignment must bind a string literal
    uint8_t window;      // symmetric look-around, lines
    uint8_t lookahead;   // forward reach of absence guards, lines
    double confidence;   // (0, 1]
    char description[192];

    [[nodiscard]] auto isSignal() const noexcept -> bool { return role == IndicatorRole::SIGNAL; }
};

struct Rule {
    char id[MAX_ID_LEN];
    Category category;
    SeverityTier tier;
    char title[128];
    std::array<Indicator, MAX_INDICATORS_PER_RULE> indicators;
    uint32_t indicator_count;
    char guidance[MAX_GUIDANCE][256];  // annotation only
    uint32_t guidance_count;

    [[nodiscard]] auto indicator(size_t idx) const noexcept -> const Indicator& {
        return indicators[idx];
    }
    [[nodiscard]] auto signalCount() const noexcept -> uint32_t;
};

/// Immutable set of the five category rules. Only CatalogLoader can create
/// one; after load it is shared read-only by every scan.
class RuleCatalog {
public:
    RuleCatalog(const RuleCatalog&) = delete;
    RuleCatalog& operator=(const RuleCatalog&) = delete;

    [[nodiscard]] auto rulesFor(Category category) const noexcept -> const Rule& {
        return rules_[categoryIndex(category)];
    }

    /// Rules in document order: credentials, SSL, input validation, logging,
    /// error handling
    [[nodiscard]] auto allRules() const noexcept -> const std::array<Rule, CATEGORY_COUNT>& {
        return rules_;
    }

    [[nodiscard]] auto findRule(std::string_view rule_id) const noexcept -> const Rule*;

    /// SHA-256 hex of the catalog source document
    [[nodiscard]] auto digest() const noexcept -> const char* { return digest_; }

    [[nodiscard]] auto indicatorCount() const noexcept -> uint32_t;

private:
    friend class CatalogLoader;

    RuleCatalog() noexcept;

    std::array<Rule, CATEGORY_COUNT> rules_;
    char digest_[Common::SHA256_HEX_SIZE];
};

} // namespace Shield
