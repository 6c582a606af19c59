#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

#include "engine/rule_catalog.h"
#include "engine/source_unit.h"

namespace Shield {

constexpr size_t MAX_EXCERPT_LEN = 192;
constexpr size_t MAX_LITERAL_LEN = 128;

/// One indicator firing on one line of a unit. Valid only while the unit and
/// catalog it points into are alive.
struct Match {
    const Rule* rule;
    uint16_t indicator_index;
    const SourceUnit* unit;
    uint32_t line;            // 1-based
    uint32_t column;          // 0-based byte offset of the matched token
    char excerpt[MAX_EXCERPT_LEN];
    char literal_value[MAX_LITERAL_LEN];
    bool has_literal;
    double confidence;
    bool low_confidence;

    [[nodiscard]] auto indicator() const noexcept -> const Indicator& {
        return rule->indicator(indicator_index);
    }
    [[nodiscard]] auto isSignal() const noexcept -> bool { return indicator().isSignal(); }
};

/// Applies every rule's indicators to every line of a unit. Stateless.
class PatternMatcher {
public:
    /// Appends matches in catalog order (rule, indicator, line)
    static auto scan(const SourceUnit& unit, const RuleCatalog& catalog, std::vector<Match>* out) -> void;

    static auto scanRule(const SourceUnit& unit, const Rule& rule, std::vector<Match>* out) -> void;

    /// Evaluate one indicator on one line
    [[nodiscard]] static auto matchLine(const SourceUnit& unit, const Rule& rule, uint16_t indicator_index,
                                        uint32_t line_no, Match* out) noexcept -> bool;
};

/// Content of a string literal opening rhs (optional b/r/u prefix); f-strings
/// are not literals
[[nodiscard]] auto leadingStringLiteral(std::string_view rhs, std::string_view* content) noexcept -> bool;

} // namespace Shield
