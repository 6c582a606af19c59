#include "engine/rule_catalog.h"

namespace Shield {

auto Rule::signalCount() const noexcept -> uint32_t {
    uint32_t signals = 0;
    for (uint32_t i = 0; i < indicator_count; ++i) {
        if (indicators[i].isSignal()) {
            ++signals;
        }
    }
    return signals;
}

RuleCatalog::RuleCatalog() noexcept : rules_{}, digest_{} {}

auto RuleCatalog::findRule(std::string_view rule_id) const noexcept -> const Rule* {
    for (const auto& rule : rules_) {
        if (rule_id == rule.id) {
            return &rule;
        }
    }
    return nullptr;
}

auto RuleCatalog::indicatorCount() const noexcept -> uint32_t {
    uint32_t total = 0;
    for (const auto& rule : rules_) {
        total += rule.indicator_count;
    }
    return total;
}

} // namespace Shield
