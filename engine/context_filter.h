#pragma once

#include <string_view>
#include <vector>

#include "config/config.h"
#include "engine/pattern_matcher.h"

namespace Shield {

/// Narrows raw matches to those the indicator text can responsibly flag.
/// Never fails and is idempotent: filter(filter(m)) == filter(m).
class ContextFilter {
public:
    explicit ContextFilter(const ScannerConfig& config) noexcept;

    [[nodiscard]] auto filter(const std::vector<Match>& matches) const -> std::vector<Match>;

    [[nodiscard]] auto isFixturePath(std::string_view unit_id) const noexcept -> bool;
    [[nodiscard]] auto isCommented(const Match& match) const noexcept -> bool;
    [[nodiscard]] auto isPlaceholder(std::string_view literal) const noexcept -> bool;

private:
    void dedupe(std::vector<Match>* matches) const;
    void applyErrorBlockRule(std::vector<Match>* matches) const;

    const NameList& fixture_segments_;
    const NameList& placeholder_values_;
    uint32_t error_block_window_;
    double low_confidence_cap_;
};

} // namespace Shield
