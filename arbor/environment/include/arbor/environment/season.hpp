#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace arbor::environment {

enum class Season : uint8_t {
    Spring,
    Summer,
    Autumn,
    Winter
};

const char* season_to_string(Season season);

// Parse "spring", "summer", "autumn" or "winter"
std::optional<Season> season_from_string(std::string_view name);

// Parse, falling back for unknown names
Season season_from_string_or(std::string_view name, Season fallback = Season::Summer);

// Base seasonal growth multiplier: spring 1.5, summer 1.0, autumn 0.8, winter 0.0.
// Evergreen and cold-hardy overrides for winter are applied by the growth model.
double season_growth_multiplier(Season season);

} // namespace arbor::environment
