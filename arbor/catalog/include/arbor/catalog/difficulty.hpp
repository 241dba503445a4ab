#pragma once

#include <array>
#include <string>

namespace arbor::catalog {

// Growth divisor for a species difficulty rating (1-5).
// Higher difficulty => larger divisor => slower growth. Unknown ratings return 1.0.
double growth_difficulty_divisor(int difficulty);

// Game difficulty tier chosen by the player. Normal is the 1.0 baseline.
struct DifficultyTier {
    const char* id;
    const char* name;
    double growth_speed_mult;    // Scales growth in both the live and offline paths
    double resource_yield_mult;  // Scales harvest yields at collection time
};

constexpr size_t DIFFICULTY_TIER_COUNT = 5;

// Tiers ordered from most forgiving to harshest
const std::array<DifficultyTier, DIFFICULTY_TIER_COUNT>& difficulty_tiers();

// nullptr if the id is unknown
const DifficultyTier* find_difficulty_tier(const std::string& id);

// Falls back to "normal" for unknown ids
const DifficultyTier& difficulty_tier_or_normal(const std::string& id);

} // namespace arbor::catalog
