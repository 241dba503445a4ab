#include <arbor/catalog/difficulty.hpp>

namespace arbor::catalog {

namespace {

constexpr std::array<double, 5> GROWTH_DIVISORS = {1.0, 1.3, 1.6, 2.0, 2.5};

constexpr std::array<DifficultyTier, DIFFICULTY_TIER_COUNT> TIERS = {{
    {"explore",      "Explore",      1.3, 1.3},
    {"normal",       "Normal",       1.0, 1.0},
    {"hard",         "Hard",         0.8, 0.85},
    {"brutal",       "Brutal",       0.6, 0.7},
    {"ultra-brutal", "Ultra Brutal", 0.4, 0.5},
}};

constexpr size_t NORMAL_TIER_INDEX = 1;

} // namespace

double growth_difficulty_divisor(int difficulty) {
    if (difficulty < 1 || difficulty > 5) return 1.0;
    return GROWTH_DIVISORS[static_cast<size_t>(difficulty - 1)];
}

const std::array<DifficultyTier, DIFFICULTY_TIER_COUNT>& difficulty_tiers() {
    return TIERS;
}

const DifficultyTier* find_difficulty_tier(const std::string& id) {
    for (const auto& tier : TIERS) {
        if (id == tier.id) return &tier;
    }
    return nullptr;
}

const DifficultyTier& difficulty_tier_or_normal(const std::string& id) {
    const DifficultyTier* tier = find_difficulty_tier(id);
    return tier ? *tier : TIERS[NORMAL_TIER_INDEX];
}

} // namespace arbor::catalog
