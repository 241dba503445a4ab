#pragma once

#include <arbor/catalog/resources.hpp>
#include <cstdint>
#include <optional>
#include <string_view>

namespace arbor::catalog {

// When a per-resource yield boost applies
enum class YieldCondition : uint8_t {
    OldGrowth,  // Tree is at the terminal stage
    Autumn      // Collected during autumn
};

struct YieldBoost {
    ResourceType resource;
    double multiplier;
    YieldCondition condition;
};

// Hard-coded exceptions to the generic growth and yield formulas.
// Default-constructed traits are neutral.
struct SpeciesTraits {
    // Replaces the winter season multiplier (cold-hardy species)
    std::optional<double> winter_growth_mult;

    // Growth multiplier while a water tile lies in the 8-neighbour ring
    double water_proximity_bonus = 1.0;

    // Growth bonus of 1 + min(cap, per_tree * adjacent trees)
    double cluster_bonus_per_tree = 0.0;
    double cluster_bonus_cap = 0.0;

    // Multiplier on a single resource type under a condition
    std::optional<YieldBoost> yield_boost;

    bool has_cluster_bonus() const { return cluster_bonus_per_tree > 0.0; }
    bool has_water_bonus() const { return water_proximity_bonus != 1.0; }
};

// Traits for a species id; neutral traits for species without specials
const SpeciesTraits& species_traits(std::string_view species_id);

} // namespace arbor::catalog
