#pragma once

#include <arbor/lifecycle/tree_components.hpp>
#include <arbor/catalog/species.hpp>
#include <arbor/environment/season.hpp>
#include <arbor/scene/world.hpp>
#include <cstdint>
#include <string_view>
#include <unordered_map>
#include <unordered_set>

namespace arbor::lifecycle {

using environment::Season;

// Progress per second for one stage of growth, before any world modifiers.
// rate = (season * water) / (base_time * difficulty divisor)
// Returns 0 for dormant seasons and non-positive base times.
double calc_growth_rate(double base_time, int difficulty, Season season,
                        bool watered, bool evergreen,
                        std::string_view species_id = {});

// Visual scale for a tree: the stage's scale plus a partial preview
// (progress * 0.3) of the way to the next stage's scale.
float stage_scale(int stage, double progress);

// Per-sweep neighbour lookups. Built once at the start of a growth sweep and
// read-only afterwards, so trees advanced during the sweep never affect it.
class SpatialIndex {
public:
    static SpatialIndex build(const scene::World& world);

    void add_water(const IVec2& cell);
    void add_tree(const IVec2& cell);

    // Any water tile in the 8-neighbour ring around `cell` (the cell itself excluded)
    bool water_adjacent(const IVec2& cell) const;

    // Trees occupying the 8-neighbour ring around `cell` (the cell itself excluded)
    int adjacent_tree_count(const IVec2& cell) const;

    size_t water_count() const { return m_water.size(); }

private:
    std::unordered_set<uint64_t> m_water;
    std::unordered_map<uint64_t, int> m_tree_counts;
};

// Growth multiplier from the species' spatial specials (water proximity,
// clustering). 1.0 for species without either.
double species_growth_bonus(std::string_view species_id, const IVec2& cell,
                            const SpatialIndex& index);

// Modifiers supplied by the caller for one growth sweep
struct GrowthConditions {
    Season season = Season::Summer;
    double weather_mult = 1.0;              // From the active weather event
    double difficulty_growth_mult = 1.0;    // Active difficulty tier growth scalar
};

// Per-tick growth sweep over every tree.
// Phase: FixedUpdate, Priority: 10
void growth_system(scene::World& world, double dt, const GrowthConditions& conditions,
                   const catalog::SpeciesCatalog& species_catalog = catalog::get_species_catalog());

// Season and weather only, no difficulty scalar: advance = rate * weather * structures
// * fertilizer * species bonus * dt. register_lifecycle_systems uses the
// GrowthConditions overload, which also applies the tier's growth_speed_mult.
void growth_system(scene::World& world, double dt, Season season, double weather_mult = 1.0);

} // namespace arbor::lifecycle
