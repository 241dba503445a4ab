#pragma once

#include <arbor/lifecycle/tree_components.hpp>
#include <arbor/catalog/species.hpp>
#include <arbor/catalog/species_traits.hpp>
#include <arbor/environment/season.hpp>
#include <arbor/scene/world.hpp>
#include <optional>
#include <vector>

namespace arbor::lifecycle {

// World state read at collection time
struct HarvestConditions {
    std::optional<environment::Season> season;
    double difficulty_yield_mult = 1.0;     // Active difficulty tier yield multiplier
};

// Breakdown of the multipliers applied to a harvest. Computed fresh for every
// collection and never stored on the tree.
struct YieldMultiplier {
    double stage = 1.0;         // 1.5 at Old Growth
    double pruned = 1.0;        // 1.5 while pruned
    double structure = 1.0;     // Nearby harvest-boost structures
    double difficulty = 1.0;

    // Species boost whose condition currently holds, if any
    std::optional<catalog::YieldBoost> species_boost;

    // Product of the multipliers shared by every resource
    double common() const { return stage * pruned * structure * difficulty; }

    // Combined multiplier for one resource type
    double for_resource(catalog::ResourceType type) const;
};

// Attach (or refresh) the harvest facet on a tree at stage >= Mature.
// First attachment starts the cooldown from zero. Refreshing keeps the elapsed
// cooldown and re-snapshots base yields and cycle length from the species.
// Returns false if the tree is too young or its species is unknown.
bool init_harvestable(scene::World& world, scene::Entity entity,
                      const catalog::SpeciesCatalog& species_catalog = catalog::get_species_catalog());

// Attaches facets to trees that reached Mature and refreshes those that advanced
// past the stage their facet was attached at.
void attach_harvestables(scene::World& world, const catalog::SpeciesCatalog& species_catalog);

// Phase: FixedUpdate, Priority: 5
void attach_harvestable_system(scene::World& world, double dt);

// Advances cooldowns of facets that are not yet ready.
// Phase: FixedUpdate, Priority: 0
void harvest_system(scene::World& world, double dt);

YieldMultiplier harvest_yield_multiplier(const scene::World& world, scene::Entity entity,
                                         const HarvestConditions& conditions);

// Collect a ready harvest. Each amount is ceil(base * multiplier).
// Resets the cooldown and consumes the pruned bonus.
// Returns nullopt if the tree has no facet or it is not ready.
std::optional<std::vector<catalog::ResourceYield>> collect_harvest(
    scene::World& world, scene::Entity entity, const HarvestConditions& conditions = {});

} // namespace arbor::lifecycle
