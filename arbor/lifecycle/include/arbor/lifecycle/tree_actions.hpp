#pragma once

#include <arbor/lifecycle/tree_components.hpp>
#include <arbor/catalog/species.hpp>
#include <arbor/scene/world.hpp>
#include <string>

namespace arbor::lifecycle {

// Fraction of the harvest cycle skipped by pruning
constexpr double PRUNE_COOLDOWN_FRACTION = 0.3;

// Create a grid cell entity
scene::Entity spawn_grid_cell(scene::World& world, const IVec2& cell, CellType type = CellType::Soil);

// Cell entity at `cell`, or NullEntity
scene::Entity find_grid_cell(const scene::World& world, const IVec2& cell);

// Plant a seed at `cell`. The cell must exist, be soil or path, and be free.
// Returns the new tree entity, or NullEntity if planting is not possible.
scene::Entity plant_tree(scene::World& world, const std::string& species_id, const IVec2& cell,
                         const catalog::SpeciesCatalog& species_catalog = catalog::get_species_catalog());

// Spawn a tree directly at a stage, without a grid cell (world generation, tests)
scene::Entity spawn_tree(scene::World& world, const std::string& species_id, const IVec2& cell,
                         int stage = TreeStage::Seed, double progress = 0.0);

// Each action returns false if the entity is not a tree or the action does not apply
bool water_tree(scene::World& world, scene::Entity entity);
bool fertilize_tree(scene::World& world, scene::Entity entity);

// Mature and older only. Skips 30% of an attached facet's cycle and grants
// the pruned yield bonus until the next collection.
bool prune_tree(scene::World& world, scene::Entity entity,
                const catalog::SpeciesCatalog& species_catalog = catalog::get_species_catalog());

} // namespace arbor::lifecycle
