#include <arbor/lifecycle/tree_actions.hpp>
#include <arbor/lifecycle/growth.hpp>
#include <arbor/lifecycle/harvest.hpp>
#include <arbor/core/log.hpp>

namespace arbor::lifecycle {

using namespace arbor::scene;
using core::log;
using core::LogLevel;

Entity spawn_grid_cell(World& world, const IVec2& cell, CellType type) {
    Entity e = world.create();
    world.emplace<GridCell>(e, GridCell{cell, type, false});
    return e;
}

Entity find_grid_cell(const World& world, const IVec2& cell) {
    auto view = world.view<GridCell>();
    for (auto entity : view) {
        if (view.get<GridCell>(entity).cell == cell) {
            return entity;
        }
    }
    return NullEntity;
}

Entity plant_tree(World& world, const std::string& species_id, const IVec2& cell,
                  const catalog::SpeciesCatalog& species_catalog) {
    if (!species_catalog.contains(species_id)) {
        log(LogLevel::Warn, "Cannot plant unknown species '{}'", species_id);
        return NullEntity;
    }

    Entity cell_entity = find_grid_cell(world, cell);
    if (cell_entity == NullEntity) return NullEntity;

    auto& grid_cell = world.get<GridCell>(cell_entity);
    if (grid_cell.type != CellType::Soil && grid_cell.type != CellType::Path) return NullEntity;
    if (grid_cell.occupied) return NullEntity;

    grid_cell.occupied = true;
    return spawn_tree(world, species_id, cell);
}

Entity spawn_tree(World& world, const std::string& species_id, const IVec2& cell,
                  int stage, double progress) {
    Entity e = world.create(species_id);

    TreeComponent tree;
    tree.species_id = species_id;
    tree.stage = stage;
    tree.progress = progress;
    world.emplace<TreeComponent>(e, tree);
    world.emplace<GridPosition>(e, GridPosition{cell});
    world.emplace<TreeVisual>(e, TreeVisual{stage_scale(stage, progress)});
    return e;
}

bool water_tree(World& world, Entity entity) {
    auto* tree = world.try_get<TreeComponent>(entity);
    if (!tree || tree->watered) return false;

    tree->watered = true;
    return true;
}

bool fertilize_tree(World& world, Entity entity) {
    auto* tree = world.try_get<TreeComponent>(entity);
    if (!tree || tree->fertilized) return false;
    if (tree->stage >= MAX_STAGE) return false;

    tree->fertilized = true;
    return true;
}

bool prune_tree(World& world, Entity entity, const catalog::SpeciesCatalog& species_catalog) {
    auto* tree = world.try_get<TreeComponent>(entity);
    if (!tree || tree->stage < HARVEST_STAGE) return false;

    tree->pruned = true;

    if (auto* harvestable = world.try_get<Harvestable>(entity)) {
        harvestable->cooldown_elapsed += harvestable->cooldown_total * PRUNE_COOLDOWN_FRACTION;
        init_harvestable(world, entity, species_catalog);
    }
    return true;
}

} // namespace arbor::lifecycle
