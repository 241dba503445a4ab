#include <arbor/lifecycle/growth.hpp>
#include <arbor/catalog/difficulty.hpp>
#include <arbor/catalog/species_traits.hpp>
#include <arbor/structures/structure_effects.hpp>
#include <arbor/core/log.hpp>
#include <algorithm>
#include <array>

namespace arbor::lifecycle {

using namespace arbor::scene;
using core::log;
using core::LogLevel;

namespace {

constexpr double WATER_BONUS = 1.3;
constexpr double EVERGREEN_WINTER_MULT = 0.3;
constexpr double STAGE_PREVIEW_FRACTION = 0.3;

constexpr std::array<float, MAX_STAGE + 1> STAGE_SCALES = {0.08f, 0.15f, 0.4f, 0.8f, 1.2f};

// Visits the 8 cells around `cell`
template<typename Fn>
void for_each_neighbour(const IVec2& cell, Fn&& fn) {
    for (int dx = -1; dx <= 1; ++dx) {
        for (int dz = -1; dz <= 1; ++dz) {
            if (dx == 0 && dz == 0) continue;
            fn(IVec2(cell.x + dx, cell.y + dz));
        }
    }
}

void update_visual(World& world, Entity entity, const TreeComponent& tree) {
    if (auto* visual = world.try_get<TreeVisual>(entity)) {
        visual->scale = stage_scale(tree.stage, tree.progress);
    }
}

} // namespace

double calc_growth_rate(double base_time, int difficulty, Season season,
                        bool watered, bool evergreen, std::string_view species_id) {
    double season_mult = environment::season_growth_multiplier(season);

    if (season == Season::Winter) {
        const auto& traits = catalog::species_traits(species_id);
        if (traits.winter_growth_mult) {
            season_mult = *traits.winter_growth_mult;
        } else if (evergreen) {
            season_mult = EVERGREEN_WINTER_MULT;
        }
    }

    if (season_mult == 0.0) return 0.0;

    double diff_mult = catalog::growth_difficulty_divisor(difficulty);
    double water_mult = watered ? WATER_BONUS : 1.0;

    if (base_time <= 0.0) return 0.0;

    return (season_mult * water_mult) / (base_time * diff_mult);
}

float stage_scale(int stage, double progress) {
    int clamped = std::clamp(stage, 0, MAX_STAGE);
    float base = STAGE_SCALES[static_cast<size_t>(clamped)];
    if (clamped >= MAX_STAGE) return base;

    float next = STAGE_SCALES[static_cast<size_t>(clamped + 1)];
    float preview = static_cast<float>(progress * STAGE_PREVIEW_FRACTION);
    return base + (next - base) * preview;
}

// ============================================================================
// SpatialIndex
// ============================================================================

SpatialIndex SpatialIndex::build(const World& world) {
    SpatialIndex index;

    auto cells = world.view<GridCell>();
    for (auto entity : cells) {
        const auto& cell = cells.get<GridCell>(entity);
        if (cell.type == CellType::Water) {
            index.add_water(cell.cell);
        }
    }

    auto trees = world.view<TreeComponent, GridPosition>();
    for (auto entity : trees) {
        index.add_tree(trees.get<GridPosition>(entity).cell);
    }

    return index;
}

void SpatialIndex::add_water(const IVec2& cell) {
    m_water.insert(grid_key(cell));
}

void SpatialIndex::add_tree(const IVec2& cell) {
    ++m_tree_counts[grid_key(cell)];
}

bool SpatialIndex::water_adjacent(const IVec2& cell) const {
    bool found = false;
    for_each_neighbour(cell, [&](const IVec2& n) {
        if (!found && m_water.count(grid_key(n)) > 0) found = true;
    });
    return found;
}

int SpatialIndex::adjacent_tree_count(const IVec2& cell) const {
    int count = 0;
    for_each_neighbour(cell, [&](const IVec2& n) {
        auto it = m_tree_counts.find(grid_key(n));
        if (it != m_tree_counts.end()) count += it->second;
    });
    return count;
}

double species_growth_bonus(std::string_view species_id, const IVec2& cell,
                            const SpatialIndex& index) {
    const auto& traits = catalog::species_traits(species_id);
    double bonus = 1.0;

    if (traits.has_water_bonus() && index.water_adjacent(cell)) {
        bonus = traits.water_proximity_bonus;
    }

    if (traits.has_cluster_bonus()) {
        double cluster = traits.cluster_bonus_per_tree * index.adjacent_tree_count(cell);
        bonus = 1.0 + std::min(cluster, traits.cluster_bonus_cap);
    }

    return bonus;
}

// ============================================================================
// Growth System
// ============================================================================

void growth_system(World& world, double dt, const GrowthConditions& conditions,
                   const catalog::SpeciesCatalog& species_catalog) {
    // Neighbour lookups reflect the world as it was before this sweep
    const SpatialIndex index = SpatialIndex::build(world);

    auto view = world.view<TreeComponent>();
    for (auto entity : view) {
        auto& tree = view.get<TreeComponent>(entity);

        if (tree.stage >= MAX_STAGE) {
            tree.progress = std::min(tree.progress, TERMINAL_PROGRESS_CAP);
            update_visual(world, entity, tree);
            continue;
        }

        const catalog::SpeciesData* species = species_catalog.find(tree.species_id);
        if (!species) {
            update_visual(world, entity, tree);
            continue;
        }

        double base_time = species->growth_time(tree.stage);
        double rate = calc_growth_rate(base_time, species->difficulty, conditions.season,
                                       tree.watered, species->evergreen, species->id);
        if (rate <= 0.0) {
            update_visual(world, entity, tree);
            continue;
        }

        double structure_mult = 1.0;
        double species_bonus = 1.0;
        if (const auto* pos = world.try_get<GridPosition>(entity)) {
            structure_mult = structures::growth_multiplier(world,
                                                           static_cast<float>(pos->cell.x),
                                                           static_cast<float>(pos->cell.y));
            species_bonus = species_growth_bonus(tree.species_id, pos->cell, index);
        }

        double fertilized_mult = tree.fertilized ? 2.0 : 1.0;

        tree.progress += rate * conditions.weather_mult * conditions.difficulty_growth_mult *
                         structure_mult * fertilized_mult * species_bonus * dt;
        tree.total_growth_time += dt;

        // A long tick may cross several stages
        while (tree.progress >= 1.0 && tree.stage < MAX_STAGE) {
            tree.progress -= 1.0;
            tree.stage += 1;
            tree.watered = false;
            tree.fertilized = false;
            log(LogLevel::Debug, "Tree {} ({}) advanced to {}",
                static_cast<uint32_t>(entity), tree.species_id, tree_stage_name(tree.stage));
        }

        if (tree.stage >= MAX_STAGE) {
            tree.progress = std::min(tree.progress, TERMINAL_PROGRESS_CAP);
        }

        update_visual(world, entity, tree);
    }
}

void growth_system(World& world, double dt, Season season, double weather_mult) {
    GrowthConditions conditions;
    conditions.season = season;
    conditions.weather_mult = weather_mult;
    growth_system(world, dt, conditions);
}

} // namespace arbor::lifecycle
