#include <arbor/lifecycle/harvest.hpp>
#include <arbor/structures/structure_effects.hpp>
#include <arbor/core/log.hpp>
#include <algorithm>
#include <cmath>
#include <utility>

namespace arbor::lifecycle {

using namespace arbor::scene;
using catalog::ResourceYield;
using core::log;
using core::LogLevel;

namespace {

constexpr double OLD_GROWTH_YIELD_MULT = 1.5;
constexpr double PRUNED_YIELD_MULT = 1.5;

int round_up_yield(int base, double multiplier) {
    if (base <= 0) return 0;
    int amount = static_cast<int>(std::ceil(base * multiplier));
    return std::max(amount, 1);
}

bool boost_applies(const catalog::YieldBoost& boost, const TreeComponent& tree,
                   const HarvestConditions& conditions) {
    switch (boost.condition) {
        case catalog::YieldCondition::OldGrowth:
            return tree.stage >= TreeStage::OldGrowth;
        case catalog::YieldCondition::Autumn:
            return conditions.season == environment::Season::Autumn;
    }
    return false;
}

} // namespace

double YieldMultiplier::for_resource(catalog::ResourceType type) const {
    double mult = common();
    if (species_boost && species_boost->resource == type) {
        mult *= species_boost->multiplier;
    }
    return mult;
}

bool init_harvestable(World& world, Entity entity, const catalog::SpeciesCatalog& species_catalog) {
    const auto* tree = world.try_get<TreeComponent>(entity);
    if (!tree || tree->stage < HARVEST_STAGE) return false;

    const catalog::SpeciesData* species = species_catalog.find(tree->species_id);
    if (!species) return false;

    if (auto* existing = world.try_get<Harvestable>(entity)) {
        existing->resources = species->yields;
        existing->cooldown_total = species->harvest_cycle_sec;
        existing->attached_stage = tree->stage;
        if (existing->cooldown_elapsed >= existing->cooldown_total) {
            existing->ready = true;
        }
        return true;
    }

    Harvestable harvestable;
    harvestable.resources = species->yields;
    harvestable.cooldown_total = species->harvest_cycle_sec;
    harvestable.attached_stage = tree->stage;
    world.emplace<Harvestable>(entity, std::move(harvestable));
    return true;
}

void attach_harvestables(World& world, const catalog::SpeciesCatalog& species_catalog) {
    // Collect first; emplacing while iterating a view is not allowed
    std::vector<Entity> pending;

    auto view = world.view<TreeComponent>();
    for (auto entity : view) {
        const auto& tree = view.get<TreeComponent>(entity);
        if (tree.stage < HARVEST_STAGE) continue;

        const auto* harvestable = world.try_get<Harvestable>(entity);
        if (!harvestable || tree.stage > harvestable->attached_stage) {
            pending.push_back(entity);
        }
    }

    for (auto entity : pending) {
        init_harvestable(world, entity, species_catalog);
    }
}

void attach_harvestable_system(World& world, double /*dt*/) {
    attach_harvestables(world, catalog::get_species_catalog());
}

void harvest_system(World& world, double dt) {
    auto view = world.view<Harvestable>();
    for (auto entity : view) {
        auto& harvestable = view.get<Harvestable>(entity);
        if (harvestable.ready) continue;

        harvestable.cooldown_elapsed += dt;
        if (harvestable.cooldown_elapsed >= harvestable.cooldown_total) {
            harvestable.ready = true;
        }
    }
}

YieldMultiplier harvest_yield_multiplier(const World& world, Entity entity,
                                         const HarvestConditions& conditions) {
    YieldMultiplier mult;
    mult.difficulty = conditions.difficulty_yield_mult;

    const auto* tree = world.try_get<TreeComponent>(entity);
    if (!tree) return mult;

    mult.stage = tree->stage >= TreeStage::OldGrowth ? OLD_GROWTH_YIELD_MULT : 1.0;
    mult.pruned = tree->pruned ? PRUNED_YIELD_MULT : 1.0;

    if (const auto* pos = world.try_get<GridPosition>(entity)) {
        mult.structure = structures::harvest_multiplier(world,
                                                        static_cast<float>(pos->cell.x),
                                                        static_cast<float>(pos->cell.y));
    }

    const auto& traits = catalog::species_traits(tree->species_id);
    if (traits.yield_boost && boost_applies(*traits.yield_boost, *tree, conditions)) {
        mult.species_boost = traits.yield_boost;
    }

    return mult;
}

std::optional<std::vector<ResourceYield>> collect_harvest(World& world, Entity entity,
                                                          const HarvestConditions& conditions) {
    auto* harvestable = world.try_get<Harvestable>(entity);
    if (!harvestable || !harvestable->ready) return std::nullopt;

    YieldMultiplier mult = harvest_yield_multiplier(world, entity, conditions);

    std::vector<ResourceYield> collected;
    collected.reserve(harvestable->resources.size());
    for (const auto& base : harvestable->resources) {
        collected.push_back({base.type, round_up_yield(base.amount, mult.for_resource(base.type))});
    }

    harvestable->ready = false;
    harvestable->cooldown_elapsed = 0.0;

    if (auto* tree = world.try_get<TreeComponent>(entity)) {
        tree->pruned = false;
    }

    log(LogLevel::Debug, "Collected {} resource entries from tree {} (x{:.2f})",
        collected.size(), static_cast<uint32_t>(entity), mult.common());
    return collected;
}

} // namespace arbor::lifecycle
