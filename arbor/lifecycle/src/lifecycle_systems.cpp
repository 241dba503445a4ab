#include <arbor/lifecycle/lifecycle_systems.hpp>
#include <arbor/catalog/difficulty.hpp>

namespace arbor::lifecycle {

using namespace arbor::scene;

GrowthConditions LifecycleConditions::growth() const {
    GrowthConditions conditions;
    conditions.season = season;
    conditions.weather_mult = environment::weather_growth_multiplier(weather);
    conditions.difficulty_growth_mult = catalog::difficulty_tier_or_normal(difficulty).growth_speed_mult;
    return conditions;
}

HarvestConditions LifecycleConditions::harvest() const {
    HarvestConditions conditions;
    conditions.season = season;
    conditions.difficulty_yield_mult = catalog::difficulty_tier_or_normal(difficulty).resource_yield_mult;
    return conditions;
}

void register_lifecycle_systems(Scheduler& scheduler, const LifecycleConditions& conditions) {
    scheduler.add(Phase::FixedUpdate,
                  [&conditions](World& world, double dt) {
                      growth_system(world, dt, conditions.growth());
                  },
                  "lifecycle.growth", 10);

    scheduler.add(Phase::FixedUpdate, attach_harvestable_system, "lifecycle.attach", 5);
    scheduler.add(Phase::FixedUpdate, harvest_system, "lifecycle.harvest", 0);
}

} // namespace arbor::lifecycle
