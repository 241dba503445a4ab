#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <arbor/lifecycle/lifecycle_systems.hpp>
#include <arbor/lifecycle/tree_actions.hpp>

using namespace arbor::lifecycle;
using namespace arbor::scene;
using arbor::catalog::ResourceType;
using arbor::catalog::SpeciesCatalog;
using arbor::catalog::SpeciesData;
using arbor::environment::Season;
using arbor::environment::WeatherType;
using Catch::Matchers::WithinAbs;

TEST_CASE("LifecycleConditions resolves modifiers", "[lifecycle][systems]") {
    LifecycleConditions conditions;

    SECTION("Defaults are neutral") {
        GrowthConditions growth = conditions.growth();
        REQUIRE(growth.season == Season::Summer);
        REQUIRE_THAT(growth.weather_mult, WithinAbs(1.0, 1e-12));
        REQUIRE_THAT(growth.difficulty_growth_mult, WithinAbs(1.0, 1e-12));
        REQUIRE_THAT(conditions.harvest().difficulty_yield_mult, WithinAbs(1.0, 1e-12));
    }

    SECTION("Weather and difficulty tier") {
        conditions.season = Season::Autumn;
        conditions.weather = WeatherType::Drought;
        conditions.difficulty = "explore";

        GrowthConditions growth = conditions.growth();
        REQUIRE(growth.season == Season::Autumn);
        REQUIRE_THAT(growth.weather_mult, WithinAbs(0.5, 1e-12));
        REQUIRE_THAT(growth.difficulty_growth_mult, WithinAbs(1.3, 1e-12));

        HarvestConditions harvest = conditions.harvest();
        REQUIRE(harvest.season == Season::Autumn);
        REQUIRE_THAT(harvest.difficulty_yield_mult, WithinAbs(1.3, 1e-12));
    }

    SECTION("Unknown difficulty acts as normal") {
        conditions.difficulty = "nightmare";
        REQUIRE_THAT(conditions.growth().difficulty_growth_mult, WithinAbs(1.0, 1e-12));
        REQUIRE_THAT(conditions.harvest().difficulty_yield_mult, WithinAbs(1.0, 1e-12));
    }
}

TEST_CASE("Lifecycle systems registration", "[lifecycle][systems]") {
    Scheduler scheduler;
    LifecycleConditions conditions;
    register_lifecycle_systems(scheduler, conditions);

    REQUIRE(scheduler.size(Phase::FixedUpdate) == 3);
    REQUIRE(scheduler.contains("lifecycle.growth"));
    REQUIRE(scheduler.contains("lifecycle.attach"));
    REQUIRE(scheduler.contains("lifecycle.harvest"));
    REQUIRE(scheduler.size(Phase::Update) == 0);
}

TEST_CASE("Lifecycle tick grows, attaches and readies in order", "[lifecycle][systems]") {
    World world;
    Scheduler scheduler;
    LifecycleConditions conditions;
    conditions.season = Season::Spring;
    register_lifecycle_systems(scheduler, conditions);

    Entity oak = spawn_tree(world, "white-oak", {0, 0}, TreeStage::Sapling, 0.99);

    scheduler.run(world, 1.0, Phase::FixedUpdate);
    REQUIRE(world.get<TreeComponent>(oak).stage == TreeStage::Mature);
    REQUIRE(world.has<Harvestable>(oak));
    REQUIRE_FALSE(world.get<Harvestable>(oak).ready);

    scheduler.run(world, 50.0, Phase::FixedUpdate);
    REQUIRE(world.get<TreeComponent>(oak).stage == TreeStage::OldGrowth);
    REQUIRE(world.get<Harvestable>(oak).attached_stage == TreeStage::OldGrowth);
    REQUIRE(world.get<Harvestable>(oak).ready);

    auto yields = collect_harvest(world, oak, conditions.harvest());
    REQUIRE(yields.has_value());
    REQUIRE((*yields)[0].amount == 3);   // ceil(2 * 1.5)
}

TEST_CASE("Lifecycle systems read conditions by reference", "[lifecycle][systems]") {
    World world;
    Scheduler scheduler;
    LifecycleConditions conditions;
    register_lifecycle_systems(scheduler, conditions);

    Entity oak = spawn_tree(world, "white-oak", {0, 0});

    conditions.season = Season::Winter;
    scheduler.run(world, 5.0, Phase::FixedUpdate);
    REQUIRE_THAT(world.get<TreeComponent>(oak).progress, WithinAbs(0.0, 1e-12));

    conditions.season = Season::Summer;
    conditions.weather = WeatherType::Rain;
    scheduler.run(world, 1.0, Phase::FixedUpdate);
    REQUIRE_THAT(world.get<TreeComponent>(oak).progress, WithinAbs(0.13, 1e-9));

    scheduler.set_enabled("lifecycle.growth", false);
    scheduler.run(world, 1.0, Phase::FixedUpdate);
    REQUIRE_THAT(world.get<TreeComponent>(oak).progress, WithinAbs(0.13, 1e-9));
}

TEST_CASE("Planted tree from seed to harvest", "[lifecycle][scenario]") {
    SpeciesCatalog catalog;
    SpeciesData species;
    species.id = "test-oak";
    species.name = "Test Oak";
    species.difficulty = 1;
    species.base_growth_times = {15, 20, 25, 30, 35};
    species.yields = {{ResourceType::Timber, 2}, {ResourceType::Sap, 1}};
    species.harvest_cycle_sec = 45;
    REQUIRE(catalog.add(species));

    World world;
    spawn_grid_cell(world, {0, 0}, CellType::Soil);
    Entity tree = plant_tree(world, "test-oak", {0, 0}, catalog);
    REQUIRE(tree != NullEntity);

    GrowthConditions summer;
    summer.season = Season::Summer;
    growth_system(world, 0.5, summer, catalog);

    auto& component = world.get<TreeComponent>(tree);
    REQUIRE(component.stage == TreeStage::Seed);
    REQUIRE(component.progress > 0.0);
    REQUIRE_THAT(component.progress, WithinAbs(0.5 / 15.0, 1e-9));

    component.stage = TreeStage::Mature;
    component.progress = 0.99;
    GrowthConditions spring;
    spring.season = Season::Spring;
    growth_system(world, 100.0, spring, catalog);

    REQUIRE(component.stage == TreeStage::OldGrowth);
    REQUIRE(component.progress <= 0.99);

    attach_harvestables(world, catalog);
    REQUIRE(world.has<Harvestable>(tree));

    harvest_system(world, 20.0);
    REQUIRE_FALSE(collect_harvest(world, tree).has_value());
    harvest_system(world, 30.0);

    auto yields = collect_harvest(world, tree);
    REQUIRE(yields.has_value());
    REQUIRE(yields->size() == 2);
    REQUIRE((*yields)[0].type == ResourceType::Timber);
    REQUIRE((*yields)[0].amount == 3);   // ceil(2 * 1.5)
    REQUIRE((*yields)[1].amount == 2);   // ceil(1 * 1.5)
}
