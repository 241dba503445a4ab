#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <arbor/lifecycle/offline_growth.hpp>
#include <arbor/lifecycle/growth.hpp>
#include <arbor/lifecycle/tree_actions.hpp>

using namespace arbor::lifecycle;
using namespace arbor::scene;
using arbor::catalog::SpeciesCatalog;
using arbor::catalog::SpeciesData;
using arbor::environment::Season;
using Catch::Matchers::WithinAbs;

namespace {

SpeciesData slow_species() {
    SpeciesData s;
    s.id = "slow-yew";
    s.name = "Slow Yew";
    s.difficulty = 5;
    s.base_growth_times = {30000, 40000, 50000, 60000, 70000};
    s.yields = {{arbor::catalog::ResourceType::Timber, 1}};
    s.harvest_cycle_sec = 300;
    return s;
}

const SpeciesData& white_oak() {
    return *arbor::catalog::get_species_catalog().find("white-oak");
}

OfflineTreeState seed(const std::string& species_id) {
    OfflineTreeState state;
    state.species_id = species_id;
    return state;
}

} // namespace

TEST_CASE("Offline growth within a stage", "[lifecycle][offline]") {
    OfflineTreeState tree = seed("white-oak");
    tree.progress = 0.2;
    tree.watered = true;

    auto result = calculate_offline_growth(tree, 5.0, white_oak());

    REQUIRE(result.stage == TreeStage::Seed);
    REQUIRE_THAT(result.progress, WithinAbs(0.7, 1e-9));
    REQUIRE_FALSE(result.watered);
}

TEST_CASE("Offline growth crosses several stages", "[lifecycle][offline]") {
    // 10s + 15s + 15s of the 20s Sapling stage
    auto result = calculate_offline_growth(seed("white-oak"), 40.0, white_oak());

    REQUIRE(result.stage == TreeStage::Sapling);
    REQUIRE_THAT(result.progress, WithinAbs(0.75, 1e-9));
}

TEST_CASE("Offline growth to the terminal stage", "[lifecycle][offline]") {
    auto result = calculate_offline_growth(seed("white-oak"), 3600.0, white_oak());
    REQUIRE(result.stage == TreeStage::OldGrowth);
    REQUIRE(result.progress <= 0.99);

    OfflineTreeState old = seed("white-oak");
    old.stage = TreeStage::OldGrowth;
    old.progress = 1.0;
    auto clamped = calculate_offline_growth(old, 100.0, white_oak());
    REQUIRE(clamped.stage == TreeStage::OldGrowth);
    REQUIRE_THAT(clamped.progress, WithinAbs(0.99, 1e-12));
}

TEST_CASE("Offline time is capped at 24 hours", "[lifecycle][offline]") {
    SpeciesData yew = slow_species();

    auto capped = calculate_offline_growth(seed("slow-yew"), 86400.0, yew);
    auto over = calculate_offline_growth(seed("slow-yew"), 500000.0, yew);

    // 75000s fills the Seed stage, 11400 of 100000s into Sprout
    REQUIRE(capped.stage == TreeStage::Sprout);
    REQUIRE_THAT(capped.progress, WithinAbs(0.114, 1e-9));
    REQUIRE(over.stage == capped.stage);
    REQUIRE_THAT(over.progress, WithinAbs(capped.progress, 1e-12));

    SECTION("A configured cap can tighten the limit") {
        OfflineGrowthOptions options;
        options.cap_seconds = 3600.0;
        auto tight = calculate_offline_growth(seed("slow-yew"), 86400.0, yew, options);
        REQUIRE(tight.stage == TreeStage::Seed);
        REQUIRE_THAT(tight.progress, WithinAbs(3600.0 / 75000.0, 1e-9));
    }

    SECTION("A configured cap cannot loosen it") {
        OfflineGrowthOptions options;
        options.cap_seconds = 200000.0;
        auto loose = calculate_offline_growth(seed("slow-yew"), 200000.0, yew, options);
        REQUIRE(loose.stage == capped.stage);
        REQUIRE_THAT(loose.progress, WithinAbs(capped.progress, 1e-12));
    }
}

TEST_CASE("Offline growth edge cases", "[lifecycle][offline]") {
    SECTION("Negative elapsed time does nothing") {
        OfflineTreeState tree = seed("white-oak");
        tree.progress = 0.3;
        auto result = calculate_offline_growth(tree, -50.0, white_oak());
        REQUIRE(result.stage == TreeStage::Seed);
        REQUIRE_THAT(result.progress, WithinAbs(0.3, 1e-12));
    }

    SECTION("Missing base time freezes the tree") {
        SpeciesData stunted = white_oak();
        stunted.base_growth_times = {10, 0, 0, 0, 0};
        auto result = calculate_offline_growth(seed("white-oak"), 1000.0, stunted);
        REQUIRE(result.stage == TreeStage::Sprout);
        REQUIRE_THAT(result.progress, WithinAbs(0.0, 1e-12));
    }

    SECTION("Difficulty growth scalar") {
        OfflineGrowthOptions options;
        options.growth_scalar = 1.3;
        auto result = calculate_offline_growth(seed("white-oak"), 5.0, white_oak(), options);
        REQUIRE_THAT(result.progress, WithinAbs(0.65, 1e-9));
    }
}

TEST_CASE("Batch offline growth", "[lifecycle][offline]") {
    std::vector<OfflineTreeState> trees;
    trees.push_back(seed("white-oak"));
    OfflineTreeState lost = seed("no-such-tree");
    lost.stage = TreeStage::Sapling;
    lost.progress = 0.4;
    lost.watered = true;
    trees.push_back(lost);
    trees.push_back(seed("redwood"));

    auto results = calculate_all_offline_growth(trees, 5.0, arbor::catalog::get_species_catalog());

    REQUIRE(results.size() == 3);
    REQUIRE_THAT(results[0].progress, WithinAbs(0.5, 1e-9));
    REQUIRE(results[1].stage == TreeStage::Sapling);
    REQUIRE_THAT(results[1].progress, WithinAbs(0.4, 1e-12));
    REQUIRE_FALSE(results[1].watered);
    REQUIRE_THAT(results[2].progress, WithinAbs(5.0 / (20.0 * 2.0), 1e-9));
}

TEST_CASE("Offline growth applied to the world", "[lifecycle][offline]") {
    World world;
    Entity oak = spawn_tree(world, "white-oak", {0, 0});
    Entity redwood = spawn_tree(world, "redwood", {4, 0});
    world.get<TreeComponent>(oak).watered = true;
    world.get<TreeComponent>(oak).fertilized = true;

    size_t advanced = apply_offline_growth(world, 12.0, arbor::catalog::get_species_catalog());

    REQUIRE(advanced == 1);

    const auto& oak_tree = world.get<TreeComponent>(oak);
    REQUIRE(oak_tree.stage == TreeStage::Sprout);
    REQUIRE_THAT(oak_tree.progress, WithinAbs(2.0 / 15.0, 1e-9));
    REQUIRE_FALSE(oak_tree.watered);
    REQUIRE_FALSE(oak_tree.fertilized);
    REQUIRE_THAT(world.get<TreeVisual>(oak).scale, WithinAbs(stage_scale(1, 2.0 / 15.0), 1e-6));

    REQUIRE(world.get<TreeComponent>(redwood).stage == TreeStage::Seed);
}

TEST_CASE("Per-tick growth converges to offline catch-up", "[lifecycle][offline][consistency]") {
    const double total = 32.0;
    const double dt = 0.01;
    const int steps = static_cast<int>(total / dt + 0.5);

    SECTION("Normal difficulty") {
        World world;
        Entity oak = spawn_tree(world, "white-oak", {0, 0});
        for (int i = 0; i < steps; ++i) {
            growth_system(world, dt, Season::Summer, 1.0);
        }

        auto offline = calculate_offline_growth(seed("white-oak"), total, white_oak());
        const auto& tree = world.get<TreeComponent>(oak);

        // 10s + 15s, then 7 of 20s into Sapling
        REQUIRE(offline.stage == TreeStage::Sapling);
        REQUIRE_THAT(offline.progress, WithinAbs(0.35, 1e-9));
        REQUIRE(tree.stage == offline.stage);
        REQUIRE_THAT(tree.progress, WithinAbs(offline.progress, 0.01));
    }

    SECTION("Brutal difficulty scalar on both paths") {
        World world;
        Entity oak = spawn_tree(world, "white-oak", {0, 0});
        GrowthConditions conditions;
        conditions.difficulty_growth_mult = 0.6;
        for (int i = 0; i < steps; ++i) {
            growth_system(world, dt, conditions);
        }

        OfflineGrowthOptions options;
        options.growth_scalar = 0.6;
        auto offline = calculate_offline_growth(seed("white-oak"), total, white_oak(), options);
        const auto& tree = world.get<TreeComponent>(oak);

        REQUIRE(tree.stage == offline.stage);
        REQUIRE_THAT(tree.progress, WithinAbs(offline.progress, 0.01));
    }
}
