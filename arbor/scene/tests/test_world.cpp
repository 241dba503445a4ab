#include <catch2/catch_test_macros.hpp>
#include <arbor/scene/world.hpp>

using namespace arbor::scene;

// Test components
struct TestCell {
    int x = 0;
    int z = 0;
};

struct TestGrowth {
    double progress = 0.0;
};

TEST_CASE("World construction", "[scene][world]") {
    World world;
    REQUIRE(world.empty());
    REQUIRE(world.size() == 0);
}

TEST_CASE("World entity creation", "[scene][world]") {
    World world;

    SECTION("Create entity") {
        Entity e = world.create();
        REQUIRE(world.valid(e));
        REQUIRE(world.size() == 1);
        REQUIRE(world.get<EntityInfo>(e).uuid == 1);
    }

    SECTION("Create named entity") {
        Entity e = world.create("Oak");
        REQUIRE(world.valid(e));
        REQUIRE(world.find_by_name("Oak") == e);
        REQUIRE(world.find_by_name("Pine") == NullEntity);
    }

    SECTION("Uuids are unique") {
        Entity e1 = world.create();
        Entity e2 = world.create();
        REQUIRE(e1 != e2);
        REQUIRE(world.get<EntityInfo>(e1).uuid != world.get<EntityInfo>(e2).uuid);
        REQUIRE(world.size() == 2);
    }
}

TEST_CASE("World entity destruction", "[scene][world]") {
    World world;
    Entity e = world.create();
    world.emplace<TestCell>(e, 1, 2);

    world.destroy(e);
    REQUIRE_FALSE(world.valid(e));
    REQUIRE(world.size() == 0);

    // Destroying twice is a no-op
    world.destroy(e);
    REQUIRE(world.empty());
}

TEST_CASE("World component management", "[scene][world]") {
    World world;
    Entity e = world.create();

    SECTION("Emplace and get") {
        auto& cell = world.emplace<TestCell>(e, 3, 4);
        REQUIRE(cell.x == 3);
        REQUIRE(world.get<TestCell>(e).z == 4);
    }

    SECTION("Emplace replaces existing") {
        world.emplace<TestCell>(e, 1, 1);
        world.emplace<TestCell>(e, 7, 8);
        REQUIRE(world.get<TestCell>(e).x == 7);
    }

    SECTION("Try get") {
        REQUIRE(world.try_get<TestGrowth>(e) == nullptr);
        world.emplace<TestGrowth>(e);
        REQUIRE(world.try_get<TestGrowth>(e) != nullptr);
    }

    SECTION("Has and remove") {
        world.emplace<TestGrowth>(e);
        REQUIRE(world.has<TestGrowth>(e));
        world.remove<TestGrowth>(e);
        REQUIRE_FALSE(world.has<TestGrowth>(e));
    }
}

TEST_CASE("World views", "[scene][world]") {
    World world;

    Entity e1 = world.create();
    world.emplace<TestCell>(e1, 0, 0);
    world.emplace<TestGrowth>(e1);

    Entity e2 = world.create();
    world.emplace<TestCell>(e2, 1, 0);

    int cells = 0;
    for (auto entity : world.view<TestCell>()) {
        (void)entity;
        cells++;
    }
    REQUIRE(cells == 2);

    int growing = 0;
    for (auto entity : world.view<TestCell, TestGrowth>()) {
        REQUIRE(entity == e1);
        growing++;
    }
    REQUIRE(growing == 1);
}

TEST_CASE("World clear", "[scene][world]") {
    World world;
    world.create();
    world.create();
    world.clear();

    REQUIRE(world.empty());
    Entity e = world.create();
    REQUIRE(world.get<EntityInfo>(e).uuid == 1);
}
