#pragma once

#include <arbor/catalog/resources.hpp>
#include <arbor/core/math.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace arbor::lifecycle {

using namespace arbor::core;

// Lifecycle stages. Stage only ever increases; OldGrowth is terminal.
namespace TreeStage {
    constexpr int Seed = 0;
    constexpr int Sprout = 1;
    constexpr int Sapling = 2;
    constexpr int Mature = 3;
    constexpr int OldGrowth = 4;
}

constexpr int MAX_STAGE = TreeStage::OldGrowth;

// Stage at which a tree starts producing harvests
constexpr int HARVEST_STAGE = TreeStage::Mature;

// Highest progress a terminal-stage tree reports
constexpr double TERMINAL_PROGRESS_CAP = 0.99;

const char* tree_stage_name(int stage);

struct TreeComponent {
    std::string species_id;
    int stage = TreeStage::Seed;
    double progress = 0.0;              // [0, 1) below terminal, <= 0.99 at terminal
    bool watered = false;               // Cleared on stage advance
    bool fertilized = false;            // Doubles growth until the next stage advance
    bool pruned = false;                // Consumed by the next harvest collection
    double total_growth_time = 0.0;     // Seconds advanced, diagnostic
};

// Integer grid cell a tree occupies (x, z)
struct GridPosition {
    IVec2 cell{0, 0};
};

enum class CellType : uint8_t {
    Soil,
    Water,
    Rock,
    Path
};

struct GridCell {
    IVec2 cell{0, 0};
    CellType type = CellType::Soil;
    bool occupied = false;
};

// Harvest facet. `resources` holds the species' base yield, never multiplied in place.
struct Harvestable {
    std::vector<catalog::ResourceYield> resources;
    double cooldown_elapsed = 0.0;
    double cooldown_total = 0.0;
    bool ready = false;
    int attached_stage = HARVEST_STAGE;
};

struct TreeVisual {
    float scale = 0.08f;
};

} // namespace arbor::lifecycle
