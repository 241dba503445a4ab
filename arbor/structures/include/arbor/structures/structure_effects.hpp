#pragma once

#include <arbor/core/math.hpp>
#include <arbor/scene/world.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace arbor::structures {

using namespace arbor::core;

enum class StructureEffectType : uint8_t {
    GrowthBoost,    // Speeds up tree growth in range
    HarvestBoost,   // Increases harvest yields in range
    StaminaRegen,
    Storage
};

// Ground-plane position of a placed structure
struct WorldPosition {
    float x = 0.0f;
    float z = 0.0f;
};

// A placed structure. Structures without an effect never show up in queries.
struct StructureComponent {
    std::string template_id;
    std::optional<StructureEffectType> effect;
    float effect_radius = 0.0f;
    double effect_magnitude = 0.0;
};

struct StructureEffect {
    StructureEffectType type;
    double magnitude;
};

// Every effect whose radius covers (x, z), by Euclidean distance (inclusive)
std::vector<StructureEffect> effects_at_position(const scene::World& world, float x, float z);

// 1 + sum of growth-boost magnitudes in range; 1.0 with none
double growth_multiplier(const scene::World& world, float x, float z);

// 1 + sum of harvest-boost magnitudes in range; 1.0 with none
double harvest_multiplier(const scene::World& world, float x, float z);

// Convenience for spawning a structure entity
scene::Entity place_structure(scene::World& world, StructureComponent structure, float x, float z);

} // namespace arbor::structures
