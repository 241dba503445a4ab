#include <arbor/structures/structure_effects.hpp>
#include <utility>

namespace arbor::structures {

namespace {

double sum_boosts(const scene::World& world, float x, float z, StructureEffectType type) {
    double bonus = 0.0;
    for (const auto& effect : effects_at_position(world, x, z)) {
        if (effect.type == type) {
            bonus += effect.magnitude;
        }
    }
    return 1.0 + bonus;
}

} // namespace

std::vector<StructureEffect> effects_at_position(const scene::World& world, float x, float z) {
    std::vector<StructureEffect> effects;

    auto view = world.view<StructureComponent, WorldPosition>();
    for (auto entity : view) {
        const auto& structure = view.get<StructureComponent>(entity);
        if (!structure.effect) continue;

        const auto& pos = view.get<WorldPosition>(entity);
        float distance = glm::length(Vec2(x, z) - Vec2(pos.x, pos.z));
        if (distance <= structure.effect_radius) {
            effects.push_back({*structure.effect, structure.effect_magnitude});
        }
    }

    return effects;
}

double growth_multiplier(const scene::World& world, float x, float z) {
    return sum_boosts(world, x, z, StructureEffectType::GrowthBoost);
}

double harvest_multiplier(const scene::World& world, float x, float z) {
    return sum_boosts(world, x, z, StructureEffectType::HarvestBoost);
}

scene::Entity place_structure(scene::World& world, StructureComponent structure, float x, float z) {
    scene::Entity e = world.create(structure.template_id);
    world.emplace<WorldPosition>(e, WorldPosition{x, z});
    world.emplace<StructureComponent>(e, std::move(structure));
    return e;
}

} // namespace arbor::structures
