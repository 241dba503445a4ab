#pragma once

#include <glm/glm.hpp>
#include <cstdint>

namespace arbor::core {

// Vector types
using Vec2 = glm::vec2;
using Vec3 = glm::vec3;

// Integer grid coordinate (x, z on the ground plane)
using IVec2 = glm::ivec2;

// Pack a grid coordinate into a single hashable key
inline uint64_t grid_key(const IVec2& cell) {
    return (static_cast<uint64_t>(static_cast<uint32_t>(cell.x)) << 32) |
           static_cast<uint64_t>(static_cast<uint32_t>(cell.y));
}

} // namespace arbor::core
