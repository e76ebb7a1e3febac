/**
 * @file CollisionResult.hpp
 * @brief Records produced by collision and ray queries.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#ifndef SKY_PHYSICS_COLLISIONRESULT_HPP
    #define SKY_PHYSICS_COLLISIONRESULT_HPP

#include <sky/physics/EntityType.hpp>
#include <sky/math/Vec3.hpp>
#include <sky/core/Types.hpp>

#include <variant>

namespace sky::physics {

/** @brief Entity bottom at or below the terrain surface. */
struct TerrainHit
{
    core::EntityId terrainId{0};
    math::Vec3f    position{};
    math::Vec3f    normal{0.0f, 1.0f, 0.0f};
};

/** @brief Bounding spheres of two entities overlap. */
struct ObjectHit
{
    core::EntityId idA{0};
    core::EntityId idB{0};
    math::Vec3f    position{};
    math::Vec3f    normal{};
    core::f32      penetration{0.0f};
};

/** @brief Entity position outside the configured world boundaries. */
struct BoundaryHit
{
    math::Vec3f position{};
    math::Vec3f normal{};
};

using CollisionResult = std::variant<TerrainHit, ObjectHit, BoundaryHit>;

/** @brief Closest ray intersection. */
struct RaycastHit
{
    core::f32      distance{0.0f};
    math::Vec3f    point{};
    math::Vec3f    normal{};
    core::EntityId entity{0};
    EntityType     type{EntityType::kTerrain};
};

} // namespace sky::physics

#endif // SKY_PHYSICS_COLLISIONRESULT_HPP
