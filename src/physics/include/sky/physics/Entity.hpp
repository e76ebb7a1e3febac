/**
 * @file Entity.hpp
 * @brief Per-tick entity snapshots and the resolved records the indices track.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#ifndef SKY_PHYSICS_ENTITY_HPP
    #define SKY_PHYSICS_ENTITY_HPP

#include <sky/physics/EntityType.hpp>
#include <sky/math/AABB.hpp>
#include <sky/core/Expected.hpp>
#include <sky/core/Types.hpp>

#include <optional>

namespace sky::physics {

/**
 * @struct EntityDesc
 * @brief Snapshot pushed by the game loop for a dynamic entity.
 *
 * Either @c bounds, or both @c position and @c dimensions, must be set.
 */
struct EntityDesc
{
    core::EntityId                  id{0};
    EntityType                      type{EntityType::kAircraft};
    std::optional<math::Vec3f>      position;
    std::optional<math::Vec3f>      dimensions;
    std::optional<math::AABBf>      bounds;
};

/**
 * @struct Entity
 * @brief Fully resolved record stored in the collision registry.
 */
struct Entity
{
    core::EntityId id{0};
    EntityType     type{EntityType::kAircraft};
    math::Vec3f    position{};
    math::Vec3f    dimensions{};
    math::AABBf    bounds{};

    /** @brief Bounding-sphere radius: half of the largest dimension. */
    [[nodiscard]] core::f32 boundingRadius() const noexcept { return dimensions.maxComponent() / 2.0f; }

    /** @brief Height of the entity's lowest point. */
    [[nodiscard]] core::f32 bottom() const noexcept { return position.y - dimensions.y / 2.0f; }
};

/**
 * @brief Resolves a snapshot into a record.
 *
 * Missing bounds are derived from position and dimensions. When bounds are
 * supplied, a missing position defaults to their centre and missing
 * dimensions to their extents.
 *
 * @return The record, or kInvalidArgument when the geometry is missing,
 *         inverted or not finite, or when @p desc is typed as terrain.
 */
[[nodiscard]] core::Expected<Entity> resolveEntity(const EntityDesc& desc);

} // namespace sky::physics

#endif // SKY_PHYSICS_ENTITY_HPP
