/**
 * @file CollisionConfig.hpp
 * @brief Collision subsystem configuration (Builder pattern).
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef SKY_PHYSICS_COLLISIONCONFIG_HPP
    #define SKY_PHYSICS_COLLISIONCONFIG_HPP

#include <sky/physics/CollisionGroups.hpp>
#include <sky/math/AABB.hpp>
#include <sky/core/Constants.hpp>
#include <sky/core/Expected.hpp>
#include <sky/core/Types.hpp>

#include <optional>

namespace sky::physics {

/** @brief Immutable collision configuration. */
class CollisionConfig
{
public:
    /** @brief Fluent builder for CollisionConfig. */
    class Builder
    {
    public:
        Builder& worldSize(core::f32 size) noexcept;
        Builder& terrainMaxDepth(core::u32 depth) noexcept;
        Builder& maxObjectsPerLeaf(core::u32 n) noexcept;
        Builder& cellSize(core::f32 size) noexcept;
        Builder& collisionGroups(const CollisionGroups& groups) noexcept;
        Builder& worldBoundaries(const math::AABBf& boundaries) noexcept;

        /**
         * @return kInvalidArgument for a non-positive world or cell size, a
         *         zero leaf capacity, or inverted world boundaries.
         */
        [[nodiscard]] core::Expected<CollisionConfig> build() const;

    private:
        core::f32                  _worldSize{core::kWorldSize};
        core::u32                  _terrainMaxDepth{core::kOctreeMaxDepth};
        core::u32                  _maxObjectsPerLeaf{core::kOctreeLeafCapacity};
        core::f32                  _cellSize{core::kGridCellSize};
        CollisionGroups            _collisionGroups{CollisionGroups::defaults()};
        std::optional<math::AABBf> _worldBoundaries;
    };

    [[nodiscard]] core::f32              worldSize()         const noexcept { return _worldSize; }
    [[nodiscard]] core::u32              terrainMaxDepth()   const noexcept { return _terrainMaxDepth; }
    [[nodiscard]] core::u32              maxObjectsPerLeaf() const noexcept { return _maxObjectsPerLeaf; }
    [[nodiscard]] core::f32              cellSize()          const noexcept { return _cellSize; }
    [[nodiscard]] const CollisionGroups& collisionGroups()   const noexcept { return _collisionGroups; }
    [[nodiscard]] const std::optional<math::AABBf>& worldBoundaries() const noexcept { return _worldBoundaries; }

    /** @brief Cube of side worldSize centred on the origin: the octree root. */
    [[nodiscard]] math::AABBf worldBounds() const noexcept;

private:
    friend class Builder;

    core::f32                  _worldSize{core::kWorldSize};
    core::u32                  _terrainMaxDepth{core::kOctreeMaxDepth};
    core::u32                  _maxObjectsPerLeaf{core::kOctreeLeafCapacity};
    core::f32                  _cellSize{core::kGridCellSize};
    CollisionGroups            _collisionGroups{CollisionGroups::defaults()};
    std::optional<math::AABBf> _worldBoundaries;
};

} // namespace sky::physics

#endif // SKY_PHYSICS_COLLISIONCONFIG_HPP
