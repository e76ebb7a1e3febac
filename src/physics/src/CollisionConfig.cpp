/**
 * @file CollisionConfig.cpp
 * @brief CollisionConfig::Builder implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <sky/physics/CollisionConfig.hpp>

#include <cmath>
#include <format>

namespace sky::physics {

CollisionConfig::Builder& CollisionConfig::Builder::worldSize(core::f32 size) noexcept
{
    _worldSize = size;
    return *this;
}

CollisionConfig::Builder& CollisionConfig::Builder::terrainMaxDepth(core::u32 depth) noexcept
{
    _terrainMaxDepth = depth;
    return *this;
}

CollisionConfig::Builder& CollisionConfig::Builder::maxObjectsPerLeaf(core::u32 n) noexcept
{
    _maxObjectsPerLeaf = n;
    return *this;
}

CollisionConfig::Builder& CollisionConfig::Builder::cellSize(core::f32 size) noexcept
{
    _cellSize = size;
    return *this;
}

CollisionConfig::Builder& CollisionConfig::Builder::collisionGroups(const CollisionGroups& groups) noexcept
{
    _collisionGroups = groups;
    return *this;
}

CollisionConfig::Builder& CollisionConfig::Builder::worldBoundaries(const math::AABBf& boundaries) noexcept
{
    _worldBoundaries = boundaries;
    return *this;
}

core::Expected<CollisionConfig> CollisionConfig::Builder::build() const
{
    if (!(_worldSize > 0.0f) || !std::isfinite(_worldSize))
    {
        return core::makeError(core::ErrorCode::kInvalidArgument,
            std::format("config: world size must be positive, got {}", _worldSize));
    }
    if (!(_cellSize > 0.0f) || !std::isfinite(_cellSize))
    {
        return core::makeError(core::ErrorCode::kInvalidArgument,
            std::format("config: cell size must be positive, got {}", _cellSize));
    }
    if (_maxObjectsPerLeaf == 0)
    {
        return core::makeError(core::ErrorCode::kInvalidArgument, "config: leaf capacity must be at least 1");
    }
    if (_worldBoundaries && !_worldBoundaries->isValid())
    {
        return core::makeError(core::ErrorCode::kInvalidArgument, "config: world boundaries are inverted");
    }

    CollisionConfig cfg;
    cfg._worldSize         = _worldSize;
    cfg._terrainMaxDepth   = _terrainMaxDepth;
    cfg._maxObjectsPerLeaf = _maxObjectsPerLeaf;
    cfg._cellSize          = _cellSize;
    cfg._collisionGroups   = _collisionGroups;
    cfg._worldBoundaries   = _worldBoundaries;
    return cfg;
}

math::AABBf CollisionConfig::worldBounds() const noexcept
{
    const core::f32 half = _worldSize / 2.0f;
    return {math::Vec3f{-half, -half, -half}, math::Vec3f{half, half, half}};
}

} // namespace sky::physics
