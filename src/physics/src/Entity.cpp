/**
 * @file Entity.cpp
 * @brief Snapshot validation and bounds derivation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <sky/physics/Entity.hpp>

#include <cmath>
#include <format>

namespace sky::physics {

namespace {

[[nodiscard]] bool isFinite(const math::Vec3f& v) noexcept
{
    return std::isfinite(v.x) && std::isfinite(v.y) && std::isfinite(v.z);
}

} // namespace

core::Expected<Entity> resolveEntity(const EntityDesc& desc)
{
    if (desc.type == EntityType::kTerrain)
    {
        return core::makeError(core::ErrorCode::kInvalidArgument,
            std::format("entity {}: terrain must be added as a terrain chunk", desc.id));
    }

    Entity entity;
    entity.id   = desc.id;
    entity.type = desc.type;

    if (desc.bounds)
    {
        const math::AABBf& b = *desc.bounds;
        if (!isFinite(b.min) || !isFinite(b.max) || !b.isValid())
        {
            return core::makeError(core::ErrorCode::kInvalidArgument,
                std::format("entity {}: bounds are inverted or not finite", desc.id));
        }
        entity.bounds     = b;
        entity.position   = desc.position.value_or(b.center());
        entity.dimensions = desc.dimensions.value_or(b.size());
    }
    else
    {
        if (!desc.position || !desc.dimensions)
        {
            return core::makeError(core::ErrorCode::kInvalidArgument,
                std::format("entity {}: needs bounds or position and dimensions", desc.id));
        }
        entity.position   = *desc.position;
        entity.dimensions = *desc.dimensions;
        entity.bounds     = math::AABBf::fromCenterExtents(entity.position, entity.dimensions);
    }

    if (!isFinite(entity.position) || !isFinite(entity.dimensions))
    {
        return core::makeError(core::ErrorCode::kInvalidArgument,
            std::format("entity {}: position or dimensions not finite", desc.id));
    }
    if (entity.dimensions.x < 0.0f || entity.dimensions.y < 0.0f || entity.dimensions.z < 0.0f)
    {
        return core::makeError(core::ErrorCode::kInvalidArgument,
            std::format("entity {}: negative dimensions", desc.id));
    }

    return entity;
}

} // namespace sky::physics
