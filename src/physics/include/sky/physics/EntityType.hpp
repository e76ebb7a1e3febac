/**
 * @file EntityType.hpp
 * @brief Kinds of simulated entities and bit masks over them.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#ifndef SKY_PHYSICS_ENTITYTYPE_HPP
    #define SKY_PHYSICS_ENTITYTYPE_HPP

#include <sky/core/Types.hpp>

#include <array>
#include <initializer_list>
#include <string_view>

namespace sky::physics {

/**
 * @enum EntityType
 * @brief Collision category of an entity.
 *
 * Terrain lives in the octree; every other kind lives in the hash grid.
 */
enum class EntityType : core::u8 {
    kTerrain = 0,
    kAircraft,
    kProjectile,
    kStaticObject,
    kPickup,
};

inline constexpr core::usize kEntityTypeCount = 5;

inline constexpr std::array<EntityType, kEntityTypeCount> kAllEntityTypeList = {
    EntityType::kTerrain,
    EntityType::kAircraft,
    EntityType::kProjectile,
    EntityType::kStaticObject,
    EntityType::kPickup,
};

/** @brief Set of entity types, one bit per EntityType. */
using EntityTypeMask = core::u8;

[[nodiscard]] constexpr EntityTypeMask maskOf(EntityType type) noexcept
{
    return static_cast<EntityTypeMask>(1u << static_cast<core::u8>(type));
}

[[nodiscard]] constexpr EntityTypeMask maskOf(std::initializer_list<EntityType> types) noexcept
{
    EntityTypeMask mask = 0;
    for (EntityType t : types)
        mask = static_cast<EntityTypeMask>(mask | maskOf(t));
    return mask;
}

[[nodiscard]] constexpr bool hasType(EntityTypeMask mask, EntityType type) noexcept
{
    return (mask & maskOf(type)) != 0;
}

inline constexpr EntityTypeMask kNoEntityTypes  = 0;
inline constexpr EntityTypeMask kAllEntityTypes = maskOf({
    EntityType::kTerrain, EntityType::kAircraft, EntityType::kProjectile,
    EntityType::kStaticObject, EntityType::kPickup});

[[nodiscard]] constexpr std::string_view toString(EntityType type) noexcept
{
    switch (type)
    {
    case EntityType::kTerrain:      return "Terrain";
    case EntityType::kAircraft:     return "Aircraft";
    case EntityType::kProjectile:   return "Projectile";
    case EntityType::kStaticObject: return "StaticObject";
    case EntityType::kPickup:       return "Pickup";
    }
    return "Unknown";
}

} // namespace sky::physics

#endif // SKY_PHYSICS_ENTITYTYPE_HPP
