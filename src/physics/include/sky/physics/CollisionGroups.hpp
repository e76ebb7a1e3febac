/**
 * @file CollisionGroups.hpp
 * @brief Directed table of which entity types each type is tested against.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#ifndef SKY_PHYSICS_COLLISIONGROUPS_HPP
    #define SKY_PHYSICS_COLLISIONGROUPS_HPP

#include <sky/physics/EntityType.hpp>

#include <array>

namespace sky::physics {

/**
 * @class CollisionGroups
 * @brief type → mask of target types. The table is directed: A listing B
 *        does not imply B lists A.
 */
class CollisionGroups
{
public:
    /** @brief Table in which no type collides with anything. */
    constexpr CollisionGroups() = default;

    /**
     * @brief Flight-sim defaults.
     *
     * Aircraft hit everything, projectiles hit terrain, aircraft and static
     * objects, static objects report aircraft and projectiles, pickups
     * report aircraft. Terrain is never a subject.
     */
    [[nodiscard]] static constexpr CollisionGroups defaults() noexcept
    {
        CollisionGroups groups;
        groups.set(EntityType::kAircraft, maskOf({EntityType::kTerrain, EntityType::kAircraft,
                                                  EntityType::kProjectile, EntityType::kStaticObject,
                                                  EntityType::kPickup}));
        groups.set(EntityType::kProjectile, maskOf({EntityType::kTerrain, EntityType::kAircraft,
                                                    EntityType::kStaticObject}));
        groups.set(EntityType::kStaticObject, maskOf({EntityType::kAircraft, EntityType::kProjectile}));
        groups.set(EntityType::kPickup, maskOf(EntityType::kAircraft));
        return groups;
    }

    constexpr CollisionGroups& set(EntityType subject, EntityTypeMask targets) noexcept
    {
        _table[static_cast<core::usize>(subject)] = targets;
        return *this;
    }

    [[nodiscard]] constexpr EntityTypeMask allowed(EntityType subject) const noexcept
    {
        return _table[static_cast<core::usize>(subject)];
    }

    [[nodiscard]] constexpr bool canCollide(EntityType subject, EntityType target) const noexcept
    {
        return hasType(allowed(subject), target);
    }

    [[nodiscard]] constexpr bool operator==(const CollisionGroups&) const = default;

private:
    std::array<EntityTypeMask, kEntityTypeCount> _table{};
};

} // namespace sky::physics

#endif // SKY_PHYSICS_COLLISIONGROUPS_HPP
