/**
 * @file CollisionSystem.hpp
 * @brief Collision orchestrator: terrain octree, dynamic hash grid and the
 *        queries the game loop runs against them every tick.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#ifndef SKY_PHYSICS_COLLISIONSYSTEM_HPP
    #define SKY_PHYSICS_COLLISIONSYSTEM_HPP

#include <sky/physics/CollisionConfig.hpp>
#include <sky/physics/CollisionResult.hpp>
#include <sky/physics/Entity.hpp>
#include <sky/physics/Octree.hpp>
#include <sky/physics/SpatialHashGrid.hpp>
#include <sky/physics/TerrainChunk.hpp>
#include <sky/math/Ray.hpp>
#include <sky/core/Expected.hpp>
#include <sky/core/NonCopyable.hpp>

#include <limits>
#include <memory>
#include <optional>
#include <unordered_map>
#include <vector>

namespace sky::physics {

/**
 * @class CollisionSystem
 * @brief Owns both spatial indices and the id → record registries.
 *
 * Terrain is append-only and indexed in the octree. Every other entity type
 * is indexed in the hash grid and refreshed through updateObject() each
 * tick. Single-threaded: callers serialise access to one instance.
 */
class CollisionSystem final : public core::NonCopyable<CollisionSystem>
{
public:
    using CollisionMap = std::unordered_map<core::EntityId, std::vector<CollisionResult>>;

    explicit CollisionSystem(CollisionConfig config = {});
    ~CollisionSystem();

    CollisionSystem(CollisionSystem&&) noexcept;
    CollisionSystem& operator=(CollisionSystem&&) noexcept;

    /**
     * @brief Registers a static terrain chunk.
     * @return kAlreadyExists when the id is already tracked, kInvalidArgument
     *         when the chunk fails validateTerrainChunk().
     */
    [[nodiscard]] core::ExpectedVoid addTerrainChunk(TerrainChunk chunk);

    /**
     * @brief Inserts or refreshes a dynamic entity from its snapshot.
     *
     * Nothing is mutated when an error is returned.
     *
     * @return kInvalidArgument when the snapshot does not resolve,
     *         kInvalidState when the id belongs to a terrain chunk,
     *         kOutOfRange when the bounds do not fit the hash grid.
     */
    [[nodiscard]] core::ExpectedVoid updateObject(const EntityDesc& desc);

    /** @brief Drops a dynamic entity. Unknown ids are ignored, terrain ids are refused. */
    void removeObject(core::EntityId id);

    /**
     * @brief Everything @p id currently collides with.
     * @return Terrain hit first, then the boundary hit, then object hits in
     *         grid order. Empty for unknown ids and terrain.
     */
    [[nodiscard]] std::vector<CollisionResult> checkCollisions(core::EntityId id) const;

    /** @brief checkCollisions() for every dynamic entity with at least one hit. */
    [[nodiscard]] CollisionMap checkAllCollisions() const;

    /** @brief Highest terrain surface at (x, z), 0 when no chunk covers it. */
    [[nodiscard]] core::f32 getHeightAt(core::f32 x, core::f32 z) const;

    /**
     * @brief Closest hit along @p ray strictly nearer than @p maxDistance.
     * @param ray          Any non-zero direction; normalised internally.
     * @param maxDistance  Search range, unbounded by default. An unbounded ray
     *                     is culled to worldSize along its direction.
     * @param allowedTypes Entity types that can be hit.
     */
    [[nodiscard]] std::optional<RaycastHit> raycast(
        const math::Rayf& ray,
        core::f32 maxDistance = std::numeric_limits<core::f32>::infinity(),
        EntityTypeMask allowedTypes = kAllEntityTypes) const;

    /** @brief Empties both indices and both registries. */
    void clear();

    [[nodiscard]] const Entity*       find(core::EntityId id) const;
    [[nodiscard]] const TerrainChunk* findTerrain(core::EntityId id) const;

    [[nodiscard]] core::usize objectCount() const noexcept;
    [[nodiscard]] core::usize terrainCount() const noexcept;

    [[nodiscard]] const CollisionConfig& config() const noexcept;
    [[nodiscard]] const Octree&          terrainIndex() const noexcept;
    [[nodiscard]] const SpatialHashGrid& dynamicIndex() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace sky::physics

#endif // SKY_PHYSICS_COLLISIONSYSTEM_HPP
