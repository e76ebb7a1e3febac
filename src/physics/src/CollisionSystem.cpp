/**
 * @file CollisionSystem.cpp
 * @brief Broad phase (octree + hash grid), narrow phase and queries.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <sky/physics/CollisionSystem.hpp>
#include <sky/physics/CollisionDetector.hpp>
#include <sky/core/Constants.hpp>
#include <sky/core/Expected.hpp>
#include <sky/core/Log.hpp>

#include <algorithm>
#include <cmath>
#include <format>
#include <unordered_set>

namespace sky::physics {

namespace {

constexpr const char* kTag = "physics";

[[nodiscard]] std::optional<BoundaryHit> testBoundary(const math::Vec3f& p, const math::AABBf& limits)
{
    if (limits.contains(p))
    {
        return std::nullopt;
    }

    BoundaryHit hit{p, math::Vec3f::zero()};

    const auto clampAxis = [](core::f32 v, core::f32 lo, core::f32 hi, core::f32& out, core::f32& n) {
        if (v < lo)      { out = lo; n =  1.0f; }
        else if (v > hi) { out = hi; n = -1.0f; }
    };
    clampAxis(p.x, limits.min.x, limits.max.x, hit.position.x, hit.normal.x);
    clampAxis(p.y, limits.min.y, limits.max.y, hit.position.y, hit.normal.y);
    clampAxis(p.z, limits.min.z, limits.max.z, hit.position.z, hit.normal.z);
    return hit;
}

} // namespace

// ========================================================================== //
//  Impl                                                                      //
// ========================================================================== //

struct CollisionSystem::Impl
{
    CollisionConfig                                   config;
    Octree                                            terrainTree;
    SpatialHashGrid                                   grid;
    std::unordered_map<core::EntityId, Entity>        objects;
    std::unordered_map<core::EntityId, TerrainChunk>  terrain;

    explicit Impl(CollisionConfig cfg)
        : config{std::move(cfg)},
          terrainTree{config.worldBounds(), config.terrainMaxDepth(), config.maxObjectsPerLeaf()},
          grid{config.cellSize()}
    {}

    [[nodiscard]] core::ExpectedVoid admitTerrain(const TerrainChunk& chunk) const
    {
        if (terrain.contains(chunk.id) || objects.contains(chunk.id))
        {
            return core::makeError(core::ErrorCode::kAlreadyExists,
                std::format("terrain {}: id already tracked", chunk.id));
        }
        SKY_TRY_VOID(validateTerrainChunk(chunk));
        return {};
    }

    [[nodiscard]] std::optional<TerrainHit> terrainPhase(const Entity& entity) const
    {
        std::vector<Octree::Item> candidates;
        terrainTree.queryPotentialCollisions(entity.bounds, candidates);

        for (const auto& item : candidates)
        {
            if (!item.bounds.intersects(entity.bounds))
                continue;

            const auto it = terrain.find(item.id);
            if (it == terrain.end())
                continue;

            const core::f32 height = sampleTerrainHeight(it->second, entity.position.x, entity.position.z);
            if (entity.bottom() <= height)
            {
                return TerrainHit{item.id,
                                  math::Vec3f{entity.position.x, height, entity.position.z},
                                  math::Vec3f::unitY()};
            }
        }
        return std::nullopt;
    }

    void objectPhase(const Entity& entity, EntityTypeMask allowed, std::vector<CollisionResult>& out) const
    {
        for (core::EntityId otherId : grid.findPotentialCollisions(entity.id, entity.bounds))
        {
            const auto it = objects.find(otherId);
            if (it == objects.end())
                continue;

            const Entity& other = it->second;
            if (!hasType(allowed, other.type) || !entity.bounds.intersects(other.bounds))
                continue;

            const auto contact = CollisionDetector::testSphereVsSphere(
                entity.position, entity.boundingRadius(), other.position, other.boundingRadius());
            if (!contact)
                continue;

            out.emplace_back(ObjectHit{entity.id, other.id, contact->position,
                                       contact->normal, contact->penetrationDepth});
        }
    }

    /** @brief Terrain ray hit refined against the heightfield sampled at the box entry. */
    [[nodiscard]] std::optional<core::f32> rayVsTerrain(const math::Rayf& ray, const TerrainChunk& chunk) const
    {
        const auto entry = CollisionDetector::rayVsAABB(ray, chunk.bounds);
        if (!entry)
            return std::nullopt;

        if (!chunk.heightfield)
            return entry;

        if (ray.direction.y == 0.0f)
            return std::nullopt;

        const math::Vec3f entryPoint = ray.at(*entry);
        const core::f32 height = sampleTerrainHeight(chunk, entryPoint.x, entryPoint.z);
        const core::f32 t = (height - ray.origin.y) / ray.direction.y;
        if (!(t >= 0.0f))
            return std::nullopt;

        const math::Vec3f hit = ray.at(t);
        if (hit.x < chunk.bounds.min.x || hit.x > chunk.bounds.max.x ||
            hit.z < chunk.bounds.min.z || hit.z > chunk.bounds.max.z)
        {
            return std::nullopt;
        }
        return t;
    }
};

// ========================================================================== //
//  Public API                                                                //
// ========================================================================== //

CollisionSystem::CollisionSystem(CollisionConfig config)
    : _impl{std::make_unique<Impl>(std::move(config))}
{
    const auto& cfg = _impl->config;
    core::Log::info(kTag, std::format(
        "collision system: world {} depth {} leaf {} cell {}{}",
        cfg.worldSize(), cfg.terrainMaxDepth(), cfg.maxObjectsPerLeaf(), cfg.cellSize(),
        cfg.worldBoundaries() ? " (bounded)" : ""));
}

CollisionSystem::~CollisionSystem() = default;
CollisionSystem::CollisionSystem(CollisionSystem&&) noexcept = default;
CollisionSystem& CollisionSystem::operator=(CollisionSystem&&) noexcept = default;

core::ExpectedVoid CollisionSystem::addTerrainChunk(TerrainChunk chunk)
{
    if (auto admitted = _impl->admitTerrain(chunk); !admitted)
    {
        core::Log::warn(kTag, admitted.error().message());
        return admitted;
    }

    _impl->terrainTree.insert({chunk.id, chunk.bounds});
    const core::EntityId id = chunk.id;
    _impl->terrain.emplace(id, std::move(chunk));
    return {};
}

core::ExpectedVoid CollisionSystem::updateObject(const EntityDesc& desc)
{
    if (_impl->terrain.contains(desc.id))
    {
        core::Log::warn(kTag, std::format("entity {} rejected: id belongs to terrain", desc.id));
        return core::makeError(core::ErrorCode::kInvalidState,
            std::format("entity {}: id belongs to a terrain chunk", desc.id));
    }

    auto resolved = resolveEntity(desc);
    if (!resolved)
    {
        core::Log::warn(kTag, resolved.error().message());
        return std::unexpected(std::move(resolved.error()));
    }

    if (auto fits = _impl->grid.checkBounds(resolved->bounds); !fits)
    {
        core::Log::warn(kTag, std::format("entity {} rejected: {}", desc.id, fits.error().message()));
        return fits;
    }

    auto it = _impl->objects.find(desc.id);
    if (it == _impl->objects.end())
    {
        _impl->grid.insertObject(resolved->id, resolved->bounds);
        _impl->objects.emplace(resolved->id, *resolved);
        return {};
    }

    _impl->grid.updateObject(resolved->id, resolved->bounds, it->second.bounds);
    it->second = *resolved;
    return {};
}

void CollisionSystem::removeObject(core::EntityId id)
{
    if (_impl->terrain.contains(id))
    {
        core::Log::warn(kTag, std::format("terrain {} cannot be removed", id));
        return;
    }

    auto it = _impl->objects.find(id);
    if (it == _impl->objects.end())
        return;

    _impl->grid.removeObject(id, it->second.bounds);
    _impl->objects.erase(it);
}

std::vector<CollisionResult> CollisionSystem::checkCollisions(core::EntityId id) const
{
    std::vector<CollisionResult> results;

    const auto it = _impl->objects.find(id);
    if (it == _impl->objects.end())
        return results;

    const Entity& entity = it->second;
    const EntityTypeMask allowed = _impl->config.collisionGroups().allowed(entity.type);

    if (hasType(allowed, EntityType::kTerrain))
    {
        if (auto hit = _impl->terrainPhase(entity))
            results.emplace_back(*hit);
    }

    if (const auto& limits = _impl->config.worldBoundaries())
    {
        if (auto hit = testBoundary(entity.position, *limits))
            results.emplace_back(*hit);
    }

    _impl->objectPhase(entity, allowed, results);
    return results;
}

CollisionSystem::CollisionMap CollisionSystem::checkAllCollisions() const
{
    CollisionMap all;
    for (const auto& [id, entity] : _impl->objects)
    {
        auto results = checkCollisions(id);
        if (!results.empty())
            all.emplace(id, std::move(results));
    }
    return all;
}

core::f32 CollisionSystem::getHeightAt(core::f32 x, core::f32 z) const
{
    const core::f32 halfHeight = _impl->config.worldSize() / 2.0f;
    const math::AABBf probe{
        math::Vec3f{x - core::kHeightProbeHalfWidth, -halfHeight, z - core::kHeightProbeHalfWidth},
        math::Vec3f{x + core::kHeightProbeHalfWidth,  halfHeight, z + core::kHeightProbeHalfWidth}};

    std::vector<Octree::Item> candidates;
    _impl->terrainTree.queryPotentialCollisions(probe, candidates);

    std::optional<core::f32> best;
    for (const auto& item : candidates)
    {
        if (!item.bounds.intersects(probe))
            continue;

        const auto it = _impl->terrain.find(item.id);
        if (it == _impl->terrain.end())
            continue;

        const core::f32 h = sampleTerrainHeight(it->second, x, z);
        if (!best || h > *best)
            best = h;
    }
    return best.value_or(0.0f);
}

std::optional<RaycastHit> CollisionSystem::raycast(
    const math::Rayf& ray, core::f32 maxDistance, EntityTypeMask allowedTypes) const
{
    const math::Vec3f dir = ray.direction.normalize();
    if (dir.lengthSquared() == 0.0f || !(maxDistance > 0.0f))
        return std::nullopt;

    const math::Rayf unitRay{ray.origin, dir};
    const core::f32 reach = std::isfinite(maxDistance) ? maxDistance : _impl->config.worldSize();
    const math::AABBf rayBox = math::AABBf{ray.origin, ray.origin}.expandByPoint(unitRay.at(reach));

    std::optional<RaycastHit> closest;
    core::f32 closestDistance = maxDistance;

    if (hasType(allowedTypes, EntityType::kTerrain))
    {
        std::vector<Octree::Item> candidates;
        _impl->terrainTree.queryPotentialCollisions(rayBox, candidates);

        std::unordered_set<core::EntityId> visited;
        for (const auto& item : candidates)
        {
            if (!visited.insert(item.id).second)
                continue;

            const auto it = _impl->terrain.find(item.id);
            if (it == _impl->terrain.end())
                continue;

            const auto t = _impl->rayVsTerrain(unitRay, it->second);
            if (t && *t < closestDistance)
            {
                closestDistance = *t;
                closest = RaycastHit{*t, unitRay.at(*t), math::Vec3f::unitY(), item.id, EntityType::kTerrain};
            }
        }
    }

    for (const auto& [id, entity] : _impl->objects)
    {
        if (!hasType(allowedTypes, entity.type) || !entity.bounds.intersects(rayBox))
            continue;

        const auto t = CollisionDetector::rayVsSphere(unitRay, entity.position, entity.boundingRadius());
        if (t && *t < closestDistance)
        {
            const math::Vec3f point = unitRay.at(*t);
            closestDistance = *t;
            closest = RaycastHit{*t, point, (point - entity.position).normalize(), id, entity.type};
        }
    }

    return closest;
}

void CollisionSystem::clear()
{
    _impl->terrainTree.clear();
    _impl->grid.clear();
    _impl->objects.clear();
    _impl->terrain.clear();
    core::Log::info(kTag, "collision system cleared");
}

const Entity* CollisionSystem::find(core::EntityId id) const
{
    const auto it = _impl->objects.find(id);
    return it != _impl->objects.end() ? &it->second : nullptr;
}

const TerrainChunk* CollisionSystem::findTerrain(core::EntityId id) const
{
    const auto it = _impl->terrain.find(id);
    return it != _impl->terrain.end() ? &it->second : nullptr;
}

core::usize CollisionSystem::objectCount() const noexcept
{
    return _impl->objects.size();
}

core::usize CollisionSystem::terrainCount() const noexcept
{
    return _impl->terrain.size();
}

const CollisionConfig& CollisionSystem::config() const noexcept
{
    return _impl->config;
}

const Octree& CollisionSystem::terrainIndex() const noexcept
{
    return _impl->terrainTree;
}

const SpatialHashGrid& CollisionSystem::dynamicIndex() const noexcept
{
    return _impl->grid;
}

} // namespace sky::physics
