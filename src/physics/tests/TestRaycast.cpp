/**
 * @file TestRaycast.cpp
 * @brief Unit tests for CollisionSystem::raycast.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <sky/physics/CollisionSystem.hpp>

#include <random>

namespace sky::physics {

using Catch::Matchers::WithinAbs;

namespace {

const math::Vec3f kDown{0.0f, -1.0f, 0.0f};

TerrainChunk fieldChunk(core::EntityId id, core::f32 top, core::f32 surface)
{
    TerrainChunk chunk;
    chunk.id = id;
    chunk.bounds = {math::Vec3f{-50.0f, -10.0f, -50.0f}, math::Vec3f{50.0f, top, 50.0f}};
    chunk.heightfield = Heightfield{10, 10, surface};
    chunk.heightfieldScale = {10.0f, 10.0f};
    return chunk;
}

EntityDesc sphere(core::EntityId id, EntityType type, math::Vec3f center, core::f32 radius)
{
    EntityDesc desc;
    desc.id = id;
    desc.type = type;
    desc.position = center;
    desc.dimensions = math::Vec3f{radius * 2.0f, radius * 2.0f, radius * 2.0f};
    return desc;
}

} // namespace

TEST_CASE("raycast against terrain", "[physics][raycast]")
{
    CollisionSystem system;

    SECTION("heightfield surface at the box top")
    {
        REQUIRE(system.addTerrainChunk(fieldChunk(7, 0.0f, 0.0f)).has_value());

        const auto hit = system.raycast({{3.0f, 100.0f, 4.0f}, kDown});
        REQUIRE(hit.has_value());
        REQUIRE(hit->entity == 7);
        REQUIRE(hit->type == EntityType::kTerrain);
        REQUIRE_THAT(hit->distance, WithinAbs(100.0f, 1e-3f));
        REQUIRE_THAT(hit->point.y, WithinAbs(0.0f, 1e-3f));
        REQUIRE(hit->normal == math::Vec3f{0.0f, 1.0f, 0.0f});
    }

    SECTION("heightfield refines below the box entry")
    {
        REQUIRE(system.addTerrainChunk(fieldChunk(7, 10.0f, 5.0f)).has_value());

        const auto hit = system.raycast({{3.0f, 100.0f, 4.0f}, kDown});
        REQUIRE(hit.has_value());
        REQUIRE_THAT(hit->distance, WithinAbs(95.0f, 1e-3f));
        REQUIRE_THAT(hit->point.y, WithinAbs(5.0f, 1e-3f));
    }

    SECTION("without heightfield the box entry is the hit")
    {
        TerrainChunk chunk;
        chunk.id = 8;
        chunk.bounds = {math::Vec3f{-50.0f, -10.0f, -50.0f}, math::Vec3f{50.0f, 2.0f, 50.0f}};
        REQUIRE(system.addTerrainChunk(std::move(chunk)).has_value());

        const auto hit = system.raycast({{0.0f, 100.0f, 0.0f}, kDown});
        REQUIRE(hit.has_value());
        REQUIRE_THAT(hit->distance, WithinAbs(98.0f, 1e-3f));
    }

    SECTION("terrain filtered out by type")
    {
        REQUIRE(system.addTerrainChunk(fieldChunk(7, 0.0f, 0.0f)).has_value());
        REQUIRE_FALSE(system.raycast({{3.0f, 100.0f, 4.0f}, kDown}, 1000.0f, maskOf(EntityType::kAircraft)));
    }
}

TEST_CASE("raycast honours maxDistance strictly", "[physics][raycast]")
{
    CollisionSystem system;
    REQUIRE(system.addTerrainChunk(fieldChunk(7, 0.0f, 0.0f)).has_value());

    const math::Rayf ray{{3.0f, 100.0f, 4.0f}, kDown};
    REQUIRE_FALSE(system.raycast(ray, 50.0f));
    REQUIRE(system.raycast(ray, 150.0f).has_value());
}

TEST_CASE("raycast against entities", "[physics][raycast]")
{
    CollisionSystem system;
    REQUIRE(system.updateObject(sphere(1, EntityType::kAircraft, {0.0f, 0.0f, 0.0f}, 2.0f)).has_value());

    SECTION("entering point and outward normal")
    {
        const auto hit = system.raycast({{0.0f, 0.0f, -20.0f}, {0.0f, 0.0f, 2.0f}});
        REQUIRE(hit.has_value());
        REQUIRE(hit->entity == 1);
        REQUIRE(hit->type == EntityType::kAircraft);
        REQUIRE_THAT(hit->distance, WithinAbs(18.0f, 1e-4f));
        REQUIRE_THAT(hit->point.z, WithinAbs(-2.0f, 1e-4f));
        REQUIRE_THAT(hit->normal.z, WithinAbs(-1.0f, 1e-4f));
    }

    SECTION("origin inside reports the exit point")
    {
        const auto hit = system.raycast({{0.0f, 0.0f, 0.0f}, {1.0f, 0.0f, 0.0f}});
        REQUIRE(hit.has_value());
        REQUIRE_THAT(hit->distance, WithinAbs(2.0f, 1e-4f));
    }

    SECTION("closest entity wins")
    {
        REQUIRE(system.updateObject(sphere(2, EntityType::kProjectile, {0.0f, 0.0f, -10.0f}, 1.0f)).has_value());

        const auto hit = system.raycast({{0.0f, 0.0f, -20.0f}, {0.0f, 0.0f, 1.0f}});
        REQUIRE(hit.has_value());
        REQUIRE(hit->entity == 2);
        REQUIRE_THAT(hit->distance, WithinAbs(9.0f, 1e-4f));
    }

    SECTION("type filter")
    {
        REQUIRE_FALSE(system.raycast({{0.0f, 0.0f, -20.0f}, {0.0f, 0.0f, 1.0f}},
                                     100.0f, maskOf(EntityType::kProjectile)));
    }

    SECTION("entity above terrain is hit first")
    {
        REQUIRE(system.addTerrainChunk(fieldChunk(7, -5.0f, -5.0f)).has_value());

        const auto hit = system.raycast({{0.0f, 100.0f, 0.0f}, kDown});
        REQUIRE(hit.has_value());
        REQUIRE(hit->entity == 1);
        REQUIRE_THAT(hit->distance, WithinAbs(98.0f, 1e-3f));
    }

    SECTION("zero direction hits nothing")
    {
        REQUIRE_FALSE(system.raycast({{0.0f, 0.0f, -20.0f}, {0.0f, 0.0f, 0.0f}}));
    }
}

TEST_CASE("raycast reach follows a finite maxDistance past the world size", "[physics][raycast]")
{
    CollisionSystem system;
    REQUIRE(system.updateObject(sphere(1, EntityType::kAircraft, {15000.0f, 0.0f, 0.0f}, 5.0f)).has_value());

    const math::Rayf ray{{0.0f, 0.0f, 0.0f}, {1.0f, 0.0f, 0.0f}};

    SECTION("finite maxDistance beyond the world")
    {
        const auto hit = system.raycast(ray, 20000.0f);
        REQUIRE(hit.has_value());
        REQUIRE(hit->entity == 1);
        REQUIRE_THAT(hit->distance, WithinAbs(14995.0f, 1e-2f));
    }

    SECTION("unbounded ray stops at the world size")
    {
        REQUIRE_FALSE(system.raycast(ray));
    }
}

TEST_CASE("raycast never reports a hit beyond maxDistance", "[physics][raycast]")
{
    CollisionSystem system;
    REQUIRE(system.addTerrainChunk(fieldChunk(7, 0.0f, 0.0f)).has_value());

    std::mt19937 rng{3};
    std::uniform_real_distribution<core::f32> coord{-60.0f, 60.0f};
    std::uniform_real_distribution<core::f32> radius{0.5f, 6.0f};
    for (core::EntityId id = 1; id <= 40; ++id)
        REQUIRE(system.updateObject(sphere(id, EntityType::kAircraft, {coord(rng), coord(rng) + 30.0f, coord(rng)}, radius(rng))).has_value());

    std::uniform_real_distribution<core::f32> dir{-1.0f, 1.0f};
    std::uniform_real_distribution<core::f32> range{1.0f, 150.0f};
    for (int i = 0; i < 200; ++i)
    {
        const math::Rayf ray{{coord(rng), 80.0f, coord(rng)}, {dir(rng), dir(rng) - 1.0f, dir(rng)}};
        const core::f32 maxDistance = range(rng);

        if (const auto hit = system.raycast(ray, maxDistance))
            REQUIRE(hit->distance < maxDistance);
    }
}

} // namespace sky::physics
