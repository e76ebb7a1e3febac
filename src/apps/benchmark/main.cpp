// /////////////////////////////////////////////////////////////////////////////
/// @file main.cpp
/// @brief SkyCollide benchmark entry-point.
///
/// Headless benchmark: exercises the terrain octree, the dynamic hash grid
/// and the collision queries in isolation for profiling.
// /////////////////////////////////////////////////////////////////////////////

#include <sky/core/Types.hpp>
#include <sky/core/Log.hpp>
#include <sky/math/Morton.hpp>
#include <sky/physics/CollisionSystem.hpp>

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <random>

using namespace sky;

namespace {

constexpr core::u32 kTerrainGrid  = 20;
constexpr core::u32 kAircraft     = 2000;
constexpr core::u32 kProjectiles  = 3000;
constexpr core::u32 kTerrainIdBase = 1'000'000;

template <typename Fn>
core::f64 benchmarkMs(const char* label, Fn&& fn)
{
    const auto start = std::chrono::steady_clock::now();
    fn();
    const auto end = std::chrono::steady_clock::now();
    const core::f64 ms = std::chrono::duration<core::f64, std::milli>(end - start).count();
    std::printf("  %-36s %10.3f ms\n", label, ms);
    return ms;
}

physics::EntityDesc randomEntity(std::mt19937& rng, core::EntityId id, physics::EntityType type, core::f32 size)
{
    std::uniform_real_distribution<core::f32> horizontal{-4000.0f, 4000.0f};
    std::uniform_real_distribution<core::f32> altitude{-20.0f, 800.0f};

    physics::EntityDesc desc;
    desc.id = id;
    desc.type = type;
    desc.position = math::Vec3f{horizontal(rng), altitude(rng), horizontal(rng)};
    desc.dimensions = math::Vec3f{size, size, size};
    return desc;
}

void benchmarkMorton()
{
    benchmarkMs("Morton encode3D 1M", []()
    {
        for (core::u32 i = 0; i < 1000000; ++i)
        {
            [[maybe_unused]] auto code = math::morton::encode3D(
                static_cast<core::i32>(i),
                static_cast<core::i32>(i + 1),
                static_cast<core::i32>(i + 2));
        }
    });
}

bool populateTerrain(physics::CollisionSystem& system)
{
    const core::f32 chunkSize = 8000.0f / kTerrainGrid;
    bool ok = true;

    benchmarkMs("addTerrainChunk 400 chunks", [&]()
    {
        for (core::u32 ix = 0; ix < kTerrainGrid; ++ix)
        {
            for (core::u32 iz = 0; iz < kTerrainGrid; ++iz)
            {
                const core::f32 x0 = -4000.0f + static_cast<core::f32>(ix) * chunkSize;
                const core::f32 z0 = -4000.0f + static_cast<core::f32>(iz) * chunkSize;

                physics::TerrainChunk chunk;
                chunk.id = kTerrainIdBase + ix * kTerrainGrid + iz;
                chunk.bounds = {math::Vec3f{x0, -50.0f, z0}, math::Vec3f{x0 + chunkSize, 50.0f, z0 + chunkSize}};
                chunk.heightfield = physics::Heightfield{40, 40, static_cast<core::f32>((ix + iz) % 7) * 5.0f};
                chunk.heightfieldScale = {chunkSize / 40.0f, chunkSize / 40.0f};

                if (auto added = system.addTerrainChunk(std::move(chunk)); !added)
                {
                    core::Log::error("bench", added.error().message());
                    ok = false;
                    return;
                }
            }
        }
    });
    return ok;
}

bool populateDynamic(physics::CollisionSystem& system, std::mt19937& rng)
{
    bool ok = true;
    benchmarkMs("updateObject 5k inserts", [&]()
    {
        for (core::u32 i = 0; i < kAircraft + kProjectiles && ok; ++i)
        {
            const bool aircraft = i < kAircraft;
            auto desc = randomEntity(rng, i,
                aircraft ? physics::EntityType::kAircraft : physics::EntityType::kProjectile,
                aircraft ? 20.0f : 1.0f);
            if (auto updated = system.updateObject(desc); !updated)
            {
                core::Log::error("bench", updated.error().message());
                ok = false;
            }
        }
    });
    return ok;
}

void benchmarkMoves(physics::CollisionSystem& system, std::mt19937& rng)
{
    std::uniform_real_distribution<core::f32> step{-15.0f, 15.0f};

    benchmarkMs("updateObject 5k moves", [&]()
    {
        for (core::u32 i = 0; i < kAircraft + kProjectiles; ++i)
        {
            const physics::Entity* current = system.find(i);
            if (current == nullptr)
                continue;

            physics::EntityDesc desc;
            desc.id = i;
            desc.type = current->type;
            desc.position = current->position + math::Vec3f{step(rng), step(rng), step(rng)};
            desc.dimensions = current->dimensions;
            if (auto updated = system.updateObject(desc); !updated)
                core::Log::error("bench", updated.error().message());
        }
    });
}

void benchmarkQueries(const physics::CollisionSystem& system, std::mt19937& rng)
{
    std::size_t colliding = 0;
    benchmarkMs("checkAllCollisions", [&]()
    {
        colliding = system.checkAllCollisions().size();
    });
    std::printf("  %-36s %10zu\n", "  entities with hits", colliding);

    std::uniform_real_distribution<core::f32> coord{-4000.0f, 4000.0f};
    benchmarkMs("getHeightAt 100k", [&]()
    {
        core::f32 acc = 0.0f;
        for (int i = 0; i < 100000; ++i)
            acc += system.getHeightAt(coord(rng), coord(rng));
        [[maybe_unused]] volatile core::f32 sink = acc;
    });

    std::size_t hits = 0;
    benchmarkMs("raycast 10k downward", [&]()
    {
        for (int i = 0; i < 10000; ++i)
        {
            const math::Rayf ray{math::Vec3f{coord(rng), 1000.0f, coord(rng)}, math::Vec3f{0.0f, -1.0f, 0.0f}};
            if (system.raycast(ray, 2000.0f))
                ++hits;
        }
    });
    std::printf("  %-36s %10zu\n", "  rays with hits", hits);
}

} // anonymous namespace

int main(int /*argc*/, char* /*argv*/[])
{
    core::Log::info("bench", "=== SkyCollide Benchmark ===");
    std::printf("\n");

    benchmarkMorton();

    physics::CollisionSystem system;
    std::mt19937 rng{1234};

    if (!populateTerrain(system) || !populateDynamic(system, rng))
        return EXIT_FAILURE;

    benchmarkMoves(system, rng);
    benchmarkQueries(system, rng);

    std::printf("\nDone.\n");
    return EXIT_SUCCESS;
}
