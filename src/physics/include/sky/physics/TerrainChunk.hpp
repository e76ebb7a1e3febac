/**
 * @file TerrainChunk.hpp
 * @brief Terrain chunk descriptor and surface height sampling.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#ifndef SKY_PHYSICS_TERRAINCHUNK_HPP
    #define SKY_PHYSICS_TERRAINCHUNK_HPP

#include <sky/physics/Heightfield.hpp>
#include <sky/math/AABB.hpp>
#include <sky/core/Expected.hpp>
#include <sky/core/Types.hpp>

#include <functional>
#include <optional>

namespace sky::physics {

/** @brief World units covered by one heightfield sample on each horizontal axis. */
struct HeightfieldScale
{
    core::f32 x{1.0f};
    core::f32 z{1.0f};
};

/** @brief Terrain-supplied height function for chunks without a heightfield. */
using HeightProbe = std::function<core::f32(core::f32 x, core::f32 z)>;

/**
 * @struct TerrainChunk
 * @brief Static terrain piece handed over by the world generator.
 *
 * The heightfield is anchored at (bounds.min.x, bounds.min.z).
 */
struct TerrainChunk
{
    core::EntityId             id{0};
    math::AABBf                bounds{};
    std::optional<Heightfield> heightfield;
    HeightfieldScale           heightfieldScale{};
    HeightProbe                heightProbe;
};

/**
 * @brief Checks a chunk before it enters the terrain index.
 * @return kInvalidArgument for inverted or non-finite bounds, a non-positive
 *         heightfield scale, or a heightfield without samples.
 */
[[nodiscard]] core::ExpectedVoid validateTerrainChunk(const TerrainChunk& chunk);

/**
 * @brief Surface height of @p chunk at world (x, z).
 *
 * Lookup order: the heightfield sample floor((coord - min) / scale) when it
 * is in range, then the height probe, then bounds.min.y.
 */
[[nodiscard]] core::f32 sampleTerrainHeight(const TerrainChunk& chunk, core::f32 x, core::f32 z);

} // namespace sky::physics

#endif // SKY_PHYSICS_TERRAINCHUNK_HPP
