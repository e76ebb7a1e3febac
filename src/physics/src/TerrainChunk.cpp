/**
 * @file TerrainChunk.cpp
 * @brief Terrain chunk validation and height sampling.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <sky/physics/TerrainChunk.hpp>

#include <cmath>
#include <format>

namespace sky::physics {

core::ExpectedVoid validateTerrainChunk(const TerrainChunk& chunk)
{
    const auto& b = chunk.bounds;
    const bool finite = std::isfinite(b.min.x) && std::isfinite(b.min.y) && std::isfinite(b.min.z)
                     && std::isfinite(b.max.x) && std::isfinite(b.max.y) && std::isfinite(b.max.z);
    if (!finite || !b.isValid())
    {
        return core::makeError(core::ErrorCode::kInvalidArgument,
            std::format("terrain {}: bounds are inverted or not finite", chunk.id));
    }

    if (chunk.heightfield)
    {
        if (chunk.heightfield->empty())
        {
            return core::makeError(core::ErrorCode::kInvalidArgument,
                std::format("terrain {}: heightfield has no samples", chunk.id));
        }
        if (!(chunk.heightfieldScale.x > 0.0f) || !(chunk.heightfieldScale.z > 0.0f))
        {
            return core::makeError(core::ErrorCode::kInvalidArgument,
                std::format("terrain {}: heightfield scale must be positive", chunk.id));
        }
    }
    return {};
}

core::f32 sampleTerrainHeight(const TerrainChunk& chunk, core::f32 x, core::f32 z)
{
    if (chunk.heightfield)
    {
        const auto xi = static_cast<core::i64>(
            std::floor((x - chunk.bounds.min.x) / chunk.heightfieldScale.x));
        const auto zi = static_cast<core::i64>(
            std::floor((z - chunk.bounds.min.z) / chunk.heightfieldScale.z));

        if (chunk.heightfield->inRange(xi, zi))
        {
            return chunk.heightfield->at(static_cast<core::usize>(xi),
                                         static_cast<core::usize>(zi));
        }
    }

    if (chunk.heightProbe)
    {
        return chunk.heightProbe(x, z);
    }

    return chunk.bounds.min.y;
}

} // namespace sky::physics
