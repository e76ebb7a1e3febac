/**
 * @file Constants.hpp
 * @brief Compile-time defaults of the collision subsystem.
 *
 * All tunable parameters that shape the spatial indices are centralised
 * here so that a single header controls the default operating point.
 * Every value can be overridden per instance through CollisionConfig.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef SKY_CORE_CONSTANTS_HPP
    #define SKY_CORE_CONSTANTS_HPP

    #include "Types.hpp"

namespace sky::core {

inline constexpr f32   kWorldSize              = 10'000.0f;

inline constexpr u32   kOctreeMaxDepth         = 8;
inline constexpr u32   kOctreeLeafCapacity     = 10;

inline constexpr f32   kGridCellSize           = 100.0f;
inline constexpr i32   kGridCellLimit          = (1 << 20) - 1;
inline constexpr u64   kGridMaxCellsPerObject  = 1 << 18;

inline constexpr f32   kHeightProbeHalfWidth   = 0.1f;

inline constexpr i32   kMortonBias             = 1 << 20;

} // namespace sky::core

#endif // SKY_CORE_CONSTANTS_HPP
