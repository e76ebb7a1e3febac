/**
 * @file Types.hpp
 * @brief Primitive type aliases shared by every SkyCollide module.
 *
 * Fixed-width integer aliases, floating-point aliases and the entity id
 * type used as the key of every index.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef SKY_CORE_TYPES_HPP
    #define SKY_CORE_TYPES_HPP

    #include <cstddef>
    #include <cstdint>

namespace sky::core {

using u8  = std::uint8_t;
using u16 = std::uint16_t;
using u32 = std::uint32_t;
using u64 = std::uint64_t;

using i8  = std::int8_t;
using i16 = std::int16_t;
using i32 = std::int32_t;
using i64 = std::int64_t;

using f32 = float;
using f64 = double;

using usize = std::size_t;
using isize = std::ptrdiff_t;

/**
 * @brief Stable identifier of a tracked entity or terrain chunk.
 *
 * Ids are owned by the caller; terrain and dynamic entities share one id
 * space inside a CollisionSystem.
 */
using EntityId = u32;

} // namespace sky::core

#endif // SKY_CORE_TYPES_HPP
