/**
 * @file AABB.hpp
 * @brief Axis-Aligned Bounding Box for broadphase collision and spatial queries.
 *
 * Invariant of a valid box: min[i] <= max[i] on every axis. Intersection
 * and containment tests are closed (touching boxes intersect).
 *
 * @tparam T Scalar type satisfying sky::core::Arithmetic.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef SKY_MATH_AABB_HPP
    #define SKY_MATH_AABB_HPP

    #include "Vec3.hpp"

namespace sky::math {

template <core::Arithmetic T>
struct AABB final {
    Vec3<T> min{};
    Vec3<T> max{};

    constexpr AABB() = default;
    constexpr AABB(Vec3<T> min, Vec3<T> max);

    /** @brief Box centred on @p center spanning @p extents (full side lengths). */
    [[nodiscard]] static constexpr AABB fromCenterExtents(Vec3<T> center, Vec3<T> extents);

    [[nodiscard]] constexpr bool        isValid()                 const;
    [[nodiscard]] constexpr bool        contains(Vec3<T> point)   const;
    [[nodiscard]] constexpr bool        intersects(AABB other)    const;
    [[nodiscard]] constexpr AABB        merge(AABB other)         const;
    [[nodiscard]] constexpr AABB        expandByPoint(Vec3<T> p)  const;
    [[nodiscard]] constexpr Vec3<T>     center()                  const;
    [[nodiscard]] constexpr Vec3<T>     size()                    const;

    [[nodiscard]] constexpr bool operator==(const AABB &) const = default;
};

using AABBf = AABB<float>;

} // namespace sky::math

#include "AABB.inl"

#endif // SKY_MATH_AABB_HPP
