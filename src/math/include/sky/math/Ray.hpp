/**
 * @file Ray.hpp
 * @brief Half-line used by ray casts and terrain probes.
 *
 * The direction is stored as given; consumers that need a unit direction
 * normalise it themselves.
 *
 * @tparam T Floating-point scalar type.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef SKY_MATH_RAY_HPP
    #define SKY_MATH_RAY_HPP

    #include "Vec3.hpp"

namespace sky::math {

template <core::Real T>
struct Ray final {
    Vec3<T> origin{};
    Vec3<T> direction{T{}, T{-1}, T{}};

    constexpr Ray() = default;
    constexpr Ray(Vec3<T> o, Vec3<T> d) : origin(o), direction(d) {}

    /** @brief Point at parameter @p t along the ray. */
    [[nodiscard]] constexpr Vec3<T> at(T t) const { return origin + direction * t; }
};

using Rayf = Ray<float>;

} // namespace sky::math

#endif // SKY_MATH_RAY_HPP
