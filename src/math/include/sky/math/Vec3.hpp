/**
 * @file Vec3.hpp
 * @brief 3-component vector template for collision math.
 *
 * Parameterised on the scalar type; the collision subsystem instantiates
 * it with f32 (world units).
 *
 * @tparam T Scalar type satisfying sky::core::Arithmetic.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef SKY_MATH_VEC3_HPP
    #define SKY_MATH_VEC3_HPP

    #include <sky/core/Concepts.hpp>

namespace sky::math {

template <core::Arithmetic T>
struct Vec3 final {
    T x{};
    T y{};
    T z{};

    constexpr Vec3() = default;
    constexpr Vec3(T x, T y, T z);

    [[nodiscard]] constexpr Vec3 operator+(Vec3 rhs) const;
    [[nodiscard]] constexpr Vec3 operator-(Vec3 rhs) const;
    [[nodiscard]] constexpr Vec3 operator*(T scalar)  const;
    [[nodiscard]] constexpr Vec3 operator/(T scalar)  const;
    [[nodiscard]] constexpr Vec3 operator-()          const;

    [[nodiscard]] constexpr bool operator==(const Vec3 &) const = default;

    [[nodiscard]] constexpr T    dot(Vec3 rhs)      const;
    [[nodiscard]] constexpr T    lengthSquared()    const;
    [[nodiscard]] T              length()           const;

    /** @brief Unit vector along this one; the zero vector is returned unchanged. */
    [[nodiscard]] Vec3           normalize()        const;

    /** @brief Largest of the three components. */
    [[nodiscard]] constexpr T    maxComponent()     const;

    static constexpr Vec3 zero();
    static constexpr Vec3 unitY();
};

using Vec3f = Vec3<float>;

} // namespace sky::math

    #include "Vec3.inl"

#endif // SKY_MATH_VEC3_HPP
