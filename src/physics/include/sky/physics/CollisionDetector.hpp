/**
 * @file CollisionDetector.hpp
 * @brief Narrow-phase primitives: sphere overlap, ray vs box, ray vs sphere.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#ifndef SKY_PHYSICS_COLLISIONDETECTOR_HPP
    #define SKY_PHYSICS_COLLISIONDETECTOR_HPP

#include <sky/math/AABB.hpp>
#include <sky/math/Ray.hpp>
#include <sky/math/Vec3.hpp>
#include <sky/core/Types.hpp>

#include <optional>

namespace sky::physics {

/**
 * @struct ContactPoint
 * @brief Single contact between two overlapping bodies.
 */
struct ContactPoint
{
    math::Vec3f position{};
    math::Vec3f normal{};
    core::f32   penetrationDepth{0.0f};
};

/**
 * @class CollisionDetector
 * @brief Stateless narrow-phase query functions.
 */
class CollisionDetector
{
public:
    /**
     * @brief Sphere vs sphere overlap test (touching counts).
     *
     * The normal points from A to B, or +Y when the centres coincide. The
     * contact lies on A's surface along the normal.
     *
     * @return The contact, or std::nullopt when the spheres are apart.
     */
    [[nodiscard]] static std::optional<ContactPoint> testSphereVsSphere(
        const math::Vec3f& centerA, core::f32 radiusA,
        const math::Vec3f& centerB, core::f32 radiusB) noexcept;

    /**
     * @brief Slab test of a ray against a box.
     * @param ray Ray with a unit direction.
     * @return Entry distance, or the exit distance when the origin is inside.
     *         std::nullopt when the box is missed or lies behind the origin.
     */
    [[nodiscard]] static std::optional<core::f32> rayVsAABB(
        const math::Rayf& ray, const math::AABBf& box) noexcept;

    /**
     * @brief Ray against sphere.
     * @param ray Ray with a unit direction.
     * @return Entry distance, or the exit distance when the origin is inside.
     */
    [[nodiscard]] static std::optional<core::f32> rayVsSphere(
        const math::Rayf& ray, const math::Vec3f& center, core::f32 radius) noexcept;
};

} // namespace sky::physics

#endif // SKY_PHYSICS_COLLISIONDETECTOR_HPP
