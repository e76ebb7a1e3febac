/**
 * @file CollisionDetector.cpp
 * @brief Narrow-phase collision detection implementations.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <sky/physics/CollisionDetector.hpp>

#include <algorithm>
#include <cmath>
#include <limits>
#include <utility>

namespace sky::physics {

std::optional<ContactPoint> CollisionDetector::testSphereVsSphere(
    const math::Vec3f& centerA, core::f32 radiusA,
    const math::Vec3f& centerB, core::f32 radiusB) noexcept
{
    const auto diff = centerB - centerA;
    const auto distSq = diff.lengthSquared();
    const auto radSum = radiusA + radiusB;

    if (distSq > radSum * radSum)
    {
        return std::nullopt;
    }

    const auto dist = std::sqrt(distSq);

    ContactPoint contact;
    contact.normal = (dist > 0.0f) ? diff / dist : math::Vec3f::unitY();
    contact.position = centerA + contact.normal * radiusA;
    contact.penetrationDepth = radSum - dist;
    return contact;
}

std::optional<core::f32> CollisionDetector::rayVsAABB(
    const math::Rayf& ray, const math::AABBf& box) noexcept
{
    core::f32 tmin = -std::numeric_limits<core::f32>::infinity();
    core::f32 tmax =  std::numeric_limits<core::f32>::infinity();

    const core::f32 origin[3] = {ray.origin.x, ray.origin.y, ray.origin.z};
    const core::f32 dir[3]    = {ray.direction.x, ray.direction.y, ray.direction.z};
    const core::f32 lo[3]     = {box.min.x, box.min.y, box.min.z};
    const core::f32 hi[3]     = {box.max.x, box.max.y, box.max.z};

    for (int axis = 0; axis < 3; ++axis)
    {
        if (dir[axis] == 0.0f)
        {
            if (origin[axis] < lo[axis] || origin[axis] > hi[axis])
            {
                return std::nullopt;
            }
            continue;
        }

        const core::f32 inv = 1.0f / dir[axis];
        core::f32 t1 = (lo[axis] - origin[axis]) * inv;
        core::f32 t2 = (hi[axis] - origin[axis]) * inv;
        if (t1 > t2)
        {
            std::swap(t1, t2);
        }
        tmin = std::max(tmin, t1);
        tmax = std::min(tmax, t2);
        if (tmin > tmax)
        {
            return std::nullopt;
        }
    }

    if (tmax < 0.0f)
    {
        return std::nullopt;
    }
    return (tmin >= 0.0f) ? tmin : tmax;
}

std::optional<core::f32> CollisionDetector::rayVsSphere(
    const math::Rayf& ray, const math::Vec3f& center, core::f32 radius) noexcept
{
    const auto toCenter = center - ray.origin;
    const auto tca = toCenter.dot(ray.direction);
    const auto d2 = toCenter.lengthSquared() - tca * tca;
    const auto r2 = radius * radius;

    if (d2 > r2)
    {
        return std::nullopt;
    }

    const auto thc = std::sqrt(r2 - d2);
    const auto t0 = tca - thc;
    const auto t1 = tca + thc;

    if (t1 < 0.0f)
    {
        return std::nullopt;
    }
    return (t0 < 0.0f) ? t1 : t0;
}

} // namespace sky::physics
