/**
 * @file AABB.inl
 * @brief Inline implementations of AABB template methods.
 *
 * @note This file is automatically included at the end of AABB.hpp.
 *       Do not include it directly.
 */

namespace sky::math {

template <core::Arithmetic T>
constexpr AABB<T>::AABB(Vec3<T> mn, Vec3<T> mx) : min(mn), max(mx) {}

template <core::Arithmetic T>
constexpr AABB<T> AABB<T>::fromCenterExtents(Vec3<T> c, Vec3<T> extents)
{
    const Vec3<T> half = extents / T{2};
    return AABB{c - half, c + half};
}

template <core::Arithmetic T>
constexpr bool AABB<T>::isValid() const
{
    return min.x <= max.x && min.y <= max.y && min.z <= max.z;
}

template <core::Arithmetic T>
constexpr bool AABB<T>::contains(Vec3<T> point) const
{
    return point.x >= min.x && point.x <= max.x
        && point.y >= min.y && point.y <= max.y
        && point.z >= min.z && point.z <= max.z;
}

template <core::Arithmetic T>
constexpr bool AABB<T>::intersects(AABB other) const
{
    return min.x <= other.max.x && max.x >= other.min.x
        && min.y <= other.max.y && max.y >= other.min.y
        && min.z <= other.max.z && max.z >= other.min.z;
}

template <core::Arithmetic T>
constexpr AABB<T> AABB<T>::merge(AABB other) const
{
    auto lo = [](T a, T b) { return (a < b) ? a : b; };
    auto hi = [](T a, T b) { return (a > b) ? a : b; };
    return AABB{
        Vec3<T>(lo(min.x, other.min.x), lo(min.y, other.min.y), lo(min.z, other.min.z)),
        Vec3<T>(hi(max.x, other.max.x), hi(max.y, other.max.y), hi(max.z, other.max.z))};
}

template <core::Arithmetic T>
constexpr AABB<T> AABB<T>::expandByPoint(Vec3<T> p) const
{
    return merge(AABB{p, p});
}

template <core::Arithmetic T>
constexpr Vec3<T> AABB<T>::center() const
{
    return (min + max) / T{2};
}

template <core::Arithmetic T>
constexpr Vec3<T> AABB<T>::size() const
{
    return max - min;
}

} // namespace sky::math
