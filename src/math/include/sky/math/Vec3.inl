/**
 * @file Vec3.inl
 * @brief Inline implementation of Vec3 operations.
 * @see   Vec3.hpp
 */

#ifndef SKY_MATH_VEC3_INL
    #define SKY_MATH_VEC3_INL

#include <cmath>

namespace sky::math {

template <core::Arithmetic T>
constexpr Vec3<T>::Vec3(T x_, T y_, T z_) : x(x_), y(y_), z(z_) {}

template <core::Arithmetic T>
constexpr Vec3<T> Vec3<T>::operator+(Vec3 rhs) const { return {x + rhs.x, y + rhs.y, z + rhs.z}; }

template <core::Arithmetic T>
constexpr Vec3<T> Vec3<T>::operator-(Vec3 rhs) const { return {x - rhs.x, y - rhs.y, z - rhs.z}; }

template <core::Arithmetic T>
constexpr Vec3<T> Vec3<T>::operator*(T s) const { return {x * s, y * s, z * s}; }

template <core::Arithmetic T>
constexpr Vec3<T> Vec3<T>::operator/(T s) const { return {x / s, y / s, z / s}; }

template <core::Arithmetic T>
constexpr Vec3<T> Vec3<T>::operator-() const { return {-x, -y, -z}; }

template <core::Arithmetic T>
constexpr T Vec3<T>::dot(Vec3 rhs) const { return x * rhs.x + y * rhs.y + z * rhs.z; }

template <core::Arithmetic T>
constexpr T Vec3<T>::lengthSquared() const { return dot(*this); }

template <core::Arithmetic T>
T Vec3<T>::length() const { return static_cast<T>(std::sqrt(lengthSquared())); }

template <core::Arithmetic T>
Vec3<T> Vec3<T>::normalize() const
{
    const T len = length();
    if (len == T{})
        return *this;
    return *this / len;
}

template <core::Arithmetic T>
constexpr T Vec3<T>::maxComponent() const
{
    T m = x;
    if (y > m) m = y;
    if (z > m) m = z;
    return m;
}

template <core::Arithmetic T>
constexpr Vec3<T> Vec3<T>::zero()  { return {T{}, T{}, T{}}; }

template <core::Arithmetic T>
constexpr Vec3<T> Vec3<T>::unitY() { return {T{}, T{1}, T{}}; }

} // namespace sky::math

#endif // SKY_MATH_VEC3_INL
