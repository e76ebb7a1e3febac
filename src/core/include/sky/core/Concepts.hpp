/**
 * @file Concepts.hpp
 * @brief C++20 concepts constraining the generic math types.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef SKY_CORE_CONCEPTS_HPP
    #define SKY_CORE_CONCEPTS_HPP

    #include "Types.hpp"

    #include <concepts>
    #include <type_traits>

namespace sky::core {

/**
 * @brief A type that supports basic arithmetic operations.
 */
template <typename T>
concept Arithmetic = std::is_arithmetic_v<T> || requires(T a, T b) {
    { a + b } -> std::convertible_to<T>;
    { a - b } -> std::convertible_to<T>;
    { a * b } -> std::convertible_to<T>;
    { a / b } -> std::convertible_to<T>;
};

/**
 * @brief A scalar type with IEEE-754 semantics (infinity, NaN, sqrt).
 *
 * Required by the geometric queries (rays, spheres) that need square roots
 * and unbounded distances.
 */
template <typename T>
concept Real = std::floating_point<T>;

} // namespace sky::core

#endif // SKY_CORE_CONCEPTS_HPP
