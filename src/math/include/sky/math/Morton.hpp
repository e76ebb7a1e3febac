/**
 * @file Morton.hpp
 * @brief Z-order curve encoding via bit-interleaving.
 *
 * Converts 3D integer coordinates to a single Morton code that preserves
 * spatial locality. A bias of 2^20 is applied to support negative
 * coordinates without branching; each axis keeps its low 21 bits, so
 * coordinates outside [-2^20, 2^20) alias onto other codes.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef SKY_MATH_MORTON_HPP
    #define SKY_MATH_MORTON_HPP

    #include <sky/core/Constants.hpp>
    #include <sky/core/Types.hpp>

namespace sky::math::morton {

/**
 * @brief Encode a 3D coordinate triple into a 63-bit Morton code.
 * @param x First axis.
 * @param y Second axis.
 * @param z Third axis.
 * @return 63-bit Morton key stored in a u64.
 */
[[nodiscard]] constexpr core::u64 encode3D(core::i32 x, core::i32 y, core::i32 z);

namespace detail {

[[nodiscard]] constexpr core::u64 part1by2(core::u64 n)
{
    core::u64 v = n & 0x1FFFFF;
    v = (v | (v << 32)) & 0x1F00000000FFFF;
    v = (v | (v << 16)) & 0x1F0000FF0000FF;
    v = (v | (v <<  8)) & 0x100F00F00F00F00F;
    v = (v | (v <<  4)) & 0x10C30C30C30C30C3;
    v = (v | (v <<  2)) & 0x1249249249249249;
    return v;
}

} // namespace detail

constexpr core::u64 encode3D(core::i32 x, core::i32 y, core::i32 z)
{
    // Wrapping u32 arithmetic: the bias must not overflow a signed int.
    auto ux = static_cast<core::u64>(static_cast<core::u32>(x) + static_cast<core::u32>(core::kMortonBias));
    auto uy = static_cast<core::u64>(static_cast<core::u32>(y) + static_cast<core::u32>(core::kMortonBias));
    auto uz = static_cast<core::u64>(static_cast<core::u32>(z) + static_cast<core::u32>(core::kMortonBias));
    return detail::part1by2(ux) | (detail::part1by2(uy) << 1) | (detail::part1by2(uz) << 2);
}

} // namespace sky::math::morton

#endif // SKY_MATH_MORTON_HPP
