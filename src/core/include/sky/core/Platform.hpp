/**
 * @file Platform.hpp
 * @brief Compile-time compiler detection and portability macros.
 *
 * Provides the branch-prediction hint used by the assertion macros.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef SKY_CORE_PLATFORM_HPP
    #define SKY_CORE_PLATFORM_HPP

// ---- Compiler ------------------------------------------------------------

    #if defined(__clang__)
        #define SKY_COMPILER_CLANG 1
    #elif defined(__GNUC__)
        #define SKY_COMPILER_GCC   1
    #elif defined(_MSC_VER)
        #define SKY_COMPILER_MSVC  1
    #else
        #define SKY_COMPILER_UNKNOWN 1
    #endif

// ---- Intrinsics ----------------------------------------------------------

    #if defined(SKY_COMPILER_GCC) || defined(SKY_COMPILER_CLANG)
        #define SKY_UNLIKELY(x)     __builtin_expect(!!(x), 0)
    #else
        #define SKY_UNLIKELY(x)     (x)
    #endif

#endif // SKY_CORE_PLATFORM_HPP
