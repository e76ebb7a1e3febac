/**
 * @file Expected.hpp
 * @brief Monadic error-handling type built on std::expected.
 *
 * Provides Expected<T> as an alias for std::expected<T, Error> and a
 * SKY_TRY_VOID macro for early-return propagation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef SKY_CORE_EXPECTED_HPP
    #define SKY_CORE_EXPECTED_HPP

    #include "Error.hpp"

    #include <expected>

namespace sky::core {

/**
 * @brief Alias for an expected value or a structured Error.
 * @tparam T The success-path value type.
 */
template <typename T>
using Expected = std::expected<T, Error>;

/**
 * @brief Alias for operations that succeed with no value.
 */
using ExpectedVoid = Expected<void>;

} // namespace sky::core

/**
 * @brief Propagate an error from an ExpectedVoid expression.
 *
 * Evaluates @p expr once. If the result holds an error, the enclosing
 * function immediately returns that error wrapped in an unexpected.
 *
 * @param expr An expression of type sky::core::ExpectedVoid.
 */
#define SKY_TRY_VOID(expr)                                                \
    do {                                                                   \
        auto &&_sky_result = (expr);                                       \
        if (!_sky_result.has_value()) [[unlikely]]                         \
            return std::unexpected(std::move(_sky_result.error()));         \
    } while (false)

#endif // SKY_CORE_EXPECTED_HPP
