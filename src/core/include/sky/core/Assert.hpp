/**
 * @file Assert.hpp
 * @brief Debug-only invariant checks for the spatial indices.
 *
 * SKY_ASSERT and SKY_ASSERT_MSG are compiled in when SKY_DEBUG is defined
 * (Debug builds) and vanish otherwise. A failed check is reported through
 * Log::fatal under the "assert" tag, then the process aborts.
 *
 * Caller mistakes are reported through core::Expected, never through these
 * macros.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef SKY_CORE_ASSERT_HPP
    #define SKY_CORE_ASSERT_HPP

    #include "Log.hpp"
    #include "Platform.hpp"

    #include <cstdlib>
    #include <format>
    #include <source_location>
    #include <string_view>

namespace sky::core::detail {

[[noreturn]] inline void assertFail(
    std::string_view expr,
    std::string_view detail,
    std::source_location loc = std::source_location::current()
) {
    Log::fatal("assert", std::format(
        "{}:{} in {}: \"{}\" failed{}{}",
        loc.file_name(), loc.line(), loc.function_name(), expr,
        detail.empty() ? "" : ": ", detail));
    std::abort();
}

} // namespace sky::core::detail

    #ifdef SKY_DEBUG
        #define SKY_ASSERT_MSG(cond, msg)                                 \
            do {                                                           \
                if (SKY_UNLIKELY(!(cond)))                                 \
                    ::sky::core::detail::assertFail(#cond, (msg));         \
            } while (false)
    #else
        #define SKY_ASSERT_MSG(cond, msg) ((void)0)
    #endif

    #define SKY_ASSERT(cond) SKY_ASSERT_MSG(cond, "")

#endif // SKY_CORE_ASSERT_HPP
