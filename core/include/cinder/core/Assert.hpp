/**
 * @file Assert.hpp
 * @brief Debug assertions and contract-checking macros with source location.
 *
 * Provides CINDER_ASSERT (debug-only) and CINDER_VERIFY (always evaluated).
 * These guard programmer errors only; recoverable
 * failures travel through core::Expected.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef CINDER_CORE_ASSERT_HPP
    #define CINDER_CORE_ASSERT_HPP

    #include "Platform.hpp"

    #include <cstdio>
    #include <cstdlib>
    #include <source_location>

namespace cinder::core::detail {

[[noreturn]] inline void assertFail(
    const char *expr,
    std::source_location loc = std::source_location::current()
) {
    std::fprintf(
        stderr,
        "[CINDER ASSERT] %s:%u in %s: \"%s\" failed\n",
        loc.file_name(), loc.line(), loc.function_name(), expr
    );
    std::abort();
}

} // namespace cinder::core::detail

    #ifdef CINDER_DEBUG
        #define CINDER_ASSERT(cond)                                       \
            do {                                                           \
                if (CINDER_UNLIKELY(!(cond)))                              \
                    ::cinder::core::detail::assertFail(#cond);             \
            } while (false)
    #else
        #define CINDER_ASSERT(cond) ((void)0)
    #endif

    #define CINDER_VERIFY(cond)                                           \
        do {                                                               \
            if (CINDER_UNLIKELY(!(cond)))                                  \
                ::cinder::core::detail::assertFail(#cond);                 \
        } while (false)

#endif // CINDER_CORE_ASSERT_HPP
