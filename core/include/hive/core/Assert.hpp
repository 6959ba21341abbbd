/**
 * @file Assert.hpp
 * @brief Debug assertions and contract-checking macros with source location.
 *
 * Provides HIVE_ASSERT (debug-only), HIVE_VERIFY (always evaluated), and
 * HIVE_UNREACHABLE (marks provably dead code paths).  The macros report the
 * failing expression together with the file, line, and function before
 * aborting.  In release builds HIVE_ASSERT is a no-op.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef HIVE_CORE_ASSERT_HPP
    #define HIVE_CORE_ASSERT_HPP

    #include "Platform.hpp"

    #include <cstdio>
    #include <cstdlib>
    #include <source_location>

namespace hive::core::detail {

[[noreturn]] inline void assertFail(
    const char *expr,
    std::source_location loc = std::source_location::current()
) {
    std::fprintf(
        stderr,
        "[HIVE ASSERT] %s:%u in %s: \"%s\" failed\n",
        loc.file_name(), loc.line(), loc.function_name(), expr
    );
    std::abort();
}

} // namespace hive::core::detail

    #ifdef HIVE_DEBUG
        #define HIVE_ASSERT(cond)                                         \
            do {                                                           \
                if (HIVE_UNLIKELY(!(cond)))                                \
                    ::hive::core::detail::assertFail(#cond);               \
            } while (false)
    #else
        #define HIVE_ASSERT(cond) ((void)0)
    #endif

    #define HIVE_VERIFY(cond)                                             \
        do {                                                               \
            if (HIVE_UNLIKELY(!(cond)))                                    \
                ::hive::core::detail::assertFail(#cond);                   \
        } while (false)

    #define HIVE_UNREACHABLE()                                            \
        do {                                                               \
            ::hive::core::detail::assertFail("UNREACHABLE");               \
            __builtin_unreachable();                                       \
        } while (false)

#endif // HIVE_CORE_ASSERT_HPP
