/**
 * @file Assert.hpp
 * @brief Debug-only contract checks for internal preconditions.
 *
 * LTR_ASSERT guards caller contracts such as bit widths in the bitstream.
 * It compiles away unless LTR_DEBUG is defined. Runtime faults (bad
 * datagrams, unreachable peers) go through Expected, never through here.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-17
 * @copyright MIT License
 */
#pragma once

#ifndef LTR_CORE_ASSERT_HPP
    #define LTR_CORE_ASSERT_HPP

    #include <cstdio>
    #include <cstdlib>
    #include <source_location>

namespace ltr::core::detail {

[[noreturn]] inline void assertFail(
    const char *expr,
    std::source_location loc = std::source_location::current()
) {
    std::fprintf(
        stderr,
        "[LTR ASSERT] %s:%u in %s: \"%s\" failed\n",
        loc.file_name(), loc.line(), loc.function_name(), expr
    );
    std::abort();
}

} // namespace ltr::core::detail

    #if defined(__GNUC__) || defined(__clang__)
        #define LTR_UNLIKELY(x) __builtin_expect(!!(x), 0)
    #else
        #define LTR_UNLIKELY(x) (x)
    #endif

    #ifdef LTR_DEBUG
        #define LTR_ASSERT(cond)                                          \
            do {                                                           \
                if (LTR_UNLIKELY(!(cond)))                                 \
                    ::ltr::core::detail::assertFail(#cond);                \
            } while (false)
    #else
        #define LTR_ASSERT(cond) ((void)0)
    #endif

#endif // LTR_CORE_ASSERT_HPP
