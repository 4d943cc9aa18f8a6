/**
 * @file Assert.hpp
 * @brief Contract-checking macros with source location.
 *
 * BPB_ASSERT is debug-only and guards programming errors (stage order,
 * null collaborators). Runtime failures of hardware or platform APIs are
 * never asserted: they travel as core::Error values.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef BPB_CORE_ASSERT_HPP
    #define BPB_CORE_ASSERT_HPP

    #include "Platform.hpp"

    #include <cstdio>
    #include <cstdlib>
    #include <source_location>

namespace bpb::core::detail {

[[noreturn]] inline void assertFail(
    const char *expr,
    std::source_location loc = std::source_location::current()
) {
    std::fprintf(
        stderr,
        "[BPB ASSERT] %s:%u in %s: \"%s\" failed\n",
        loc.file_name(), loc.line(), loc.function_name(), expr
    );
    std::abort();
}

} // namespace bpb::core::detail

    #ifdef BPB_DEBUG
        #define BPB_ASSERT(cond)                                          \
            do {                                                           \
                if (BPB_UNLIKELY(!(cond)))                                 \
                    ::bpb::core::detail::assertFail(#cond);                \
            } while (false)
    #else
        #define BPB_ASSERT(cond) ((void)0)
    #endif

#endif // BPB_CORE_ASSERT_HPP
