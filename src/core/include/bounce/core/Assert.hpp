/**
 * @file Assert.hpp
 * @brief Debug-only contract checks.
 *
 * BOUNCE_ASSERT guards internal invariants of the replay passes (one
 * orientation per target frame, spawns set before the layout is fixed).
 * Release builds compile it out; user input is validated with Expected.
 *
 * @version 0.1.0
 * @copyright MIT License
 */
#pragma once

#ifndef BOUNCE_CORE_ASSERT_HPP
    #define BOUNCE_CORE_ASSERT_HPP

    #include <cstdio>
    #include <cstdlib>
    #include <source_location>

namespace bounce::core::detail {

[[noreturn]] inline void assertFail(
    const char *expr,
    std::source_location loc = std::source_location::current()
) {
    std::fprintf(stderr, "[bounce] %s:%u: contract \"%s\" broken in %s\n",
                 loc.file_name(), static_cast<unsigned>(loc.line()), expr, loc.function_name());
    std::abort();
}

} // namespace bounce::core::detail

    #ifdef BOUNCE_DEBUG
        #define BOUNCE_ASSERT(cond)                                   \
            do {                                                       \
                if (!(cond)) [[unlikely]]                              \
                    ::bounce::core::detail::assertFail(#cond);         \
            } while (false)
    #else
        #define BOUNCE_ASSERT(cond) ((void)0)
    #endif

#endif // BOUNCE_CORE_ASSERT_HPP
