/**
 * @file format.hpp
 * @brief Compatibility header for std::format vs fmt::format
 *
 * Provides a single formatting entry point that works on standard libraries
 * with and without <format>. Detection relies on the __cpp_lib_format
 * feature test macro, with explicit checks for toolchains known to ship
 * std::format without advertising it.
 *
 * Usage:
 *   #include <piiguard/compat/format.hpp>
 *   auto s = piiguard::compat::format("{} entities detected", count);
 */

#pragma once

#include <version>

// 1. __cpp_lib_format (libstdc++ 13+, libc++ 17+)
// 2. Apple Clang 15+ with libc++
// 3. MSVC 19.29+ in C++20 mode
#if defined(__cpp_lib_format) && __cpp_lib_format >= 201907L
    #define PIIGUARD_HAS_STD_FORMAT 1
#elif defined(__APPLE__) && defined(__clang__) && __clang_major__ >= 15
    #define PIIGUARD_HAS_STD_FORMAT 1
#elif defined(_MSC_VER) && _MSC_VER >= 1929 && defined(_HAS_CXX20) && _HAS_CXX20
    #define PIIGUARD_HAS_STD_FORMAT 1
#else
    #define PIIGUARD_HAS_STD_FORMAT 0
#endif

#if PIIGUARD_HAS_STD_FORMAT
    #include <format>
    namespace piiguard::compat {
        using std::format;
        template <typename... Args>
        using format_string = std::format_string<Args...>;
    }
#else
    #include <fmt/format.h>
    namespace piiguard::compat {
        using fmt::format;
        template <typename... Args>
        using format_string = fmt::format_string<Args...>;
    }
#endif
