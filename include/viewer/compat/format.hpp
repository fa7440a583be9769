/**
 * @file format.hpp
 * @brief std::format when the standard library has it, fmt otherwise
 *
 * Usage:
 *   #include <viewer/compat/format.hpp>
 *   auto s = viewer::compat::format("{}x{} raster", rows, columns);
 */

#pragma once

#include <version>

// libstdc++ ships <format> from GCC 13 on; older toolchains fall back to fmt.
#if defined(__cpp_lib_format) && __cpp_lib_format >= 201907L
    #define VIEWER_HAS_STD_FORMAT 1
#elif defined(__APPLE__) && defined(__clang__) && __clang_major__ >= 15
    #define VIEWER_HAS_STD_FORMAT 1
#elif defined(_MSC_VER) && _MSC_VER >= 1929 && defined(_HAS_CXX20) && _HAS_CXX20
    #define VIEWER_HAS_STD_FORMAT 1
#else
    #define VIEWER_HAS_STD_FORMAT 0
#endif

#if VIEWER_HAS_STD_FORMAT
    #include <format>
    namespace viewer::compat {
        using std::format;
        template <typename... Args>
        using format_string = std::format_string<Args...>;
    }
#else
    #include <fmt/format.h>
    namespace viewer::compat {
        using fmt::format;
        template <typename... Args>
        using format_string = fmt::format_string<Args...>;
    }
#endif
