/**
 * @file format.hpp
 * @brief dcmwire::compat::format, std::format where available, fmt otherwise
 *
 * Diagnostics such as "Frame 3 of 12" or "(7FE0,0010)" are built with
 * this alias so the library also builds on standard libraries that ship
 * C++20 without <format>.
 */

#pragma once

#include <version>

#if defined(__cpp_lib_format) && __cpp_lib_format >= 201907L
    #define DCMWIRE_HAS_STD_FORMAT 1
    #include <format>
#else
    #define DCMWIRE_HAS_STD_FORMAT 0
    #include <fmt/format.h>
#endif

namespace dcmwire::compat {

#if DCMWIRE_HAS_STD_FORMAT
using std::format;
template <typename... Args>
using format_string = std::format_string<Args...>;
#else
using fmt::format;
template <typename... Args>
using format_string = fmt::format_string<Args...>;
#endif

}  // namespace dcmwire::compat
