// tf_runner/format.hpp
// Formatting shim used for error messages and diagnostics.
//
// std::format when the standard library provides it; otherwise fmt::format,
// which is always available because spdlog depends on it.

#pragma once

#include <string>
#include <utility>
#include <version>

#if defined(__cpp_lib_format) && (__cpp_lib_format >= 201907L)
    #include <format>
    #define TFRUN_HAS_STD_FORMAT 1
#else
    #include <fmt/format.h>
    #define TFRUN_HAS_STD_FORMAT 0
#endif

namespace tf_runner::detail {

#if TFRUN_HAS_STD_FORMAT

template<class... Args>
[[nodiscard]] inline std::string format(std::format_string<Args...> fmt, Args&&... args)
{
    return std::format(fmt, std::forward<Args>(args)...);
}

#else

template<class... Args>
[[nodiscard]] inline std::string format(fmt::format_string<Args...> fmt, Args&&... args)
{
    return fmt::format(fmt, std::forward<Args>(args)...);
}

#endif

} // namespace tf_runner::detail
