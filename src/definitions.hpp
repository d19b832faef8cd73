#ifndef DEFINITIONS_HPP
#define DEFINITIONS_HPP

#include <cstdio>  // for stderr

#include <fmt/color.h>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

inline constexpr auto RESET     = "\033[0m";
inline constexpr auto RED       = "\033[31m";        /* Red */
inline constexpr auto CYAN      = "\033[36m";        /* Cyan */
inline constexpr auto BOLDRED   = "\033[1m\033[31m"; /* Bold Red */
inline constexpr auto BOLDWHITE = "\033[1m\033[37m"; /* Bold White */

#define output_inter(...)  fmt::print(__VA_ARGS__)
#define error_inter(...)   fmt::print(stderr, fmt::fg(fmt::color::red), __VA_ARGS__)
#define warning_inter(...) fmt::print(fmt::fg(fmt::color::yellow), __VA_ARGS__)
#define info_inter(...)    fmt::print(fmt::fg(fmt::color::cyan), __VA_ARGS__)
#define success_inter(...) fmt::print(fmt::fg(fmt::color::green), __VA_ARGS__)

#endif
