#ifndef DEFINITIONS_HPP
#define DEFINITIONS_HPP

#include <cstdio>  // for stderr

#include <fmt/color.h>
#include <fmt/core.h>

#define output_inter(...)  fmt::print(__VA_ARGS__)
#define error_inter(...)   fmt::print(stderr, fmt::fg(fmt::color::red), __VA_ARGS__)
#define warning_inter(...) fmt::print(fmt::fg(fmt::color::yellow), __VA_ARGS__)
#define info_inter(...)    fmt::print(fmt::fg(fmt::color::cyan), __VA_ARGS__)
#define success_inter(...) fmt::print(fmt::fg(fmt::color::green), __VA_ARGS__)

#endif
