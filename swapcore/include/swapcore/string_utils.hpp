#ifndef STRING_UTILS_HPP
#define STRING_UTILS_HPP

#include <ranges>       // for ranges::*
#include <string_view>  // for string_view

namespace swapcore::utils {

/// @brief Case-insensitive (ASCII) substring search.
auto icontains(std::string_view haystack, std::string_view needle) noexcept -> bool;

/// @brief Strip leading and trailing whitespace.
auto trim(std::string_view str) noexcept -> std::string_view;

/// @brief Make a split view from a string into multiple lines based on a delimiter.
/// @param str The string to split.
/// @param delim The delimiter to split the string.
/// @return A range view representing the split lines.
constexpr auto make_split_view(std::string_view str, char delim = '\n') noexcept {
    constexpr auto functor = [](auto&& rng) {
        return std::string_view(&*rng.begin(), static_cast<size_t>(std::ranges::distance(rng)));
    };
    // empty pieces are dropped before dereferencing their begin()
    constexpr auto non_empty = [](auto&& rng) { return !std::ranges::empty(rng); };

    return str
        | std::ranges::views::split(delim)
        | std::ranges::views::filter(non_empty)
        | std::ranges::views::transform(functor);
}

}  // namespace swapcore::utils

#endif  // STRING_UTILS_HPP
