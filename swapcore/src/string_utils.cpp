#include "swapcore/string_utils.hpp"

#include <algorithm>  // for search
#include <cctype>     // for tolower, isspace

namespace swapcore::utils {

auto icontains(std::string_view haystack, std::string_view needle) noexcept -> bool {
    if (needle.empty()) {
        return true;
    }
    auto it = std::search(haystack.begin(), haystack.end(), needle.begin(), needle.end(),
        [](unsigned char lhs, unsigned char rhs) { return std::tolower(lhs) == std::tolower(rhs); });
    return it != haystack.end();
}

auto trim(std::string_view str) noexcept -> std::string_view {
    while (!str.empty() && std::isspace(static_cast<unsigned char>(str.front()))) {
        str.remove_prefix(1);
    }
    while (!str.empty() && std::isspace(static_cast<unsigned char>(str.back()))) {
        str.remove_suffix(1);
    }
    return str;
}

}  // namespace swapcore::utils
