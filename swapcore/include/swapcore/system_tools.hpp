#ifndef SYSTEM_TOOLS_HPP
#define SYSTEM_TOOLS_HPP

#include <string_view>  // for string_view

namespace swapcore::tools {

// Absolute paths of the macOS tools the engine drives.
inline constexpr std::string_view csrutil       = "/usr/bin/csrutil";
inline constexpr std::string_view diskutil      = "/usr/sbin/diskutil";
inline constexpr std::string_view ls            = "/bin/ls";
inline constexpr std::string_view sysctl        = "/usr/sbin/sysctl";
inline constexpr std::string_view sudo          = "/usr/bin/sudo";
inline constexpr std::string_view osascript     = "/usr/bin/osascript";
inline constexpr std::string_view true_cmd      = "/usr/bin/true";
inline constexpr std::string_view mkdir         = "/bin/mkdir";
inline constexpr std::string_view test          = "/bin/test";
inline constexpr std::string_view rm            = "/bin/rm";
inline constexpr std::string_view cp            = "/bin/cp";
inline constexpr std::string_view chmod         = "/bin/chmod";
inline constexpr std::string_view ln            = "/bin/ln";
inline constexpr std::string_view dd            = "/bin/dd";
inline constexpr std::string_view dynamic_pager = "/usr/sbin/dynamic_pager";

// sysctl knob toggling swap accounting
inline constexpr std::string_view swap_enabled_key = "vm.swap_enabled";

}  // namespace swapcore::tools

#endif  // SYSTEM_TOOLS_HPP
