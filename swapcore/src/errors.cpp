#include "swapcore/errors.hpp"

#include <fmt/compile.h>
#include <fmt/format.h>

using namespace std::string_view_literals;

namespace swapcore {

auto to_string(SwapErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
    case SwapErrorKind::SipEnabled:
        return "SIPEnabled"sv;
    case SwapErrorKind::InsufficientPermissions:
        return "InsufficientPermissions"sv;
    case SwapErrorKind::CommandExecutionFailed:
        return "CommandExecutionFailed"sv;
    case SwapErrorKind::DriveNotFound:
        return "DriveNotFound"sv;
    case SwapErrorKind::NoSwapFileDetected:
        return "NoSwapFileDetected"sv;
    case SwapErrorKind::CommandTimedOut:
        return "CommandTimedOut"sv;
    case SwapErrorKind::RelocationInProgress:
        return "RelocationInProgress"sv;
    case SwapErrorKind::UnknownError:
    default:
        return "UnknownError"sv;
    }
}

auto describe(const SwapError& error) noexcept -> std::string {
    if (error.detail.empty()) {
        return std::string{to_string(error.kind)};
    }
    return fmt::format(FMT_COMPILE("{}: {}"), to_string(error.kind), error.detail);
}

}  // namespace swapcore
