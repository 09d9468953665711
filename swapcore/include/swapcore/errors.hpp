#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <cstdint>      // for uint8_t
#include <string>       // for string
#include <string_view>  // for string_view
#include <utility>      // for move

namespace swapcore {

/// @brief Failure kinds surfaced by the engine.
enum class SwapErrorKind : std::uint8_t {
    SipEnabled,
    InsufficientPermissions,
    CommandExecutionFailed,
    DriveNotFound,
    NoSwapFileDetected,
    CommandTimedOut,
    RelocationInProgress,
    UnknownError
};

/// @brief Typed failure with free-form detail (captured stderr, path, ...).
struct SwapError final {
    SwapErrorKind kind{SwapErrorKind::UnknownError};
    std::string detail{};

    auto operator==(const SwapError&) const -> bool = default;
};

/// @brief Convert error kind to its short name.
/// @param kind The kind to convert.
/// @return string view of the kind, e.g "CommandTimedOut".
auto to_string(SwapErrorKind kind) noexcept -> std::string_view;

/// @brief Renders error as "<kind>: <detail>" (or just "<kind>" with empty detail).
auto describe(const SwapError& error) noexcept -> std::string;

/// @brief Shorthand constructor.
inline auto make_error(SwapErrorKind kind, std::string detail = {}) -> SwapError {
    return SwapError{.kind = kind, .detail = std::move(detail)};
}

}  // namespace swapcore

#endif  // ERRORS_HPP
