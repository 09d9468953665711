#ifndef SECURITY_GATE_HPP
#define SECURITY_GATE_HPP

#include "swapcore/errors.hpp"
#include "swapcore/privileged_executor.hpp"
#include "swapcore/status_model.hpp"

#include <chrono>       // for milliseconds
#include <expected>     // for expected
#include <string_view>  // for string_view

namespace swapcore::security {

/// @brief Interprets `csrutil status` output.
/// @return true when System Integrity Protection reports itself disabled.
auto parse_sip_status(std::string_view csrutil_output) noexcept -> bool;

// Queries and caches the System Integrity Protection state.
class SecurityGate final {
 public:
    SecurityGate(PrivilegedExecutor& executor, StatusModel& status, std::chrono::milliseconds timeout) noexcept;

    /// @brief Run `csrutil status` and publish the result.
    /// On failure the previously known state stays in place and an error is recorded.
    auto check() -> std::expected<SecurityState, SwapError>;

    /// @brief Last published state.
    [[nodiscard]] auto state() const -> SecurityState;

 private:
    PrivilegedExecutor& m_executor;
    StatusModel& m_status;
    std::chrono::milliseconds m_timeout;
};

}  // namespace swapcore::security

#endif  // SECURITY_GATE_HPP
