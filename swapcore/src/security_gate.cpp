#include "swapcore/security_gate.hpp"
#include "swapcore/string_utils.hpp"
#include "swapcore/system_tools.hpp"

#include <utility>  // for move

#include <fmt/compile.h>
#include <fmt/format.h>

using namespace std::string_view_literals;

namespace swapcore::security {

auto parse_sip_status(std::string_view csrutil_output) noexcept -> bool {
    return utils::icontains(csrutil_output, "disabled"sv);
}

SecurityGate::SecurityGate(PrivilegedExecutor& executor, StatusModel& status, std::chrono::milliseconds timeout) noexcept
  : m_executor(executor), m_status(status), m_timeout(timeout) { }

auto SecurityGate::check() -> std::expected<SecurityState, SwapError> {
    auto result = m_executor.run(tools::csrutil, {"status"}, m_timeout);
    if (!result) {
        m_status.report_error(fmt::format(FMT_COMPILE("Failed to query SIP status: {}"), describe(result.error())));
        return std::unexpected(std::move(result.error()));
    }
    if (result->exit_status != 0) {
        auto error = make_error(SwapErrorKind::CommandExecutionFailed, std::string{utils::trim(result->err)});
        m_status.report_error(fmt::format(FMT_COMPILE("Failed to query SIP status: {}"), describe(error)));
        return std::unexpected(std::move(error));
    }

    const SecurityState state{
        .sip_disabled = parse_sip_status(result->out),
        .checked_at   = std::chrono::system_clock::now(),
    };
    m_status.update([&state](StatusFields& fields) { fields.security = state; });
    m_status.append_log(LogKind::Info, state.sip_disabled ? "SIP is disabled" : "SIP is enabled");
    return state;
}

auto SecurityGate::state() const -> SecurityState {
    return m_status.snapshot().security;
}

}  // namespace swapcore::security
