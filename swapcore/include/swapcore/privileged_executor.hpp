#ifndef PRIVILEGED_EXECUTOR_HPP
#define PRIVILEGED_EXECUTOR_HPP

#include "swapcore/command_runner.hpp"
#include "swapcore/errors.hpp"
#include "swapcore/plist.hpp"
#include "swapcore/status_model.hpp"

#include <chrono>       // for milliseconds
#include <expected>     // for expected
#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace swapcore {

using CommandOutput = utils::ProcessResult;

/// @brief Quote one argument for /bin/sh, only when it contains characters the shell would interpret.
auto shell_quote(std::string_view arg) noexcept -> std::string;

/// @brief Render path and args as a single shell command line.
auto build_shell_command(std::string_view path, const std::vector<std::string>& args) noexcept -> std::string;

/// @brief Wrap a shell command line into an AppleScript administrator-privileges invocation.
/// @return e.g `do shell script "/bin/rm /private/var/vm/swapfile" with administrator privileges`
auto build_elevated_script(std::string_view shell_command) noexcept -> std::string;

/// Runs external commands on behalf of the engine and audits each of them
/// into the status model: a `command` entry before execution, then an
/// `output` or `error` entry.
class PrivilegedExecutor final {
 public:
    PrivilegedExecutor(CommandRunner& runner, StatusModel& status, std::chrono::milliseconds short_timeout, std::chrono::milliseconds elevated_timeout) noexcept;

    /// @brief Run a command with the caller's privileges.
    /// A non-zero exit status is not an error here; only spawn failures and timeouts are.
    auto run(std::string_view path, const std::vector<std::string>& args, std::optional<std::chrono::milliseconds> timeout)
        -> std::expected<CommandOutput, SwapError>;

    /// @brief Run a command with administrator privileges (one consent prompt per call).
    /// @return CommandExecutionFailed carrying stderr on a non-zero exit.
    auto run_elevated(std::string_view path, const std::vector<std::string>& args)
        -> std::expected<CommandOutput, SwapError>;

    /// @brief Run a command producing an XML property list and parse it.
    /// @return The parsed tree, or an empty dictionary when the command fails or emits garbage.
    auto run_structured(std::string_view path, const std::vector<std::string>& args, std::optional<std::chrono::milliseconds> timeout)
        -> plist::Value;

    /// @brief Whether sudo already holds a cached credential (`sudo -n true`).
    auto has_cached_privileges() -> bool;

    /// @brief Prompt for administrator privileges once by running a no-op elevated.
    /// @return InsufficientPermissions when the user refuses.
    auto request_privileges() -> std::expected<void, SwapError>;

    [[nodiscard]] auto elevated_timeout() const noexcept -> std::chrono::milliseconds { return m_elevated_timeout; }

 private:
    auto execute(std::vector<std::string> argv, std::string_view display, std::optional<std::chrono::milliseconds> timeout, bool elevated)
        -> std::expected<CommandOutput, SwapError>;

    CommandRunner& m_runner;
    StatusModel& m_status;
    std::chrono::milliseconds m_short_timeout;
    std::chrono::milliseconds m_elevated_timeout;
};

}  // namespace swapcore

#endif  // PRIVILEGED_EXECUTOR_HPP
