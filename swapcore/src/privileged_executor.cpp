#include "swapcore/privileged_executor.hpp"
#include "swapcore/logger.hpp"
#include "swapcore/string_utils.hpp"
#include "swapcore/system_tools.hpp"

#include <algorithm>  // for all_of
#include <utility>    // for move

#include <fmt/compile.h>
#include <fmt/format.h>
#include <fmt/ranges.h>

#include <spdlog/spdlog.h>

using namespace std::string_view_literals;

namespace {

constexpr auto is_shell_safe(char ch) noexcept -> bool {
    if ((ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || (ch >= '0' && ch <= '9')) {
        return true;
    }
    return "/._-+=:,@%"sv.contains(ch);
}

auto describe_output(const swapcore::CommandOutput& output) noexcept -> std::string {
    const auto out = swapcore::utils::trim(output.out);
    if (out.empty()) {
        return fmt::format(FMT_COMPILE("exit status {}"), output.exit_status);
    }
    return std::string{out};
}

}  // namespace

namespace swapcore {

auto shell_quote(std::string_view arg) noexcept -> std::string {
    if (!arg.empty() && std::ranges::all_of(arg, is_shell_safe)) {
        return std::string{arg};
    }
    std::string quoted{"'"};
    for (const char ch : arg) {
        if (ch == '\'') {
            quoted += R"('\'')";
        } else {
            quoted += ch;
        }
    }
    quoted += '\'';
    return quoted;
}

auto build_shell_command(std::string_view path, const std::vector<std::string>& args) noexcept -> std::string {
    auto command = shell_quote(path);
    for (const auto& arg : args) {
        command += ' ';
        command += shell_quote(arg);
    }
    return command;
}

auto build_elevated_script(std::string_view shell_command) noexcept -> std::string {
    std::string escaped{};
    escaped.reserve(shell_command.size());
    for (const char ch : shell_command) {
        if (ch == '\\' || ch == '"') {
            escaped += '\\';
        }
        escaped += ch;
    }
    return fmt::format(FMT_COMPILE("do shell script \"{}\" with administrator privileges"), escaped);
}

PrivilegedExecutor::PrivilegedExecutor(CommandRunner& runner, StatusModel& status, std::chrono::milliseconds short_timeout, std::chrono::milliseconds elevated_timeout) noexcept
  : m_runner(runner), m_status(status), m_short_timeout(short_timeout), m_elevated_timeout(elevated_timeout) { }

auto PrivilegedExecutor::execute(std::vector<std::string> argv, std::string_view display, std::optional<std::chrono::milliseconds> timeout, bool elevated)
    -> std::expected<CommandOutput, SwapError> {
    m_status.append_log(LogKind::Command, std::string{display});
    if (logger::log_exec_cmds()) {
        spdlog::debug("[exec] cmd := {}", argv);
    }

    auto result = m_runner.run(argv, timeout);
    if (!result) {
        m_status.append_log(LogKind::Error, describe(result.error()));
        return std::unexpected(std::move(result.error()));
    }

    if (result->exit_status == 0) {
        m_status.append_log(LogKind::Output, describe_output(*result));
        return result;
    }

    const auto err = utils::trim(result->err);
    if (elevated) {
        m_status.append_log(LogKind::Error, fmt::format(FMT_COMPILE("'{}' failed with exit status {}: {}"), display, result->exit_status, err));
        return std::unexpected(make_error(SwapErrorKind::CommandExecutionFailed, std::string{err}));
    }
    m_status.append_log(LogKind::Output, fmt::format(FMT_COMPILE("exit status {}{}{}"), result->exit_status, err.empty() ? ""sv : ": "sv, err));
    return result;
}

auto PrivilegedExecutor::run(std::string_view path, const std::vector<std::string>& args, std::optional<std::chrono::milliseconds> timeout)
    -> std::expected<CommandOutput, SwapError> {
    std::vector<std::string> argv{std::string{path}};
    argv.insert(argv.end(), args.begin(), args.end());
    return execute(std::move(argv), build_shell_command(path, args), timeout, false);
}

auto PrivilegedExecutor::run_elevated(std::string_view path, const std::vector<std::string>& args)
    -> std::expected<CommandOutput, SwapError> {
    const auto shell_command = build_shell_command(path, args);
    std::vector<std::string> argv{std::string{tools::osascript}, "-e", build_elevated_script(shell_command)};
    return execute(std::move(argv), shell_command, m_elevated_timeout, true);
}

auto PrivilegedExecutor::run_structured(std::string_view path, const std::vector<std::string>& args, std::optional<std::chrono::milliseconds> timeout)
    -> plist::Value {
    auto result = run(path, args, timeout);
    if (!result || result->exit_status != 0) {
        return plist::Value{.data = plist::Value::Dictionary{}};
    }
    return plist::parse_plist(result->out);
}

auto PrivilegedExecutor::has_cached_privileges() -> bool {
    auto result = run(tools::sudo, {"-n", "true"}, m_short_timeout);
    return result && result->exit_status == 0;
}

auto PrivilegedExecutor::request_privileges() -> std::expected<void, SwapError> {
    auto result = run_elevated(tools::true_cmd, {});
    if (result) {
        return {};
    }
    if (result.error().kind == SwapErrorKind::CommandTimedOut) {
        return std::unexpected(std::move(result.error()));
    }
    return std::unexpected(make_error(SwapErrorKind::InsufficientPermissions, std::move(result.error().detail)));
}

}  // namespace swapcore
