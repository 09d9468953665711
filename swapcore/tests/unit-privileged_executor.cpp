#include "doctest_compatibility.h"

#include "fake_command_runner.hpp"
#include "test_env.hpp"

#include "swapcore/privileged_executor.hpp"
#include "swapcore/status_model.hpp"

#include <chrono>
#include <string>
#include <string_view>
#include <vector>

using namespace std::string_view_literals;
using namespace std::string_literals;
using namespace std::chrono_literals;

using swapcore::LogKind;
using swapcore::SwapErrorKind;
using swapcore::test::FakeCommandRunner;
using swapcore::test::exit_with;
using swapcore::test::ok;

TEST_CASE("elevated command quoting")
{
    SECTION("plain arguments are left alone")
    {
        REQUIRE_EQ(swapcore::shell_quote("/private/var/vm/swapfile"sv), "/private/var/vm/swapfile"s);
        REQUIRE_EQ(swapcore::shell_quote("vm.swap_enabled=0"sv), "vm.swap_enabled=0"s);
    }
    SECTION("spaces and quotes are single-quoted")
    {
        REQUIRE_EQ(swapcore::shell_quote("/Volumes/My Drive"sv), "'/Volumes/My Drive'"s);
        REQUIRE_EQ(swapcore::shell_quote("Bob's Disk"sv), R"('Bob'\''s Disk')"s);
        REQUIRE_EQ(swapcore::shell_quote(""sv), "''"s);
    }
    SECTION("shell command line")
    {
        const auto command = swapcore::build_shell_command("/bin/mkdir"sv, {"-p", "/Volumes/My Drive/private/var/vm"});
        REQUIRE_EQ(command, "/bin/mkdir -p '/Volumes/My Drive/private/var/vm'"s);
    }
    SECTION("applescript escaping")
    {
        REQUIRE_EQ(swapcore::build_elevated_script("/bin/rm /private/var/vm/swapfile"sv),
            R"(do shell script "/bin/rm /private/var/vm/swapfile" with administrator privileges)"s);
        REQUIRE_EQ(swapcore::build_elevated_script(R"(/bin/echo "a\b")"sv),
            R"(do shell script "/bin/echo \"a\\b\"" with administrator privileges)"s);
    }
}

TEST_CASE("privileged executor")
{
    swapcore::test::silence_logging();

    FakeCommandRunner runner{};
    swapcore::StatusModel status{};
    swapcore::PrivilegedExecutor executor{runner, status, 3000ms, 120000ms};

    SECTION("command and output entries bracket every run")
    {
        runner.on("csrutil status", ok("System Integrity Protection status: enabled.\n"));

        auto result = executor.run("/usr/bin/csrutil"sv, {"status"}, 5000ms);
        REQUIRE(result.has_value());
        REQUIRE_EQ(result->exit_status, 0);

        const auto logs = status.snapshot().logs;
        REQUIRE_EQ(logs.size(), 2);
        REQUIRE(logs[0].kind == LogKind::Command);
        REQUIRE_EQ(logs[0].message, "/usr/bin/csrutil status"s);
        REQUIRE(logs[1].kind == LogKind::Output);
        REQUIRE_EQ(logs[1].message, "System Integrity Protection status: enabled."s);

        const auto calls = runner.calls();
        REQUIRE_EQ(calls.size(), 1);
        REQUIRE(calls[0].timeout == std::optional{5000ms});
    }
    SECTION("non-zero exit is returned, not raised")
    {
        runner.on("test -f", exit_with(1));

        auto result = executor.run("/bin/test"sv, {"-f", "/Volumes/External/private/var/vm/swapfile"}, 3000ms);
        REQUIRE(result.has_value());
        REQUIRE_EQ(result->exit_status, 1);
        REQUIRE(!status.snapshot().last_error.has_value());
    }
    SECTION("timeout is an error entry")
    {
        runner.on("ls -la", swapcore::test::Response{std::unexpected(swapcore::make_error(SwapErrorKind::CommandTimedOut, "'/bin/ls' exceeded 3000ms"))});

        auto result = executor.run("/bin/ls"sv, {"-la", "/private/var/vm/swapfile"}, 3000ms);
        REQUIRE(!result.has_value());
        REQUIRE(result.error().kind == SwapErrorKind::CommandTimedOut);

        const auto logs = status.snapshot().logs;
        REQUIRE_EQ(logs.size(), 2);
        REQUIRE(logs[0].kind == LogKind::Command);
        REQUIRE(logs[1].kind == LogKind::Error);
    }
    SECTION("elevated run goes through osascript")
    {
        auto result = executor.run_elevated("/bin/ln"sv, {"-s", "/Volumes/My Drive/private/var/vm/swapfile", "/private/var/vm/swapfile"});
        REQUIRE(result.has_value());

        const auto calls = runner.calls();
        REQUIRE_EQ(calls.size(), 1);
        REQUIRE_EQ(calls[0].argv.size(), 3);
        REQUIRE_EQ(calls[0].argv[0], "/usr/bin/osascript"s);
        REQUIRE_EQ(calls[0].argv[1], "-e"s);
        REQUIRE(calls[0].elevated);
        REQUIRE_EQ(calls[0].command_line, "/bin/ln -s '/Volumes/My Drive/private/var/vm/swapfile' /private/var/vm/swapfile"s);
        REQUIRE(calls[0].timeout == std::optional{120000ms});

        // the audit log shows the inner command
        REQUIRE_EQ(status.snapshot().logs[0].message, calls[0].command_line);
    }
    SECTION("elevated failure carries stderr")
    {
        runner.on("/bin/cp", exit_with(1, "cp: /Volumes/External: Permission denied\n"));

        auto result = executor.run_elevated("/bin/cp"sv, {"/private/var/vm/swapfile", "/Volumes/External/private/var/vm/swapfile"});
        REQUIRE(!result.has_value());
        REQUIRE(result.error().kind == SwapErrorKind::CommandExecutionFailed);
        REQUIRE_EQ(result.error().detail, "cp: /Volumes/External: Permission denied"s);
        REQUIRE(status.snapshot().logs.back().kind == LogKind::Error);
    }
    SECTION("structured output")
    {
        runner.on("diskutil info -plist /Volumes/External", ok(swapcore::test::volume_plist("External", "EXT-UUID", "/dev/disk4s1", "USB", "exfat")));
        runner.on("diskutil info -plist /Volumes/Gone", exit_with(1, "Could not find disk: /Volumes/Gone\n"));
        runner.on("diskutil info -plist /Volumes/Garbage", ok("not a plist at all"));

        const auto info = executor.run_structured("/usr/sbin/diskutil"sv, {"info", "-plist", "/Volumes/External"}, 15000ms);
        REQUIRE_EQ(swapcore::plist::get_string(info, "VolumeUUID"sv), std::optional<std::string>{"EXT-UUID"});

        const auto gone = executor.run_structured("/usr/sbin/diskutil"sv, {"info", "-plist", "/Volumes/Gone"}, 15000ms);
        REQUIRE(gone.is_dict());
        REQUIRE(gone.empty());

        const auto garbage = executor.run_structured("/usr/sbin/diskutil"sv, {"info", "-plist", "/Volumes/Garbage"}, 15000ms);
        REQUIRE(garbage.is_dict());
        REQUIRE(garbage.empty());
    }
    SECTION("cached privileges")
    {
        runner.on("sudo -n true", ok());
        REQUIRE(executor.has_cached_privileges());

        runner.on("sudo -n true", exit_with(1, "sudo: a password is required\n"));
        REQUIRE(!executor.has_cached_privileges());
        REQUIRE(runner.elevated_commands().empty());
    }
    SECTION("privilege request")
    {
        REQUIRE(executor.request_privileges().has_value());

        runner.on("/usr/bin/true", exit_with(1, "execution error: User canceled. (-128)\n"));
        auto refused = executor.request_privileges();
        REQUIRE(!refused.has_value());
        REQUIRE(refused.error().kind == SwapErrorKind::InsufficientPermissions);
        REQUIRE_EQ(runner.elevated_commands().size(), 2);
    }
}
