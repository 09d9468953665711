#include "doctest_compatibility.h"

#include "fake_command_runner.hpp"
#include "test_env.hpp"

#include "swapcore/relocation.hpp"
#include "swapcore/swap_engine.hpp"

#include <algorithm>  // for any_of, count_if, none_of
#include <array>      // for array
#include <chrono>     // for milliseconds
#include <expected>   // for expected
#include <future>     // for promise, future
#include <string>
#include <string_view>
#include <thread>  // for jthread
#include <vector>

using namespace std::string_view_literals;
using namespace std::string_literals;

using swapcore::SwapErrorKind;
using swapcore::test::ScriptedMac;
using swapcore::test::exit_with;
using swapcore::test::index_of;
using swapcore::test::ok;

namespace {

auto is_file_mutation(std::string_view command) -> bool {
    return std::ranges::any_of(std::array{"/bin/mkdir"sv, "/bin/cp"sv, "/bin/chmod"sv, "/bin/rm"sv, "/bin/ln"sv, "/bin/dd"sv, "/usr/sbin/dynamic_pager"sv},
        [command](auto&& tool) { return command.starts_with(tool); });
}

auto count_kind(const std::vector<swapcore::LogEntry>& logs, swapcore::LogKind kind) -> std::ptrdiff_t {
    return std::ranges::count_if(logs, [kind](auto&& entry) { return entry.kind == kind; });
}

}  // namespace

TEST_CASE("relocation plan")
{
    using swapcore::relocation::RelocationStep;
    using swapcore::relocation::StepKind;
    using swapcore::relocation::plan_relocation;

    const swapcore::EngineConfig config{};
    const swapcore::disk::Volume system_volume{.id = "SYS", .name = "Macintosh HD", .mount_path = "/", .is_system_volume = true};
    const swapcore::disk::Volume external_volume{.id = "EXT", .name = "External", .mount_path = "/Volumes/External", .is_physical_external = true};

    SECTION("target path")
    {
        REQUIRE_EQ(swapcore::relocation::target_swap_path(system_volume, config.swap_path), "/private/var/vm/swapfile"s);
        REQUIRE_EQ(swapcore::relocation::target_swap_path(external_volume, config.swap_path), "/Volumes/External/private/var/vm/swapfile"s);
    }
    SECTION("system file onto external volume")
    {
        const swapcore::disk::SwapLocation current{.is_symlink = false};
        const auto steps = plan_relocation(external_volume, current, config);

        const std::vector<RelocationStep> expected{
            {.kind = StepKind::Elevated, .path = "/bin/mkdir", .args = {"-p", "/Volumes/External/private/var/vm"}},
            {.kind = StepKind::RemoveIfPresent, .path = "/Volumes/External/private/var/vm/swapfile", .args = {}},
            {.kind = StepKind::Elevated, .path = "/bin/cp", .args = {"/private/var/vm/swapfile", "/Volumes/External/private/var/vm/swapfile"}},
            {.kind = StepKind::Elevated, .path = "/bin/chmod", .args = {"644", "/Volumes/External/private/var/vm/swapfile"}},
            {.kind = StepKind::Elevated, .path = "/bin/rm", .args = {"/private/var/vm/swapfile"}},
            {.kind = StepKind::Elevated, .path = "/bin/ln", .args = {"-s", "/Volumes/External/private/var/vm/swapfile", "/private/var/vm/swapfile"}},
        };
        REQUIRE(steps == expected);
    }
    SECTION("linked file onto another external volume removes the old target")
    {
        const swapcore::disk::SwapLocation current{.is_symlink = true, .link_target = "/Volumes/Old/private/var/vm/swapfile"};
        const auto steps = plan_relocation(external_volume, current, config);

        REQUIRE_EQ(steps.size(), 7);
        REQUIRE(steps[4] == RelocationStep{.kind = StepKind::Elevated, .path = "/bin/rm", .args = {"/Volumes/Old/private/var/vm/swapfile"}});
        REQUIRE(steps[5] == RelocationStep{.kind = StepKind::Elevated, .path = "/bin/rm", .args = {"/private/var/vm/swapfile"}});
    }
    SECTION("linked file back onto the system volume")
    {
        const swapcore::disk::SwapLocation current{.is_symlink = true, .link_target = "/Volumes/External/private/var/vm/swapfile"};
        const auto steps = plan_relocation(system_volume, current, config);

        const std::vector<RelocationStep> expected{
            {.kind = StepKind::Elevated, .path = "/bin/rm", .args = {"/private/var/vm/swapfile"}},
            {.kind = StepKind::Elevated, .path = "/usr/sbin/dynamic_pager", .args = {"-F", "/private/var/vm/swapfile"}},
        };
        REQUIRE(steps == expected);
    }
    SECTION("missing swap file is created with dd")
    {
        auto custom = config;
        custom.default_swap_size_mib = 2048;
        const auto steps = plan_relocation(external_volume, std::nullopt, custom);

        REQUIRE_EQ(steps.size(), 5);
        REQUIRE(steps[2] == RelocationStep{.kind = StepKind::Elevated, .path = "/bin/dd", .args = {"if=/dev/zero", "of=/Volumes/External/private/var/vm/swapfile", "bs=1m", "count=2048"}});
        REQUIRE_EQ(steps[4].path, "/bin/ln"s);
    }
    SECTION("missing swap file on the system volume needs no link")
    {
        const auto steps = plan_relocation(system_volume, std::nullopt, config);
        REQUIRE_EQ(steps.size(), 4);
        REQUIRE(std::ranges::none_of(steps, [](auto&& step) { return step.path == "/bin/ln"; }));
    }
}

TEST_CASE("relocation orchestration")
{
    swapcore::test::silence_logging();

    SECTION("system volume to external volume")
    {
        ScriptedMac mac{"reloc-a"};
        swapcore::SwapEngine engine{mac.runner, mac.config};
        engine.initialize();

        const auto before = engine.snapshot();
        REQUIRE(before.security.sip_disabled);
        REQUIRE_EQ(before.available_volumes.size(), 2);
        REQUIRE_EQ(before.current_location->host_volume_id, std::optional<std::string>{"SYS-UUID"});

        auto result = engine.relocate(ScriptedMac::external_id);
        REQUIRE(result.has_value());

        const auto target   = mac.external_target();
        const auto elevated = mac.runner.elevated_commands();
        const std::vector<std::string> expected{
            "/usr/sbin/sysctl -w vm.swap_enabled=0",
            "/bin/mkdir -p " + mac.external_path + "/private/var/vm",
            "/bin/cp /private/var/vm/swapfile " + target,
            "/bin/chmod 644 " + target,
            "/bin/rm /private/var/vm/swapfile",
            "/bin/ln -s " + target + " /private/var/vm/swapfile",
            "/usr/sbin/sysctl -w vm.swap_enabled=1",
        };
        REQUIRE(elevated == expected);

        const auto after = engine.snapshot();
        REQUIRE(!after.busy);
        REQUIRE(!after.last_error.has_value());
        REQUIRE(after.relocation_state == swapcore::RelocationState::Completed);
        REQUIRE(after.current_location.has_value());
        REQUIRE(after.current_location->is_symlink);
        REQUIRE_EQ(after.current_location->host_volume_id, std::optional<std::string>{"EXT-UUID"});

        const auto host = swapcore::disk::find_volume_by_id(after.available_volumes, ScriptedMac::external_id);
        REQUIRE(host.has_value());
        REQUIRE(host->hosts_swap_file);
    }
    SECTION("SIP enabled refuses before any command")
    {
        ScriptedMac mac{"reloc-b"};
        mac.runner.on("csrutil status", ok("System Integrity Protection status: enabled.\n"));
        swapcore::SwapEngine engine{mac.runner, mac.config};
        engine.initialize();

        const auto before      = engine.snapshot();
        const auto calls_before = mac.runner.calls().size();
        REQUIRE(!before.security.sip_disabled);

        auto result = engine.relocate(ScriptedMac::external_id);
        REQUIRE(!result.has_value());
        REQUIRE(result.error().kind == SwapErrorKind::SipEnabled);

        const auto after = engine.snapshot();
        REQUIRE(!after.busy);
        REQUIRE_EQ(mac.runner.calls().size(), calls_before);
        REQUIRE(mac.runner.elevated_commands().empty());
        REQUIRE_EQ(count_kind(after.logs, swapcore::LogKind::Command), count_kind(before.logs, swapcore::LogKind::Command));
        REQUIRE(after.relocation_state == swapcore::RelocationState::Failed);
    }
    SECTION("disable times out with a zero elevated deadline")
    {
        ScriptedMac mac{"reloc-c"};
        mac.config.elevated_timeout = std::chrono::milliseconds{0};
        swapcore::SwapEngine engine{mac.runner, mac.config};
        engine.initialize();

        auto result = engine.relocate(ScriptedMac::external_id);
        REQUIRE(!result.has_value());
        REQUIRE(result.error().kind == SwapErrorKind::CommandTimedOut);

        const auto elevated = mac.runner.elevated_commands();
        REQUIRE(std::ranges::none_of(elevated, is_file_mutation));
        REQUIRE_EQ(index_of(elevated, "vm.swap_enabled=0"), 0);
        // rollback is still attempted
        REQUIRE(index_of(elevated, "vm.swap_enabled=1") > 0);
        REQUIRE(!engine.snapshot().busy);
    }
    SECTION("failed copy re-enables swap before failing")
    {
        ScriptedMac mac{"reloc-rollback"};
        mac.runner.on("/bin/cp", exit_with(1, "cp: No space left on device\n"));
        swapcore::SwapEngine engine{mac.runner, mac.config};
        engine.initialize();

        auto result = engine.relocate(ScriptedMac::external_id);
        REQUIRE(!result.has_value());
        REQUIRE(result.error().kind == SwapErrorKind::CommandExecutionFailed);
        REQUIRE(result.error().detail.contains("No space left"));

        const auto elevated = mac.runner.elevated_commands();
        REQUIRE(!elevated.empty());
        REQUIRE_EQ(elevated.back(), "/usr/sbin/sysctl -w vm.swap_enabled=1"s);
        REQUIRE_EQ(index_of(elevated, "/bin/ln"), -1);
        REQUIRE_EQ(index_of(elevated, "/bin/rm"), -1);

        const auto snapshot = engine.snapshot();
        REQUIRE(snapshot.last_error.has_value());
        REQUIRE(snapshot.relocation_state == swapcore::RelocationState::Failed);
    }
    SECTION("existing target file is removed first")
    {
        ScriptedMac mac{"reloc-existing"};
        mac.runner.on("test -f", ok());
        swapcore::SwapEngine engine{mac.runner, mac.config};
        engine.initialize();

        REQUIRE(engine.relocate(ScriptedMac::external_id).has_value());
        const auto elevated = mac.runner.elevated_commands();
        const auto remove_target = index_of(elevated, "/bin/rm " + mac.external_target());
        REQUIRE(remove_target > index_of(elevated, "/bin/mkdir"));
        REQUIRE(remove_target < index_of(elevated, "/bin/cp"));
    }
    SECTION("relocating onto the current host is a no-op")
    {
        ScriptedMac mac{"reloc-idempotent"};
        mac.link_to(mac.external_target());
        swapcore::SwapEngine engine{mac.runner, mac.config};
        engine.initialize();

        auto result = engine.relocate(ScriptedMac::external_id);
        REQUIRE(result.has_value());
        REQUIRE(mac.runner.elevated_commands().empty());
        REQUIRE_EQ(mac.runner.count_matching("sudo -n true"), 0);
        REQUIRE(engine.snapshot().relocation_state == swapcore::RelocationState::Completed);
    }
    SECTION("external volume back to the system volume")
    {
        ScriptedMac mac{"reloc-back"};
        mac.link_to(mac.external_target());
        swapcore::SwapEngine engine{mac.runner, mac.config};
        engine.initialize();

        REQUIRE(engine.relocate(ScriptedMac::system_id).has_value());
        const std::vector<std::string> expected{
            "/usr/sbin/sysctl -w vm.swap_enabled=0",
            "/bin/rm /private/var/vm/swapfile",
            "/usr/sbin/dynamic_pager -F /private/var/vm/swapfile",
            "/usr/sbin/sysctl -w vm.swap_enabled=1",
        };
        REQUIRE(mac.runner.elevated_commands() == expected);
        REQUIRE_EQ(engine.snapshot().current_location->host_volume_id, std::optional<std::string>{"SYS-UUID"});
    }
    SECTION("link to an unmounted volume is replaced on the system volume")
    {
        ScriptedMac mac{"reloc-dangling"};
        mac.link_to("/Volumes/Gone/private/var/vm/swapfile");
        swapcore::SwapEngine engine{mac.runner, mac.config};
        engine.initialize();

        const auto before = engine.snapshot();
        REQUIRE(before.current_location->is_symlink);
        REQUIRE(!before.current_location->host_volume_id.has_value());

        REQUIRE(engine.relocate(ScriptedMac::system_id).has_value());
        const std::vector<std::string> expected{
            "/usr/sbin/sysctl -w vm.swap_enabled=0",
            "/bin/rm /private/var/vm/swapfile",
            "/usr/sbin/dynamic_pager -F /private/var/vm/swapfile",
            "/usr/sbin/sysctl -w vm.swap_enabled=1",
        };
        REQUIRE(mac.runner.elevated_commands() == expected);
        REQUIRE_EQ(engine.snapshot().current_location->host_volume_id, std::optional<std::string>{"SYS-UUID"});
    }
    SECTION("failed location query aborts before any privileged command")
    {
        ScriptedMac mac{"reloc-ls-timeout"};
        swapcore::SwapEngine engine{mac.runner, mac.config};
        engine.initialize();

        mac.runner.on("ls -la", swapcore::test::Response{std::unexpected(swapcore::make_error(SwapErrorKind::CommandTimedOut, "'/bin/ls' exceeded 3000ms"))});
        mac.runner.on("test -f", ok());

        for (const auto destination : {ScriptedMac::system_id, ScriptedMac::external_id}) {
            auto result = engine.relocate(destination);
            REQUIRE(!result.has_value());
            REQUIRE(result.error().kind == SwapErrorKind::CommandTimedOut);
        }
        REQUIRE(mac.runner.elevated_commands().empty());
        REQUIRE_EQ(mac.runner.count_matching("sudo -n true"), 0);
        REQUIRE_EQ(mac.runner.count_matching("test -f"), 0);
        REQUIRE(engine.snapshot().relocation_state == swapcore::RelocationState::Failed);
    }
    SECTION("swap accounting already off is not disabled again")
    {
        ScriptedMac mac{"reloc-swapoff"};
        mac.runner.on("sysctl vm.swap_enabled", ok("vm.swap_enabled: 0\n"));
        swapcore::SwapEngine engine{mac.runner, mac.config};
        engine.initialize();

        REQUIRE(engine.relocate(ScriptedMac::external_id).has_value());
        const auto elevated = mac.runner.elevated_commands();
        REQUIRE_EQ(index_of(elevated, "vm.swap_enabled=0"), -1);
        REQUIRE_EQ(elevated.back(), "/usr/sbin/sysctl -w vm.swap_enabled=1"s);
    }
    SECTION("missing swap file is materialized on the destination")
    {
        ScriptedMac mac{"reloc-missing"};
        mac.remove_swap_file();
        swapcore::SwapEngine engine{mac.runner, mac.config};
        engine.initialize();

        REQUIRE(engine.relocate(ScriptedMac::external_id).has_value());
        const auto elevated = mac.runner.elevated_commands();
        REQUIRE(index_of(elevated, "/bin/dd if=/dev/zero of=" + mac.external_target() + " bs=1m count=1024") > 0);
        REQUIRE_EQ(index_of(elevated, "/bin/cp"), -1);
    }
    SECTION("unknown destination")
    {
        ScriptedMac mac{"reloc-unknown"};
        swapcore::SwapEngine engine{mac.runner, mac.config};
        engine.initialize();

        auto result = engine.relocate("NOPE"sv);
        REQUIRE(!result.has_value());
        REQUIRE(result.error().kind == SwapErrorKind::DriveNotFound);
        REQUIRE(mac.runner.elevated_commands().empty());
    }
    SECTION("refused authorization")
    {
        ScriptedMac mac{"reloc-refused"};
        mac.runner.on("sudo -n true", exit_with(1, "sudo: a password is required\n"));
        mac.runner.on("/usr/bin/true", exit_with(1, "execution error: User canceled. (-128)\n"));
        swapcore::SwapEngine engine{mac.runner, mac.config};
        engine.initialize();

        auto result = engine.relocate(ScriptedMac::external_id);
        REQUIRE(!result.has_value());
        REQUIRE(result.error().kind == SwapErrorKind::InsufficientPermissions);
        REQUIRE(mac.runner.elevated_commands() == std::vector<std::string>{"/usr/bin/true"});
    }
    SECTION("re-enable failure is reported")
    {
        ScriptedMac mac{"reloc-reenable"};
        mac.runner.on("vm.swap_enabled=1", exit_with(1, "sysctl: permission denied\n"));
        swapcore::SwapEngine engine{mac.runner, mac.config};
        engine.initialize();

        auto result = engine.relocate(ScriptedMac::external_id);
        REQUIRE(!result.has_value());
        REQUIRE(result.error().kind == SwapErrorKind::CommandExecutionFailed);
        // the move itself is not undone
        REQUIRE(index_of(mac.runner.elevated_commands(), "/bin/ln -s") > 0);
        REQUIRE_EQ(mac.runner.count_matching("vm.swap_enabled=1"), 1);
    }
    SECTION("second concurrent relocation is rejected")
    {
        ScriptedMac mac{"reloc-concurrent"};
        std::promise<void> entered{};
        std::promise<void> release{};
        auto release_future = release.get_future().share();
        mac.runner.on("sudo -n true", std::function<swapcore::test::Response()>{[&entered, release_future] {
            entered.set_value();
            release_future.wait();
            return ok();
        }});

        swapcore::SwapEngine engine{mac.runner, mac.config};
        engine.initialize();

        std::expected<void, swapcore::SwapError> first{};
        std::expected<void, swapcore::SwapError> second{};
        bool busy_while_running{false};
        {
            const std::jthread worker([&] { first = engine.relocate(ScriptedMac::external_id); });
            entered.get_future().wait();

            second             = engine.relocate(ScriptedMac::external_id);
            busy_while_running = engine.snapshot().busy;
            release.set_value();
        }
        REQUIRE(!second.has_value());
        REQUIRE(second.error().kind == SwapErrorKind::RelocationInProgress);
        REQUIRE(busy_while_running);
        REQUIRE(first.has_value());
        REQUIRE(!engine.snapshot().busy);
    }
}
