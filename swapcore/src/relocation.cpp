#include "swapcore/relocation.hpp"
#include "swapcore/string_utils.hpp"
#include "swapcore/system_tools.hpp"

#include <utility>  // for move

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

using namespace std::string_view_literals;

namespace {

using swapcore::relocation::RelocationStep;
using swapcore::relocation::StepKind;

auto parent_dir(std::string_view path) noexcept -> std::string {
    const auto pos = path.rfind('/');
    if (pos == std::string_view::npos || pos == 0) {
        return "/";
    }
    return std::string{path.substr(0, pos)};
}

auto elevated(std::string_view path, std::vector<std::string> args) noexcept -> RelocationStep {
    return RelocationStep{.kind = StepKind::Elevated, .path = std::string{path}, .args = std::move(args)};
}

auto remove_if_present(std::string_view path) noexcept -> RelocationStep {
    return RelocationStep{.kind = StepKind::RemoveIfPresent, .path = std::string{path}, .args = {}};
}

// Clears the in-flight flag once the relocation returns.
class InFlightGuard final {
 public:
    explicit InFlightGuard(std::atomic_bool& flag) noexcept : m_flag(flag) { }
    ~InFlightGuard() { m_flag.store(false); }

    InFlightGuard(const InFlightGuard&) = delete;
    auto operator=(const InFlightGuard&) = delete;

 private:
    std::atomic_bool& m_flag;
};

}  // namespace

namespace swapcore::relocation {

auto target_swap_path(const disk::Volume& destination, std::string_view swap_path) noexcept -> std::string {
    if (destination.is_system_volume) {
        return std::string{swap_path};
    }
    std::string_view mount_path{destination.mount_path};
    while (mount_path.ends_with('/')) {
        mount_path.remove_suffix(1);
    }
    return fmt::format(FMT_COMPILE("{}{}"), mount_path, swap_path);
}

auto plan_relocation(const disk::Volume& destination, const std::optional<disk::SwapLocation>& current, const EngineConfig& config) noexcept
    -> std::vector<RelocationStep> {
    const auto& swap_path = config.swap_path;
    const auto target     = target_swap_path(destination, swap_path);

    std::vector<RelocationStep> steps{};

    // no swap file found, materialize a fresh one
    if (!current) {
        steps.emplace_back(elevated(tools::mkdir, {"-p", parent_dir(target)}));
        steps.emplace_back(remove_if_present(target));
        steps.emplace_back(elevated(tools::dd, {"if=/dev/zero", fmt::format(FMT_COMPILE("of={}"), target), "bs=1m", fmt::format(FMT_COMPILE("count={}"), config.default_swap_size_mib)}));
        steps.emplace_back(elevated(tools::chmod, {"644", target}));
        if (target != swap_path) {
            steps.emplace_back(elevated(tools::ln, {"-s", target, swap_path}));
        }
        return steps;
    }

    if (destination.is_system_volume) {
        // back to the system volume: drop the link, let dynamic_pager recreate the file
        if (current->is_symlink) {
            steps.emplace_back(elevated(tools::rm, {swap_path}));
            steps.emplace_back(elevated(tools::dynamic_pager, {"-F", swap_path}));
        }
        return steps;
    }

    steps.emplace_back(elevated(tools::mkdir, {"-p", parent_dir(target)}));
    steps.emplace_back(remove_if_present(target));
    steps.emplace_back(elevated(tools::cp, {swap_path, target}));
    steps.emplace_back(elevated(tools::chmod, {"644", target}));
    if (current->is_symlink && current->link_target) {
        steps.emplace_back(elevated(tools::rm, {*current->link_target}));
    }
    steps.emplace_back(elevated(tools::rm, {swap_path}));
    steps.emplace_back(elevated(tools::ln, {"-s", target, swap_path}));
    return steps;
}

RelocationOrchestrator::RelocationOrchestrator(PrivilegedExecutor& executor, disk::DriveInventory& inventory, StatusModel& status, const EngineConfig& config) noexcept
  : m_executor(executor), m_inventory(inventory), m_status(status), m_config(config) { }

void RelocationOrchestrator::set_state(RelocationState state) {
    spdlog::debug("[relocation] state := {}", relocation_state_to_string(state));
    m_status.update([state](StatusFields& fields) { fields.relocation_state = state; });
}

auto RelocationOrchestrator::relocate(std::string_view destination_id) -> std::expected<void, SwapError> {
    bool expected_idle{false};
    if (!m_in_flight.compare_exchange_strong(expected_idle, true)) {
        auto error = make_error(SwapErrorKind::RelocationInProgress, "another relocation is running");
        m_status.report_error(fmt::format(FMT_COMPILE("Relocation rejected: {}"), describe(error)));
        return std::unexpected(std::move(error));
    }
    const InFlightGuard in_flight{m_in_flight};
    const BusyScope busy{m_status};

    m_status.append_log(LogKind::Info, fmt::format(FMT_COMPILE("Relocating swap file to volume '{}'"), destination_id));
    auto result = run_sequence(destination_id);
    if (!result) {
        set_state(RelocationState::Failed);
        m_status.report_error(fmt::format(FMT_COMPILE("Relocation failed: {}"), describe(result.error())));
        return result;
    }
    set_state(RelocationState::Completed);
    m_status.append_log(LogKind::Info, "Relocation completed");
    return result;
}

auto RelocationOrchestrator::run_sequence(std::string_view destination_id) -> std::expected<void, SwapError> {
    set_state(RelocationState::ValidatingPreconditions);
    auto preconditions = validate(destination_id);
    if (!preconditions) {
        return std::unexpected(std::move(preconditions.error()));
    }
    if (preconditions->already_in_place) {
        m_status.append_log(LogKind::Info, fmt::format(FMT_COMPILE("Swap file already lives on '{}', nothing to do"), preconditions->destination.name));
        return {};
    }

    set_state(RelocationState::AcquiringPrivileges);
    if (auto privileges = acquire_privileges(); !privileges) {
        return std::unexpected(std::move(privileges.error()));
    }

    set_state(RelocationState::DisablingAccounting);
    if (auto disabled = disable_accounting(); !disabled) {
        rollback_accounting();
        return std::unexpected(std::move(disabled.error()));
    }

    set_state(RelocationState::Relocating);
    const auto steps = plan_relocation(preconditions->destination, preconditions->current, m_config);
    if (auto moved = execute_plan(steps); !moved) {
        rollback_accounting();
        return std::unexpected(std::move(moved.error()));
    }

    set_state(RelocationState::ReenablingAccounting);
    if (auto enabled = enable_accounting(); !enabled) {
        return std::unexpected(make_error(SwapErrorKind::CommandExecutionFailed,
            fmt::format(FMT_COMPILE("failed to re-enable swap: {}"), describe(enabled.error()))));
    }

    // the relocation itself succeeded, refresh failures only end up in the log
    if (auto volumes = m_inventory.publish_volumes(); !volumes) {
        spdlog::warn("[relocation] inventory refresh failed: {}", describe(volumes.error()));
    }
    if (auto location = m_inventory.publish_location(); !location) {
        spdlog::warn("[relocation] location refresh failed: {}", describe(location.error()));
    }
    return {};
}

auto RelocationOrchestrator::validate(std::string_view destination_id) -> std::expected<Preconditions, SwapError> {
    const auto snapshot = m_status.snapshot();
    if (!snapshot.security.sip_disabled) {
        return std::unexpected(make_error(SwapErrorKind::SipEnabled, "System Integrity Protection is enabled"));
    }

    auto destination = disk::find_volume_by_id(snapshot.available_volumes, destination_id);
    if (!destination) {
        return std::unexpected(make_error(SwapErrorKind::DriveNotFound, std::string{destination_id}));
    }

    Preconditions preconditions{.destination = std::move(*destination), .current = std::nullopt, .already_in_place = false};

    auto location = m_inventory.detect_swap_location();
    if (!location) {
        if (location.error().kind != SwapErrorKind::NoSwapFileDetected) {
            return std::unexpected(std::move(location.error()));
        }
        m_status.append_log(LogKind::Warning, fmt::format(FMT_COMPILE("No swap file detected ({}), a new one will be created"), describe(location.error())));
        return preconditions;
    }

    location->host_volume_id = disk::find_swap_host(snapshot.available_volumes, *location);
    preconditions.already_in_place = location->host_volume_id == preconditions.destination.id;
    preconditions.current = std::move(*location);
    return preconditions;
}

auto RelocationOrchestrator::acquire_privileges() -> std::expected<void, SwapError> {
    if (m_executor.has_cached_privileges()) {
        m_status.append_log(LogKind::Info, "Administrator privileges already cached");
        return {};
    }
    m_status.append_log(LogKind::Info, "Requesting administrator privileges");
    return m_executor.request_privileges();
}

auto RelocationOrchestrator::disable_accounting() -> std::expected<void, SwapError> {
    auto status = m_executor.run(tools::sysctl, {std::string{tools::swap_enabled_key}}, m_config.short_timeout);
    if (!status) {
        return std::unexpected(std::move(status.error()));
    }
    if (status->exit_status != 0) {
        return std::unexpected(make_error(SwapErrorKind::CommandExecutionFailed, std::string{utils::trim(status->err)}));
    }

    if (!status->out.contains(": 1"sv)) {
        m_status.append_log(LogKind::Info, "Swap is already disabled");
        return {};
    }
    auto disabled = m_executor.run_elevated(tools::sysctl, {"-w", fmt::format(FMT_COMPILE("{}=0"), tools::swap_enabled_key)});
    if (!disabled) {
        return std::unexpected(std::move(disabled.error()));
    }
    return {};
}

auto RelocationOrchestrator::execute_plan(const std::vector<RelocationStep>& steps) -> std::expected<void, SwapError> {
    for (const auto& step : steps) {
        if (step.kind == StepKind::RemoveIfPresent) {
            auto probe = m_executor.run(tools::test, {"-f", step.path}, m_config.short_timeout);
            if (!probe) {
                return std::unexpected(std::move(probe.error()));
            }
            if (probe->exit_status != 0) {
                continue;
            }
            if (auto removed = m_executor.run_elevated(tools::rm, {step.path}); !removed) {
                return std::unexpected(std::move(removed.error()));
            }
            continue;
        }

        if (auto result = m_executor.run_elevated(step.path, step.args); !result) {
            return std::unexpected(std::move(result.error()));
        }
    }
    return {};
}

auto RelocationOrchestrator::enable_accounting() -> std::expected<void, SwapError> {
    auto enabled = m_executor.run_elevated(tools::sysctl, {"-w", fmt::format(FMT_COMPILE("{}=1"), tools::swap_enabled_key)});
    if (!enabled) {
        return std::unexpected(std::move(enabled.error()));
    }
    return {};
}

void RelocationOrchestrator::rollback_accounting() {
    m_status.append_log(LogKind::Warning, "Re-enabling swap after failure");
    if (auto enabled = enable_accounting(); !enabled) {
        m_status.append_log(LogKind::Error, fmt::format(FMT_COMPILE("Rollback failed: {}"), describe(enabled.error())));
    }
}

}  // namespace swapcore::relocation
