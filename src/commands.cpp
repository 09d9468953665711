#include "commands.hpp"
#include "definitions.hpp"

#include <chrono>  // for system_clock

#include <fmt/chrono.h>
#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

using namespace std::string_view_literals;

namespace {

using swapcore::StatusSnapshot;
using swapcore::disk::Volume;

void print_volumes(const StatusSnapshot& snapshot) noexcept {
    if (snapshot.available_volumes.empty()) {
        warning_inter("No selectable volumes found\n");
        return;
    }
    for (const auto& volume : snapshot.available_volumes) {
        const bool selected = snapshot.selected_target == volume.id;
        output_inter("{} {:<24} {:<32} {:>10} free of {:>10}{}{}\n",
            volume.hosts_swap_file ? '*' : (selected ? '>' : ' '),
            volume.name,
            volume.mount_path,
            swapcore::disk::format_capacity(volume.available_capacity),
            swapcore::disk::format_capacity(volume.total_capacity),
            volume.is_system_volume ? "  [system]"sv : ""sv,
            volume.is_physical_external ? "  [external]"sv : ""sv);
        output_inter("    id: {}\n", volume.id);
    }
}

void print_sip(const StatusSnapshot& snapshot) noexcept {
    if (!snapshot.security.checked_at) {
        warning_inter("SIP: unknown\n");
    } else if (snapshot.security.sip_disabled) {
        success_inter("SIP: disabled\n");
    } else {
        error_inter("SIP: enabled (relocation is refused until SIP is disabled)\n");
    }
}

void print_logs(const StatusSnapshot& snapshot) noexcept {
    for (const auto& entry : snapshot.logs) {
        const auto kind = swapcore::log_kind_to_string(entry.kind);
        const auto line = fmt::format(FMT_COMPILE("[{:%H:%M:%S}] {:<7} {}\n"),
            std::chrono::floor<std::chrono::seconds>(entry.timestamp), kind, entry.message);
        switch (entry.kind) {
        case swapcore::LogKind::Error:
            error_inter("{}", line);
            break;
        case swapcore::LogKind::Warning:
            warning_inter("{}", line);
            break;
        case swapcore::LogKind::Command:
            info_inter("{}", line);
            break;
        default:
            output_inter("{}", line);
            break;
        }
    }
}

auto print_last_error(const StatusSnapshot& snapshot) noexcept -> int {
    if (snapshot.last_error) {
        error_inter("Error: {}\n", *snapshot.last_error);
        return 1;
    }
    return 0;
}

}  // namespace

namespace swapmover {

auto resolve_volume(const std::vector<Volume>& volumes, std::string_view query) noexcept -> std::optional<Volume> {
    for (auto field : {&Volume::id, &Volume::mount_path, &Volume::name}) {
        for (const auto& volume : volumes) {
            if (volume.*field == query) {
                return volume;
            }
        }
    }
    return std::nullopt;
}

auto describe_location(const StatusSnapshot& snapshot) noexcept -> std::string {
    const auto& location = snapshot.current_location;
    if (!location) {
        return "not detected";
    }
    if (location->host_volume_id) {
        if (const auto host = swapcore::disk::find_volume_by_id(snapshot.available_volumes, *location->host_volume_id)) {
            return fmt::format(FMT_COMPILE("{} ({})"), host->name, host->mount_path);
        }
    }
    if (location->link_target) {
        return fmt::format(FMT_COMPILE("link to {}"), *location->link_target);
    }
    return "system volume";
}

auto run_command(swapcore::SwapEngine& engine, const CliOptions& options) noexcept -> int {
    switch (options.command) {
    case Command::Status: {
        const auto snapshot = engine.snapshot();
        print_sip(snapshot);
        output_inter("Swap file: {}\n", describe_location(snapshot));
        output_inter("Volume policy: {}\n", swapcore::disk::volume_policy_to_string(engine.config().volume_policy));
        print_volumes(snapshot);
        return print_last_error(snapshot);
    }
    case Command::Drives: {
        const auto snapshot = engine.snapshot();
        print_volumes(snapshot);
        return print_last_error(snapshot);
    }
    case Command::Sip: {
        const auto snapshot = engine.snapshot();
        print_sip(snapshot);
        return print_last_error(snapshot);
    }
    case Command::Logs:
        print_logs(engine.snapshot());
        return 0;
    case Command::Relocate:
        break;
    }

    const auto snapshot = engine.snapshot();
    if (snapshot.last_error) {
        // startup discovery failed, the inventory cannot be trusted
        return print_last_error(snapshot);
    }
    const auto volume = resolve_volume(snapshot.available_volumes, options.target.value_or(""));
    if (!volume) {
        error_inter("No selectable volume matches '{}'\n", options.target.value_or(""));
        return 1;
    }
    if (auto selected = engine.select_target(volume->id); !selected) {
        error_inter("{}\n", swapcore::describe(selected.error()));
        return 1;
    }

    info_inter("Moving swap file to '{}' ({})...\n", volume->name, volume->mount_path);
    if (auto result = engine.relocate_selected(); !result) {
        error_inter("Relocation failed: {}\n", swapcore::describe(result.error()));
        return 1;
    }
    success_inter("Swap file now lives on: {}\n", describe_location(engine.snapshot()));
    return 0;
}

}  // namespace swapmover
