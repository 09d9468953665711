#include "swapcore/drive_inventory.hpp"
#include "swapcore/string_utils.hpp"
#include "swapcore/system_tools.hpp"

#include <algorithm>     // for any_of, sort
#include <array>         // for array
#include <filesystem>    // for directory_iterator, space, canonical
#include <iterator>      // for make_move_iterator
#include <system_error>  // for error_code
#include <utility>       // for move

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

using namespace std::string_view_literals;
namespace fs = std::filesystem;

namespace {

// network, virtual and pseudo filesystems never qualify as physical storage
constexpr std::array virtual_fs_types{
    "nfs"sv,
    "smbfs"sv,
    "cifs"sv,
    "afpfs"sv,
    "autofs"sv,
    "webdav"sv,
    "ftp"sv,
    "devfs"sv,
    "vmware"sv,
    "synthetics"sv,
};

constexpr std::array external_protocols{
    "USB"sv,
    "Thunderbolt"sv,
    "SATA"sv,
    "SAS"sv,
    "FireWire"sv,
    "External"sv,
};

auto strip_trailing_slash(std::string_view path) noexcept -> std::string_view {
    while (path.size() > 1 && path.ends_with('/')) {
        path.remove_suffix(1);
    }
    return path;
}

auto canonical_or_self(const fs::path& path) noexcept -> fs::path {
    std::error_code err{};
    auto resolved = fs::canonical(path, err);
    return err ? path : resolved;
}

}  // namespace

namespace swapcore::disk {

auto is_virtual_filesystem(std::string_view fs_type) noexcept -> bool {
    return std::ranges::any_of(virtual_fs_types, [fs_type](auto&& virtual_type) { return utils::icontains(fs_type, virtual_type); });
}

auto classify_is_system_volume(const plist::Value& info, std::string_view mount_path, std::string_view name, std::string_view root_path, std::string_view system_volume_name) noexcept -> bool {
    if (plist::get_bool(info, "VolumeInfo.BootFromThisVolume"sv).value_or(false)) {
        return true;
    }
    if (strip_trailing_slash(mount_path) == strip_trailing_slash(root_path)) {
        return true;
    }
    return name == system_volume_name;
}

auto classify_is_physical_external(const plist::Value& info) noexcept -> bool {
    const auto device_node = plist::get_string(info, "DeviceNode"sv);
    if (!device_node || !device_node->starts_with("/dev/disk"sv)) {
        return false;
    }

    // filesystem type takes priority over every hardware hint
    if (const auto fs_type = plist::get_string(info, "FilesystemType"sv); fs_type && is_virtual_filesystem(*fs_type)) {
        return false;
    }

    if (const auto protocol = plist::get_string(info, "Protocol"sv); protocol) {
        const bool external_protocol = std::ranges::any_of(external_protocols, [&protocol](auto&& name) { return protocol->contains(name); });
        if (external_protocol) {
            return true;
        }
    }
    return plist::get_bool(info, "RemovableMedia"sv).value_or(false) || plist::get_bool(info, "External"sv).value_or(false);
}

auto parse_swap_link_target(std::string_view ls_output) noexcept -> std::optional<std::string> {
    for (auto&& line : utils::make_split_view(ls_output)) {
        const auto arrow_pos = line.find(" -> "sv);
        if (arrow_pos == std::string_view::npos) {
            continue;
        }
        const auto target = utils::trim(line.substr(arrow_pos + 4));
        if (!target.empty()) {
            return std::string{target};
        }
    }
    return std::nullopt;
}

auto path_has_prefix(std::string_view path, std::string_view prefix) noexcept -> bool {
    prefix = strip_trailing_slash(prefix);
    if (prefix == "/"sv) {
        return path.starts_with('/');
    }
    if (!path.starts_with(prefix)) {
        return false;
    }
    return path.size() == prefix.size() || path[prefix.size()] == '/';
}

auto find_swap_host(const std::vector<Volume>& volumes, const SwapLocation& location) noexcept -> std::optional<std::string> {
    if (location.is_symlink && location.link_target) {
        const Volume* best{nullptr};
        // a link never points back at the system volume, an unmatched target has no host
        for (const auto& volume : volumes) {
            if (volume.is_system_volume || !path_has_prefix(*location.link_target, volume.mount_path)) {
                continue;
            }
            if (best == nullptr || strip_trailing_slash(volume.mount_path).size() > strip_trailing_slash(best->mount_path).size()) {
                best = &volume;
            }
        }
        return best != nullptr ? std::optional<std::string>{best->id} : std::nullopt;
    }

    auto system_it = std::ranges::find_if(volumes, [](auto&& volume) { return volume.is_system_volume; });
    if (system_it == volumes.end()) {
        return std::nullopt;
    }
    return system_it->id;
}

void mark_swap_host(std::vector<Volume>& volumes, const std::optional<std::string>& host_id) noexcept {
    bool marked{false};
    for (auto& volume : volumes) {
        volume.hosts_swap_file = !marked && host_id && volume.id == *host_id;
        marked                 = marked || volume.hosts_swap_file;
    }
}

DriveInventory::DriveInventory(PrivilegedExecutor& executor, StatusModel& status, const EngineConfig& config) noexcept
  : m_executor(executor), m_status(status), m_config(config) { }

auto DriveInventory::enumerate_mount_paths() -> std::expected<std::vector<std::string>, SwapError> {
    std::error_code err{};
    fs::directory_iterator volumes_it{m_config.volumes_dir, err};
    if (err) {
        return std::unexpected(make_error(SwapErrorKind::UnknownError,
            fmt::format(FMT_COMPILE("failed to read '{}': {}"), m_config.volumes_dir, err.message())));
    }

    const auto root_canonical = canonical_or_self(m_config.root_path);

    std::vector<std::string> entries{};
    for (; volumes_it != fs::directory_iterator{}; volumes_it.increment(err)) {
        const auto& entry = *volumes_it;
        std::error_code entry_err{};
        if (!entry.is_directory(entry_err)) {
            continue;
        }
        // the boot volume is linked into the volumes directory as well
        if (canonical_or_self(entry.path()) == root_canonical) {
            continue;
        }
        entries.emplace_back(entry.path().string());
    }
    if (err) {
        return std::unexpected(make_error(SwapErrorKind::UnknownError,
            fmt::format(FMT_COMPILE("failed to read '{}': {}"), m_config.volumes_dir, err.message())));
    }
    std::ranges::sort(entries);

    std::vector<std::string> mount_paths{m_config.root_path};
    mount_paths.insert(mount_paths.end(), std::make_move_iterator(entries.begin()), std::make_move_iterator(entries.end()));
    return mount_paths;
}

auto DriveInventory::probe_volume(const std::string& mount_path) -> std::optional<Volume> {
    std::error_code err{};
    const auto space_info = fs::space(mount_path, err);
    if (err) {
        m_status.append_log(LogKind::Warning, fmt::format(FMT_COMPILE("Skipping volume '{}': {}"), mount_path, err.message()));
        return std::nullopt;
    }

    const auto info = m_executor.run_structured(tools::diskutil, {"info", "-plist", mount_path}, m_config.short_timeout);

    std::string name{};
    if (auto volume_name = plist::get_string(info, "VolumeName"sv); volume_name && !volume_name->empty()) {
        name = std::move(*volume_name);
    } else if (strip_trailing_slash(mount_path) == strip_trailing_slash(m_config.root_path)) {
        name = m_config.system_volume_name;
    } else {
        name = fs::path{mount_path}.filename().string();
    }

    auto volume_id = plist::get_string(info, "VolumeUUID"sv);
    if (!volume_id || volume_id->empty()) {
        volume_id = mount_path;
    }

    const bool is_system = classify_is_system_volume(info, mount_path, name, m_config.root_path, m_config.system_volume_name);
    const bool is_external = classify_is_physical_external(info);
    spdlog::debug("[inventory] '{}' at '{}': system={}, physical_external={}", name, mount_path, is_system, is_external);

    return Volume{
        .id                   = std::move(*volume_id),
        .name                 = std::move(name),
        .mount_path           = mount_path,
        .total_capacity       = space_info.capacity,
        .available_capacity   = space_info.available,
        .is_system_volume     = is_system,
        .is_physical_external = is_external,
        .hosts_swap_file      = false,
    };
}

auto DriveInventory::refresh() -> std::expected<std::vector<Volume>, SwapError> {
    auto mount_paths = enumerate_mount_paths();
    if (!mount_paths) {
        return std::unexpected(std::move(mount_paths.error()));
    }

    std::vector<Volume> volumes{};
    for (const auto& mount_path : *mount_paths) {
        if (auto volume = probe_volume(mount_path)) {
            volumes.emplace_back(std::move(*volume));
        }
    }

    auto location = detect_swap_location();
    if (location) {
        mark_swap_host(volumes, find_swap_host(volumes, *location));
    } else {
        mark_swap_host(volumes, std::nullopt);
    }
    return volumes;
}

auto DriveInventory::detect_swap_location() -> std::expected<SwapLocation, SwapError> {
    auto listing = m_executor.run(tools::ls, {"-la", m_config.swap_path}, m_config.short_timeout);
    if (!listing) {
        // the query itself failed, nothing is known about the file
        return std::unexpected(std::move(listing.error()));
    }
    if (listing->exit_status != 0) {
        return std::unexpected(make_error(SwapErrorKind::NoSwapFileDetected, std::string{utils::trim(listing->err)}));
    }

    auto link_target = parse_swap_link_target(listing->out);
    return SwapLocation{
        .is_symlink      = link_target.has_value(),
        .link_target     = std::move(link_target),
        .host_volume_id  = std::nullopt,
    };
}

auto DriveInventory::publish_volumes() -> std::expected<std::vector<Volume>, SwapError> {
    auto volumes = refresh();
    if (!volumes) {
        m_status.report_error(fmt::format(FMT_COMPILE("Failed to enumerate volumes: {}"), describe(volumes.error())));
        return std::unexpected(std::move(volumes.error()));
    }

    auto selectable = selectable_volumes(*volumes, m_config.volume_policy);
    m_status.update([&selectable](StatusFields& fields) {
        fields.available_volumes = selectable;
        if (fields.selected_target && !find_volume_by_id(selectable, *fields.selected_target)) {
            fields.selected_target = std::nullopt;
        }
    });
    m_status.append_log(LogKind::Info, fmt::format(FMT_COMPILE("Found {} selectable volume(s)"), selectable.size()));
    return selectable;
}

auto DriveInventory::publish_location() -> std::expected<SwapLocation, SwapError> {
    auto location = detect_swap_location();
    if (!location) {
        m_status.update([](StatusFields& fields) { fields.current_location = std::nullopt; });
        m_status.report_error(fmt::format(FMT_COMPILE("Failed to detect swap file location: {}"), describe(location.error())));
        return std::unexpected(std::move(location.error()));
    }

    m_status.update([&location](StatusFields& fields) {
        location->host_volume_id = find_swap_host(fields.available_volumes, *location);
        fields.current_location  = *location;
    });
    m_status.append_log(LogKind::Info, location->link_target
            ? fmt::format(FMT_COMPILE("Swap file is a link to '{}'"), *location->link_target)
            : std::string{"Swap file is on the system volume"});
    return location;
}

}  // namespace swapcore::disk
