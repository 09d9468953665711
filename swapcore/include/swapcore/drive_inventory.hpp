#ifndef DRIVE_INVENTORY_HPP
#define DRIVE_INVENTORY_HPP

#include "swapcore/engine_config.hpp"
#include "swapcore/errors.hpp"
#include "swapcore/plist.hpp"
#include "swapcore/privileged_executor.hpp"
#include "swapcore/status_model.hpp"
#include "swapcore/volume.hpp"

#include <expected>     // for expected
#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace swapcore::disk {

/// @brief Checks whether a filesystem type names a network, virtual or pseudo filesystem.
/// @param fs_type The FilesystemType reported by diskutil (e.g., "smbfs").
auto is_virtual_filesystem(std::string_view fs_type) noexcept -> bool;

/// @brief Determines whether a volume is the system boot volume.
/// @param info Parsed `diskutil info -plist` output.
/// @param mount_path Mount path of the volume.
/// @param name Display name of the volume.
/// @param root_path Root mount path (usually "/").
/// @param system_volume_name Well-known name of the system volume.
auto classify_is_system_volume(const plist::Value& info, std::string_view mount_path, std::string_view name, std::string_view root_path, std::string_view system_volume_name) noexcept -> bool;

/// @brief Determines whether a volume lives on a physical, externally attached device.
/// @param info Parsed `diskutil info -plist` output.
auto classify_is_physical_external(const plist::Value& info) noexcept -> bool;

/// @brief Extracts the target of a symbolic link from `ls -la` output.
/// @return The link target, or std::nullopt when the listing is not a link.
auto parse_swap_link_target(std::string_view ls_output) noexcept -> std::optional<std::string>;

/// @brief Checks whether path lies under prefix, comparing whole path components.
auto path_has_prefix(std::string_view path, std::string_view prefix) noexcept -> bool;

/// @brief Finds the volume hosting the swap file.
///
/// A link target is matched against the non-system volume with the longest
/// mount path prefix; a regular file belongs to the system volume.
/// @return Id of the hosting volume, std::nullopt when none matches.
auto find_swap_host(const std::vector<Volume>& volumes, const SwapLocation& location) noexcept -> std::optional<std::string>;

/// @brief Marks at most one volume as swap host.
void mark_swap_host(std::vector<Volume>& volumes, const std::optional<std::string>& host_id) noexcept;

// Enumerates and classifies mounted volumes.
class DriveInventory final {
 public:
    DriveInventory(PrivilegedExecutor& executor, StatusModel& status, const EngineConfig& config) noexcept;

    /// @brief Rebuild the classified inventory, swap host flag included.
    /// @return Every classified volume, the root volume first.
    auto refresh() -> std::expected<std::vector<Volume>, SwapError>;

    /// @brief Inspect the canonical swap path with `ls -la`.
    /// @return NoSwapFileDetected when `ls` reports the path missing, or the
    /// runner error (CommandTimedOut, CommandExecutionFailed) when the query fails.
    auto detect_swap_location() -> std::expected<SwapLocation, SwapError>;

    /// @brief Refresh and publish the selectable volumes into the status model.
    /// A selected target that is no longer selectable is dropped.
    /// @return The selectable volumes.
    auto publish_volumes() -> std::expected<std::vector<Volume>, SwapError>;

    /// @brief Detect and publish the swap location, matched against the published volumes.
    auto publish_location() -> std::expected<SwapLocation, SwapError>;

 private:
    auto enumerate_mount_paths() -> std::expected<std::vector<std::string>, SwapError>;
    auto probe_volume(const std::string& mount_path) -> std::optional<Volume>;

    PrivilegedExecutor& m_executor;
    StatusModel& m_status;
    const EngineConfig& m_config;
};

}  // namespace swapcore::disk

#endif  // DRIVE_INVENTORY_HPP
