#ifndef VOLUME_HPP
#define VOLUME_HPP

#include <cstdint>      // for uint64_t, uint8_t
#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace swapcore::disk {

/// @brief Represents one mounted filesystem.
struct Volume final {
    /// Stable identifier (VolumeUUID, or the mount path when unknown).
    std::string id{};
    /// Display name (e.g., Macintosh HD).
    std::string name{};
    /// Mount path (e.g., /Volumes/External).
    std::string mount_path{};
    /// Total capacity in bytes.
    std::uint64_t total_capacity{0};
    /// Available capacity in bytes.
    std::uint64_t available_capacity{0};
    /// Whether this is the system boot volume.
    bool is_system_volume{false};
    /// Whether the volume lives on a physical, externally attached device.
    bool is_physical_external{false};
    /// Whether the swap file currently lives on this volume.
    bool hosts_swap_file{false};

    auto operator==(const Volume&) const -> bool = default;
};

/// @brief Where the canonical swap path currently points.
struct SwapLocation final {
    /// Whether the canonical swap path is a symbolic link.
    bool is_symlink{false};
    /// Link target, when the canonical path is a symbolic link.
    std::optional<std::string> link_target{};
    /// Id of the volume hosting the swap file, once matched against an inventory.
    std::optional<std::string> host_volume_id{};

    auto operator==(const SwapLocation&) const -> bool = default;
};

/// @brief Which volumes are offered as relocation targets.
enum class VolumePolicy : std::uint8_t {
    /// Every non-virtual mounted volume, the system volume included.
    AllVolumes,
    /// Non-boot physical-external volumes only.
    ExternalOnly
};

/// @brief Convert volume policy to its configuration name ("all"/"external").
auto volume_policy_to_string(VolumePolicy policy) noexcept -> std::string_view;

/// @brief Parse volume policy from its configuration name.
auto volume_policy_from_string(std::string_view policy_str) noexcept -> std::optional<VolumePolicy>;

/// @brief Filters an inventory down to the volumes the policy allows as destinations.
/// @param volumes Classified inventory.
/// @param policy Selection policy.
/// @return Selectable volumes, in inventory order.
auto selectable_volumes(const std::vector<Volume>& volumes, VolumePolicy policy) noexcept -> std::vector<Volume>;

/// @brief Finds a volume by its id.
auto find_volume_by_id(const std::vector<Volume>& volumes, std::string_view id) noexcept -> std::optional<Volume>;

/// @brief Formats a capacity in decimal gigabytes, e.g "500.1 GB".
auto format_capacity(std::uint64_t bytes) noexcept -> std::string;

}  // namespace swapcore::disk

#endif  // VOLUME_HPP
