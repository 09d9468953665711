#include "swapcore/volume.hpp"

#include <algorithm>  // for find_if, copy_if
#include <iterator>   // for back_inserter

#include <fmt/compile.h>
#include <fmt/format.h>

using namespace std::string_view_literals;

namespace swapcore::disk {

auto volume_policy_to_string(VolumePolicy policy) noexcept -> std::string_view {
    switch (policy) {
    case VolumePolicy::AllVolumes:
        return "all"sv;
    case VolumePolicy::ExternalOnly:
        return "external"sv;
    }
    return "unknown"sv;
}

auto volume_policy_from_string(std::string_view policy_str) noexcept -> std::optional<VolumePolicy> {
    if (policy_str == "all"sv) {
        return VolumePolicy::AllVolumes;
    }
    if (policy_str == "external"sv) {
        return VolumePolicy::ExternalOnly;
    }
    return std::nullopt;
}

auto selectable_volumes(const std::vector<Volume>& volumes, VolumePolicy policy) noexcept -> std::vector<Volume> {
    std::vector<Volume> selectable{};
    std::ranges::copy_if(volumes, std::back_inserter(selectable), [policy](auto&& volume) {
        if (policy == VolumePolicy::ExternalOnly) {
            return !volume.is_system_volume && volume.is_physical_external;
        }
        return volume.is_system_volume || volume.is_physical_external;
    });
    return selectable;
}

auto find_volume_by_id(const std::vector<Volume>& volumes, std::string_view id) noexcept -> std::optional<Volume> {
    auto it = std::ranges::find_if(volumes, [id](auto&& volume) { return volume.id == id; });
    if (it != std::ranges::end(volumes)) {
        return std::make_optional<Volume>(*it);
    }
    return std::nullopt;
}

auto format_capacity(std::uint64_t bytes) noexcept -> std::string {
    constexpr double GB = 1'000'000'000.0;
    return fmt::format(FMT_COMPILE("{:.1f} GB"), static_cast<double>(bytes) / GB);
}

}  // namespace swapcore::disk
