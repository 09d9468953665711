#ifndef ENGINE_CONFIG_HPP
#define ENGINE_CONFIG_HPP

#include "swapcore/volume.hpp"

#include <chrono>       // for milliseconds
#include <cstdint>      // for uint32_t
#include <expected>     // for expected
#include <string>       // for string
#include <string_view>  // for string_view

namespace swapcore {

/// Engine configuration.
struct EngineConfig {
    // Layout
    std::string swap_path{"/private/var/vm/swapfile"};
    std::string swap_dir{"/private/var/vm"};
    std::string volumes_dir{"/Volumes"};
    std::string root_path{"/"};
    std::string system_volume_name{"Macintosh HD"};

    // Destination policy
    disk::VolumePolicy volume_policy{disk::VolumePolicy::AllVolumes};

    // Command deadlines
    std::chrono::milliseconds short_timeout{3000};
    std::chrono::milliseconds medium_timeout{5000};
    std::chrono::milliseconds long_timeout{15000};
    std::chrono::milliseconds elevated_timeout{120000};

    // Size of a freshly materialized swap file
    std::uint32_t default_swap_size_mib{1024};

    // Logging
    std::string log_file{"/tmp/swap-mover.log"};
    bool debug{true};
};

/// Returns EngineConfig with the stock macOS defaults.
[[nodiscard]] auto get_default_engine_config() noexcept -> EngineConfig;

/// Parses engine configuration from JSON string content.
/// @param json_content The JSON configuration content.
/// @return EngineConfig on success, or error string on failure.
[[nodiscard]] auto parse_engine_config(std::string_view json_content) noexcept
    -> std::expected<EngineConfig, std::string>;

/// Loads engine configuration from a file; a missing file yields defaults.
/// @param config_path Path to the JSON file.
/// @return EngineConfig on success, or error string on failure.
[[nodiscard]] auto load_engine_config(std::string_view config_path) noexcept
    -> std::expected<EngineConfig, std::string>;

}  // namespace swapcore

#endif  // ENGINE_CONFIG_HPP
