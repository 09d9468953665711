#ifndef COMMANDS_HPP
#define COMMANDS_HPP

#include "cli_options.hpp"

#include "swapcore/status_model.hpp"
#include "swapcore/swap_engine.hpp"
#include "swapcore/volume.hpp"

#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace swapmover {

/// Resolves a user supplied volume reference, matched by id, then mount path, then name.
[[nodiscard]] auto resolve_volume(const std::vector<swapcore::disk::Volume>& volumes, std::string_view query) noexcept
    -> std::optional<swapcore::disk::Volume>;

/// Human readable swap location, e.g "system volume" or "External (/Volumes/External)".
[[nodiscard]] auto describe_location(const swapcore::StatusSnapshot& snapshot) noexcept -> std::string;

/// Runs the requested command against an initialized engine.
/// @return Process exit status.
auto run_command(swapcore::SwapEngine& engine, const CliOptions& options) noexcept -> int;

}  // namespace swapmover

#endif  // COMMANDS_HPP
