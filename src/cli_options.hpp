#ifndef CLI_OPTIONS_HPP
#define CLI_OPTIONS_HPP

#include <cstdint>      // for uint8_t
#include <expected>     // for expected
#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace swapmover {

/// Front-end commands.
enum class Command : std::uint8_t {
    Status,
    Drives,
    Sip,
    Relocate,
    Logs
};

inline constexpr std::string_view default_config_path = "/usr/local/etc/swap-mover.json";

/// Parsed command line.
struct CliOptions {
    Command command{Command::Status};
    /// Volume id, mount path or name (relocate only).
    std::optional<std::string> target{};
    std::string config_path{default_config_path};
};

/// Parses the arguments following argv[0].
/// @param args Command line arguments.
/// @return CliOptions on success, or a usage error message.
[[nodiscard]] auto parse_cli_options(const std::vector<std::string_view>& args) noexcept
    -> std::expected<CliOptions, std::string>;

/// Help text listing commands and options.
[[nodiscard]] auto usage() noexcept -> std::string_view;

}  // namespace swapmover

#endif  // CLI_OPTIONS_HPP
