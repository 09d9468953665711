#include "cli_options.hpp"

#include <fmt/compile.h>
#include <fmt/format.h>

using namespace std::string_view_literals;

namespace {

auto command_from_string(std::string_view name) noexcept -> std::optional<swapmover::Command> {
    using swapmover::Command;
    if (name == "status"sv) {
        return Command::Status;
    } else if (name == "drives"sv) {
        return Command::Drives;
    } else if (name == "sip"sv) {
        return Command::Sip;
    } else if (name == "relocate"sv) {
        return Command::Relocate;
    } else if (name == "logs"sv) {
        return Command::Logs;
    }
    return std::nullopt;
}

}  // namespace

namespace swapmover {

auto usage() noexcept -> std::string_view {
    return R"(Usage: swap-mover [--config <file>] <command>

Commands:
  status                 Show SIP state, swap location and selectable volumes (default)
  drives                 List selectable destination volumes
  sip                    Show System Integrity Protection state
  relocate <volume>      Move the swap file to a volume (id, mount path or name)
  logs                   Print the audit log of this run

Options:
  --config <file>        JSON configuration file
  -h, --help             Show this help
)"sv;
}

auto parse_cli_options(const std::vector<std::string_view>& args) noexcept
    -> std::expected<CliOptions, std::string> {
    CliOptions options{};
    std::optional<Command> command{};

    for (std::size_t i = 0; i < args.size(); ++i) {
        const auto arg = args[i];
        if (arg == "--config"sv) {
            if (i + 1 >= args.size()) {
                return std::unexpected("--config requires a file argument");
            }
            options.config_path = std::string{args[++i]};
            continue;
        }
        if (arg == "-h"sv || arg == "--help"sv) {
            return std::unexpected("");
        }
        if (arg.starts_with('-')) {
            return std::unexpected(fmt::format(FMT_COMPILE("Unknown option '{}'"), arg));
        }

        if (!command) {
            command = command_from_string(arg);
            if (!command) {
                return std::unexpected(fmt::format(FMT_COMPILE("Unknown command '{}'"), arg));
            }
            continue;
        }
        if (*command == Command::Relocate && !options.target) {
            options.target = std::string{arg};
            continue;
        }
        return std::unexpected(fmt::format(FMT_COMPILE("Unexpected argument '{}'"), arg));
    }

    options.command = command.value_or(Command::Status);
    if (options.command == Command::Relocate && !options.target) {
        return std::unexpected("relocate requires a destination volume");
    }
    return options;
}

}  // namespace swapmover
