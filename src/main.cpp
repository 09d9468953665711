#include "cli_options.hpp"  // for parse_cli_options
#include "commands.hpp"     // for run_command
#include "definitions.hpp"  // for error_inter

// import swapcore
#include "swapcore/command_runner.hpp"
#include "swapcore/engine_config.hpp"
#include "swapcore/logger.hpp"
#include "swapcore/swap_engine.hpp"

#include <chrono>       // for seconds
#include <memory>       // for shared_ptr
#include <string_view>  // for string_view
#include <vector>       // for vector

#include <spdlog/async.h>                  // for create_async
#include <spdlog/common.h>                 // for debug
#include <spdlog/sinks/basic_file_sink.h>  // for basic_file_sink_mt
#include <spdlog/spdlog.h>                 // for set_default_logger, set_level

int main(int argc, char** argv) {
    const std::vector<std::string_view> args(argv + 1, argv + argc);

    const auto& options = swapmover::parse_cli_options(args);
    if (!options) {
        if (options.error().empty()) {
            output_inter("{}", swapmover::usage());
            return 0;
        }
        error_inter("{}\n\n", options.error());
        output_inter("{}", swapmover::usage());
        return 2;
    }

    // Load engine config.
    const auto& config = swapcore::load_engine_config(options->config_path);
    if (!config) {
        error_inter("Invalid configuration '{}': {}\n", options->config_path, config.error());
        return 1;
    }

    // Initialize logger.
    std::shared_ptr<spdlog::logger> logger{};
    try {
        logger = spdlog::create_async<spdlog::sinks::basic_file_sink_mt>("swap_mover_logger", config->log_file);
    } catch (const spdlog::spdlog_ex& ex) {
        error_inter("Failed to open log file '{}': {}\n", config->log_file, ex.what());
        return 1;
    }
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%r][%^---%L---%$] %v");
    spdlog::set_level(config->debug ? spdlog::level::debug : spdlog::level::info);
    spdlog::flush_every(std::chrono::seconds(5));

    // Set swapcore logger.
    swapcore::logger::set_logger(logger);

    swapcore::SubprocessRunner runner{};
    swapcore::SwapEngine engine{runner, *config};
    engine.initialize();

    const int ret = swapmover::run_command(engine, *options);

    spdlog::shutdown();
    return ret;
}
