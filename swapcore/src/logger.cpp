#include "swapcore/logger.hpp"

#include <cstdlib>      // for getenv
#include <string_view>  // for string_view
#include <utility>      // for move

#include <spdlog/spdlog.h>

using namespace std::string_view_literals;

namespace swapcore::logger {

void set_logger(std::shared_ptr<spdlog::logger> default_logger) noexcept {
    spdlog::set_default_logger(std::move(default_logger));
}

auto log_exec_cmds() noexcept -> bool {
    const char* const raw_val = std::getenv("LOG_EXEC_CMDS");
    return raw_val != nullptr && std::string_view{raw_val} == "1"sv;
}

}  // namespace swapcore::logger
