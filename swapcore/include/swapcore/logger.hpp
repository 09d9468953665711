#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <memory>  // for shared_ptr

#include <spdlog/spdlog.h>

namespace swapcore::logger {

// Set library default logger
void set_logger(std::shared_ptr<spdlog::logger> default_logger) noexcept;

// Whether spawned argv should be dumped (LOG_EXEC_CMDS=1)
auto log_exec_cmds() noexcept -> bool;

}  // namespace swapcore::logger

#endif  // LOGGER_HPP
