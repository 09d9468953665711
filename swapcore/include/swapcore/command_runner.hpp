#ifndef COMMAND_RUNNER_HPP
#define COMMAND_RUNNER_HPP

#include "swapcore/errors.hpp"
#include "swapcore/subprocess.hpp"

#include <chrono>    // for milliseconds
#include <expected>  // for expected
#include <optional>  // for optional
#include <string>    // for string
#include <vector>    // for vector

namespace swapcore {

/// Spawns external processes. Everything that touches the OS goes
/// through this seam, so the engine can be driven by a scripted runner.
class CommandRunner {
 public:
    virtual ~CommandRunner() = default;

    /// @brief Run argv to completion.
    /// @param argv Absolute executable path followed by its arguments.
    /// @param timeout Deadline, std::nullopt waits forever.
    virtual auto run(const std::vector<std::string>& argv, std::optional<std::chrono::milliseconds> timeout)
        -> std::expected<utils::ProcessResult, SwapError> = 0;
};

/// Production runner backed by subprocess.h.
class SubprocessRunner final : public CommandRunner {
 public:
    auto run(const std::vector<std::string>& argv, std::optional<std::chrono::milliseconds> timeout)
        -> std::expected<utils::ProcessResult, SwapError> override {
        return utils::run_process(argv, timeout);
    }
};

}  // namespace swapcore

#endif  // COMMAND_RUNNER_HPP
