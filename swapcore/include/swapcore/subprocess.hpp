#ifndef SUBPROCESS_HPP
#define SUBPROCESS_HPP

#include "swapcore/errors.hpp"

#include <chrono>      // for milliseconds
#include <cstdint>     // for int32_t
#include <expected>    // for expected
#include <memory>      // for unique_ptr
#include <optional>    // for optional
#include <stop_token>  // for stop_token
#include <string>      // for string
#include <vector>      // for vector

namespace swapcore::utils {

/// @brief Captured outcome of a finished process.
struct ProcessResult final {
    /// Everything the process wrote to stdout.
    std::string out{};
    /// Everything the process wrote to stderr.
    std::string err{};
    /// Exit status reported by the OS.
    std::int32_t exit_status{-1};
};

// Wrapper around thirdparty subprocess handle
class SubProcess final {
 public:
    SubProcess();
    ~SubProcess();

    // explicitly deleted (move-only)
    SubProcess(const SubProcess&)     = delete;
    auto operator=(const SubProcess&) = delete;

    SubProcess(SubProcess&& other) noexcept;
    auto operator=(SubProcess&& other) noexcept -> SubProcess&;

    /// @brief Spawn argv[0] with the remaining args, stdout and stderr piped separately.
    /// @return true when the process has been spawned.
    [[nodiscard]] auto spawn(const std::vector<std::string>& argv) noexcept -> bool;

    /// @return true when the process has been spawned and has a valid child pid.
    [[nodiscard]] auto has_child() const noexcept -> bool;

    /// @brief Drain stdout until EOF or until a stop is requested.
    void read_stdout(std::string& out, std::stop_token stop) noexcept;

    /// @brief Drain stderr until EOF or until a stop is requested.
    void read_stderr(std::string& err, std::stop_token stop) noexcept;

    /// @brief Block until the child exits, leaving it unreaped.
    void wait_exit() noexcept;

    /// @brief Send SIGKILL to the child.
    /// @return true on success.
    auto terminate() noexcept -> bool;

    /// @brief Reap the child and fetch its exit status.
    /// @return true on success.
    auto join(std::int32_t& exit_status) noexcept -> bool;

 private:
    struct Impl;
    std::unique_ptr<Impl> m_impl;
};

/// @brief Run argv to completion, racing it against an optional deadline.
///
/// Once the deadline fires the child is killed, the pipe readers are stopped
/// and the call fails with CommandTimedOut, even if the child happens to exit
/// in the meantime. Descendants still holding the pipes are not waited for.
/// The reader threads and the child are always joined before returning.
/// @param argv Absolute executable path followed by its arguments.
/// @param timeout Deadline, std::nullopt waits forever.
/// @return The captured result, or CommandTimedOut/CommandExecutionFailed.
auto run_process(const std::vector<std::string>& argv, std::optional<std::chrono::milliseconds> timeout)
    -> std::expected<ProcessResult, SwapError>;

}  // namespace swapcore::utils

#endif  // SUBPROCESS_HPP
