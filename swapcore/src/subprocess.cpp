#include "swapcore/subprocess.hpp"
#include "swapcore/logger.hpp"

#include <poll.h>      // for poll, pollfd
#include <sys/wait.h>  // for waitid

#include <cerrno>   // for errno, EINTR
#include <cstdint>  // for uint32_t
#include <cstdio>   // for fileno
#include <cstring>  // for strerror

#include <array>    // for array
#include <chrono>   // for steady_clock
#include <future>   // for promise, future_status
#include <thread>   // for jthread
#include <utility>  // for move

#include <subprocess.h>

#include <fmt/compile.h>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

namespace {

// poll interval of the pipe readers, bounds how long a stop request goes unnoticed
constexpr int pipe_poll_ms = 50;

template <typename ReadFn>
void drain_pipe(int fd, std::string& sink, const std::stop_token& stop, ReadFn&& read_fn) noexcept {
    std::array<char, 8192> buf{};
    while (!stop.stop_requested()) {
        pollfd pfd{.fd = fd, .events = POLLIN, .revents = 0};
        const int ready = ::poll(&pfd, 1, pipe_poll_ms);
        if (ready == -1) {
            if (errno == EINTR) {
                continue;
            }
            spdlog::error("[run_process] poll failed: {}", std::strerror(errno));
            return;
        }
        if (ready == 0) {
            continue;
        }
        const auto bytes_read = read_fn(buf.data(), static_cast<std::uint32_t>(buf.size()));
        if (bytes_read == 0) {
            return;
        }
        sink.append(buf.data(), bytes_read);
    }
}

}  // namespace

namespace swapcore::utils {

struct SubProcess::Impl {
    subprocess_s proc{};
    bool spawned{false};
    bool reaped{false};
};

SubProcess::SubProcess() : m_impl(std::make_unique<Impl>()) { }

SubProcess::~SubProcess() {
    if (m_impl && m_impl->spawned) {
        subprocess_destroy(&m_impl->proc);
    }
}

SubProcess::SubProcess(SubProcess&& other) noexcept = default;

auto SubProcess::operator=(SubProcess&& other) noexcept -> SubProcess& {
    if (this != &other) {
        if (m_impl && m_impl->spawned) {
            subprocess_destroy(&m_impl->proc);
        }
        m_impl = std::move(other.m_impl);
    }
    return *this;
}

auto SubProcess::spawn(const std::vector<std::string>& argv) noexcept -> bool {
    if (!m_impl || m_impl->spawned || argv.empty()) {
        return false;
    }

    std::vector<const char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        args.push_back(arg.c_str());
    }
    args.push_back(nullptr);

    static constexpr const char* environment[] = {"PATH=/usr/bin:/bin:/usr/sbin:/sbin:/usr/local/bin", nullptr};
    if (subprocess_create_ex(args.data(), subprocess_option_enable_async, environment, &m_impl->proc) != 0) {
        return false;
    }
    m_impl->spawned = true;
    return true;
}

auto SubProcess::has_child() const noexcept -> bool {
    return m_impl && m_impl->spawned && m_impl->proc.child != 0;
}

void SubProcess::read_stdout(std::string& out, std::stop_token stop) noexcept {
    if (!has_child()) {
        return;
    }
    drain_pipe(::fileno(subprocess_stdout(&m_impl->proc)), out, stop, [this](char* buf, std::uint32_t size) {
        return subprocess_read_stdout(&m_impl->proc, buf, size);
    });
}

void SubProcess::read_stderr(std::string& err, std::stop_token stop) noexcept {
    if (!has_child()) {
        return;
    }
    drain_pipe(::fileno(subprocess_stderr(&m_impl->proc)), err, stop, [this](char* buf, std::uint32_t size) {
        return subprocess_read_stderr(&m_impl->proc, buf, size);
    });
}

void SubProcess::wait_exit() noexcept {
    if (!has_child()) {
        return;
    }
    // WNOWAIT keeps the pid valid for terminate() until join() reaps it
    siginfo_t info{};
    while (waitid(P_PID, static_cast<id_t>(m_impl->proc.child), &info, WEXITED | WNOWAIT) == -1 && errno == EINTR) { }
}

auto SubProcess::terminate() noexcept -> bool {
    return has_child() && !m_impl->reaped && subprocess_terminate(&m_impl->proc) == 0;
}

auto SubProcess::join(std::int32_t& exit_status) noexcept -> bool {
    if (!has_child()) {
        return false;
    }
    int ret{-1};
    if (subprocess_join(&m_impl->proc, &ret) != 0) {
        return false;
    }
    m_impl->reaped = true;
    exit_status    = static_cast<std::int32_t>(ret);
    return true;
}

auto run_process(const std::vector<std::string>& argv, std::optional<std::chrono::milliseconds> timeout)
    -> std::expected<ProcessResult, SwapError> {
    if (argv.empty()) {
        return std::unexpected(make_error(SwapErrorKind::UnknownError, "empty command line"));
    }
    if (logger::log_exec_cmds()) {
        spdlog::debug("[run_process] cmd := {}", argv);
    }

    SubProcess child{};
    if (!child.spawn(argv)) {
        spdlog::error("[run_process] Failed to spawn '{}'", argv.front());
        return std::unexpected(make_error(SwapErrorKind::CommandExecutionFailed,
            fmt::format(FMT_COMPILE("failed to launch '{}'"), argv.front())));
    }

    ProcessResult result{};
    std::promise<void> exited{};
    std::promise<void> stderr_closed{};
    auto exited_future        = exited.get_future();
    auto stderr_closed_future = stderr_closed.get_future();
    bool timed_out{false};
    {
        std::jthread stderr_reader([&](std::stop_token stop) {
            child.read_stderr(result.err, stop);
            stderr_closed.set_value();
        });
        std::jthread stdout_reader([&](std::stop_token stop) {
            child.read_stdout(result.out, stop);
            child.wait_exit();
            exited.set_value();
        });

        if (timeout) {
            const auto deadline = std::chrono::steady_clock::now() + *timeout;
            timed_out = exited_future.wait_until(deadline) == std::future_status::timeout
                || stderr_closed_future.wait_until(deadline) == std::future_status::timeout;
            if (timed_out && !child.terminate()) {
                spdlog::warn("[run_process] Failed to terminate '{}'", argv.front());
            }
        } else {
            exited_future.wait();
            stderr_closed_future.wait();
        }
        // leaving the scope stops and joins the readers, descendants holding the pipes are not waited for
    }

    if (!child.join(result.exit_status)) {
        spdlog::error("[run_process] Failed to join process '{}'", argv.front());
        if (!timed_out) {
            return std::unexpected(make_error(SwapErrorKind::CommandExecutionFailed,
                fmt::format(FMT_COMPILE("failed to join '{}'"), argv.front())));
        }
    }
    if (timed_out) {
        return std::unexpected(make_error(SwapErrorKind::CommandTimedOut,
            fmt::format(FMT_COMPILE("'{}' exceeded {}ms"), argv.front(), timeout->count())));
    }
    return result;
}

}  // namespace swapcore::utils
