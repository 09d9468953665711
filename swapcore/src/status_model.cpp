#include "swapcore/status_model.hpp"

#include <utility>  // for move

#include <spdlog/spdlog.h>

using namespace std::string_view_literals;

namespace swapcore {

auto log_kind_to_string(LogKind kind) noexcept -> std::string_view {
    switch (kind) {
    case LogKind::Info:
        return "info"sv;
    case LogKind::Warning:
        return "warning"sv;
    case LogKind::Error:
        return "error"sv;
    case LogKind::Command:
        return "command"sv;
    case LogKind::Output:
        return "output"sv;
    }
    return "unknown"sv;
}

auto relocation_state_to_string(RelocationState state) noexcept -> std::string_view {
    switch (state) {
    case RelocationState::Idle:
        return "Idle"sv;
    case RelocationState::ValidatingPreconditions:
        return "ValidatingPreconditions"sv;
    case RelocationState::AcquiringPrivileges:
        return "AcquiringPrivileges"sv;
    case RelocationState::DisablingAccounting:
        return "DisablingAccounting"sv;
    case RelocationState::Relocating:
        return "Relocating"sv;
    case RelocationState::ReenablingAccounting:
        return "ReenablingAccounting"sv;
    case RelocationState::Completed:
        return "Completed"sv;
    case RelocationState::Failed:
        return "Failed"sv;
    }
    return "unknown"sv;
}

StatusModel::StatusModel(bool record_verbose) noexcept : m_record_verbose(record_verbose) { }

auto StatusModel::snapshot() const -> StatusSnapshot {
    const std::lock_guard<std::mutex> lock(m_mutex);
    StatusSnapshot snap{};
    static_cast<StatusFields&>(snap) = m_fields;
    snap.busy = m_busy_depth > 0;
    snap.logs = m_logs;
    return snap;
}

void StatusModel::update(const std::function<void(StatusFields&)>& mutator) {
    const std::lock_guard<std::mutex> lock(m_mutex);
    mutator(m_fields);
}

void StatusModel::append_log(LogKind kind, std::string message) {
    switch (kind) {
    case LogKind::Info:
        spdlog::info("{}", message);
        break;
    case LogKind::Warning:
        spdlog::warn("{}", message);
        break;
    case LogKind::Error:
        spdlog::error("{}", message);
        break;
    case LogKind::Command:
        spdlog::debug("[cmd] {}", message);
        break;
    case LogKind::Output:
        spdlog::debug("  └─ {}", message);
        break;
    }

    if (!m_record_verbose && kind != LogKind::Error) {
        return;
    }
    const std::lock_guard<std::mutex> lock(m_mutex);
    m_logs.emplace_back(LogEntry{.kind = kind, .message = std::move(message), .timestamp = std::chrono::system_clock::now()});
}

void StatusModel::report_error(std::string message) {
    {
        const std::lock_guard<std::mutex> lock(m_mutex);
        m_fields.last_error = message;
    }
    append_log(LogKind::Error, std::move(message));
}

void StatusModel::clear_logs() {
    const std::lock_guard<std::mutex> lock(m_mutex);
    m_logs.clear();
}

void StatusModel::begin_busy() noexcept {
    const std::lock_guard<std::mutex> lock(m_mutex);
    ++m_busy_depth;
}

void StatusModel::end_busy() noexcept {
    const std::lock_guard<std::mutex> lock(m_mutex);
    if (m_busy_depth > 0) {
        --m_busy_depth;
    }
}

auto StatusModel::is_busy() const noexcept -> bool {
    const std::lock_guard<std::mutex> lock(m_mutex);
    return m_busy_depth > 0;
}

}  // namespace swapcore
