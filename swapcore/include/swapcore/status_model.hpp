#ifndef STATUS_MODEL_HPP
#define STATUS_MODEL_HPP

#include "swapcore/volume.hpp"

#include <chrono>       // for system_clock
#include <cstdint>      // for uint8_t, uint32_t
#include <functional>   // for function
#include <mutex>        // for mutex
#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace swapcore {

enum class LogKind : std::uint8_t {
    Info,
    Warning,
    Error,
    Command,
    Output
};

auto log_kind_to_string(LogKind kind) noexcept -> std::string_view;

/// Append-only audit record.
struct LogEntry final {
    LogKind kind{LogKind::Info};
    std::string message{};
    std::chrono::system_clock::time_point timestamp{};
};

/// Last known System Integrity Protection state.
struct SecurityState final {
    bool sip_disabled{false};
    /// Time of the last successful check, empty if never checked.
    std::optional<std::chrono::system_clock::time_point> checked_at{};
};

enum class RelocationState : std::uint8_t {
    Idle,
    ValidatingPreconditions,
    AcquiringPrivileges,
    DisablingAccounting,
    Relocating,
    ReenablingAccounting,
    Completed,
    Failed
};

auto relocation_state_to_string(RelocationState state) noexcept -> std::string_view;

/// Fields written through StatusModel::update.
struct StatusFields {
    SecurityState security{};
    std::optional<disk::SwapLocation> current_location{};
    std::vector<disk::Volume> available_volumes{};
    std::optional<std::string> selected_target{};
    std::optional<std::string> last_error{};
    RelocationState relocation_state{RelocationState::Idle};
};

/// Read-only copy handed to observers.
struct StatusSnapshot final : StatusFields {
    bool busy{false};
    std::vector<LogEntry> logs{};
};

// Mutex-guarded state container. All writes go through update(),
// append_log() and the busy counter; readers only ever see copies.
class StatusModel final {
 public:
    /// @param record_verbose Whether info/warning/command/output entries reach the feed.
    explicit StatusModel(bool record_verbose = true) noexcept;

    [[nodiscard]] auto snapshot() const -> StatusSnapshot;

    /// @brief Apply a mutation under the model lock.
    void update(const std::function<void(StatusFields&)>& mutator);

    /// @brief Append an audit record and mirror it to spdlog.
    void append_log(LogKind kind, std::string message);

    /// @brief Record an error entry and publish it as last error.
    void report_error(std::string message);

    void clear_logs();

    void begin_busy() noexcept;
    void end_busy() noexcept;
    [[nodiscard]] auto is_busy() const noexcept -> bool;

 private:
    mutable std::mutex m_mutex;
    StatusFields m_fields{};
    std::vector<LogEntry> m_logs{};
    std::uint32_t m_busy_depth{0};
    bool m_record_verbose{true};
};

// Brackets one public operation: busy goes true on entry and back to
// false once the outermost scope exits.
class BusyScope final {
 public:
    explicit BusyScope(StatusModel& model) noexcept : m_model(model) { m_model.begin_busy(); }
    ~BusyScope() { m_model.end_busy(); }

    BusyScope(const BusyScope&)       = delete;
    auto operator=(const BusyScope&) = delete;

 private:
    StatusModel& m_model;
};

}  // namespace swapcore

#endif  // STATUS_MODEL_HPP
