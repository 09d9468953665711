#ifndef SWAP_ENGINE_HPP
#define SWAP_ENGINE_HPP

#include "swapcore/command_runner.hpp"
#include "swapcore/drive_inventory.hpp"
#include "swapcore/engine_config.hpp"
#include "swapcore/errors.hpp"
#include "swapcore/privileged_executor.hpp"
#include "swapcore/relocation.hpp"
#include "swapcore/security_gate.hpp"
#include "swapcore/status_model.hpp"
#include "swapcore/volume.hpp"

#include <expected>     // for expected
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace swapcore {

/// Facade over the relocation engine. Owns the status model and every
/// component writing into it; callers observe state only through snapshot().
class SwapEngine final {
 public:
    /// @param runner Process runner, must outlive the engine.
    /// @param config Engine configuration, copied.
    SwapEngine(CommandRunner& runner, EngineConfig config);

    SwapEngine(const SwapEngine&)     = delete;
    auto operator=(const SwapEngine&) = delete;

    /// @brief Startup discovery: swap directory precheck, then SIP check,
    /// drive inventory and location detection as concurrent tasks.
    void initialize();

    auto refresh_drives() -> std::expected<std::vector<disk::Volume>, SwapError>;
    auto check_security() -> std::expected<SecurityState, SwapError>;
    auto detect_current_location() -> std::expected<disk::SwapLocation, SwapError>;

    /// @brief Remember a destination, accepted only from the selectable volumes.
    auto select_target(std::string_view volume_id) -> std::expected<void, SwapError>;

    auto relocate(std::string_view volume_id) -> std::expected<void, SwapError>;

    /// @brief Relocate to the selected target; DriveNotFound when none is selected.
    auto relocate_selected() -> std::expected<void, SwapError>;

    void clear_logs();

    [[nodiscard]] auto snapshot() const -> StatusSnapshot;
    [[nodiscard]] auto config() const noexcept -> const EngineConfig& { return m_config; }

 private:
    auto swap_dir_accessible() -> bool;

    EngineConfig m_config;
    StatusModel m_status;
    PrivilegedExecutor m_executor;
    disk::DriveInventory m_inventory;
    security::SecurityGate m_security;
    relocation::RelocationOrchestrator m_orchestrator;
};

}  // namespace swapcore

#endif  // SWAP_ENGINE_HPP
