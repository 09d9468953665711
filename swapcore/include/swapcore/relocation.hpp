#ifndef RELOCATION_HPP
#define RELOCATION_HPP

#include "swapcore/drive_inventory.hpp"
#include "swapcore/engine_config.hpp"
#include "swapcore/errors.hpp"
#include "swapcore/privileged_executor.hpp"
#include "swapcore/status_model.hpp"
#include "swapcore/volume.hpp"

#include <atomic>       // for atomic_bool
#include <cstdint>      // for uint8_t, uint32_t
#include <expected>     // for expected
#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace swapcore::relocation {

enum class StepKind : std::uint8_t {
    /// Run the command with administrator privileges.
    Elevated,
    /// Probe the path with an unprivileged `test -f`, remove it elevated when present.
    RemoveIfPresent
};

/// @brief One mutation of the relocation sequence.
struct RelocationStep final {
    StepKind kind{StepKind::Elevated};
    std::string path{};
    std::vector<std::string> args{};

    auto operator==(const RelocationStep&) const -> bool = default;
};

/// @brief Path the swap file takes on the destination volume.
/// @return The canonical swap path for the system volume, `<mount><swap_path>` otherwise.
auto target_swap_path(const disk::Volume& destination, std::string_view swap_path) noexcept -> std::string;

/// @brief Computes the mutation sequence moving the swap file onto the destination.
/// @param destination Destination volume.
/// @param current Detected swap location, std::nullopt when no swap file was found.
/// @param config Engine configuration (paths, default swap size).
/// @return Ordered steps; empty when nothing has to change.
auto plan_relocation(const disk::Volume& destination, const std::optional<disk::SwapLocation>& current, const EngineConfig& config) noexcept
    -> std::vector<RelocationStep>;

// Drives a relocation through its states:
//   Idle -> ValidatingPreconditions -> AcquiringPrivileges -> DisablingAccounting
//        -> Relocating -> ReenablingAccounting -> Completed | Failed
// Failures between DisablingAccounting and Relocating re-enable swap
// accounting before the original error is returned.
class RelocationOrchestrator final {
 public:
    RelocationOrchestrator(PrivilegedExecutor& executor, disk::DriveInventory& inventory, StatusModel& status, const EngineConfig& config) noexcept;

    /// @brief Relocate the swap file onto the selectable volume with the given id.
    /// @return RelocationInProgress when another relocation is running.
    auto relocate(std::string_view destination_id) -> std::expected<void, SwapError>;

 private:
    struct Preconditions final {
        disk::Volume destination{};
        std::optional<disk::SwapLocation> current{};
        bool already_in_place{false};
    };

    auto run_sequence(std::string_view destination_id) -> std::expected<void, SwapError>;
    auto validate(std::string_view destination_id) -> std::expected<Preconditions, SwapError>;
    auto acquire_privileges() -> std::expected<void, SwapError>;
    auto disable_accounting() -> std::expected<void, SwapError>;
    auto execute_plan(const std::vector<RelocationStep>& steps) -> std::expected<void, SwapError>;
    auto enable_accounting() -> std::expected<void, SwapError>;
    void rollback_accounting();
    void set_state(RelocationState state);

    PrivilegedExecutor& m_executor;
    disk::DriveInventory& m_inventory;
    StatusModel& m_status;
    const EngineConfig& m_config;
    std::atomic_bool m_in_flight{false};
};

}  // namespace swapcore::relocation

#endif  // RELOCATION_HPP
