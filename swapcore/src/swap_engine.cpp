#include "swapcore/swap_engine.hpp"

#include <filesystem>    // for directory_iterator
#include <system_error>  // for error_code
#include <thread>        // for jthread
#include <utility>       // for move

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace swapcore {

SwapEngine::SwapEngine(CommandRunner& runner, EngineConfig config)
  : m_config(std::move(config)),
    m_status(m_config.debug),
    m_executor(runner, m_status, m_config.short_timeout, m_config.elevated_timeout),
    m_inventory(m_executor, m_status, m_config),
    m_security(m_executor, m_status, m_config.medium_timeout),
    m_orchestrator(m_executor, m_inventory, m_status, m_config) { }

auto SwapEngine::swap_dir_accessible() -> bool {
    std::error_code err{};
    const fs::directory_iterator swap_dir_it{m_config.swap_dir, err};
    if (err) {
        spdlog::error("Cannot list '{}': {}", m_config.swap_dir, err.message());
        return false;
    }
    return true;
}

void SwapEngine::initialize() {
    const BusyScope busy{m_status};

    if (!swap_dir_accessible()) {
        m_status.report_error(fmt::format(FMT_COMPILE("Swap directory '{}' is not accessible, run with sufficient permissions"), m_config.swap_dir));
        return;
    }

    {
        // each task records its own failure into the status model
        const std::jthread sip_task([this] {
            if (auto state = m_security.check(); !state) {
                spdlog::debug("[engine] SIP check failed: {}", describe(state.error()));
            }
        });
        const std::jthread drives_task([this] {
            if (auto volumes = m_inventory.publish_volumes(); !volumes) {
                spdlog::debug("[engine] drive refresh failed: {}", describe(volumes.error()));
            }
        });
        const std::jthread location_task([this] {
            if (auto location = m_inventory.publish_location(); !location) {
                spdlog::debug("[engine] location detection failed: {}", describe(location.error()));
            }
        });
    }

    // location detection may have finished before the inventory was published
    m_status.update([](StatusFields& fields) {
        if (fields.current_location) {
            fields.current_location->host_volume_id = disk::find_swap_host(fields.available_volumes, *fields.current_location);
        }
    });
}

auto SwapEngine::refresh_drives() -> std::expected<std::vector<disk::Volume>, SwapError> {
    const BusyScope busy{m_status};
    return m_inventory.publish_volumes();
}

auto SwapEngine::check_security() -> std::expected<SecurityState, SwapError> {
    const BusyScope busy{m_status};
    return m_security.check();
}

auto SwapEngine::detect_current_location() -> std::expected<disk::SwapLocation, SwapError> {
    const BusyScope busy{m_status};
    return m_inventory.publish_location();
}

auto SwapEngine::select_target(std::string_view volume_id) -> std::expected<void, SwapError> {
    const auto snapshot = m_status.snapshot();
    const auto volume   = disk::find_volume_by_id(snapshot.available_volumes, volume_id);
    if (!volume) {
        auto error = make_error(SwapErrorKind::DriveNotFound, std::string{volume_id});
        m_status.report_error(fmt::format(FMT_COMPILE("Cannot select volume: {}"), describe(error)));
        return std::unexpected(std::move(error));
    }

    m_status.update([&volume](StatusFields& fields) { fields.selected_target = volume->id; });
    m_status.append_log(LogKind::Info, fmt::format(FMT_COMPILE("Selected '{}' ({})"), volume->name, volume->mount_path));
    return {};
}

auto SwapEngine::relocate(std::string_view volume_id) -> std::expected<void, SwapError> {
    return m_orchestrator.relocate(volume_id);
}

auto SwapEngine::relocate_selected() -> std::expected<void, SwapError> {
    const auto selected = m_status.snapshot().selected_target;
    if (!selected) {
        auto error = make_error(SwapErrorKind::DriveNotFound, "no volume selected");
        m_status.report_error(fmt::format(FMT_COMPILE("Relocation failed: {}"), describe(error)));
        return std::unexpected(std::move(error));
    }
    return m_orchestrator.relocate(*selected);
}

void SwapEngine::clear_logs() {
    m_status.clear_logs();
}

auto SwapEngine::snapshot() const -> StatusSnapshot {
    return m_status.snapshot();
}

}  // namespace swapcore
