#include "swapcore/engine_config.hpp"

#include <cerrno>      // for errno
#include <cstring>     // for strerror
#include <filesystem>  // for exists
#include <fstream>     // for ifstream
#include <iterator>    // for istreambuf_iterator
#include <system_error>  // for error_code
#include <utility>     // for pair, move

#if defined(__clang__)
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wold-style-cast"
#elif defined(__GNUC__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wuseless-cast"
#pragma GCC diagnostic ignored "-Wold-style-cast"
#endif

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>

#if defined(__clang__)
#pragma clang diagnostic pop
#elif defined(__GNUC__)
#pragma GCC diagnostic pop
#endif

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

using namespace std::string_view_literals;
namespace fs = std::filesystem;

namespace {

auto parse_string_field(const rapidjson::Document& doc, const char* key, std::string& out) noexcept
    -> std::expected<void, std::string> {
    if (!doc.HasMember(key)) {
        return {};
    }
    if (!doc[key].IsString()) {
        return std::unexpected(fmt::format(FMT_COMPILE("'{}' must be a string"), key));
    }
    out = doc[key].GetString();
    return {};
}

auto parse_timeout_field(const rapidjson::Document& doc, const char* key, std::chrono::milliseconds& out) noexcept
    -> std::expected<void, std::string> {
    if (!doc.HasMember(key)) {
        return {};
    }
    if (!doc[key].IsInt64() || doc[key].GetInt64() < 0) {
        return std::unexpected(fmt::format(FMT_COMPILE("'{}' must be a non-negative integer"), key));
    }
    out = std::chrono::milliseconds{doc[key].GetInt64()};
    return {};
}

}  // namespace

namespace swapcore {

auto get_default_engine_config() noexcept -> EngineConfig {
    return EngineConfig{};
}

auto parse_engine_config(std::string_view json_content) noexcept
    -> std::expected<EngineConfig, std::string> {
    if (json_content.empty()) {
        return get_default_engine_config();
    }

    rapidjson::Document doc;
    doc.Parse(json_content.data(), json_content.size());
    if (doc.HasParseError()) {
        return std::unexpected(fmt::format(FMT_COMPILE("JSON parse error at offset {}: {}"), doc.GetErrorOffset(), rapidjson::GetParseError_En(doc.GetParseError())));
    }
    if (!doc.IsObject()) {
        return std::unexpected("JSON root must be an object");
    }

    auto config = get_default_engine_config();

    for (auto&& [key, field] : {
             std::pair{"swap_path", &config.swap_path},
             std::pair{"swap_dir", &config.swap_dir},
             std::pair{"volumes_dir", &config.volumes_dir},
             std::pair{"root_path", &config.root_path},
             std::pair{"system_volume_name", &config.system_volume_name},
             std::pair{"log_file", &config.log_file},
         }) {
        if (auto res = parse_string_field(doc, key, *field); !res) {
            return std::unexpected(std::move(res.error()));
        }
    }

    // Parse volume_policy (optional, default all)
    if (doc.HasMember("volume_policy")) {
        if (!doc["volume_policy"].IsString()) {
            return std::unexpected("'volume_policy' must be a string");
        }
        const auto policy_str = std::string_view{doc["volume_policy"].GetString()};
        auto policy           = disk::volume_policy_from_string(policy_str);
        if (!policy) {
            return std::unexpected(fmt::format(FMT_COMPILE("Invalid volume policy '{}'. Valid policies: all, external"), policy_str));
        }
        config.volume_policy = *policy;
    }

    for (auto&& [key, field] : {
             std::pair{"short_timeout_ms", &config.short_timeout},
             std::pair{"medium_timeout_ms", &config.medium_timeout},
             std::pair{"long_timeout_ms", &config.long_timeout},
             std::pair{"elevated_timeout_ms", &config.elevated_timeout},
         }) {
        if (auto res = parse_timeout_field(doc, key, *field); !res) {
            return std::unexpected(std::move(res.error()));
        }
    }

    // Parse default_swap_size_mib (optional, default 1024)
    if (doc.HasMember("default_swap_size_mib")) {
        if (!doc["default_swap_size_mib"].IsUint() || doc["default_swap_size_mib"].GetUint() == 0) {
            return std::unexpected("'default_swap_size_mib' must be a positive integer");
        }
        config.default_swap_size_mib = doc["default_swap_size_mib"].GetUint();
    }

    // Parse debug (optional, default true)
    if (doc.HasMember("debug")) {
        if (!doc["debug"].IsBool()) {
            return std::unexpected("'debug' must be a boolean");
        }
        config.debug = doc["debug"].GetBool();
    }

    return config;
}

auto load_engine_config(std::string_view config_path) noexcept
    -> std::expected<EngineConfig, std::string> {
    std::error_code err{};
    if (!fs::exists(config_path, err)) {
        spdlog::debug("Config '{}' not found, using defaults", config_path);
        return get_default_engine_config();
    }

    std::ifstream file{fs::path{config_path}, std::ios::binary};
    if (!file.is_open()) {
        return std::unexpected(fmt::format(FMT_COMPILE("Failed to open '{}': {}"), config_path, std::strerror(errno)));
    }
    const std::string content{std::istreambuf_iterator<char>{file}, std::istreambuf_iterator<char>{}};
    return parse_engine_config(content);
}

}  // namespace swapcore
