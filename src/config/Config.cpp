#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <yaml-cpp/yaml.h>
#include <nlohmann/json.hpp>

namespace hs::config {

namespace {

template <typename T>
void decodeSection(const YAML::Node& root, const char* name, T& out) {
    const auto node = root[name];
    if (!node) return;
    if (!YAML::convert<T>::decode(node, out))
        spdlog::warn("[Config] Section '{}' must be a map, using defaults", name);
}

std::string levelName(const spdlog::level::level_enum lvl) {
    const auto sv = spdlog::level::to_string_view(lvl);
    return {sv.data(), sv.size()};
}

}

bool SyncConfig::isWakingHour(const unsigned int hour) const {
    if (waking_hours_start <= waking_hours_end)
        return hour >= waking_hours_start && hour <= waking_hours_end;
    return hour >= waking_hours_start || hour <= waking_hours_end;
}

Config loadConfig(const std::filesystem::path& path) {
    Config cfg;

    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        spdlog::info("[Config] No config at {}, using defaults", path.string());
        return cfg;
    }

    YAML::Node root;
    try {
        root = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        spdlog::warn("[Config] Failed to parse {}: {}; using defaults", path.string(), e.what());
        return cfg;
    }

    if (root.IsNull()) return cfg;
    if (!root.IsMap()) {
        spdlog::warn("[Config] {} is not a YAML map, using defaults", path.string());
        return cfg;
    }

    decodeSection(root, "sync", cfg.sync);
    decodeSection(root, "storage", cfg.storage);
    decodeSection(root, "notifications", cfg.notifications);
    decodeSection(root, "presentation", cfg.presentation);
    decodeSection(root, "logging", cfg.logging);

    return cfg;
}

void to_json(nlohmann::json& j, const Config& c) {
    j = {
        {"sync", c.sync},
        {"storage", c.storage},
        {"notifications", c.notifications},
        {"presentation", c.presentation},
        {"logging", c.logging}
    };
}

void to_json(nlohmann::json& j, const SyncConfig& c) {
    j = {
        {"interval_minutes", c.interval_minutes},
        {"change_threshold_steps", c.change_threshold_steps},
        {"waking_hours_start", c.waking_hours_start},
        {"waking_hours_end", c.waking_hours_end},
        {"safety_overlap_days", c.safety_overlap_days},
        {"fetch_timeout_seconds", c.fetch_timeout_seconds},
        {"bootstrap_days", c.bootstrap_days},
        {"fetch_workers", c.fetch_workers}
    };
}

void to_json(nlohmann::json& j, const StorageConfig& c) {
    j = {{"data_dir", c.data_dir.string()}};
}

void to_json(nlohmann::json& j, const NotificationsConfig& c) {
    j = {
        {"daily_summary_enabled", c.daily_summary_enabled},
        {"log_to_markdown", c.log_to_markdown},
        {"log_file", c.log_file}
    };
}

void to_json(nlohmann::json& j, const PresentationConfig& c) {
    j = {{"freshness_warning_minutes", c.freshness_warning_minutes}};
}

void to_json(nlohmann::json& j, const LoggingConfig& c) {
    j = {
        {"log_dir", c.log_dir.string()},
        {"levels", c.levels}
    };
}

void to_json(nlohmann::json& j, const LogLevelsConfig& c) {
    j = {
        {"console_log_level", levelName(c.console_log_level)},
        {"file_log_level", levelName(c.file_log_level)},
        {"subsystem_levels", c.subsystem_levels}
    };
}

void to_json(nlohmann::json& j, const SubsystemLogLevelsConfig& c) {
    j = {
        {"healthsync", levelName(c.healthsync)},
        {"storage", levelName(c.storage)},
        {"sync", levelName(c.sync)},
        {"remote", levelName(c.remote)},
        {"analytics", levelName(c.analytics)},
        {"presentation", levelName(c.presentation)}
    };
}

}
