#pragma once

#include "config/Config.hpp"

#include <limits>
#include <string>
#include <yaml-cpp/yaml.h>

namespace hs::config::detail {

// Bad or out-of-range values fall back to the default with a warning.
inline unsigned int readUInt(const YAML::Node& section, const char* sectionName, const char* key,
                             const unsigned int def, const unsigned int lo = 0,
                             const unsigned int hi = std::numeric_limits<unsigned int>::max()) {
    const auto node = section[key];
    if (!node) return def;
    try {
        const auto v = node.as<long long>();
        if (v < static_cast<long long>(lo) || v > static_cast<long long>(hi)) {
            spdlog::warn("[Config] {}.{} = {} is outside [{}, {}], using default {}",
                         sectionName, key, v, lo, hi, def);
            return def;
        }
        return static_cast<unsigned int>(v);
    } catch (const YAML::Exception& e) {
        spdlog::warn("[Config] {}.{} is not an integer ({}), using default {}", sectionName, key, e.what(), def);
        return def;
    }
}

inline bool readBool(const YAML::Node& section, const char* sectionName, const char* key, const bool def) {
    const auto node = section[key];
    if (!node) return def;
    try {
        return node.as<bool>();
    } catch (const YAML::Exception& e) {
        spdlog::warn("[Config] {}.{} is not a boolean ({}), using default {}", sectionName, key, e.what(), def);
        return def;
    }
}

inline std::string readString(const YAML::Node& section, const char* sectionName, const char* key,
                              const std::string& def) {
    const auto node = section[key];
    if (!node) return def;
    if (!node.IsScalar() || node.Scalar().empty()) {
        spdlog::warn("[Config] {}.{} must be a non-empty string, using default '{}'", sectionName, key, def);
        return def;
    }
    return node.Scalar();
}

inline spdlog::level::level_enum readLevel(const YAML::Node& section, const char* sectionName, const char* key,
                                           const spdlog::level::level_enum def) {
    const auto node = section[key];
    if (!node) return def;
    const auto str = node.IsScalar() ? node.Scalar() : std::string{};
    const auto lvl = spdlog::level::from_str(str);
    // from_str maps anything unknown to "off"
    if (lvl == spdlog::level::off && str != "off") {
        spdlog::warn("[Config] {}.{} = '{}' is not a log level, using default", sectionName, key, str);
        return def;
    }
    return lvl;
}

}

namespace YAML {

using namespace hs::config;

template<>
struct convert<SyncConfig> {
    static bool decode(const Node& node, SyncConfig& rhs) {
        if (!node.IsMap()) return false;
        using namespace hs::config::detail;
        const SyncConfig def;
        rhs.interval_minutes       = readUInt(node, "sync", "interval_minutes", def.interval_minutes, 1);
        rhs.change_threshold_steps = readUInt(node, "sync", "change_threshold_steps", def.change_threshold_steps);
        rhs.waking_hours_start     = readUInt(node, "sync", "waking_hours_start", def.waking_hours_start, 0, 23);
        rhs.waking_hours_end       = readUInt(node, "sync", "waking_hours_end", def.waking_hours_end, 0, 23);
        rhs.safety_overlap_days    = readUInt(node, "sync", "safety_overlap_days", def.safety_overlap_days, 0, 365);
        rhs.fetch_timeout_seconds  = readUInt(node, "sync", "fetch_timeout_seconds", def.fetch_timeout_seconds, 1);
        rhs.bootstrap_days         = readUInt(node, "sync", "bootstrap_days", def.bootstrap_days, 1, 36500);
        rhs.fetch_workers          = readUInt(node, "sync", "fetch_workers", def.fetch_workers, 1, 64);
        return true;
    }
};

template<>
struct convert<StorageConfig> {
    static bool decode(const Node& node, StorageConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.data_dir = hs::config::detail::readString(node, "storage", "data_dir", rhs.data_dir.string());
        return true;
    }
};

template<>
struct convert<NotificationsConfig> {
    static bool decode(const Node& node, NotificationsConfig& rhs) {
        if (!node.IsMap()) return false;
        using namespace hs::config::detail;
        const NotificationsConfig def;
        rhs.daily_summary_enabled = readBool(node, "notifications", "daily_summary_enabled", def.daily_summary_enabled);
        rhs.log_to_markdown = readBool(node, "notifications", "log_to_markdown", def.log_to_markdown);
        rhs.log_file = readString(node, "notifications", "log_file", def.log_file);
        return true;
    }
};

template<>
struct convert<PresentationConfig> {
    static bool decode(const Node& node, PresentationConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.freshness_warning_minutes = hs::config::detail::readUInt(
            node, "presentation", "freshness_warning_minutes", PresentationConfig{}.freshness_warning_minutes, 1);
        return true;
    }
};

template<>
struct convert<SubsystemLogLevelsConfig> {
    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        using hs::config::detail::readLevel;
        const SubsystemLogLevelsConfig def;
        rhs.healthsync   = readLevel(node, "subsystem_levels", "healthsync", def.healthsync);
        rhs.storage      = readLevel(node, "subsystem_levels", "storage", def.storage);
        rhs.sync         = readLevel(node, "subsystem_levels", "sync", def.sync);
        rhs.remote       = readLevel(node, "subsystem_levels", "remote", def.remote);
        rhs.analytics    = readLevel(node, "subsystem_levels", "analytics", def.analytics);
        rhs.presentation = readLevel(node, "subsystem_levels", "presentation", def.presentation);
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        using namespace hs::config::detail;
        const LogLevelsConfig def;
        rhs.log_dir = readString(node, "logging", "log_dir", rhs.log_dir.string());
        rhs.levels.console_log_level = readLevel(node, "logging", "console_log_level", def.console_log_level);
        rhs.levels.file_log_level = readLevel(node, "logging", "file_log_level", def.file_log_level);
        if (const auto sub = node["subsystem_levels"]; sub && !convert<SubsystemLogLevelsConfig>::decode(sub, rhs.levels.subsystem_levels))
            spdlog::warn("[Config] logging.subsystem_levels must be a map, using defaults");
        return true;
    }
};

}
