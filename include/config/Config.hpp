#pragma once

#include "util/paths.hpp"

#include <chrono>
#include <filesystem>
#include <string>
#include <spdlog/spdlog.h>
#include <nlohmann/json_fwd.hpp>

namespace hs::config {

struct SyncConfig {
    unsigned int interval_minutes = 10;
    unsigned int change_threshold_steps = 100;
    unsigned int waking_hours_start = 7;   // inclusive, 0..23
    unsigned int waking_hours_end = 23;    // inclusive, 0..23; start > end wraps midnight
    unsigned int safety_overlap_days = 3;
    unsigned int fetch_timeout_seconds = 30;
    unsigned int bootstrap_days = 2190;    // ~6 years of history on first sync
    unsigned int fetch_workers = 2;

    [[nodiscard]] bool isWakingHour(unsigned int hour) const;
    [[nodiscard]] std::chrono::minutes interval() const { return std::chrono::minutes(interval_minutes); }
    [[nodiscard]] std::chrono::seconds fetchTimeout() const { return std::chrono::seconds(fetch_timeout_seconds); }
};

struct StorageConfig {
    std::filesystem::path data_dir = paths::getDataDir();
};

struct NotificationsConfig {
    bool daily_summary_enabled = true;
    bool log_to_markdown = true;
    std::string log_file = "daily-summaries.md";
};

struct PresentationConfig {
    unsigned int freshness_warning_minutes = 30;
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum healthsync   = spdlog::level::info;   // Startup, shutdown, one line per run
    spdlog::level::level_enum storage      = spdlog::level::warn;   // Quarantined files, failed writes
    spdlog::level::level_enum sync         = spdlog::level::info;   // Plans, per-kind outcomes
    spdlog::level::level_enum remote       = spdlog::level::warn;   // Fetch failures and dropped payloads
    spdlog::level::level_enum analytics    = spdlog::level::warn;
    spdlog::level::level_enum presentation = spdlog::level::warn;
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::info;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_dir = paths::getLogDir();
    LogLevelsConfig levels;
};

struct Config {
    SyncConfig sync;
    StorageConfig storage;
    NotificationsConfig notifications;
    PresentationConfig presentation;
    LoggingConfig logging;
};

// Never throws: missing file, unparsable file and bad values all fall back to defaults.
Config loadConfig(const std::filesystem::path& path);

void to_json(nlohmann::json& j, const Config& c);
void to_json(nlohmann::json& j, const SyncConfig& c);
void to_json(nlohmann::json& j, const StorageConfig& c);
void to_json(nlohmann::json& j, const NotificationsConfig& c);
void to_json(nlohmann::json& j, const PresentationConfig& c);
void to_json(nlohmann::json& j, const LoggingConfig& c);
void to_json(nlohmann::json& j, const LogLevelsConfig& c);
void to_json(nlohmann::json& j, const SubsystemLogLevelsConfig& c);

} // namespace hs::config
