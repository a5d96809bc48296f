#pragma once

#include <cstdlib>
#include <filesystem>
#include <string>

namespace hs::paths {

inline std::filesystem::path homeDir() {
    if (const char* home = std::getenv("HOME"); home && *home) return home;
    return std::filesystem::temp_directory_path();
}

inline std::filesystem::path xdgDir(const char* var, const char* fallbackUnderHome) {
    if (const char* dir = std::getenv(var); dir && *dir) return std::filesystem::path(dir) / "healthsync";
    return homeDir() / fallbackUnderHome / "healthsync";
}

inline std::filesystem::path getConfigPath() {
    if (const char* p = std::getenv("HEALTHSYNC_CONFIG"); p && *p) return p;
    return xdgDir("XDG_CONFIG_HOME", ".config") / "config.yaml";
}

inline std::filesystem::path getDataDir() {
    if (const char* p = std::getenv("HEALTHSYNC_DATA_DIR"); p && *p) return p;
    return xdgDir("XDG_DATA_HOME", ".local/share");
}

inline std::filesystem::path getLogDir() {
    return xdgDir("XDG_STATE_HOME", ".local/state") / "log";
}

}
