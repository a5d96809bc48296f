#include <gtest/gtest.h>
#include <filesystem>
#include <iostream>

#include "config/Config.hpp"
#include "logging/LogRegistry.hpp"

namespace fs = std::filesystem;

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    try {
        const auto logDir = fs::temp_directory_path() / "healthsync_test_logs";
        fs::create_directories(logDir);

        hs::config::LoggingConfig cnf;
        cnf.log_dir = logDir;
        cnf.levels.console_log_level = spdlog::level::err;
        cnf.levels.file_log_level = spdlog::level::debug;
        cnf.levels.subsystem_levels.storage = spdlog::level::debug;
        cnf.levels.subsystem_levels.sync = spdlog::level::debug;
        cnf.levels.subsystem_levels.remote = spdlog::level::debug;

        hs::logging::LogRegistry::init(logDir, cnf);
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize healthsync test environment: " << e.what() << std::endl;
        return 1;
    }

    return RUN_ALL_TESTS();
}
