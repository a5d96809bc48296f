// Sync
#include "sync/Coordinator.hpp"
#include "sync/model/Result.hpp"

// Storage / remote
#include "storage/LocalStore.hpp"
#include "remote/ExportDirSource.hpp"

// Analytics / presentation
#include "analytics/Engine.hpp"
#include "analytics/GoalSource.hpp"
#include "presentation/Sink.hpp"
#include "presentation/StatusBoard.hpp"
#include "report/MarkdownLog.hpp"

// Misc
#include "config/Config.hpp"
#include "logging/LogRegistry.hpp"
#include "util/paths.hpp"

// Libraries
#include <fmt/core.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <nlohmann/json.hpp>

#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

using namespace hs;
using namespace hs::config;
using namespace hs::logging;

namespace {

constexpr auto USAGE =
    "usage: healthsync sync <export-dir> [--force]\n"
    "       healthsync summary [YYYY-MM-DD]\n"
    "       healthsync status\n"
    "       healthsync config\n";

struct Runtime {
    Config cnf;
    std::shared_ptr<const util::Clock> clock = std::make_shared<util::SystemClock>();
    std::shared_ptr<storage::LocalStore> store;
    std::shared_ptr<analytics::Engine> engine;
    std::shared_ptr<presentation::StatusBoard> board;

    explicit Runtime(Config c) : cnf(std::move(c)) {
        store = std::make_shared<storage::LocalStore>(cnf.storage.data_dir);
        engine = std::make_shared<analytics::Engine>(
            store, std::make_shared<analytics::FileGoalSource>(cnf.storage.data_dir / "goals.json"), clock);
        board = std::make_shared<presentation::StatusBoard>(store, engine, cnf.presentation, clock);
    }
};

int runSync(Runtime& rt, const std::filesystem::path& exportDir, const bool force) {
    rt.board->addSink(std::make_shared<presentation::JsonStreamSink>(std::cout));

    sync::Coordinator coordinator(rt.store, std::make_shared<remote::ExportDirSource>(exportDir), rt.cnf, rt.clock);
    coordinator.attach(rt.board);

    sync::model::Request req;
    req.trigger = sync::model::Trigger::Manual;
    req.force = force;

    try {
        const auto result = coordinator.run(req);
        return result.state == sync::model::Result::State::Done ? EXIT_SUCCESS : EXIT_FAILURE;
    } catch (const sync::SyncInProgress& e) {
        LogRegistry::healthsync()->warn("[-] {}", e.what());
        return EXIT_FAILURE;
    }
}

int runSummary(const Runtime& rt, const std::string_view dateArg) {
    std::optional<util::Date> date;
    if (!dateArg.empty()) {
        date = util::parseDate(dateArg);
        if (!date) {
            fmt::print(stderr, "invalid date: {}\n", dateArg);
            return EXIT_FAILURE;
        }
    }

    const auto summary = rt.engine->dailySummary(date);
    fmt::print("{}\n", nlohmann::json(summary).dump(2));

    const auto& n = rt.cnf.notifications;
    if (n.daily_summary_enabled && n.log_to_markdown)
        report::MarkdownLog(rt.cnf.storage.data_dir / n.log_file).append(summary);

    return EXIT_SUCCESS;
}

}

int main(const int argc, char** argv) {
    if (argc < 2) {
        fmt::print(stderr, "{}", USAGE);
        return 2;
    }

    const std::string_view cmd = argv[1];

    // Config warnings are emitted before LogRegistry exists; keep stdout for JSON output.
    spdlog::set_default_logger(spdlog::stderr_color_mt("bootstrap"));

    try {
        auto cnf = loadConfig(paths::getConfigPath());

        if (cmd == "config") {
            fmt::print("{}\n", nlohmann::json(cnf).dump(2));
            return EXIT_SUCCESS;
        }

        LogRegistry::init(cnf.logging.log_dir, cnf.logging);
        LogRegistry::healthsync()->debug("[*] healthsync {} (data dir {})", cmd, cnf.storage.data_dir.string());

        Runtime rt(std::move(cnf));

        if (cmd == "sync") {
            if (argc < 3) {
                fmt::print(stderr, "{}", USAGE);
                return 2;
            }
            const bool force = argc > 3 && std::string_view(argv[3]) == "--force";
            const auto rc = runSync(rt, argv[2], force);
            if (rc == EXIT_SUCCESS) LogRegistry::healthsync()->info("[✓] Sync finished");
            else LogRegistry::healthsync()->warn("[-] Sync finished with failures");
            return rc;
        }

        if (cmd == "summary") return runSummary(rt, argc > 2 ? argv[2] : "");

        if (cmd == "status") {
            fmt::print("{}\n", nlohmann::json(rt.board->current()).dump(2));
            return EXIT_SUCCESS;
        }

        fmt::print(stderr, "unknown command: {}\n{}", cmd, USAGE);
        return 2;
    } catch (const std::exception& e) {
        if (LogRegistry::isInitialized()) LogRegistry::healthsync()->error("[-] Fatal: {}", e.what());
        else fmt::print(stderr, "[-] Fatal: {}\n", e.what());
        return EXIT_FAILURE;
    }
}
