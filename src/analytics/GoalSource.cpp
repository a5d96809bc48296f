#include "analytics/GoalSource.hpp"
#include "logging/LogRegistry.hpp"
#include "util/files.hpp"

#include <nlohmann/json.hpp>

using namespace hs::analytics;
using namespace hs::types::metric;
using namespace hs::logging;
using json = nlohmann::json;

FileGoalSource::FileGoalSource(std::filesystem::path path) : path_(std::move(path)) {}

std::optional<GoalSet> FileGoalSource::load() const {
    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) return std::nullopt;

    try {
        const auto j = json::parse(util::readFileToString(path_));
        if (!j.is_object()) {
            LogRegistry::analytics()->warn("[FileGoalSource] {} is not a JSON object", path_.string());
            return std::nullopt;
        }
        return j.get<GoalSet>();
    } catch (const json::exception& e) {
        LogRegistry::analytics()->warn("[FileGoalSource] Malformed {}: {}", path_.string(), e.what());
    } catch (const std::runtime_error& e) {
        LogRegistry::analytics()->warn("[FileGoalSource] {}", e.what());
    }
    return std::nullopt;
}
