#include "remote/ExportDirSource.hpp"
#include "remote/FetchError.hpp"
#include "remote/GarminParser.hpp"
#include "logging/LogRegistry.hpp"
#include "util/files.hpp"

#include <nlohmann/json.hpp>

using namespace hs::remote;
using namespace hs::types::metric;
using namespace hs::logging;
using namespace hs::util;
using json = nlohmann::json;

ExportDirSource::ExportDirSource(std::filesystem::path dir) : dir_(std::move(dir)) {}

std::string ExportDirSource::name() const {
    return "export:" + dir_.string();
}

std::string_view ExportDirSource::fileFor(const Kind kind) noexcept {
    switch (kind) {
    case Kind::Steps:       return "daily_stats.json";
    case Kind::Sleep:       return "sleep.json";
    case Kind::Weight:      return "weight.json";
    case Kind::Activity:    return "activities.json";
    case Kind::BodyBattery: return "body_battery.json";
    case Kind::Stress:      return "stress.json";
    }
    return "";
}

Records ExportDirSource::fetch(const Kind kind, const Date start, const Date end) {
    std::error_code ec;
    if (!std::filesystem::is_directory(dir_, ec))
        throw FetchError(FetchError::Code::NetworkError, "export directory not found: " + dir_.string());

    const auto path = dir_ / fileFor(kind);
    if (!std::filesystem::exists(path, ec)) {
        LogRegistry::remote()->debug("[ExportDirSource] No {} in {}", fileFor(kind), dir_.string());
        return {};
    }

    Records all;
    try {
        all = GarminParser::parseDocument(kind, json::parse(readFileToString(path)));
    } catch (const json::exception& e) {
        throw FetchError(FetchError::Code::NetworkError, "unparsable " + path.string() + ": " + e.what());
    } catch (const std::invalid_argument& e) {
        throw FetchError(FetchError::Code::NetworkError, "unexpected shape in " + path.string() + ": " + e.what());
    } catch (const std::runtime_error& e) {
        throw FetchError(FetchError::Code::NetworkError, "unreadable " + path.string() + ": " + e.what());
    }

    Records out;
    for (auto& r : all) {
        const auto d = dateOf(r.timestamp);
        if (d >= start && d <= end) out.push_back(std::move(r));
    }

    LogRegistry::remote()->debug("[ExportDirSource] {} {} records in [{}, {}]",
                                 out.size(), toString(kind), formatDate(start), formatDate(end));
    return out;
}
