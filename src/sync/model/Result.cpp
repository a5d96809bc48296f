#include "sync/model/Result.hpp"
#include "logging/LogRegistry.hpp"
#include "util/files.hpp"

#include <nlohmann/json.hpp>
#include <ranges>
#include <stdexcept>
#include <vector>

using namespace hs::sync::model;
using namespace hs::types::metric;
using namespace hs::logging;
using namespace hs::util;
using json = nlohmann::json;

std::string_view hs::sync::model::toString(const Trigger t) noexcept {
    switch (t) {
    case Trigger::Schedule: return "schedule";
    case Trigger::Manual:   return "manual";
    case Trigger::Startup:  return "startup";
    }
    return "unknown";
}

bool hs::sync::model::tryParseTrigger(const std::string_view in, Trigger& out) noexcept {
    if (in == "schedule") { out = Trigger::Schedule; return true; }
    if (in == "manual")   { out = Trigger::Manual; return true; }
    if (in == "startup")  { out = Trigger::Startup; return true; }
    return false;
}

std::string_view KindOutcome::toString(const Status s) noexcept {
    switch (s) {
    case Status::Skipped:   return "skipped";
    case Status::Unchanged: return "unchanged";
    case Status::Changed:   return "changed";
    case Status::Failed:    return "failed";
    }
    return "unknown";
}

bool KindOutcome::tryParseStatus(const std::string_view in, Status& out) noexcept {
    if (in == "skipped")   { out = Status::Skipped; return true; }
    if (in == "unchanged") { out = Status::Unchanged; return true; }
    if (in == "changed")   { out = Status::Changed; return true; }
    if (in == "failed")    { out = Status::Failed; return true; }
    return false;
}

std::string_view Result::toString(const State s) noexcept {
    switch (s) {
    case State::Idle:     return "idle";
    case State::Planning: return "planning";
    case State::Fetching: return "fetching";
    case State::Merging:  return "merging";
    case State::Done:     return "done";
    case State::Failed:   return "failed";
    }
    return "unknown";
}

bool Result::tryParseState(const std::string_view in, State& out) noexcept {
    if (in == "idle")     { out = State::Idle; return true; }
    if (in == "planning") { out = State::Planning; return true; }
    if (in == "fetching") { out = State::Fetching; return true; }
    if (in == "merging")  { out = State::Merging; return true; }
    if (in == "done")     { out = State::Done; return true; }
    if (in == "failed")   { out = State::Failed; return true; }
    return false;
}

std::set<Kind> Result::changed() const {
    std::set<Kind> out;
    for (const auto& [k, o] : outcomes)
        if (o.status == KindOutcome::Status::Changed) out.insert(k);
    return out;
}

std::set<Kind> Result::notifiable() const {
    std::set<Kind> out;
    for (const auto& [k, o] : outcomes)
        if (o.notifiable) out.insert(k);
    return out;
}

std::set<Kind> Result::failed() const {
    std::set<Kind> out;
    for (const auto& [k, o] : outcomes)
        if (o.failed()) out.insert(k);
    return out;
}

const KindOutcome* Result::outcome(const Kind kind) const noexcept {
    const auto it = outcomes.find(kind);
    return it == outcomes.end() ? nullptr : &it->second;
}

void hs::sync::model::to_json(json& j, const KindOutcome& o) {
    j = {
        {"kind", hs::types::metric::toString(o.kind)},
        {"status", KindOutcome::toString(o.status)},
        {"reason", Plan::toString(o.reason)},
        {"fetched_count", o.fetched_count},
        {"changed_count", o.changed_count},
        {"notifiable", o.notifiable}
    };

    if (o.failed()) {
        j["error_code"] = o.error_code;
        j["error_message"] = o.error_message;
    }

    if (o.freshness) j["freshness"] = *o.freshness;
    else j["freshness"] = nullptr;
}

void hs::sync::model::from_json(const json& j, KindOutcome& o) {
    if (!tryParseKind(j.at("kind").get<std::string>(), o.kind))
        throw std::invalid_argument("unknown kind in sync result");
    if (!KindOutcome::tryParseStatus(j.at("status").get<std::string>(), o.status))
        throw std::invalid_argument("unknown outcome status in sync result");

    const auto reason = j.value("reason", std::string{});
    if (reason == "bootstrap") o.reason = Plan::Reason::Bootstrap;
    else if (reason == "incremental") o.reason = Plan::Reason::Incremental;
    else o.reason = Plan::Reason::WithinInterval;

    o.fetched_count = j.value("fetched_count", size_t{0});
    o.changed_count = j.value("changed_count", size_t{0});
    o.notifiable = j.value("notifiable", false);
    o.error_code = j.value("error_code", std::string{});
    o.error_message = j.value("error_message", std::string{});

    if (j.contains("freshness") && !j.at("freshness").is_null()) o.freshness = j.at("freshness").get<Freshness>();
    else o.freshness.reset();
}

void hs::sync::model::to_json(json& j, const Result& r) {
    json outcomes = json::array();
    for (const auto& o : r.outcomes | std::views::values) outcomes.push_back(o);

    std::vector<std::string> changed, notifiable;
    for (const auto k : r.changed()) changed.emplace_back(hs::types::metric::toString(k));
    for (const auto k : r.notifiable()) notifiable.emplace_back(hs::types::metric::toString(k));

    j = {
        {"run_uuid", r.run_uuid},
        {"trigger", toString(r.trigger)},
        {"started_at", formatTimestamp(r.started_at)},
        {"finished_at", formatTimestamp(r.finished_at)},
        {"state", Result::toString(r.state)},
        {"changed", changed},
        {"notifiable", notifiable},
        {"outcomes", outcomes}
    };
}

void hs::sync::model::from_json(const json& j, Result& r) {
    r.run_uuid = j.value("run_uuid", std::string{});
    if (!tryParseTrigger(j.value("trigger", std::string{}), r.trigger)) r.trigger = Trigger::Schedule;
    if (!Result::tryParseState(j.at("state").get<std::string>(), r.state))
        throw std::invalid_argument("unknown state in sync result");

    const auto started = parseTimestamp(j.at("started_at").get<std::string>());
    const auto finished = parseTimestamp(j.at("finished_at").get<std::string>());
    if (!started || !finished) throw std::invalid_argument("bad timestamps in sync result");
    r.started_at = *started;
    r.finished_at = *finished;

    r.outcomes.clear();
    for (const auto& item : j.at("outcomes")) {
        auto o = item.get<KindOutcome>();
        r.outcomes[o.kind] = std::move(o);
    }
}

std::filesystem::path hs::sync::model::lastResultPath(const std::filesystem::path& dataDir) {
    return dataDir / "last_sync.json";
}

void hs::sync::model::persistLastResult(const std::filesystem::path& dataDir, const Result& r) {
    writeFileAtomic(lastResultPath(dataDir), json(r).dump(2));
}

std::optional<Result> hs::sync::model::loadLastResult(const std::filesystem::path& dataDir) {
    const auto path = lastResultPath(dataDir);
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) return std::nullopt;

    try {
        return json::parse(readFileToString(path)).get<Result>();
    } catch (const json::exception& e) {
        LogRegistry::presentation()->warn("[Result] Ignoring unreadable {}: {}", path.string(), e.what());
    } catch (const std::exception& e) {
        LogRegistry::presentation()->warn("[Result] Ignoring {}: {}", path.string(), e.what());
    }
    return std::nullopt;
}
