#include "remote/GarminParser.hpp"
#include "logging/LogRegistry.hpp"

#include <cstdint>
#include <limits>
#include <format>
#include <stdexcept>
#include <nlohmann/json.hpp>

using namespace hs::remote;
using namespace hs::types::metric;
using namespace hs::logging;
using namespace hs::util;
using json = nlohmann::json;

namespace {

double num(const json& j, const char* key, const double fallback = 0.0) {
    if (!j.is_object() || !j.contains(key)) return fallback;
    const auto& v = j.at(key);
    return v.is_number() ? v.get<double>() : fallback;
}

// Saturating double -> integer conversion; out-of-range values pin to the limits.
template <typename T>
T clampTo(const double v) {
    constexpr auto lo = static_cast<double>(std::numeric_limits<T>::min());
    constexpr auto hi = static_cast<double>(std::numeric_limits<T>::max());
    if (v <= lo) return std::numeric_limits<T>::min();
    if (v >= hi) return std::numeric_limits<T>::max();
    return static_cast<T>(v);
}

uint32_t count(const json& j, const char* key) {
    return clampTo<uint32_t>(num(j, key));
}

std::optional<double> optNum(const json& j, const char* key) {
    if (!j.is_object() || !j.contains(key) || !j.at(key).is_number()) return std::nullopt;
    return j.at(key).get<double>();
}

std::string str(const json& j, const char* key) {
    if (!j.is_object() || !j.contains(key) || !j.at(key).is_string()) return {};
    return j.at(key).get<std::string>();
}

const json& child(const json& j, const char* key) {
    static const json empty = json::object();
    if (!j.is_object() || !j.contains(key) || !j.at(key).is_object()) return empty;
    return j.at(key);
}

std::optional<Timestamp> dateKey(const json& j, std::initializer_list<const char*> keys) {
    for (const auto* key : keys) {
        const auto s = str(j, key);
        if (s.empty()) continue;
        if (const auto d = parseDate(s)) return startOf(*d);
    }
    return std::nullopt;
}

Payload stepsDay(const json& j) {
    StepsDay p;
    p.total_steps = count(j, "totalSteps");
    p.total_calories = count(j, "totalKilocalories");
    p.active_calories = count(j, "activeKilocalories");
    p.active_seconds = count(j, "activeSeconds");
    p.distance_meters = num(j, "totalDistanceMeters");
    p.floors_climbed = num(j, "floorsAscended");
    if (const auto hr = optNum(j, "restingHeartRate")) p.resting_hr = clampTo<int>(*hr);
    return p;
}

Payload sleepSession(const json& j) {
    const auto& dto = child(j, "dailySleepDTO");
    const auto& overall = child(child(dto, "sleepScores"), "overall");

    SleepSession p;
    p.duration_seconds = count(dto, "sleepTimeSeconds");
    p.score = clampTo<int>(num(overall, "value"));
    p.deep_seconds = count(dto, "deepSleepSeconds");
    p.light_seconds = count(dto, "lightSleepSeconds");
    p.rem_seconds = count(dto, "remSleepSeconds");
    p.awake_seconds = count(dto, "awakeSleepSeconds");
    return p;
}

Payload weightSample(const json& j) {
    auto grams = num(j, "maxWeight");
    if (grams <= 0) grams = num(j, "weight");

    WeightSample p;
    p.weight_kg = grams / 1000.0;
    p.bmi = optNum(j, "bmi");
    p.body_fat_pct = optNum(j, "bodyFat");
    if (const auto m = optNum(j, "muscleMass"); m && *m > 0) p.muscle_mass_kg = *m / 1000.0;
    if (const auto b = optNum(j, "boneMass"); b && *b > 0) p.bone_mass_kg = *b / 1000.0;
    p.body_water_pct = optNum(j, "bodyWater");
    return p;
}

Payload activity(const json& j) {
    Activity p;
    p.name = str(j, "activityName");
    p.type_key = str(child(j, "activityType"), "typeKey");
    p.duration_seconds = num(j, "duration");
    p.distance_meters = num(j, "distance");
    p.calories = optNum(j, "calories");
    return p;
}

Payload bodyBattery(const json& j) {
    BodyBatterySample p;
    if (j.contains("data") && j.at("data").is_array() && !j.at("data").empty()) {
        const auto& inner = j.at("data").front();
        p.charged = clampTo<int>(num(inner, "charged"));
        p.drained = clampTo<int>(num(inner, "drained"));
    }
    return p;
}

Payload stress(const json& j) {
    StressSample p;
    p.avg_level = clampTo<int>(num(j, "avgStressLevel"));
    p.max_level = clampTo<int>(num(j, "maxStressLevel"));
    return p;
}

}

std::string GarminParser::revisionOf(const json& element) {
    uint64_t hash = 0xcbf29ce484222325ULL;
    for (const unsigned char c : element.dump()) {
        hash ^= c;
        hash *= 0x100000001b3ULL;
    }
    return std::format("{:016x}", hash);
}

std::optional<Record> GarminParser::parse(const Kind kind, const json& element) {
    if (!element.is_object()) return std::nullopt;

    std::optional<Timestamp> ts;
    Payload payload;

    switch (kind) {
    case Kind::Steps:
        ts = dateKey(element, {"_date", "calendarDate"});
        payload = stepsDay(element);
        break;
    case Kind::Sleep:
        ts = dateKey(element, {"_date", "calendarDate"});
        if (!ts) ts = dateKey(child(element, "dailySleepDTO"), {"calendarDate"});
        payload = sleepSession(element);
        break;
    case Kind::Weight:
        ts = dateKey(element, {"summaryDate", "calendarDate", "_date"});
        payload = weightSample(element);
        break;
    case Kind::Activity:
        ts = parseTimestamp(str(element, "startTimeLocal"));
        payload = activity(element);
        break;
    case Kind::BodyBattery:
        ts = dateKey(element, {"_date", "calendarDate"});
        payload = bodyBattery(element);
        break;
    case Kind::Stress:
        ts = dateKey(element, {"_date", "calendarDate"});
        payload = stress(element);
        break;
    }

    if (!ts) return std::nullopt;
    return Record{std::move(payload), *ts, revisionOf(element)};
}

Records GarminParser::parseDocument(const Kind kind, const json& document) {
    const json* items = &document;
    if (document.is_object() && document.contains("dailyWeightSummaries"))
        items = &document.at("dailyWeightSummaries");

    if (!items->is_array())
        throw std::invalid_argument("expected an array of " + std::string(toString(kind)) + " entries");

    Records out;
    out.reserve(items->size());
    size_t skipped = 0;

    for (const auto& element : *items) {
        if (auto rec = parse(kind, element)) out.push_back(std::move(*rec));
        else ++skipped;
    }

    if (skipped > 0)
        LogRegistry::remote()->warn("[GarminParser] Skipped {} {} entries without a usable date", skipped, toString(kind));

    return out;
}
