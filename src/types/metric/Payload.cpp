#include "types/metric/Payload.hpp"

#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

using namespace hs::types::metric;
using json = nlohmann::json;

namespace {

template <typename T>
void putOpt(json& j, const char* key, const std::optional<T>& v) {
    if (v) j[key] = *v;
    else j[key] = nullptr;
}

template <typename T>
void getOpt(const json& j, const char* key, std::optional<T>& out) {
    if (j.contains(key) && !j.at(key).is_null()) out = j.at(key).get<T>();
    else out.reset();
}

template <typename T>
Payload decodeAs(const json& j) {
    return Payload{std::in_place_type<T>, j.get<T>()};
}

}

double hs::types::metric::naturalValue(const Payload& p) {
    return std::visit([]<typename T>(const T& v) -> double {
        if constexpr (std::is_same_v<T, StepsDay>) return v.total_steps;
        else if constexpr (std::is_same_v<T, SleepSession>) return v.durationHours();
        else if constexpr (std::is_same_v<T, WeightSample>) return v.weight_kg;
        else if constexpr (std::is_same_v<T, Activity>) return 1.0;
        else if constexpr (std::is_same_v<T, BodyBatterySample>) return v.charged;
        else return v.avg_level;
    }, p);
}

void hs::types::metric::to_json(json& j, const StepsDay& p) {
    j = {
        {"total_steps", p.total_steps},
        {"total_calories", p.total_calories},
        {"active_calories", p.active_calories},
        {"active_seconds", p.active_seconds},
        {"distance_meters", p.distance_meters},
        {"floors_climbed", p.floors_climbed}
    };
    putOpt(j, "resting_hr", p.resting_hr);
}

void hs::types::metric::from_json(const json& j, StepsDay& p) {
    j.at("total_steps").get_to(p.total_steps);
    p.total_calories = j.value("total_calories", 0u);
    p.active_calories = j.value("active_calories", 0u);
    p.active_seconds = j.value("active_seconds", 0u);
    p.distance_meters = j.value("distance_meters", 0.0);
    p.floors_climbed = j.value("floors_climbed", 0.0);
    getOpt(j, "resting_hr", p.resting_hr);
}

void hs::types::metric::to_json(json& j, const SleepSession& p) {
    j = {
        {"duration_seconds", p.duration_seconds},
        {"score", p.score},
        {"deep_seconds", p.deep_seconds},
        {"light_seconds", p.light_seconds},
        {"rem_seconds", p.rem_seconds},
        {"awake_seconds", p.awake_seconds}
    };
}

void hs::types::metric::from_json(const json& j, SleepSession& p) {
    j.at("duration_seconds").get_to(p.duration_seconds);
    p.score = j.value("score", 0);
    p.deep_seconds = j.value("deep_seconds", 0u);
    p.light_seconds = j.value("light_seconds", 0u);
    p.rem_seconds = j.value("rem_seconds", 0u);
    p.awake_seconds = j.value("awake_seconds", 0u);
}

void hs::types::metric::to_json(json& j, const WeightSample& p) {
    j = {{"weight_kg", p.weight_kg}};
    putOpt(j, "bmi", p.bmi);
    putOpt(j, "body_fat_pct", p.body_fat_pct);
    putOpt(j, "muscle_mass_kg", p.muscle_mass_kg);
    putOpt(j, "bone_mass_kg", p.bone_mass_kg);
    putOpt(j, "body_water_pct", p.body_water_pct);
}

void hs::types::metric::from_json(const json& j, WeightSample& p) {
    j.at("weight_kg").get_to(p.weight_kg);
    getOpt(j, "bmi", p.bmi);
    getOpt(j, "body_fat_pct", p.body_fat_pct);
    getOpt(j, "muscle_mass_kg", p.muscle_mass_kg);
    getOpt(j, "bone_mass_kg", p.bone_mass_kg);
    getOpt(j, "body_water_pct", p.body_water_pct);
}

void hs::types::metric::to_json(json& j, const Activity& p) {
    j = {
        {"name", p.name},
        {"type_key", p.type_key},
        {"duration_seconds", p.duration_seconds},
        {"distance_meters", p.distance_meters}
    };
    putOpt(j, "calories", p.calories);
}

void hs::types::metric::from_json(const json& j, Activity& p) {
    j.at("name").get_to(p.name);
    p.type_key = j.value("type_key", std::string{});
    p.duration_seconds = j.value("duration_seconds", 0.0);
    p.distance_meters = j.value("distance_meters", 0.0);
    getOpt(j, "calories", p.calories);
}

void hs::types::metric::to_json(json& j, const BodyBatterySample& p) {
    j = {{"charged", p.charged}, {"drained", p.drained}};
}

void hs::types::metric::from_json(const json& j, BodyBatterySample& p) {
    j.at("charged").get_to(p.charged);
    j.at("drained").get_to(p.drained);
}

void hs::types::metric::to_json(json& j, const StressSample& p) {
    j = {{"avg_level", p.avg_level}, {"max_level", p.max_level}};
}

void hs::types::metric::from_json(const json& j, StressSample& p) {
    j.at("avg_level").get_to(p.avg_level);
    p.max_level = j.value("max_level", 0);
}

json hs::types::metric::payloadToJson(const Payload& p) {
    return std::visit([](const auto& v) { return json(v); }, p);
}

Payload hs::types::metric::payloadFromJson(const Kind kind, const json& j) {
    if (!j.is_object())
        throw std::invalid_argument("payload for " + std::string(toString(kind)) + " is not an object");

    switch (kind) {
    case Kind::Steps:       return decodeAs<StepsDay>(j);
    case Kind::Sleep:       return decodeAs<SleepSession>(j);
    case Kind::Weight:      return decodeAs<WeightSample>(j);
    case Kind::Activity:    return decodeAs<Activity>(j);
    case Kind::BodyBattery: return decodeAs<BodyBatterySample>(j);
    case Kind::Stress:      return decodeAs<StressSample>(j);
    }
    throw std::invalid_argument("unknown metric kind");
}
