#pragma once

#include "types/metric/Kind.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <nlohmann/json_fwd.hpp>

namespace hs::types::metric {

struct StepsDay {
    uint32_t total_steps{};
    uint32_t total_calories{};
    uint32_t active_calories{};
    uint32_t active_seconds{};
    double distance_meters{};
    double floors_climbed{};
    std::optional<int> resting_hr;

    bool operator==(const StepsDay&) const = default;
};

struct SleepSession {
    uint32_t duration_seconds{};
    int score{};
    uint32_t deep_seconds{}, light_seconds{}, rem_seconds{}, awake_seconds{};

    [[nodiscard]] double durationHours() const noexcept { return duration_seconds / 3600.0; }
    [[nodiscard]] double deepPct() const noexcept {
        return duration_seconds == 0 ? 0.0 : 100.0 * deep_seconds / duration_seconds;
    }
    [[nodiscard]] double remPct() const noexcept {
        return duration_seconds == 0 ? 0.0 : 100.0 * rem_seconds / duration_seconds;
    }

    bool operator==(const SleepSession&) const = default;
};

struct WeightSample {
    double weight_kg{};
    std::optional<double> bmi, body_fat_pct, muscle_mass_kg, bone_mass_kg, body_water_pct;

    bool operator==(const WeightSample&) const = default;
};

struct Activity {
    std::string name;
    std::string type_key;
    double duration_seconds{};
    double distance_meters{};
    std::optional<double> calories;

    bool operator==(const Activity&) const = default;
};

struct BodyBatterySample {
    int charged{};
    int drained{};

    [[nodiscard]] int netChange() const noexcept { return charged - drained; }

    bool operator==(const BodyBatterySample&) const = default;
};

struct StressSample {
    int avg_level{};
    int max_level{};

    bool operator==(const StressSample&) const = default;
};

using Payload = std::variant<StepsDay, SleepSession, WeightSample, Activity, BodyBatterySample, StressSample>;

static_assert(std::variant_size_v<Payload> == ALL_KINDS.size());

[[nodiscard]] inline Kind kindOf(const Payload& p) noexcept { return static_cast<Kind>(p.index()); }

// The number trend and pattern analytics work with: steps, hours slept, kg,
// one per activity, body battery charged, average stress.
[[nodiscard]] double naturalValue(const Payload& p);

void to_json(nlohmann::json& j, const StepsDay& p);
void from_json(const nlohmann::json& j, StepsDay& p);
void to_json(nlohmann::json& j, const SleepSession& p);
void from_json(const nlohmann::json& j, SleepSession& p);
void to_json(nlohmann::json& j, const WeightSample& p);
void from_json(const nlohmann::json& j, WeightSample& p);
void to_json(nlohmann::json& j, const Activity& p);
void from_json(const nlohmann::json& j, Activity& p);
void to_json(nlohmann::json& j, const BodyBatterySample& p);
void from_json(const nlohmann::json& j, BodyBatterySample& p);
void to_json(nlohmann::json& j, const StressSample& p);
void from_json(const nlohmann::json& j, StressSample& p);

nlohmann::json payloadToJson(const Payload& p);
Payload payloadFromJson(Kind kind, const nlohmann::json& j);

}
