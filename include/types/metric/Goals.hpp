#pragma once

#include <cstdint>
#include <nlohmann/json_fwd.hpp>

namespace hs::types::metric {

struct GoalSet {
    double weight_kg = 75.0;
    uint32_t daily_steps = 10000;
    double sleep_hours = 7.0;
    uint32_t workouts_per_week = 3;

    bool operator==(const GoalSet&) const = default;
};

void to_json(nlohmann::json& j, const GoalSet& g);

// Missing keys keep their defaults.
void from_json(const nlohmann::json& j, GoalSet& g);

}
