#include "types/metric/Goals.hpp"

#include <nlohmann/json.hpp>

using namespace hs::types::metric;
using json = nlohmann::json;

void hs::types::metric::to_json(json& j, const GoalSet& g) {
    j = {
        {"weight_kg", g.weight_kg},
        {"daily_steps", g.daily_steps},
        {"sleep_hours", g.sleep_hours},
        {"workouts_per_week", g.workouts_per_week}
    };
}

void hs::types::metric::from_json(const json& j, GoalSet& g) {
    const GoalSet defaults;
    g.weight_kg = j.value("weight_kg", defaults.weight_kg);
    g.daily_steps = j.value("daily_steps", defaults.daily_steps);
    g.sleep_hours = j.value("sleep_hours", defaults.sleep_hours);
    g.workouts_per_week = j.value("workouts_per_week", defaults.workouts_per_week);
}
