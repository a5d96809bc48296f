#pragma once

#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace hs::analytics::model {

struct GoalProgress {
    std::string name;   // daily_steps, sleep_hours, weight_kg, workouts_per_week
    double current{0};
    double target{0};
    double percent{0};
    bool met{false};
};

struct GoalReport {
    static constexpr const auto* NO_GOALS = "no goals configured";

    bool configured{false};
    std::string message;
    std::vector<GoalProgress> goals;

    [[nodiscard]] const GoalProgress* find(const std::string& name) const noexcept {
        for (const auto& g : goals)
            if (g.name == name) return &g;
        return nullptr;
    }
};

void to_json(nlohmann::json& j, const GoalProgress& g);
void to_json(nlohmann::json& j, const GoalReport& r);

}
