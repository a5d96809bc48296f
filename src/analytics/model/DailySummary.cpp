#include "analytics/model/DailySummary.hpp"

#include <nlohmann/json.hpp>

using namespace hs::analytics::model;
using namespace hs::util;
using json = nlohmann::json;

namespace {

template <typename T>
json orNull(const std::optional<T>& v) {
    if (v) return *v;
    return nullptr;
}

}

void hs::analytics::model::to_json(json& j, const DailySummary& s) {
    j = {
        {"date", formatDate(s.date)},
        {"steps", s.steps},
        {"steps_goal", s.steps_goal},
        {"sleep_hours", s.sleep_hours},
        {"sleep_goal", s.sleep_goal},
        {"sleep_score", s.sleep_score},
        {"weight_kg", orNull(s.weight_kg)},
        {"weight_goal", s.weight_goal},
        {"weight_change_7d", orNull(s.weight_change_7d)},
        {"body_battery", orNull(s.body_battery)},
        {"goals_met", s.goals_met},
        {"status", s.status}
    };
}
