#include "analytics/model/Goal.hpp"

#include <nlohmann/json.hpp>

using namespace hs::analytics::model;

void hs::analytics::model::to_json(nlohmann::json& j, const GoalProgress& g) {
    j = {
        {"name", g.name},
        {"current", g.current},
        {"target", g.target},
        {"percent", g.percent},
        {"met", g.met}
    };
}

void hs::analytics::model::to_json(nlohmann::json& j, const GoalReport& r) {
    j = {{"configured", r.configured}};
    if (!r.configured) j["message"] = r.message;
    else j["goals"] = r.goals;
}
