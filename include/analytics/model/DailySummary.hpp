#pragma once

#include "util/timestamp.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace hs::analytics::model {

struct DailySummary {
    util::Date date;

    uint32_t steps{0};
    uint32_t steps_goal{0};

    double sleep_hours{0};
    double sleep_goal{0};
    int sleep_score{0};

    std::optional<double> weight_kg;
    double weight_goal{0};
    std::optional<double> weight_change_7d;

    std::optional<int> body_battery;

    unsigned int goals_met{0};  // out of steps and sleep
    std::string status;

    [[nodiscard]] bool stepsMet() const noexcept { return steps >= steps_goal; }
    [[nodiscard]] bool sleepMet() const noexcept { return sleep_hours >= sleep_goal; }
};

void to_json(nlohmann::json& j, const DailySummary& s);

}
