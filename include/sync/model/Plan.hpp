#pragma once

#include "types/metric/Kind.hpp"
#include "util/timestamp.hpp"

#include <cstdint>
#include <string_view>
#include <nlohmann/json_fwd.hpp>

namespace hs::sync::model {

struct Plan {
    enum class Action : uint8_t {
        Skip,
        Fetch
    };

    enum class Reason : uint8_t {
        Bootstrap,      // no freshness: whole retention window
        Incremental,    // overlap-guarded range since the last seen remote timestamp
        WithinInterval  // synced too recently
    };

    types::metric::Kind kind{types::metric::Kind::Steps};
    Action action{Action::Skip};
    Reason reason{Reason::WithinInterval};

    // Inclusive calendar-date range; meaningful only when action == Fetch
    util::Date start{};
    util::Date end{};

    [[nodiscard]] bool skip() const noexcept { return action == Action::Skip; }
    [[nodiscard]] bool isBootstrap() const noexcept { return reason == Reason::Bootstrap; }
    [[nodiscard]] long days() const noexcept { return skip() ? 0 : (end - start).count() + 1; }

    static std::string_view toString(Action a) noexcept;
    static std::string_view toString(Reason r) noexcept;
};

void to_json(nlohmann::json& j, const Plan& p);

}
