#pragma once

#include "analytics/model/Goal.hpp"
#include "sync/model/Result.hpp"
#include "types/metric/Freshness.hpp"
#include "types/metric/Kind.hpp"
#include "util/timestamp.hpp"

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace hs::presentation {

struct KindStatus {
    types::metric::Kind kind{types::metric::Kind::Steps};
    std::optional<long> age_minutes;  // nullopt: never synced
    std::string label;
    bool stale{true};
    size_t records{0};
    std::optional<types::metric::Freshness> freshness;
};

struct StatusSnapshot {
    util::Timestamp generated_at{};
    std::vector<KindStatus> kinds;
    analytics::model::GoalReport goals;
    std::optional<sync::model::Result> last_sync;

    [[nodiscard]] bool anyStale() const noexcept {
        for (const auto& k : kinds)
            if (k.stale) return true;
        return false;
    }
};

void to_json(nlohmann::json& j, const KindStatus& s);
void to_json(nlohmann::json& j, const StatusSnapshot& s);

}
