#pragma once

#include "util/timestamp.hpp"

#include <chrono>
#include <optional>
#include <nlohmann/json_fwd.hpp>

namespace hs::types::metric {

struct Freshness {
    util::Timestamp last_synced_at{};
    std::optional<util::Timestamp> last_remote_timestamp_seen;

    [[nodiscard]] std::chrono::minutes age(const util::Timestamp now) const {
        if (now <= last_synced_at) return std::chrono::minutes{0};
        return std::chrono::floor<std::chrono::minutes>(now - last_synced_at);
    }

    bool operator==(const Freshness&) const = default;
};

void to_json(nlohmann::json& j, const Freshness& f);
void from_json(const nlohmann::json& j, Freshness& f);

}
