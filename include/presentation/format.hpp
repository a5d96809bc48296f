#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace hs::presentation {

// "?" when unknown or negative, "now" under a minute, then "Nm", "Nh", "Nd".
inline std::string formatTimeAgo(const std::optional<std::chrono::minutes> age) {
    if (!age || age->count() < 0) return "?";

    const auto m = age->count();
    if (m < 1) return "now";
    if (m < 60) return std::to_string(m) + "m";
    if (m < 1440) return std::to_string(m / 60) + "h";
    return std::to_string(m / 1440) + "d";
}

}
