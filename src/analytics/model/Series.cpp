#include "analytics/model/Series.hpp"

#include <nlohmann/json.hpp>
#include <string>

using namespace hs::analytics::model;
using namespace hs::util;
using json = nlohmann::json;

std::string_view hs::analytics::model::toString(const Bucket b) noexcept {
    switch (b) {
    case Bucket::Day:  return "day";
    case Bucket::Week: return "week";
    }
    return "unknown";
}

void hs::analytics::model::to_json(json& j, const Trend& t) {
    json points = json::array();
    for (const auto& p : t.points) points.push_back({{"bucket", formatDate(p.bucket)}, {"value", p.value}});

    j = {
        {"kind", hs::types::metric::toString(t.kind)},
        {"bucket", toString(t.bucket)},
        {"window_days", t.window_days},
        {"samples", t.samples},
        {"insufficient_data", t.insufficient_data},
        {"points", points}
    };
}

void hs::analytics::model::to_json(json& j, const Pattern& p) {
    json buckets = json::object();
    for (const auto& [key, value] : p.buckets) buckets[std::to_string(key)] = value;

    j = {
        {"kind", hs::types::metric::toString(p.kind)},
        {"samples", p.samples},
        {"insufficient_data", p.insufficient_data},
        {"buckets", buckets}
    };
}

void hs::analytics::model::to_json(json& j, const Extremes& e) {
    const auto day = [](const std::optional<DayValue>& d) -> json {
        if (!d) return nullptr;
        return {{"date", formatDate(d->date)}, {"value", d->value}};
    };

    j = {
        {"kind", hs::types::metric::toString(e.kind)},
        {"best", day(e.best)},
        {"worst", day(e.worst)}
    };
}
