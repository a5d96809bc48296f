#pragma once

#include "types/metric/Kind.hpp"
#include "util/timestamp.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string_view>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace hs::analytics::model {

enum class Bucket : uint8_t { Day, Week };

std::string_view toString(Bucket b) noexcept;

struct TrendPoint {
    util::Date bucket;  // the day, or the Monday starting the ISO week
    double value{0};
};

// insufficient_data is set (and points left empty) when the window holds fewer than two
// samples or the samples fall into a single bucket.
struct Trend {
    types::metric::Kind kind{types::metric::Kind::Steps};
    Bucket bucket{Bucket::Day};
    unsigned int window_days{0};
    size_t samples{0};
    bool insufficient_data{true};
    std::vector<TrendPoint> points;
};

// Keys are ISO weekdays (1 = Monday) or months (1 = January).
struct Pattern {
    types::metric::Kind kind{types::metric::Kind::Steps};
    size_t samples{0};
    bool insufficient_data{true};
    std::map<unsigned int, double> buckets;
};

struct DayValue {
    util::Date date;
    double value{0};
};

struct Extremes {
    types::metric::Kind kind{types::metric::Kind::Steps};
    std::optional<DayValue> best;   // highest daily value
    std::optional<DayValue> worst;  // lowest daily value
};

void to_json(nlohmann::json& j, const Trend& t);
void to_json(nlohmann::json& j, const Pattern& p);
void to_json(nlohmann::json& j, const Extremes& e);

}
