#pragma once

#include "types/metric/Kind.hpp"
#include "types/metric/Record.hpp"

#include <optional>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace hs::remote {

// Garmin Connect shaped JSON -> MetricRecords. Nulls and missing fields become zero or
// empty; an element without a usable date is skipped.
struct GarminParser {
    static std::optional<types::metric::Record> parse(types::metric::Kind kind, const nlohmann::json& element);

    // Accepts an array of elements, or the {"dailyWeightSummaries": [...]} wrapper for weight.
    static types::metric::Records parseDocument(types::metric::Kind kind, const nlohmann::json& document);

    // FNV-1a 64 of the element's compact dump, as 16 hex digits.
    static std::string revisionOf(const nlohmann::json& element);
};

}
