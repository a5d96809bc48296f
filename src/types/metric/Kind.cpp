#include "types/metric/Kind.hpp"

using namespace hs::types::metric;

Aggregation hs::types::metric::aggregationFor(const Kind kind) noexcept {
    switch (kind) {
    case Kind::Steps:
    case Kind::Activity:
        return Aggregation::Sum;
    case Kind::Sleep:
    case Kind::Weight:
    case Kind::BodyBattery:
    case Kind::Stress:
        return Aggregation::Mean;
    }
    return Aggregation::Mean;
}

std::string_view hs::types::metric::toString(const Kind kind) noexcept {
    switch (kind) {
    case Kind::Steps:       return "steps";
    case Kind::Sleep:       return "sleep";
    case Kind::Weight:      return "weight";
    case Kind::Activity:    return "activity";
    case Kind::BodyBattery: return "body_battery";
    case Kind::Stress:      return "stress";
    }
    return "unknown";
}

bool hs::types::metric::tryParseKind(const std::string_view in, Kind& out) noexcept {
    for (const auto k : ALL_KINDS) {
        if (toString(k) == in) {
            out = k;
            return true;
        }
    }
    return false;
}
