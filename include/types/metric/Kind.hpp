#pragma once

#include <array>
#include <cstdint>
#include <string_view>

namespace hs::types::metric {

// Order matches the alternatives of metric::Payload.
enum class Kind : uint8_t {
    Steps,
    Sleep,
    Weight,
    Activity,
    BodyBattery,
    Stress
};

inline constexpr std::array<Kind, 6> ALL_KINDS = {
    Kind::Steps, Kind::Sleep, Kind::Weight, Kind::Activity, Kind::BodyBattery, Kind::Stress
};

// How values of one kind combine inside a bucket (a day, a weekday, a month).
enum class Aggregation { Sum, Mean };

[[nodiscard]] Aggregation aggregationFor(Kind kind) noexcept;

[[nodiscard]] std::string_view toString(Kind kind) noexcept;

// Returns false if unrecognized (and leaves out unchanged)
bool tryParseKind(std::string_view in, Kind& out) noexcept;

}
