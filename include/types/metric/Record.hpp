#pragma once

#include "types/metric/Kind.hpp"
#include "types/metric/Payload.hpp"
#include "util/timestamp.hpp"

#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace hs::types::metric {

struct Record {
    Kind kind{Kind::Steps};
    util::Timestamp timestamp{};
    Payload payload{};
    std::string source_revision;

    Record() = default;
    Record(Payload p, util::Timestamp ts, std::string revision = {})
        : kind(kindOf(p)), timestamp(ts), payload(std::move(p)), source_revision(std::move(revision)) {}

    [[nodiscard]] bool isConsistent() const noexcept { return kindOf(payload) == kind; }
    [[nodiscard]] double value() const { return naturalValue(payload); }

    template <typename T>
    [[nodiscard]] const T& as() const { return std::get<T>(payload); }

    bool operator==(const Record&) const = default;
};

using Records = std::vector<Record>;

// Inclusive timestamp window
struct TimeRange {
    util::Timestamp start{};
    util::Timestamp end{util::Timestamp::max()};

    [[nodiscard]] bool contains(const util::Timestamp ts) const noexcept { return ts >= start && ts <= end; }

    static TimeRange all() { return {}; }
    static TimeRange since(const util::Timestamp ts) { return {ts, util::Timestamp::max()}; }
};

// Series-file form: {"ts", "rev", "payload"}. The kind lives in the file header.
void to_json(nlohmann::json& j, const Record& r);
Record recordFromJson(Kind kind, const nlohmann::json& j);

}
