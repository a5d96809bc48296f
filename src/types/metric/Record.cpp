#include "types/metric/Record.hpp"

#include <nlohmann/json.hpp>
#include <stdexcept>

using namespace hs::types::metric;
using namespace hs::util;
using json = nlohmann::json;

void hs::types::metric::to_json(json& j, const Record& r) {
    j = {
        {"ts", formatTimestamp(r.timestamp)},
        {"rev", r.source_revision},
        {"payload", payloadToJson(r.payload)}
    };
}

Record hs::types::metric::recordFromJson(const Kind kind, const json& j) {
    const auto ts = parseTimestamp(j.at("ts").get<std::string>());
    if (!ts) throw std::invalid_argument("bad record timestamp: " + j.at("ts").get<std::string>());

    Record r;
    r.kind = kind;
    r.timestamp = *ts;
    r.source_revision = j.value("rev", std::string{});
    r.payload = payloadFromJson(kind, j.at("payload"));
    return r;
}
