#include "types/metric/Freshness.hpp"

#include <nlohmann/json.hpp>
#include <stdexcept>

using namespace hs::types::metric;
using namespace hs::util;
using json = nlohmann::json;

namespace {

Timestamp requireTimestamp(const json& j) {
    const auto s = j.get<std::string>();
    const auto ts = parseTimestamp(s);
    if (!ts) throw std::invalid_argument("bad freshness timestamp: " + s);
    return *ts;
}

}

void hs::types::metric::to_json(json& j, const Freshness& f) {
    j = {{"last_synced_at", formatTimestamp(f.last_synced_at)}};
    if (f.last_remote_timestamp_seen) j["last_remote_timestamp_seen"] = formatTimestamp(*f.last_remote_timestamp_seen);
    else j["last_remote_timestamp_seen"] = nullptr;
}

void hs::types::metric::from_json(const json& j, Freshness& f) {
    f.last_synced_at = requireTimestamp(j.at("last_synced_at"));
    if (j.contains("last_remote_timestamp_seen") && !j.at("last_remote_timestamp_seen").is_null())
        f.last_remote_timestamp_seen = requireTimestamp(j.at("last_remote_timestamp_seen"));
    else f.last_remote_timestamp_seen.reset();
}
