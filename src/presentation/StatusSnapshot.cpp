#include "presentation/StatusSnapshot.hpp"
#include "presentation/Sink.hpp"

#include <nlohmann/json.hpp>

using namespace hs::presentation;
using namespace hs::util;
using json = nlohmann::json;

void hs::presentation::to_json(json& j, const KindStatus& s) {
    j = {
        {"kind", hs::types::metric::toString(s.kind)},
        {"label", s.label},
        {"stale", s.stale},
        {"records", s.records}
    };

    if (s.age_minutes) j["age_minutes"] = *s.age_minutes;
    else j["age_minutes"] = nullptr;

    if (s.freshness) j["freshness"] = *s.freshness;
    else j["freshness"] = nullptr;
}

void hs::presentation::to_json(json& j, const StatusSnapshot& s) {
    j = {
        {"generated_at", formatTimestamp(s.generated_at)},
        {"any_stale", s.anyStale()},
        {"kinds", s.kinds},
        {"goals", s.goals}
    };

    if (s.last_sync) j["last_sync"] = *s.last_sync;
    else j["last_sync"] = nullptr;
}

void JsonStreamSink::publish(const StatusSnapshot& snapshot) {
    out_ << json(snapshot).dump(2) << '\n';
    out_.flush();
}
