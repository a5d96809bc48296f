#include "sync/model/Plan.hpp"

#include <nlohmann/json.hpp>

using namespace hs::sync::model;
using namespace hs::util;

std::string_view Plan::toString(const Action a) noexcept {
    switch (a) {
    case Action::Skip:  return "skip";
    case Action::Fetch: return "fetch";
    }
    return "unknown";
}

std::string_view Plan::toString(const Reason r) noexcept {
    switch (r) {
    case Reason::Bootstrap:      return "bootstrap";
    case Reason::Incremental:    return "incremental";
    case Reason::WithinInterval: return "within_interval";
    }
    return "unknown";
}

void hs::sync::model::to_json(nlohmann::json& j, const Plan& p) {
    j = {
        {"kind", hs::types::metric::toString(p.kind)},
        {"action", Plan::toString(p.action)},
        {"reason", Plan::toString(p.reason)}
    };

    if (!p.skip()) {
        j["start"] = formatDate(p.start);
        j["end"] = formatDate(p.end);
    }
}
