#include "sync/Planner.hpp"
#include "storage/LocalStore.hpp"
#include "logging/LogRegistry.hpp"

#include <algorithm>

using namespace hs::sync;
using namespace hs::sync::model;
using namespace hs::types::metric;
using namespace hs::logging;
using namespace hs::util;

Planner::Planner(const storage::LocalStore& store, config::SyncConfig cnf, const Clock& clock)
    : store_(store), cnf_(std::move(cnf)), clock_(clock) {}

Plan Planner::plan(const Kind kind, const bool force) const {
    auto p = build(kind, store_.freshness(kind), cnf_, clock_.now(), clock_.today(), force);

    if (p.skip())
        LogRegistry::sync()->debug("[Planner] {}: skip ({})", toString(kind), Plan::toString(p.reason));
    else
        LogRegistry::sync()->debug("[Planner] {}: {} {} .. {} ({} days)", toString(kind), Plan::toString(p.reason),
                                   formatDate(p.start), formatDate(p.end), p.days());
    return p;
}

Plan Planner::build(const Kind kind,
                    const std::optional<Freshness>& freshness,
                    const config::SyncConfig& cnf,
                    const Timestamp now,
                    const Date today,
                    const bool force) {
    Plan p{.kind = kind};

    if (!freshness) {
        p.action = Plan::Action::Fetch;
        p.reason = Plan::Reason::Bootstrap;
        p.start = today - std::chrono::days(cnf.bootstrap_days);
        p.end = today;
        return p;
    }

    // A clock that went backwards counts as elapsed.
    const auto elapsed = now - freshness->last_synced_at;
    if (!force && elapsed >= std::chrono::seconds::zero() && elapsed < cnf.interval()) {
        p.action = Plan::Action::Skip;
        p.reason = Plan::Reason::WithinInterval;
        return p;
    }

    const Date anchor = freshness->last_remote_timestamp_seen
                            ? dateOf(*freshness->last_remote_timestamp_seen)
                            : dateOf(freshness->last_synced_at);

    p.action = Plan::Action::Fetch;
    p.reason = Plan::Reason::Incremental;
    p.end = today;
    p.start = std::min(anchor - std::chrono::days(cnf.safety_overlap_days), today);
    return p;
}
