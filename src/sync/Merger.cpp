#include "sync/Merger.hpp"
#include "storage/LocalStore.hpp"
#include "logging/LogRegistry.hpp"

#include <algorithm>
#include <map>

using namespace hs::sync;
using namespace hs::types::metric;
using namespace hs::logging;
using namespace hs::util;

Merger::Merger(storage::LocalStore& store, const Clock& clock) : store_(store), clock_(clock) {}

MergeOutcome Merger::merge(const Kind kind, const Records& fetched) {
    MergeOutcome out;

    std::map<Timestamp, const Record*> batch;
    for (const auto& r : fetched) {
        if (r.kind != kind || !r.isConsistent()) {
            ++out.rejected_count;
            continue;
        }
        batch[r.timestamp] = &r;
    }

    if (out.rejected_count > 0)
        LogRegistry::sync()->warn("[Merger] Dropped {} records not matching kind {}", out.rejected_count, toString(kind));

    Records accepted;
    accepted.reserve(batch.size());

    for (const auto& [ts, rec] : batch) {
        auto previous = store_.at(kind, ts);
        const bool changed = !previous || rec->source_revision.empty() ||
                             previous->source_revision != rec->source_revision;
        if (changed) out.changes.push_back({std::move(previous), *rec});
        accepted.push_back(*rec);
    }

    out.changed_count = store_.upsert(kind, accepted);

    const auto prior = store_.freshness(kind);
    out.freshness.last_synced_at = clock_.now();
    if (prior) out.freshness.last_remote_timestamp_seen = prior->last_remote_timestamp_seen;

    if (!batch.empty()) {
        const auto newest = batch.rbegin()->first;
        auto& seen = out.freshness.last_remote_timestamp_seen;
        if (!seen || *seen < newest) seen = newest;
    }

    store_.commitFreshness(kind, out.freshness);

    LogRegistry::sync()->debug("[Merger] {}: {} fetched, {} changed", toString(kind), fetched.size(), out.changed_count);
    return out;
}
