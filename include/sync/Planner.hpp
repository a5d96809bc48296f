#pragma once

#include "config/Config.hpp"
#include "sync/model/Plan.hpp"
#include "types/metric/Freshness.hpp"

#include <optional>

namespace hs::storage { class LocalStore; }
namespace hs::util { struct Clock; }

namespace hs::sync {

class Planner {
public:
    Planner(const storage::LocalStore& store, config::SyncConfig cnf, const util::Clock& clock);

    [[nodiscard]] model::Plan plan(types::metric::Kind kind, bool force = false) const;

    // No freshness: fetch [today - bootstrap_days, today].
    // Synced less than interval_minutes ago (and not forced): skip.
    // Otherwise: fetch [anchor - safety_overlap_days, today], where the anchor is the date of
    // last_remote_timestamp_seen, or of last_synced_at when nothing was ever seen.
    static model::Plan build(types::metric::Kind kind,
                             const std::optional<types::metric::Freshness>& freshness,
                             const config::SyncConfig& cnf,
                             util::Timestamp now,
                             util::Date today,
                             bool force = false);

private:
    const storage::LocalStore& store_;
    config::SyncConfig cnf_;
    const util::Clock& clock_;
};

}
