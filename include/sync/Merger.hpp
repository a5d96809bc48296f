#pragma once

#include "types/metric/Freshness.hpp"
#include "types/metric/Kind.hpp"
#include "types/metric/Record.hpp"

#include <optional>
#include <vector>

namespace hs::storage { class LocalStore; }
namespace hs::util { struct Clock; }

namespace hs::sync {

struct RecordChange {
    std::optional<types::metric::Record> previous;
    types::metric::Record current;
};

struct MergeOutcome {
    size_t changed_count{0};
    size_t rejected_count{0};
    types::metric::Freshness freshness;
    std::vector<RecordChange> changes;
};

// Reconciles a fetched batch with the store. Only invoked after a successful fetch.
class Merger {
public:
    Merger(storage::LocalStore& store, const util::Clock& clock);

    // Records of another kind are dropped. Within the batch the last record for a timestamp
    // wins. The series is written before freshness is committed; last_remote_timestamp_seen
    // only ever moves forward. Storage errors propagate with freshness untouched.
    MergeOutcome merge(types::metric::Kind kind, const types::metric::Records& fetched);

private:
    storage::LocalStore& store_;
    const util::Clock& clock_;
};

}
