#pragma once

#include "types/metric/Freshness.hpp"
#include "types/metric/Kind.hpp"
#include "types/metric/Record.hpp"

#include <array>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <stdexcept>
#include <string>

namespace hs::storage {

// Raised while loading a persisted artifact that fails to parse. Never leaves LocalStore.
struct StoreCorrupt : std::runtime_error {
    std::filesystem::path file;

    StoreCorrupt(std::filesystem::path f, const std::string& why)
        : std::runtime_error("Corrupt store file " + f.string() + ": " + why), file(std::move(f)) {}
};

// Durable per-kind record series plus one freshness file, under a single data directory:
//
//   <data_dir>/series/<kind>.json
//   <data_dir>/freshness.json
//
// Every write replaces the whole file through a temp file and rename, so a crash leaves
// the previously committed state. Each kind has its own lock; readers of one kind never
// wait on writers of another.
class LocalStore {
public:
    explicit LocalStore(std::filesystem::path dataDir);

    [[nodiscard]] types::metric::Records read(types::metric::Kind kind,
                                              const types::metric::TimeRange& range = types::metric::TimeRange::all()) const;

    [[nodiscard]] std::optional<types::metric::Record> at(types::metric::Kind kind, util::Timestamp ts) const;
    [[nodiscard]] std::optional<types::metric::Record> latest(types::metric::Kind kind) const;
    [[nodiscard]] size_t size(types::metric::Kind kind) const;

    // Inserts or replaces records by timestamp. Returns how many timestamps were new or
    // carried a different (or empty) source revision. Nothing is written when that is 0.
    // Throws std::invalid_argument for a record of another kind, and filesystem errors
    // if the series cannot be persisted (the in-memory state is then left untouched).
    size_t upsert(types::metric::Kind kind, const types::metric::Records& records);

    // Loads the kind's series first, so a quarantined series never reports stale freshness.
    [[nodiscard]] std::optional<types::metric::Freshness> freshness(types::metric::Kind kind) const;

    // Callers commit freshness only after the matching upsert has returned.
    void commitFreshness(types::metric::Kind kind, const types::metric::Freshness& f);

    // Forgets freshness so the next plan for this kind is a bootstrap.
    void resetFreshness(types::metric::Kind kind);

    // Drops every cached series and the freshness map; the next access re-reads from disk.
    // Writers in other processes are only excluded while sync.lock is held.
    void reload();

    // Maintenance: drops records older than cutoff. Returns the number dropped.
    size_t retain(types::metric::Kind kind, util::Timestamp cutoff);

    [[nodiscard]] const std::filesystem::path& dataDir() const { return dataDir_; }
    [[nodiscard]] std::filesystem::path seriesPath(types::metric::Kind kind) const;
    [[nodiscard]] std::filesystem::path freshnessPath() const;

private:
    using Series = std::map<util::Timestamp, types::metric::Record>;

    struct Slot {
        mutable std::shared_mutex mutex;
        bool loaded = false;
        Series records;
    };

    std::filesystem::path dataDir_;

    mutable std::array<Slot, types::metric::ALL_KINDS.size()> slots_;

    mutable std::mutex freshnessMutex_;
    mutable bool freshnessLoaded_ = false;
    mutable std::map<types::metric::Kind, types::metric::Freshness> freshness_;

    Slot& slot(types::metric::Kind kind) const;
    void ensureLoaded(types::metric::Kind kind) const;

    Series loadSeries(types::metric::Kind kind) const;
    void persistSeries(types::metric::Kind kind, const Series& series) const;

    // Also called from loadSeries when a series file is quarantined
    void forgetFreshness(types::metric::Kind kind) const;

    // freshnessMutex_ must be held
    void ensureFreshnessLoaded() const;
    void persistFreshness() const;
};

}
