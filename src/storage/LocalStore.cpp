#include "storage/LocalStore.hpp"
#include "logging/LogRegistry.hpp"
#include "util/files.hpp"

#include <nlohmann/json.hpp>
#include <ranges>
#include <set>

using namespace hs::storage;
using namespace hs::types::metric;
using namespace hs::logging;
using namespace hs::util;
using json = nlohmann::json;

namespace {

constexpr int SERIES_VERSION = 1;
constexpr int FRESHNESS_VERSION = 1;

json parseFile(const std::filesystem::path& path) {
    try {
        return json::parse(readFileToString(path));
    } catch (const json::exception& e) {
        throw StoreCorrupt(path, e.what());
    }
}

void quarantine(const std::filesystem::path& path) {
    try {
        const auto moved = quarantineFile(path);
        LogRegistry::storage()->warn("[LocalStore] Quarantined {} as {}", path.string(), moved.string());
    } catch (const std::exception& e) {
        // The next successful write replaces the file anyway.
        LogRegistry::storage()->error("[LocalStore] Failed to quarantine {}: {}", path.string(), e.what());
    }
}

}

LocalStore::LocalStore(std::filesystem::path dataDir) : dataDir_(std::move(dataDir)) {}

std::filesystem::path LocalStore::seriesPath(const Kind kind) const {
    return dataDir_ / "series" / (std::string(toString(kind)) + ".json");
}

std::filesystem::path LocalStore::freshnessPath() const {
    return dataDir_ / "freshness.json";
}

LocalStore::Slot& LocalStore::slot(const Kind kind) const {
    return slots_[static_cast<size_t>(kind)];
}

void LocalStore::ensureLoaded(const Kind kind) const {
    auto& s = slot(kind);
    {
        std::shared_lock lock(s.mutex);
        if (s.loaded) return;
    }

    std::unique_lock lock(s.mutex);
    if (s.loaded) return;
    s.records = loadSeries(kind);
    s.loaded = true;
}

LocalStore::Series LocalStore::loadSeries(const Kind kind) const {
    const auto path = seriesPath(kind);
    Series series;

    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) return series;

    try {
        const auto j = parseFile(path);
        if (!j.is_object()) throw StoreCorrupt(path, "root is not an object");
        if (j.value("kind", std::string{}) != toString(kind)) throw StoreCorrupt(path, "kind mismatch");
        if (!j.contains("records") || !j.at("records").is_array()) throw StoreCorrupt(path, "missing records array");

        size_t duplicates = 0;
        for (const auto& item : j.at("records")) {
            try {
                auto rec = recordFromJson(kind, item);
                const auto ts = rec.timestamp;
                if (!series.insert_or_assign(ts, std::move(rec)).second) ++duplicates;
            } catch (const json::exception& e) {
                throw StoreCorrupt(path, e.what());
            } catch (const std::invalid_argument& e) {
                throw StoreCorrupt(path, e.what());
            }
        }

        if (duplicates > 0)
            LogRegistry::storage()->warn("[LocalStore] Collapsed {} duplicate timestamps in {}", duplicates, path.string());

        LogRegistry::storage()->debug("[LocalStore] Loaded {} {} records", series.size(), toString(kind));
        return series;
    } catch (const StoreCorrupt& e) {
        LogRegistry::storage()->warn("[LocalStore] {}; resetting {} for a full re-sync", e.what(), toString(kind));
        quarantine(path);
        forgetFreshness(kind);
        return {};
    }
}

void LocalStore::persistSeries(const Kind kind, const Series& series) const {
    json records = json::array();
    for (const auto& rec : series | std::views::values) records.push_back(rec);

    const json j = {
        {"kind", toString(kind)},
        {"version", SERIES_VERSION},
        {"records", std::move(records)}
    };

    writeFileAtomic(seriesPath(kind), j.dump(2));
}

Records LocalStore::read(const Kind kind, const TimeRange& range) const {
    ensureLoaded(kind);
    const auto& s = slot(kind);
    std::shared_lock lock(s.mutex);

    Records out;
    for (auto it = s.records.lower_bound(range.start); it != s.records.end() && it->first <= range.end; ++it)
        out.push_back(it->second);
    return out;
}

std::optional<Record> LocalStore::at(const Kind kind, const Timestamp ts) const {
    ensureLoaded(kind);
    const auto& s = slot(kind);
    std::shared_lock lock(s.mutex);

    if (const auto it = s.records.find(ts); it != s.records.end()) return it->second;
    return std::nullopt;
}

std::optional<Record> LocalStore::latest(const Kind kind) const {
    ensureLoaded(kind);
    const auto& s = slot(kind);
    std::shared_lock lock(s.mutex);

    if (s.records.empty()) return std::nullopt;
    return s.records.rbegin()->second;
}

size_t LocalStore::size(const Kind kind) const {
    ensureLoaded(kind);
    const auto& s = slot(kind);
    std::shared_lock lock(s.mutex);
    return s.records.size();
}

size_t LocalStore::upsert(const Kind kind, const Records& records) {
    for (const auto& r : records)
        if (r.kind != kind || !r.isConsistent())
            throw std::invalid_argument("record of kind " + std::string(toString(r.kind)) +
                                        " passed to " + std::string(toString(kind)) + " series");

    ensureLoaded(kind);
    auto& s = slot(kind);
    std::unique_lock lock(s.mutex);

    auto next = s.records;
    std::set<Timestamp> changed;

    for (const auto& r : records) {
        const auto it = next.find(r.timestamp);
        if (it != next.end() && !r.source_revision.empty() &&
            it->second.source_revision == r.source_revision) continue;

        next.insert_or_assign(r.timestamp, r);
        changed.insert(r.timestamp);
    }

    if (changed.empty()) return 0;

    persistSeries(kind, next);
    s.records = std::move(next);

    LogRegistry::storage()->debug("[LocalStore] Upserted {} {} records ({} total)",
                                  changed.size(), toString(kind), s.records.size());
    return changed.size();
}

size_t LocalStore::retain(const Kind kind, const Timestamp cutoff) {
    ensureLoaded(kind);
    auto& s = slot(kind);
    std::unique_lock lock(s.mutex);

    auto next = s.records;
    const auto end = next.lower_bound(cutoff);
    const auto dropped = static_cast<size_t>(std::distance(next.begin(), end));
    if (dropped == 0) return 0;

    next.erase(next.begin(), end);
    persistSeries(kind, next);
    s.records = std::move(next);

    LogRegistry::storage()->info("[LocalStore] Retention dropped {} {} records older than {}",
                                 dropped, toString(kind), formatTimestamp(cutoff));
    return dropped;
}

void LocalStore::ensureFreshnessLoaded() const {
    if (freshnessLoaded_) return;
    freshnessLoaded_ = true;

    const auto path = freshnessPath();
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) return;

    try {
        const auto j = parseFile(path);
        if (!j.is_object() || !j.contains("kinds") || !j.at("kinds").is_object())
            throw StoreCorrupt(path, "missing kinds object");

        for (const auto& [name, value] : j.at("kinds").items()) {
            Kind k;
            if (!tryParseKind(name, k)) {
                LogRegistry::storage()->warn("[LocalStore] Ignoring freshness for unknown kind '{}'", name);
                continue;
            }
            try {
                freshness_[k] = value.get<Freshness>();
            } catch (const json::exception& e) {
                throw StoreCorrupt(path, e.what());
            } catch (const std::invalid_argument& e) {
                throw StoreCorrupt(path, e.what());
            }
        }
    } catch (const StoreCorrupt& e) {
        LogRegistry::storage()->warn("[LocalStore] {}; all kinds will bootstrap", e.what());
        freshness_.clear();
        quarantine(path);
    }
}

void LocalStore::persistFreshness() const {
    json kinds = json::object();
    for (const auto& [k, f] : freshness_) kinds[std::string(toString(k))] = f;

    const json j = {
        {"version", FRESHNESS_VERSION},
        {"kinds", std::move(kinds)}
    };

    writeFileAtomic(freshnessPath(), j.dump(2));
}

std::optional<Freshness> LocalStore::freshness(const Kind kind) const {
    // A corrupt series drops its freshness when loaded; that must happen before it is reported.
    ensureLoaded(kind);

    std::scoped_lock lock(freshnessMutex_);
    ensureFreshnessLoaded();
    if (const auto it = freshness_.find(kind); it != freshness_.end()) return it->second;
    return std::nullopt;
}

void LocalStore::commitFreshness(const Kind kind, const Freshness& f) {
    ensureLoaded(kind);

    std::scoped_lock lock(freshnessMutex_);
    ensureFreshnessLoaded();

    const auto prev = freshness_.find(kind);
    std::optional<Freshness> old;
    if (prev != freshness_.end()) old = prev->second;

    freshness_[kind] = f;
    try {
        persistFreshness();
    } catch (const std::exception&) {
        if (old) freshness_[kind] = *old;
        else freshness_.erase(kind);
        throw;
    }
}

void LocalStore::reload() {
    for (auto& s : slots_) {
        std::unique_lock lock(s.mutex);
        s.loaded = false;
        s.records.clear();
    }

    std::scoped_lock lock(freshnessMutex_);
    freshnessLoaded_ = false;
    freshness_.clear();

    LogRegistry::storage()->debug("[LocalStore] Dropped cached series and freshness for {}", dataDir_.string());
}

void LocalStore::resetFreshness(const Kind kind) {
    forgetFreshness(kind);
}

void LocalStore::forgetFreshness(const Kind kind) const {
    std::scoped_lock lock(freshnessMutex_);
    ensureFreshnessLoaded();
    if (freshness_.erase(kind) == 0) return;

    try {
        persistFreshness();
    } catch (const std::exception& e) {
        // In-memory state already forces the bootstrap for this process.
        LogRegistry::storage()->error("[LocalStore] Failed to persist freshness reset for {}: {}", toString(kind), e.what());
    }
}
