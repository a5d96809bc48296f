#include "sync/Coordinator.hpp"
#include "storage/LocalStore.hpp"
#include "remote/FetchError.hpp"
#include "remote/Source.hpp"
#include "presentation/StatusBoard.hpp"
#include "logging/LogRegistry.hpp"
#include "util/FileLock.hpp"

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <cmath>
#include <future>
#include <map>

using namespace hs::sync;
using namespace hs::sync::model;
using namespace hs::types::metric;
using namespace hs::remote;
using namespace hs::logging;
using namespace hs::util;

namespace {

struct InFlightGuard {
    std::atomic<bool>& flag;
    ~InFlightGuard() { flag.store(false); }
};

std::string joinKinds(const std::set<Kind>& kinds) {
    std::string out;
    for (const auto k : kinds) {
        if (!out.empty()) out += ',';
        out += toString(k);
    }
    return out.empty() ? "-" : out;
}

double stepsOf(const Record& r) {
    if (!std::holds_alternative<StepsDay>(r.payload)) return 0.0;
    return r.as<StepsDay>().total_steps;
}

// An absent previous day counts as zero steps
double stepsOf(const std::optional<Record>& r) {
    return r ? stepsOf(*r) : 0.0;
}

}

Coordinator::Coordinator(std::shared_ptr<storage::LocalStore> store,
                         std::shared_ptr<Source> source,
                         config::Config cnf,
                         std::shared_ptr<const Clock> clock)
    : store_(std::move(store)),
      source_(std::move(source)),
      cnf_(std::move(cnf)),
      clock_(std::move(clock)),
      planner_(*store_, cnf_.sync, *clock_),
      merger_(*store_, *clock_),
      fetcher_(source_, cnf_.sync.fetch_workers,
               std::chrono::duration_cast<std::chrono::milliseconds>(cnf_.sync.fetchTimeout())) {}

void Coordinator::attach(std::shared_ptr<presentation::StatusBoard> board) {
    board_ = std::move(board);
}

std::optional<Result> Coordinator::lastResult() const {
    std::scoped_lock lock(lastMutex_);
    return last_;
}

bool Coordinator::stepsNotifiable(const std::vector<RecordChange>& changes,
                                  const config::SyncConfig& cnf,
                                  const unsigned int localHour) {
    if (!cnf.isWakingHour(localHour)) return false;

    for (const auto& c : changes) {
        const auto delta = std::abs(stepsOf(c.current) - stepsOf(c.previous));
        if (delta > cnf.change_threshold_steps) return true;
    }
    return false;
}

void Coordinator::fail(Result& result, const Kind kind, std::string code, const std::string& message) const {
    auto& o = result.outcomes[kind];
    o.kind = kind;
    o.status = KindOutcome::Status::Failed;
    o.error_code = std::move(code);
    o.error_message = message;
    o.notifiable = false;

    // Freshness is whatever was committed before this run
    try {
        o.freshness = store_->freshness(kind);
    } catch (const std::exception& e) {
        LogRegistry::sync()->error("[Coordinator] Could not read {} freshness: {}", toString(kind), e.what());
    }
}

Result Coordinator::run(const Request& req) {
    bool expected = false;
    if (!inFlight_.compare_exchange_strong(expected, true)) {
        LogRegistry::sync()->warn("[Coordinator] Rejected {} run: a sync is already in progress", toString(req.trigger));
        throw SyncInProgress("a sync is already in progress in this process");
    }
    InFlightGuard guard{inFlight_};

    FileLock lock(store_->dataDir() / "sync.lock");
    if (!lock.acquired()) {
        LogRegistry::sync()->warn("[Coordinator] Rejected {} run: another process holds the sync lock", toString(req.trigger));
        throw SyncInProgress("another process holds " + (store_->dataDir() / "sync.lock").string());
    }

    // Another process may have committed since this store last read the disk.
    store_->reload();

    Result result;
    result.run_uuid = boost::uuids::to_string(boost::uuids::random_generator()());
    result.trigger = req.trigger;
    result.started_at = clock_->now();

    LogRegistry::sync()->info("[Coordinator] Run {} started (trigger={}, force={})",
                              result.run_uuid, toString(req.trigger), req.force);

    // Planning
    state_.store(Result::State::Planning);
    result.state = Result::State::Planning;

    std::vector<Plan> fetches;
    std::set<Kind> seen;
    for (const auto kind : req.kinds) {
        if (!seen.insert(kind).second) continue;

        try {
            const auto plan = planner_.plan(kind, req.force);
            auto& o = result.outcomes[kind];
            o.kind = kind;
            o.reason = plan.reason;

            if (plan.skip()) {
                o.status = KindOutcome::Status::Skipped;
                o.freshness = store_->freshness(kind);
                continue;
            }
            fetches.push_back(plan);
        } catch (const std::exception& e) {
            LogRegistry::sync()->error("[Coordinator] Planning {} failed: {}", toString(kind), e.what());
            fail(result, kind, "storage_error", e.what());
        }
    }

    // Fetching
    state_.store(Result::State::Fetching);
    result.state = Result::State::Fetching;

    std::map<Kind, std::future<Records>> pending;
    for (const auto& plan : fetches) pending.emplace(plan.kind, fetcher_.submit(plan.kind, plan.start, plan.end));

    std::map<Kind, Records> fetched;
    for (auto& [kind, future] : pending) {
        try {
            fetched[kind] = fetcher_.await(future, kind);
            result.outcomes[kind].fetched_count = fetched[kind].size();
        } catch (const FetchError& e) {
            if (e.retriable())
                LogRegistry::sync()->warn("[Coordinator] {} fetch failed ({}), retry next run: {}",
                                          toString(kind), toString(e.code), e.what());
            else
                LogRegistry::sync()->error("[Coordinator] {} fetch failed ({}), not retried this cycle: {}",
                                           toString(kind), toString(e.code), e.what());
            fail(result, kind, std::string(toString(e.code)), e.what());
        }
    }

    // Merging
    state_.store(Result::State::Merging);
    result.state = Result::State::Merging;

    for (const auto& [kind, records] : fetched) {
        try {
            const auto merged = merger_.merge(kind, records);

            auto& o = result.outcomes[kind];
            o.changed_count = merged.changed_count;
            o.freshness = merged.freshness;
            o.status = merged.changed_count > 0 ? KindOutcome::Status::Changed : KindOutcome::Status::Unchanged;

            if (kind == Kind::Steps)
                o.notifiable = stepsNotifiable(merged.changes, cnf_.sync, clock_->localHour(clock_->now()));
            else
                o.notifiable = merged.changed_count > 0;

            LogRegistry::sync()->info("[Coordinator] {}: {} fetched, {} changed{}", toString(kind), records.size(),
                                      merged.changed_count, o.notifiable ? " (notifiable)" : "");
        } catch (const std::exception& e) {
            LogRegistry::sync()->error("[Coordinator] Merging {} failed: {}", toString(kind), e.what());
            fail(result, kind, "storage_error", e.what());
        }
    }

    result.state = result.failed().empty() ? Result::State::Done : Result::State::Failed;
    result.finished_at = clock_->now();
    state_.store(result.state);

    publish(result);
    return result;
}

void Coordinator::publish(const Result& result) {
    {
        std::scoped_lock lock(lastMutex_);
        last_ = result;
    }

    try {
        persistLastResult(store_->dataDir(), result);
    } catch (const std::exception& e) {
        LogRegistry::sync()->warn("[Coordinator] Could not persist last sync result: {}", e.what());
    }

    LogRegistry::audit()->info("run={} trigger={} state={} changed={} notifiable={} failed={} duration={}s",
                               result.run_uuid, toString(result.trigger), Result::toString(result.state),
                               joinKinds(result.changed()), joinKinds(result.notifiable()),
                               joinKinds(result.failed()), (result.finished_at - result.started_at).count());

    LogRegistry::sync()->info("[Coordinator] Run {} {} (changed: {}, failed: {})", result.run_uuid,
                              Result::toString(result.state), joinKinds(result.changed()), joinKinds(result.failed()));

    if (board_) board_->publish(result);
}
