#include "presentation/StatusBoard.hpp"
#include "presentation/Sink.hpp"
#include "presentation/format.hpp"
#include "analytics/Engine.hpp"
#include "storage/LocalStore.hpp"
#include "logging/LogRegistry.hpp"

using namespace hs::presentation;
using namespace hs::types::metric;
using namespace hs::logging;
using namespace hs::util;

StatusBoard::StatusBoard(std::shared_ptr<const storage::LocalStore> store,
                         std::shared_ptr<const analytics::Engine> analytics,
                         config::PresentationConfig cnf,
                         std::shared_ptr<const Clock> clock)
    : store_(std::move(store)), analytics_(std::move(analytics)), cnf_(cnf), clock_(std::move(clock)) {}

void StatusBoard::addSink(std::shared_ptr<Sink> sink) {
    std::scoped_lock lock(sinksMutex_);
    sinks_.push_back(std::move(sink));
}

KindStatus StatusBoard::describe(const Kind kind,
                                 const std::optional<Freshness>& freshness,
                                 const Timestamp now,
                                 const unsigned int warningMinutes) {
    KindStatus s{.kind = kind, .freshness = freshness};

    if (!freshness) {
        s.label = formatTimeAgo(std::nullopt);
        s.stale = true;
        return s;
    }

    const auto age = freshness->age(now);
    s.age_minutes = age.count();
    s.label = formatTimeAgo(age);
    s.stale = age.count() > static_cast<long>(warningMinutes);
    return s;
}

StatusSnapshot StatusBoard::snapshot(const std::optional<sync::model::Result>& last) const {
    StatusSnapshot snap;
    snap.generated_at = clock_->now();
    snap.last_sync = last;

    for (const auto kind : ALL_KINDS) {
        auto s = describe(kind, store_->freshness(kind), snap.generated_at, cnf_.freshness_warning_minutes);
        s.records = store_->size(kind);
        snap.kinds.push_back(std::move(s));
    }

    if (analytics_) snap.goals = analytics_->goalProgress();
    return snap;
}

StatusSnapshot StatusBoard::current() const {
    return snapshot(sync::model::loadLastResult(store_->dataDir()));
}

void StatusBoard::publish(const sync::model::Result& result) {
    const auto snap = snapshot(result);

    std::vector<std::shared_ptr<Sink>> sinks;
    {
        std::scoped_lock lock(sinksMutex_);
        sinks = sinks_;
    }

    for (const auto& sink : sinks) {
        try {
            sink->publish(snap);
        } catch (const std::exception& e) {
            LogRegistry::presentation()->error("[StatusBoard] Sink failed to publish: {}", e.what());
        }
    }

    if (snap.anyStale())
        LogRegistry::presentation()->info("[StatusBoard] Some metrics are older than {} minutes", cnf_.freshness_warning_minutes);
}
