#pragma once

#include "analytics/model/DailySummary.hpp"
#include "analytics/model/Goal.hpp"
#include "analytics/model/Series.hpp"
#include "types/metric/Goals.hpp"
#include "types/metric/Kind.hpp"
#include "util/timestamp.hpp"

#include <map>
#include <memory>
#include <optional>

namespace hs::storage { class LocalStore; }

namespace hs::analytics {

struct GoalSource;

// Read-only derivations over the local store. Never writes, never touches the network.
class Engine {
public:
    Engine(std::shared_ptr<const storage::LocalStore> store,
           std::shared_ptr<const GoalSource> goals,
           std::shared_ptr<const util::Clock> clock);

    // Today's steps, the latest sleep session, the latest weight and activities in the
    // trailing 7 days, each against its goal.
    [[nodiscard]] model::GoalReport goalProgress() const;

    // The last windowDays days (today included), aggregated per day or per ISO week.
    [[nodiscard]] model::Trend trend(types::metric::Kind kind, unsigned int windowDays,
                                     model::Bucket bucket = model::Bucket::Day) const;

    // All history grouped by ISO weekday; each weekday is the mean of its daily aggregates.
    [[nodiscard]] model::Pattern weeklyPattern(types::metric::Kind kind) const;

    // Daily aggregates of the given year grouped by month.
    [[nodiscard]] model::Pattern monthlyPattern(types::metric::Kind kind, int year) const;

    [[nodiscard]] model::Extremes extremes(types::metric::Kind kind) const;

    [[nodiscard]] std::optional<double> averageSteps(unsigned int days = 7) const;
    [[nodiscard]] std::optional<double> averageSleepHours(unsigned int days = 7) const;

    // Last minus first weight in the window; nullopt with fewer than two samples
    [[nodiscard]] std::optional<double> weightChange(unsigned int days = 7) const;

    // Consecutive days, newest first, at or above the goal. A missing day ends the streak.
    [[nodiscard]] unsigned int stepStreak(std::optional<uint32_t> goal = std::nullopt) const;

    [[nodiscard]] model::DailySummary dailySummary(std::optional<util::Date> date = std::nullopt) const;

    // Per-day aggregate (sum or mean by kind) of the records dated in [start, end]
    [[nodiscard]] std::map<util::Date, double> dailyAggregates(types::metric::Kind kind, util::Date start, util::Date end) const;

private:
    std::shared_ptr<const storage::LocalStore> store_;
    std::shared_ptr<const GoalSource> goals_;
    std::shared_ptr<const util::Clock> clock_;

    [[nodiscard]] types::metric::GoalSet goalsOrDefaults() const;
    [[nodiscard]] util::Date windowStart(unsigned int days) const;
};

}
