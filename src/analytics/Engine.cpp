#include "analytics/Engine.hpp"
#include "analytics/GoalSource.hpp"
#include "storage/LocalStore.hpp"
#include "logging/LogRegistry.hpp"

#include <algorithm>
#include <numeric>
#include <ranges>

using namespace hs::analytics;
using namespace hs::analytics::model;
using namespace hs::types::metric;
using namespace hs::logging;
using namespace hs::util;

namespace {

double percentOf(const double current, const double target) {
    return target > 0 ? current / target * 100.0 : 0.0;
}

double mean(const std::vector<double>& values) {
    return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
}

double combine(const Aggregation agg, const std::vector<double>& values) {
    const auto sum = std::accumulate(values.begin(), values.end(), 0.0);
    return agg == Aggregation::Sum ? sum : sum / static_cast<double>(values.size());
}

TimeRange daysRange(const Date start, const Date end) {
    return {startOf(start), startOf(end + std::chrono::days(1)) - std::chrono::seconds(1)};
}

Date isoWeekStart(const Date d) {
    return d - std::chrono::days(isoWeekday(d) - 1);
}

}

Engine::Engine(std::shared_ptr<const storage::LocalStore> store,
               std::shared_ptr<const GoalSource> goals,
               std::shared_ptr<const Clock> clock)
    : store_(std::move(store)), goals_(std::move(goals)), clock_(std::move(clock)) {}

GoalSet Engine::goalsOrDefaults() const {
    if (goals_)
        if (auto g = goals_->load()) return *g;
    return {};
}

Date Engine::windowStart(const unsigned int days) const {
    return clock_->today() - std::chrono::days(days > 0 ? days - 1 : 0);
}

std::map<Date, double> Engine::dailyAggregates(const Kind kind, const Date start, const Date end) const {
    std::map<Date, std::vector<double>> grouped;
    for (const auto& r : store_->read(kind, daysRange(start, end)))
        grouped[dateOf(r.timestamp)].push_back(r.value());

    std::map<Date, double> out;
    const auto agg = aggregationFor(kind);
    for (const auto& [d, values] : grouped) out[d] = combine(agg, values);
    return out;
}

GoalReport Engine::goalProgress() const {
    GoalReport report;

    const auto goals = goals_ ? goals_->load() : std::nullopt;
    if (!goals) {
        report.message = GoalReport::NO_GOALS;
        return report;
    }
    report.configured = true;

    const auto today = clock_->today();

    double steps = 0;
    if (const auto r = store_->at(Kind::Steps, startOf(today))) steps = r->value();
    report.goals.push_back({"daily_steps", steps, static_cast<double>(goals->daily_steps),
                            percentOf(steps, goals->daily_steps), steps >= goals->daily_steps});

    double sleep = 0;
    if (const auto r = store_->latest(Kind::Sleep)) sleep = r->as<SleepSession>().durationHours();
    report.goals.push_back({"sleep_hours", sleep, goals->sleep_hours,
                            percentOf(sleep, goals->sleep_hours), sleep >= goals->sleep_hours});

    // Lower is better; at or under target is 100%
    double weight = 0;
    if (const auto r = store_->latest(Kind::Weight)) weight = r->as<WeightSample>().weight_kg;
    double weightPct = 0;
    if (weight > 0) weightPct = weight <= goals->weight_kg ? 100.0 : goals->weight_kg / weight * 100.0;
    report.goals.push_back({"weight_kg", weight, goals->weight_kg, weightPct, weight > 0 && weight <= goals->weight_kg});

    const auto workouts = static_cast<double>(store_->read(Kind::Activity, daysRange(windowStart(7), today)).size());
    report.goals.push_back({"workouts_per_week", workouts, static_cast<double>(goals->workouts_per_week),
                            percentOf(workouts, goals->workouts_per_week), workouts >= goals->workouts_per_week});

    return report;
}

Trend Engine::trend(const Kind kind, const unsigned int windowDays, const Bucket bucket) const {
    Trend t{.kind = kind, .bucket = bucket, .window_days = windowDays};
    if (windowDays == 0) return t;

    const auto start = windowStart(windowDays);
    const auto end = clock_->today();

    t.samples = store_->read(kind, daysRange(start, end)).size();
    if (t.samples < 2) return t;

    const auto daily = dailyAggregates(kind, start, end);

    if (bucket == Bucket::Day) {
        for (const auto& [d, v] : daily) t.points.push_back({d, v});
    } else {
        std::map<Date, std::vector<double>> weeks;
        for (const auto& [d, v] : daily) weeks[isoWeekStart(d)].push_back(v);
        for (const auto& [w, values] : weeks) t.points.push_back({w, combine(aggregationFor(kind), values)});
    }

    if (t.points.size() < 2) {
        t.points.clear();
        return t;
    }

    t.insufficient_data = false;
    return t;
}

Pattern Engine::weeklyPattern(const Kind kind) const {
    Pattern p{.kind = kind};

    const auto all = store_->read(kind);
    p.samples = all.size();
    if (p.samples < 2) return p;

    std::map<Date, std::vector<double>> days;
    for (const auto& r : all) days[dateOf(r.timestamp)].push_back(r.value());

    std::map<unsigned int, std::vector<double>> weekdays;
    for (const auto& [d, values] : days) weekdays[isoWeekday(d)].push_back(combine(aggregationFor(kind), values));

    for (const auto& [wd, values] : weekdays) p.buckets[wd] = mean(values);
    p.insufficient_data = false;
    return p;
}

Pattern Engine::monthlyPattern(const Kind kind, const int year) const {
    Pattern p{.kind = kind};

    const std::chrono::year y{year};
    const Date start{y / std::chrono::January / 1};
    const Date end{y / std::chrono::December / 31};

    const auto daily = dailyAggregates(kind, start, end);
    p.samples = store_->read(kind, daysRange(start, end)).size();
    if (p.samples < 2) return p;

    std::map<unsigned int, std::vector<double>> months;
    for (const auto& [d, v] : daily)
        months[static_cast<unsigned>(std::chrono::year_month_day{d}.month())].push_back(v);

    for (const auto& [m, values] : months) p.buckets[m] = mean(values);
    p.insufficient_data = false;
    return p;
}

Extremes Engine::extremes(const Kind kind) const {
    Extremes e{.kind = kind};

    std::map<Date, std::vector<double>> days;
    for (const auto& r : store_->read(kind)) days[dateOf(r.timestamp)].push_back(r.value());

    for (const auto& [d, values] : days) {
        const auto v = combine(aggregationFor(kind), values);
        if (kind == Kind::Steps && v <= 0) continue;

        if (!e.best || v > e.best->value) e.best = DayValue{d, v};
        if (!e.worst || v < e.worst->value) e.worst = DayValue{d, v};
    }
    return e;
}

std::optional<double> Engine::averageSteps(const unsigned int days) const {
    const auto recs = store_->read(Kind::Steps, daysRange(windowStart(days), clock_->today()));
    if (recs.empty()) return std::nullopt;

    std::vector<double> values;
    for (const auto& r : recs) values.push_back(r.value());
    return mean(values);
}

std::optional<double> Engine::averageSleepHours(const unsigned int days) const {
    const auto recs = store_->read(Kind::Sleep, daysRange(windowStart(days), clock_->today()));
    if (recs.empty()) return std::nullopt;

    std::vector<double> values;
    for (const auto& r : recs) values.push_back(r.as<SleepSession>().durationHours());
    return mean(values);
}

std::optional<double> Engine::weightChange(const unsigned int days) const {
    const auto recs = store_->read(Kind::Weight, daysRange(windowStart(days), clock_->today()));
    if (recs.size() < 2) return std::nullopt;
    return recs.back().as<WeightSample>().weight_kg - recs.front().as<WeightSample>().weight_kg;
}

unsigned int Engine::stepStreak(const std::optional<uint32_t> goal) const {
    const auto target = goal.value_or(goalsOrDefaults().daily_steps);
    const auto recs = store_->read(Kind::Steps);

    unsigned int streak = 0;
    std::optional<Date> expected;
    for (const auto& r : recs | std::views::reverse) {
        const auto d = dateOf(r.timestamp);
        if (expected && d != *expected) break;
        if (r.as<StepsDay>().total_steps < target) break;
        ++streak;
        expected = d - std::chrono::days(1);
    }
    return streak;
}

DailySummary Engine::dailySummary(const std::optional<Date> date) const {
    const auto goals = goalsOrDefaults();

    DailySummary s;
    s.date = date.value_or(clock_->today());
    s.steps_goal = goals.daily_steps;
    s.sleep_goal = goals.sleep_hours;
    s.weight_goal = goals.weight_kg;

    if (const auto r = store_->at(Kind::Steps, startOf(s.date))) s.steps = r->as<StepsDay>().total_steps;

    const auto upTo = TimeRange{Timestamp{}, startOf(s.date + std::chrono::days(1)) - std::chrono::seconds(1)};

    if (const auto sleep = store_->read(Kind::Sleep, upTo); !sleep.empty()) {
        const auto& last = sleep.back().as<SleepSession>();
        s.sleep_hours = last.durationHours();
        s.sleep_score = last.score;
    }

    if (const auto weight = store_->read(Kind::Weight, upTo); !weight.empty()) {
        s.weight_kg = weight.back().as<WeightSample>().weight_kg;
        s.weight_change_7d = weightChange(7);
    }

    if (const auto bb = store_->read(Kind::BodyBattery, upTo); !bb.empty())
        s.body_battery = bb.back().as<BodyBatterySample>().charged;

    s.goals_met = (s.stepsMet() ? 1 : 0) + (s.sleepMet() ? 1 : 0);
    switch (s.goals_met) {
    case 2:  s.status = "Great day! All goals met"; break;
    case 1:  s.status = "Good effort today"; break;
    default: s.status = "Tomorrow is a new day"; break;
    }

    LogRegistry::analytics()->debug("[Engine] Daily summary for {}: {}", formatDate(s.date), s.status);
    return s;
}
