#include <gtest/gtest.h>
#include "analytics/Engine.hpp"
#include "analytics/GoalSource.hpp"
#include "storage/LocalStore.hpp"
#include "support/TestEnv.hpp"

#include <nlohmann/json.hpp>

using namespace hs::analytics;
using namespace hs::analytics::model;
using namespace hs::storage;
using namespace hs::types::metric;
using namespace hs::test;

class AnalyticsTest : public ::testing::Test {
protected:
    TempDir tmp;
    std::shared_ptr<FixedClock> clock = std::make_shared<FixedClock>();
    std::shared_ptr<LocalStore> store;
    std::unique_ptr<Engine> engine;

    const hs::util::Date today = date(2024, 6, 15);

    void SetUp() override {
        store = std::make_shared<LocalStore>(tmp.path);
        engine = std::make_unique<Engine>(store, std::make_shared<FileGoalSource>(tmp.path / "goals.json"), clock);
    }

    void goals(const std::string& content) { writeText(tmp.path / "goals.json", content); }

    void steps(const std::vector<std::pair<hs::util::Date, uint32_t>>& days) {
        Records recs;
        for (const auto& [d, n] : days) recs.push_back(stepsRecord(d, n));
        store->upsert(Kind::Steps, recs);
    }
};

TEST_F(AnalyticsTest, SingleDayTrendIsInsufficient) {
    steps({{today, 8000}});

    const auto t = engine->trend(Kind::Steps, 7);

    EXPECT_TRUE(t.insufficient_data);
    EXPECT_EQ(t.samples, 1u);
    EXPECT_TRUE(t.points.empty());
}

TEST_F(AnalyticsTest, DailyTrendCoversWindowOnly) {
    steps({{date(2024, 6, 1), 1}, {date(2024, 6, 13), 5000}, {date(2024, 6, 14), 6000}, {today, 7000}});

    const auto t = engine->trend(Kind::Steps, 3);

    ASSERT_FALSE(t.insufficient_data);
    EXPECT_EQ(t.samples, 3u);
    ASSERT_EQ(t.points.size(), 3u);
    EXPECT_EQ(t.points.front().bucket, date(2024, 6, 13));
    EXPECT_DOUBLE_EQ(t.points.back().value, 7000);
}

TEST_F(AnalyticsTest, SumKindsAddUpWithinADay) {
    store->upsert(Kind::Activity, {
        activityRecord(at(date(2024, 6, 14), 7), "run"),
        activityRecord(at(date(2024, 6, 14), 18), "ride"),
        activityRecord(at(today, 9), "swim"),
    });

    const auto t = engine->trend(Kind::Activity, 7);

    ASSERT_EQ(t.points.size(), 2u);
    EXPECT_DOUBLE_EQ(t.points[0].value, 2.0);
    EXPECT_DOUBLE_EQ(t.points[1].value, 1.0);
}

TEST_F(AnalyticsTest, WeeklyBucketsStartOnMonday) {
    // 2024-06-03 and 2024-06-10 are Mondays
    steps({{date(2024, 6, 5), 1000}, {date(2024, 6, 7), 2000}, {date(2024, 6, 10), 3000}, {today, 4000}});

    const auto t = engine->trend(Kind::Steps, 14, Bucket::Week);

    ASSERT_FALSE(t.insufficient_data);
    ASSERT_EQ(t.points.size(), 2u);
    EXPECT_EQ(t.points[0].bucket, date(2024, 6, 3));
    EXPECT_DOUBLE_EQ(t.points[0].value, 3000);
    EXPECT_EQ(t.points[1].bucket, date(2024, 6, 10));
    EXPECT_DOUBLE_EQ(t.points[1].value, 7000);
}

TEST_F(AnalyticsTest, MeanKindsAverageWithinAWeek) {
    store->upsert(Kind::Weight, {weightRecord(date(2024, 6, 10), 80.0), weightRecord(date(2024, 6, 12), 79.0),
                                 weightRecord(date(2024, 6, 4), 82.0)});

    const auto t = engine->trend(Kind::Weight, 14, Bucket::Week);

    ASSERT_EQ(t.points.size(), 2u);
    EXPECT_DOUBLE_EQ(t.points[1].value, 79.5);
}

TEST_F(AnalyticsTest, SamplesInOneWeekAreInsufficientForWeeklyTrend) {
    steps({{date(2024, 6, 11), 1000}, {date(2024, 6, 12), 2000}});

    const auto t = engine->trend(Kind::Steps, 7, Bucket::Week);

    EXPECT_TRUE(t.insufficient_data);
    EXPECT_EQ(t.samples, 2u);
}

TEST_F(AnalyticsTest, WeeklyPatternGroupsByIsoWeekday) {
    steps({{date(2024, 6, 3), 4000}, {date(2024, 6, 10), 6000}, {date(2024, 6, 15), 9000}});

    const auto p = engine->weeklyPattern(Kind::Steps);

    ASSERT_FALSE(p.insufficient_data);
    EXPECT_EQ(p.buckets.size(), 2u);
    EXPECT_DOUBLE_EQ(p.buckets.at(1), 5000);
    EXPECT_DOUBLE_EQ(p.buckets.at(6), 9000);
}

TEST_F(AnalyticsTest, MonthlyPatternOnlyUsesTheYear) {
    store->upsert(Kind::Sleep, {sleepRecord(date(2023, 12, 31), 9.0), sleepRecord(date(2024, 1, 5), 6.0),
                                sleepRecord(date(2024, 1, 6), 8.0), sleepRecord(date(2024, 3, 1), 7.0)});

    const auto p = engine->monthlyPattern(Kind::Sleep, 2024);

    ASSERT_FALSE(p.insufficient_data);
    EXPECT_EQ(p.samples, 3u);
    EXPECT_DOUBLE_EQ(p.buckets.at(1), 7.0);
    EXPECT_DOUBLE_EQ(p.buckets.at(3), 7.0);
    EXPECT_FALSE(p.buckets.contains(12));
}

TEST_F(AnalyticsTest, MissingGoalsReportNoGoalsConfigured) {
    const auto report = engine->goalProgress();

    EXPECT_FALSE(report.configured);
    EXPECT_EQ(report.message, GoalReport::NO_GOALS);
    EXPECT_TRUE(report.goals.empty());
}

TEST_F(AnalyticsTest, MalformedGoalsFileIsTreatedAsNoGoals) {
    goals("{ not json");
    EXPECT_FALSE(engine->goalProgress().configured);

    goals("[1, 2]");
    EXPECT_FALSE(engine->goalProgress().configured);
}

TEST_F(AnalyticsTest, GoalsAreReadOnEveryCall) {
    EXPECT_FALSE(engine->goalProgress().configured);
    goals(R"({"daily_steps": 5000})");
    EXPECT_TRUE(engine->goalProgress().configured);
}

TEST_F(AnalyticsTest, GoalProgressAgainstConfiguredGoals) {
    goals(R"({"daily_steps": 8000, "sleep_hours": 8, "weight_kg": 80, "workouts_per_week": 2})");
    steps({{date(2024, 6, 14), 20000}, {today, 6000}});
    store->upsert(Kind::Sleep, {sleepRecord(today, 8.5)});
    store->upsert(Kind::Weight, {weightRecord(date(2024, 6, 1), 84.0)});
    store->upsert(Kind::Activity, {activityRecord(at(date(2024, 6, 8), 7), "old"),
                                   activityRecord(at(date(2024, 6, 9), 7), "run"),
                                   activityRecord(at(today, 7), "ride")});

    const auto report = engine->goalProgress();
    ASSERT_TRUE(report.configured);

    const auto* s = report.find("daily_steps");
    ASSERT_NE(s, nullptr);
    EXPECT_DOUBLE_EQ(s->current, 6000);
    EXPECT_DOUBLE_EQ(s->percent, 75.0);
    EXPECT_FALSE(s->met);

    const auto* sl = report.find("sleep_hours");
    ASSERT_NE(sl, nullptr);
    EXPECT_TRUE(sl->met);

    const auto* w = report.find("weight_kg");
    ASSERT_NE(w, nullptr);
    EXPECT_DOUBLE_EQ(w->current, 84.0);
    EXPECT_NEAR(w->percent, 80.0 / 84.0 * 100.0, 1e-9);
    EXPECT_FALSE(w->met);

    const auto* wo = report.find("workouts_per_week");
    ASSERT_NE(wo, nullptr);
    EXPECT_DOUBLE_EQ(wo->current, 2);
    EXPECT_TRUE(wo->met);
}

TEST_F(AnalyticsTest, StepStreakStopsAtMissedGoalOrGap) {
    steps({{date(2024, 6, 10), 12000}, {date(2024, 6, 11), 3000}, {date(2024, 6, 12), 11000},
           {date(2024, 6, 13), 10000}, {today, 10500}});

    // 06-14 is missing
    EXPECT_EQ(engine->stepStreak(10000), 1u);

    steps({{date(2024, 6, 14), 10001}});
    EXPECT_EQ(engine->stepStreak(10000), 4u);
    EXPECT_EQ(engine->stepStreak(10600), 0u);
    EXPECT_EQ(engine->stepStreak(), 4u);
}

TEST_F(AnalyticsTest, AveragesAndWeightChange) {
    steps({{date(2024, 6, 1), 50000}, {date(2024, 6, 13), 4000}, {today, 8000}});
    store->upsert(Kind::Weight, {weightRecord(date(2024, 6, 10), 81.0), weightRecord(today, 80.2)});

    EXPECT_DOUBLE_EQ(*engine->averageSteps(7), 6000);
    EXPECT_FALSE(engine->averageSleepHours(7).has_value());
    EXPECT_NEAR(*engine->weightChange(7), -0.8, 1e-9);
    EXPECT_FALSE(engine->weightChange(3).has_value());
}

TEST_F(AnalyticsTest, ExtremesIgnoreZeroStepDays) {
    steps({{date(2024, 6, 12), 0}, {date(2024, 6, 13), 4000}, {date(2024, 6, 14), 15000}});

    const auto e = engine->extremes(Kind::Steps);

    ASSERT_TRUE(e.best && e.worst);
    EXPECT_EQ(e.best->date, date(2024, 6, 14));
    EXPECT_EQ(e.worst->date, date(2024, 6, 13));
    EXPECT_DOUBLE_EQ(e.worst->value, 4000);
}

TEST_F(AnalyticsTest, DailySummaryStatusReflectsGoalsMet) {
    steps({{today, 12000}});
    store->upsert(Kind::Sleep, {sleepRecord(today, 7.5, 85)});
    store->upsert(Kind::BodyBattery, {batteryRecord(today, 60, 20)});

    auto s = engine->dailySummary();
    EXPECT_EQ(s.date, today);
    EXPECT_EQ(s.goals_met, 2u);
    EXPECT_EQ(s.status, "Great day! All goals met");
    EXPECT_EQ(s.sleep_score, 85);
    EXPECT_EQ(s.body_battery.value_or(-1), 60);
    EXPECT_FALSE(s.weight_kg.has_value());

    steps({{today, 2000}});
    EXPECT_EQ(engine->dailySummary().status, "Good effort today");

    s = engine->dailySummary(date(2024, 6, 1));
    EXPECT_EQ(s.goals_met, 0u);
    EXPECT_EQ(s.status, "Tomorrow is a new day");
    EXPECT_FALSE(s.body_battery.has_value());
}

TEST_F(AnalyticsTest, DailySummarySerializes) {
    steps({{today, 12345}});
    const auto j = nlohmann::json(engine->dailySummary());

    EXPECT_EQ(j.at("date"), "2024-06-15");
    EXPECT_EQ(j.at("steps"), 12345);
}
