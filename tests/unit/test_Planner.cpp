#include <gtest/gtest.h>
#include "sync/Planner.hpp"
#include "storage/LocalStore.hpp"
#include "support/TestEnv.hpp"

using namespace hs::sync;
using namespace hs::sync::model;
using namespace hs::types::metric;
using namespace hs::config;
using namespace hs::test;
using namespace hs::util;
using namespace std::chrono_literals;

class PlannerTest : public ::testing::Test {
protected:
    SyncConfig cnf;
    const Date today = date(2024, 6, 15);
    const Timestamp now = at(today, 12);
};

TEST_F(PlannerTest, NoFreshnessIsBootstrapOverRetentionWindow) {
    const auto p = Planner::build(Kind::Weight, std::nullopt, cnf, now, today);

    EXPECT_EQ(p.action, Plan::Action::Fetch);
    EXPECT_EQ(p.reason, Plan::Reason::Bootstrap);
    EXPECT_EQ(p.end, today);
    EXPECT_EQ(p.start, today - std::chrono::days(cnf.bootstrap_days));
}

TEST_F(PlannerTest, BootstrapIgnoresIntervalAndForce) {
    EXPECT_TRUE(Planner::build(Kind::Steps, std::nullopt, cnf, now, today, false).isBootstrap());
    EXPECT_TRUE(Planner::build(Kind::Steps, std::nullopt, cnf, now, today, true).isBootstrap());
}

TEST_F(PlannerTest, SkipsWhenSyncedWithinInterval) {
    const Freshness f{now - 5min, at(today, 8)};
    const auto p = Planner::build(Kind::Steps, f, cnf, now, today);

    EXPECT_TRUE(p.skip());
    EXPECT_EQ(p.reason, Plan::Reason::WithinInterval);
    EXPECT_EQ(p.days(), 0);
}

TEST_F(PlannerTest, ForceBypassesIntervalButKeepsOverlap) {
    const Freshness f{now - 5min, at(today, 8)};
    const auto p = Planner::build(Kind::Steps, f, cnf, now, today, true);

    EXPECT_EQ(p.action, Plan::Action::Fetch);
    EXPECT_EQ(p.reason, Plan::Reason::Incremental);
    EXPECT_EQ(p.start, today - std::chrono::days(cnf.safety_overlap_days));
}

TEST_F(PlannerTest, FetchesOnceIntervalElapsed) {
    const Freshness f{now - std::chrono::minutes(cnf.interval_minutes), at(date(2024, 6, 10))};
    const auto p = Planner::build(Kind::Sleep, f, cnf, now, today);

    EXPECT_EQ(p.action, Plan::Action::Fetch);
    EXPECT_EQ(p.start, date(2024, 6, 10) - std::chrono::days(cnf.safety_overlap_days));
    EXPECT_EQ(p.end, today);
}

TEST_F(PlannerTest, AnchorsOnLastSyncWhenNothingWasSeen) {
    const Freshness f{at(date(2024, 6, 12), 10), std::nullopt};
    const auto p = Planner::build(Kind::Stress, f, cnf, now, today);

    EXPECT_EQ(p.reason, Plan::Reason::Incremental);
    EXPECT_EQ(p.start, date(2024, 6, 12) - std::chrono::days(cnf.safety_overlap_days));
}

TEST_F(PlannerTest, ClockGoingBackwardsDoesNotSkip) {
    const Freshness f{now + 2h, at(today)};
    EXPECT_FALSE(Planner::build(Kind::Steps, f, cnf, now, today).skip());
}

TEST_F(PlannerTest, StartNeverPassesToday) {
    cnf.safety_overlap_days = 0;
    const Freshness f{now - 1h, at(today + std::chrono::days(2))};
    const auto p = Planner::build(Kind::Steps, f, cnf, now, today);

    EXPECT_EQ(p.start, today);
    EXPECT_EQ(p.end, today);
    EXPECT_EQ(p.days(), 1);
}

TEST_F(PlannerTest, ReadsFreshnessFromStore) {
    TempDir tmp;
    hs::storage::LocalStore store(tmp.path);
    FixedClock clock;
    clock.set(now);

    const Planner planner(store, cnf, clock);
    EXPECT_TRUE(planner.plan(Kind::Activity).isBootstrap());

    store.commitFreshness(Kind::Activity, {now - 1min, at(today, 7)});
    EXPECT_TRUE(planner.plan(Kind::Activity).skip());
    EXPECT_FALSE(planner.plan(Kind::Activity, true).skip());
}

class PlannerOverlapTest : public ::testing::TestWithParam<unsigned int> {};

TEST_P(PlannerOverlapTest, RangeCoversOverlapBeforeLastSeen) {
    SyncConfig cnf;
    cnf.safety_overlap_days = GetParam();

    const Date today = date(2024, 6, 15);
    const Date lastSeen = date(2024, 6, 11);
    const Freshness f{at(today, 6), at(lastSeen, 18)};

    const auto p = Planner::build(Kind::Steps, f, cnf, at(today, 12), today);

    ASSERT_EQ(p.action, Plan::Action::Fetch);
    EXPECT_EQ(p.start, lastSeen - std::chrono::days(GetParam()));
    EXPECT_EQ(p.end, today);
    EXPECT_EQ(p.days(), static_cast<long>(GetParam()) + 5);
    EXPECT_LE(p.start, lastSeen);
}

INSTANTIATE_TEST_SUITE_P(Overlaps, PlannerOverlapTest, ::testing::Values(0u, 1u, 3u, 7u, 30u));
