#include <gtest/gtest.h>
#include "presentation/format.hpp"
#include "presentation/Sink.hpp"
#include "presentation/StatusBoard.hpp"
#include "analytics/Engine.hpp"
#include "analytics/GoalSource.hpp"
#include "report/MarkdownLog.hpp"
#include "storage/LocalStore.hpp"
#include "util/files.hpp"
#include "support/TestEnv.hpp"

#include <nlohmann/json.hpp>
#include <sstream>

using namespace hs;
using namespace hs::presentation;
using namespace hs::types::metric;
using namespace hs::test;
using namespace std::chrono_literals;

TEST(FormatTimeAgoTest, Buckets) {
    EXPECT_EQ(formatTimeAgo(std::nullopt), "?");
    EXPECT_EQ(formatTimeAgo(-5min), "?");
    EXPECT_EQ(formatTimeAgo(0min), "now");
    EXPECT_EQ(formatTimeAgo(59min), "59m");
    EXPECT_EQ(formatTimeAgo(60min), "1h");
    EXPECT_EQ(formatTimeAgo(1439min), "23h");
    EXPECT_EQ(formatTimeAgo(1440min), "1d");
    EXPECT_EQ(formatTimeAgo(std::chrono::minutes(3 * 1440 + 5)), "3d");
}

TEST(StatusBoardDescribeTest, NeverSyncedIsStale) {
    const auto s = StatusBoard::describe(Kind::Sleep, std::nullopt, at(date(2024, 6, 15), 12), 30);

    EXPECT_TRUE(s.stale);
    EXPECT_EQ(s.label, "?");
    EXPECT_FALSE(s.age_minutes.has_value());
}

TEST(StatusBoardDescribeTest, StaleOnlyPastTheWarningAge) {
    const auto now = at(date(2024, 6, 15), 12);

    auto s = StatusBoard::describe(Kind::Steps, Freshness{now - 30min, std::nullopt}, now, 30);
    EXPECT_FALSE(s.stale);
    EXPECT_EQ(s.label, "30m");
    EXPECT_EQ(s.age_minutes.value_or(-1), 30);

    s = StatusBoard::describe(Kind::Steps, Freshness{now - 31min, std::nullopt}, now, 30);
    EXPECT_TRUE(s.stale);

    s = StatusBoard::describe(Kind::Steps, Freshness{now - 3h, std::nullopt}, now, 30);
    EXPECT_EQ(s.label, "3h");
}

TEST(StatusBoardDescribeTest, FutureSyncTimeReadsAsNow) {
    const auto now = at(date(2024, 6, 15), 12);
    const auto s = StatusBoard::describe(Kind::Steps, Freshness{now + 10min, std::nullopt}, now, 30);

    EXPECT_FALSE(s.stale);
    EXPECT_EQ(s.label, "now");
}

class StatusBoardTest : public ::testing::Test {
protected:
    TempDir tmp;
    std::shared_ptr<FixedClock> clock = std::make_shared<FixedClock>();
    std::shared_ptr<storage::LocalStore> store;
    std::shared_ptr<StatusBoard> board;

    void SetUp() override {
        store = std::make_shared<storage::LocalStore>(tmp.path);
        auto engine = std::make_shared<analytics::Engine>(
            store, std::make_shared<analytics::FileGoalSource>(tmp.path / "goals.json"), clock);
        board = std::make_shared<StatusBoard>(store, engine, config::PresentationConfig{}, clock);
    }
};

TEST_F(StatusBoardTest, SnapshotListsEveryKind) {
    store->upsert(Kind::Steps, {stepsRecord(clock->today(), 5000)});
    store->commitFreshness(Kind::Steps, {clock->now() - 5min, at(clock->today())});

    const auto snap = board->snapshot(std::nullopt);

    ASSERT_EQ(snap.kinds.size(), ALL_KINDS.size());
    EXPECT_EQ(snap.kinds[0].kind, Kind::Steps);
    EXPECT_FALSE(snap.kinds[0].stale);
    EXPECT_EQ(snap.kinds[0].records, 1u);
    EXPECT_TRUE(snap.kinds[1].stale);
    EXPECT_TRUE(snap.anyStale());
    EXPECT_FALSE(snap.goals.configured);
}

TEST_F(StatusBoardTest, JsonSinkWritesSnapshot) {
    std::ostringstream out;
    board->addSink(std::make_shared<JsonStreamSink>(out));

    sync::model::Result r;
    r.run_uuid = "run-1";
    r.state = sync::model::Result::State::Done;
    board->publish(r);

    const auto j = nlohmann::json::parse(out.str());
    EXPECT_EQ(j.at("last_sync").at("run_uuid"), "run-1");
    EXPECT_EQ(j.at("kinds").size(), ALL_KINDS.size());
    EXPECT_EQ(j.at("goals").at("message"), analytics::model::GoalReport::NO_GOALS);
    EXPECT_TRUE(j.at("any_stale").get<bool>());
}

TEST_F(StatusBoardTest, CurrentReadsPersistedResult) {
    EXPECT_FALSE(board->current().last_sync.has_value());

    sync::model::Result r;
    r.run_uuid = "persisted";
    r.state = sync::model::Result::State::Failed;
    sync::model::persistLastResult(tmp.path, r);

    const auto snap = board->current();
    ASSERT_TRUE(snap.last_sync.has_value());
    EXPECT_EQ(snap.last_sync->run_uuid, "persisted");
    EXPECT_EQ(snap.last_sync->state, sync::model::Result::State::Failed);
}

namespace {

analytics::model::DailySummary sampleSummary() {
    analytics::model::DailySummary s;
    s.date = date(2024, 6, 15);
    s.steps = 12345;
    s.steps_goal = 10000;
    s.sleep_hours = 3.5;
    s.sleep_goal = 7;
    s.weight_kg = 80.0;
    s.weight_goal = 75;
    s.body_battery = 64;
    s.goals_met = 1;
    s.status = "Good effort today";
    return s;
}

}

TEST(MarkdownLogTest, RendersTable) {
    const auto md = report::MarkdownLog::render(sampleSummary());

    EXPECT_NE(md.find("## 2024-06-15"), std::string::npos);
    EXPECT_NE(md.find("| Metric | Value | Goal | Status |"), std::string::npos);
    EXPECT_NE(md.find("| Steps | 12,345 | 10,000 | ✓ |"), std::string::npos);
    EXPECT_NE(md.find("| Sleep | 3.5h | 7h | 50% |"), std::string::npos);
    EXPECT_NE(md.find("| Weight | 80.0kg | 75kg | ↓5.0kg |"), std::string::npos);
    EXPECT_NE(md.find("| Body Battery | 64% | - | - |"), std::string::npos);
    EXPECT_NE(md.find("**Status:** Good effort today"), std::string::npos);
}

TEST(MarkdownLogTest, OmitsMissingWeight) {
    auto s = sampleSummary();
    s.weight_kg.reset();
    s.body_battery.reset();

    const auto md = report::MarkdownLog::render(s);
    EXPECT_EQ(md.find("| Weight"), std::string::npos);
    EXPECT_EQ(md.find("| Body Battery"), std::string::npos);
}

TEST(MarkdownLogTest, HeaderWrittenOnce) {
    TempDir tmp;
    const report::MarkdownLog log(tmp.path / "notes" / "daily.md");

    log.append(sampleSummary());
    auto second = sampleSummary();
    second.date = date(2024, 6, 16);
    log.append(second);

    const auto content = util::readFileToString(log.path());
    const auto header = report::MarkdownLog::header();

    EXPECT_EQ(content.rfind(header, 0), 0u);
    EXPECT_EQ(content.find(header, 1), std::string::npos);
    EXPECT_NE(content.find("## 2024-06-15"), std::string::npos);
    EXPECT_LT(content.find("## 2024-06-15"), content.find("## 2024-06-16"));
}
