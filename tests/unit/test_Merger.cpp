#include <gtest/gtest.h>
#include "sync/Merger.hpp"
#include "storage/LocalStore.hpp"
#include "support/TestEnv.hpp"

using namespace hs::sync;
using namespace hs::storage;
using namespace hs::types::metric;
using namespace hs::test;
using namespace std::chrono_literals;

class MergerTest : public ::testing::Test {
protected:
    TempDir tmp;
    FixedClock clock;
    std::unique_ptr<LocalStore> store;
    std::unique_ptr<Merger> merger;

    void SetUp() override {
        store = std::make_unique<LocalStore>(tmp.path);
        merger = std::make_unique<Merger>(*store, clock);
    }
};

TEST_F(MergerTest, FirstMergeReportsEveryRecordAsChanged) {
    const auto out = merger->merge(Kind::Steps, {
        stepsRecord(date(2024, 6, 13), 8000),
        stepsRecord(date(2024, 6, 14), 9000),
    });

    EXPECT_EQ(out.changed_count, 2u);
    ASSERT_EQ(out.changes.size(), 2u);
    EXPECT_FALSE(out.changes[0].previous.has_value());
    EXPECT_EQ(store->size(Kind::Steps), 2u);
}

TEST_F(MergerTest, RepeatedMergeIsIdempotent) {
    const Records batch{stepsRecord(date(2024, 6, 14), 9000)};
    merger->merge(Kind::Steps, batch);

    clock.advance(10min);
    const auto again = merger->merge(Kind::Steps, batch);

    EXPECT_EQ(again.changed_count, 0u);
    EXPECT_TRUE(again.changes.empty());
    EXPECT_EQ(store->read(Kind::Steps), batch);
    EXPECT_EQ(again.freshness.last_synced_at, clock.now());
}

TEST_F(MergerTest, RevisedRecordCarriesPrevious) {
    merger->merge(Kind::Steps, {stepsRecord(date(2024, 6, 15), 4000)});
    const auto out = merger->merge(Kind::Steps, {stepsRecord(date(2024, 6, 15), 4200)});

    EXPECT_EQ(out.changed_count, 1u);
    ASSERT_EQ(out.changes.size(), 1u);
    ASSERT_TRUE(out.changes[0].previous.has_value());
    EXPECT_EQ(out.changes[0].previous->as<StepsDay>().total_steps, 4000u);
    EXPECT_EQ(out.changes[0].current.as<StepsDay>().total_steps, 4200u);
}

TEST_F(MergerTest, LastRecordForATimestampWins) {
    const auto out = merger->merge(Kind::Steps, {
        stepsRecord(date(2024, 6, 15), 1000),
        stepsRecord(date(2024, 6, 15), 2000),
    });

    EXPECT_EQ(out.changed_count, 1u);
    const auto stored = store->at(Kind::Steps, at(date(2024, 6, 15)));
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->as<StepsDay>().total_steps, 2000u);
}

TEST_F(MergerTest, RecordsOfAnotherKindAreRejected) {
    const auto out = merger->merge(Kind::Steps, {
        stepsRecord(date(2024, 6, 15), 1000),
        sleepRecord(date(2024, 6, 15), 7.5),
    });

    EXPECT_EQ(out.rejected_count, 1u);
    EXPECT_EQ(out.changed_count, 1u);
    EXPECT_EQ(store->size(Kind::Sleep), 0u);
}

TEST_F(MergerTest, EmptyFetchStillAdvancesLastSyncedOnly) {
    merger->merge(Kind::Weight, {weightRecord(date(2024, 6, 10), 80.0)});
    const auto seen = store->freshness(Kind::Weight)->last_remote_timestamp_seen;

    clock.advance(1h);
    const auto out = merger->merge(Kind::Weight, {});

    EXPECT_EQ(out.changed_count, 0u);
    EXPECT_EQ(out.freshness.last_synced_at, clock.now());
    EXPECT_EQ(out.freshness.last_remote_timestamp_seen, seen);
    EXPECT_EQ(store->freshness(Kind::Weight), out.freshness);
}

TEST_F(MergerTest, LastSeenNeverMovesBackwards) {
    merger->merge(Kind::Weight, {weightRecord(date(2024, 6, 12), 80.0)});
    const auto out = merger->merge(Kind::Weight, {weightRecord(date(2024, 6, 1), 81.0)});

    EXPECT_EQ(out.freshness.last_remote_timestamp_seen, at(date(2024, 6, 12)));
    EXPECT_EQ(out.changed_count, 1u);
}

TEST_F(MergerTest, WeightSamplesAcrossThreeDays) {
    const auto d1 = date(2024, 6, 1), d2 = date(2024, 6, 2), d3 = date(2024, 6, 3);
    const auto out = merger->merge(Kind::Weight, {
        weightRecord(d3, 79.6),
        weightRecord(d1, 80.2),
        weightRecord(d2, 79.9),
    });

    EXPECT_EQ(out.changed_count, 3u);
    EXPECT_EQ(out.freshness.last_remote_timestamp_seen, at(d3));

    const auto stored = store->read(Kind::Weight);
    ASSERT_EQ(stored.size(), 3u);
    EXPECT_EQ(stored.front().timestamp, at(d1));
    EXPECT_EQ(stored.back().timestamp, at(d3));
    EXPECT_DOUBLE_EQ(stored.back().value(), 79.6);
}
