#include <gtest/gtest.h>
#include "util/FileLock.hpp"
#include "util/files.hpp"
#include "util/timestamp.hpp"
#include "types/metric/Freshness.hpp"
#include "types/metric/Kind.hpp"
#include "types/metric/Record.hpp"
#include "support/TestEnv.hpp"

#include <nlohmann/json.hpp>

using namespace hs::util;
using namespace hs::types::metric;
using namespace hs::test;
using namespace std::chrono_literals;

TEST(TimestampTest, ParsesSupportedForms) {
    EXPECT_EQ(parseTimestamp("2024-06-15"), at(date(2024, 6, 15)));
    EXPECT_EQ(parseTimestamp("2024-06-15T07:30:05Z"), at(date(2024, 6, 15), 7, 30) + 5s);
    EXPECT_EQ(parseTimestamp("2024-06-15T07:30:05.250"), at(date(2024, 6, 15), 7, 30) + 5s);
    EXPECT_EQ(parseTimestamp("2024-06-15 23:59:00"), at(date(2024, 6, 15), 23, 59));
}

TEST(TimestampTest, RejectsGarbage) {
    EXPECT_FALSE(parseTimestamp("").has_value());
    EXPECT_FALSE(parseTimestamp("yesterday").has_value());
    EXPECT_FALSE(parseTimestamp("15/06/2024").has_value());
    EXPECT_FALSE(parseDate("2024-06-15Tnope:ab:cd").has_value());
}

TEST(TimestampTest, FormatsUtc) {
    EXPECT_EQ(formatTimestamp(at(date(2024, 6, 15), 7, 5)), "2024-06-15T07:05:00Z");
    EXPECT_EQ(formatDate(date(2024, 1, 2)), "2024-01-02");
    EXPECT_EQ(dateOf(at(date(2024, 6, 15), 23, 59)), date(2024, 6, 15));
}

TEST(TimestampTest, IsoWeekdays) {
    EXPECT_EQ(isoWeekday(date(2024, 6, 10)), 1u);
    EXPECT_EQ(isoWeekday(date(2024, 6, 15)), 6u);
    EXPECT_EQ(isoWeekday(date(2024, 6, 16)), 7u);
}

TEST(FilesTest, AtomicWriteReplacesContent) {
    TempDir tmp;
    const auto path = tmp.path / "nested" / "state.json";

    writeFileAtomic(path, "first");
    writeFileAtomic(path, "second");

    EXPECT_EQ(readFileToString(path), "second");

    size_t entries = 0;
    for ([[maybe_unused]] const auto& e : std::filesystem::directory_iterator(path.parent_path())) ++entries;
    EXPECT_EQ(entries, 1u);
}

TEST(FilesTest, ReadingMissingFileThrows) {
    TempDir tmp;
    EXPECT_THROW((void)readFileToString(tmp.path / "absent"), std::runtime_error);
}

TEST(FilesTest, QuarantineMovesFileAside) {
    TempDir tmp;
    const auto path = tmp.path / "series.json";
    writeText(path, "{broken");

    const auto moved = quarantineFile(path);

    EXPECT_FALSE(std::filesystem::exists(path));
    EXPECT_TRUE(std::filesystem::exists(moved));
    EXPECT_TRUE(moved.filename().string().starts_with("series.json.corrupt-"));
    EXPECT_EQ(readFileToString(moved), "{broken");
}

TEST(FileLockTest, SecondHolderIsRefused) {
    TempDir tmp;
    const auto path = tmp.path / "locks" / "sync.lock";

    {
        FileLock first(path);
        ASSERT_TRUE(first.acquired());

        FileLock second(path);
        EXPECT_FALSE(second.acquired());
    }

    FileLock again(path);
    EXPECT_TRUE(again.acquired());
}

TEST(KindTest, NamesParseBack) {
    for (const auto kind : ALL_KINDS) {
        Kind parsed{};
        ASSERT_TRUE(tryParseKind(toString(kind), parsed)) << toString(kind);
        EXPECT_EQ(parsed, kind);
    }

    Kind untouched = Kind::Stress;
    EXPECT_FALSE(tryParseKind("heart_rate", untouched));
    EXPECT_EQ(untouched, Kind::Stress);
}

TEST(KindTest, AggregationByKind) {
    EXPECT_EQ(aggregationFor(Kind::Steps), Aggregation::Sum);
    EXPECT_EQ(aggregationFor(Kind::Activity), Aggregation::Sum);
    EXPECT_EQ(aggregationFor(Kind::Weight), Aggregation::Mean);
    EXPECT_EQ(aggregationFor(Kind::Sleep), Aggregation::Mean);
}

TEST(FreshnessTest, AgeNeverNegative) {
    const auto now = at(date(2024, 6, 15), 12);
    EXPECT_EQ((Freshness{now - 90min, std::nullopt}.age(now)), 90min);
    EXPECT_EQ((Freshness{now + 5min, std::nullopt}.age(now)), 0min);
}

TEST(FreshnessTest, JsonRejectsBadTimestamps) {
    const Freshness f{at(date(2024, 6, 15), 8), at(date(2024, 6, 14))};
    EXPECT_EQ(nlohmann::json(f).get<Freshness>(), f);

    const auto bad = nlohmann::json::parse(R"({"last_synced_at": "whenever"})");
    EXPECT_THROW((void)bad.get<Freshness>(), std::invalid_argument);
}

TEST(RecordTest, SeriesFormCarriesRevision) {
    const auto r = weightRecord(date(2024, 6, 1), 80.5);
    const auto j = nlohmann::json(r);

    EXPECT_EQ(j.at("ts"), "2024-06-01T00:00:00Z");
    EXPECT_EQ(j.at("rev"), r.source_revision);
    EXPECT_EQ(recordFromJson(Kind::Weight, j), r);
}
