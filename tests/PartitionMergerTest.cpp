#include <algorithm>
#include <fstream>
#include <map>
#include <set>
#include <utility>
#include <vector>
#include <gtest/gtest.h>
#include <arrow/api.h>
#include <arrow/io/file.h>
#include <parquet/arrow/writer.h>
#include "ArchiveErrors.hpp"
#include "PartitionMerger.hpp"
#include "PartitionReader.hpp"
#include "PartitionWriter.hpp"
#include "SQLiteStore.hpp"
#include "TestUtils.hpp"

namespace
{
    using Observation = std::pair<std::string, int64_t>;

    const PartitionKey january{2024, 1};
    const PartitionKey february{2024, 2};

    class PartitionMergerTest : public ::testing::Test
    {
    protected:
        TempDir tmp;
        SQLiteStore store{(tmp / "realtime.db").string()};
        std::filesystem::path root = tmp / "archive";

        std::vector<VehiclePosition> contents(PartitionMerger const& merger, PartitionKey const& key)
        {
            PartitionReader reader(merger.partitionPath(key));
            return reader.readAll();
        }

        std::vector<Observation> observations(PartitionMerger const& merger, PartitionKey const& key)
        {
            std::vector<Observation> out;
            for (auto const& p : contents(merger, key))
                out.emplace_back(p.vehicleId, p.timestamp);
            std::sort(out.begin(), out.end());
            return out;
        }
    };
}

TEST_F(PartitionMergerTest, FirstMergeCreatesMonthFiles)
{
    store.insert(makePosition("V1", JAN_2024 + 3600));
    store.insert(makePosition("V1", FEB_2024 + 7200));

    PartitionMerger merger(store, root);
    MergeStats jan = merger.merge(january);
    MergeStats feb = merger.merge(february);

    EXPECT_EQ(jan.existingRows, 0);
    EXPECT_EQ(jan.newRows, 1);
    EXPECT_EQ(feb.newRows, 1);

    EXPECT_EQ(merger.partitionPath(february), root / "year=2024" / "month=02" / "vehicle_positions.parquet");
    EXPECT_EQ(observations(merger, january), (std::vector<Observation>{{"V1", JAN_2024 + 3600}}));
    EXPECT_EQ(observations(merger, february), (std::vector<Observation>{{"V1", FEB_2024 + 7200}}));
}

TEST_F(PartitionMergerTest, RerunWithoutNewDataAddsNothing)
{
    store.insert(makePosition("V1", FEB_2024 + 7200));

    PartitionMerger merger(store, root);
    merger.merge(february);
    auto before = observations(merger, february);

    MergeStats again = merger.merge(february);
    EXPECT_EQ(again.existingRows, 1);
    EXPECT_EQ(again.copiedRows, 1);
    EXPECT_EQ(again.vehicles, 1u);
    EXPECT_EQ(again.newRows, 0);
    EXPECT_EQ(again.skippedRows, 1);
    EXPECT_EQ(observations(merger, february), before);
}

TEST_F(PartitionMergerTest, NewerRowIsAppendedOnce)
{
    const int64_t t2 = FEB_2024 + 7200;
    const int64_t t3 = t2 + 30;
    store.insert(makePosition("V1", t2, "trip-a"));

    PartitionMerger merger(store, root);
    merger.merge(february);

    store.insert(makePosition("V1", t3, "trip-a"));
    MergeStats stats = merger.merge(february);

    EXPECT_EQ(stats.copiedRows, 1);
    EXPECT_EQ(stats.newRows, 1);
    EXPECT_EQ(stats.skippedRows, 1);
    EXPECT_EQ(observations(merger, february), (std::vector<Observation>{{"V1", t2}, {"V1", t3}}));
}

TEST_F(PartitionMergerTest, RowsStayInsideTheirMonth)
{
    store.insert(makePosition("A", FEB_2024 - 1));
    store.insert(makePosition("B", FEB_2024));
    store.insert(makePosition("C", MAR_2024 - 1));
    store.insert(makePosition("D", MAR_2024));

    PartitionMerger merger(store, root);
    merger.merge(february);

    auto rows = contents(merger, february);
    ASSERT_EQ(rows.size(), 2u);
    for (auto const& p : rows)
        EXPECT_TRUE(february.contains(p.timestamp)) << p.vehicleId;
}

TEST_F(PartitionMergerTest, DuplicateVehicleTimestampKeptOnce)
{
    // Same vehicle and instant reported under two trips.
    store.insert(makePosition("V1", FEB_2024 + 60, "trip-a"));
    store.insert(makePosition("V1", FEB_2024 + 60, "trip-b"));
    store.insert(makePosition("V1", FEB_2024 + 120, "trip-b"));

    PartitionMerger merger(store, root);
    MergeStats stats = merger.merge(february);

    EXPECT_EQ(stats.newRows, 2);
    EXPECT_EQ(stats.skippedRows, 1);

    std::set<Observation> unique;
    for (auto const& o : observations(merger, february))
        EXPECT_TRUE(unique.insert(o).second) << o.first << "@" << o.second;
}

TEST_F(PartitionMergerTest, RowsWithoutVehicleIdAreKeyedByTrip)
{
    store.insert(makePosition("", FEB_2024 + 60, "trip-a"));
    store.insert(makePosition("", FEB_2024 + 60, "trip-b"));

    PartitionMerger merger(store, root);
    EXPECT_EQ(merger.merge(february).newRows, 2);
    EXPECT_EQ(contents(merger, february).size(), 2u);
}

TEST_F(PartitionMergerTest, RerunDoesNotRepeatRowsWithoutVehicleId)
{
    store.insert(makePosition("", FEB_2024 + 60, "trip-a"));
    store.insert(makePosition("", FEB_2024 + 90, "trip-b"));
    store.insert(makePosition("V1", FEB_2024 + 120));

    PartitionMerger merger(store, root);
    merger.merge(february);

    for (int run = 0; run < 3; ++run)
    {
        MergeStats stats = merger.merge(february);
        EXPECT_EQ(stats.newRows, 0) << "run " << run;
        EXPECT_EQ(stats.skippedRows, 3) << "run " << run;
    }
    EXPECT_EQ(contents(merger, february).size(), 3u);

    store.insert(makePosition("", FEB_2024 + 150, "trip-a"));
    MergeStats stats = merger.merge(february);
    EXPECT_EQ(stats.newRows, 1);
    EXPECT_EQ(observations(merger, february),
              (std::vector<Observation>{{"", FEB_2024 + 60}, {"", FEB_2024 + 90}, {"", FEB_2024 + 150},
                                        {"V1", FEB_2024 + 120}}));
}

TEST_F(PartitionMergerTest, WatermarksSplitVehiclesAndTrips)
{
    store.insert(makePosition("", FEB_2024 + 60, "trip-a"));
    store.insert(makePosition("", FEB_2024 + 80, "trip-a"));
    store.insert(makePosition("V1", FEB_2024 + 40, "trip-a"));
    store.insert(makePosition("V1", FEB_2024 + 70, "trip-b"));

    PartitionMerger merger(store, root);
    merger.merge(february);

    PartitionReader reader(merger.partitionPath(february));
    ArchiveWatermarks marks = reader.watermarks();
    EXPECT_EQ(marks.vehicles, (Watermarks{{"V1", FEB_2024 + 70}}));
    EXPECT_EQ(marks.trips, (Watermarks{{"trip-a", FEB_2024 + 80}}));
    EXPECT_EQ(marks.oldest(), std::optional<int64_t>(FEB_2024 + 70));
}

TEST_F(PartitionMergerTest, FieldsSurviveTheArchive)
{
    VehiclePosition in = makePosition("V7", FEB_2024 + 99);
    store.insert(in);

    PartitionMerger merger(store, root);
    merger.merge(february);
    merger.merge(february);

    auto rows = contents(merger, february);
    ASSERT_EQ(rows.size(), 1u);
    VehiclePosition const& out = rows[0];
    EXPECT_EQ(out.tripId, in.tripId);
    EXPECT_EQ(out.routeId, in.routeId);
    EXPECT_EQ(out.directionId, in.directionId);
    EXPECT_EQ(out.startTime, in.startTime);
    EXPECT_EQ(out.scheduleRelationship, in.scheduleRelationship);
    EXPECT_FLOAT_EQ(out.latitude, in.latitude);
    EXPECT_FLOAT_EQ(out.longitude, in.longitude);
    EXPECT_FLOAT_EQ(out.bearing, in.bearing);
    EXPECT_DOUBLE_EQ(out.odometer, in.odometer);
    EXPECT_FLOAT_EQ(out.speed, in.speed);
    EXPECT_EQ(out.currentStopSequence, in.currentStopSequence);
    EXPECT_EQ(out.stopId, in.stopId);
    EXPECT_EQ(out.currentStatus, in.currentStatus);
    EXPECT_EQ(out.timestamp, in.timestamp);
    EXPECT_EQ(out.congestionLevel, in.congestionLevel);
    EXPECT_EQ(out.occupancyStatus, in.occupancyStatus);
    EXPECT_EQ(out.vehicleId, in.vehicleId);
    EXPECT_EQ(out.vehicleLabel, in.vehicleLabel);
    EXPECT_EQ(out.licensePlate, in.licensePlate);
}

TEST_F(PartitionMergerTest, SmallRowGroupsAreCopiedIntact)
{
    for (int i = 0; i < 5; ++i)
        store.insert(makePosition("V" + std::to_string(i), FEB_2024 + 10 * i));

    MergeOptions options;
    options.rowGroupSize = 2;
    PartitionMerger merger(store, root, options);
    merger.merge(february);

    {
        PartitionReader reader(merger.partitionPath(february));
        EXPECT_EQ(reader.numRows(), 5);
        EXPECT_EQ(reader.numRowGroups(), 3);
    }

    store.insert(makePosition("V9", FEB_2024 + 100));
    MergeStats stats = merger.merge(february);
    EXPECT_EQ(stats.copiedRows, 5);
    EXPECT_EQ(stats.newRows, 1);
    EXPECT_EQ(contents(merger, february).size(), 6u);
}

TEST_F(PartitionMergerTest, StrayStagingFileIsReplaced)
{
    store.insert(makePosition("V1", FEB_2024 + 60));
    PartitionMerger merger(store, root);
    merger.merge(february);

    auto finalPath = merger.partitionPath(february);
    auto staging = finalPath;
    staging += PartitionMerger::stagingSuffix;
    {
        std::ofstream junk(staging, std::ios::binary);
        junk << "left behind by an interrupted run";
    }

    store.insert(makePosition("V1", FEB_2024 + 120));
    MergeStats stats = merger.merge(february);

    EXPECT_EQ(stats.newRows, 1);
    EXPECT_FALSE(std::filesystem::exists(staging));
    EXPECT_EQ(contents(merger, february).size(), 2u);
}

TEST_F(PartitionMergerTest, AbandonedWriteLeavesExistingFileReadable)
{
    store.insert(makePosition("V1", FEB_2024 + 60));
    PartitionMerger merger(store, root);
    merger.merge(february);

    auto finalPath = merger.partitionPath(february);
    auto staging = finalPath;
    staging += PartitionMerger::stagingSuffix;
    {
        // Interrupted before close(): no footer, no rename.
        PartitionWriter writer(staging, 10);
        writer.write({makePosition("V2", FEB_2024 + 90)});
    }

    EXPECT_EQ(observations(merger, february), (std::vector<Observation>{{"V1", FEB_2024 + 60}}));
    EXPECT_THROW(PartitionReader reader(staging), ArchiveError);
}

TEST_F(PartitionMergerTest, ForeignFileIsCodecErrorAndLeftAlone)
{
    PartitionMerger merger(store, root);
    auto finalPath = merger.partitionPath(february);
    std::filesystem::create_directories(finalPath.parent_path());

    arrow::Int32Builder builder;
    ASSERT_TRUE(builder.Append(1).ok());
    std::shared_ptr<arrow::Array> values;
    ASSERT_TRUE(builder.Finish(&values).ok());
    auto table = arrow::Table::Make(arrow::schema({arrow::field("x", arrow::int32())}), {values});
    auto outfile = arrow::io::FileOutputStream::Open(finalPath.string()).ValueOrDie();
    ASSERT_TRUE(parquet::arrow::WriteTable(*table, arrow::default_memory_pool(), outfile, 1024).ok());
    ASSERT_TRUE(outfile->Close().ok());
    auto size = std::filesystem::file_size(finalPath);

    store.insert(makePosition("V1", FEB_2024 + 60));
    try
    {
        merger.merge(february);
        FAIL() << "expected ArchiveError";
    }
    catch (ArchiveError const& e)
    {
        EXPECT_EQ(e.kind(), ArchiveError::Kind::Codec);
    }
    EXPECT_EQ(std::filesystem::file_size(finalPath), size);
}

TEST_F(PartitionMergerTest, MinWatermarkWindowMissesOlderRowsOfNewVehicles)
{
    store.insert(makePosition("V1", FEB_2024 + 1000));
    PartitionMerger merger(store, root);
    merger.merge(february);

    // Arrives late and predates every archived watermark.
    store.insert(makePosition("V2", FEB_2024 + 500));
    MergeStats stats = merger.merge(february);

    EXPECT_EQ(stats.newRows, 0);
    EXPECT_EQ(observations(merger, february), (std::vector<Observation>{{"V1", FEB_2024 + 1000}}));
}

TEST_F(PartitionMergerTest, PeriodStartWindowPicksUpLateVehicles)
{
    store.insert(makePosition("V1", FEB_2024 + 1000));
    MergeOptions options;
    options.windowStart = WindowStart::PeriodStart;
    PartitionMerger merger(store, root, options);
    merger.merge(february);

    store.insert(makePosition("V2", FEB_2024 + 500));
    MergeStats stats = merger.merge(february);

    EXPECT_EQ(stats.newRows, 1);
    EXPECT_EQ(stats.skippedRows, 1);
    EXPECT_EQ(observations(merger, february),
              (std::vector<Observation>{{"V1", FEB_2024 + 1000}, {"V2", FEB_2024 + 500}}));

    EXPECT_EQ(merger.merge(february).newRows, 0);
}

TEST_F(PartitionMergerTest, EmptyMonthStillGetsAFile)
{
    store.insert(makePosition("V1", JAN_2024 + 1));
    PartitionMerger merger(store, root);

    MergeStats stats = merger.merge(february);
    EXPECT_EQ(stats.newRows, 0);
    PartitionReader reader(merger.partitionPath(february));
    EXPECT_EQ(reader.numRows(), 0);
}
