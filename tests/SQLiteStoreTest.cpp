#include <fstream>
#include <vector>
#include <gtest/gtest.h>
#include "ArchiveErrors.hpp"
#include "SQLiteStore.hpp"
#include "TestUtils.hpp"

namespace
{
    std::vector<VehiclePosition> drain(PositionCursor cursor)
    {
        std::vector<VehiclePosition> out;
        VehiclePosition p;
        while (cursor.next(p))
            out.push_back(p);
        return out;
    }

    void rawExec(std::filesystem::path const& dbPath, char const* sql)
    {
        sqlite3* db = nullptr;
        ASSERT_EQ(sqlite3_open(dbPath.string().c_str(), &db), SQLITE_OK);
        char* err = nullptr;
        int rc = sqlite3_exec(db, sql, nullptr, nullptr, &err);
        std::string message = err ? err : "";
        sqlite3_free(err);
        sqlite3_close(db);
        ASSERT_EQ(rc, SQLITE_OK) << message;
    }
}

TEST(SQLiteStoreTest, DuplicateTripAndTimestampIsIgnored)
{
    TempDir tmp;
    SQLiteStore store((tmp / "realtime.db").string());

    EXPECT_TRUE(store.insert(makePosition("v1", JAN_2024, "t1")));
    EXPECT_FALSE(store.insert(makePosition("v1", JAN_2024, "t1")));
    EXPECT_TRUE(store.insert(makePosition("v1", JAN_2024, "t2")));

    EXPECT_EQ(drain(store.queryWindow(JAN_2024, FEB_2024)).size(), 2u);
}

TEST(SQLiteStoreTest, InsertManyCountsOnlyNewRows)
{
    TempDir tmp;
    SQLiteStore store((tmp / "realtime.db").string());

    std::vector<VehiclePosition> batch{
        makePosition("v1", JAN_2024 + 10),
        makePosition("v2", JAN_2024 + 10),
        makePosition("v1", JAN_2024 + 10),
    };
    EXPECT_EQ(store.insertMany(batch), 2u);
    EXPECT_EQ(store.insertMany(batch), 0u);
}

TEST(SQLiteStoreTest, MonthBoundsIgnoreUnstampedRows)
{
    TempDir tmp;
    SQLiteStore store((tmp / "realtime.db").string());

    EXPECT_FALSE(store.archiveMonthBounds());

    store.insert(makePosition("v0", 0));
    EXPECT_FALSE(store.archiveMonthBounds());

    store.insert(makePosition("v1", FEB_2024 + 5));
    store.insert(makePosition("v2", APR_2024 - 1));

    auto bounds = store.archiveMonthBounds();
    ASSERT_TRUE(bounds);
    EXPECT_EQ(bounds->first, "2024-02");
    EXPECT_EQ(bounds->second, "2024-03");
}

TEST(SQLiteStoreTest, WindowIsHalfOpenAndOrdered)
{
    TempDir tmp;
    SQLiteStore store((tmp / "realtime.db").string());

    store.insert(makePosition("a", FEB_2024 + 30));
    store.insert(makePosition("b", FEB_2024));
    store.insert(makePosition("c", MAR_2024));
    store.insert(makePosition("d", FEB_2024 - 1));
    store.insert(makePosition("e", FEB_2024 + 20));

    auto rows = drain(store.queryWindow(FEB_2024, MAR_2024));
    ASSERT_EQ(rows.size(), 3u);
    EXPECT_EQ(rows[0].vehicleId, "b");
    EXPECT_EQ(rows[1].vehicleId, "e");
    EXPECT_EQ(rows[2].vehicleId, "a");
}

TEST(SQLiteStoreTest, RowsRoundTripThroughCursor)
{
    TempDir tmp;
    SQLiteStore store((tmp / "realtime.db").string());

    VehiclePosition in = makePosition("v9", JAN_2024 + 99);
    store.insert(in);

    auto rows = drain(store.queryWindow(JAN_2024, FEB_2024));
    ASSERT_EQ(rows.size(), 1u);
    VehiclePosition const& out = rows[0];
    EXPECT_EQ(out.tripId, in.tripId);
    EXPECT_EQ(out.routeId, in.routeId);
    EXPECT_EQ(out.directionId, in.directionId);
    EXPECT_EQ(out.startTime, in.startTime);
    EXPECT_FLOAT_EQ(out.latitude, in.latitude);
    EXPECT_FLOAT_EQ(out.longitude, in.longitude);
    EXPECT_DOUBLE_EQ(out.odometer, in.odometer);
    EXPECT_EQ(out.currentStopSequence, in.currentStopSequence);
    EXPECT_EQ(out.stopId, in.stopId);
    EXPECT_EQ(out.timestamp, in.timestamp);
    EXPECT_EQ(out.vehicleLabel, in.vehicleLabel);
    EXPECT_EQ(out.licensePlate, in.licensePlate);
}

TEST(SQLiteStoreTest, NonNumericCodeIsCodecError)
{
    TempDir tmp;
    auto path = tmp / "realtime.db";
    SQLiteStore store(path.string());
    store.insert(makePosition("v1", JAN_2024 + 1));

    rawExec(path, "UPDATE vehicle_positions SET direction_id = 'north';");

    PositionCursor cursor = store.queryWindow(JAN_2024, FEB_2024);
    VehiclePosition p;
    try
    {
        cursor.next(p);
        FAIL() << "expected ArchiveError";
    }
    catch (ArchiveError const& e)
    {
        EXPECT_EQ(e.kind(), ArchiveError::Kind::Codec);
    }
}

TEST(SQLiteStoreTest, UnopenablePathThrows)
{
    TempDir tmp;
    EXPECT_THROW(SQLiteStore((tmp / "missing" / "dir" / "realtime.db").string()), std::runtime_error);
}

TEST(SQLiteStoreTest, ReadOnlyStoreSeesWrittenRows)
{
    TempDir tmp;
    auto path = tmp / "realtime.db";
    {
        SQLiteStore writer(path.string());
        writer.insert(makePosition("v1", JAN_2024 + 5));
        writer.insert(makePosition("v2", FEB_2024 + 5));
    }

    SQLiteStore reader(path.string(), OpenMode::ReadOnly);
    auto bounds = reader.archiveMonthBounds();
    ASSERT_TRUE(bounds);
    EXPECT_EQ(bounds->first, "2024-01");
    EXPECT_EQ(bounds->second, "2024-02");
    EXPECT_EQ(drain(reader.queryWindow(JAN_2024, MAR_2024)).size(), 2u);
}

TEST(SQLiteStoreTest, ReadOnlyStoreRejectsInserts)
{
    TempDir tmp;
    auto path = tmp / "realtime.db";
    {
        SQLiteStore writer(path.string());
    }

    SQLiteStore reader(path.string(), OpenMode::ReadOnly);
    EXPECT_THROW(reader.insert(makePosition("v1", JAN_2024)), std::runtime_error);
    EXPECT_THROW(reader.insertMany({makePosition("v1", JAN_2024)}), std::runtime_error);
    EXPECT_FALSE(reader.archiveMonthBounds());
}

TEST(SQLiteStoreTest, ReadOnlyOpenNeverCreatesFile)
{
    TempDir tmp;
    auto path = tmp / "realtime.db";
    EXPECT_THROW(SQLiteStore(path.string(), OpenMode::ReadOnly), std::runtime_error);
    EXPECT_FALSE(std::filesystem::exists(path));
}

TEST(SQLiteStoreTest, ReadOnlyOpenLeavesSchemaAlone)
{
    TempDir tmp;
    auto path = tmp / "realtime.db";
    std::ofstream(path).close();

    SQLiteStore reader(path.string(), OpenMode::ReadOnly);
    try
    {
        reader.archiveMonthBounds();
        FAIL() << "expected ArchiveError";
    }
    catch (ArchiveError const& e)
    {
        EXPECT_EQ(e.kind(), ArchiveError::Kind::Discovery);
    }
    EXPECT_EQ(std::filesystem::file_size(path), 0u);
}
