#include <memory>
#include <gtest/gtest.h>
#include <arrow/api.h>
#include "ArchiveSchema.hpp"
#include "PartitionReader.hpp"
#include "PartitionWriter.hpp"
#include "TestUtils.hpp"

TEST(ArchiveSchemaTest, PublicHeadersKeepStatusMacrosPrivate)
{
#ifdef ARCHIVE_THROW_IF_NOT_OK
    FAIL() << "ARCHIVE_THROW_IF_NOT_OK is visible through the public headers";
#endif
}

TEST(ArchiveSchemaTest, EpochSecondsFloorsSubSecondValues)
{
    arrow::TimestampBuilder builder(arrow::timestamp(arrow::TimeUnit::MILLI, "UTC"), arrow::default_memory_pool());
    ASSERT_TRUE(builder.Append(1500).ok());
    ASSERT_TRUE(builder.Append(-1500).ok());
    ASSERT_TRUE(builder.Append(-2000).ok());

    std::shared_ptr<arrow::Array> array;
    ASSERT_TRUE(builder.Finish(&array).ok());
    auto const& column = static_cast<arrow::TimestampArray const&>(*array);

    EXPECT_EQ(ArchiveSchema::epochSeconds(column, 0), 1);
    EXPECT_EQ(ArchiveSchema::epochSeconds(column, 1), -2);
    EXPECT_EQ(ArchiveSchema::epochSeconds(column, 2), -2);
}

TEST(ArchiveSchemaTest, TableKeepsVehicleFields)
{
    VehiclePosition p = makePosition("V1", FEB_2024 + 30, "trip-9");
    auto table = ArchiveSchema::toTable({p});
    ASSERT_EQ(table->num_rows(), 1);

    std::vector<VehiclePosition> back = ArchiveSchema::fromTable(*table);
    ASSERT_EQ(back.size(), 1u);
    EXPECT_EQ(back[0].vehicleId, "V1");
    EXPECT_EQ(back[0].tripId, "trip-9");
    EXPECT_EQ(back[0].timestamp, FEB_2024 + 30);
}

TEST(ArchiveSchemaTest, WrongColumnTypeIsCodecError)
{
    auto table = ArchiveSchema::toTable({makePosition("V1", FEB_2024)});
    int index = table->schema()->GetFieldIndex(ArchiveSchema::timestampColumn);
    ASSERT_GE(index, 0);

    arrow::Int64Builder builder;
    ASSERT_TRUE(builder.Append(FEB_2024).ok());
    std::shared_ptr<arrow::Array> seconds;
    ASSERT_TRUE(builder.Finish(&seconds).ok());

    auto replaced = table->SetColumn(index, arrow::field(ArchiveSchema::timestampColumn, arrow::int64()),
                                     std::make_shared<arrow::ChunkedArray>(seconds));
    ASSERT_TRUE(replaced.ok());

    try
    {
        ArchiveSchema::fromTable(**replaced);
        FAIL() << "expected ArchiveError";
    }
    catch (ArchiveError const& e)
    {
        EXPECT_EQ(e.kind(), ArchiveError::Kind::Codec);
    }
}
