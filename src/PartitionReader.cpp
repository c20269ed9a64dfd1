#include <algorithm>
#include <iterator>
#include <string_view>
#include <system_error>
#include "ArchiveSchema.hpp"
#include "ArchiveStatus.hpp"
#include "PartitionReader.hpp"

namespace
{
    constexpr auto kIo = ArchiveError::Kind::Io;
    constexpr auto kCodec = ArchiveError::Kind::Codec;

    int fieldIndex(arrow::Schema const& schema, char const* name)
    {
        int index = schema.GetFieldIndex(name);
        if (index < 0)
            throw ArchiveError(kCodec, std::string("partition file has no column ") + name);
        return index;
    }
}

std::optional<PartitionReader> PartitionReader::open(std::filesystem::path const& path)
{
    std::error_code ec;
    bool present = std::filesystem::exists(path, ec);
    if (ec)
        throw ArchiveError(kIo, "Cannot inspect " + path.string() + ": " + ec.message());
    if (!present)
        return std::nullopt;

    return PartitionReader(path);
}

PartitionReader::PartitionReader(std::filesystem::path const& path)
    : filePath(path)
{
    file = valueOrThrow(arrow::io::ReadableFile::Open(filePath.string()), kIo,
                        "Cannot open " + filePath.string());

    parquet::arrow::FileReaderBuilder builder;
    ARCHIVE_THROW_IF_NOT_OK(kCodec, builder.Open(file));
    ARCHIVE_THROW_IF_NOT_OK(kCodec, builder.memory_pool(arrow::default_memory_pool())->Build(&reader));
    ARCHIVE_THROW_IF_NOT_OK(kCodec, reader->GetSchema(&arrowSchema));
}

int64_t PartitionReader::numRows() const
{
    return reader->parquet_reader()->metadata()->num_rows();
}

int PartitionReader::numRowGroups() const
{
    return reader->num_row_groups();
}

std::shared_ptr<arrow::Table> PartitionReader::nextRowGroup()
{
    if (nextGroup >= numRowGroups())
        return nullptr;

    std::shared_ptr<arrow::Table> table;
    ARCHIVE_THROW_IF_NOT_OK(kCodec, reader->ReadRowGroup(nextGroup, &table));
    ++nextGroup;
    return table;
}

std::shared_ptr<arrow::Table> PartitionReader::nextRowGroup(std::vector<int> const& columns)
{
    if (nextGroup >= numRowGroups())
        return nullptr;

    std::shared_ptr<arrow::Table> table;
    ARCHIVE_THROW_IF_NOT_OK(kCodec, reader->ReadRowGroup(nextGroup, columns, &table));
    ++nextGroup;
    return table;
}

std::optional<int64_t> ArchiveWatermarks::oldest() const
{
    std::optional<int64_t> result;
    for (Watermarks const* marks : {&vehicles, &trips})
    {
        for (auto const& entry : *marks)
        {
            if (!result || entry.second < *result)
                result = entry.second;
        }
    }
    return result;
}

bool ArchiveWatermarks::admit(VehiclePosition const& p)
{
    Watermarks& marks = p.vehicleId.empty() ? trips : vehicles;
    std::string const& key = p.vehicleId.empty() ? p.tripId : p.vehicleId;

    auto [it, inserted] = marks.emplace(key, p.timestamp);
    if (inserted)
        return true;
    if (p.timestamp <= it->second)
        return false;

    it->second = p.timestamp;
    return true;
}

ArchiveWatermarks PartitionReader::watermarks()
{
    const int tripIndex = fieldIndex(*arrowSchema, ArchiveSchema::tripIdColumn);
    const int vehicleIndex = fieldIndex(*arrowSchema, ArchiveSchema::vehicleIdColumn);
    const int timestampIndex = fieldIndex(*arrowSchema, ArchiveSchema::timestampColumn);

    ArchiveWatermarks latest;
    while (auto table = nextRowGroup({tripIndex, vehicleIndex, timestampIndex}))
    {
        arrow::TableBatchReader batches(*table);
        std::shared_ptr<arrow::RecordBatch> batch;
        for (;;)
        {
            ARCHIVE_THROW_IF_NOT_OK(kCodec, batches.ReadNext(&batch));
            if (!batch)
                break;

            auto trips = std::dynamic_pointer_cast<arrow::StringArray>(
                batch->GetColumnByName(ArchiveSchema::tripIdColumn));
            auto vehicles = std::dynamic_pointer_cast<arrow::StringArray>(
                batch->GetColumnByName(ArchiveSchema::vehicleIdColumn));
            auto times = std::dynamic_pointer_cast<arrow::TimestampArray>(
                batch->GetColumnByName(ArchiveSchema::timestampColumn));
            if (!trips || !vehicles || !times)
                throw ArchiveError(kCodec, "Unexpected trip_id/vehicle_id/timestamp types in " + filePath.string());

            for (int64_t i = 0; i < batch->num_rows(); ++i)
            {
                if (times->IsNull(i))
                    continue;

                std::string_view vehicleId = vehicles->IsNull(i) ? std::string_view() : vehicles->GetView(i);
                Watermarks& marks = vehicleId.empty() ? latest.trips : latest.vehicles;
                std::string key(vehicleId.empty()
                                ? (trips->IsNull(i) ? std::string_view() : trips->GetView(i))
                                : vehicleId);

                const int64_t ts = ArchiveSchema::epochSeconds(*times, i);
                auto it = marks.find(key);
                if (it == marks.end())
                    marks.emplace(std::move(key), ts);
                else
                    it->second = std::max(it->second, ts);
            }
        }
    }
    return latest;
}

std::vector<VehiclePosition> PartitionReader::readAll()
{
    rewind();

    std::vector<VehiclePosition> rows;
    rows.reserve(static_cast<std::size_t>(numRows()));
    while (auto table = nextRowGroup())
    {
        auto decoded = ArchiveSchema::fromTable(*table);
        std::move(decoded.begin(), decoded.end(), std::back_inserter(rows));
    }
    return rows;
}
