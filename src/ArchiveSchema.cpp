#include "ArchiveSchema.hpp"
#include "ArchiveStatus.hpp"

namespace
{
    constexpr auto kCodec = ArchiveError::Kind::Codec;

    std::shared_ptr<arrow::DataType> timestampType()
    {
        return arrow::timestamp(arrow::TimeUnit::MILLI, "UTC");
    }

    int64_t unitsPerSecond(arrow::TimeUnit::type unit)
    {
        switch (unit)
        {
            case arrow::TimeUnit::SECOND: return 1;
            case arrow::TimeUnit::MILLI:  return 1000;
            case arrow::TimeUnit::MICRO:  return 1000000;
            case arrow::TimeUnit::NANO:   return 1000000000;
        }
        return 1;
    }

    // Looks a column up by name and checks its Arrow type.
    template <typename ArrayType>
    ArrayType const& column(arrow::RecordBatch const& batch, char const* name, arrow::Type::type expected)
    {
        auto array = batch.GetColumnByName(name);
        if (!array)
            throw ArchiveError(kCodec, std::string("partition file has no column ") + name);
        if (array->type_id() != expected)
        {
            throw ArchiveError(kCodec, std::string("column ") + name + " has type "
                                     + array->type()->ToString());
        }
        return static_cast<ArrayType const&>(*array);
    }

    std::string stringAt(arrow::StringArray const& a, int64_t i)
    {
        return a.IsNull(i) ? std::string() : a.GetString(i);
    }

    template <typename ArrayType>
    auto valueAt(ArrayType const& a, int64_t i) -> decltype(a.Value(i))
    {
        return a.IsNull(i) ? decltype(a.Value(i)){} : a.Value(i);
    }

    int64_t secondsAt(arrow::TimestampArray const& a, int64_t i)
    {
        return a.IsNull(i) ? 0 : ArchiveSchema::epochSeconds(a, i);
    }

    void decodeBatch(arrow::RecordBatch const& batch, std::vector<VehiclePosition>& out)
    {
        auto const& tripId       = column<arrow::StringArray>(batch, "trip_id", arrow::Type::STRING);
        auto const& routeId      = column<arrow::StringArray>(batch, "route_id", arrow::Type::STRING);
        auto const& directionId  = column<arrow::Int8Array>(batch, "direction_id", arrow::Type::INT8);
        auto const& startTime    = column<arrow::TimestampArray>(batch, "start_time", arrow::Type::TIMESTAMP);
        auto const& schedule     = column<arrow::Int8Array>(batch, "schedule_relationship", arrow::Type::INT8);
        auto const& latitude     = column<arrow::FloatArray>(batch, "latitude", arrow::Type::FLOAT);
        auto const& longitude    = column<arrow::FloatArray>(batch, "longitude", arrow::Type::FLOAT);
        auto const& bearing      = column<arrow::FloatArray>(batch, "bearing", arrow::Type::FLOAT);
        auto const& odometer     = column<arrow::DoubleArray>(batch, "odometer", arrow::Type::DOUBLE);
        auto const& speed        = column<arrow::FloatArray>(batch, "speed", arrow::Type::FLOAT);
        auto const& stopSequence = column<arrow::UInt32Array>(batch, "current_stop_sequence", arrow::Type::UINT32);
        auto const& stopId       = column<arrow::StringArray>(batch, "stop_id", arrow::Type::STRING);
        auto const& status       = column<arrow::Int8Array>(batch, "current_status", arrow::Type::INT8);
        auto const& timestamp    = column<arrow::TimestampArray>(batch, "timestamp", arrow::Type::TIMESTAMP);
        auto const& congestion   = column<arrow::Int8Array>(batch, "congestion_level", arrow::Type::INT8);
        auto const& occupancy    = column<arrow::Int8Array>(batch, "occupancy_status", arrow::Type::INT8);
        auto const& vehicleId    = column<arrow::StringArray>(batch, "vehicle_id", arrow::Type::STRING);
        auto const& vehicleLabel = column<arrow::StringArray>(batch, "vehicle_label", arrow::Type::STRING);
        auto const& licensePlate = column<arrow::StringArray>(batch, "license_plate", arrow::Type::STRING);

        for (int64_t i = 0; i < batch.num_rows(); ++i)
        {
            VehiclePosition p;
            p.tripId               = stringAt(tripId, i);
            p.routeId              = stringAt(routeId, i);
            p.directionId          = valueAt(directionId, i);
            p.startTime            = secondsAt(startTime, i);
            p.scheduleRelationship = valueAt(schedule, i);
            p.latitude             = valueAt(latitude, i);
            p.longitude            = valueAt(longitude, i);
            p.bearing              = valueAt(bearing, i);
            p.odometer             = valueAt(odometer, i);
            p.speed                = valueAt(speed, i);
            p.currentStopSequence  = valueAt(stopSequence, i);
            p.stopId               = stringAt(stopId, i);
            p.currentStatus        = valueAt(status, i);
            p.timestamp            = secondsAt(timestamp, i);
            p.congestionLevel      = valueAt(congestion, i);
            p.occupancyStatus      = valueAt(occupancy, i);
            p.vehicleId            = stringAt(vehicleId, i);
            p.vehicleLabel         = stringAt(vehicleLabel, i);
            p.licensePlate         = stringAt(licensePlate, i);
            out.push_back(std::move(p));
        }
    }
}

std::shared_ptr<arrow::Schema> const& ArchiveSchema::schema()
{
    static const std::shared_ptr<arrow::Schema> instance = arrow::schema({
        arrow::field("trip_id", arrow::utf8()),
        arrow::field("route_id", arrow::utf8()),
        arrow::field("direction_id", arrow::int8()),
        arrow::field("start_time", timestampType()),
        arrow::field("schedule_relationship", arrow::int8()),
        arrow::field("latitude", arrow::float32()),
        arrow::field("longitude", arrow::float32()),
        arrow::field("bearing", arrow::float32()),
        arrow::field("odometer", arrow::float64()),
        arrow::field("speed", arrow::float32()),
        arrow::field("current_stop_sequence", arrow::uint32()),
        arrow::field("stop_id", arrow::utf8()),
        arrow::field("current_status", arrow::int8()),
        arrow::field("timestamp", timestampType()),
        arrow::field("congestion_level", arrow::int8()),
        arrow::field("occupancy_status", arrow::int8()),
        arrow::field("vehicle_id", arrow::utf8()),
        arrow::field("vehicle_label", arrow::utf8()),
        arrow::field("license_plate", arrow::utf8())
    });
    return instance;
}

std::shared_ptr<arrow::Table> ArchiveSchema::toTable(std::vector<VehiclePosition> const& batch)
{
    arrow::MemoryPool* pool = arrow::default_memory_pool();
    const int64_t n = static_cast<int64_t>(batch.size());
    const int64_t millis = unitsPerSecond(arrow::TimeUnit::MILLI);

    arrow::StringBuilder tripId(pool), routeId(pool), stopId(pool);
    arrow::StringBuilder vehicleId(pool), vehicleLabel(pool), licensePlate(pool);
    arrow::Int8Builder directionId(pool), schedule(pool), status(pool), congestion(pool), occupancy(pool);
    arrow::TimestampBuilder startTime(timestampType(), pool), timestamp(timestampType(), pool);
    arrow::FloatBuilder latitude(pool), longitude(pool), bearing(pool), speed(pool);
    arrow::DoubleBuilder odometer(pool);
    arrow::UInt32Builder stopSequence(pool);

    ARCHIVE_THROW_IF_NOT_OK(kCodec, directionId.Reserve(n));
    ARCHIVE_THROW_IF_NOT_OK(kCodec, schedule.Reserve(n));
    ARCHIVE_THROW_IF_NOT_OK(kCodec, status.Reserve(n));
    ARCHIVE_THROW_IF_NOT_OK(kCodec, congestion.Reserve(n));
    ARCHIVE_THROW_IF_NOT_OK(kCodec, occupancy.Reserve(n));
    ARCHIVE_THROW_IF_NOT_OK(kCodec, startTime.Reserve(n));
    ARCHIVE_THROW_IF_NOT_OK(kCodec, timestamp.Reserve(n));
    ARCHIVE_THROW_IF_NOT_OK(kCodec, latitude.Reserve(n));
    ARCHIVE_THROW_IF_NOT_OK(kCodec, longitude.Reserve(n));
    ARCHIVE_THROW_IF_NOT_OK(kCodec, bearing.Reserve(n));
    ARCHIVE_THROW_IF_NOT_OK(kCodec, speed.Reserve(n));
    ARCHIVE_THROW_IF_NOT_OK(kCodec, odometer.Reserve(n));
    ARCHIVE_THROW_IF_NOT_OK(kCodec, stopSequence.Reserve(n));

    for (VehiclePosition const& p : batch)
    {
        directionId.UnsafeAppend(static_cast<int8_t>(p.directionId));
        startTime.UnsafeAppend(p.startTime * millis);
        schedule.UnsafeAppend(static_cast<int8_t>(p.scheduleRelationship));
        latitude.UnsafeAppend(p.latitude);
        longitude.UnsafeAppend(p.longitude);
        bearing.UnsafeAppend(p.bearing);
        odometer.UnsafeAppend(p.odometer);
        speed.UnsafeAppend(p.speed);
        stopSequence.UnsafeAppend(p.currentStopSequence);
        status.UnsafeAppend(static_cast<int8_t>(p.currentStatus));
        timestamp.UnsafeAppend(p.timestamp * millis);
        congestion.UnsafeAppend(static_cast<int8_t>(p.congestionLevel));
        occupancy.UnsafeAppend(static_cast<int8_t>(p.occupancyStatus));

        ARCHIVE_THROW_IF_NOT_OK(kCodec, tripId.Append(p.tripId));
        ARCHIVE_THROW_IF_NOT_OK(kCodec, routeId.Append(p.routeId));
        ARCHIVE_THROW_IF_NOT_OK(kCodec, stopId.Append(p.stopId));
        ARCHIVE_THROW_IF_NOT_OK(kCodec, vehicleId.Append(p.vehicleId));
        ARCHIVE_THROW_IF_NOT_OK(kCodec, vehicleLabel.Append(p.vehicleLabel));
        ARCHIVE_THROW_IF_NOT_OK(kCodec, licensePlate.Append(p.licensePlate));
    }

    std::vector<std::shared_ptr<arrow::Array>> columns(19);
    ARCHIVE_THROW_IF_NOT_OK(kCodec, tripId.Finish(&columns[0]));
    ARCHIVE_THROW_IF_NOT_OK(kCodec, routeId.Finish(&columns[1]));
    ARCHIVE_THROW_IF_NOT_OK(kCodec, directionId.Finish(&columns[2]));
    ARCHIVE_THROW_IF_NOT_OK(kCodec, startTime.Finish(&columns[3]));
    ARCHIVE_THROW_IF_NOT_OK(kCodec, schedule.Finish(&columns[4]));
    ARCHIVE_THROW_IF_NOT_OK(kCodec, latitude.Finish(&columns[5]));
    ARCHIVE_THROW_IF_NOT_OK(kCodec, longitude.Finish(&columns[6]));
    ARCHIVE_THROW_IF_NOT_OK(kCodec, bearing.Finish(&columns[7]));
    ARCHIVE_THROW_IF_NOT_OK(kCodec, odometer.Finish(&columns[8]));
    ARCHIVE_THROW_IF_NOT_OK(kCodec, speed.Finish(&columns[9]));
    ARCHIVE_THROW_IF_NOT_OK(kCodec, stopSequence.Finish(&columns[10]));
    ARCHIVE_THROW_IF_NOT_OK(kCodec, stopId.Finish(&columns[11]));
    ARCHIVE_THROW_IF_NOT_OK(kCodec, status.Finish(&columns[12]));
    ARCHIVE_THROW_IF_NOT_OK(kCodec, timestamp.Finish(&columns[13]));
    ARCHIVE_THROW_IF_NOT_OK(kCodec, congestion.Finish(&columns[14]));
    ARCHIVE_THROW_IF_NOT_OK(kCodec, occupancy.Finish(&columns[15]));
    ARCHIVE_THROW_IF_NOT_OK(kCodec, vehicleId.Finish(&columns[16]));
    ARCHIVE_THROW_IF_NOT_OK(kCodec, vehicleLabel.Finish(&columns[17]));
    ARCHIVE_THROW_IF_NOT_OK(kCodec, licensePlate.Finish(&columns[18]));

    return arrow::Table::Make(schema(), columns, n);
}

std::vector<VehiclePosition> ArchiveSchema::fromTable(arrow::Table const& table)
{
    std::vector<VehiclePosition> out;
    out.reserve(static_cast<std::size_t>(table.num_rows()));

    arrow::TableBatchReader reader(table);
    std::shared_ptr<arrow::RecordBatch> batch;
    for (;;)
    {
        ARCHIVE_THROW_IF_NOT_OK(kCodec, reader.ReadNext(&batch));
        if (!batch)
            break;
        decodeBatch(*batch, out);
    }
    return out;
}

int64_t ArchiveSchema::epochSeconds(arrow::TimestampArray const& column, int64_t i)
{
    auto const& type = static_cast<arrow::TimestampType const&>(*column.type());
    const int64_t perSecond = unitsPerSecond(type.unit());
    const int64_t value = column.Value(i);

    // Floor division, so pre-1970 instants stay in the right second.
    int64_t seconds = value / perSecond;
    if (value % perSecond != 0 && value < 0)
        --seconds;
    return seconds;
}
