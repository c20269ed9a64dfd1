#pragma once
#include <memory>
#include <string>
#include <vector>
#include <arrow/api.h>
#include "ArchiveErrors.hpp"
#include "Types.hpp"

// Column layout of vehicle_positions.parquet. Field order and names match the
// store table; start_time and timestamp are real timestamps instead of
// integers.
class ArchiveSchema
{
public:
    static constexpr char const* tripIdColumn = "trip_id";
    static constexpr char const* vehicleIdColumn = "vehicle_id";
    static constexpr char const* timestampColumn = "timestamp";
    static constexpr char const* startTimeColumn = "start_time";

    static std::shared_ptr<arrow::Schema> const& schema();

    static std::shared_ptr<arrow::Table> toTable(std::vector<VehiclePosition> const& batch);

    // Throws ArchiveError (Codec) on a missing column or an unexpected type.
    static std::vector<VehiclePosition> fromTable(arrow::Table const& table);

    // Epoch seconds of element `i`, whatever unit the column was written with.
    static int64_t epochSeconds(arrow::TimestampArray const& column, int64_t i);
};
