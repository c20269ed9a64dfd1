#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include <date/tz.h>
#include "gtfs-realtime.pb.h"
#include "Types.hpp"

class FeedParser
{
public:
    // Decodes a serialized FeedMessage and returns one record per entity that
    // carries a vehicle position. Throws std::runtime_error when the payload
    // is empty, does not decode, or holds a malformed trip start.
    static std::vector<VehiclePosition> extractVehiclePositions(std::string const& data, date::time_zone const* zone);

    // Local midnight of startDate (YYYYMMDD) plus startTime (HH:MM:SS, hours
    // may run past 23) in zone, as epoch seconds. 0 when either is empty.
    static int64_t scheduledStart(std::string const& startDate, std::string const& startTime, date::time_zone const* zone);

private:
    static VehiclePosition toPosition(transit_realtime::VehiclePosition const& v, date::time_zone const* zone);
};
