#include <cctype>
#include <chrono>
#include <sstream>
#include <stdexcept>
#include <date/date.h>
#include "FeedParser.hpp"

namespace
{
    bool allDigits(std::string const& s)
    {
        if (s.empty()) return false;
        for (unsigned char c : s)
            if (!std::isdigit(c)) return false;
        return true;
    }

    date::year_month_day parseServiceDate(std::string const& startDate)
    {
        if (startDate.size() != 8 || !allDigits(startDate))
            throw std::runtime_error("Malformed trip start_date: '" + startDate + "'");

        std::istringstream in(startDate);
        date::year_month_day ymd{};
        in >> date::parse("%Y%m%d", ymd);
        if (in.fail() || !ymd.ok())
            throw std::runtime_error("Malformed trip start_date: '" + startDate + "'");
        return ymd;
    }

    std::chrono::seconds parseOffset(std::string const& startTime)
    {
        auto first = startTime.find(':');
        auto second = first == std::string::npos ? std::string::npos : startTime.find(':', first + 1);
        if (second == std::string::npos)
            throw std::runtime_error("Malformed trip start_time: '" + startTime + "'");

        std::string hh = startTime.substr(0, first);
        std::string mm = startTime.substr(first + 1, second - first - 1);
        std::string ss = startTime.substr(second + 1);
        if (hh.size() > 3 || !allDigits(hh) || mm.size() != 2 || !allDigits(mm) || ss.size() != 2 || !allDigits(ss))
            throw std::runtime_error("Malformed trip start_time: '" + startTime + "'");

        int minutes = std::stoi(mm);
        int seconds = std::stoi(ss);
        if (minutes > 59 || seconds > 59)
            throw std::runtime_error("Malformed trip start_time: '" + startTime + "'");

        return std::chrono::hours{std::stoi(hh)} + std::chrono::minutes{minutes} + std::chrono::seconds{seconds};
    }
}

int64_t FeedParser::scheduledStart(std::string const& startDate, std::string const& startTime, date::time_zone const* zone)
{
    if (startDate.empty() || startTime.empty())
        return 0;

    date::local_days day{parseServiceDate(startDate)};
    std::chrono::seconds offset = parseOffset(startTime);

    auto midnight = zone->to_sys(date::local_seconds{day}, date::choose::earliest);
    return (midnight + offset).time_since_epoch().count();
}

VehiclePosition FeedParser::toPosition(transit_realtime::VehiclePosition const& v, date::time_zone const* zone)
{
    VehiclePosition p;

    auto const& trip = v.trip();
    p.tripId               = trip.trip_id();
    p.routeId              = trip.route_id();
    p.directionId          = static_cast<int32_t>(trip.direction_id());
    p.startTime            = scheduledStart(trip.start_date(), trip.start_time(), zone);
    p.scheduleRelationship = trip.schedule_relationship();

    auto const& pos = v.position();
    p.latitude  = pos.latitude();
    p.longitude = pos.longitude();
    p.bearing   = pos.bearing();
    p.odometer  = pos.odometer();
    p.speed     = pos.speed();

    p.currentStopSequence = v.current_stop_sequence();
    p.stopId              = v.stop_id();
    p.currentStatus       = v.current_status();
    p.timestamp           = static_cast<int64_t>(v.timestamp());
    p.congestionLevel     = v.congestion_level();
    p.occupancyStatus     = v.occupancy_status();

    auto const& vehicle = v.vehicle();
    p.vehicleId    = vehicle.id();
    p.vehicleLabel = vehicle.label();
    p.licensePlate = vehicle.license_plate();

    return p;
}

std::vector<VehiclePosition> FeedParser::extractVehiclePositions(std::string const& data, date::time_zone const* zone)
{
    if (data.empty())
        throw std::runtime_error("Empty feed payload");

    transit_realtime::FeedMessage feed;
    if (!feed.ParseFromString(data))
        throw std::runtime_error("Feed payload is not a GTFS-realtime FeedMessage");

    std::vector<VehiclePosition> out;
    out.reserve(feed.entity_size());

    for (const auto& entity : feed.entity())
    {
        if (!entity.has_vehicle())
            continue;
        out.push_back(toPosition(entity.vehicle(), zone));
    }

    return out;
}
