#pragma once
#include <string>
#include <cstdint>

// One observation of one vehicle, as the feed reports it and the store keeps it.
struct VehiclePosition
{
    std::string tripId;
    std::string routeId;
    int32_t directionId = 0;
    int64_t startTime = 0;            // Epoch seconds (scheduled trip start)
    int32_t scheduleRelationship = 0; // 0=SCHEDULED, 1=ADDED, 2=UNSCHEDULED, 3=CANCELED
    float latitude = 0.0f;
    float longitude = 0.0f;
    float bearing = 0.0f;
    double odometer = 0.0;
    float speed = 0.0f;
    uint32_t currentStopSequence = 0;
    std::string stopId;
    int32_t currentStatus = 0;        // 0=INCOMING_AT, 1=STOPPED_AT, 2=IN_TRANSIT_TO
    int64_t timestamp = 0;            // Epoch seconds, <= 0 means the feed never set it
    int32_t congestionLevel = 0;
    int32_t occupancyStatus = 0;
    std::string vehicleId;
    std::string vehicleLabel;
    std::string licensePlate;

    bool isValid() const noexcept { return timestamp > 0; }
};
