#pragma once
#include <string>
#include <vector>
#include <cstdint>

// A parking station from station_information.json.
struct Station
{
    std::string id;
    std::string name;
    double lat = 0.0;
    double lon = 0.0;
};

// Represents one vehicle's position at one poll instant.
struct VehicleObservation
{
    std::string id;
    double lat = 0.0;
    double lon = 0.0;
    std::int64_t observedAt = 0;  // payload last_updated, epoch seconds
    bool enabled = true;
};

// One decoded free_bike_status.json snapshot.
struct PollPayload
{
    std::int64_t lastUpdated = 0;
    std::int32_t ttl = 0;
    std::vector<VehicleObservation> vehicles;
};

struct Trip
{
    Station startStation;
    Station endStation;
    std::int64_t startedAt = 0;
    std::int64_t endedAt = 0;
    std::int64_t durationSeconds = 0;
};
