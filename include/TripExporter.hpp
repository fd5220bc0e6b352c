#pragma once
#include <string>
#include <vector>
#include "trip_export.pb.h"
#include "Types.hpp"

class TripExporter
{
public:
    static fleettrips::TripRecord toRecord(Trip const& trip);
    static std::string toJson(std::vector<Trip> const& trips);

    // Throws std::runtime_error if the file cannot be written.
    static void writeJson(std::string const& path, std::vector<Trip> const& trips);

private:
    static void setStationId(google::protobuf::Value& value, Station const& station);
};
