#include <fstream>
#include <sstream>
#include <stdexcept>
#include <google/protobuf/util/json_util.h>
#include "StationIndex.hpp"
#include "TimeFormat.hpp"
#include "TripExporter.hpp"

void TripExporter::setStationId(google::protobuf::Value& value, Station const& station)
{
    if (StationIndex::isFlexParking(station))
        value.set_number_value(0);
    else
        value.set_string_value(station.id);
}

fleettrips::TripRecord TripExporter::toRecord(Trip const& trip)
{
    fleettrips::TripRecord r;
    r.set_started_at(formatUtc(trip.startedAt));
    r.set_ended_at(formatUtc(trip.endedAt));
    r.set_duration(static_cast<std::int32_t>(trip.durationSeconds));

    setStationId(*r.mutable_start_station_id(), trip.startStation);
    r.set_start_station_name(trip.startStation.name);
    r.set_start_station_latitude(trip.startStation.lat);
    r.set_start_station_longitude(trip.startStation.lon);

    setStationId(*r.mutable_end_station_id(), trip.endStation);
    r.set_end_station_name(trip.endStation.name);
    r.set_end_station_latitude(trip.endStation.lat);
    r.set_end_station_longitude(trip.endStation.lon);
    return r;
}

std::string TripExporter::toJson(std::vector<Trip> const& trips)
{
    google::protobuf::util::JsonPrintOptions options;
    options.add_whitespace = true;
    options.always_print_primitive_fields = true;
    options.preserve_proto_field_names = true;

    std::stringstream ss;
    ss << "[";

    bool first = true;
    for (Trip const& t : trips)
    {
        std::string object;
        auto status = google::protobuf::util::MessageToJsonString(toRecord(t), &object, options);
        if (!status.ok())
            throw std::runtime_error("Failed to serialize trip: " + status.ToString());

        // the printer ends each object with a newline
        while (!object.empty() && object.back() == '\n')
            object.pop_back();

        ss << (first ? "\n" : ",\n") << object;
        first = false;
    }

    ss << (first ? "]\n" : "\n]\n");
    return ss.str();
}

void TripExporter::writeJson(std::string const& path, std::vector<Trip> const& trips)
{
    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open())
        throw std::runtime_error("Could not open " + path + " for writing.");

    out << toJson(trips);
    out.flush();
    if (!out.good())
        throw std::runtime_error("Failed writing trips to " + path + ".");
}
