#include <cmath>
#include <iostream>
#include <stdexcept>
#include <google/protobuf/util/json_util.h>
#include "Parser.hpp"

bool Parser::validPosition(double lat, double lon)
{
    return std::isfinite(lat) && std::isfinite(lon)
        && lat >= -90.0 && lat <= 90.0
        && lon >= -180.0 && lon <= 180.0;
}

std::optional<bool> Parser::isDisabled(google::protobuf::Value const& value)
{
    switch (value.kind_case())
    {
        case google::protobuf::Value::KIND_NOT_SET:
        case google::protobuf::Value::kNullValue:
            return false;
        case google::protobuf::Value::kBoolValue:
            return value.bool_value();
        case google::protobuf::Value::kNumberValue:
            return value.number_value() != 0.0;
        default:
            return std::nullopt;
    }
}

bool Parser::decode(std::string const& data, google::protobuf::Message& message, std::string& error)
{
    if (data.empty() || data[0] == '<')
    {
        error = "not a JSON document";
        return false;
    }

    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = true;

    auto status = google::protobuf::util::JsonStringToMessage(data, &message, options);
    if (!status.ok())
    {
        error = status.ToString();
        return false;
    }
    return true;
}

std::vector<Station> Parser::parseStations(std::string const& data)
{
    gbfs::StationInformationFeed feed;
    std::string error;
    if (!decode(data, feed, error))
        throw std::runtime_error("Could not decode station information: " + error);

    if (!feed.has_data() || feed.data().stations_size() == 0)
        throw std::runtime_error("Station information contains no stations.");

    std::vector<Station> out;
    out.reserve(feed.data().stations_size());

    for (auto const& s : feed.data().stations())
    {
        if (s.station_id().empty())
            throw std::runtime_error("Station information entry without station_id.");

        if (!s.has_lat() || !s.has_lon() || !validPosition(s.lat(), s.lon()))
            throw std::runtime_error("Station " + s.station_id() + " has no valid lat/lon.");

        out.push_back(Station{s.station_id(), s.name(), s.lat(), s.lon()});
    }
    return out;
}

std::optional<PollPayload> Parser::parseBikeStatus(std::string const& data)
{
    gbfs::FreeBikeStatusFeed feed;
    std::string error;
    if (!decode(data, feed, error))
    {
        std::cerr << "Could not decode free bike status: " << error << "\n";
        return std::nullopt;
    }

    if (feed.last_updated() <= 0)
    {
        std::cerr << "Free bike status without last_updated, discarding.\n";
        return std::nullopt;
    }

    PollPayload payload;
    payload.lastUpdated = feed.last_updated();
    payload.ttl = feed.ttl();
    payload.vehicles.reserve(feed.data().bikes_size());

    for (auto const& b : feed.data().bikes())
    {
        if (b.bike_id().empty())
        {
            std::cerr << "Free bike status entry without bike_id, discarding poll.\n";
            return std::nullopt;
        }

        if (!b.has_lat() || !b.has_lon() || !validPosition(b.lat(), b.lon()))
        {
            std::cerr << "Bike " << b.bike_id() << " has no valid lat/lon, discarding poll.\n";
            return std::nullopt;
        }

        std::optional<bool> disabled = isDisabled(b.is_disabled());
        if (!disabled)
        {
            std::cerr << "Bike " << b.bike_id() << " has an unreadable is_disabled, discarding poll.\n";
            return std::nullopt;
        }

        VehicleObservation v;
        v.id         = b.bike_id();
        v.lat        = b.lat();
        v.lon        = b.lon();
        v.observedAt = payload.lastUpdated;
        v.enabled    = !*disabled;
        payload.vehicles.push_back(std::move(v));
    }
    return payload;
}
