#pragma once
#include <optional>
#include <string>
#include <vector>
#include "gbfs.pb.h"
#include "Types.hpp"

class Parser
{
public:
    // Throws std::runtime_error: without stations nothing can be matched.
    static std::vector<Station> parseStations(std::string const& data);

    // nullopt when the document cannot be decoded; the caller retries.
    static std::optional<PollPayload> parseBikeStatus(std::string const& data);

private:
    static bool validPosition(double lat, double lon);
    // absent or null counts as enabled; 0/1 and false/true are both accepted
    static std::optional<bool> isDisabled(google::protobuf::Value const& value);
    static bool decode(std::string const& data, google::protobuf::Message& message, std::string& error);
};
