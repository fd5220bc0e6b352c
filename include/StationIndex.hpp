#pragma once
#include <string>
#include <vector>
#include <cstddef>
#include "Types.hpp"

// Stations sorted by longitude. Nearest lookups only inspect the stations
// adjacent to the query longitude, so a closer station further away in
// longitude can be missed.
class StationIndex
{
private:
    std::vector<Station> stations;

    Station const* closestCandidate(double lat, double lon, double& bestDistance) const;

public:
    static constexpr double MATCH_RADIUS_METERS = 10.0;
    static inline const std::string FLEX_PARKING_ID   = "0";
    static inline const std::string FLEX_PARKING_NAME = "Flex parking";

    // Throws std::runtime_error on an empty station list.
    explicit StationIndex(std::vector<Station> list);

    // Never fails: returns a real station within MATCH_RADIUS_METERS or a
    // flex parking placeholder located at the query point.
    Station nearest(double lat, double lon) const;

    template <typename Point>
    Station nearest(Point const& p) const { return nearest(p.lat, p.lon); }

    std::size_t size() const noexcept;
    std::vector<Station> const& sorted() const noexcept;

    static Station flexParking(double lat, double lon);
    static bool isFlexParking(Station const& station);
};
