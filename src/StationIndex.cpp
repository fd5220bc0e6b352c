#include <algorithm>
#include <iterator>
#include <iostream>
#include <stdexcept>
#include "Geo.hpp"
#include "StationIndex.hpp"

StationIndex::StationIndex(std::vector<Station> list)
    : stations(std::move(list))
{
    if (stations.empty())
        throw std::runtime_error("Station list is empty, cannot build station index.");

    std::sort(stations.begin(), stations.end(),
              [](Station const& a, Station const& b) { return a.lon < b.lon; });

    std::cout << "Loaded " << stations.size() << " stations\n";
}

Station const* StationIndex::closestCandidate(double lat, double lon, double& bestDistance) const
{
    auto byLon = [](Station const& s, double value) { return s.lon < value; };
    auto lonBelow = [](double value, Station const& s) { return value < s.lon; };

    auto lo = std::lower_bound(stations.begin(), stations.end(), lon, byLon);
    auto hi = std::upper_bound(lo, stations.end(), lon, lonBelow);

    // left neighbour, every station sharing the exact longitude, right neighbour
    auto first = (lo == stations.begin()) ? lo : std::prev(lo);
    auto last  = (hi == stations.end()) ? hi : std::next(hi);

    Station const* best = nullptr;
    for (auto it = first; it != last; ++it)
    {
        double d = Geo::distanceMeters(lat, lon, it->lat, it->lon);
        if (!best || d < bestDistance)
        {
            best = &*it;
            bestDistance = d;
        }
    }
    return best;
}

Station StationIndex::nearest(double lat, double lon) const
{
    double d = 0.0;
    Station const* candidate = closestCandidate(lat, lon, d);

    if (candidate && d < MATCH_RADIUS_METERS)
        return *candidate;

    return flexParking(lat, lon);
}

Station StationIndex::flexParking(double lat, double lon)
{
    return Station{FLEX_PARKING_ID, FLEX_PARKING_NAME, lat, lon};
}

bool StationIndex::isFlexParking(Station const& station)
{
    return station.id == FLEX_PARKING_ID && station.name == FLEX_PARKING_NAME;
}

std::size_t StationIndex::size() const noexcept
{
    return stations.size();
}

std::vector<Station> const& StationIndex::sorted() const noexcept
{
    return stations;
}
