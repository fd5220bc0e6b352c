#include <algorithm>
#include "TripLog.hpp"

Trip TripLog::makeTrip(Station const& start, Station const& end, std::int64_t startedAt, std::int64_t endedAt)
{
    Trip t;
    t.startStation    = start;
    t.endStation      = end;
    t.startedAt       = startedAt;
    t.endedAt         = endedAt;
    t.durationSeconds = endedAt - startedAt;
    return t;
}

void TripLog::append(Trip const& trip)
{
    trips.push_back(trip);
}

void TripLog::appendMany(std::vector<Trip> const& batch)
{
    trips.insert(trips.end(), batch.begin(), batch.end());
}

std::vector<Trip> const& TripLog::entries() const noexcept
{
    return trips;
}

std::size_t TripLog::size() const noexcept
{
    return trips.size();
}

std::vector<Trip> TripLog::sortedByStart() const
{
    std::vector<Trip> out = trips;
    std::stable_sort(out.begin(), out.end(),
                     [](Trip const& a, Trip const& b) { return a.startedAt < b.startedAt; });
    return out;
}
