#include "StationIndex.hpp"
#include "FleetTracker.hpp"

FleetTracker::FleetTracker(StationIndex const& stations)
    : detector(stations)
{
}

bool FleetTracker::isStale(PollPayload const& payload) const
{
    return lastUpdated && payload.lastUpdated <= *lastUpdated;
}

std::vector<Trip> FleetTracker::ingest(PollPayload const& payload)
{
    if (isStale(payload))
        return {};

    lastUpdated = payload.lastUpdated;
    ttl = payload.ttl;

    std::vector<Trip> found;
    std::optional<Trip> trip;

    for (auto const& vehicle : payload.vehicles)
    {
        VehicleObservation cur = vehicle;
        cur.observedAt = payload.lastUpdated;

        if (detector.reconcile(state, cur, trip) == Reconciliation::TripDetected)
            found.push_back(*trip);
    }

    log.appendMany(found);
    return found;
}
