#include "FleetState.hpp"
#include "Geo.hpp"
#include "StationIndex.hpp"
#include "TripLog.hpp"
#include "TripDetector.hpp"

TripDetector::TripDetector(StationIndex const& stationIndex)
    : stations(stationIndex)
{
}

bool TripDetector::isTrip(VehicleObservation const& old, VehicleObservation const& cur)
{
    // short hops are GPS noise, short rentals are cancelled unlocks
    return Geo::distance(old, cur) > MIN_TRIP_DISTANCE_METERS
        && cur.observedAt - old.observedAt > MIN_TRIP_SECONDS;
}

bool TripDetector::hasMoved(VehicleObservation const& old, VehicleObservation const& cur)
{
    return old.lat != cur.lat || old.lon != cur.lon;
}

Reconciliation TripDetector::reconcile(FleetState& state, VehicleObservation const& cur, std::optional<Trip>& trip) const
{
    trip.reset();

    VehicleObservation* old = state.find(cur.id);
    if (!old)
    {
        if (!cur.enabled)
            return Reconciliation::Ignored;

        state.track(cur);
        return Reconciliation::Tracked;
    }

    if (isTrip(*old, cur))
    {
        trip = TripLog::makeTrip(stations.nearest(*old), stations.nearest(cur),
                                 old->observedAt, cur.observedAt);
        state.track(cur);
        return Reconciliation::TripDetected;
    }

    old->observedAt = cur.observedAt;
    if (hasMoved(*old, cur))
    {
        state.track(cur);
        return Reconciliation::Repositioned;
    }
    return Reconciliation::Refreshed;
}
