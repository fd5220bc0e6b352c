#pragma once
#include <optional>
#include "Types.hpp"

class FleetState;
class StationIndex;

enum class Reconciliation
{
    Ignored,        // disabled and never tracked
    Tracked,        // first enabled sighting
    Refreshed,      // same position, lastSeen updated
    Repositioned,   // moved but below trip thresholds
    TripDetected
};

class TripDetector
{
private:
    StationIndex const& stations;

public:
    static constexpr double MIN_TRIP_DISTANCE_METERS = 50.0;
    static constexpr std::int64_t MIN_TRIP_SECONDS   = 100;

    explicit TripDetector(StationIndex const& stationIndex);

    // Compares cur against the stored observation for the same id and
    // applies the outcome to state. trip is set only on TripDetected.
    Reconciliation reconcile(FleetState& state, VehicleObservation const& cur, std::optional<Trip>& trip) const;

    static bool isTrip(VehicleObservation const& old, VehicleObservation const& cur);
    static bool hasMoved(VehicleObservation const& old, VehicleObservation const& cur);
};
