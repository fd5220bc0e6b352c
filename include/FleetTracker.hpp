#pragma once
#include <optional>
#include <vector>
#include <cstdint>
#include "Types.hpp"
#include "FleetState.hpp"
#include "TripDetector.hpp"
#include "TripLog.hpp"

class StationIndex;

// Everything that survives between polls: tracked vehicles, detected trips
// and the last accepted feed timestamp.
class FleetTracker
{
private:
    TripDetector detector;
    FleetState state;
    TripLog log;
    std::optional<std::int64_t> lastUpdated;
    std::int32_t ttl = 0;

public:
    explicit FleetTracker(StationIndex const& stations);

    // Reconciles every vehicle of the payload and returns the new trips in
    // detection order. A payload that is not newer than the last accepted
    // one is skipped without touching any state.
    std::vector<Trip> ingest(PollPayload const& payload);

    bool isStale(PollPayload const& payload) const;

    FleetState const& fleet() const noexcept { return state; }
    TripLog const& trips() const noexcept { return log; }
    std::optional<std::int64_t> lastUpdatedAt() const noexcept { return lastUpdated; }
    std::int32_t lastTtl() const noexcept { return ttl; }
};
